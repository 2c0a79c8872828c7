#include "clumpfit/CO2Equilibrium.hpp"
#include "clumpfit/Errors.hpp"
#include <algorithm>
#include <cmath>
#include <map>
#include <sstream>
#include <utility>

namespace clumpfit {
namespace {

using TableRow = std::pair<double, double>;     // T (°C), Δ47

/* Petersen et al. (2019), doi:10.1029/2018GC008127 */
const TableRow kPetersen[] = {
    {-12, 1.147113572}, {-11, 1.139961218}, {-10, 1.132872856}, {-9, 1.125847677},
    {-8, 1.118884889}, {-7, 1.111983708}, {-6, 1.105143366}, {-5, 1.098363105},
    {-4, 1.091642182}, {-3, 1.084979862}, {-2, 1.078375423}, {-1, 1.071828156},
    {0, 1.06533736}, {1, 1.058902349}, {2, 1.052522443}, {3, 1.046196976},
    {4, 1.039925291}, {5, 1.033706741}, {6, 1.02754069}, {7, 1.02142651},
    {8, 1.015363585}, {9, 1.009351306}, {10, 1.003389075}, {11, 0.997476303},
    {12, 0.991612409}, {13, 0.985796821}, {14, 0.980028975}, {15, 0.974308318},
    {16, 0.968634304}, {17, 0.963006392}, {18, 0.957424055}, {19, 0.951886769},
    {20, 0.94639402}, {21, 0.940945302}, {22, 0.935540114}, {23, 0.930177964},
    {24, 0.924858369}, {25, 0.919580851}, {26, 0.914344938}, {27, 0.909150167},
    {28, 0.90399608}, {29, 0.898882228}, {30, 0.893808167}, {31, 0.888773459},
    {32, 0.883777672}, {33, 0.878820382}, {34, 0.87390117}, {35, 0.869019623},
    {36, 0.864175334}, {37, 0.859367901}, {38, 0.854596929}, {39, 0.849862028},
    {40, 0.845162813}, {41, 0.840498905}, {42, 0.835869931}, {43, 0.831275522},
    {44, 0.826715314}, {45, 0.82218895}, {46, 0.817696075}, {47, 0.813236341},
    {48, 0.808809404}, {49, 0.804414926}, {50, 0.800052572}, {51, 0.795722012},
    {52, 0.791422922}, {53, 0.787154979}, {54, 0.782917869}, {55, 0.778711277},
    {56, 0.774534898}, {57, 0.770388426}, {58, 0.766271562}, {59, 0.76218401},
    {60, 0.758125479}, {61, 0.75409568}, {62, 0.750094329}, {63, 0.746121147},
    {64, 0.742175856}, {65, 0.738258184}, {66, 0.73436786}, {67, 0.73050462},
    {68, 0.726668201}, {69, 0.722858343}, {70, 0.719074792}, {71, 0.715317295},
    {72, 0.711585602}, {73, 0.707879469}, {74, 0.704198652}, {75, 0.700542912},
    {76, 0.696912012}, {77, 0.693305719}, {78, 0.689723802}, {79, 0.686166034},
    {80, 0.682632189}, {81, 0.679122047}, {82, 0.675635387}, {83, 0.672171994},
    {84, 0.668731654}, {85, 0.665314156}, {86, 0.661919291}, {87, 0.658546854},
    {88, 0.655196641}, {89, 0.651868451}, {90, 0.648562087}, {91, 0.645277352},
    {92, 0.642014054}, {93, 0.638771999}, {94, 0.635551001}, {95, 0.632350872},
    {96, 0.629171428}, {97, 0.626012487}, {98, 0.62287387}, {99, 0.619755397},
    {100, 0.616656895}, {102, 0.610519107}, {104, 0.604459143}, {106, 0.59847567},
    {108, 0.592567388}, {110, 0.586733026}, {112, 0.580971342}, {114, 0.575281125},
    {116, 0.569661187}, {118, 0.564110371}, {120, 0.558627545}, {122, 0.5532116},
    {124, 0.547861454}, {126, 0.542576048}, {128, 0.537354347}, {130, 0.532195337},
    {132, 0.527098028}, {134, 0.52206145}, {136, 0.517084654}, {138, 0.512166711},
    {140, 0.507306712}, {142, 0.502503768}, {144, 0.497757006}, {146, 0.493065573},
    {148, 0.488428634}, {150, 0.48384537}, {152, 0.47931498}, {154, 0.474836677},
    {156, 0.470409692}, {158, 0.466033271}, {160, 0.461706674}, {162, 0.457429176},
    {164, 0.453200067}, {166, 0.44901865}, {168, 0.444884242}, {170, 0.440796174},
    {172, 0.436753787}, {174, 0.432756438}, {176, 0.428803494}, {178, 0.424894334},
    {180, 0.42102835}, {182, 0.417204944}, {184, 0.41342353}, {186, 0.409683531},
    {188, 0.405984383}, {190, 0.402325531}, {192, 0.398706429}, {194, 0.395126543},
    {196, 0.391585347}, {198, 0.388082324}, {200, 0.384616967}, {202, 0.381188778},
    {204, 0.377797268}, {206, 0.374441954}, {208, 0.371122364}, {210, 0.367838033},
    {212, 0.364588505}, {214, 0.361373329}, {216, 0.358192065}, {218, 0.355044277},
    {220, 0.35192954}, {222, 0.348847432}, {224, 0.34579754}, {226, 0.34277946},
    {228, 0.339792789}, {230, 0.336837136}, {232, 0.333912113}, {234, 0.331017339},
    {236, 0.328152439}, {238, 0.325317046}, {240, 0.322510795}, {242, 0.319733329},
    {244, 0.316984297}, {246, 0.314263352}, {248, 0.311570153}, {250, 0.308904364},
    {252, 0.306265654}, {254, 0.303653699}, {256, 0.301068176}, {258, 0.298508771},
    {260, 0.295975171}, {262, 0.29346707}, {264, 0.290984167}, {266, 0.288526163},
    {268, 0.286092765}, {270, 0.283683684}, {272, 0.281298636}, {274, 0.278937339},
    {276, 0.276599517}, {278, 0.274284898}, {280, 0.271993211}, {282, 0.269724193},
    {284, 0.267477582}, {286, 0.265253121}, {288, 0.263050554}, {290, 0.260869633},
    {292, 0.25871011}, {294, 0.256571741}, {296, 0.254454286}, {298, 0.252357508},
    {300, 0.250281174}, {302, 0.248225053}, {304, 0.246188917}, {306, 0.244172542},
    {308, 0.242175707}, {310, 0.240198194}, {312, 0.238239786}, {314, 0.236300272},
    {316, 0.234379441}, {318, 0.232477087}, {320, 0.230593005}, {322, 0.228726993},
    {324, 0.226878853}, {326, 0.225048388}, {328, 0.223235405}, {330, 0.221439711},
    {332, 0.219661118}, {334, 0.217899439}, {336, 0.216154491}, {338, 0.214426091},
    {340, 0.21271406}, {342, 0.21101822}, {344, 0.209338398}, {346, 0.20767442},
    {348, 0.206026115}, {350, 0.204393315}, {355, 0.200378063}, {360, 0.196456139},
    {365, 0.192625077}, {370, 0.188882487}, {375, 0.185226048}, {380, 0.181653511},
    {385, 0.178162694}, {390, 0.174751478}, {395, 0.171417807}, {400, 0.168159686},
    {405, 0.164975177}, {410, 0.161862398}, {415, 0.158819521}, {420, 0.155844772},
    {425, 0.152936426}, {430, 0.150092806}, {435, 0.147312286}, {440, 0.144593281},
    {445, 0.141934254}, {450, 0.13933371}, {455, 0.136790195}, {460, 0.134302294},
    {465, 0.131868634}, {470, 0.129487876}, {475, 0.127158722}, {480, 0.124879906},
    {485, 0.122650197}, {490, 0.120468398}, {495, 0.118333345}, {500, 0.116243903},
    {505, 0.11419897}, {510, 0.112197471}, {515, 0.110238362}, {520, 0.108320625},
    {525, 0.106443271}, {530, 0.104605335}, {535, 0.102805877}, {540, 0.101043985},
    {545, 0.099318768}, {550, 0.097629359}, {555, 0.095974915}, {560, 0.094354612},
    {565, 0.09276765}, {570, 0.091213248}, {575, 0.089690648}, {580, 0.088199108},
    {585, 0.086737906}, {590, 0.085306341}, {595, 0.083903726}, {600, 0.082529395},
    {605, 0.081182697}, {610, 0.079862998}, {615, 0.07856968}, {620, 0.077302141},
    {625, 0.076059794}, {630, 0.074842066}, {635, 0.0736484}, {640, 0.072478251},
    {645, 0.07133109}, {650, 0.070206399}, {655, 0.069103674}, {660, 0.068022424},
    {665, 0.066962168}, {670, 0.065922439}, {675, 0.06490278}, {680, 0.063902748},
    {685, 0.062921909}, {690, 0.061959837}, {695, 0.061016122}, {700, 0.06009036},
    {705, 0.059182157}, {710, 0.058291131}, {715, 0.057416907}, {720, 0.05655912},
    {725, 0.055717414}, {730, 0.05489144}, {735, 0.05408086}, {740, 0.053285343},
    {745, 0.052504565}, {750, 0.05173821}, {755, 0.050985971}, {760, 0.050247546},
    {765, 0.049522643}, {770, 0.048810974}, {775, 0.04811226}, {780, 0.047426227},
    {785, 0.046752609}, {790, 0.046091145}, {795, 0.045441581}, {800, 0.044803668},
    {805, 0.044177164}, {810, 0.043561831}, {815, 0.042957438}, {820, 0.042363759},
    {825, 0.041780573}, {830, 0.041207664}, {835, 0.040644822}, {840, 0.040091839},
    {845, 0.039548516}, {850, 0.039014654}, {855, 0.038490063}, {860, 0.037974554},
    {865, 0.037467944}, {870, 0.036970054}, {875, 0.036480707}, {880, 0.035999734},
    {885, 0.035526965}, {890, 0.035062238}, {895, 0.034605393}, {900, 0.034156272},
    {905, 0.033714724}, {910, 0.033280598}, {915, 0.032853749}, {920, 0.032434032},
    {925, 0.032021309}, {930, 0.031615443}, {935, 0.0312163}, {940, 0.030823749},
    {945, 0.030437663}, {950, 0.030057915}, {955, 0.029684385}, {960, 0.029316951},
    {965, 0.028955498}, {970, 0.02859991}, {975, 0.028250075}, {980, 0.027905884},
    {985, 0.027567229}, {990, 0.027234006}, {995, 0.026906112}, {1000, 0.026583445},
    {1005, 0.026265908}, {1010, 0.025953405}, {1015, 0.025645841}, {1020, 0.025343124},
    {1025, 0.025045163}, {1030, 0.024751871}, {1035, 0.02446316}, {1040, 0.024178947},
    {1045, 0.023899147}, {1050, 0.02362368}, {1055, 0.023352467}, {1060, 0.023085429},
    {1065, 0.022822491}, {1070, 0.022563577}, {1075, 0.022308615}, {1080, 0.022057533},
    {1085, 0.02181026}, {1090, 0.021566729}, {1095, 0.021326872}, {1100, 0.021090622},
};

/* Wang et al. (2004), doi:10.1016/j.gca.2004.05.039, as tabulated by Dennis et al. (2011) */
const TableRow kWang[] = {
    {-83, 1.8954}, {-73, 1.753}, {-63, 1.6261}, {-53, 1.5126},
    {-43, 1.4104}, {-33, 1.3182}, {-23, 1.2345}, {-13, 1.1584},
    {-3, 1.0888}, {7, 1.0251}, {17, 0.9665}, {27, 0.9125},
    {37, 0.8626}, {47, 0.8164}, {57, 0.7734}, {67, 0.7334},
    {87, 0.6612}, {97, 0.6286}, {107, 0.598}, {117, 0.5693},
    {127, 0.5423}, {137, 0.5169}, {147, 0.493}, {157, 0.4704},
    {167, 0.4491}, {177, 0.4289}, {187, 0.4098}, {197, 0.3918},
    {207, 0.3747}, {217, 0.3585}, {227, 0.3431}, {237, 0.3285},
    {247, 0.3147}, {257, 0.3015}, {267, 0.289}, {277, 0.2771},
    {287, 0.2657}, {297, 0.255}, {307, 0.2447}, {317, 0.2349},
    {327, 0.2256}, {337, 0.2167}, {347, 0.2083}, {357, 0.2002},
    {367, 0.1925}, {377, 0.1851}, {387, 0.1781}, {397, 0.1714},
    {407, 0.165}, {417, 0.1589}, {427, 0.153}, {437, 0.1474},
    {447, 0.1421}, {457, 0.137}, {467, 0.1321}, {477, 0.1274},
    {487, 0.1229}, {497, 0.1186}, {507, 0.1145}, {517, 0.1105},
    {527, 0.1068}, {537, 0.1031}, {547, 0.0997}, {557, 0.0963},
    {567, 0.0931}, {577, 0.0901}, {587, 0.0871}, {597, 0.0843},
    {607, 0.0816}, {617, 0.079}, {627, 0.0765}, {637, 0.0741},
    {647, 0.0718}, {657, 0.0695}, {667, 0.0674}, {677, 0.0654},
    {687, 0.0634}, {697, 0.0615}, {707, 0.0597}, {717, 0.0579},
    {727, 0.0562}, {737, 0.0546}, {747, 0.053}, {757, 0.0515},
    {767, 0.05}, {777, 0.0486}, {787, 0.0472}, {797, 0.0459},
    {807, 0.0447}, {817, 0.0435}, {827, 0.0423}, {837, 0.0411},
    {847, 0.04}, {857, 0.039}, {867, 0.038}, {877, 0.037},
    {887, 0.036}, {897, 0.0351}, {907, 0.0342}, {917, 0.0333},
    {927, 0.0325}, {937, 0.0317}, {947, 0.0309}, {957, 0.0302},
    {967, 0.0294}, {977, 0.0287}, {987, 0.0281}, {997, 0.0274},
    {1007, 0.0268}, {1017, 0.0261}, {1027, 0.0255}, {1037, 0.0249},
    {1047, 0.0244}, {1057, 0.0238}, {1067, 0.0233}, {1077, 0.0228},
    {1087, 0.0223}, {1097, 0.0218},
};

template <std::size_t N>
double interpolate(const TableRow (&table)[N], double T, double shift, const char* law)
{
    const double lo = table[0].first + shift;
    const double hi = table[N - 1].first + shift;
    if (!std::isfinite(T) || T < lo || T > hi) {
        std::ostringstream s;
        s << "Teq = " << T << " °C is outside the range of the " << law
          << " CO2 equilibrium law [" << lo << ", " << hi << "]";
        throw ConfigurationError(s.str());
    }

    const auto* first = std::begin(table);
    const auto* last  = std::end(table);
    const auto* it = std::upper_bound(first, last, T,
                                      [shift](double x, const TableRow& r) { return x < r.first + shift; });
    if (it == last) return table[N - 1].second;
    if (it == first) return table[0].second;

    const TableRow& a = *(it - 1);
    const TableRow& b = *it;
    const double f = (T - (a.first + shift)) / (b.first - a.first);
    return (1.0 - f) * a.second + f * b.second;
}

} // namespace

double fCO2eqD47_Petersen(double T)
{
    return interpolate(kPetersen, T, 0.0, "Petersen");
}

double fCO2eqD47_Wang(double T)
{
    return interpolate(kWang, T, -0.15, "Wang");
}

double fCO2eqD47(TeqLaw law, double T)
{
    return law == TeqLaw::Wang ? fCO2eqD47_Wang(T) : fCO2eqD47_Petersen(T);
}

void D47fromTeq(D4xData& data, const TeqOptions& opt)
{
    if (data.mass() != 47)
        throw ConfigurationError("D47fromTeq only applies to Δ47 datasets");

    std::map<std::string, double> Teq;
    std::map<std::string, bool>   missing;
    for (const auto& r : data.analyses()) {
        if (r.Teq) {
            auto [it, fresh] = Teq.emplace(r.Sample, *r.Teq);
            if (!fresh && it->second != *r.Teq)
                throw ConfigurationError("Different values of Teq provided for sample '" + r.Sample + "'");
        } else {
            missing[r.Sample] = true;
        }
    }
    for (const auto& [sample, T] : Teq)
        if (missing.count(sample))
            throw ConfigurationError("Teq is inconsistently specified for sample '" + sample + "'");

    std::map<std::string, double> nominal = data.nominal_D4x();
    if (opt.priority == TeqPriority::Replace) nominal.clear();
    for (const auto& [sample, T] : Teq) {
        const double D47 = fCO2eqD47(opt.law, T);
        if (opt.priority != TeqPriority::Old || !nominal.count(sample))
            nominal[sample] = D47;
        data.msg("D47fromTeq", sample + ": Teq = " + std::to_string(T) + " °C");
    }
    data.set_nominal_D4x(std::move(nominal));
}

} // namespace clumpfit
