#include "clumpfit/AnalysisCruncher.hpp"
#include "clumpfit/Errors.hpp"
#include "clumpfit/IsobarModel.hpp"
#include "clumpfit/StatsUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <map>
#include <sstream>

namespace clumpfit {
namespace {

constexpr double kRoundTripTolerance = 5e-8;

std::string fixed(double v, int prec)
{
    std::ostringstream s;
    s << std::fixed << std::setprecision(prec) << v;
    return s.str();
}

/*  WG isobar ratio from (δ, R) pairs of the standards.  If δ = 0 is
 *  reasonably bracketed use the intercept of a linear fit, otherwise
 *  average R / (1 + δ/1000).                                             */
double wg_ratio(const std::vector<double>& X, const std::vector<double>& Y)
{
    const double x1 = *std::min_element(X.begin(), X.end());
    const double x2 = *std::max_element(X.begin(), X.end());
    const double wgcoord = x1 < x2 ? x1 / (x1 - x2) : 999.0;

    if (wgcoord < -0.5 || wgcoord > 1.5) {
        double sum = 0.0;
        for (std::size_t i = 0; i < X.size(); ++i) sum += Y[i] / (1.0 + X[i] / 1000.0);
        return sum / static_cast<double>(X.size());
    }
    return polyfit1(X, Y).intercept;
}

/*  Shared 1pt / 2pt logic.  `field` selects the analysis member being
 *  corrected; anchors come from the nominal δ18O table when `oxygen`,
 *  from the δ13C one otherwise.                                          */
void standardize_bulk(D4xData& data,
                      double Analysis::* field,
                      bool oxygen)
{
    const Config& cfg = data.config();
    const auto& nominal = oxygen ? cfg.nominal_d18O_VPDB : cfg.nominal_d13C_VPDB;
    const char* label   = oxygen ? "d18O" : "d13C";

    for (auto& [name, s] : data.sessions()) {
        const BulkMethod method = oxygen ? s.settings.d18O_method : s.settings.d13C_method;
        if (method == BulkMethod::None) continue;

        std::vector<double> X, Y;
        for (std::size_t i : s.data) {
            const Analysis& r = data.analyses()[i];
            auto it = nominal.find(r.Sample);
            if (it == nominal.end()) continue;
            X.push_back(r.*field);
            Y.push_back(oxygen ? carbonate_to_co2_d18O(cfg.ratios, it->second, cfg.alpha_18O_acid)
                               : it->second);
        }
        if (X.empty())
            throw InsufficientDataError(std::string("Session '") + name + "': no sample with a nominal "
                                        + label + " value, cannot apply " + to_string(method)
                                        + " standardization");

        if (method == BulkMethod::OnePoint) {
            const double offset = mean(Y) - mean(X);
            for (std::size_t i : s.data) data.analyses()[i].*field += offset;
        } else {
            LinearFit f;
            try {
                f = polyfit1(X, Y);
            } catch (const std::invalid_argument&) {
                throw InsufficientDataError(std::string("Session '") + name + "': 2pt " + label
                                            + " standardization needs standards with distinct compositions");
            }
            for (std::size_t i : s.data) {
                double& v = data.analyses()[i].*field;
                v = f.slope * v + f.intercept;
            }
        }
    }
}

} // namespace

/* ------------------------------------------------------------------------- */
/*  working gas                                                              */
/* ------------------------------------------------------------------------- */
void compute_wg(D4xData& data,
                std::optional<double> alpha_acid,
                const std::vector<std::string>& samples)
{
    const Config& cfg = data.config();
    const double alpha = alpha_acid.value_or(cfg.alpha_18O_acid);
    if (alpha == 0.0 || !std::isfinite(alpha))
        throw ConfigurationError("Acid fractionation factor should not be zero.");

    data.msg("wg", "Computing WG composition:");

    /* standards: in both nominal tables (and in `samples` if given) */
    std::map<std::string, IsobarRatios> standards;
    for (const auto& [sample, d13C] : cfg.nominal_d13C_VPDB) {
        auto o = cfg.nominal_d18O_VPDB.find(sample);
        if (o == cfg.nominal_d18O_VPDB.end()) continue;
        if (!samples.empty() && std::find(samples.begin(), samples.end(), sample) == samples.end())
            continue;
        const double R13 = R13_from_d13C(cfg.ratios, d13C);
        const double R18 = cfg.ratios.R18_VPDB * (1.0 + o->second / 1000.0) * alpha;
        standards[sample] = compute_isobar_ratios(cfg.ratios, R13, R18);
    }

    for (auto& [name, s] : data.sessions()) {
        std::vector<double> X45, Y45, X46, Y46;
        for (std::size_t i : s.data) {
            const Analysis& r = data.analyses()[i];
            auto it = standards.find(r.Sample);
            if (it == standards.end()) continue;
            X45.push_back(r.d45); Y45.push_back(it->second.R45);
            X46.push_back(r.d46); Y46.push_back(it->second.R46);
        }
        if (X45.empty())
            throw InsufficientDataError("No carbonate standard found in session '" + name
                                        + "', cannot compute WG composition");

        const double R45_wg = wg_ratio(X45, Y45);
        const double R46_wg = wg_ratio(X46, Y46);
        const BulkComposition wg = compute_bulk_delta(cfg.ratios, R45_wg, R46_wg);

        data.msg("wg", "Session " + name + " WG:   δ13C_VPDB = " + fixed(wg.d13C_VPDB, 3)
                       + "   δ18O_VSMOW = " + fixed(wg.d18O_VSMOW, 3));

        s.d13Cwg_VPDB  = wg.d13C_VPDB;
        s.d18Owg_VSMOW = wg.d18O_VSMOW;
        for (std::size_t i : s.data) {
            data.analyses()[i].d13Cwg_VPDB  = wg.d13C_VPDB;
            data.analyses()[i].d18Owg_VSMOW = wg.d18O_VSMOW;
        }
    }
}

/* ------------------------------------------------------------------------- */
/*  per-analysis crunching                                                   */
/* ------------------------------------------------------------------------- */
void compute_bulk_and_clumping_deltas(D4xData& data, Analysis& r)
{
    const ReferenceRatios& ref = data.config().ratios;

    if (!std::isfinite(r.d13Cwg_VPDB) || !std::isfinite(r.d18Owg_VSMOW))
        throw ConfigurationError("Analysis " + r.UID + " (session '" + r.Session
                                 + "') has no working-gas composition; run compute_wg() "
                                   "or provide d13Cwg_VPDB / d18Owg_VSMOW");

    /* working gas */
    const IsobarRatios wg = compute_isobar_ratios(ref,
                                                  R13_from_d13C(ref, r.d13Cwg_VPDB),
                                                  R18_from_d18O(ref, r.d18Owg_VSMOW));

    /* analyte */
    const double R45 = (1.0 + r.d45 / 1000.0) * wg.R45;
    const double R46 = (1.0 + r.d46 / 1000.0) * wg.R46;
    const double R47 = (1.0 + r.d47 / 1000.0) * wg.R47;
    const double R48 = (1.0 + r.d48 / 1000.0) * wg.R48;
    const double R49 = (1.0 + r.d49 / 1000.0) * wg.R49;

    const BulkComposition bulk = compute_bulk_delta(ref, R45, R46, r.D17O);
    r.d13C_VPDB  = bulk.d13C_VPDB;
    r.d18O_VSMOW = bulk.d18O_VSMOW;

    /* stochastic reference of the analyte */
    const IsobarRatios stoch = compute_isobar_ratios(ref,
                                                     R13_from_d13C(ref, r.d13C_VPDB),
                                                     R18_from_d18O(ref, r.d18O_VSMOW),
                                                     r.D17O);

    const double e45 = R45 / stoch.R45 - 1.0;
    const double e46 = R46 / stoch.R46 - 1.0;
    if (std::abs(e45) > kRoundTripTolerance) {
        data.vmsg("crunch", "This is unexpected: R45/R45stoch - 1 = " + fixed(1e6 * e45, 3)
                            + " ppm (analysis " + r.UID + ")");
        data.note_numerical_anomaly();
    }
    if (std::abs(e46) > kRoundTripTolerance) {
        data.vmsg("crunch", "This is unexpected: R46/R46stoch - 1 = " + fixed(1e6 * e46, 3)
                            + " ppm (analysis " + r.UID + ")");
        data.note_numerical_anomaly();
    }

    r.D47raw = 1000.0 * (R47 / stoch.R47 - 1.0);
    r.D48raw = 1000.0 * (R48 / stoch.R48 - 1.0);
    r.D49raw = 1000.0 * (R49 / stoch.R49 - 1.0);
}

/* ------------------------------------------------------------------------- */
/*  bulk standardization                                                     */
/* ------------------------------------------------------------------------- */
void standardize_d13C(D4xData& data)
{
    standardize_bulk(data, &Analysis::d13C_VPDB, false);
}

void standardize_d18O(D4xData& data)
{
    standardize_bulk(data, &Analysis::d18O_VSMOW, true);
}

void crunch(D4xData& data)
{
    for (auto& r : data.analyses())
        compute_bulk_and_clumping_deltas(data, r);

    /* sessions may have been given their WG through the input records */
    for (auto& [name, s] : data.sessions()) {
        const Analysis& first = data.analyses()[s.data.front()];
        s.d13Cwg_VPDB  = first.d13Cwg_VPDB;
        s.d18Owg_VSMOW = first.d18Owg_VSMOW;
    }

    standardize_d13C(data);
    standardize_d18O(data);
    data.msg("crunch", "Crunched " + std::to_string(data.size()) + " analyses.");
}

} // namespace clumpfit
