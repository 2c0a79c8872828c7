#include "clumpfit/VirtualData.hpp"
#include "clumpfit/Errors.hpp"
#include "clumpfit/IsobarModel.hpp"
#include "clumpfit/StatsUtils.hpp"
#include <random>

namespace clumpfit {
namespace {

double lookup(const std::optional<double>& v,
              const std::map<std::string, double>& table,
              const std::string& sample,
              const char* what)
{
    if (v) return *v;
    auto it = table.find(sample);
    if (it == table.end())
        throw ConfigurationError("Sample '" + sample + "' is missing a " + what
                                 + " value and has no nominal one");
    return it->second;
}

std::vector<double> scaled_errors(std::mt19937& rng, std::size_t n, double r)
{
    std::normal_distribution<> dist(0.0, 1.0);
    std::vector<double> e(n);
    for (double& x : e) x = dist(rng);
    if (n < 2) return std::vector<double>(n, 0.0);
    const double sd = stdev(e);
    for (double& x : e) x *= r / sd;
    return e;
}

} // namespace

Analysis simulate_single_analysis(const Config& cfg,
                                  const VirtualSample& s,
                                  double d13Cwg_VPDB,
                                  double d18Owg_VSMOW,
                                  const InstrumentModel& m)
{
    const ReferenceRatios& ref = cfg.ratios;

    const double d13C = lookup(s.d13C_VPDB, cfg.nominal_d13C_VPDB, s.Sample, "d13C_VPDB");
    const double d18O = lookup(s.d18O_VPDB, cfg.nominal_d18O_VPDB, s.Sample, "d18O_VPDB");
    const double D47  = lookup(s.D47, cfg.nominal_D47, s.Sample, "D47");
    const double D48  = lookup(s.D48, cfg.nominal_D48, s.Sample, "D48");

    const IsobarRatios wg = compute_isobar_ratios(ref, R13_from_d13C(ref, d13Cwg_VPDB),
                                                  R18_from_d18O(ref, d18Owg_VSMOW));

    const double R13 = R13_from_d13C(ref, d13C);
    const double R18 = ref.R18_VPDB * (1.0 + d18O / 1000.0) * cfg.alpha_18O_acid;
    const IsobarRatios R     = compute_isobar_ratios(ref, R13, R18, s.D17O, D47, D48, s.D49);
    const IsobarRatios stoch = compute_isobar_ratios(ref, R13, R18, s.D17O);

    Analysis r;
    r.Sample       = s.Sample;
    r.D17O         = s.D17O;
    r.d13Cwg_VPDB  = d13Cwg_VPDB;
    r.d18Owg_VSMOW = d18Owg_VSMOW;
    r.d45 = 1000.0 * (R.R45 / wg.R45 - 1.0);
    r.d46 = 1000.0 * (R.R46 / wg.R46 - 1.0);
    r.d47 = 1000.0 * (R.R47 / wg.R47 - 1.0);
    r.d48 = 1000.0 * (R.R48 / wg.R48 - 1.0);
    r.d49 = 1000.0 * (R.R49 / wg.R49 - 1.0);

    /* raw anomalies depend on δ47 / δ48 themselves: fixed-point iteration */
    for (int k = 0; k < 3; ++k) {
        const double R47raw = (1.0 + (m.a47 * D47 + m.b47 * r.d47 + m.c47) / 1000.0) * stoch.R47;
        const double R48raw = (1.0 + (m.a48 * D48 + m.b48 * r.d48 + m.c48) / 1000.0) * stoch.R48;
        r.d47 = 1000.0 * (R47raw / wg.R47 - 1.0);
        r.d48 = 1000.0 * (R48raw / wg.R48 - 1.0);
    }
    return r;
}

std::vector<Analysis> virtual_data(const Config& cfg, const VirtualSession& v)
{
    std::size_t N = 0;
    for (const auto& s : v.samples) {
        if (s.N < 0)
            throw ConfigurationError("Sample '" + s.Sample + "': negative number of analyses");
        N += static_cast<std::size_t>(s.N);
    }

    std::mt19937 rng(v.seed ? v.seed : std::random_device{}());
    const std::vector<double> e47 = scaled_errors(rng, N, v.rD47);
    const std::vector<double> e48 = scaled_errors(rng, N, v.rD48);

    std::vector<Analysis> out;
    out.reserve(N);
    std::size_t k = 0;
    for (const auto& s : v.samples) {
        const Analysis base = simulate_single_analysis(cfg, s, v.d13Cwg_VPDB, v.d18Owg_VSMOW, v.model);
        for (int i = 0; i < s.N; ++i, ++k) {
            Analysis r = base;
            r.d47 += e47[k] * v.model.a47;
            r.d48 += e48[k] * v.model.a48;
            r.Session = v.session;
            out.push_back(std::move(r));
        }
    }
    return out;
}

VirtualSession virtual_session_from_json(const nlohmann::json& j)
{
    VirtualSession v;
    try {
        v.session      = j.value("session", std::string{});
        v.seed         = j.value("seed", 0u);
        v.rD47         = j.value("rD47", v.rD47);
        v.rD48         = j.value("rD48", v.rD48);
        v.d13Cwg_VPDB  = j.value("d13Cwg_VPDB", v.d13Cwg_VPDB);
        v.d18Owg_VSMOW = j.value("d18Owg_VSMOW", v.d18Owg_VSMOW);
        v.model.a47 = j.value("a47", v.model.a47);
        v.model.b47 = j.value("b47", v.model.b47);
        v.model.c47 = j.value("c47", v.model.c47);
        v.model.a48 = j.value("a48", v.model.a48);
        v.model.b48 = j.value("b48", v.model.b48);
        v.model.c48 = j.value("c48", v.model.c48);

        for (const auto& js : j.at("samples")) {
            VirtualSample s;
            s.Sample = js.at("Sample").get<std::string>();
            s.N      = js.value("N", 1);
            if (js.contains("d13C_VPDB")) s.d13C_VPDB = js["d13C_VPDB"].get<double>();
            if (js.contains("d18O_VPDB")) s.d18O_VPDB = js["d18O_VPDB"].get<double>();
            if (js.contains("D47"))       s.D47       = js["D47"].get<double>();
            if (js.contains("D48"))       s.D48       = js["D48"].get<double>();
            s.D49  = js.value("D49", 0.0);
            s.D17O = js.value("D17O", 0.0);
            v.samples.push_back(std::move(s));
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationError(std::string("Invalid virtual session: ") + e.what());
    }
    return v;
}

} // namespace clumpfit
