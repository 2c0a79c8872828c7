#include "clumpfit/ConsolidationStatistics.hpp"
#include "clumpfit/CovariancePropagator.hpp"
#include "clumpfit/ParameterIndexer.hpp"
#include "clumpfit/StatsUtils.hpp"
#include <algorithm>
#include <cmath>
#include <iomanip>
#include <set>
#include <sstream>

namespace clumpfit {
namespace {

bool selected(const D4xData& data, const std::string& sample, SampleClass c)
{
    switch (c) {
        case SampleClass::Anchors:  return data.is_anchor(sample);
        case SampleClass::Unknowns: return !data.is_anchor(sample);
        default:                    return true;
    }
}

std::set<std::string> session_set(const D4xData& data, const std::vector<std::string>& sessions)
{
    if (sessions.empty()) {
        auto all = data.session_names();
        return { all.begin(), all.end() };
    }
    return { sessions.begin(), sessions.end() };
}

double value_of(const Analysis& r, Observable key)
{
    switch (key) {
        case Observable::d13C_VPDB:  return r.d13C_VPDB;
        case Observable::d18O_VSMOW: return r.d18O_VSMOW;
        default:                     return r.D4x;
    }
}

std::string ppm(double r)
{
    std::ostringstream s;
    s << std::fixed << std::setprecision(1) << 1000.0 * r << " ppm";
    return s.str();
}

} // namespace

std::string to_string(SampleClass c)
{
    switch (c) {
        case SampleClass::Anchors:  return "anchors";
        case SampleClass::Unknowns: return "unknowns";
        default:                    return "all samples";
    }
}

/* ------------------------------------------------------------------------- */
/*  RMSWD                                                                    */
/* ------------------------------------------------------------------------- */
RmswdResult rmswd(const D4xData& data, SampleClass samples, const std::vector<std::string>& sessions)
{
    const auto keep = session_set(data, sessions);
    RmswdResult out;

    for (const auto& [name, smp] : data.samples()) {
        if (!selected(data, name, samples)) continue;

        std::vector<double> X, sX;
        for (std::size_t i : smp.data) {
            const Analysis& r = data.analyses()[i];
            if (!keep.count(r.Session)) continue;
            X.push_back(r.D4x);
            sX.push_back(r.wD4x);
        }
        if (X.size() < 2) continue;

        const double avg = w_avg(X, sX).value;
        out.Nf += static_cast<int>(X.size()) - 1;
        for (std::size_t k = 0; k < X.size(); ++k)
            out.chisq += std::pow((X[k] - avg) / sX[k], 2);
    }
    out.rmswd = out.Nf > 0 ? std::sqrt(out.chisq / out.Nf) : 0.0;

    std::ostringstream s;
    s << "RMSWD of " << data.D4x_name() << " is " << std::fixed << std::setprecision(6)
      << out.rmswd << " for " << to_string(samples) << ".";
    data.msg("rmswd", s.str());
    return out;
}

/* ------------------------------------------------------------------------- */
/*  repeatabilities                                                          */
/* ------------------------------------------------------------------------- */
double compute_r(const D4xData& data, Observable key, SampleClass samples,
                 const std::vector<std::string>& sessions)
{
    const auto keep = session_set(data, sessions);
    double chisq = 0.0;
    int    Nf    = 0;

    for (const auto& [name, smp] : data.samples()) {
        if (!selected(data, name, samples)) continue;

        std::vector<double> X;
        for (std::size_t i : smp.data) {
            const Analysis& r = data.analyses()[i];
            if (keep.count(r.Session)) X.push_back(value_of(r, key));
        }
        if (X.size() < 2) continue;

        if (key == Observable::D4x) {
            for (double x : X) chisq += (x - smp.D4x) * (x - smp.D4x);
            Nf += smp.anchor ? static_cast<int>(X.size()) : static_cast<int>(X.size()) - 1;
        } else {
            const double m = mean(X);
            for (double x : X) chisq += (x - m) * (x - m);
            Nf += static_cast<int>(X.size()) - 1;
        }
    }

    if (key == Observable::D4x && samples != SampleClass::Unknowns) {
        for (const auto& sname : keep) {
            auto it = data.sessions().find(sname);
            if (it == data.sessions().end()) continue;
            std::set<std::string> anchors_present;
            for (std::size_t i : it->second.data) {
                const Analysis& r = data.analyses()[i];
                if (data.is_anchor(r.Sample)) anchors_present.insert(r.Sample);
            }
            Nf -= std::min(it->second.Np, static_cast<int>(anchors_present.size()));
        }
    }

    const double r = Nf > 0 ? std::sqrt(chisq / Nf) : 0.0;
    const char* label = key == Observable::d13C_VPDB  ? "d13C_VPDB"
                      : key == Observable::d18O_VSMOW ? "d18O_VSMOW" : "D4x";
    data.msg("compute_r", std::string("Repeatability of ") + label + " is " + ppm(r)
                          + " for " + to_string(samples) + ".");
    return r;
}

void load_session_parameters(D4xData& data)
{
    const StandardizationResult& res = data.standardization();
    for (auto& [name, s] : data.sessions()) {
        const std::size_t i0 = res.session_index(name, 0);
        double* p[6]  = { &s.a,    &s.b,    &s.c,    &s.a2,    &s.b2,    &s.c2 };
        double* se[6] = { &s.SE_a, &s.SE_b, &s.SE_c, &s.SE_a2, &s.SE_b2, &s.SE_c2 };
        for (int k = 0; k < 6; ++k) {
            *p[k]  = res.values[i0 + k];
            *se[k] = std::sqrt(std::max(0.0, res.covar(i0 + k, i0 + k)));
        }
        s.CM = res.covar.block<6, 6>(static_cast<Eigen::Index>(i0), static_cast<Eigen::Index>(i0));
    }
}

/* ------------------------------------------------------------------------- */
/*  samples                                                                  */
/* ------------------------------------------------------------------------- */
void consolidate_samples(D4xData& data)
{
    const int mass = data.mass();
    const auto& nominal = data.nominal_D4x();

    std::vector<double> ref_pop;
    const std::string& ref = data.config().levene_ref_sample;
    if (auto it = data.samples().find(ref); it != data.samples().end())
        for (std::size_t i : it->second.data) ref_pop.push_back(data.analyses()[i].D4x);

    for (auto& [name, smp] : data.samples()) {
        std::vector<double> D, d13, d18;
        for (std::size_t i : smp.data) {
            const Analysis& r = data.analyses()[i];
            D.push_back(r.D4x);
            d13.push_back(r.d13C_VPDB);
            d18.push_back(r.d18O_VSMOW);
        }
        smp.N = static_cast<int>(D.size());
        smp.SD_D4x.reset();
        if (smp.N > 1) smp.SD_D4x = stdev(D);
        smp.d13C_VPDB  = mean(d13);
        smp.d18O_VSMOW = mean(d18);

        smp.p_Levene.reset();
        if (smp.N > 2 && !ref_pop.empty())
            smp.p_Levene = levene_median(ref_pop, D);

        smp.session_D4x.clear();
        if (smp.anchor) {
            smp.D4x    = nominal.at(name);
            smp.SE_D4x = 0.0;
        }
    }

    if (data.standardization_method() == Method::Pooled) {
        const StandardizationResult& res = data.standardization();
        for (auto& [name, smp] : data.samples()) {
            if (smp.anchor) continue;
            const std::size_t i = res.index_of(data.D4x_name() + "_" + pf(name));
            smp.D4x    = res.values[i];
            smp.SE_D4x = std::sqrt(std::max(0.0, res.covar(i, i)));
        }
    } else {
        for (auto& [name, smp] : data.samples()) {
            if (smp.anchor) continue;
            data.msg("consolidate", "Consolidating sample " + name);

            std::vector<double> X, sX;
            for (const auto& [sname, s] : data.sessions()) {
                std::vector<const Analysis*> sdata;
                for (std::size_t i : s.data)
                    if (data.analyses()[i].Sample == name) sdata.push_back(&data.analyses()[i]);
                if (sdata.empty()) continue;

                double avg_D = 0.0, avg_d = 0.0;
                for (const Analysis* r : sdata) { avg_D += r->D4x; avg_d += r->d4x(mass); }
                avg_D /= static_cast<double>(sdata.size());
                avg_d /= static_cast<double>(sdata.size());

                const double sigma_s = standardization_error(s, avg_d, avg_D);
                const double sigma_u = sdata.front()->wD4xraw / s.a
                                     / std::sqrt(static_cast<double>(sdata.size()));
                const double se = std::hypot(sigma_u, sigma_s);

                smp.session_D4x[sname] = SessionEstimate{ avg_D, se, kNaN };
                X.push_back(avg_D);
                sX.push_back(se);
            }

            const WeightedValue avg = w_avg(X, sX);
            smp.D4x    = avg.value;
            smp.SE_D4x = avg.SE;

            double wsum = 0.0;
            for (const auto& [sname, e] : smp.session_D4x) wsum += 1.0 / (e.SE * e.SE);
            for (auto& [sname, e] : smp.session_D4x) e.weight = 1.0 / (e.SE * e.SE) / wsum;
        }
    }

    for (auto& r : data.analyses())
        r.D4x_residual = r.D4x - data.sample(r.Sample).D4x;
}

/* ------------------------------------------------------------------------- */
/*  sessions                                                                 */
/* ------------------------------------------------------------------------- */
void consolidate_sessions(D4xData& data)
{
    for (auto& [name, s] : data.sessions()) {
        const Analysis& first = data.analyses()[s.data.front()];
        if (!std::isfinite(s.d13Cwg_VPDB))  s.d13Cwg_VPDB  = first.d13Cwg_VPDB;
        if (!std::isfinite(s.d18Owg_VSMOW)) s.d18Owg_VSMOW = first.d18Owg_VSMOW;

        s.Na = s.Nu = 0;
        for (std::size_t i : s.data)
            (data.is_anchor(data.analyses()[i].Sample) ? s.Na : s.Nu) += 1;

        data.msg("consolidate", "Computing repeatabilities for session " + name);
        s.r_d13C_VPDB  = compute_r(data, Observable::d13C_VPDB,  SampleClass::Anchors, { name });
        s.r_d18O_VSMOW = compute_r(data, Observable::d18O_VSMOW, SampleClass::Anchors, { name });
        s.r_D4x        = compute_r(data, Observable::D4x,        SampleClass::All,     { name });
    }

    if (data.standardization_method() == Method::Pooled)
        load_session_parameters(data);
}

void repeatabilities(D4xData& data)
{
    data.msg("consolidate", "Computing repeatabilities for all sessions");
    const std::string D = data.D4x_name();
    data.repeatability["r_d13C_VPDB"]  = compute_r(data, Observable::d13C_VPDB,  SampleClass::Anchors);
    data.repeatability["r_d18O_VSMOW"] = compute_r(data, Observable::d18O_VSMOW, SampleClass::Anchors);
    data.repeatability["r_" + D + "a"] = compute_r(data, Observable::D4x, SampleClass::Anchors);
    data.repeatability["r_" + D + "u"] = compute_r(data, Observable::D4x, SampleClass::Unknowns);
    data.repeatability["r_" + D]       = compute_r(data, Observable::D4x, SampleClass::All);
}

void consolidate(D4xData& data)
{
    consolidate_samples(data);
    consolidate_sessions(data);
    repeatabilities(data);
}

} // namespace clumpfit
