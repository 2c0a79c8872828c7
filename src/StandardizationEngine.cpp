#include "clumpfit/StandardizationEngine.hpp"
#include "clumpfit/ConsolidationStatistics.hpp"
#include "clumpfit/ConstraintMap.hpp"
#include "clumpfit/CovariancePropagator.hpp"
#include "clumpfit/Errors.hpp"
#include "clumpfit/LevenbergMarquardt.hpp"
#include "clumpfit/ParameterIndexer.hpp"
#include "clumpfit/PooledResidual.hpp"
#include "clumpfit/StatsUtils.hpp"
#include <Eigen/Dense>
#include <algorithm>
#include <array>
#include <cmath>
#include <exception>
#include <iomanip>
#include <map>
#include <set>
#include <sstream>

#ifdef _OPENMP
  #include <omp.h>
#endif

namespace clumpfit {
namespace {

constexpr double kStartA       = 0.9;
constexpr double kStartC       = -0.9;
constexpr double kStartUnknown = 0.5;

std::string fixed(double v, int prec)
{
    std::ostringstream s;
    s << std::fixed << std::setprecision(prec) << v;
    return s.str();
}

std::string join(const std::vector<std::string>& v)
{
    std::string out;
    for (const auto& x : v) out += (out.empty() ? "" : ", ") + x;
    return "[" + out + "]";
}

std::array<bool, 6> active_params(const SessionSettings& st)
{
    return { true, true, true, st.scrambling_drift, st.slope_drift, st.wg_drift };
}

/*  D4x = (raw − c − b·d − c2·t − b2·t·d) / (a + a2·t),  wD4x = wD4xraw / (a + a2·t)  */
void apply_model(D4xData& data, const Session& s)
{
    const int mass = data.mass();
    for (std::size_t i : s.data) {
        Analysis& r = data.analyses()[i];
        const double scale = s.a + s.a2 * r.t;
        if (scale == 0.0 || !std::isfinite(scale))
            throw InsufficientDataError("Session '" + s.name + "': a + a2·t vanishes for analysis " + r.UID);
        const double d = r.d4x(mass);
        r.D4x  = (r.D4xraw(mass) - s.c - s.b * d - s.c2 * r.t - s.b2 * r.t * d) / scale;
        r.wD4x = r.wD4xraw / scale;
    }
}

} // namespace

/* ------------------------------------------------------------------------- */
/*  timestamps                                                               */
/* ------------------------------------------------------------------------- */
void assign_timestamps(D4xData& data)
{
    for (auto& [name, s] : data.sessions()) {
        const bool tagged = std::all_of(s.data.begin(), s.data.end(), [&](std::size_t i) {
            return data.analyses()[i].TimeTag.has_value();
        });

        if (tagged) {
            double t0 = 0.0;
            for (std::size_t i : s.data) t0 += *data.analyses()[i].TimeTag;
            t0 /= static_cast<double>(s.data.size());
            for (std::size_t i : s.data)
                data.analyses()[i].t = *data.analyses()[i].TimeTag - t0;
        } else {
            const double t0 = (static_cast<double>(s.data.size()) - 1.0) / 2.0;
            for (std::size_t k = 0; k < s.data.size(); ++k)
                data.analyses()[s.data[k]].t = static_cast<double>(k) - t0;
        }
    }
}

/* ------------------------------------------------------------------------- */
/*  setup                                                                    */
/* ------------------------------------------------------------------------- */
StandardizationEngine::Options StandardizationEngine::options_from(const Config& cfg)
{
    Options o;
    o.method            = cfg.method;
    o.weighted_sessions = cfg.weighted_sessions;
    o.constraints       = cfg.constraints;
    o.max_iterations    = cfg.max_iterations;
    o.threads           = cfg.threads;
    return o;
}

StandardizationEngine::StandardizationEngine(D4xData& data, Options opt)
    : data_(data)
    , opt_(std::move(opt))
{
    if (opt_.method != Method::Pooled && !opt_.constraints.empty())
        throw ConfigurationError("Parameter constraints are only supported by the pooled method");
    if (opt_.max_iterations <= 0)
        throw ConfigurationError("max_iterations must be positive");
}

void StandardizationEngine::check_inputs() const
{
    if (data_.size() == 0)
        throw InsufficientDataError("Nothing to standardize: the dataset is empty");

    const int mass = data_.mass();
    for (const auto& r : data_.analyses()) {
        if (!std::isfinite(r.D4xraw(mass)) || !std::isfinite(r.d4x(mass)))
            throw ConfigurationError("Analysis " + r.UID + " (sample '" + r.Sample + "'): "
                                     + data_.D4x_name() + "raw or d" + std::to_string(mass)
                                     + " is not finite; was the dataset crunched?");
        if (!(r.wD4xraw > 0.0))
            throw ConfigurationError("Analysis " + r.UID + ": non-positive weight");
    }

    for (const auto& [name, s] : data_.sessions()) {
        const bool has_anchor = std::any_of(s.data.begin(), s.data.end(), [&](std::size_t i) {
            return data_.is_anchor(data_.analyses()[i].Sample);
        });
        if (!has_anchor)
            throw InsufficientDataError("Session '" + name + "' contains no anchor analyses");
    }
}

void StandardizationEngine::check_weighted_groups() const
{
    for (const auto& group : opt_.weighted_sessions) {
        if (group.empty())
            throw ConfigurationError("Empty group in weighted_sessions");
        for (const auto& s : group)
            if (!data_.sessions().count(s))
                throw ConfigurationError("weighted_sessions refers to unknown session '" + s + "'");
    }
}

/* ------------------------------------------------------------------------- */
/*  weights                                                                  */
/* ------------------------------------------------------------------------- */
void StandardizationEngine::reset_weights()
{
    for (auto& r : data_.analyses()) r.wD4xraw = 1.0;
}

void StandardizationEngine::weight_groups_pooled()
{
    reset_weights();
    for (const auto& group : opt_.weighted_sessions) {
        D4xData sub = data_.subset(group);
        Options o = opt_;
        o.weighted_sessions.clear();
        o.constraints.clear();
        o.consolidate = false;
        const StandardizationResult& res = StandardizationEngine(sub, o).run();

        const double w = std::sqrt(res.redchi);
        data_.msg("standardize", "Session group " + join(group) + " MRSWD = " + fixed(w, 4));
        if (!(w > 0.0)) continue;       // perfect fit: keep unit weights

        const std::set<std::string> members(group.begin(), group.end());
        for (auto& r : data_.analyses())
            if (members.count(r.Session)) r.wD4xraw *= w;
    }
}

void StandardizationEngine::weight_groups_indep()
{
    for (const auto& group : opt_.weighted_sessions) {
        D4xData sub = data_.subset(group);
        Options o = opt_;
        o.weighted_sessions.clear();
        o.consolidate = false;
        StandardizationEngine(sub, o).run();

        std::map<std::string, double> w;
        for (const auto& r : sub.analyses()) w[r.UID] = r.wD4xraw;
        for (auto& r : data_.analyses())
            if (auto it = w.find(r.UID); it != w.end()) r.wD4xraw = it->second;

        data_.msg("standardize", data_.D4x_name() + "raw weights set to "
                                 + fixed(1000.0 * sub.analyses().front().wD4xraw, 1)
                                 + " ppm for sessions in " + join(group));
    }
}

/* ------------------------------------------------------------------------- */
/*  driver                                                                   */
/* ------------------------------------------------------------------------- */
const StandardizationResult& StandardizationEngine::run()
{
    data_.set_standardization_method(opt_.method);
    for (auto& [name, s] : data_.sessions())
        s.Np = s.settings.n_active_params();

    check_inputs();
    check_weighted_groups();
    assign_timestamps(data_);

    data_.msg("standardize", "Standardizing " + std::to_string(data_.size()) + " analyses from "
                             + std::to_string(data_.sessions().size()) + " sessions ("
                             + to_string(opt_.method) + ")");

    if (opt_.method == Method::Pooled) run_pooled();
    else                               run_indep();

    return data_.standardization();
}

/* ------------------------------------------------------------------------- */
/*  pooled                                                                   */
/* ------------------------------------------------------------------------- */
StandardizationResult StandardizationEngine::run_pooled()
{
    if (!opt_.weighted_sessions.empty()) {
        weight_groups_pooled();
    } else {
        data_.msg("standardize", "All " + data_.D4x_name() + "raw weights set to 1 ‰");
        reset_weights();
    }

    const int mass = data_.mass();
    const auto sessions = data_.session_names();
    const auto unknowns = data_.unknowns();

    ParameterIndexer idx;
    idx.build(sessions, unknowns, mass);

    /* inactive drift terms are fixed at zero */
    std::vector<bool> fixed_zero(idx.total(), false);
    Vector p0 = Vector::Zero(idx.total());
    for (std::size_t k = 0; k < sessions.size(); ++k) {
        const Session& s = data_.session(sessions[k]);
        data_.msg("standardize", "Session " + sessions[k] + ": scrambling_drift is "
                                 + (s.settings.scrambling_drift ? "true" : "false") + ", slope_drift is "
                                 + (s.settings.slope_drift ? "true" : "false") + ", wg_drift is "
                                 + (s.settings.wg_drift ? "true" : "false") + ".");
        const auto active = active_params(s.settings);
        for (int p = 3; p < ParameterIndexer::kNSessionParams; ++p)
            fixed_zero[idx.session_param(k, p)] = !active[p];
        p0[idx.session_param(k, 0)] = kStartA;
        p0[idx.session_param(k, 2)] = kStartC;
    }
    for (std::size_t u = 0; u < unknowns.size(); ++u)
        p0[idx.unknown(u)] = kStartUnknown;

    const ConstraintMap map(idx.names(), fixed_zero, opt_.constraints);

    /* residual rows */
    std::map<std::string, int> session_pos, unknown_pos;
    for (std::size_t k = 0; k < sessions.size(); ++k) session_pos[sessions[k]] = static_cast<int>(k);
    for (std::size_t u = 0; u < unknowns.size(); ++u) unknown_pos[unknowns[u]] = static_cast<int>(u);

    const auto& nominal = data_.nominal_D4x();
    std::vector<PooledRow> rows;
    rows.reserve(data_.size());
    for (const auto& r : data_.analyses()) {
        PooledRow row{};
        row.raw     = r.D4xraw(mass);
        row.d       = r.d4x(mass);
        row.t       = r.t;
        row.w       = r.wD4xraw;
        row.session = session_pos.at(r.Session);
        auto it = nominal.find(r.Sample);
        row.unknown = it == nominal.end() ? unknown_pos.at(r.Sample) : -1;
        row.nominal = it == nominal.end() ? kNaN : it->second;
        rows.push_back(row);
    }

    const PooledResidual cost(std::move(rows), idx, map);

    LMSolverOptions lo;
    lo.max_iterations = opt_.max_iterations;
    lo.verbose        = data_.verbose();

    Vector u = map.reduce(p0);
    const LMSolverSummary summ = levenberg_marquardt(cost, u, lo);

    if (summ.singular)
        throw InsufficientDataError("Pooled standardization is underdetermined (rank "
                                    + std::to_string(summ.rank) + " for "
                                    + std::to_string(map.n_free())
                                    + " free parameters); check the anchors of every session");
    if (!summ.converged)
        data_.vmsg("standardize", "Pooled fit did not converge within "
                                  + std::to_string(opt_.max_iterations) + " iterations");

    StandardizationResult res;
    res.method           = Method::Pooled;
    res.mass             = mass;
    res.var_names        = idx.names();
    res.values           = map.expand(u);
    res.covar            = map.propagate(summ.covariance);
    res.varying.resize(idx.total());
    for (int i = 0; i < idx.total(); ++i) res.varying[i] = map.is_free(i);
    res.sessions         = sessions;
    res.unknowns         = unknowns;
    res.n_session_params = static_cast<std::size_t>(idx.n_session_params());
    res.Nf               = cost.numResiduals() - map.n_free();
    res.t95              = student_t95(res.Nf);
    res.chisq            = summ.final_chi2;
    res.redchi           = summ.final_chi2 / std::max(res.Nf, 1);
    res.iterations       = summ.iterations;
    res.converged        = summ.converged;

    data_.Nf  = res.Nf;
    data_.t95 = res.t95;
    data_.set_standardization(res);

    load_session_parameters(data_);
    for (const auto& [name, s] : data_.sessions()) apply_model(data_, s);

    data_.msg("standardize", "Pooled fit: χ² = " + fixed(res.chisq, 6) + ", Nf = "
                             + std::to_string(res.Nf) + ", " + std::to_string(res.iterations)
                             + " iterations");

    if (opt_.consolidate) consolidate(data_);
    return res;
}

/* ------------------------------------------------------------------------- */
/*  indep_sessions                                                           */
/* ------------------------------------------------------------------------- */
void StandardizationEngine::fit_session(Session& s)
{
    const int mass = data_.mass();
    const auto& nominal = data_.nominal_D4x();
    const auto active = active_params(s.settings);
    s.Np = s.settings.n_active_params();

    std::vector<const Analysis*> anchors;
    for (std::size_t i : s.data) {
        const Analysis& r = data_.analyses()[i];
        if (nominal.count(r.Sample)) anchors.push_back(&r);
    }
    s.Na = static_cast<int>(anchors.size());
    if (anchors.empty())
        throw InsufficientDataError("Session '" + s.name + "' contains no anchor analyses");

    Matrix A(anchors.size(), s.Np);
    Vector Y(anchors.size());
    for (std::size_t k = 0; k < anchors.size(); ++k) {
        const Analysis& r = *anchors[k];
        const double w   = r.wD4xraw;
        const double nom = nominal.at(r.Sample);
        const double d   = r.d4x(mass);
        const double full[6] = { nom / w, d / w, 1.0 / w, nom * r.t / w, d * r.t / w, r.t / w };
        int col = 0;
        for (int p = 0; p < 6; ++p)
            if (active[p]) A(static_cast<Eigen::Index>(k), col++) = full[p];
        Y[static_cast<Eigen::Index>(k)] = r.D4xraw(mass) / w;
    }

    const Matrix N = A.transpose() * A;
    Eigen::FullPivLU<Matrix> lu(N);
    if (lu.rank() < s.Np)
        throw InsufficientDataError("Session '" + s.name + "': " + std::to_string(s.Na)
                                    + " anchor analyses only constrain " + std::to_string(lu.rank())
                                    + " of " + std::to_string(s.Np) + " standardization parameters");

    const Matrix CM = lu.inverse();
    const Vector bf = CM * (A.transpose() * Y);

    double* params[6] = { &s.a, &s.b, &s.c, &s.a2, &s.b2, &s.c2 };
    std::vector<int> k_active;
    for (int p = 0, k = 0; p < 6; ++p) {
        if (active[p]) {
            *params[p] = bf[k++];
            k_active.push_back(p);
        } else {
            *params[p] = 0.0;
        }
    }

    s.CM.setZero();
    for (std::size_t i = 0; i < k_active.size(); ++i)
        for (std::size_t j = 0; j < k_active.size(); ++j)
            s.CM(k_active[i], k_active[j]) = CM(static_cast<Eigen::Index>(i), static_cast<Eigen::Index>(j));

    apply_model(data_, s);
}

StandardizationResult StandardizationEngine::run_indep()
{
    const bool weighted = !opt_.weighted_sessions.empty();
    if (weighted) {
        weight_groups_indep();
    } else {
        data_.msg("standardize", "All weights set to 1 ‰");
        reset_weights();
    }

    std::vector<Session*> sessions;
    for (auto& [name, s] : data_.sessions()) sessions.push_back(&s);

    std::exception_ptr failure;
    const int n = static_cast<int>(sessions.size());

#ifdef _OPENMP
    const int nthreads = opt_.threads > 0 ? opt_.threads : omp_get_max_threads();
#endif
    #pragma omp parallel for schedule(dynamic) num_threads(nthreads) if (n > 1)
    for (int k = 0; k < n; ++k) {
        try {
            fit_session(*sessions[k]);
        } catch (...) {
            #pragma omp critical(clumpfit_indep_failure)
            if (!failure) failure = std::current_exception();
        }
    }
    if (failure) std::rethrow_exception(failure);

    if (!weighted) {
        const double w = rmswd(data_).rmswd;
        if (w > 0.0) {
            for (auto& r : data_.analyses()) {
                r.wD4x    *= w;
                r.wD4xraw *= w;
            }
            for (Session* s : sessions) s->CM *= w * w;
        }
    }

    for (Session* s : sessions) {
        s->SE_a  = std::sqrt(s->CM(0, 0));
        s->SE_b  = std::sqrt(s->CM(1, 1));
        s->SE_c  = std::sqrt(s->CM(2, 2));
        s->SE_a2 = std::sqrt(s->CM(3, 3));
        s->SE_b2 = std::sqrt(s->CM(4, 4));
        s->SE_c2 = std::sqrt(s->CM(5, 5));
    }

    if (!weighted) {
        int Np = 0;
        for (Session* s : sessions) Np += s->Np;
        data_.Nf = static_cast<int>(data_.size()) - static_cast<int>(data_.unknowns().size()) - Np;
    } else {
        data_.Nf = 0;
        for (const auto& group : opt_.weighted_sessions)
            data_.Nf += rmswd(data_, SampleClass::All, group).Nf;
    }
    data_.t95 = student_t95(data_.Nf);

    /* Δ4x scatter around the sample means */
    std::map<std::string, double> avg;
    for (const auto& [name, smp] : data_.samples()) {
        double sum = 0.0;
        for (std::size_t i : smp.data) sum += data_.analyses()[i].D4x;
        avg[name] = sum / static_cast<double>(smp.data.size());
    }
    double chi2 = 0.0;
    for (const auto& r : data_.analyses()) chi2 += std::pow(r.D4x - avg[r.Sample], 2);
    data_.repeatability["sigma_" + std::to_string(data_.mass())] =
        data_.Nf > 0 ? std::sqrt(chi2 / data_.Nf) : 0.0;

    consolidate_samples(data_);

    StandardizationResult res = indep_result();
    data_.set_standardization(res);

    if (opt_.consolidate) {
        consolidate_sessions(data_);
        repeatabilities(data_);
    }
    return res;
}

/*  Result layout identical to the pooled one: session blocks from CM,
 *  unknowns from the consolidated session averages.                      */
StandardizationResult StandardizationEngine::indep_result() const
{
    const int mass = data_.mass();
    const auto sessions = data_.session_names();
    const auto unknowns = data_.unknowns();

    ParameterIndexer idx;
    idx.build(sessions, unknowns, mass);

    StandardizationResult res;
    res.method           = Method::IndepSessions;
    res.mass             = mass;
    res.var_names        = idx.names();
    res.values           = Vector::Zero(idx.total());
    res.covar            = Matrix::Zero(idx.total(), idx.total());
    res.varying.assign(idx.total(), true);
    res.sessions         = sessions;
    res.unknowns         = unknowns;
    res.n_session_params = static_cast<std::size_t>(idx.n_session_params());

    for (std::size_t k = 0; k < sessions.size(); ++k) {
        const Session& s = data_.session(sessions[k]);
        const int i0 = idx.session_param(k, 0);
        const double p[6] = { s.a, s.b, s.c, s.a2, s.b2, s.c2 };
        const auto active = active_params(s.settings);
        for (int j = 0; j < 6; ++j) {
            res.values[i0 + j]  = p[j];
            res.varying[i0 + j] = active[j];
        }
        res.covar.block<6, 6>(i0, i0) = s.CM;
    }

    for (std::size_t u = 0; u < unknowns.size(); ++u) {
        const Sample& smp = data_.sample(unknowns[u]);
        const int iu = idx.unknown(u);
        res.values[iu] = smp.D4x;

        for (std::size_t v = 0; v < unknowns.size(); ++v)
            res.covar(iu, idx.unknown(v)) = sample_D4x_covar(data_, unknowns[u], unknowns[v]);

        /* cov(p_s, D4x_u) = w_us · CM_s · ∂D4x_us/∂p_s */
        for (std::size_t k = 0; k < sessions.size(); ++k) {
            auto e = smp.session_D4x.find(sessions[k]);
            if (e == smp.session_D4x.end()) continue;
            const Session& s = data_.session(sessions[k]);

            double avg_d = 0.0;
            int n = 0;
            for (std::size_t i : s.data)
                if (data_.analyses()[i].Sample == unknowns[u]) {
                    avg_d += data_.analyses()[i].d4x(mass);
                    ++n;
                }
            avg_d /= n;

            const Vector6 c = e->second.weight * (s.CM * standardization_gradient(s, avg_d, e->second.D4x));
            const int i0 = idx.session_param(k, 0);
            res.covar.block<6, 1>(i0, iu) = c;
            res.covar.block<1, 6>(iu, i0) = c.transpose();
        }
    }

    const RmswdResult rm = rmswd(data_);
    res.Nf         = data_.Nf;
    res.t95        = data_.t95;
    res.chisq      = rm.chisq;
    res.redchi     = rm.chisq / std::max(res.Nf, 1);
    res.iterations = 0;
    res.converged  = true;
    return res;
}

/* ------------------------------------------------------------------------- */
const StandardizationResult& standardize(D4xData& data)
{
    return StandardizationEngine(data, StandardizationEngine::options_from(data.config())).run();
}

const StandardizationResult& standardize(D4xData& data, const StandardizationEngine::Options& opt)
{
    return StandardizationEngine(data, opt).run();
}

} // namespace clumpfit
