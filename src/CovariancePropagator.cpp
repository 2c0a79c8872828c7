#include "clumpfit/CovariancePropagator.hpp"
#include "clumpfit/ParameterIndexer.hpp"
#include "clumpfit/StatsUtils.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace clumpfit {
namespace {

struct SessionMeans {
    double D4x = 0.0;
    double d4x = 0.0;
    bool   present = false;
};

SessionMeans session_means(const D4xData& data, const Session& s, const std::string& sample)
{
    SessionMeans m;
    int n = 0;
    for (std::size_t i : s.data) {
        const Analysis& r = data.analyses()[i];
        if (r.Sample != sample) continue;
        m.D4x += r.D4x;
        m.d4x += r.d4x(data.mass());
        ++n;
    }
    if (n > 0) {
        m.D4x /= n;
        m.d4x /= n;
        m.present = true;
    }
    return m;
}

} // namespace

/* ------------------------------------------------------------------------- */
/*  standardization error                                                    */
/* ------------------------------------------------------------------------- */
Vector6 standardization_gradient(const Session& s, double d4x, double D4x, double t)
{
    const double scale = s.a + s.a2 * t;
    if (scale == 0.0)
        throw std::domain_error("Session '" + s.name + "': a + a2·t vanishes");

    Vector6 V;
    V << D4x, d4x, 1.0, D4x * t, d4x * t, t;
    return -V / scale;
}

double standardization_error(const Session& s, double d4x, double D4x, double t)
{
    const Vector6 V = standardization_gradient(s, d4x, D4x, t);
    return std::sqrt(std::max(0.0, V.dot(s.CM * V)));
}

double standardization_error(const D4xData& data, const std::string& session,
                             double d4x, double D4x, double t)
{
    return standardization_error(data.session(session), d4x, D4x, t);
}

/* ------------------------------------------------------------------------- */
/*  sample covariances                                                       */
/* ------------------------------------------------------------------------- */
double sample_D4x_covar(const D4xData& data, const std::string& sample1, const std::string& sample2)
{
    const std::string& s2 = sample2.empty() ? sample1 : sample2;
    const Sample& A = data.sample(sample1);
    const Sample& B = data.sample(s2);
    if (A.anchor || B.anchor) return 0.0;

    if (data.standardization_method() == Method::Pooled) {
        const StandardizationResult& res = data.standardization();
        const std::string prefix = data.D4x_name() + "_";
        const std::size_t i = res.index_of(prefix + pf(sample1));
        const std::size_t j = res.index_of(prefix + pf(s2));
        return res.covar(i, j);
    }

    if (sample1 == s2) return A.SE_D4x * A.SE_D4x;

    double c = 0.0;
    for (const auto& [name, s] : data.sessions()) {
        auto w1 = A.session_D4x.find(name);
        auto w2 = B.session_D4x.find(name);
        if (w1 == A.session_D4x.end() || w2 == B.session_D4x.end()) continue;

        const SessionMeans m1 = session_means(data, s, sample1);
        const SessionMeans m2 = session_means(data, s, s2);
        const Eigen::Vector3d v1(m1.D4x, m1.d4x, 1.0);
        const Eigen::Vector3d v2(m2.D4x, m2.d4x, 1.0);
        const Eigen::Matrix3d CM = s.CM.topLeftCorner<3, 3>();
        c += w1->second.weight * w2->second.weight * v1.dot(CM * v2) / (s.a * s.a);
    }
    return c;
}

double sample_D4x_correl(const D4xData& data, const std::string& sample1, const std::string& sample2)
{
    if (sample2.empty() || sample2 == sample1) return 1.0;
    const double se1 = data.sample(sample1).SE_D4x;
    const double se2 = data.sample(sample2).SE_D4x;
    if (!(se1 > 0.0) || !(se2 > 0.0)) return 0.0;
    const double r = sample_D4x_covar(data, sample1, sample2) / (se1 * se2);
    return std::clamp(r, -1.0, 1.0);
}

/* ------------------------------------------------------------------------- */
/*  weighted sums                                                            */
/* ------------------------------------------------------------------------- */
WeightedValue correlated_sum(const Vector& X, const Matrix& C, const Vector& w)
{
    if (X.size() != w.size() || C.rows() != X.size() || C.cols() != X.size())
        throw std::invalid_argument("correlated_sum: inconsistent sizes");
    return { w.dot(X), std::sqrt(std::max(0.0, w.dot(C * w))) };
}

WeightedValue correlated_sum(const Vector& X, const Matrix& C)
{
    return correlated_sum(X, C, Vector::Ones(X.size()));
}

WeightedValue w_avg(const std::vector<double>& X, const std::vector<double>& sX)
{
    if (X.empty() || X.size() != sX.size())
        throw std::invalid_argument("w_avg: inconsistent sizes");

    std::vector<double> W(X.size());
    double sum = 0.0;
    for (std::size_t i = 0; i < X.size(); ++i) {
        W[i] = 1.0 / (sX[i] * sX[i]);
        sum += W[i];
    }
    double avg = 0.0, var = 0.0;
    for (std::size_t i = 0; i < X.size(); ++i) {
        W[i] /= sum;
        avg += W[i] * X[i];
        var += W[i] * W[i] * sX[i] * sX[i];
    }
    return { avg, std::sqrt(var) };
}

WeightedValue sample_average(const D4xData& data,
                             const std::vector<std::string>& samples,
                             std::vector<double> weights,
                             bool normalize)
{
    const std::size_t n = samples.size();
    if (n == 0) throw std::invalid_argument("sample_average: no samples");

    if (weights.empty()) weights.assign(n, 1.0 / static_cast<double>(n));
    if (weights.size() != n)
        throw std::invalid_argument("sample_average: one weight per sample expected");

    if (normalize) {
        double s = 0.0;
        for (double w : weights) s += w;
        if (s != 0.0)
            for (double& w : weights) w /= s;
    }

    Vector X(n), w(n);
    Matrix C(n, n);
    for (std::size_t i = 0; i < n; ++i) {
        X[i] = data.sample(samples[i]).D4x;
        w[i] = weights[i];
        for (std::size_t k = 0; k < n; ++k)
            C(i, k) = sample_D4x_covar(data, samples[i], samples[k]);
    }
    return correlated_sum(X, C, w);
}

CombinedSamples combine_samples(const D4xData& data,
                                const std::map<std::string, std::vector<std::string>>& groups)
{
    CombinedSamples out;
    std::vector<std::string> samples;
    for (const auto& [g, members] : groups) {
        out.groups.push_back(g);
        std::vector<std::string> sorted = members;
        std::sort(sorted.begin(), sorted.end());
        samples.insert(samples.end(), sorted.begin(), sorted.end());
    }

    const auto n = static_cast<Eigen::Index>(samples.size());
    const auto k = static_cast<Eigen::Index>(out.groups.size());

    Vector D4x_old(n);
    Matrix CM_old(n, n);
    for (Eigen::Index i = 0; i < n; ++i) {
        D4x_old[i] = data.sample(samples[i]).D4x;
        for (Eigen::Index j = 0; j < n; ++j)
            CM_old(i, j) = sample_D4x_covar(data, samples[i], samples[j]);
    }

    Matrix W = Matrix::Zero(k, n);
    for (Eigen::Index g = 0; g < k; ++g) {
        const auto& members = groups.at(out.groups[g]);
        double total = 0.0;
        for (const auto& s : members) total += data.sample(s).N;
        if (total <= 0.0)
            throw std::invalid_argument("combine_samples: group '" + out.groups[g] + "' has no analyses");
        for (Eigen::Index i = 0; i < n; ++i)
            if (std::find(members.begin(), members.end(), samples[i]) != members.end())
                W(g, i) = data.sample(samples[i]).N / total;
    }

    out.D4x   = W * D4x_old;
    out.covar = W * CM_old * W.transpose();
    return out;
}

} // namespace clumpfit
