#include "clumpfit/StatsUtils.hpp"
#include <boost/math/distributions/fisher_f.hpp>
#include <boost/math/distributions/students_t.hpp>
#include <algorithm>
#include <cmath>
#include <numeric>
#include <stdexcept>

namespace clumpfit {

double mean(const std::vector<double>& x)
{
    if (x.empty())
        throw std::invalid_argument("mean(): empty vector");
    return std::accumulate(x.begin(), x.end(), 0.0) / static_cast<double>(x.size());
}

double stdev(const std::vector<double>& x)
{
    if (x.size() < 2)
        throw std::invalid_argument("stdev(): need at least two values");
    const double m = mean(x);
    double ss = 0.0;
    for (double v : x) ss += (v - m) * (v - m);
    return std::sqrt(ss / static_cast<double>(x.size() - 1));
}

double median(std::vector<double> v)         // by value, we reorder it
{
    const std::size_t n = v.size();
    if (n == 0)
        throw std::invalid_argument("median(): empty vector");

    const std::size_t k = n / 2;
    std::nth_element(v.begin(), v.begin() + k, v.end());
    double m = v[k];
    if ((n & 1) == 0) {
        const double max_lo = *std::max_element(v.begin(), v.begin() + k);
        m = 0.5 * (m + max_lo);
    }
    return m;
}

LinearFit polyfit1(const std::vector<double>& x, const std::vector<double>& y)
{
    if (x.size() != y.size() || x.size() < 2)
        throw std::invalid_argument("polyfit1(): need at least two (x, y) pairs");

    const double mx = mean(x);
    const double my = mean(y);
    double sxx = 0.0, sxy = 0.0;
    for (std::size_t i = 0; i < x.size(); ++i) {
        sxx += (x[i] - mx) * (x[i] - mx);
        sxy += (x[i] - mx) * (y[i] - my);
    }
    if (sxx == 0.0)
        throw std::invalid_argument("polyfit1(): all x values are identical");

    LinearFit f;
    f.slope     = sxy / sxx;
    f.intercept = my - f.slope * mx;
    return f;
}

double student_t95(double Nf)
{
    if (!(Nf >= 1.0)) return kNaN;
    const boost::math::students_t dist(Nf);
    return boost::math::quantile(boost::math::complement(dist, 0.025));
}

std::optional<double> levene_median(const std::vector<double>& x,
                                    const std::vector<double>& y)
{
    const std::size_t n1 = x.size(), n2 = y.size();
    const std::size_t N  = n1 + n2;
    if (n1 == 0 || n2 == 0 || N <= 2) return std::nullopt;

    /* absolute deviations from each group's median */
    auto deviations = [](const std::vector<double>& v) {
        const double m = median(v);
        std::vector<double> z(v.size());
        std::transform(v.begin(), v.end(), z.begin(),
                       [m](double e) { return std::abs(e - m); });
        return z;
    };
    const std::vector<double> z1 = deviations(x);
    const std::vector<double> z2 = deviations(y);

    const double m1 = mean(z1);
    const double m2 = mean(z2);
    const double mall = (m1 * n1 + m2 * n2) / static_cast<double>(N);

    const double between = n1 * (m1 - mall) * (m1 - mall)
                         + n2 * (m2 - mall) * (m2 - mall);
    double within = 0.0;
    for (double z : z1) within += (z - m1) * (z - m1);
    for (double z : z2) within += (z - m2) * (z - m2);
    if (within <= 0.0) return std::nullopt;

    const double df1 = 1.0;                          // k − 1
    const double df2 = static_cast<double>(N - 2);   // N − k
    const double W   = df2 / df1 * between / within;

    const boost::math::fisher_f dist(df1, df2);
    return boost::math::cdf(boost::math::complement(dist, W));
}

} // namespace clumpfit
