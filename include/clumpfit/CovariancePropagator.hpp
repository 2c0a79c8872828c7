#pragma once
#include "Dataset.hpp"
#include "Types.hpp"
#include <map>
#include <string>
#include <vector>

namespace clumpfit {

/*  Value and standard error of a linear combination.                    */
struct WeightedValue {
    double value = kNaN;
    double SE    = kNaN;
};

/*  Gradient of  D4x = (raw − c − b·d4x − c2·t − b2·t·d4x)/(a + a2·t)
 *  with respect to (a, b, c, a2, b2, c2), at the point (d4x, D4x, t).  */
Vector6 standardization_gradient(const Session& s, double d4x, double D4x, double t = 0.0);

/*  √(Vᵗ·CM·V) for the session's 6×6 parameter covariance.               */
double standardization_error(const Session& s, double d4x, double D4x, double t = 0.0);
double standardization_error(const D4xData& data, const std::string& session,
                             double d4x, double D4x, double t = 0.0);

/*  Error covariance of the average Δ4x of two samples (variance when
 *  `sample2` is empty or equal to `sample1`).  Anchors have none.       */
double sample_D4x_covar(const D4xData& data,
                        const std::string& sample1,
                        const std::string& sample2 = "");

/*  covar / (SE1·SE2); 1 for a sample with itself.                       */
double sample_D4x_correl(const D4xData& data,
                         const std::string& sample1,
                         const std::string& sample2 = "");

/*  Σ w·X and √(wᵗ·C·w).                                                  */
WeightedValue correlated_sum(const Vector& X, const Matrix& C, const Vector& w);
WeightedValue correlated_sum(const Vector& X, const Matrix& C);

/*  Inverse-variance weighted mean of X.                                 */
WeightedValue w_avg(const std::vector<double>& X, const std::vector<double>& sX);

/*  Covariance-aware weighted sum of sample Δ4x values.  Empty `weights`
 *  means equal weights; with `normalize` the weights are rescaled to a
 *  unit sum (unless they sum to zero).                                   */
WeightedValue sample_average(const D4xData& data,
                             const std::vector<std::string>& samples,
                             std::vector<double> weights = {},
                             bool normalize = true);

/*  Groups of samples combined with weights N_i / Σ N.                   */
struct CombinedSamples {
    std::vector<std::string> groups;     // sorted
    Vector                   D4x;
    Matrix                   covar;
};

CombinedSamples combine_samples(const D4xData& data,
                                const std::map<std::string, std::vector<std::string>>& groups);

} // namespace clumpfit
