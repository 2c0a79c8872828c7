#pragma once
#include "Dataset.hpp"
#include <string>
#include <vector>

namespace clumpfit {

enum class SampleClass { All, Anchors, Unknowns };
enum class Observable  { d13C_VPDB, d18O_VSMOW, D4x };

std::string to_string(SampleClass c);

/*  χ², degrees of freedom and √(χ²/Nf) of the weighted Δ4x scatter of
 *  each sample around its inverse-variance mean.                         */
struct RmswdResult {
    double rmswd = 0.0;
    double chisq = 0.0;
    int    Nf    = 0;
};

/*  Empty `sessions` means every session.                                 */
RmswdResult rmswd(const D4xData& data,
                  SampleClass samples = SampleClass::All,
                  const std::vector<std::string>& sessions = {});

/*  Pooled standard deviation of `key` within samples.  For Δ4x the
 *  deviations are taken from the sample averages and every session
 *  considered costs min(Np, anchors present) degrees of freedom when
 *  anchors are included.                                                 */
double compute_r(const D4xData& data,
                 Observable key,
                 SampleClass samples = SampleClass::All,
                 const std::vector<std::string>& sessions = {});

/*  Copy a, b, c, a2, b2, c2, their SE and the 6×6 block of the pooled
 *  covariance into every session record.                                 */
void load_session_parameters(D4xData& data);

void consolidate_samples(D4xData& data);
void consolidate_sessions(D4xData& data);
void repeatabilities(D4xData& data);

/*  samples, then sessions, then dataset repeatabilities                  */
void consolidate(D4xData& data);

} // namespace clumpfit
