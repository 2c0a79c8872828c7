#pragma once
#include "Dataset.hpp"
#include <string>
#include <vector>

namespace clumpfit {

/*  Renames the analyses of the given unknowns (all unknowns when empty)
 *  to "<sample>__<UID>" (grouping "by_uid") or "<sample>__<session>"
 *  ("by_session") so that a subsequent standardization treats them as
 *  separate samples.  The original name is kept in Sample_original.     */
void split_samples(D4xData& data,
                   const std::vector<std::string>& samples = {},
                   const std::string& grouping = "by_session");

/*  Recombines split unknowns without refitting: the pooled parameter
 *  vector and covariance are transformed by W (identity on session
 *  parameters, normalized weights on the split columns).  Weights are
 *  inverse variances for "by_session", equal for "by_uid".
 *  Throws std::logic_error unless the last standardization was pooled.  */
void unsplit_samples(D4xData& data);

} // namespace clumpfit
