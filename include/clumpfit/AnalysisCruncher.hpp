#pragma once
#include "Dataset.hpp"
#include <optional>
#include <string>
#include <vector>

namespace clumpfit {

/*  Working-gas bulk composition of every session, from the carbonate
 *  standards listed in both nominal δ13C and δ18O tables (or the subset
 *  `samples`).  `alpha_acid` overrides the configured acid factor.       */
void compute_wg(D4xData& data,
                std::optional<double> alpha_acid = std::nullopt,
                const std::vector<std::string>& samples = {});

/*  δ13C_VPDB, δ18O_VSMOW and raw Δ47 / Δ48 / Δ49 of one analysis.
 *  Inconsistent R45 / R46 round trips are reported through `data`.      */
void compute_bulk_and_clumping_deltas(D4xData& data, Analysis& r);

/*  Per-session 1pt / 2pt correction of bulk compositions against the
 *  nominal values of the carbonate standards.                            */
void standardize_d13C(D4xData& data);
void standardize_d18O(D4xData& data);

/*  All of the above for every analysis.                                  */
void crunch(D4xData& data);

} // namespace clumpfit
