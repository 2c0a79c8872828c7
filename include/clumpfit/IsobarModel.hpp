#pragma once
#include <cmath>

namespace clumpfit {

/*  Absolute isotope ratios of the reference materials and the
 *  triple-oxygen mass-dependent exponent.                                 */
struct ReferenceRatios {
    double R13_VPDB  = 0.01118;            // Chang & Li (1990)
    double R18_VSMOW = 0.0020052;          // Baertschi (1976)
    double LAMBDA_17 = 0.528;              // Barkan & Luz (2005)
    double R17_VSMOW = 0.00038475;         // Assonov & Brenninkmeijer (2003)
    double R18_VPDB  = 0.0020052 * 1.03092;

    double R17_VPDB() const {
        return R17_VSMOW * std::pow(R18_VPDB / R18_VSMOW, LAMBDA_17);
    }
};

struct IsobarRatios {
    double R45 = 0.0;
    double R46 = 0.0;
    double R47 = 0.0;
    double R48 = 0.0;
    double R49 = 0.0;
};

struct BulkComposition {
    double d13C_VPDB  = 0.0;
    double d18O_VSMOW = 0.0;
};

/*  Stochastic isobar ratios of CO2 with the given R13 / R18, optionally
 *  with a 17O anomaly and clumped anomalies (all in permil) applied on
 *  top of the stochastic distribution.                                    */
IsobarRatios compute_isobar_ratios(const ReferenceRatios& ref,
                                   double R13,
                                   double R18,
                                   double D17O = 0.0,
                                   double D47  = 0.0,
                                   double D48  = 0.0,
                                   double D49  = 0.0);

/*  Bulk δ13C_VPDB / δ18O_VSMOW from R45 / R46.  Solves the second-order
 *  Taylor polynomial of Brand et al. (2010) eq. 17 around δ18O = 0, so
 *  the result is only accurate for |δ18O| ≲ 50 ‰.                         */
BulkComposition compute_bulk_delta(const ReferenceRatios& ref,
                                   double R45,
                                   double R46,
                                   double D17O = 0.0);

/*  R13 / R18 of a gas with the given delta values.                        */
inline double R13_from_d13C(const ReferenceRatios& ref, double d13C_VPDB) {
    return ref.R13_VPDB * (1.0 + d13C_VPDB / 1000.0);
}
inline double R18_from_d18O(const ReferenceRatios& ref, double d18O_VSMOW) {
    return ref.R18_VSMOW * (1.0 + d18O_VSMOW / 1000.0);
}

/*  δ18O of carbonate (VPDB) → δ18O of acid-evolved CO2 (VSMOW).           */
inline double carbonate_to_co2_d18O(const ReferenceRatios& ref,
                                    double d18O_VPDB,
                                    double alpha_acid)
{
    return (1000.0 + d18O_VPDB) * ref.R18_VPDB * alpha_acid / ref.R18_VSMOW - 1000.0;
}

} // namespace clumpfit
