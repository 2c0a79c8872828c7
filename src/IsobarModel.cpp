#include "clumpfit/IsobarModel.hpp"
#include <cmath>

namespace clumpfit {

IsobarRatios compute_isobar_ratios(const ReferenceRatios& ref,
                                   double R13,
                                   double R18,
                                   double D17O,
                                   double D47,
                                   double D48,
                                   double D49)
{
    const double R17 = ref.R17_VSMOW * std::exp(D17O / 1000.0)
                     * std::pow(R18 / ref.R18_VSMOW, ref.LAMBDA_17);

    /* ---- isotope abundances ---------------------------------------- */
    const double C12 = 1.0 / (1.0 + R13);
    const double C13 = C12 * R13;
    const double C16 = 1.0 / (1.0 + R17 + R18);
    const double C17 = C16 * R17;
    const double C18 = C16 * R18;

    /* ---- stochastic isotopologues (O-C-O, asymmetric ones × 2) ------ */
    const double C626 = C16 * C12 * C16;
    const double C627 = C16 * C12 * C17 * 2.0;
    const double C628 = C16 * C12 * C18 * 2.0;
    const double C636 = C16 * C13 * C16;
    const double C637 = C16 * C13 * C17 * 2.0;
    const double C638 = C16 * C13 * C18 * 2.0;
    const double C727 = C17 * C12 * C17;
    const double C728 = C17 * C12 * C18 * 2.0;
    const double C737 = C17 * C13 * C17;
    const double C738 = C17 * C13 * C18 * 2.0;
    const double C828 = C18 * C12 * C18;
    const double C838 = C18 * C13 * C18;

    IsobarRatios out;
    out.R45 = (C636 + C627) / C626;
    out.R46 = (C628 + C637 + C727) / C626;
    out.R47 = (C638 + C728 + C737) / C626;
    out.R48 = (C738 + C828) / C626;
    out.R49 = C838 / C626;

    out.R47 *= 1.0 + D47 / 1000.0;
    out.R48 *= 1.0 + D48 / 1000.0;
    out.R49 *= 1.0 + D49 / 1000.0;
    return out;
}

BulkComposition compute_bulk_delta(const ReferenceRatios& ref,
                                   double R45,
                                   double R46,
                                   double D17O)
{
    const double lambda = ref.LAMBDA_17;
    const double K = std::exp(D17O / 1000.0) * ref.R17_VSMOW
                   * std::pow(ref.R18_VSMOW, -lambda);

    const double A = -3.0 * K * K * std::pow(ref.R18_VSMOW, 2.0 * lambda);
    const double B = 2.0 * K * R45 * std::pow(ref.R18_VSMOW, lambda);
    const double C = 2.0 * ref.R18_VSMOW;
    const double D = -R46;

    const double aa = A * lambda * (2.0 * lambda - 1.0) + B * lambda * (lambda - 1.0) / 2.0;
    const double bb = 2.0 * A * lambda + B * lambda + C;
    const double cc = A + B + C + D;

    BulkComposition out;
    out.d18O_VSMOW = 1000.0 * (-bb + std::sqrt(bb * bb - 4.0 * aa * cc)) / (2.0 * aa);

    const double R18 = (1.0 + out.d18O_VSMOW / 1000.0) * ref.R18_VSMOW;
    const double R17 = K * std::pow(R18, lambda);
    const double R13 = R45 - 2.0 * R17;

    out.d13C_VPDB = 1000.0 * (R13 / ref.R13_VPDB - 1.0);
    return out;
}

} // namespace clumpfit
