#pragma once
#include "Types.hpp"
#include <optional>
#include <string>

namespace clumpfit {

/*  One dual-inlet measurement.  Raw fields come from ingestion, the rest
 *  are written in place by crunching and standardization.                */
struct Analysis {
    std::string UID;
    std::string Session;
    std::string Sample;
    std::optional<std::string> Sample_original;   // set by split_samples()

    /* raw working-gas deltas */
    double d45 = kNaN;
    double d46 = kNaN;
    double d47 = kNaN;
    double d48 = kNaN;
    double d49 = kNaN;
    double D17O = 0.0;

    std::optional<double> TimeTag;
    std::optional<double> Teq;                    // equilibration temperature, °C

    /* crunching */
    double d13Cwg_VPDB  = kNaN;
    double d18Owg_VSMOW = kNaN;
    double d13C_VPDB    = kNaN;
    double d18O_VSMOW   = kNaN;
    double D47raw = kNaN;
    double D48raw = kNaN;
    double D49raw = kNaN;

    /* standardization */
    double t            = 0.0;
    double wD4xraw      = 1.0;
    double D4x          = kNaN;
    double wD4x         = kNaN;
    double D4x_residual = kNaN;

    double d4x(int mass) const     { return mass == 48 ? d48 : d47; }
    double D4xraw(int mass) const  { return mass == 48 ? D48raw : D47raw; }
};

} // namespace clumpfit
