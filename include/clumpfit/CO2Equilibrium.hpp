#pragma once
#include "Config.hpp"
#include "Dataset.hpp"

namespace clumpfit {

/*  Equilibrium Δ47 of CO2 at T (°C), linearly interpolated.  Throws
 *  ConfigurationError outside the tabulated range.                       */
double fCO2eqD47_Petersen(double T);
double fCO2eqD47_Wang(double T);
double fCO2eqD47(TeqLaw law, double T);

/*  Turns every sample whose analyses carry a Teq into an anchor with the
 *  equilibrium Δ47 of that temperature.                                  */
void D47fromTeq(D4xData& data, const TeqOptions& opt = {});

} // namespace clumpfit
