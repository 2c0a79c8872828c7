#pragma once
#include "Types.hpp"
#include <optional>
#include <vector>

namespace clumpfit {

double mean(const std::vector<double>& x);

/*  Sample standard deviation (N − 1 denominator).  Needs N ≥ 2.         */
double stdev(const std::vector<double>& x);

double median(std::vector<double> x);

/*  Least-squares line  y = slope·x + intercept.                          */
struct LinearFit {
    double slope     = 0.0;
    double intercept = 0.0;
};
LinearFit polyfit1(const std::vector<double>& x, const std::vector<double>& y);

/*  Two-sided 95 % Student-t factor for Nf degrees of freedom.
 *  NaN when Nf < 1.                                                      */
double student_t95(double Nf);

/*  Levene test of equal variance between two populations, centred on
 *  the group medians (Brown–Forsythe).  Returns the p-value, or nothing
 *  when the statistic is undefined (zero spread, too few values).        */
std::optional<double> levene_median(const std::vector<double>& x,
                                    const std::vector<double>& y);

} // namespace clumpfit
