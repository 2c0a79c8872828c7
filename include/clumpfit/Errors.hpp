#pragma once
#include <stdexcept>
#include <string>

namespace clumpfit {

/*  Bad or missing settings: zero acid fractionation factor, unknown
 *  method names, a sample without a required nominal value, …
 *  Always raised before any fitting takes place.                         */
class ConfigurationError : public std::runtime_error {
public:
    explicit ConfigurationError(const std::string& what)
        : std::runtime_error(what) {}
};

/*  A session without anchors, or fewer independent anchor
 *  combinations than free standardization parameters.                    */
class InsufficientDataError : public std::runtime_error {
public:
    explicit InsufficientDataError(const std::string& what)
        : std::runtime_error(what) {}
};

/*  A pooled-fit constraint names a parameter that does not exist, is
 *  cyclic, or is not a linear expression.                                */
class ConstraintResolutionError : public std::runtime_error {
public:
    explicit ConstraintResolutionError(const std::string& what)
        : std::runtime_error(what) {}
};

} // namespace clumpfit
