#pragma once
#include "Config.hpp"
#include "Types.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace clumpfit {

/*  Parameter vector and covariance of a standardization.
 *
 *  Layout:  [ a_s, b_s, c_s, a2_s, b2_s, c2_s ]  for every session s
 *           (sorted), followed by one D4x per unknown sample (sorted).
 *  Every parameter has a row in `covar`, including those fixed at zero
 *  (zero row) and those tied by a constraint (propagated row).          */
struct StandardizationResult {
    Method                   method = Method::Pooled;
    int                      mass   = 47;
    std::vector<std::string> var_names;
    Vector                   values;
    Matrix                   covar;
    std::vector<bool>        varying;        // free in the solver

    std::vector<std::string> sessions;       // order of the session blocks
    std::vector<std::string> unknowns;       // order of the D4x entries
    std::size_t              n_session_params = 0;

    int    Nf     = 0;
    double t95    = kNaN;
    double chisq  = kNaN;
    double redchi = kNaN;
    int    iterations = 0;
    bool   converged  = false;

    std::optional<std::size_t> find(const std::string& name) const;
    std::size_t index_of(const std::string& name) const;       // throws std::out_of_range
    double value(const std::string& name) const { return values[index_of(name)]; }
    double stderr_of(const std::string& name) const;

    std::optional<std::size_t> unknown_index(const std::string& sample) const;
    std::size_t session_index(const std::string& session, int param) const;

    nlohmann::json to_json() const;
};

} // namespace clumpfit
