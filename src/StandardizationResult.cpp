#include "clumpfit/StandardizationResult.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace clumpfit {

std::optional<std::size_t> StandardizationResult::find(const std::string& name) const
{
    auto it = std::find(var_names.begin(), var_names.end(), name);
    if (it == var_names.end()) return std::nullopt;
    return static_cast<std::size_t>(it - var_names.begin());
}

std::size_t StandardizationResult::index_of(const std::string& name) const
{
    if (auto i = find(name)) return *i;
    throw std::out_of_range("No parameter named '" + name + "' in standardization result");
}

double StandardizationResult::stderr_of(const std::string& name) const
{
    const std::size_t i = index_of(name);
    return std::sqrt(std::max(0.0, covar(i, i)));
}

std::optional<std::size_t>
StandardizationResult::unknown_index(const std::string& sample) const
{
    auto it = std::find(unknowns.begin(), unknowns.end(), sample);
    if (it == unknowns.end()) return std::nullopt;
    return n_session_params + static_cast<std::size_t>(it - unknowns.begin());
}

std::size_t StandardizationResult::session_index(const std::string& session, int param) const
{
    auto it = std::find(sessions.begin(), sessions.end(), session);
    if (it == sessions.end() || param < 0 || param > 5)
        throw std::out_of_range("No parameter " + std::to_string(param)
                                + " for session '" + session + "'");
    return static_cast<std::size_t>(it - sessions.begin()) * 6 + param;
}

nlohmann::json StandardizationResult::to_json() const
{
    nlohmann::json j;
    j["method"]    = to_string(method);
    j["mass"]      = mass;
    j["var_names"] = var_names;
    j["values"]    = std::vector<double>(values.data(), values.data() + values.size());
    j["varying"]   = varying;
    nlohmann::json cov = nlohmann::json::array();
    for (Eigen::Index i = 0; i < covar.rows(); ++i) {
        std::vector<double> row(covar.cols());
        for (Eigen::Index k = 0; k < covar.cols(); ++k) row[k] = covar(i, k);
        cov.push_back(row);
    }
    j["covar"]  = cov;
    j["Nf"]     = Nf;
    j["t95"]    = std::isfinite(t95) ? nlohmann::json(t95) : nlohmann::json(nullptr);
    j["chisq"]  = chisq;
    j["redchi"] = std::isfinite(redchi) ? nlohmann::json(redchi) : nlohmann::json(nullptr);
    j["iterations"] = iterations;
    j["converged"]  = converged;
    return j;
}

} // namespace clumpfit
