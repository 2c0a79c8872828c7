#pragma once
/*
 * Maps  (session, instrumental parameter)  and  (unknown sample)  to one
 * global position in the parameter vector of the pooled standardization.
 *
 *  Session parameter order:
 *      0 a   1 b   2 c   3 a2   4 b2   5 c2
 *
 * Session blocks come first (in session order), followed by one D4x
 * per unknown sample.
 */

#include "Errors.hpp"
#include <algorithm>
#include <array>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace clumpfit {

/*  Parameter-name form of a session or sample name:
 *  '-', '.' and ' ' become '_'.                                          */
inline std::string pf(const std::string& name)
{
    std::string out = name;
    std::replace_if(out.begin(), out.end(),
                    [](char ch) { return ch == '-' || ch == '.' || ch == ' '; }, '_');
    return out;
}

class ParameterIndexer {
public:
    static constexpr int kNSessionParams = 6;
    static constexpr std::array<const char*, kNSessionParams> kSessionParamNames =
        { "a", "b", "c", "a2", "b2", "c2" };

    void build(const std::vector<std::string>& sessions,
               const std::vector<std::string>& unknowns,
               int mass)
    {
        sessions_ = sessions;
        unknowns_ = unknowns;
        names_.clear();
        lookup_.clear();

        for (const auto& s : sessions)
            for (int p = 0; p < kNSessionParams; ++p)
                add_name(std::string(kSessionParamNames[p]) + "_" + pf(s), "session '" + s + "'");

        const std::string prefix = "D" + std::to_string(mass) + "_";
        for (const auto& u : unknowns)
            add_name(prefix + pf(u), "sample '" + u + "'");
    }

    int session_param(std::size_t session, int par) const {
        return static_cast<int>(session) * kNSessionParams + par;
    }
    int unknown(std::size_t u) const {
        return static_cast<int>(sessions_.size()) * kNSessionParams + static_cast<int>(u);
    }

    int total() const { return static_cast<int>(names_.size()); }
    int n_session_params() const { return static_cast<int>(sessions_.size()) * kNSessionParams; }

    const std::vector<std::string>& names()    const { return names_; }
    const std::vector<std::string>& sessions() const { return sessions_; }
    const std::vector<std::string>& unknowns() const { return unknowns_; }

    std::optional<int> find(const std::string& name) const {
        auto it = lookup_.find(name);
        if (it == lookup_.end()) return std::nullopt;
        return it->second;
    }

private:
    void add_name(const std::string& n, const std::string& what)
    {
        if (!lookup_.emplace(n, static_cast<int>(names_.size())).second)
            throw ConfigurationError("Parameter name '" + n + "' of " + what
                                     + " collides with another session or sample name");
        names_.push_back(n);
    }

    std::vector<std::string>   sessions_;
    std::vector<std::string>   unknowns_;
    std::vector<std::string>   names_;
    std::map<std::string, int> lookup_;
};

} // namespace clumpfit
