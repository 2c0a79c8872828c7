#include "clumpfit/JsonUtils.hpp"
#include "clumpfit/Errors.hpp"
#include <fstream>
#include <regex>
#include <cstdlib>

namespace clumpfit {

nlohmann::json load_json(const std::string& path)
{
    std::ifstream f(path);
    if (!f)
        throw ConfigurationError("Cannot open '" + path + "'");
    try {
        return nlohmann::json::parse(f, nullptr, true, /*ignore_comments=*/true);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigurationError("Malformed JSON in '" + path + "': " + e.what());
    }
}

void save_json(const std::string& path, const nlohmann::json& j, int indent)
{
    std::ofstream f(path);
    if (!f)
        throw std::runtime_error("Cannot write '" + path + "'");
    f << j.dump(indent) << '\n';
}

/*  "${HOME}/data" → "/home/me/data"; unset variables expand to "".      */
static std::string expand(const std::string& input)
{
    static const std::regex re(R"(\$\{([^}]+)\})");
    std::string out = input;
    std::smatch m;
    while (std::regex_search(out, m, re)) {
        const std::string var = m[1];
        const char* env = std::getenv(var.c_str());
        out.replace(m.position(0), m.length(0), env ? env : "");
    }
    return out;
}

void expand_env(nlohmann::json& j)
{
    if (j.is_string()) {
        j = expand(j.get<std::string>());
    } else if (j.is_array() || j.is_object()) {
        for (auto& el : j) expand_env(el);
    }
}

} // namespace clumpfit
