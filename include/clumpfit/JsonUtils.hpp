#pragma once
#include <nlohmann/json.hpp>
#include <string>

namespace clumpfit {
nlohmann::json load_json(const std::string& path);
void save_json(const std::string& path, const nlohmann::json& j, int indent = 2);
void expand_env(nlohmann::json& j);
} // namespace clumpfit
