#pragma once

#include <filesystem>

#include "nlohmann/json.hpp"

#include "config/config_schema.hpp"

namespace runbox::config {

Config LoadConfig();
Config LoadConfigFrom(const std::filesystem::path& path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyEnvironment(Config& config);

}  // namespace runbox::config
