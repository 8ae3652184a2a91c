#pragma once

#include <chrono>
#include <filesystem>

#include "config/config_schema.hpp"

namespace reportd::config {

// Reads ~/.reportd/config.json (or $REPORTD_CONFIG), then applies REPORTD_* overrides.
Config LoadConfig();
Config LoadConfigFromFile(const std::filesystem::path& path);

std::filesystem::path GetConfigPath();

// Upper bound for a running daemon to finish its current report after SIGTERM.
std::chrono::seconds ShutdownGracePeriod(const SchedulerConfig& scheduler);

}  // namespace reportd::config
