#pragma once

#include <filesystem>

#include "nlohmann/json.hpp"

#include "config/config_schema.hpp"
#include "judge/interaction_runner.hpp"
#include "sandbox/sandbox_executor.hpp"
#include "stress/stress_test.hpp"

namespace interjudge::config {

// $INTERJUDGE_CONFIG, else ~/.interjudge/config.json.
std::filesystem::path GetConfigPath();

// Defaults, then the config file (if present), then environment overrides.
Config LoadConfig();
Config LoadConfig(const std::filesystem::path& config_path);

void ApplyConfigFromJson(Config& config, const nlohmann::json& data);
void ApplyConfigFromEnv(Config& config);

judge::RunnerOptions ToRunnerOptions(const Config& config);
sandbox::SandboxOptions ToSandboxOptions(const Config& config);
stress::StressOptions ToStressOptions(const Config& config);

}  // namespace interjudge::config
