#include "config/config_loader.hpp"

#include <chrono>
#include <cmath>
#include <fstream>
#include <string>

#include "utils/common.hpp"
#include "utils/logging.hpp"

namespace interjudge::config {
namespace {

std::string GetEnvFallback(const char* primary, const char* secondary) {
    auto value = utils::GetEnv(primary);
    if (!value.empty()) {
        return value;
    }
    return utils::GetEnv(secondary);
}

int ParseInt(const std::string& value, int fallback) {
    const auto parsed = utils::ParseInt(value);
    if (!parsed) {
        utils::LogWarn("config", "ignoring non-integer value '" + value + "'");
        return fallback;
    }
    return *parsed;
}

double ParseDouble(const std::string& value, double fallback) {
    try {
        std::size_t used = 0;
        const double parsed = std::stod(value, &used);
        if (used == value.size() && std::isfinite(parsed)) {
            return parsed;
        }
    } catch (const std::exception&) {
    }
    utils::LogWarn("config", "ignoring non-numeric value '" + value + "'");
    return fallback;
}

void ReadString(const nlohmann::json& section, const char* key, std::string& target) {
    if (section.contains(key) && section[key].is_string()) {
        target = section[key].get<std::string>();
    }
}

void ReadInt(const nlohmann::json& section, const char* key, int& target) {
    if (section.contains(key) && section[key].is_number_integer()) {
        target = section[key].get<int>();
    }
}

void ReadDouble(const nlohmann::json& section, const char* key, double& target) {
    if (section.contains(key) && section[key].is_number()) {
        target = section[key].get<double>();
    }
}

// Out-of-range durations fall back to the built-in default for that key.
std::chrono::milliseconds ToMillis(double seconds, double default_seconds, const char* key) {
    if (const auto millis = utils::SecondsToMillis(seconds)) {
        return *millis;
    }
    utils::LogWarn("config", std::string("ignoring out-of-range ") + key + "=" + std::to_string(seconds));
    return *utils::SecondsToMillis(default_seconds);
}

}  // namespace

std::filesystem::path GetConfigPath() {
    const auto explicit_path = utils::GetEnv("INTERJUDGE_CONFIG");
    if (!explicit_path.empty()) {
        return std::filesystem::path(explicit_path);
    }
    return utils::GetHomePath() / ".interjudge" / "config.json";
}

void ApplyConfigFromJson(Config& config, const nlohmann::json& data) {
    if (!data.is_object()) {
        return;
    }

    if (data.contains("runner") && data["runner"].is_object()) {
        const auto& runner = data["runner"];
        ReadString(runner, "interpreter", config.runner.interpreter);
        ReadString(runner, "sourceSuffix", config.runner.source_suffix);
        ReadString(runner, "tempDir", config.runner.temp_dir);
        ReadDouble(runner, "graceS", config.runner.grace_s);
        ReadDouble(runner, "killWaitS", config.runner.kill_wait_s);
    }

    if (data.contains("stress") && data["stress"].is_object()) {
        const auto& stress = data["stress"];
        ReadInt(stress, "numTests", config.stress.num_tests);
        ReadDouble(stress, "timeoutTotalS", config.stress.timeout_total_s);
        ReadDouble(stress, "timeoutPerTurnS", config.stress.timeout_per_turn_s);
        ReadDouble(stress, "generatorTimeoutS", config.stress.generator_timeout_s);
        ReadInt(stress, "generatorMemoryMb", config.stress.generator_memory_mb);
    }

    if (data.contains("logging") && data["logging"].is_object()) {
        ReadString(data["logging"], "level", config.logging.level);
    }
}

void ApplyConfigFromEnv(Config& config) {
    const auto interpreter = GetEnvFallback(
        "INTERJUDGE_RUNNER__INTERPRETER",
        "INTERJUDGE_RUNNER_INTERPRETER");
    if (!interpreter.empty()) {
        config.runner.interpreter = interpreter;
    }

    const auto source_suffix = GetEnvFallback(
        "INTERJUDGE_RUNNER__SOURCE_SUFFIX",
        "INTERJUDGE_RUNNER_SOURCE_SUFFIX");
    if (!source_suffix.empty()) {
        config.runner.source_suffix = source_suffix;
    }

    const auto temp_dir = GetEnvFallback(
        "INTERJUDGE_RUNNER__TEMP_DIR",
        "INTERJUDGE_RUNNER_TEMP_DIR");
    if (!temp_dir.empty()) {
        config.runner.temp_dir = temp_dir;
    }

    const auto grace = GetEnvFallback(
        "INTERJUDGE_RUNNER__GRACE_S",
        "INTERJUDGE_RUNNER_GRACE_S");
    if (!grace.empty()) {
        config.runner.grace_s = ParseDouble(grace, config.runner.grace_s);
    }

    const auto kill_wait = GetEnvFallback(
        "INTERJUDGE_RUNNER__KILL_WAIT_S",
        "INTERJUDGE_RUNNER_KILL_WAIT_S");
    if (!kill_wait.empty()) {
        config.runner.kill_wait_s = ParseDouble(kill_wait, config.runner.kill_wait_s);
    }

    const auto num_tests = GetEnvFallback(
        "INTERJUDGE_STRESS__NUM_TESTS",
        "INTERJUDGE_STRESS_NUM_TESTS");
    if (!num_tests.empty()) {
        config.stress.num_tests = ParseInt(num_tests, config.stress.num_tests);
    }

    const auto timeout_total = GetEnvFallback(
        "INTERJUDGE_STRESS__TIMEOUT_TOTAL_S",
        "INTERJUDGE_STRESS_TIMEOUT_TOTAL_S");
    if (!timeout_total.empty()) {
        config.stress.timeout_total_s = ParseDouble(timeout_total, config.stress.timeout_total_s);
    }

    const auto timeout_per_turn = GetEnvFallback(
        "INTERJUDGE_STRESS__TIMEOUT_PER_TURN_S",
        "INTERJUDGE_STRESS_TIMEOUT_PER_TURN_S");
    if (!timeout_per_turn.empty()) {
        config.stress.timeout_per_turn_s = ParseDouble(timeout_per_turn, config.stress.timeout_per_turn_s);
    }

    const auto generator_timeout = GetEnvFallback(
        "INTERJUDGE_STRESS__GENERATOR_TIMEOUT_S",
        "INTERJUDGE_STRESS_GENERATOR_TIMEOUT_S");
    if (!generator_timeout.empty()) {
        config.stress.generator_timeout_s = ParseDouble(generator_timeout, config.stress.generator_timeout_s);
    }

    const auto generator_memory = GetEnvFallback(
        "INTERJUDGE_STRESS__GENERATOR_MEMORY_MB",
        "INTERJUDGE_STRESS_GENERATOR_MEMORY_MB");
    if (!generator_memory.empty()) {
        config.stress.generator_memory_mb = ParseInt(generator_memory, config.stress.generator_memory_mb);
    }

    const auto log_level = GetEnvFallback(
        "INTERJUDGE_LOGGING__LEVEL",
        "INTERJUDGE_LOG_LEVEL");
    if (!log_level.empty()) {
        config.logging.level = log_level;
    }
}

Config LoadConfig() {
    return LoadConfig(GetConfigPath());
}

Config LoadConfig(const std::filesystem::path& config_path) {
    Config config{};

    if (std::filesystem::exists(config_path)) {
        try {
            std::ifstream input(config_path);
            nlohmann::json data;
            input >> data;
            ApplyConfigFromJson(config, data);
        } catch (const nlohmann::json::exception& ex) {
            utils::LogWarn("config", "keeping defaults, cannot parse " + config_path.string() +
                                     ": " + ex.what());
        }
    }

    ApplyConfigFromEnv(config);
    return config;
}

judge::RunnerOptions ToRunnerOptions(const Config& config) {
    const RunnerConfig defaults{};
    judge::RunnerOptions options{};
    options.interpreter = config.runner.interpreter;
    options.source_suffix = config.runner.source_suffix;
    options.temp_dir = config.runner.temp_dir;
    options.grace_period = ToMillis(config.runner.grace_s, defaults.grace_s, "runner.graceS");
    options.kill_wait = ToMillis(config.runner.kill_wait_s, defaults.kill_wait_s, "runner.killWaitS");
    return options;
}

sandbox::SandboxOptions ToSandboxOptions(const Config& config) {
    const RunnerConfig defaults{};
    sandbox::SandboxOptions options{};
    options.interpreter = config.runner.interpreter;
    options.source_suffix = config.runner.source_suffix;
    options.temp_dir = config.runner.temp_dir;
    options.kill_wait = ToMillis(config.runner.kill_wait_s, defaults.kill_wait_s, "runner.killWaitS");
    return options;
}

stress::StressOptions ToStressOptions(const Config& config) {
    const StressConfig defaults{};
    stress::StressOptions options{};
    options.timeout_total = ToMillis(config.stress.timeout_total_s, defaults.timeout_total_s,
                                     "stress.timeoutTotalS");
    options.timeout_per_turn = ToMillis(config.stress.timeout_per_turn_s, defaults.timeout_per_turn_s,
                                        "stress.timeoutPerTurnS");
    options.generator_timeout = ToMillis(config.stress.generator_timeout_s, defaults.generator_timeout_s,
                                         "stress.generatorTimeoutS");
    options.generator_memory_mb = config.stress.generator_memory_mb > 0
        ? static_cast<std::size_t>(config.stress.generator_memory_mb)
        : 0;
    return options;
}

}  // namespace interjudge::config
