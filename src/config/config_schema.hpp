#pragma once

#include <string>

namespace interjudge::config {

struct RunnerConfig {
    std::string interpreter = "python3";
    std::string source_suffix = ".py";
    std::string temp_dir;
    double grace_s = 2.0;
    double kill_wait_s = 1.0;
};

struct StressConfig {
    int num_tests = 100;
    double timeout_total_s = 30.0;
    double timeout_per_turn_s = 2.0;
    double generator_timeout_s = 5.0;
    int generator_memory_mb = 256;
};

struct LoggingConfig {
    std::string level = "info";
};

struct Config {
    RunnerConfig runner;
    StressConfig stress;
    LoggingConfig logging;
};

}  // namespace interjudge::config
