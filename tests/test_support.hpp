#pragma once

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <iterator>
#include <stdexcept>
#include <string>

#include "judge/interaction_runner.hpp"
#include "sandbox/sandbox_executor.hpp"

namespace interjudge::testing {

// Fresh directory under the system temp dir, removed with its contents.
class ScratchDir {
public:
    ScratchDir() {
        std::string pattern = (std::filesystem::temp_directory_path() / "interjudge_test_XXXXXX").string();
        if (::mkdtemp(pattern.data()) == nullptr) {
            throw std::runtime_error("mkdtemp failed");
        }
        path_ = pattern;
    }

    ~ScratchDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    ScratchDir(const ScratchDir&) = delete;
    ScratchDir& operator=(const ScratchDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

    std::size_t EntryCount() const {
        return static_cast<std::size_t>(std::distance(
            std::filesystem::directory_iterator(path_),
            std::filesystem::directory_iterator()));
    }

private:
    std::filesystem::path path_;
};

// Judges, solvers and generators in the tests are POSIX shell scripts.
inline judge::RunnerOptions ShellRunnerOptions(const ScratchDir& dir) {
    judge::RunnerOptions options{};
    options.interpreter = "/bin/sh";
    options.source_suffix = ".sh";
    options.temp_dir = dir.path().string();
    return options;
}

inline sandbox::SandboxOptions ShellSandboxOptions(const ScratchDir& dir) {
    sandbox::SandboxOptions options{};
    options.interpreter = "/bin/sh";
    options.source_suffix = ".sh";
    options.temp_dir = dir.path().string();
    return options;
}

inline bool TranscriptContains(const judge::InteractionResult& result, const std::string& rendered) {
    for (const auto& line : result.transcript) {
        if (line.Render() == rendered) {
            return true;
        }
    }
    return false;
}

}  // namespace interjudge::testing
