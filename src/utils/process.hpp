#pragma once

#include <chrono>
#include <filesystem>
#include <string>

#include <boost/process/child.hpp>
#include <boost/process/env.hpp>
#include <boost/process/environment.hpp>

namespace interjudge::utils {

// Absolute path of the interpreter; bare names are looked up on PATH.
// Returns an empty string when nothing is found.
std::string ResolveExecutable(const std::string& name);

// PATH, HOME and PYTHONUNBUFFERED only; nothing else leaks from our own
// environment into the children.
boost::process::environment BuildChildEnvironment(const std::filesystem::path& home);

void SetCloseOnExec(int fd);

// Folds a raw waitpid() status into a single exit code, using 128 + signal
// for processes killed by a signal.
int DecodeExitStatus(int native_status);

// SIGTERM, then SIGKILL if the process is still alive after kill_wait.
// The child is reaped before returning. Never throws.
void StopProcess(boost::process::child& child, std::chrono::milliseconds kill_wait) noexcept;

}  // namespace interjudge::utils
