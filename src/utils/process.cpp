#include "utils/process.hpp"

#include <thread>

#include <boost/process/search_path.hpp>
#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>

#include "utils/common.hpp"

namespace interjudge::utils {
namespace bp = boost::process;

std::string ResolveExecutable(const std::string& name) {
    if (name.empty()) {
        return {};
    }
    if (name.find('/') != std::string::npos) {
        return name;
    }
    return bp::search_path(name).string();
}

bp::environment BuildChildEnvironment(const std::filesystem::path& home) {
    bp::environment env;
    auto path = GetEnv("PATH");
    if (path.empty()) {
        path = "/usr/local/bin:/usr/bin:/bin";
    }
    env["PATH"] = path;
    env["HOME"] = home.string();
    env["PYTHONUNBUFFERED"] = "1";
    return env;
}

void SetCloseOnExec(int fd) {
    if (fd < 0) {
        return;
    }
    const int flags = ::fcntl(fd, F_GETFD);
    if (flags >= 0) {
        ::fcntl(fd, F_SETFD, flags | FD_CLOEXEC);
    }
}

int DecodeExitStatus(int native_status) {
    if (WIFEXITED(native_status)) {
        return WEXITSTATUS(native_status);
    }
    if (WIFSIGNALED(native_status)) {
        return 128 + WTERMSIG(native_status);
    }
    return native_status;
}

void StopProcess(bp::child& child, std::chrono::milliseconds kill_wait) noexcept {
    std::error_code ec;
    if (!child.valid() || !child.running(ec)) {
        return;
    }
    ::kill(child.id(), SIGTERM);
    const auto deadline = std::chrono::steady_clock::now() + kill_wait;
    while (std::chrono::steady_clock::now() < deadline) {
        if (!child.running(ec)) {
            return;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    child.terminate(ec);
}

}  // namespace interjudge::utils
