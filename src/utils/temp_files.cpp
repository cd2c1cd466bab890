#include "utils/temp_files.hpp"

#include <cerrno>
#include <cstdlib>
#include <system_error>
#include <unistd.h>

namespace interjudge::utils {
namespace {

void WriteAll(int fd, const std::string& contents, const std::string& path) {
    std::size_t written = 0;
    while (written < contents.size()) {
        const auto n = ::write(fd, contents.data() + written, contents.size() - written);
        if (n < 0) {
            if (errno == EINTR) {
                continue;
            }
            const int saved = errno;
            ::close(fd);
            throw std::system_error(saved, std::generic_category(), "write " + path);
        }
        written += static_cast<std::size_t>(n);
    }
}

}  // namespace

TempFileSet::TempFileSet(std::filesystem::path directory)
    : directory_(std::move(directory)) {}

TempFileSet::~TempFileSet() {
    RemoveAll();
}

std::filesystem::path TempFileSet::Create(const std::string& prefix,
                                          const std::string& suffix,
                                          const std::string& contents) {
    std::string name = (directory_ / (prefix + "XXXXXX" + suffix)).string();
    const int fd = ::mkstemps(name.data(), static_cast<int>(suffix.size()));
    if (fd < 0) {
        throw std::system_error(errno, std::generic_category(), "mkstemps " + name);
    }
    paths_.emplace_back(name);
    WriteAll(fd, contents, name);
    if (::close(fd) != 0) {
        throw std::system_error(errno, std::generic_category(), "close " + name);
    }
    return paths_.back();
}

void TempFileSet::RemoveAll() noexcept {
    for (const auto& path : paths_) {
        std::error_code ec;
        std::filesystem::remove(path, ec);
    }
    paths_.clear();
}

std::filesystem::path ResolveTempDirectory(const std::string& configured) {
    if (!configured.empty()) {
        return std::filesystem::path(configured);
    }
    std::error_code ec;
    auto path = std::filesystem::temp_directory_path(ec);
    if (ec) {
        return std::filesystem::path("/tmp");
    }
    return path;
}

}  // namespace interjudge::utils
