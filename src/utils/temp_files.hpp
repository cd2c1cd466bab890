#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace interjudge::utils {

// Owns a group of uniquely named files in one directory and deletes them on
// destruction. Deletion is best-effort and never throws.
class TempFileSet {
public:
    explicit TempFileSet(std::filesystem::path directory);
    ~TempFileSet();

    TempFileSet(const TempFileSet&) = delete;
    TempFileSet& operator=(const TempFileSet&) = delete;

    // Creates "<prefix>XXXXXX<suffix>" holding contents. Throws
    // std::system_error when the file cannot be created or written.
    std::filesystem::path Create(const std::string& prefix,
                                 const std::string& suffix,
                                 const std::string& contents);

    void RemoveAll() noexcept;

    const std::filesystem::path& directory() const { return directory_; }

private:
    std::filesystem::path directory_;
    std::vector<std::filesystem::path> paths_;
};

// Empty configured value means the system temp directory.
std::filesystem::path ResolveTempDirectory(const std::string& configured);

}  // namespace interjudge::utils
