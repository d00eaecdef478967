#pragma once

#include <compare>
#include <cstdint>
#include <filesystem>
#include <map>
#include <vector>

namespace sv::reflink {

// Files with equal size and mtime are assumed to have equal content.
struct FileInfo {
    uintmax_t size{};
    std::filesystem::file_time_type mtime{};

    friend bool operator==(const FileInfo&, const FileInfo&) = default;
    friend auto operator<=>(const FileInfo&, const FileInfo&) = default;
};

struct DirScan {
    std::filesystem::path root;
    // Relative paths of the regular files under root, sorted, grouped by FileInfo.
    std::map<FileInfo, std::vector<std::filesystem::path>> entries;

    [[nodiscard]] size_t fileCount() const;
};

// Walks root recursively without following symlinks or crossing into other
// filesystems. Throws std::filesystem::filesystem_error on I/O errors.
DirScan scanDir(const std::filesystem::path& root);

}
