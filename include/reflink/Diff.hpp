#pragma once

#include "reflink/DirScan.hpp"

#include <compare>
#include <filesystem>
#include <vector>

namespace sv::reflink {

// Relative paths: src in the base tree, dst in the target tree.
struct CopyFile {
    std::filesystem::path src;
    std::filesystem::path dst;

    friend bool operator==(const CopyFile&, const CopyFile&) = default;
    friend auto operator<=>(const CopyFile&, const CopyFile&) = default;
};

/*
 * Probable moves from base to target.
 *
 * A target file whose (size, mtime) occurs in base, but not at the same path,
 * is assumed to have been moved and yields a copy from the first base path
 * with that key. Contents are never compared: reading big files would be slow,
 * reflinks are cheap, and rsync corrects any wrong guess afterwards.
 * The result is sorted.
 */
std::vector<CopyFile> diff(const DirScan& base, const DirScan& target);

}
