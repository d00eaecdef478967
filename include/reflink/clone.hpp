#pragma once

#include "reflink/Diff.hpp"

#include <filesystem>
#include <vector>

namespace sv::reflink {

// Makes dst a reflink of src (FICLONE): same contents, all extents shared.
// dst must not exist; it is created with src's permission bits and never
// followed if it is a symlink. Throws std::system_error, e.g. EOPNOTSUPP or
// EXDEV when the filesystem cannot share extents between the two paths. A dst
// created before a failed clone is removed again.
void cloneFile(const std::filesystem::path& src, const std::filesystem::path& dst);

struct ApplyStats {
    size_t cloned = 0;
    size_t skipped = 0;
};

// Replays copies from dstBase into dstTarget. An existing non-directory entry
// at the target is unlinked first. Copies are skipped when the source is not a
// regular file in dstBase, the target is a directory, or a parent of the
// target inside dstTarget is a symlink or a non-directory.
ApplyStats applyCopies(const std::vector<CopyFile>& copies,
                       const std::filesystem::path& dstBase,
                       const std::filesystem::path& dstTarget);

}
