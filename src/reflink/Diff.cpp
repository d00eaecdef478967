#include "reflink/Diff.hpp"

#include <algorithm>

namespace sv::reflink {

std::vector<CopyFile> diff(const DirScan& base, const DirScan& target) {
    std::vector<CopyFile> copies;

    for (const auto& [info, paths] : target.entries) {
        const auto it = base.entries.find(info);
        if (it == base.entries.end()) continue;

        const auto& basePaths = it->second;
        for (const auto& path : paths) {
            // Same path, size and mtime: unchanged.
            if (std::ranges::binary_search(basePaths, path)) continue;
            copies.push_back({basePaths.front(), path});
        }
    }

    std::ranges::sort(copies);
    return copies;
}

}
