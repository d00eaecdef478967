#include "reflink/DirScan.hpp"
#include "logging/LogRegistry.hpp"

#include <algorithm>
#include <cerrno>
#include <system_error>
#include <sys/stat.h>

using namespace sv::reflink;
using namespace sv::logging;

namespace fs = std::filesystem;

namespace {

dev_t deviceOf(const fs::path& p) {
    struct stat st{};
    if (::lstat(p.c_str(), &st) != 0)
        throw fs::filesystem_error("lstat failed", p, std::error_code(errno, std::generic_category()));
    return st.st_dev;
}

}

size_t DirScan::fileCount() const {
    size_t n = 0;
    for (const auto& [_, paths] : entries) n += paths.size();
    return n;
}

DirScan sv::reflink::scanDir(const fs::path& root) {
    DirScan scan{root, {}};
    const dev_t rootDev = deviceOf(root);

    for (auto it = fs::recursive_directory_iterator(root); it != fs::recursive_directory_iterator(); ++it) {
        const auto& entry = *it;
        const auto status = entry.symlink_status();

        if (fs::is_directory(status)) {
            if (deviceOf(entry.path()) != rootDev) it.disable_recursion_pending();
            continue;
        }

        if (!fs::is_regular_file(status)) continue;

        const FileInfo info{entry.file_size(), entry.last_write_time()};
        scan.entries[info].push_back(entry.path().lexically_relative(root));
    }

    for (auto& [_, paths] : scan.entries) std::ranges::sort(paths);

    LogRegistry::reflink()->debug("[DirScan] {} files under {}", scan.fileCount(), root.string());
    return scan;
}
