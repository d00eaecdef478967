#include "reflink/clone.hpp"
#include "logging/LogRegistry.hpp"

#include <cerrno>
#include <system_error>
#include <fcntl.h>
#include <linux/fs.h>
#include <sys/ioctl.h>
#include <sys/stat.h>
#include <unistd.h>

using namespace sv::logging;

namespace fs = std::filesystem;

namespace sv::reflink {

namespace {

class UniqueFd {
public:
    explicit UniqueFd(const int fd) : fd_(fd) {}
    ~UniqueFd() { if (fd_ >= 0) ::close(fd_); }

    UniqueFd(const UniqueFd&) = delete;
    UniqueFd& operator=(const UniqueFd&) = delete;

    [[nodiscard]] int get() const { return fd_; }

private:
    int fd_;
};

[[noreturn]] void throwErrno(const std::string& what, const fs::path& p, const int err = errno) {
    throw std::system_error(err, std::generic_category(), what + " " + p.string());
}

// Creates the missing directories of rel below root without following links.
// Returns false if an existing component is a symlink or not a directory.
bool prepareParents(const fs::path& root, const fs::path& rel) {
    auto cur = root;
    for (const auto& part : rel) {
        cur /= part;
        const auto st = fs::symlink_status(cur);
        if (st.type() == fs::file_type::not_found) {
            fs::create_directory(cur);
            continue;
        }
        if (!fs::is_directory(st)) return false;
    }
    return true;
}

}

void cloneFile(const fs::path& src, const fs::path& dst) {
    const UniqueFd in(::open(src.c_str(), O_RDONLY | O_CLOEXEC));
    if (in.get() < 0) throwErrno("Failed to open", src);

    struct stat st{};
    if (::fstat(in.get(), &st) != 0) throwErrno("Failed to stat", src);

    const UniqueFd out(::open(dst.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_NOFOLLOW | O_CLOEXEC, st.st_mode & 07777));
    if (out.get() < 0) throwErrno("Failed to create", dst);

    if (::ioctl(out.get(), FICLONE, in.get()) != 0) {
        const int err = errno;
        ::unlink(dst.c_str());
        throwErrno("FICLONE failed for", dst, err);
    }
}

ApplyStats applyCopies(const std::vector<CopyFile>& copies, const fs::path& dstBase, const fs::path& dstTarget) {
    ApplyStats stats;

    for (const auto& copy : copies) {
        const auto from = dstBase / copy.src;
        const auto to = dstTarget / copy.dst;

        if (!fs::is_regular_file(fs::symlink_status(from))) {
            LogRegistry::reflink()->warn("[Reflink] Skipping {} -> {}: source missing in {}",
                                         copy.src.string(), copy.dst.string(), dstBase.string());
            ++stats.skipped;
            continue;
        }

        if (!prepareParents(dstTarget, copy.dst.parent_path())) {
            LogRegistry::reflink()->warn("[Reflink] Skipping {} -> {}: parent of target is not a plain directory",
                                         copy.src.string(), copy.dst.string());
            ++stats.skipped;
            continue;
        }

        const auto existing = fs::symlink_status(to);
        if (fs::is_directory(existing)) {
            LogRegistry::reflink()->warn("[Reflink] Skipping {} -> {}: target is a directory",
                                         copy.src.string(), copy.dst.string());
            ++stats.skipped;
            continue;
        }
        // Unlink rather than truncate: the old entry may be a symlink or share an inode.
        if (fs::exists(existing)) fs::remove(to);

        cloneFile(from, to);
        LogRegistry::reflink()->info("[Reflink] {} -> {}", copy.src.string(), copy.dst.string());
        ++stats.cloned;
    }

    return stats;
}

}
