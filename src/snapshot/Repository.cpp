#include "snapshot/Repository.hpp"
#include "error/Errors.hpp"
#include "logging/LogRegistry.hpp"

using namespace sv::snapshot;
using namespace sv::logging;

namespace fs = std::filesystem;

SnapshotSet LocalRepository::listDates(const fs::path& volume) const {
    SnapshotSet dates;

    for (const auto& entry : fs::directory_iterator(volume)) {
        const auto name = entry.path().filename().string();
        const auto date = Date::tryParse(name);
        if (!date) throw error::InvalidSnapshotName(name, volume.string());
        dates.insert(*date);
    }

    LogRegistry::snapshot()->debug("[LocalRepository] {} snapshots in {}", dates.size(), volume.string());
    return dates;
}
