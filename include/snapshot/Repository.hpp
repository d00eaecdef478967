#pragma once

#include "snapshot/Date.hpp"

#include <filesystem>
#include <set>

namespace sv::snapshot {

using SnapshotSet = std::set<Date>;

// Read-only view of the dated snapshots present on a volume. Listings are never
// cached: every call reflects the volume as it is now.
class Repository {
public:
    virtual ~Repository() = default;

    [[nodiscard]] virtual SnapshotSet listDates(const std::filesystem::path& volume) const = 0;
};

// Lists the entries of a volume directory on the local filesystem. Every entry
// must be named YYYY-MM-DD.
class LocalRepository final : public Repository {
public:
    [[nodiscard]] SnapshotSet listDates(const std::filesystem::path& volume) const override;
};

}
