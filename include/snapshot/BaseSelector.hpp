#pragma once

#include "snapshot/Repository.hpp"

#include <cstdint>

namespace sv::snapshot {

struct Selection {
    Date base;
    uint64_t distance = 0;
};

struct BaseSelector {
    // Candidate with the smallest distance(target, .), the earliest date on a tie.
    // Throws error::PreconditionFailure when candidates is empty.
    static Selection select(const Date& target, const SnapshotSet& candidates);
};

}
