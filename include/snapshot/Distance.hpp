#pragma once

#include "snapshot/Date.hpp"

#include <cstdint>

namespace sv::snapshot {

/*
 * Closeness of a candidate base to a target, in days.
 *
 * A candidate on or after the target scores its day count; one before the
 * target scores twice its day count. Snapshots mostly grow over time, so
 * content missing from the target is more likely to be found in a later
 * snapshot than in an earlier one.
 */
[[nodiscard]] uint64_t distance(const Date& target, const Date& candidate);

}
