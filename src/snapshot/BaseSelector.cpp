#include "snapshot/BaseSelector.hpp"
#include "snapshot/Distance.hpp"
#include "error/Errors.hpp"

#include <optional>

using namespace sv::snapshot;

namespace {

// Ascending distance first, then ascending date.
bool closer(const Selection& a, const Selection& b) {
    if (a.distance != b.distance) return a.distance < b.distance;
    return a.base < b.base;
}

}

Selection BaseSelector::select(const Date& target, const SnapshotSet& candidates) {
    if (candidates.empty())
        throw error::PreconditionFailure("No base snapshot available to start from");

    std::optional<Selection> best;
    for (const auto& c : candidates) {
        const Selection s{c, distance(target, c)};
        if (!best || closer(s, *best)) best = s;
    }
    return *best;
}
