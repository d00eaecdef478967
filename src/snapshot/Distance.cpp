#include "snapshot/Distance.hpp"

namespace sv::snapshot {

uint64_t distance(const Date& target, const Date& candidate) {
    const int64_t d = candidate.ordinal() - target.ordinal();
    if (d < 0) return static_cast<uint64_t>(-d) * 2;
    return static_cast<uint64_t>(d);
}

}
