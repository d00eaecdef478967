#include "snapshot/Date.hpp"
#include "error/Errors.hpp"

#include <charconv>
#include <fmt/format.h>

using namespace sv::snapshot;
using namespace std::chrono;

namespace {

template <typename T>
bool parseDigits(const std::string_view sv, T& out) {
    for (const char c : sv)
        if (c < '0' || c > '9') return false;
    const auto [ptr, ec] = std::from_chars(sv.data(), sv.data() + sv.size(), out);
    return ec == std::errc() && ptr == sv.data() + sv.size();
}

}

Date::Date(const year_month_day ymd) : ymd_(ymd) {}

Date::Date(const int year, const unsigned month, const unsigned day)
    : ymd_(std::chrono::year(year), std::chrono::month(month), std::chrono::day(day)) {}

std::optional<Date> Date::tryParse(const std::string_view name) {
    if (name.size() != 10 || name[4] != '-' || name[7] != '-') return std::nullopt;

    int y = 0;
    unsigned m = 0, d = 0;
    if (!parseDigits(name.substr(0, 4), y) || y < 1) return std::nullopt;
    if (!parseDigits(name.substr(5, 2), m)) return std::nullopt;
    if (!parseDigits(name.substr(8, 2), d)) return std::nullopt;

    const year_month_day parsed{year(y), month(m), day(d)};
    if (!parsed.ok()) return std::nullopt;
    return Date(parsed);
}

Date Date::parse(const std::string_view name) {
    if (auto d = tryParse(name)) return *d;
    throw error::InvalidSnapshotName(std::string(name), "");
}

std::string Date::toString() const {
    return fmt::format("{:04}-{:02}-{:02}",
                       static_cast<int>(ymd_.year()),
                       static_cast<unsigned>(ymd_.month()),
                       static_cast<unsigned>(ymd_.day()));
}

int64_t Date::ordinal() const {
    return sys_days(ymd_).time_since_epoch().count();
}
