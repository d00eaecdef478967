#pragma once

#include <chrono>
#include <compare>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace sv::snapshot {

// Calendar date identifying a snapshot. Its canonical name is YYYY-MM-DD, so
// lexicographic order of names equals chronological order.
class Date {
public:
    Date() = default;
    explicit Date(std::chrono::year_month_day ymd);
    Date(int year, unsigned month, unsigned day);

    // Throws error::InvalidSnapshotName unless name is exactly YYYY-MM-DD and a real date.
    static Date parse(std::string_view name);
    static std::optional<Date> tryParse(std::string_view name);

    [[nodiscard]] std::string toString() const;

    // Days since the civil epoch; differences are calendar day counts.
    [[nodiscard]] int64_t ordinal() const;

    [[nodiscard]] std::chrono::year_month_day ymd() const { return ymd_; }

    friend bool operator==(const Date&, const Date&) = default;
    friend auto operator<=>(const Date&, const Date&) = default;

private:
    std::chrono::year_month_day ymd_{};
};

}
