#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace fleetalert {

struct LocalDate {
    int year = 1970;
    int month = 1;
    int day = 1;

    LocalDate plusDays(int days) const;
    LocalDate plusMonths(int months) const;

    /// "YYYY-MM-DD"
    std::string toString() const;
    static std::optional<LocalDate> parse(const std::string& text);

    bool operator==(const LocalDate& other) const {
        return year == other.year && month == other.month && day == other.day;
    }
    bool operator!=(const LocalDate& other) const { return !(*this == other); }
};

struct LocalTime {
    int hour = 0;
    int minute = 0;
    int second = 0;

    int minuteOfDay() const { return hour * 60 + minute; }
};

/**
 * @brief IANA time zone backed by the Qt zone database
 *
 * Converts between epoch millis and wall-clock values in a named zone. Zones
 * are resolved once and shared; copies are cheap.
 */
class TimeZone {
public:
    /// Returns std::nullopt for blank or unknown zone identifiers
    static std::optional<TimeZone> of(const std::string& ianaId);
    static TimeZone utc();

    const std::string& id() const { return id_; }

    LocalDate localDate(int64_t epochMillis) const;
    LocalTime localTime(int64_t epochMillis) const;

    /// Epoch millis of a wall-clock time on the given local date
    int64_t toEpochMillis(const LocalDate& date, int hour, int minute) const;
    int64_t startOfDay(const LocalDate& date) const { return toEpochMillis(date, 0, 0); }

    /// Adds calendar months to an instant keeping its wall-clock time in this zone
    int64_t plusMonths(int64_t epochMillis, int months) const;

private:
    struct Impl;
    TimeZone(std::string id, std::shared_ptr<const Impl> impl);

    std::string id_;
    std::shared_ptr<const Impl> impl_;
};

} // namespace fleetalert
