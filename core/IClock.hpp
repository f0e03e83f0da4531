#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace fleetalert {

class IClock {
public:
    virtual ~IClock() = default;

    virtual std::chrono::system_clock::time_point now() const = 0;
    virtual int64_t epochMillis() const = 0;
    virtual std::string iso8601() const = 0;
};

class SystemClock : public IClock {
public:
    std::chrono::system_clock::time_point now() const override {
        return std::chrono::system_clock::now();
    }

    int64_t epochMillis() const override {
        return std::chrono::duration_cast<std::chrono::milliseconds>(
            now().time_since_epoch()).count();
    }

    std::string iso8601() const override;
};

/**
 * @brief UTC ISO-8601 conversions for epoch-millis timestamps
 *
 * Formatting always produces "YYYY-MM-DDTHH:MM:SS.mmmZ". Parsing accepts a
 * bare date, an optional fraction and either "Z" or a "+hh:mm" offset.
 */
class Iso8601 {
public:
    static std::string format(int64_t epochMillis);
    static std::optional<int64_t> parse(const std::string& text);

    /// Days since 1970-01-01 for a proleptic Gregorian date
    static int64_t daysFromCivil(int year, unsigned month, unsigned day);
    static void civilFromDays(int64_t days, int& year, unsigned& month, unsigned& day);
};

} // namespace fleetalert
