#include "IClock.hpp"
#include <cctype>
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace fleetalert {

std::string SystemClock::iso8601() const {
    return Iso8601::format(epochMillis());
}

// Howard Hinnant's civil calendar algorithms.
int64_t Iso8601::daysFromCivil(int year, unsigned month, unsigned day) {
    year -= month <= 2;
    const int64_t era = (year >= 0 ? year : year - 399) / 400;
    const unsigned yoe = static_cast<unsigned>(year - era * 400);
    const unsigned doy = (153 * (month + (month > 2 ? -3 : 9)) + 2) / 5 + day - 1;
    const unsigned doe = yoe * 365 + yoe / 4 - yoe / 100 + doy;
    return era * 146097 + static_cast<int64_t>(doe) - 719468;
}

void Iso8601::civilFromDays(int64_t days, int& year, unsigned& month, unsigned& day) {
    days += 719468;
    const int64_t era = (days >= 0 ? days : days - 146096) / 146097;
    const unsigned doe = static_cast<unsigned>(days - era * 146097);
    const unsigned yoe = (doe - doe / 1460 + doe / 36524 - doe / 146096) / 365;
    const unsigned doy = doe - (365 * yoe + yoe / 4 - yoe / 100);
    const unsigned mp = (5 * doy + 2) / 153;
    day = doy - (153 * mp + 2) / 5 + 1;
    month = mp < 10 ? mp + 3 : mp - 9;
    year = static_cast<int>(yoe + era * 400) + (month <= 2);
}

std::string Iso8601::format(int64_t epochMillis) {
    int64_t days = epochMillis / 86400000;
    int64_t remainder = epochMillis % 86400000;
    if (remainder < 0) {
        remainder += 86400000;
        --days;
    }
    int year;
    unsigned month, day;
    civilFromDays(days, year, month, day);

    int64_t seconds = remainder / 1000;
    std::stringstream ss;
    ss << std::setfill('0')
       << std::setw(4) << year << '-' << std::setw(2) << month << '-' << std::setw(2) << day
       << 'T' << std::setw(2) << seconds / 3600 << ':' << std::setw(2) << (seconds / 60) % 60
       << ':' << std::setw(2) << seconds % 60
       << '.' << std::setw(3) << remainder % 1000 << 'Z';
    return ss.str();
}

static int daysInMonth(int year, int month) {
    static const int lengths[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
    bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
    return month == 2 && leap ? 29 : lengths[month - 1];
}

std::optional<int64_t> Iso8601::parse(const std::string& text) {
    int year = 0, month = 0, day = 0, hour = 0, minute = 0, second = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3) {
        return std::nullopt;
    }
    if (month < 1 || month > 12 || day < 1 || day > daysInMonth(year, month)) {
        return std::nullopt;
    }

    std::string rest = text.substr(static_cast<size_t>(consumed));
    int64_t millis = 0;
    int64_t offsetMinutes = 0;
    if (!rest.empty()) {
        if (rest[0] != 'T' && rest[0] != ' ') {
            return std::nullopt;
        }
        int timeConsumed = 0;
        if (std::sscanf(rest.c_str() + 1, "%2d:%2d:%2d%n", &hour, &minute, &second, &timeConsumed) != 3) {
            return std::nullopt;
        }
        size_t pos = 1 + static_cast<size_t>(timeConsumed);
        if (pos < rest.size() && rest[pos] == '.') {
            ++pos;
            int64_t scale = 100;
            while (pos < rest.size() && std::isdigit(static_cast<unsigned char>(rest[pos]))) {
                millis += (rest[pos] - '0') * scale;
                scale /= 10;
                ++pos;
            }
        }
        if (pos < rest.size()) {
            if (rest[pos] == 'Z') {
                ++pos;
            } else if (rest[pos] == '+' || rest[pos] == '-') {
                int offsetHour = 0, offsetMinute = 0;
                if (std::sscanf(rest.c_str() + pos + 1, "%2d:%2d", &offsetHour, &offsetMinute) != 2) {
                    return std::nullopt;
                }
                offsetMinutes = offsetHour * 60 + offsetMinute;
                if (rest[pos] == '-') {
                    offsetMinutes = -offsetMinutes;
                }
                pos += 6;
            }
        }
        if (pos != rest.size()) {
            return std::nullopt;
        }
        if (hour > 23 || minute > 59 || second > 60) {
            return std::nullopt;
        }
    }

    int64_t days = daysFromCivil(year, static_cast<unsigned>(month), static_cast<unsigned>(day));
    int64_t seconds = days * 86400 + hour * 3600 + minute * 60 + second - offsetMinutes * 60;
    return seconds * 1000 + millis;
}

} // namespace fleetalert
