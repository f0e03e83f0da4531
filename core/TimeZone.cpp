#include "TimeZone.hpp"
#include <QByteArray>
#include <QDate>
#include <QDateTime>
#include <QTime>
#include <QTimeZone>
#include <cstdio>
#include <utility>

namespace fleetalert {

struct TimeZone::Impl {
    QTimeZone zone;
};

namespace {

QDate toQDate(const LocalDate& date) {
    return QDate(date.year, date.month, date.day);
}

LocalDate fromQDate(const QDate& date) {
    return LocalDate{date.year(), date.month(), date.day()};
}

} // namespace

LocalDate LocalDate::plusDays(int days) const {
    return fromQDate(toQDate(*this).addDays(days));
}

LocalDate LocalDate::plusMonths(int months) const {
    return fromQDate(toQDate(*this).addMonths(months));
}

std::string LocalDate::toString() const {
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "%04d-%02d-%02d", year, month, day);
    return buffer;
}

std::optional<LocalDate> LocalDate::parse(const std::string& text) {
    int year = 0, month = 0, day = 0;
    int consumed = 0;
    if (std::sscanf(text.c_str(), "%4d-%2d-%2d%n", &year, &month, &day, &consumed) != 3
        || static_cast<size_t>(consumed) != text.size()) {
        return std::nullopt;
    }
    if (!QDate::isValid(year, month, day)) {
        return std::nullopt;
    }
    return LocalDate{year, month, day};
}

TimeZone::TimeZone(std::string id, std::shared_ptr<const Impl> impl)
    : id_(std::move(id)), impl_(std::move(impl)) {
}

std::optional<TimeZone> TimeZone::of(const std::string& ianaId) {
    if (ianaId.empty()) {
        return std::nullopt;
    }
    QTimeZone zone(QByteArray::fromStdString(ianaId));
    if (!zone.isValid()) {
        return std::nullopt;
    }
    return TimeZone(ianaId, std::make_shared<Impl>(Impl{zone}));
}

TimeZone TimeZone::utc() {
    return TimeZone("UTC", std::make_shared<Impl>(Impl{QTimeZone(QByteArray("UTC"))}));
}

LocalDate TimeZone::localDate(int64_t epochMillis) const {
    return fromQDate(QDateTime::fromMSecsSinceEpoch(epochMillis, impl_->zone).date());
}

LocalTime TimeZone::localTime(int64_t epochMillis) const {
    QTime time = QDateTime::fromMSecsSinceEpoch(epochMillis, impl_->zone).time();
    return LocalTime{time.hour(), time.minute(), time.second()};
}

int64_t TimeZone::toEpochMillis(const LocalDate& date, int hour, int minute) const {
    return QDateTime(toQDate(date), QTime(hour, minute), impl_->zone).toMSecsSinceEpoch();
}

int64_t TimeZone::plusMonths(int64_t epochMillis, int months) const {
    return QDateTime::fromMSecsSinceEpoch(epochMillis, impl_->zone).addMonths(months).toMSecsSinceEpoch();
}

} // namespace fleetalert
