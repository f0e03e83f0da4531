#include "DailySummaryTask.hpp"
#include "../Attributes.hpp"
#include "../JsonCodec.hpp"
#include <iostream>
#include <utility>

namespace fleetalert::domain {

namespace {

int secondOfDay(const LocalTime& time) {
    return time.hour * 3600 + time.minute * 60 + time.second;
}

void persistWebhookStatus(ports::IObjectStore& store, ports::ICacheManager& cacheManager,
                          int64_t userId, const std::string& reportDate, const std::string& status) {
    try {
        auto user = store.getUser(userId);
        if (!user) {
            return;
        }
        if (Attributes::getString(user->attributes, DailySummaryTask::ATTR_DATE).value_or("") != reportDate) {
            // The user already moved on to another report date.
            return;
        }
        user->attributes[DailySummaryTask::ATTR_WEBHOOK_STATUS] = status;
        store.updateUserAttributes(*user);
        cacheManager.invalidateUser(userId);
    } catch (const ports::StorageException& e) {
        std::cerr << "[DailySummary] Failed to persist webhook status userId=" << userId
                  << ": " << e.what() << std::endl;
    }
}

} // namespace

DailySummaryTask::DailySummaryTask(std::shared_ptr<ports::IObjectStore> store,
                                   std::shared_ptr<ports::ICacheManager> cacheManager,
                                   std::shared_ptr<ports::NotificatorRegistry> notificators,
                                   std::shared_ptr<IClock> clock,
                                   std::shared_ptr<ports::RetryPolicy> retryPolicy,
                                   DailySummaryConfig config,
                                   std::shared_ptr<ports::IWebhookClient> webhookClient)
    : store_(std::move(store)),
      cacheManager_(std::move(cacheManager)),
      notificators_(std::move(notificators)),
      clock_(std::move(clock)),
      retryPolicy_(std::move(retryPolicy)),
      config_(std::move(config)),
      webhookClient_(std::move(webhookClient)) {
}

bool DailySummaryTask::isTerminal(const std::string& status) {
    return status == STATUS_SENT
        || status == STATUS_SKIPPED_NO_MOVEMENT
        || status == STATUS_SKIPPED_LATE
        || status == STATUS_SKIPPED_PUSH_FAILED;
}

int DailySummaryTask::tick() {
    if (!config_.enabled) {
        return 0;
    }

    std::cout << "[DailySummary] job=start" << std::endl;
    int processed = 0;
    try {
        for (auto& user : store_->getUsers()) {
            if (user.temporary || user.disabled || !Attributes::has(user.attributes, ATTR_NOTIFICATION_TOKENS)) {
                continue;
            }
            processUser(std::move(user));
            ++processed;
        }
    } catch (const ports::StorageException& e) {
        std::cerr << "[DailySummary] job=error " << e.what() << std::endl;
    }
    std::cout << "[DailySummary] job=end usersProcessed=" << processed << std::endl;
    return processed;
}

TimeZone DailySummaryTask::resolveTimezone(const User& user) const {
    auto zone = TimeZone::of(Attributes::getString(user.attributes, ATTR_TIMEZONE).value_or(""));
    if (!zone) {
        zone = TimeZone::of(config_.serverTimezone);
    }
    if (!zone) {
        zone = TimeZone::of(config_.fallbackTimezone);
    }
    return zone ? *zone : TimeZone::utc();
}

void DailySummaryTask::processUser(User user) {
    try {
        TimeZone zone = resolveTimezone(user);
        int64_t now = clock_->epochMillis();
        int second = secondOfDay(zone.localTime(now));

        if (second < QUIET_END_SECOND || second > QUIET_START_SECOND) {
            return;
        }

        LocalDate today = zone.localDate(now);
        LocalDate reportDate = today.plusDays(-1);
        std::string reportDateValue = reportDate.toString();
        resetIfNewDate(user, reportDateValue, zone, today);

        std::string status = Attributes::getString(user.attributes, ATTR_STATUS).value_or(STATUS_PENDING);
        if (isTerminal(status)) {
            return;
        }

        int64_t cutoff = zone.toEpochMillis(today, CUTOFF_HOUR, 0);
        if (now > cutoff) {
            updateState(user, reportDateValue, STATUS_SKIPPED_LATE, std::nullopt, std::nullopt, "late_or_no_data");
            return;
        }

        int64_t nextAt = Attributes::getLong(user.attributes, ATTR_NEXT_AT).value_or(0);
        if (nextAt <= 0) {
            nextAt = zone.toEpochMillis(today, TARGET_HOUR, TARGET_MINUTE);
            user.attributes[ATTR_NEXT_AT] = nextAt;
            persist(user);
        }
        if (now < nextAt) {
            return;
        }
        if (status == STATUS_PENDING && second < WINDOW_START_SECOND) {
            return;
        }

        UserSummary summary = buildSummary(user.id, reportDate, zone);
        if (summary.devices.empty()) {
            scheduleNextCheck(user, reportDateValue, now, cutoff, "late_or_no_data");
            return;
        }
        if (!DailySummary::hasMovement(summary)) {
            updateState(user, reportDateValue, STATUS_SKIPPED_NO_MOVEMENT, std::nullopt, std::nullopt, "");
            return;
        }

        std::cout << "[DailySummary] payload userId=" << user.id << " devices=" << summary.devices.size()
                  << " distanceKm=" << DailySummary::formatDistance(summary.totalDistanceKm)
                  << " motionSec=" << summary.totalMotionSeconds << std::endl;

        auto message = DailySummary::buildMessage(summary, reportDate);
        if (!message) {
            scheduleNextCheck(user, reportDateValue, now, cutoff, "late_or_no_data");
            return;
        }

        sendPush(user, reportDateValue, *message, now);
        sendToWebhook(user, summary, reportDate);
    } catch (const std::exception& e) {
        std::cerr << "[DailySummary] Daily summary push failed for userId=" << user.id << ": " << e.what() << std::endl;
    }
}

void DailySummaryTask::resetIfNewDate(User& user, const std::string& reportDate, const TimeZone& zone,
                                      const LocalDate& today) {
    if (Attributes::getString(user.attributes, ATTR_DATE).value_or("") == reportDate) {
        return;
    }
    user.attributes[ATTR_DATE] = reportDate;
    user.attributes[ATTR_STATUS] = STATUS_PENDING;
    user.attributes[ATTR_RETRY_COUNT] = 0;
    Attributes::remove(user.attributes, ATTR_LAST_ERROR);
    Attributes::remove(user.attributes, ATTR_SENT_AT);
    Attributes::remove(user.attributes, ATTR_WEBHOOK_STATUS);
    user.attributes[ATTR_NEXT_AT] = zone.toEpochMillis(today, TARGET_HOUR, TARGET_MINUTE);
    persist(user);
}

void DailySummaryTask::updateState(User& user, const std::string& reportDate, const std::string& status,
                                   std::optional<int64_t> nextAt, std::optional<int64_t> retryCount,
                                   const std::string& lastError) {
    user.attributes[ATTR_DATE] = reportDate;
    user.attributes[ATTR_STATUS] = status;
    if (nextAt) {
        user.attributes[ATTR_NEXT_AT] = *nextAt;
    } else {
        Attributes::remove(user.attributes, ATTR_NEXT_AT);
    }
    if (retryCount) {
        user.attributes[ATTR_RETRY_COUNT] = *retryCount;
    }
    if (!lastError.empty()) {
        user.attributes[ATTR_LAST_ERROR] = lastError;
    } else {
        Attributes::remove(user.attributes, ATTR_LAST_ERROR);
    }
    if (status == STATUS_SENT) {
        user.attributes[ATTR_SENT_AT] = clock_->epochMillis();
    }
    persist(user);
}

void DailySummaryTask::scheduleNextCheck(User& user, const std::string& reportDate, int64_t now, int64_t cutoff,
                                         const std::string& reason) {
    int64_t next = now + RECHECK_INTERVAL_MILLIS;
    if (next > cutoff) {
        updateState(user, reportDate, STATUS_SKIPPED_LATE, std::nullopt, std::nullopt, reason);
    } else {
        updateState(user, reportDate, STATUS_PENDING, next,
                    Attributes::getLong(user.attributes, ATTR_RETRY_COUNT).value_or(0), reason);
    }
}

void DailySummaryTask::sendPush(User& user, const std::string& reportDate,
                                const ports::NotificationMessage& message, int64_t now) {
    int retryCount = static_cast<int>(Attributes::getLong(user.attributes, ATTR_RETRY_COUNT).value_or(0));
    try {
        sendToAvailableChannel(user, message);
        updateState(user, reportDate, STATUS_SENT, std::nullopt, retryCount, "");
        std::cout << "[DailySummary] pushSent userId=" << user.id << " dateRef=" << reportDate << std::endl;
    } catch (const ports::DeliveryException& e) {
        if (retryPolicy_->shouldRetry(retryCount)) {
            int64_t nextAt = now + retryPolicy_->getBackoffDelay(retryCount).count();
            updateState(user, reportDate, STATUS_RETRY_PENDING, nextAt, retryCount + 1, "push_retry");
        } else {
            updateState(user, reportDate, STATUS_SKIPPED_PUSH_FAILED, std::nullopt, retryCount, "push_failed");
        }
        std::cerr << "[DailySummary] pushFailed userId=" << user.id << " retryCount=" << retryCount
                  << ": " << e.what() << std::endl;
    }
}

void DailySummaryTask::sendToAvailableChannel(const User& user, const ports::NotificationMessage& message) {
    for (const auto& channel : config_.pushChannels) {
        if (notificators_->has(channel)) {
            notificators_->get(channel)->send(user, message);
            return;
        }
    }
    throw ports::DeliveryException("No push notificator available");
}

void DailySummaryTask::sendToWebhook(const User& user, const UserSummary& summary, const LocalDate& reportDate) {
    if (!webhookClient_ || config_.webhookUrl.empty()) {
        return;
    }
    std::string reportDateValue = reportDate.toString();
    if (Attributes::getString(user.attributes, ATTR_WEBHOOK_STATUS).value_or(STATUS_PENDING) == STATUS_SENT) {
        return;
    }

    std::string body = JsonCodec::dailySummaryPayload(user, summary, reportDate).dump();
    auto store = store_;
    auto cacheManager = cacheManager_;
    int64_t userId = user.id;

    webhookClient_->postJson(config_.webhookUrl, config_.webhookToken, body,
        [store, cacheManager, userId, reportDateValue](const ports::WebhookResponse& response) {
            if (response.isSuccess()) {
                std::cout << "[DailySummary] webhookSent userId=" << userId << " dateRef=" << reportDateValue
                          << " httpStatus=" << response.status << std::endl;
                persistWebhookStatus(*store, *cacheManager, userId, reportDateValue, STATUS_SENT);
            } else {
                std::cerr << "[DailySummary] webhookFailed userId=" << userId << " dateRef=" << reportDateValue
                          << " httpStatus=" << response.status << " error=" << response.error << std::endl;
                persistWebhookStatus(*store, *cacheManager, userId, reportDateValue, "failed");
            }
        });
}

void DailySummaryTask::persist(const User& user) {
    store_->updateUserAttributes(user);
    cacheManager_->invalidateUser(user.id);
}

UserSummary DailySummaryTask::buildSummary(int64_t userId, const LocalDate& reportDate, const TimeZone& zone) {
    int64_t from = zone.startOfDay(reportDate);
    int64_t to = zone.startOfDay(reportDate.plusDays(1));
    int64_t previousFrom = zone.startOfDay(reportDate.plusDays(-1));

    UserSummary summary;
    for (const auto& device : store_->getUserDevices(userId)) {
        auto positions = store_->getPositions(device.id, from, to);
        if (positions.empty()) {
            continue;
        }

        DeviceSummary item;
        item.deviceId = device.id;
        item.name = device.name;
        item.distanceKm = DailySummary::routeDistanceMeters(positions) / 1000.0;
        item.motionSeconds = DailySummary::movingTimeSeconds(positions);
        item.maxSpeedKph = DailySummary::maxSpeedKph(positions);
        for (const auto& event : store_->getEvents(device.id, from, to)) {
            if (event.type == Event::TYPE_GEOFENCE_ENTER) {
                ++item.geofenceEnterCount;
            } else if (event.type == Event::TYPE_GEOFENCE_EXIT) {
                ++item.geofenceExitCount;
            }
        }

        auto previous = store_->getPositions(device.id, previousFrom, from);
        summary.totalDistanceKm += item.distanceKm;
        summary.totalMotionSeconds += item.motionSeconds;
        summary.totalPreviousDistanceKm += DailySummary::routeDistanceMeters(previous) / 1000.0;
        summary.totalLongStops += DailySummary::countLongStops(positions);
        summary.devices.push_back(std::move(item));
    }

    DailySummary::sortDevices(summary.devices);
    return summary;
}

} // namespace fleetalert::domain
