#pragma once

#include "DailySummary.hpp"
#include "../IClock.hpp"
#include "../Model.hpp"
#include "../TimeZone.hpp"
#include "../ports/ICacheManager.hpp"
#include "../ports/INotificator.hpp"
#include "../ports/IObjectStore.hpp"
#include "../ports/IPolicyEngine.hpp"
#include "../ports/IWebhookClient.hpp"
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace fleetalert::domain {

struct DailySummaryConfig {
    bool enabled = true;
    std::string serverTimezone;                         ///< Used when the user has no "timezone" attribute
    std::string fallbackTimezone = "America/Sao_Paulo";
    std::vector<std::string> pushChannels = {"push", "firebase"};  ///< First registered channel wins
    std::string webhookUrl;                             ///< Empty disables the webhook fan-out
    std::string webhookToken;
};

/**
 * @brief Per-minute job that pushes "yesterday's" activity summary to each user
 *
 * State lives in flat user attributes (dailySummaryPush.*) so that a restart
 * resumes where the previous process stopped. For one report date a user moves
 * through:
 *
 *   pending -> sent
 *           -> retry_pending -> sent | skipped_push_failed
 *           -> skipped_no_movement
 *           -> skipped_late_or_no_data
 *
 * Nothing happens outside 07:00-21:00 local time. The first attempt targets
 * 07:30 and never starts before 07:20; without data the check repeats every 15
 * minutes until the 10:00 cutoff.
 *
 * @note Must not run concurrently with itself
 */
class DailySummaryTask {
public:
    static constexpr const char* ATTR_DATE = "dailySummaryPush.date";
    static constexpr const char* ATTR_STATUS = "dailySummaryPush.status";
    static constexpr const char* ATTR_NEXT_AT = "dailySummaryPush.nextAt";
    static constexpr const char* ATTR_RETRY_COUNT = "dailySummaryPush.retryCount";
    static constexpr const char* ATTR_SENT_AT = "dailySummaryPush.sentAt";
    static constexpr const char* ATTR_LAST_ERROR = "dailySummaryPush.lastError";
    static constexpr const char* ATTR_WEBHOOK_STATUS = "dailySummaryPush.whatsappStatus";
    static constexpr const char* ATTR_NOTIFICATION_TOKENS = "notificationTokens";
    static constexpr const char* ATTR_TIMEZONE = "timezone";

    static constexpr const char* STATUS_PENDING = "pending";
    static constexpr const char* STATUS_SENT = "sent";
    static constexpr const char* STATUS_RETRY_PENDING = "retry_pending";
    static constexpr const char* STATUS_SKIPPED_NO_MOVEMENT = "skipped_no_movement";
    static constexpr const char* STATUS_SKIPPED_LATE = "skipped_late_or_no_data";
    static constexpr const char* STATUS_SKIPPED_PUSH_FAILED = "skipped_push_failed";

    static constexpr int QUIET_END_SECOND = 7 * 3600;           // 07:00
    static constexpr int QUIET_START_SECOND = 21 * 3600;        // 21:00
    static constexpr int WINDOW_START_SECOND = 7 * 3600 + 20 * 60;
    static constexpr int TARGET_HOUR = 7;
    static constexpr int TARGET_MINUTE = 30;
    static constexpr int CUTOFF_HOUR = 10;
    static constexpr int64_t RECHECK_INTERVAL_MILLIS = 15 * 60 * 1000;

    DailySummaryTask(std::shared_ptr<ports::IObjectStore> store,
                     std::shared_ptr<ports::ICacheManager> cacheManager,
                     std::shared_ptr<ports::NotificatorRegistry> notificators,
                     std::shared_ptr<IClock> clock,
                     std::shared_ptr<ports::RetryPolicy> retryPolicy,
                     DailySummaryConfig config,
                     std::shared_ptr<ports::IWebhookClient> webhookClient = nullptr);

    /**
     * @brief Runs one scheduling pass over all eligible users
     * @return Number of users evaluated
     */
    int tick();

    TimeZone resolveTimezone(const User& user) const;

    /// Aggregates the report date for every device the user can see
    UserSummary buildSummary(int64_t userId, const LocalDate& reportDate, const TimeZone& zone);

    static bool isTerminal(const std::string& status);

private:
    void processUser(User user);
    void resetIfNewDate(User& user, const std::string& reportDate, const TimeZone& zone,
                        const LocalDate& today);
    void updateState(User& user, const std::string& reportDate, const std::string& status,
                     std::optional<int64_t> nextAt, std::optional<int64_t> retryCount,
                     const std::string& lastError);
    void scheduleNextCheck(User& user, const std::string& reportDate, int64_t now, int64_t cutoff,
                           const std::string& reason);
    void sendPush(User& user, const std::string& reportDate, const ports::NotificationMessage& message,
                  int64_t now);
    void sendToAvailableChannel(const User& user, const ports::NotificationMessage& message);
    void sendToWebhook(const User& user, const UserSummary& summary, const LocalDate& reportDate);
    void persist(const User& user);

    std::shared_ptr<ports::IObjectStore> store_;
    std::shared_ptr<ports::ICacheManager> cacheManager_;
    std::shared_ptr<ports::NotificatorRegistry> notificators_;
    std::shared_ptr<IClock> clock_;
    std::shared_ptr<ports::RetryPolicy> retryPolicy_;
    DailySummaryConfig config_;
    std::shared_ptr<ports::IWebhookClient> webhookClient_;
};

} // namespace fleetalert::domain
