#pragma once

#include "../../core/ports/IWebhookClient.hpp"
#include <chrono>
#include <future>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace fleetalert {

/**
 * @brief cpp-httplib webhook client, one worker task per request
 *
 * https URLs need the library built with CPPHTTPLIB_OPENSSL_SUPPORT. The
 * destructor waits for requests still in flight.
 */
class HttpWebhookClient : public ports::IWebhookClient {
public:
    struct Endpoint {
        std::string origin;     ///< scheme://host[:port]
        std::string path;       ///< path and query, "/" when absent
    };

    explicit HttpWebhookClient(std::chrono::seconds timeout = std::chrono::seconds(10));
    ~HttpWebhookClient() override;

    HttpWebhookClient(const HttpWebhookClient&) = delete;
    HttpWebhookClient& operator=(const HttpWebhookClient&) = delete;

    void postJson(const std::string& url, const std::string& bearerToken,
                  const std::string& body, Callback callback) override;

    /// Splits an http(s) URL, std::nullopt for anything else
    static std::optional<Endpoint> parseUrl(const std::string& url);

private:
    ports::WebhookResponse post(const std::string& url, const std::string& bearerToken,
                                const std::string& body) const;
    void pruneFinished();

    std::chrono::seconds timeout_;
    std::mutex mutex_;
    std::vector<std::future<void>> inFlight_;
};

} // namespace fleetalert
