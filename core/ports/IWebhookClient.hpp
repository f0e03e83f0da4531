#pragma once

#include <functional>
#include <string>

namespace fleetalert::ports {

struct WebhookResponse {
    int status = 0;                 ///< HTTP status, 0 when the request never completed
    std::string error;              ///< Transport error description, empty on a completed request

    bool isSuccess() const { return status >= 200 && status < 300; }
};

class IWebhookClient {
public:
    virtual ~IWebhookClient() = default;

    using Callback = std::function<void(const WebhookResponse&)>;

    /**
     * @brief POST a JSON body without blocking the caller
     * @param bearerToken Sent as "Authorization: Bearer ..." when not empty
     * @note The callback runs exactly once, on the client's worker thread
     */
    virtual void postJson(const std::string& url, const std::string& bearerToken,
                          const std::string& body, Callback callback) = 0;
};

} // namespace fleetalert::ports
