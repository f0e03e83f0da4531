#include "HttpWebhookClient.hpp"
#include <httplib.h>
#include <algorithm>
#include <iostream>
#include <utility>

namespace fleetalert {

HttpWebhookClient::HttpWebhookClient(std::chrono::seconds timeout)
    : timeout_(timeout) {
}

HttpWebhookClient::~HttpWebhookClient() {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto& task : inFlight_) {
        task.wait();
    }
}

std::optional<HttpWebhookClient::Endpoint> HttpWebhookClient::parseUrl(const std::string& url) {
    std::string::size_type schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        return std::nullopt;
    }
    std::string scheme = url.substr(0, schemeEnd);
    if (scheme != "http" && scheme != "https") {
        return std::nullopt;
    }
    std::string::size_type pathStart = url.find('/', schemeEnd + 3);
    Endpoint endpoint;
    endpoint.origin = url.substr(0, pathStart);
    endpoint.path = pathStart == std::string::npos ? "/" : url.substr(pathStart);
    if (endpoint.origin.size() <= schemeEnd + 3) {
        return std::nullopt;
    }
    return endpoint;
}

void HttpWebhookClient::postJson(const std::string& url, const std::string& bearerToken,
                                 const std::string& body, Callback callback) {
    std::lock_guard<std::mutex> lock(mutex_);
    pruneFinished();
    inFlight_.push_back(std::async(std::launch::async, [this, url, bearerToken, body, callback]() {
        ports::WebhookResponse response = post(url, bearerToken, body);
        if (callback) {
            try {
                callback(response);
            } catch (const std::exception& e) {
                std::cerr << "[Webhook] Completion handler failed: " << e.what() << std::endl;
            }
        }
    }));
}

ports::WebhookResponse HttpWebhookClient::post(const std::string& url, const std::string& bearerToken,
                                               const std::string& body) const {
    ports::WebhookResponse response;
    auto endpoint = parseUrl(url);
    if (!endpoint) {
        response.error = "Unsupported webhook URL";
        return response;
    }

    httplib::Client client(endpoint->origin);
    client.set_connection_timeout(static_cast<time_t>(timeout_.count()), 0);
    client.set_read_timeout(static_cast<time_t>(timeout_.count()), 0);
    client.set_write_timeout(static_cast<time_t>(timeout_.count()), 0);

    httplib::Headers headers;
    if (!bearerToken.empty()) {
        headers.emplace("Authorization", "Bearer " + bearerToken);
    }

    auto result = client.Post(endpoint->path, headers, body, "application/json");
    if (!result) {
        response.error = httplib::to_string(result.error());
        return response;
    }
    response.status = result->status;
    return response;
}

void HttpWebhookClient::pruneFinished() {
    inFlight_.erase(std::remove_if(inFlight_.begin(), inFlight_.end(), [](std::future<void>& task) {
        return task.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }), inFlight_.end());
}

} // namespace fleetalert
