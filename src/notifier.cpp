#include "unitpulse/notifier.hpp"
#include <nlohmann/json.hpp>

namespace unitpulse {

namespace {

constexpr std::string_view kComponent = "notifier";

} // namespace

std::string webhook_payload(const std::string& content,
                            const std::optional<std::string>& username) {
    nlohmann::json payload = {{"content", content}};
    if (username && !username->empty()) {
        payload["username"] = *username;
    }
    // Invalid UTF-8 is replaced rather than thrown on.
    return payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

WebhookNotifier::WebhookNotifier(std::string webhook_url, std::chrono::seconds timeout,
                                 HttpTransport& transport, LogSink& log)
    : webhook_url_(std::move(webhook_url)), timeout_(timeout), transport_(transport), log_(log) {}

bool WebhookNotifier::send(const std::string& content,
                           const std::optional<std::string>& username) {
    auto url = split_url(webhook_url_);
    if (!url) {
        log_.write(LogLevel::Error, kComponent, "Invalid webhook URL");
        return false;
    }

    HttpRequest request{
        .path = url->path,
        .body = webhook_payload(content, username),
        .content_type = "application/json",
        .timeout = timeout_,
    };

    try {
        auto res = transport_.post(request);
        if (!res) {
            log_.write(LogLevel::Error, kComponent,
                       "Error sending webhook message: " + res.error().message);
            return false;
        }
        if (res->status >= 400) {
            log_.write(LogLevel::Error, kComponent,
                       "Webhook error " + std::to_string(res->status) + ": " + res->body);
            return false;
        }
    } catch (const std::exception& e) {
        log_.write(LogLevel::Error, kComponent,
                   std::string("Error sending webhook message: ") + e.what());
        return false;
    }

    return true;
}

} // namespace unitpulse
