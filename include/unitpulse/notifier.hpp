#pragma once

#include "unitpulse/http_transport.hpp"
#include "unitpulse/log.hpp"
#include <chrono>
#include <optional>
#include <string>

namespace unitpulse {

// Posts a message to a Discord-style chat webhook. No retries.
class WebhookNotifier {
public:
    WebhookNotifier(std::string webhook_url, std::chrono::seconds timeout,
                    HttpTransport& transport, LogSink& log);

    bool send(const std::string& content,
              const std::optional<std::string>& username = std::nullopt);

private:
    std::string webhook_url_;
    std::chrono::seconds timeout_;
    HttpTransport& transport_;
    LogSink& log_;
};

std::string webhook_payload(const std::string& content,
                            const std::optional<std::string>& username);

} // namespace unitpulse
