#pragma once

#include "unitpulse/log.hpp"
#include "unitpulse/types.hpp"
#include <chrono>
#include <expected>
#include <optional>
#include <string>

namespace unitpulse {

struct NotifierConfig {
    std::string webhook_url;
    std::chrono::seconds timeout{15};
    std::optional<std::string> username;
};

struct AppConfig {
    ClientConfig client;
    AnchorConfig anchor;
    NotifierConfig notifier;
    LogLevel log_level = LogLevel::Info;
    int max_parallel = 1;
};

struct ConfigError {
    std::string key;
    std::string message;
};

// Builds the run configuration from the environment. Missing credentials
// and unparsable values are errors; nothing here touches the network.
std::expected<AppConfig, ConfigError> load_config(bool require_webhook = true);

} // namespace unitpulse
