#include "unitpulse/config.hpp"
#include "unitpulse/env.hpp"
#include "unitpulse/http_transport.hpp"
#include <charconv>
#include <stdexcept>
#include <utility>

namespace unitpulse {

namespace {

std::expected<std::string, ConfigError> require(const std::string& key) {
    if (auto val = get_env(key)) return *val;
    return std::unexpected(ConfigError{key, "Missing required environment variable: " + key});
}

std::expected<int, ConfigError> int_or(const std::string& key, int fallback, int min_value) {
    auto val = get_env(key);
    if (!val) return fallback;

    int parsed = 0;
    auto [ptr, ec] = std::from_chars(val->data(), val->data() + val->size(), parsed);
    if (ec != std::errc{} || ptr != val->data() + val->size()) {
        return std::unexpected(ConfigError{key, key + " is not an integer: " + *val});
    }
    if (parsed < min_value) {
        return std::unexpected(ConfigError{key, key + " must be >= " + std::to_string(min_value)});
    }
    return parsed;
}

// Accepts fractional seconds ("30", "7.5"), rounded up to whole seconds.
std::expected<std::chrono::seconds, ConfigError> seconds_or(const std::string& key,
                                                            std::chrono::seconds fallback) {
    auto val = get_env(key);
    if (!val) return fallback;

    double parsed = 0.0;
    try {
        size_t pos = 0;
        parsed = std::stod(*val, &pos);
        if (pos != val->size()) throw std::invalid_argument(*val);
    } catch (const std::exception&) {
        return std::unexpected(ConfigError{key, key + " is not a number: " + *val});
    }
    if (parsed <= 0.0) {
        return std::unexpected(ConfigError{key, key + " must be positive"});
    }
    return std::chrono::ceil<std::chrono::seconds>(std::chrono::duration<double>(parsed));
}

std::expected<bool, ConfigError> bool_or(const std::string& key, bool fallback) {
    auto val = get_env(key);
    if (!val) return fallback;
    if (auto b = parse_bool(*val)) return *b;
    return std::unexpected(ConfigError{key, key + " is not a boolean: " + *val});
}

} // namespace

std::expected<AppConfig, ConfigError> load_config(bool require_webhook) {
    AppConfig config;

    for (auto [key, field] : {
             std::pair{"APPSTORE_ISSUER_ID", &config.client.issuer_id},
             std::pair{"APPSTORE_KEY_ID", &config.client.key_id},
             std::pair{"APPSTORE_PRIVATE_KEY", &config.client.private_key_pem},
             std::pair{"APPSTORE_VENDOR_NUMBER", &config.client.vendor_number},
         }) {
        auto val = require(key);
        if (!val) return std::unexpected(val.error());
        *field = std::move(*val);
    }

    auto timeout = seconds_or("APPSTORE_TIMEOUT", std::chrono::seconds(30));
    if (!timeout) return std::unexpected(timeout.error());
    config.client.timeout = *timeout;

    auto lag = int_or("APPSTORE_LAG_DAYS", 1, 0);
    if (!lag) return std::unexpected(lag.error());
    config.anchor.lag_days = *lag;

    auto probe = bool_or("APPSTORE_AUTO_PROBE", true);
    if (!probe) return std::unexpected(probe.error());
    config.anchor.auto_probe = *probe;

    auto max_probe = int_or("APPSTORE_MAX_PROBE_DAYS", 5, 0);
    if (!max_probe) return std::unexpected(max_probe.error());
    config.anchor.max_probe_days = *max_probe;

    auto parallel = int_or("APPSTORE_MAX_PARALLEL", 1, 1);
    if (!parallel) return std::unexpected(parallel.error());
    config.max_parallel = *parallel;

    if (auto level = get_env("LOG_LEVEL")) {
        auto parsed = parse_log_level(*level);
        if (!parsed) return std::unexpected(ConfigError{"LOG_LEVEL", "Unknown LOG_LEVEL: " + *level});
        config.log_level = *parsed;
    }

    auto debug = bool_or("APPSTORE_DEBUG", false);
    if (!debug) return std::unexpected(debug.error());
    if (*debug) config.log_level = LogLevel::Debug;

    if (auto url = get_env("DISCORD_WEBHOOK_URL")) {
        if (!split_url(*url)) {
            return std::unexpected(ConfigError{"DISCORD_WEBHOOK_URL", "DISCORD_WEBHOOK_URL is not an http(s) URL"});
        }
        config.notifier.webhook_url = *url;
    } else if (require_webhook) {
        return std::unexpected(ConfigError{"DISCORD_WEBHOOK_URL",
                                           "Missing DISCORD_WEBHOOK_URL environment variable"});
    }

    auto webhook_timeout = seconds_or("DISCORD_TIMEOUT", std::chrono::seconds(15));
    if (!webhook_timeout) return std::unexpected(webhook_timeout.error());
    config.notifier.timeout = *webhook_timeout;
    config.notifier.username = get_env("DISCORD_USERNAME");

    return config;
}

} // namespace unitpulse
