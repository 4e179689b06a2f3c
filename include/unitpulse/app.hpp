#pragma once

#include "unitpulse/anchor_resolver.hpp"
#include "unitpulse/config.hpp"
#include "unitpulse/http_transport.hpp"
#include "unitpulse/log.hpp"
#include "unitpulse/rate_limiter.hpp"
#include "unitpulse/token_signer.hpp"
#include <ostream>
#include <vector>

namespace unitpulse {

struct RunOptions {
    bool dry_run = false;
    bool verify_vendor = false;
    std::vector<int> periods = {1, 7, 30};
};

// Everything one run talks to. main wires the real transports.
struct RunContext {
    const AppConfig& config;
    const TokenSigner& signer;
    HttpTransport& api_transport;
    HttpTransport& webhook_transport;
    RateLimiter& limiter;
    LogSink& log;
    TodayFn today;
    std::ostream& out;
};

// One fetch-aggregate-notify pass. Only a failed webhook delivery makes it
// return 1; vendor and report faults are logged and the message still goes
// out with N/A where data is missing.
int run_summary(const RunContext& ctx, const RunOptions& options);

} // namespace unitpulse
