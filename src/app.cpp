#include "unitpulse/app.hpp"
#include "unitpulse/aggregator.hpp"
#include "unitpulse/api_client.hpp"
#include "unitpulse/notifier.hpp"
#include "unitpulse/report_cache.hpp"
#include "unitpulse/report_fetcher.hpp"
#include "unitpulse/summary.hpp"

namespace unitpulse {

namespace {

constexpr std::string_view kComponent = "main";

} // namespace

int run_summary(const RunContext& ctx, const RunOptions& options) {
    const AppConfig& config = ctx.config;
    ApiContext api{config.client, ctx.signer, ctx.api_transport, ctx.limiter};

    if (options.verify_vendor) {
        auto verified = verify_vendor(api);
        if (verified) {
            ctx.log.write(LogLevel::Info, kComponent,
                          "Vendor " + config.client.vendor_number + " verified");
        } else {
            ctx.log.write(LogLevel::Error, kComponent,
                          "Vendor verification failed: " + verified.error().message);
        }
    }

    ReportFetcher fetcher(api, ctx.log);
    ReportCache cache;
    CachingReportSource source(fetcher, cache);

    auto resolver = make_anchor_resolver(config.anchor, source, ctx.today, ctx.log);
    Aggregator aggregator(source, ctx.log, config.max_parallel);
    SummaryRunner runner(*resolver, aggregator, ctx.log);

    auto summary = runner.run(periods_from_days(options.periods));
    auto content = format_summary(summary, std::chrono::system_clock::now());

    if (options.dry_run) {
        ctx.out << content << "\n";
        return 0;
    }

    WebhookNotifier notifier(config.notifier.webhook_url, config.notifier.timeout,
                             ctx.webhook_transport, ctx.log);
    if (!notifier.send(content, config.notifier.username)) {
        ctx.log.write(LogLevel::Error, kComponent, "Failed to send webhook message");
        return 1;
    }

    ctx.log.write(LogLevel::Info, kComponent, "Webhook message sent successfully");
    return 0;
}

} // namespace unitpulse
