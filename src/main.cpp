#include "unitpulse/app.hpp"
#include "unitpulse/config.hpp"
#include "unitpulse/date.hpp"
#include "unitpulse/env.hpp"
#include "unitpulse/http_transport.hpp"
#include "unitpulse/log.hpp"
#include "unitpulse/rate_limiter.hpp"
#include "unitpulse/token_signer.hpp"
#include <charconv>
#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace {

struct CliArgs {
    std::string env_file = ".env";
    bool dry_run = false;
    bool verify_vendor = false;
    std::vector<int> periods = {1, 7, 30};
};

void print_usage() {
    std::cerr << R"(Usage: unitpulse [options]
  --env-file <path>     dotenv file to load first (default: .env)
  --dry-run             print the summary instead of posting it
  --verify-vendor       check the vendor number is accessible before fetching
  --periods <list>      comma-separated window sizes in days (default: 1,7,30)
)";
}

std::optional<std::vector<int>> parse_periods(const std::string& csv) {
    std::vector<int> days;
    std::stringstream ss(csv);
    std::string item;
    while (std::getline(ss, item, ',')) {
        int d = 0;
        auto [ptr, ec] = std::from_chars(item.data(), item.data() + item.size(), d);
        if (ec != std::errc{} || ptr != item.data() + item.size() || d <= 0) return std::nullopt;
        days.push_back(d);
    }
    if (days.empty()) return std::nullopt;
    return days;
}

std::optional<CliArgs> parse_args(int argc, char* argv[]) {
    CliArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string flag = argv[i];

        if (flag == "--dry-run") {
            args.dry_run = true;
            continue;
        }
        if (flag == "--verify-vendor") {
            args.verify_vendor = true;
            continue;
        }

        if (i + 1 >= argc) {
            std::cerr << "Missing value for " << flag << "\n";
            return std::nullopt;
        }
        std::string val = argv[++i];

        if (flag == "--env-file") args.env_file = val;
        else if (flag == "--periods") {
            auto periods = parse_periods(val);
            if (!periods) {
                std::cerr << "Invalid --periods: " << val << "\n";
                return std::nullopt;
            }
            args.periods = *periods;
        }
        else {
            std::cerr << "Unknown option: " << flag << "\n";
            return std::nullopt;
        }
    }

    return args;
}

} // namespace

int main(int argc, char* argv[]) {
    auto args = parse_args(argc, argv);
    if (!args) {
        print_usage();
        return 2;
    }

    unitpulse::load_env(args->env_file);

    auto config = unitpulse::load_config(!args->dry_run);
    if (!config) {
        std::cerr << "Configuration error: " << config.error().message << "\n";
        return 2;
    }

    unitpulse::StderrLogSink log(config->log_level);

    auto signer = unitpulse::TokenSigner::from_pem(
        config->client.issuer_id, config->client.key_id, config->client.private_key_pem);
    if (!signer) {
        std::cerr << "Configuration error: " << signer.error().message << "\n";
        return 2;
    }

    unitpulse::HttplibTransport api_transport(config->client.base_url);
    auto webhook = unitpulse::split_url(config->notifier.webhook_url);
    unitpulse::HttplibTransport webhook_transport(webhook ? webhook->origin : std::string());
    unitpulse::RateLimiter limiter;

    unitpulse::RunContext ctx{
        .config = *config,
        .signer = *signer,
        .api_transport = api_transport,
        .webhook_transport = webhook_transport,
        .limiter = limiter,
        .log = log,
        .today = unitpulse::today_utc,
        .out = std::cout,
    };
    unitpulse::RunOptions options{
        .dry_run = args->dry_run,
        .verify_vendor = args->verify_vendor,
        .periods = args->periods,
    };
    return unitpulse::run_summary(ctx, options);
}
