#include <gtest/gtest.h>
#include "fakes.hpp"
#include "unitpulse/app.hpp"
#include "unitpulse/api_client.hpp"
#include <sstream>

using namespace unitpulse;
using namespace unitpulse::test;

namespace {

class RunSummaryTest : public ::testing::Test {
protected:
    AppConfig config = [] {
        AppConfig c;
        c.client.vendor_number = "85012345";
        c.notifier.webhook_url = "https://discord.com/api/webhooks/123/abc";
        return c;
    }();
    TokenSigner signer = *TokenSigner::from_pem("issuer", "KEY", test_key_pem());
    FakeTransport api;
    FakeTransport webhook{[](const HttpRequest&) -> HttpResult { return HttpResponse{204, ""}; }};
    RateLimiter limiter{1000, std::chrono::seconds(60), [](std::chrono::steady_clock::duration) {}};
    MemoryLogSink log;
    std::ostringstream out;

    RunContext ctx() {
        return RunContext{
            .config = config,
            .signer = signer,
            .api_transport = api,
            .webhook_transport = webhook,
            .limiter = limiter,
            .log = log,
            .today = [] { return ymd(2024, 3, 10); },
            .out = out,
        };
    }

    std::string posted_content() {
        auto requests = webhook.requests();
        if (requests.size() != 1) return "";
        return nlohmann::json::parse(requests[0].body)["content"].get<std::string>();
    }
};

} // namespace

TEST_F(RunSummaryTest, DeliversReportTotals) {
    api.set_handler([](const HttpRequest&) -> HttpResult {
        return HttpResponse{200, report_envelope("Title\tUnits\nApp\t3\n")};
    });

    EXPECT_EQ(run_summary(ctx(), RunOptions{.periods = {1, 7}}), 0);

    auto content = posted_content();
    EXPECT_NE(content.find("Period 24h: 3"), std::string::npos);
    EXPECT_NE(content.find("Period 7d: 21"), std::string::npos);
}

TEST_F(RunSummaryTest, VendorCheckFailureStillNotifies) {
    api.set_handler([](const HttpRequest&) -> HttpResult {
        return HttpResponse{403, R"({"errors":[{"status":"403","title":"Forbidden"}]})"};
    });

    int code = run_summary(ctx(), RunOptions{.verify_vendor = true});

    EXPECT_EQ(code, 0);
    EXPECT_TRUE(log.contains("Vendor verification failed"));

    auto content = posted_content();
    EXPECT_NE(content.find("Period 24h: N/A"), std::string::npos);
    EXPECT_NE(content.find("Period 30d: N/A"), std::string::npos);
    EXPECT_EQ(api.requests().front().path, kVendorsPath);
}

TEST_F(RunSummaryTest, WebhookFailureExitsWithOne) {
    webhook.set_handler([](const HttpRequest&) -> HttpResult {
        return HttpResponse{500, "oops"};
    });

    EXPECT_EQ(run_summary(ctx(), RunOptions{}), 1);
    EXPECT_TRUE(log.contains("Failed to send webhook message"));
}

TEST_F(RunSummaryTest, DryRunPrintsInsteadOfPosting) {
    EXPECT_EQ(run_summary(ctx(), RunOptions{.dry_run = true}), 0);

    EXPECT_TRUE(webhook.requests().empty());
    EXPECT_NE(out.str().find("App Store Download Units Summary"), std::string::npos);
}
