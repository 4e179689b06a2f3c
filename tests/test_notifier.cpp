#include <gtest/gtest.h>
#include "fakes.hpp"
#include "unitpulse/notifier.hpp"

using namespace unitpulse;
using namespace unitpulse::test;

namespace {

const std::string kWebhook = "https://discord.com/api/webhooks/123/abc";

} // namespace

TEST(WebhookNotifier, PostsJsonToWebhookPath) {
    FakeTransport transport([](const HttpRequest&) -> HttpResult { return HttpResponse{204, ""}; });
    MemoryLogSink log;
    WebhookNotifier notifier(kWebhook, std::chrono::seconds(15), transport, log);

    EXPECT_TRUE(notifier.send("hello\nworld"));

    auto requests = transport.requests();
    ASSERT_EQ(requests.size(), 1u);
    EXPECT_EQ(requests[0].path, "/api/webhooks/123/abc");
    EXPECT_EQ(requests[0].content_type, "application/json");
    EXPECT_EQ(requests[0].timeout, std::chrono::seconds(15));

    auto body = nlohmann::json::parse(requests[0].body);
    EXPECT_EQ(body["content"].get<std::string>(), "hello\nworld");
    EXPECT_FALSE(body.contains("username"));
}

TEST(WebhookNotifier, IncludesUsernameWhenGiven) {
    auto payload = nlohmann::json::parse(webhook_payload("hi", std::string("unitpulse")));
    EXPECT_EQ(payload["username"].get<std::string>(), "unitpulse");
}

TEST(WebhookNotifier, ClientErrorIsFailure) {
    FakeTransport transport([](const HttpRequest&) -> HttpResult {
        return HttpResponse{400, R"({"message":"Cannot send an empty message"})"};
    });
    MemoryLogSink log;
    WebhookNotifier notifier(kWebhook, std::chrono::seconds(15), transport, log);

    EXPECT_FALSE(notifier.send(""));
    EXPECT_EQ(log.count(LogLevel::Error), 1);
    EXPECT_EQ(transport.requests().size(), 1u);
}

TEST(WebhookNotifier, TransportErrorIsFailure) {
    FakeTransport transport([](const HttpRequest&) -> HttpResult {
        return std::unexpected(TransportError{"Connection failed"});
    });
    MemoryLogSink log;
    WebhookNotifier notifier(kWebhook, std::chrono::seconds(15), transport, log);

    EXPECT_FALSE(notifier.send("x"));
    EXPECT_TRUE(log.contains("Connection failed"));
}

TEST(WebhookNotifier, InvalidUrlIsFailure) {
    FakeTransport transport;
    MemoryLogSink log;
    WebhookNotifier notifier("discord.com/no-scheme", std::chrono::seconds(15), transport, log);

    EXPECT_FALSE(notifier.send("x"));
    EXPECT_TRUE(transport.requests().empty());
}

TEST(SplitUrl, SeparatesOriginAndPath) {
    auto parts = split_url("https://discord.com/api/webhooks/1/x?wait=true");
    ASSERT_TRUE(parts.has_value());
    EXPECT_EQ(parts->origin, "https://discord.com");
    EXPECT_EQ(parts->path, "/api/webhooks/1/x?wait=true");

    auto bare = split_url("http://localhost:8080");
    ASSERT_TRUE(bare.has_value());
    EXPECT_EQ(bare->origin, "http://localhost:8080");
    EXPECT_EQ(bare->path, "/");

    EXPECT_FALSE(split_url("ftp://host/x").has_value());
    EXPECT_FALSE(split_url("https:///x").has_value());
}
