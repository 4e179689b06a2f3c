#include "unitpulse/api_client.hpp"
#include <algorithm>

namespace unitpulse {

namespace {

std::string safe_str(const nlohmann::json& j, const std::string& key,
                     const std::string& fallback = "") {
    if (j.contains(key) && !j[key].is_null() && j[key].is_string())
        return j[key].get<std::string>();
    return fallback;
}

std::string error_detail(const std::string& body) {
    auto err_json = nlohmann::json::parse(body, nullptr, false);
    if (err_json.is_discarded()) return "";
    if (err_json.contains("errors") && err_json["errors"].is_array() &&
        !err_json["errors"].empty() && err_json["errors"][0].is_object()) {
        auto& first = err_json["errors"][0];
        auto detail = safe_str(first, "detail");
        return detail.empty() ? safe_str(first, "title") : detail;
    }
    return "";
}

} // namespace

std::expected<nlohmann::json, ApiError> fetch_endpoint(
    const ApiContext& ctx, const std::string& path, const QueryParams& params) {

    constexpr int max_retries = 3;
    for (int attempt = 0; attempt < max_retries; ++attempt) {
        ctx.limiter.wait_for_slot();

        auto credential = ctx.signer.sign();
        if (!credential) {
            return std::unexpected(ApiError{ApiError::Kind::Auth, 0, credential.error().message});
        }

        HttpRequest request{
            .path = path,
            .params = params,
            .headers = {
                {"Authorization", "Bearer " + credential->token},
                {"Accept", "application/json"},
            },
            .timeout = ctx.config.timeout,
        };

        auto res = ctx.transport.get(request);
        if (!res) {
            return std::unexpected(ApiError{ApiError::Kind::Transport, 0, res.error().message});
        }

        if (res->status == 429) {
            if (attempt + 1 < max_retries) {
                ctx.limiter.pause(std::chrono::seconds(2 * (attempt + 1)));
            }
            continue;
        }

        if (res->status < 200 || res->status >= 300) {
            std::string msg = "HTTP " + std::to_string(res->status);
            auto detail = error_detail(res->body);
            if (!detail.empty()) msg += ": " + detail;
            return std::unexpected(ApiError{ApiError::Kind::Http, res->status, msg});
        }

        auto body = nlohmann::json::parse(res->body, nullptr, false);
        if (body.is_discarded()) {
            return std::unexpected(ApiError{ApiError::Kind::Parse, res->status, "Response is not valid JSON"});
        }
        return body;
    }

    return std::unexpected(ApiError{ApiError::Kind::Http, 429, "Rate limited after retries"});
}

std::vector<std::string> parse_vendor_numbers(const nlohmann::json& body) {
    std::vector<std::string> numbers;
    if (!body.contains("data") || !body["data"].is_array()) return numbers;

    for (auto& item : body["data"]) {
        if (!item.is_object() || !item.contains("attributes") || !item["attributes"].is_object())
            continue;
        auto number = safe_str(item["attributes"], "vendorNumber");
        if (!number.empty()) numbers.push_back(std::move(number));
    }
    return numbers;
}

std::expected<void, VendorCheckError> verify_vendor(const ApiContext& ctx) {
    auto result = fetch_endpoint(ctx, std::string(kVendorsPath));
    if (!result) {
        auto& err = result.error();
        auto kind = err.status_code == 403 ? VendorCheckError::Kind::Forbidden
                                           : VendorCheckError::Kind::RequestFailed;
        return std::unexpected(VendorCheckError{kind, err.status_code, err.message});
    }

    auto numbers = parse_vendor_numbers(*result);
    if (std::ranges::find(numbers, ctx.config.vendor_number) == numbers.end()) {
        return std::unexpected(VendorCheckError{
            VendorCheckError::Kind::NotListed, 200,
            "Vendor " + ctx.config.vendor_number + " not among " +
                std::to_string(numbers.size()) + " accessible vendors"});
    }
    return {};
}

} // namespace unitpulse
