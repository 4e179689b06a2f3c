#pragma once

#include <expected>
#include <optional>
#include <string>
#include <string_view>

namespace unitpulse {

std::optional<std::string> base64_decode(std::string_view in);
std::string base64url_encode(std::string_view bytes);
std::optional<std::string> base64url_decode(std::string_view in);

bool is_gzip(std::string_view bytes);

// Inflates a gzip stream (concatenated members included). nullopt on
// corrupt or truncated input.
std::optional<std::string> gunzip(std::string_view bytes);

// Replaces every ill-formed UTF-8 sequence with U+FFFD.
std::string sanitize_utf8(std::string_view bytes);

struct DecodedReport {
    std::string text;
    bool compressed = false;
    bool inflate_failed = false; // text holds the raw bytes instead
};

// base64 -> optional gunzip -> UTF-8 text. Only a bad base64 payload is an
// error; a broken gzip stream falls back to the undecompressed bytes.
std::expected<DecodedReport, std::string> decode_report_content(std::string_view b64);

} // namespace unitpulse
