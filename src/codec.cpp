#include "unitpulse/codec.hpp"
#include <openssl/evp.h>
#include <zlib.h>
#include <algorithm>
#include <memory>

namespace unitpulse {

namespace {

constexpr std::string_view kReplacementChar = "\xEF\xBF\xBD";

struct InflateGuard {
    z_stream* zs;
    ~InflateGuard() { inflateEnd(zs); }
};

} // namespace

std::optional<std::string> base64_decode(std::string_view in) {
    std::unique_ptr<EVP_ENCODE_CTX, decltype(&EVP_ENCODE_CTX_free)> ctx(
        EVP_ENCODE_CTX_new(), EVP_ENCODE_CTX_free);
    if (!ctx) return std::nullopt;

    EVP_DecodeInit(ctx.get());

    // Decoded output never exceeds the input; the slack covers the final block.
    std::string out(in.size() + 80, '\0');
    auto* dst = reinterpret_cast<unsigned char*>(out.data());
    int len = 0;
    if (EVP_DecodeUpdate(ctx.get(), dst, &len,
                         reinterpret_cast<const unsigned char*>(in.data()),
                         static_cast<int>(in.size())) < 0) {
        return std::nullopt;
    }

    int tail = 0;
    if (EVP_DecodeFinal(ctx.get(), dst + len, &tail) < 0) return std::nullopt;

    out.resize(static_cast<size_t>(len + tail));
    return out;
}

std::string base64url_encode(std::string_view bytes) {
    std::string out(4 * ((bytes.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()),
                              reinterpret_cast<const unsigned char*>(bytes.data()),
                              static_cast<int>(bytes.size()));
    out.resize(static_cast<size_t>(len));

    while (!out.empty() && out.back() == '=') out.pop_back();
    std::ranges::replace(out, '+', '-');
    std::ranges::replace(out, '/', '_');
    return out;
}

std::optional<std::string> base64url_decode(std::string_view in) {
    std::string std_b64(in);
    std::ranges::replace(std_b64, '-', '+');
    std::ranges::replace(std_b64, '_', '/');
    while (std_b64.size() % 4 != 0) std_b64.push_back('=');
    return base64_decode(std_b64);
}

bool is_gzip(std::string_view bytes) {
    return bytes.size() >= 2 &&
           static_cast<unsigned char>(bytes[0]) == 0x1f &&
           static_cast<unsigned char>(bytes[1]) == 0x8b;
}

std::optional<std::string> gunzip(std::string_view bytes) {
    z_stream zs{};
    // 16 + MAX_WBITS: expect a gzip header and trailer.
    if (inflateInit2(&zs, 16 + MAX_WBITS) != Z_OK) return std::nullopt;
    InflateGuard guard{&zs};

    zs.next_in = reinterpret_cast<Bytef*>(const_cast<char*>(bytes.data()));
    zs.avail_in = static_cast<uInt>(bytes.size());

    std::string out;
    char buf[16384];

    for (;;) {
        zs.next_out = reinterpret_cast<Bytef*>(buf);
        zs.avail_out = sizeof(buf);

        int ret = inflate(&zs, Z_NO_FLUSH);
        if (ret != Z_OK && ret != Z_STREAM_END) return std::nullopt;

        out.append(buf, sizeof(buf) - zs.avail_out);

        if (ret == Z_STREAM_END) {
            if (zs.avail_in == 0) break;
            std::string_view rest(reinterpret_cast<const char*>(zs.next_in), zs.avail_in);
            if (!is_gzip(rest)) break; // trailing garbage after the last member
            if (inflateReset(&zs) != Z_OK) return std::nullopt;
            continue;
        }

        if (zs.avail_in == 0 && zs.avail_out != 0) return std::nullopt; // truncated
    }

    return out;
}

std::string sanitize_utf8(std::string_view s) {
    std::string out;
    out.reserve(s.size());

    size_t i = 0;
    while (i < s.size()) {
        auto c = static_cast<unsigned char>(s[i]);
        if (c < 0x80) {
            out.push_back(static_cast<char>(c));
            ++i;
            continue;
        }

        size_t need = 0;
        unsigned char lo = 0x80;
        unsigned char hi = 0xBF;
        if (c >= 0xC2 && c <= 0xDF) {
            need = 1;
        } else if (c == 0xE0) {
            need = 2;
            lo = 0xA0;
        } else if ((c >= 0xE1 && c <= 0xEC) || c == 0xEE || c == 0xEF) {
            need = 2;
        } else if (c == 0xED) {
            need = 2;
            hi = 0x9F;
        } else if (c == 0xF0) {
            need = 3;
            lo = 0x90;
        } else if (c >= 0xF1 && c <= 0xF3) {
            need = 3;
        } else if (c == 0xF4) {
            need = 3;
            hi = 0x8F;
        } else {
            out.append(kReplacementChar);
            ++i;
            continue;
        }

        // Longest valid prefix of the sequence; a broken one becomes a
        // single replacement character.
        size_t j = 1;
        for (; j <= need && i + j < s.size(); ++j) {
            auto cc = static_cast<unsigned char>(s[i + j]);
            auto min = j == 1 ? lo : static_cast<unsigned char>(0x80);
            auto max = j == 1 ? hi : static_cast<unsigned char>(0xBF);
            if (cc < min || cc > max) break;
        }

        if (j > need) {
            out.append(s.substr(i, need + 1));
            i += need + 1;
        } else {
            out.append(kReplacementChar);
            i += j;
        }
    }

    return out;
}

std::expected<DecodedReport, std::string> decode_report_content(std::string_view b64) {
    auto raw = base64_decode(b64);
    if (!raw) return std::unexpected(std::string("reportContent is not valid base64"));

    DecodedReport report;
    if (is_gzip(*raw)) {
        report.compressed = true;
        if (auto inflated = gunzip(*raw)) {
            report.text = sanitize_utf8(*inflated);
            return report;
        }
        report.inflate_failed = true;
    }

    report.text = sanitize_utf8(*raw);
    return report;
}

} // namespace unitpulse
