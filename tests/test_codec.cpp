#include <gtest/gtest.h>
#include "fakes.hpp"
#include "unitpulse/codec.hpp"

using namespace unitpulse;
using unitpulse::test::base64_encode;
using unitpulse::test::gzip;

TEST(Codec, Base64DecodesPlainText) {
    auto out = base64_decode("SGVsbG8sIHdvcmxkIQ==");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "Hello, world!");
}

TEST(Codec, Base64ToleratesLineBreaks) {
    auto out = base64_decode("SGVsbG8s\nIHdvcmxk\nIQ==\n");
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "Hello, world!");
}

TEST(Codec, Base64RejectsGarbage) {
    EXPECT_FALSE(base64_decode("not*base64!").has_value());
    EXPECT_FALSE(base64_decode("abc").has_value());
}

TEST(Codec, Base64DecodesBinary) {
    std::string bytes("\x00\x1f\x8b\xff", 4);
    auto out = base64_decode(base64_encode(bytes));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, bytes);
}

TEST(Codec, Base64UrlHasNoPaddingOrUnsafeChars) {
    auto encoded = base64url_encode("\xfb\xff\xfe");
    EXPECT_EQ(encoded, "-__-");

    auto decoded = base64url_decode("-__-");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, "\xfb\xff\xfe");

    EXPECT_EQ(base64url_encode("ab"), "YWI");
}

TEST(Codec, DetectsGzipMagic) {
    EXPECT_TRUE(is_gzip(gzip("payload")));
    EXPECT_FALSE(is_gzip("plain text"));
    EXPECT_FALSE(is_gzip("\x1f"));
}

TEST(Codec, GunzipInflates) {
    std::string text = "Title\tUnits\nA\t42\n";
    auto out = gunzip(gzip(text));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, text);
}

TEST(Codec, GunzipHandlesConcatenatedMembers) {
    auto out = gunzip(gzip("first ") + gzip("second"));
    ASSERT_TRUE(out.has_value());
    EXPECT_EQ(*out, "first second");
}

TEST(Codec, GunzipRejectsTruncatedStream) {
    auto compressed = gzip(std::string(5000, 'x'));
    compressed.resize(compressed.size() / 2);
    EXPECT_FALSE(gunzip(compressed).has_value());
}

TEST(Codec, GunzipRejectsCorruptStream) {
    std::string bogus("\x1f\x8b\x08\x00garbage-not-deflate", 23);
    EXPECT_FALSE(gunzip(bogus).has_value());
}

TEST(Codec, SanitizeKeepsValidUtf8) {
    std::string text = "caf\xc3\xa9 \xe2\x80\xa2 \xf0\x9f\x93\xb1";
    EXPECT_EQ(sanitize_utf8(text), text);
}

TEST(Codec, SanitizeReplacesInvalidBytes) {
    EXPECT_EQ(sanitize_utf8("a\xff" "b"), "a\xef\xbf\xbd" "b");
    // Truncated three-byte sequence collapses to one replacement.
    EXPECT_EQ(sanitize_utf8("a\xe2\x80" "b"), "a\xef\xbf\xbd" "b");
    // Overlong encoding of '/'.
    EXPECT_EQ(sanitize_utf8("\xc0\xaf"), "\xef\xbf\xbd\xef\xbf\xbd");
    // Lone continuation byte at the end.
    EXPECT_EQ(sanitize_utf8("x\x80"), "x\xef\xbf\xbd");
}

TEST(Codec, DecodeReportContentPlain) {
    auto decoded = decode_report_content(base64_encode("Units\n5\n"));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->text, "Units\n5\n");
    EXPECT_FALSE(decoded->compressed);
}

TEST(Codec, DecodeReportContentGzip) {
    auto decoded = decode_report_content(base64_encode(gzip("Units\n5\n")));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->text, "Units\n5\n");
    EXPECT_TRUE(decoded->compressed);
    EXPECT_FALSE(decoded->inflate_failed);
}

TEST(Codec, DecodeReportContentFallsBackToRawBytes) {
    std::string broken = "\x1f\x8bUnits\n5\n";
    auto decoded = decode_report_content(base64_encode(broken));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->inflate_failed);
    EXPECT_EQ(decoded->text, "\x1f\xef\xbf\xbdUnits\n5\n");
}

TEST(Codec, DecodeReportContentRejectsBadBase64) {
    EXPECT_FALSE(decode_report_content("%%%").has_value());
}
