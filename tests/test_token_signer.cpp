#include <gtest/gtest.h>
#include "fakes.hpp"
#include "unitpulse/codec.hpp"
#include "unitpulse/token_signer.hpp"
#include <openssl/bn.h>
#include <openssl/ecdsa.h>

using namespace unitpulse;
using namespace std::chrono;

namespace {

const TimePoint kNow = system_clock::from_time_t(1760000000);

std::vector<std::string> split_token(const std::string& token) {
    std::vector<std::string> parts;
    size_t start = 0;
    for (;;) {
        auto dot = token.find('.', start);
        parts.push_back(token.substr(start, dot == std::string::npos ? std::string::npos : dot - start));
        if (dot == std::string::npos) break;
        start = dot + 1;
    }
    return parts;
}

nlohmann::json decode_segment(const std::string& segment) {
    auto raw = base64url_decode(segment);
    EXPECT_TRUE(raw.has_value());
    return nlohmann::json::parse(raw.value_or("{}"));
}

bool verify_es256(const std::string& pem, const std::string& signing_input,
                  const std::string& raw_sig) {
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(pem.data(), static_cast<int>(pem.size())), BIO_free);
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(
        PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!key || raw_sig.size() != 64) return false;

    auto* bytes = reinterpret_cast<const unsigned char*>(raw_sig.data());
    ECDSA_SIG* sig = ECDSA_SIG_new();
    ECDSA_SIG_set0(sig, BN_bin2bn(bytes, 32, nullptr), BN_bin2bn(bytes + 32, 32, nullptr));
    unsigned char* der = nullptr;
    int der_len = i2d_ECDSA_SIG(sig, &der);
    ECDSA_SIG_free(sig);

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    EVP_DigestVerifyInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key.get());
    int ok = EVP_DigestVerify(ctx.get(), der, static_cast<size_t>(der_len),
                              reinterpret_cast<const unsigned char*>(signing_input.data()),
                              signing_input.size());
    OPENSSL_free(der);
    return ok == 1;
}

TokenSigner make_signer(TokenSigner::Clock clock = [] { return kNow; }) {
    auto signer = TokenSigner::from_pem("issuer-123", "KEY456",
                                        unitpulse::test::test_key_pem(), std::move(clock));
    EXPECT_TRUE(signer.has_value()) << signer.error().message;
    return *signer;
}

} // namespace

TEST(TokenSigner, ProducesThreeSegmentJwt) {
    auto credential = make_signer().sign();
    ASSERT_TRUE(credential.has_value());
    EXPECT_EQ(split_token(credential->token).size(), 3u);
}

TEST(TokenSigner, HeaderCarriesKeyIdAndType) {
    auto credential = make_signer().sign();
    ASSERT_TRUE(credential.has_value());

    auto header = decode_segment(split_token(credential->token)[0]);
    EXPECT_EQ(header["alg"].get<std::string>(), "ES256");
    EXPECT_EQ(header["kid"].get<std::string>(), "KEY456");
    EXPECT_EQ(header["typ"].get<std::string>(), "JWT");
}

TEST(TokenSigner, ClaimsExpireFifteenMinutesOut) {
    auto credential = make_signer().sign();
    ASSERT_TRUE(credential.has_value());

    auto claims = decode_segment(split_token(credential->token)[1]);
    EXPECT_EQ(claims["iss"].get<std::string>(), "issuer-123");
    EXPECT_EQ(claims["aud"].get<std::string>(), "appstoreconnect-v1");
    EXPECT_EQ(claims["exp"].get<int64_t>(), 1760000000 + 900);

    EXPECT_EQ(credential->expires_at - credential->issued_at, minutes(15));
    EXPECT_LE(credential->expires_at - credential->issued_at, minutes(20));
}

TEST(TokenSigner, SignatureVerifiesWithKey) {
    auto credential = make_signer().sign();
    ASSERT_TRUE(credential.has_value());

    auto parts = split_token(credential->token);
    auto sig = base64url_decode(parts[2]);
    ASSERT_TRUE(sig.has_value());
    EXPECT_EQ(sig->size(), 64u);
    EXPECT_TRUE(verify_es256(unitpulse::test::test_key_pem(),
                             parts[0] + "." + parts[1], *sig));
}

TEST(TokenSigner, EveryCallMintsAFreshToken) {
    auto now = kNow;
    auto signer = make_signer([&] { return now; });

    auto first = signer.sign();
    now += seconds(30);
    auto second = signer.sign();

    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_NE(first->token, second->token);
    EXPECT_EQ(second->issued_at - first->issued_at, seconds(30));
}

TEST(TokenSigner, AcceptsEscapedNewlinesInPem) {
    std::string escaped;
    for (char c : unitpulse::test::test_key_pem()) {
        if (c == '\n') escaped += "\\n";
        else escaped += c;
    }
    auto signer = TokenSigner::from_pem("iss", "kid", escaped);
    EXPECT_TRUE(signer.has_value());
}

TEST(TokenSigner, RejectsGarbageKey) {
    auto signer = TokenSigner::from_pem("iss", "kid", "not a key");
    ASSERT_FALSE(signer.has_value());
    EXPECT_FALSE(signer.error().message.empty());
}

TEST(TokenSigner, RejectsNonP256Key) {
    std::unique_ptr<EVP_PKEY, decltype(&EVP_PKEY_free)> key(EVP_EC_gen("P-384"), EVP_PKEY_free);
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(BIO_new(BIO_s_mem()), BIO_free);
    PEM_write_bio_PrivateKey(bio.get(), key.get(), nullptr, nullptr, 0, nullptr, nullptr);
    char* data = nullptr;
    long len = BIO_get_mem_data(bio.get(), &data);

    auto signer = TokenSigner::from_pem("iss", "kid", std::string(data, static_cast<size_t>(len)));
    EXPECT_FALSE(signer.has_value());
}

TEST(TokenSigner, NormalizePem) {
    EXPECT_EQ(normalize_pem("a\\nb\\nc"), "a\nb\nc");
    EXPECT_EQ(normalize_pem("a\nb"), "a\nb");
    EXPECT_EQ(normalize_pem("trailing\\"), "trailing\\");
}
