#include "unitpulse/token_signer.hpp"
#include "unitpulse/codec.hpp"
#include <nlohmann/json.hpp>
#include <openssl/bio.h>
#include <openssl/bn.h>
#include <openssl/core_names.h>
#include <openssl/ecdsa.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <array>

namespace unitpulse {

namespace {

constexpr size_t kCoordinateSize = 32; // P-256

std::string openssl_error(const std::string& what) {
    auto code = ERR_get_error();
    if (code == 0) return what;
    char buf[256];
    ERR_error_string_n(code, buf, sizeof(buf));
    return what + ": " + buf;
}

bool is_p256(EVP_PKEY* key) {
    if (EVP_PKEY_get_base_id(key) != EVP_PKEY_EC) return false;

    char group[64] = {};
    size_t len = 0;
    if (EVP_PKEY_get_utf8_string_param(key, OSSL_PKEY_PARAM_GROUP_NAME,
                                       group, sizeof(group), &len) != 1) {
        return false;
    }
    std::string_view name(group, len);
    return name == "prime256v1" || name == "P-256";
}

// ECDSA signatures come out DER-encoded; JWS wants fixed-width r || s.
std::expected<std::string, SignerError> der_to_jose(const unsigned char* der, size_t len) {
    const unsigned char* p = der;
    std::unique_ptr<ECDSA_SIG, decltype(&ECDSA_SIG_free)> sig(
        d2i_ECDSA_SIG(nullptr, &p, static_cast<long>(len)), ECDSA_SIG_free);
    if (!sig) return std::unexpected(SignerError{openssl_error("Bad DER signature")});

    const BIGNUM* r = nullptr;
    const BIGNUM* s = nullptr;
    ECDSA_SIG_get0(sig.get(), &r, &s);

    std::array<unsigned char, 2 * kCoordinateSize> raw{};
    if (BN_bn2binpad(r, raw.data(), kCoordinateSize) < 0 ||
        BN_bn2binpad(s, raw.data() + kCoordinateSize, kCoordinateSize) < 0) {
        return std::unexpected(SignerError{"Signature coordinate too large"});
    }
    return std::string(reinterpret_cast<const char*>(raw.data()), raw.size());
}

} // namespace

std::string normalize_pem(std::string pem) {
    std::string out;
    out.reserve(pem.size());
    for (size_t i = 0; i < pem.size(); ++i) {
        if (pem[i] == '\\' && i + 1 < pem.size() && pem[i + 1] == 'n') {
            out.push_back('\n');
            ++i;
        } else {
            out.push_back(pem[i]);
        }
    }
    return out;
}

TokenSigner::TokenSigner(std::string issuer_id, std::string key_id,
                         std::shared_ptr<EVP_PKEY> key, Clock clock)
    : issuer_id_(std::move(issuer_id)),
      key_id_(std::move(key_id)),
      key_(std::move(key)),
      clock_(std::move(clock)) {}

std::expected<TokenSigner, SignerError> TokenSigner::from_pem(
    std::string issuer_id, std::string key_id, const std::string& pem, Clock clock) {

    auto text = normalize_pem(pem);
    std::unique_ptr<BIO, decltype(&BIO_free)> bio(
        BIO_new_mem_buf(text.data(), static_cast<int>(text.size())), BIO_free);
    if (!bio) return std::unexpected(SignerError{openssl_error("BIO_new_mem_buf failed")});

    std::shared_ptr<EVP_PKEY> key(
        PEM_read_bio_PrivateKey(bio.get(), nullptr, nullptr, nullptr), EVP_PKEY_free);
    if (!key) return std::unexpected(SignerError{openssl_error("Cannot read private key")});

    if (!is_p256(key.get())) {
        return std::unexpected(SignerError{"Private key is not an EC P-256 key"});
    }

    return TokenSigner(std::move(issuer_id), std::move(key_id), std::move(key), std::move(clock));
}

std::expected<Credential, SignerError> TokenSigner::sign() const {
    auto issued_at = std::chrono::time_point_cast<std::chrono::seconds>(clock_());
    auto expires_at = issued_at + kTokenLifetime;

    nlohmann::json header = {
        {"alg", "ES256"},
        {"kid", key_id_},
        {"typ", "JWT"},
    };
    nlohmann::json claims = {
        {"iss", issuer_id_},
        {"exp", expires_at.time_since_epoch().count()},
        {"aud", std::string(kTokenAudience)},
    };

    auto signing_input = base64url_encode(header.dump()) + "." + base64url_encode(claims.dump());

    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), EVP_MD_CTX_free);
    if (!ctx || EVP_DigestSignInit(ctx.get(), nullptr, EVP_sha256(), nullptr, key_.get()) != 1) {
        return std::unexpected(SignerError{openssl_error("EVP_DigestSignInit failed")});
    }

    auto* data = reinterpret_cast<const unsigned char*>(signing_input.data());
    size_t der_len = 0;
    if (EVP_DigestSign(ctx.get(), nullptr, &der_len, data, signing_input.size()) != 1) {
        return std::unexpected(SignerError{openssl_error("EVP_DigestSign failed")});
    }
    std::string der(der_len, '\0');
    if (EVP_DigestSign(ctx.get(), reinterpret_cast<unsigned char*>(der.data()), &der_len,
                       data, signing_input.size()) != 1) {
        return std::unexpected(SignerError{openssl_error("EVP_DigestSign failed")});
    }

    auto raw = der_to_jose(reinterpret_cast<const unsigned char*>(der.data()), der_len);
    if (!raw) return std::unexpected(raw.error());

    return Credential{
        .token = signing_input + "." + base64url_encode(*raw),
        .issued_at = issued_at,
        .expires_at = expires_at,
    };
}

} // namespace unitpulse
