#pragma once

#include "unitpulse/types.hpp"
#include <chrono>
#include <expected>
#include <functional>
#include <memory>
#include <string>

#include <openssl/types.h>

namespace unitpulse {

inline constexpr std::string_view kTokenAudience = "appstoreconnect-v1";
// The API rejects tokens living longer than 20 minutes.
inline constexpr auto kTokenLifetime = std::chrono::minutes(15);

struct SignerError {
    std::string message;
};

// Mints ES256 JWTs for App Store Connect. Immutable after construction and
// safe to share between threads.
class TokenSigner {
public:
    using Clock = std::function<TimePoint()>;

    static std::expected<TokenSigner, SignerError> from_pem(
        std::string issuer_id, std::string key_id, const std::string& pem,
        Clock clock = [] { return std::chrono::system_clock::now(); });

    // Never cache the result; every request gets a fresh token.
    std::expected<Credential, SignerError> sign() const;

    const std::string& key_id() const { return key_id_; }
    const std::string& issuer_id() const { return issuer_id_; }

private:
    TokenSigner(std::string issuer_id, std::string key_id,
                std::shared_ptr<EVP_PKEY> key, Clock clock);

    std::string issuer_id_;
    std::string key_id_;
    std::shared_ptr<EVP_PKEY> key_;
    Clock clock_;
};

// Expands literal "\n" sequences so keys can live on one line in a .env file.
std::string normalize_pem(std::string pem);

} // namespace unitpulse
