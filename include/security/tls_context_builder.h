#pragma once

#include "security/key_store.h"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>

// Forward declarations to avoid pulling in Boost headers
namespace boost {
namespace asio {
    namespace ssl {
        class context;
    }
}
}

namespace searchlink::security {

/**
 * Certificate sources for the client TLS session
 */
struct SecurityMaterial {
    std::optional<std::string> keystore_path;       // PEM chain + key, or PKCS#12
    std::optional<std::string> keystore_password;   // Decrypts the PEM key / opens the PKCS#12
    std::optional<std::string> truststore_path;     // PEM chain or PKCS#12; defaults to the key store
    std::optional<std::string> truststore_password;
};

/**
 * Initialized client TLS context plus a summary of what went into it
 */
struct TlsContext {
    std::shared_ptr<boost::asio::ssl::context> context;
    size_t key_manager_count = 0;                   // Identities installed (0 without key store)
    size_t trust_anchor_count = 0;                  // Certificates in the single trust store
    std::optional<KeyStoreFormat> keystore_format;
    std::optional<KeyStoreFormat> truststore_format;
    bool store_password_used = false;               // true only when a PKCS#12 key store was opened with a password
};

/**
 * Builds the client TLS context from optional key/trust stores
 *
 * - Key store: PEM first, PKCS#12 fallback; key entry certificates must be
 *   within their validity period
 * - Trust store: PEM chain first, PKCS#12 fallback; no validity check;
 *   the key store doubles as trust store when none is given
 * - Exactly one X.509 trust store is derived; an empty one is rejected
 */
class TlsContextBuilder {
public:
    /**
     * @return nullopt when neither a key store nor a trust store is configured
     * @throws CertificateValidityException if a key store certificate is expired or not yet valid
     * @throws SslInitializationException on any other I/O or cryptographic failure
     */
    static std::optional<TlsContext> build(const SecurityMaterial& material);

    /**
     * Same as build(), validating certificates against a fixed point in time
     */
    static std::optional<TlsContext> build(const SecurityMaterial& material, std::time_t now);
};

} // namespace searchlink::security
