#include "security/tls_context_builder.h"
#include "client/errors.h"
#include "utils/logger.h"

#include <boost/asio/ssl.hpp>
#include <openssl/err.h>
#include <openssl/ssl.h>

#include <exception>

namespace ssl = boost::asio::ssl;

namespace searchlink::security {

namespace {
    std::string lastOpenSslError() {
        unsigned long code = ERR_get_error();
        ERR_clear_error();
        if (code == 0) {
            return "unknown error";
        }
        char buf[256] = {0};
        ERR_error_string_n(code, buf, sizeof(buf));
        return buf;
    }

    // Installs the identity of the first key entry; returns the number installed
    size_t installKeyManagers(SSL_CTX* ctx, const KeyStore& key_store) {
        if (key_store.key_entries.empty()) {
            return 0;
        }
        if (key_store.key_entries.size() > 1) {
            SEARCHLINK_WARN("Key store holds {} key entries, using '{}'",
                            key_store.key_entries.size(), key_store.key_entries.front().alias);
        }

        const KeyEntry& entry = key_store.key_entries.front();
        if (SSL_CTX_use_certificate(ctx, entry.leaf()) != 1) {
            throw SslInitializationException("cannot use client certificate: " + lastOpenSslError());
        }
        for (size_t i = 1; i < entry.chain.size(); ++i) {
            if (SSL_CTX_add1_chain_cert(ctx, entry.chain[i].get()) != 1) {
                throw SslInitializationException("cannot add chain certificate: " + lastOpenSslError());
            }
        }
        if (SSL_CTX_use_PrivateKey(ctx, entry.key.get()) != 1) {
            throw SslInitializationException("cannot use private key: " + lastOpenSslError());
        }
        if (SSL_CTX_check_private_key(ctx) != 1) {
            throw SslInitializationException("private key does not match certificate: " + lastOpenSslError());
        }
        return 1;
    }

    // The single X.509 trust manager: one certificate store holding every anchor
    size_t installTrustManager(SSL_CTX* ctx, const KeyStore& trust_store) {
        auto anchors = trust_store.allCertificates();
        if (anchors.empty()) {
            throw SslInitializationException("Unexpected default trust managers: trust store holds no certificates");
        }

        X509_STORE* store = X509_STORE_new();
        if (!store) {
            throw SslInitializationException("cannot allocate certificate store: " + lastOpenSslError());
        }
        for (const auto& cert : anchors) {
            if (X509_STORE_add_cert(store, cert.get()) != 1) {
                X509_STORE_free(store);
                throw SslInitializationException("cannot add trust anchor " + certificateSubject(cert.get()) +
                                                 ": " + lastOpenSslError());
            }
        }
        // Context takes ownership of the store
        SSL_CTX_set_cert_store(ctx, store);
        return anchors.size();
    }
}

std::optional<TlsContext> TlsContextBuilder::build(const SecurityMaterial& material) {
    return build(material, std::time(nullptr));
}

std::optional<TlsContext> TlsContextBuilder::build(const SecurityMaterial& material, std::time_t now) {
    if (!material.keystore_path && !material.truststore_path) {
        return std::nullopt;
    }

    TlsContext result;

    // load KeyStore if configured
    std::optional<KeyStore> key_store;
    if (material.keystore_path) {
        key_store = loadKeyStore(*material.keystore_path, material.keystore_password);
        validateCertificates(*key_store, now);
        result.keystore_format = key_store->format;
        // PEM passwords protect only the key, never the store itself
        result.store_password_used = key_store->format == KeyStoreFormat::PKCS12 &&
                                     material.keystore_password.has_value();
    }

    // load TrustStore if configured, otherwise use KeyStore
    KeyStore trust_store = material.truststore_path
        ? loadTrustStore(*material.truststore_path, material.truststore_password)
        : *key_store;
    result.truststore_format = trust_store.format;

    try {
        result.context = std::make_shared<ssl::context>(ssl::context::tls_client);
        result.context->set_options(
            ssl::context::default_workarounds |
            ssl::context::no_sslv2 |
            ssl::context::no_sslv3 |
            ssl::context::no_tlsv1 |
            ssl::context::no_tlsv1_1
        );
    } catch (const boost::system::system_error& e) {
        std::throw_with_nested(SslInitializationException(std::string("cannot create TLS context: ") + e.what()));
    }

    SSL_CTX* native = result.context->native_handle();
    if (key_store) {
        result.key_manager_count = installKeyManagers(native, *key_store);
    }
    result.trust_anchor_count = installTrustManager(native, trust_store);
    result.context->set_verify_mode(ssl::verify_peer);

    SEARCHLINK_INFO("TLS context initialized (key store: {}, trust store: {}, identities: {}, trust anchors: {})",
                    key_store ? keyStoreFormatName(key_store->format) : "none",
                    keyStoreFormatName(trust_store.format),
                    result.key_manager_count, result.trust_anchor_count);
    return result;
}

} // namespace searchlink::security
