#pragma once

#include <ctime>
#include <memory>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <openssl/evp.h>
#include <openssl/x509.h>

namespace searchlink::security {

using CertificatePtr = std::shared_ptr<X509>;
using PrivateKeyPtr = std::shared_ptr<EVP_PKEY>;

enum class KeyStoreFormat {
    PEM,      // Plain-text certificate chain (+ private key)
    PKCS12    // Password-protected binary container
};

const char* keyStoreFormatName(KeyStoreFormat format);

/**
 * Private key with its certificate chain (leaf first)
 */
struct KeyEntry {
    std::string alias;
    PrivateKeyPtr key;
    std::vector<CertificatePtr> chain;

    X509* leaf() const { return chain.empty() ? nullptr : chain.front().get(); }
};

/**
 * In-memory key material loaded from a PEM file or a PKCS#12 container
 */
struct KeyStore {
    KeyStoreFormat format = KeyStoreFormat::PEM;
    std::vector<KeyEntry> key_entries;                  // Identity entries
    std::vector<CertificatePtr> trusted_certificates;   // Certificate-only entries

    /**
     * Every certificate in the store: key entry chains, then trusted entries
     */
    std::vector<CertificatePtr> allCertificates() const;

    bool empty() const { return key_entries.empty() && trusted_certificates.empty(); }
};

/**
 * Result of one parsing attempt: the store, or why parsing failed
 */
using KeyStoreResult = std::variant<KeyStore, std::string>;

/**
 * Read a PEM certificate chain plus private key from one file.
 * The password only decrypts the private key.
 */
KeyStoreResult readPemKeyStore(const std::string& path, const std::optional<std::string>& key_password);

/**
 * Read a PEM certificate chain as trust anchors; an empty chain is an error
 */
KeyStoreResult readPemTrustStore(const std::string& path);

/**
 * Read a PKCS#12 container opened with the given password
 */
KeyStoreResult readPkcs12Store(const std::string& path, const std::optional<std::string>& password);

/**
 * Load a key store: PEM first, PKCS#12 on any PEM failure
 * @throws SslInitializationException when neither format can be read
 */
KeyStore loadKeyStore(const std::string& path, const std::optional<std::string>& password);

/**
 * Load a trust store: PEM chain first, PKCS#12 on any PEM failure
 * @throws SslInitializationException when neither format can be read
 */
KeyStore loadTrustStore(const std::string& path, const std::optional<std::string>& password);

/**
 * Check that every key entry certificate is valid at the given time
 * @throws CertificateValidityException naming the failed check
 */
void validateCertificates(const KeyStore& store, std::time_t now);
void validateCertificates(const KeyStore& store);

/**
 * Subject of a certificate in one-line form (for logs and messages)
 */
std::string certificateSubject(X509* cert);

} // namespace searchlink::security
