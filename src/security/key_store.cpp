#include "security/key_store.h"
#include "client/errors.h"
#include "utils/logger.h"

#include <algorithm>
#include <fstream>
#include <sstream>

// OpenSSL headers
#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/pem.h>
#include <openssl/pkcs12.h>

namespace searchlink::security {

namespace {
    using BioPtr = std::unique_ptr<BIO, decltype(&BIO_free)>;

    // Helper: Read file contents (binary safe, PKCS#12 is DER)
    std::optional<std::string> readFile(const std::string& path) {
        std::ifstream file(path, std::ios::binary);
        if (!file.is_open()) {
            return std::nullopt;
        }

        std::ostringstream ss;
        ss << file.rdbuf();
        return ss.str();
    }

    BioPtr memoryBio(const std::string& data) {
        return BioPtr(BIO_new_mem_buf(data.data(), static_cast<int>(data.size())), BIO_free);
    }

    // Drains the OpenSSL error queue into one message
    std::string lastOpenSslError() {
        std::string result;
        unsigned long code = 0;
        while ((code = ERR_get_error()) != 0) {
            char buf[256] = {0};
            ERR_error_string_n(code, buf, sizeof(buf));
            if (!result.empty()) {
                result += "; ";
            }
            result += buf;
        }
        return result.empty() ? "unknown error" : result;
    }

    // PEM password callback: never prompts, answers with the configured password only
    int passwordCallback(char* buf, int size, int /*rwflag*/, void* userdata) {
        if (!userdata || size <= 0) {
            return -1;
        }
        const auto* password = static_cast<const std::string*>(userdata);
        int len = static_cast<int>(std::min<size_t>(password->size(), static_cast<size_t>(size)));
        std::copy_n(password->data(), len, buf);
        return len;
    }

    std::vector<CertificatePtr> readCertificates(const std::string& pem) {
        std::vector<CertificatePtr> result;
        BioPtr bio = memoryBio(pem);
        if (!bio) {
            return result;
        }
        while (X509* cert = PEM_read_bio_X509(bio.get(), nullptr, passwordCallback, nullptr)) {
            result.emplace_back(cert, X509_free);
        }
        // End of input leaves PEM_R_NO_START_LINE on the queue
        ERR_clear_error();
        return result;
    }

    // Helper: Convert ASN1_TIME to printable string
    std::string asn1TimeToString(const ASN1_TIME* time) {
        if (!time) return "";

        BioPtr bio(BIO_new(BIO_s_mem()), BIO_free);
        if (!bio) return "";
        ASN1_TIME_print(bio.get(), time);

        char* data = nullptr;
        long len = BIO_get_mem_data(bio.get(), &data);
        return std::string(data, static_cast<size_t>(len));
    }

    std::string aliasOf(X509* cert, const std::string& fallback) {
        int len = 0;
        unsigned char* alias = X509_alias_get0(cert, &len);
        if (!alias || len <= 0) {
            return fallback;
        }
        return std::string(reinterpret_cast<const char*>(alias), static_cast<size_t>(len));
    }
}

const char* keyStoreFormatName(KeyStoreFormat format) {
    switch (format) {
        case KeyStoreFormat::PEM: return "PEM";
        case KeyStoreFormat::PKCS12: return "PKCS12";
    }
    return "unknown";
}

std::vector<CertificatePtr> KeyStore::allCertificates() const {
    std::vector<CertificatePtr> result;
    for (const auto& entry : key_entries) {
        result.insert(result.end(), entry.chain.begin(), entry.chain.end());
    }
    result.insert(result.end(), trusted_certificates.begin(), trusted_certificates.end());
    return result;
}

std::string certificateSubject(X509* cert) {
    if (!cert) return "";
    char buf[512] = {0};
    X509_NAME_oneline(X509_get_subject_name(cert), buf, sizeof(buf));
    return buf;
}

KeyStoreResult readPemKeyStore(const std::string& path, const std::optional<std::string>& key_password) {
    auto data = readFile(path);
    if (!data) {
        return "cannot read " + path;
    }

    auto certs = readCertificates(*data);
    if (certs.empty()) {
        return "no PEM certificate in " + path;
    }

    BioPtr bio = memoryBio(*data);
    if (!bio) {
        return "cannot allocate BIO: " + lastOpenSslError();
    }
    std::string password = key_password.value_or("");
    EVP_PKEY* raw_key = PEM_read_bio_PrivateKey(
        bio.get(), nullptr, passwordCallback, key_password ? &password : nullptr);
    if (!raw_key) {
        return "no readable PEM private key in " + path + ": " + lastOpenSslError();
    }
    PrivateKeyPtr key(raw_key, EVP_PKEY_free);

    // Leaf is the certificate matching the key; the rest of the chain keeps file order
    auto leaf = std::find_if(certs.begin(), certs.end(), [&](const CertificatePtr& cert) {
        return X509_check_private_key(cert.get(), key.get()) == 1;
    });
    ERR_clear_error();
    if (leaf == certs.end()) {
        return "private key in " + path + " does not match any certificate";
    }
    std::rotate(certs.begin(), leaf, leaf + 1);

    KeyStore store;
    store.format = KeyStoreFormat::PEM;
    store.key_entries.push_back(KeyEntry{"key", std::move(key), std::move(certs)});
    return store;
}

KeyStoreResult readPemTrustStore(const std::string& path) {
    auto data = readFile(path);
    if (!data) {
        return "cannot read " + path;
    }

    auto certs = readCertificates(*data);
    if (certs.empty()) {
        return "no PEM certificate in " + path;
    }

    KeyStore store;
    store.format = KeyStoreFormat::PEM;
    store.trusted_certificates = std::move(certs);
    return store;
}

KeyStoreResult readPkcs12Store(const std::string& path, const std::optional<std::string>& password) {
    auto data = readFile(path);
    if (!data) {
        return "cannot read " + path;
    }

    BioPtr bio = memoryBio(*data);
    if (!bio) {
        return "cannot allocate BIO: " + lastOpenSslError();
    }
    std::unique_ptr<PKCS12, decltype(&PKCS12_free)> p12(d2i_PKCS12_bio(bio.get(), nullptr), PKCS12_free);
    if (!p12) {
        return "not a PKCS#12 container: " + lastOpenSslError();
    }

    EVP_PKEY* raw_key = nullptr;
    X509* raw_cert = nullptr;
    STACK_OF(X509)* raw_ca = nullptr;
    if (PKCS12_parse(p12.get(), password ? password->c_str() : nullptr, &raw_key, &raw_cert, &raw_ca) != 1) {
        return "cannot open PKCS#12 container: " + lastOpenSslError();
    }

    PrivateKeyPtr key(raw_key, EVP_PKEY_free);
    CertificatePtr cert(raw_cert, X509_free);
    std::vector<CertificatePtr> others;
    if (raw_ca) {
        for (int i = 0; i < sk_X509_num(raw_ca); ++i) {
            X509* ca = sk_X509_value(raw_ca, i);
            X509_up_ref(ca);
            others.emplace_back(ca, X509_free);
        }
        sk_X509_pop_free(raw_ca, X509_free);
    }

    KeyStore store;
    store.format = KeyStoreFormat::PKCS12;
    if (key && cert) {
        KeyEntry entry;
        entry.alias = aliasOf(cert.get(), "key");
        entry.key = std::move(key);
        entry.chain.push_back(std::move(cert));
        entry.chain.insert(entry.chain.end(), others.begin(), others.end());
        store.key_entries.push_back(std::move(entry));
    } else {
        if (cert) {
            store.trusted_certificates.push_back(std::move(cert));
        }
        store.trusted_certificates.insert(store.trusted_certificates.end(), others.begin(), others.end());
    }
    return store;
}

KeyStore loadKeyStore(const std::string& path, const std::optional<std::string>& password) {
    auto pem = readPemKeyStore(path, password);
    if (auto* store = std::get_if<KeyStore>(&pem)) {
        return std::move(*store);
    }
    const auto& pem_error = std::get<std::string>(pem);
    SEARCHLINK_DEBUG("Key store {} is not PEM ({}), trying PKCS#12", path, pem_error);

    auto p12 = readPkcs12Store(path, password);
    if (auto* store = std::get_if<KeyStore>(&p12)) {
        return std::move(*store);
    }
    throw SslInitializationException("cannot load key store " + path + " (PEM: " + pem_error +
                                     "; PKCS#12: " + std::get<std::string>(p12) + ")");
}

KeyStore loadTrustStore(const std::string& path, const std::optional<std::string>& password) {
    auto pem = readPemTrustStore(path);
    if (auto* store = std::get_if<KeyStore>(&pem)) {
        return std::move(*store);
    }
    const auto& pem_error = std::get<std::string>(pem);
    SEARCHLINK_DEBUG("Trust store {} is not PEM ({}), trying PKCS#12", path, pem_error);

    auto p12 = readPkcs12Store(path, password);
    if (auto* store = std::get_if<KeyStore>(&p12)) {
        return std::move(*store);
    }
    throw SslInitializationException("cannot load trust store " + path + " (PEM: " + pem_error +
                                     "; PKCS#12: " + std::get<std::string>(p12) + ")");
}

void validateCertificates(const KeyStore& store, std::time_t now) {
    for (const auto& entry : store.key_entries) {
        X509* cert = entry.leaf();
        if (!cert) {
            continue;
        }

        const ASN1_TIME* not_before = X509_get0_notBefore(cert);
        const ASN1_TIME* not_after = X509_get0_notAfter(cert);
        int before_cmp = X509_cmp_time(not_before, &now);
        int after_cmp = X509_cmp_time(not_after, &now);
        if (before_cmp == 0 || after_cmp == 0) {
            throw SslInitializationException("unreadable validity period in certificate " +
                                             certificateSubject(cert));
        }

        if (before_cmp > 0) {
            throw CertificateValidityException(
                CertificateValidityException::Check::NOT_YET_VALID,
                "NotBefore: " + asn1TimeToString(not_before) + " (" + certificateSubject(cert) + ")");
        }
        if (after_cmp < 0) {
            throw CertificateValidityException(
                CertificateValidityException::Check::EXPIRED,
                "NotAfter: " + asn1TimeToString(not_after) + " (" + certificateSubject(cert) + ")");
        }
    }
}

void validateCertificates(const KeyStore& store) {
    validateCertificates(store, std::time(nullptr));
}

} // namespace searchlink::security
