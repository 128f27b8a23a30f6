#pragma once

#include <stdexcept>
#include <string>

namespace searchlink {

/**
 * @brief Error categories surfaced by the search cluster client
 */
enum class ErrorCode {
    CONNECTION_ERROR,            // Transport failure (I/O, unreachable host, timeout)
    INVALID_RESPONSE,            // Payload received but not decodable
    QUERY_FAILURE,               // Cluster rejected the query (user-actionable)
    SSL_INITIALIZATION_FAILURE   // TLS context could not be built
};

const char* errorCodeName(ErrorCode code);

/**
 * @brief Base class of every failure thrown by the client
 *
 * The underlying cause, when there is one, is attached with
 * std::throw_with_nested and can be walked with std::rethrow_if_nested.
 */
class ClientException : public std::runtime_error {
public:
    ClientException(ErrorCode code, const std::string& message)
        : std::runtime_error(std::string(errorCodeName(code)) + ": " + message)
        , code_(code)
    {}

    ErrorCode code() const { return code_; }

private:
    ErrorCode code_;
};

class ConnectionException : public ClientException {
public:
    explicit ConnectionException(const std::string& message)
        : ClientException(ErrorCode::CONNECTION_ERROR, message)
    {}
};

class InvalidResponseException : public ClientException {
public:
    explicit InvalidResponseException(const std::string& message)
        : ClientException(ErrorCode::INVALID_RESPONSE, message)
    {}
};

/**
 * @brief Query rejected by the cluster, carrying the cluster's reason verbatim
 */
class QueryFailureException : public ClientException {
public:
    explicit QueryFailureException(const std::string& reason)
        : ClientException(ErrorCode::QUERY_FAILURE, reason)
        , reason_(reason)
    {}

    const std::string& reason() const { return reason_; }

private:
    std::string reason_;
};

class SslInitializationException : public ClientException {
public:
    explicit SslInitializationException(const std::string& message)
        : ClientException(ErrorCode::SSL_INITIALIZATION_FAILURE, message)
    {}
};

/**
 * @brief A key-store certificate is outside its validity window
 */
class CertificateValidityException : public SslInitializationException {
public:
    enum class Check { EXPIRED, NOT_YET_VALID };

    CertificateValidityException(Check check, const std::string& detail)
        : SslInitializationException(
              (check == Check::EXPIRED ? "KeyStore certificate is expired: "
                                       : "KeyStore certificate is not yet valid: ") + detail)
        , check_(check)
    {}

    Check check() const { return check_; }

private:
    Check check_;
};

} // namespace searchlink
