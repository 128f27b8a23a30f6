#include "client/client_config.h"
#include "utils/logger.h"

#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace searchlink::client {

namespace {
    // Present keys must convert
    template <typename T>
    void read(const YAML::Node& node, const char* key, T& target) {
        if (node[key]) {
            target = node[key].as<T>();
        }
    }

    void readMillis(const YAML::Node& node, const char* key, std::chrono::milliseconds& target) {
        if (node[key]) {
            target = std::chrono::milliseconds(node[key].as<int64_t>());
        }
    }

    template <typename T>
    void readOptional(const YAML::Node& node, const char* key, std::optional<T>& target) {
        if (node[key] && !node[key].IsNull()) {
            target = node[key].as<T>();
        }
    }

    void readOptional(const json& j, const char* key, std::optional<std::string>& target) {
        if (j.contains(key) && !j.at(key).is_null()) {
            target = j.at(key).get<std::string>();
        }
    }
}

std::vector<std::string> ClientConfig::validate() const {
    std::vector<std::string> problems;

    if (host.empty()) {
        problems.push_back("host must not be empty");
    }
    if (port < 1 || port > 65535) {
        problems.push_back("port must be between 1 and 65535, got " + std::to_string(port));
    }
    if (scroll_size == 0) {
        problems.push_back("scroll_size must be positive");
    }
    if (connect_timeout.count() <= 0) {
        problems.push_back("connect_timeout must be positive");
    }
    if (request_timeout.count() <= 0) {
        problems.push_back("request_timeout must be positive");
    }
    if (max_retry_time.count() <= 0) {
        problems.push_back("max_retry_time must be positive");
    }
    if (scroll_timeout.count() <= 0) {
        problems.push_back("scroll_timeout must be positive");
    }
    if (max_connections_per_host == 0) {
        problems.push_back("max_connections_per_host must be positive");
    }
    if (keystore_password && !keystore_path) {
        problems.push_back("keystore_password is set without keystore_path");
    }
    if (truststore_password && !truststore_path) {
        problems.push_back("truststore_password is set without truststore_path");
    }
    return problems;
}

ClientConfig ClientConfig::loadFromYaml(const std::string& yaml_path) {
    YAML::Node loaded;
    try {
        loaded = YAML::LoadFile(yaml_path);
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument("cannot load client configuration from " + yaml_path + ": " + e.what());
    }

    const YAML::Node& root = loaded;
    ClientConfig result;

    try {
        const YAML::Node config = root["elasticsearch"] ? root["elasticsearch"] : root;

        read(config, "host", result.host);
        read(config, "port", result.port);
        read(config, "tls_enabled", result.tls_enabled);

        readMillis(config, "connect_timeout_ms", result.connect_timeout);
        readMillis(config, "request_timeout_ms", result.request_timeout);
        readMillis(config, "max_retry_time_ms", result.max_retry_time);

        read(config, "scroll_size", result.scroll_size);
        readMillis(config, "scroll_timeout_ms", result.scroll_timeout);

        read(config, "verify_hostnames", result.verify_hostnames);
        read(config, "max_connections_per_host", result.max_connections_per_host);

        readOptional(config, "keystore_path", result.keystore_path);
        readOptional(config, "keystore_password", result.keystore_password);
        readOptional(config, "truststore_path", result.truststore_path);
        readOptional(config, "truststore_password", result.truststore_password);
    } catch (const YAML::Exception& e) {
        throw std::invalid_argument("invalid client configuration in " + yaml_path + ": " + e.what());
    }

    SEARCHLINK_INFO("Loaded client configuration from {}", yaml_path);
    return result;
}

ClientConfig ClientConfig::fromJson(const json& j) {
    ClientConfig result;

    try {
        result.host = j.value("host", result.host);
        result.port = j.value("port", result.port);
        result.tls_enabled = j.value("tls_enabled", result.tls_enabled);

        result.connect_timeout = std::chrono::milliseconds(
            j.value("connect_timeout_ms", result.connect_timeout.count()));
        result.request_timeout = std::chrono::milliseconds(
            j.value("request_timeout_ms", result.request_timeout.count()));
        result.max_retry_time = std::chrono::milliseconds(
            j.value("max_retry_time_ms", result.max_retry_time.count()));

        result.scroll_size = j.value("scroll_size", result.scroll_size);
        result.scroll_timeout = std::chrono::milliseconds(
            j.value("scroll_timeout_ms", result.scroll_timeout.count()));

        result.verify_hostnames = j.value("verify_hostnames", result.verify_hostnames);
        result.max_connections_per_host = j.value("max_connections_per_host", result.max_connections_per_host);

        readOptional(j, "keystore_path", result.keystore_path);
        readOptional(j, "keystore_password", result.keystore_password);
        readOptional(j, "truststore_path", result.truststore_path);
        readOptional(j, "truststore_password", result.truststore_password);
    } catch (const json::exception& e) {
        throw std::invalid_argument(std::string("invalid client configuration: ") + e.what());
    }

    return result;
}

json ClientConfig::toJson() const {
    json j;

    j["host"] = host;
    j["port"] = port;
    j["tls_enabled"] = tls_enabled;
    j["connect_timeout_ms"] = connect_timeout.count();
    j["request_timeout_ms"] = request_timeout.count();
    j["max_retry_time_ms"] = max_retry_time.count();
    j["scroll_size"] = scroll_size;
    j["scroll_timeout_ms"] = scroll_timeout.count();
    j["verify_hostnames"] = verify_hostnames;
    j["max_connections_per_host"] = max_connections_per_host;

    if (keystore_path) {
        j["keystore_path"] = *keystore_path;
    }
    if (truststore_path) {
        j["truststore_path"] = *truststore_path;
    }

    // Mask passwords
    if (keystore_password) {
        j["keystore_password"] = "***";
    }
    if (truststore_password) {
        j["truststore_password"] = "***";
    }

    return j;
}

} // namespace searchlink::client
