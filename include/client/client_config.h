#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace searchlink::client {

using json = nlohmann::json;

/**
 * @brief Connection settings of the search cluster client
 *
 * Immutable once handed to SearchClusterClient.
 */
struct ClientConfig {
    std::string host = "localhost";                     // Seed host, replaced by discovered data nodes
    int port = 9200;
    bool tls_enabled = false;

    std::chrono::milliseconds connect_timeout{1000};
    std::chrono::milliseconds request_timeout{10000};   // Socket/read deadline per request
    std::chrono::milliseconds max_retry_time{30000};    // Failover budget across hosts

    size_t scroll_size = 1000;                          // Hits per scroll page
    std::chrono::milliseconds scroll_timeout{60000};    // Scroll lease duration

    bool verify_hostnames = true;
    size_t max_connections_per_host = 10;

    std::optional<std::string> keystore_path;
    std::optional<std::string> keystore_password;
    std::optional<std::string> truststore_path;
    std::optional<std::string> truststore_password;

    /**
     * "https" when TLS is enabled, "http" otherwise
     */
    std::string scheme() const { return tls_enabled ? "https" : "http"; }

    /**
     * Human-readable list of problems; empty when the configuration is usable
     */
    std::vector<std::string> validate() const;

    /**
     * Load from a YAML file; settings may sit under an "elasticsearch" section
     * @throws std::invalid_argument if the file cannot be read or a value has the wrong type
     */
    static ClientConfig loadFromYaml(const std::string& yaml_path);

    /**
     * Load from JSON (same keys as YAML)
     * @throws std::invalid_argument if a value has the wrong type
     */
    static ClientConfig fromJson(const json& j);

    /**
     * Serialize to JSON (passwords masked)
     */
    json toJson() const;
};

} // namespace searchlink::client
