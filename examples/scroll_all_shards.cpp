#include "client/search_cluster_client.h"
#include "client/errors.h"
#include "utils/logger.h"

#include <cstdlib>
#include <iostream>
#include <vector>

using namespace searchlink;

// Usage: scroll_all_shards <config.yaml> [index]
// Log level from SEARCHLINK_LOG_LEVEL (default info)
int main(int argc, char** argv) {
    if (argc < 2) {
        std::cerr << "usage: " << argv[0] << " <config.yaml> [index]" << std::endl;
        return 2;
    }

    utils::Logger::Options log_options;
    if (const char* level = std::getenv("SEARCHLINK_LOG_LEVEL")) {
        if (auto parsed = utils::Logger::levelFromString(level)) {
            log_options.level = *parsed;
        } else {
            std::cerr << "ignoring unknown SEARCHLINK_LOG_LEVEL '" << level << "'" << std::endl;
        }
    }
    utils::Logger::init(log_options);

    try {
        auto config = client::ClientConfig::loadFromYaml(argv[1]);
        client::SearchClusterClient es(config);

        auto indexes = es.getIndexes();
        std::cout << "=== Indexes (" << indexes.size() << ") ===" << std::endl;
        for (const auto& name : indexes) {
            std::cout << "  " << name << std::endl;
        }

        std::string index = argc > 2 ? argv[2] : (indexes.empty() ? "" : indexes.front());
        if (index.empty()) {
            std::cout << "No index to scroll" << std::endl;
            return 0;
        }

        auto metadata = es.getIndexMetadata(index);
        std::cout << "Index " << index << " has " << metadata.schema.fields.size() << " top-level field(s)" << std::endl;

        uint64_t total = 0;
        for (const auto& assignment : es.getSearchShards(index)) {
            search::SearchRequestOptions options;
            options.index = index;
            options.shard = assignment.shard;
            options.query = search::json{{"match_all", search::json::object()}};
            options.fields = std::vector<std::string>{};

            auto session = es.openScroll(options);
            while (true) {
                auto batch = session.next();
                if (batch.empty()) break;
            }
            session.close();

            std::cout << "Shard " << assignment.shard << " @ " << assignment.node_address
                      << ": " << session.fetchedHits() << " hit(s)" << std::endl;
            total += session.fetchedHits();
        }
        std::cout << "Total: " << total << " hit(s)" << std::endl;

        es.close();
    } catch (const ClientException& e) {
        SEARCHLINK_ERROR("{}", e.what());
        utils::Logger::shutdown();
        return 1;
    } catch (const std::exception& e) {
        SEARCHLINK_ERROR("Unexpected error: {}", e.what());
        utils::Logger::shutdown();
        return 1;
    }

    utils::Logger::shutdown();
    return 0;
}
