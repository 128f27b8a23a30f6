#pragma once

#include "cluster/index_metadata.h"
#include "transport/transport.h"

#include <memory>
#include <string>
#include <vector>

namespace searchlink::cluster {

/**
 * Read-only view of the indexes of the cluster
 */
class IndexCatalog {
public:
    explicit IndexCatalog(std::shared_ptr<transport::Transport> transport);

    /**
     * All index names, ascending
     */
    std::vector<std::string> getIndexes() const;

    /**
     * Field schema of an index (or alias)
     */
    IndexMetadata getIndexMetadata(const std::string& index) const;

private:
    std::shared_ptr<transport::Transport> transport_;
};

} // namespace searchlink::cluster
