#pragma once

#include "search/scroll_search.h"

#include <memory>
#include <optional>
#include <string>

namespace searchlink::search {

/**
 * Owns one scroll cursor from beginSearch to clearScroll
 *
 * Usage:
 *   ScrollSession session(protocol, options);
 *   while (true) {
 *       auto batch = session.next();
 *       if (batch.empty()) break;
 *       ...
 *   }
 *   session.close();
 *
 * Not thread-safe; a session must be driven by one caller at a time.
 */
class ScrollSession {
public:
    /**
     * Opens the scroll (runs beginSearch)
     */
    ScrollSession(std::shared_ptr<const ScrollSearchProtocol> protocol, const SearchRequestOptions& options);

    ~ScrollSession();

    ScrollSession(const ScrollSession&) = delete;
    ScrollSession& operator=(const ScrollSession&) = delete;
    ScrollSession(ScrollSession&& other) noexcept;
    ScrollSession& operator=(ScrollSession&& other) noexcept;

    /**
     * Next batch of hits; the first call returns the initial batch.
     * An empty batch means the scroll is exhausted.
     */
    std::vector<SearchHit> next();

    /**
     * Clear the cursor now, reporting failures
     * @throws ConnectionException
     */
    void close();

    bool isOpen() const { return scroll_id_.has_value(); }
    uint64_t totalHits() const { return total_hits_; }
    uint64_t fetchedHits() const { return fetched_hits_; }
    const std::optional<std::string>& scrollId() const { return scroll_id_; }

private:
    std::shared_ptr<const ScrollSearchProtocol> protocol_;
    std::optional<std::string> scroll_id_;
    std::optional<std::vector<SearchHit>> initial_batch_;
    uint64_t total_hits_ = 0;
    uint64_t fetched_hits_ = 0;

    void releaseQuietly() noexcept;
};

} // namespace searchlink::search
