#include "search/scroll_session.h"
#include "client/errors.h"
#include "utils/logger.h"

#include <stdexcept>

namespace searchlink::search {

ScrollSession::ScrollSession(std::shared_ptr<const ScrollSearchProtocol> protocol,
                             const SearchRequestOptions& options)
    : protocol_(std::move(protocol)) {
    if (!protocol_) {
        throw std::invalid_argument("ScrollSession requires a protocol");
    }
    auto response = protocol_->beginSearch(options);
    scroll_id_ = std::move(response.scroll_id);
    total_hits_ = response.total_hits;
    initial_batch_ = std::move(response.hits);
}

ScrollSession::~ScrollSession() {
    releaseQuietly();
}

ScrollSession::ScrollSession(ScrollSession&& other) noexcept
    : protocol_(std::move(other.protocol_)),
      scroll_id_(std::move(other.scroll_id_)),
      initial_batch_(std::move(other.initial_batch_)),
      total_hits_(other.total_hits_),
      fetched_hits_(other.fetched_hits_) {
    other.scroll_id_.reset();
    other.initial_batch_.reset();
}

ScrollSession& ScrollSession::operator=(ScrollSession&& other) noexcept {
    if (this != &other) {
        releaseQuietly();
        protocol_ = std::move(other.protocol_);
        scroll_id_ = std::move(other.scroll_id_);
        initial_batch_ = std::move(other.initial_batch_);
        total_hits_ = other.total_hits_;
        fetched_hits_ = other.fetched_hits_;
        other.scroll_id_.reset();
        other.initial_batch_.reset();
    }
    return *this;
}

std::vector<SearchHit> ScrollSession::next() {
    if (!scroll_id_) {
        throw std::logic_error("scroll session is closed");
    }

    std::vector<SearchHit> batch;
    if (initial_batch_) {
        batch = std::move(*initial_batch_);
        initial_batch_.reset();
    } else {
        auto response = protocol_->nextPage(*scroll_id_);
        scroll_id_ = std::move(response.scroll_id);
        batch = std::move(response.hits);
    }
    fetched_hits_ += batch.size();
    return batch;
}

void ScrollSession::close() {
    if (!scroll_id_) {
        return;
    }
    std::string scroll_id = std::move(*scroll_id_);
    scroll_id_.reset();
    initial_batch_.reset();
    protocol_->clearScroll(scroll_id);
}

void ScrollSession::releaseQuietly() noexcept {
    if (!scroll_id_ || !protocol_) {
        return;
    }
    try {
        close();
    } catch (const ClientException& e) {
        SEARCHLINK_WARN("Failed to clear scroll: {}", e.what());
    } catch (const std::exception& e) {
        SEARCHLINK_WARN("Unexpected error while clearing scroll: {}", e.what());
    }
}

} // namespace searchlink::search
