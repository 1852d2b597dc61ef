#include "engram/collection_store.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"
#include <algorithm>

namespace engram {

CollectionStore::CollectionStore(std::shared_ptr<VectorBackendClient> backend,
                                 std::string collection,
                                 const StoreConfig& config,
                                 EmbeddingFunction embed)
    : backend_(std::move(backend))
    , collection_(std::move(collection))
    , config_(config)
    , embed_(std::move(embed)) {
    ENGRAM_CHECK_ARGUMENT(backend_ != nullptr, "A vector backend is required");
    ENGRAM_CHECK_ARGUMENT(!collection_.empty(), "Collection name must not be empty");
    ENGRAM_CHECK_ARGUMENT(config_.batch_size > 0, "batch_size must be positive");
    ENGRAM_CHECK_ARGUMENT(config_.scroll_page_size > 0, "scroll_page_size must be positive");
}

void CollectionStore::ensure_collection(const CancellationToken& token) {
    if (ready_.load()) {
        return;
    }
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (ready_.load()) {
        return;
    }
    token.check(__func__);
    if (!backend_->collection_exists(collection_)) {
        ENGRAM_LOG_INFO("Collection " + collection_ + " does not exist, creating it");
        token.check(__func__);
        backend_->create_collection(collection_, config_.vector_size, Distance::COSINE);
    }
    ready_.store(true);
}

std::vector<float> CollectionStore::embed(const std::string& text) const {
    if (!embed_) {
        return std::vector<float>(config_.vector_size, 0.0f);
    }
    return embed_(text);
}

void CollectionStore::write_points(const std::vector<Point>& points, const CancellationToken& token) {
    ensure_collection(token);

    for (size_t start = 0; start < points.size(); start += config_.batch_size) {
        const size_t end = std::min(points.size(), start + config_.batch_size);
        std::vector<Point> batch(points.begin() + start, points.begin() + end);

        token.check(__func__);
        try {
            backend_->upsert(collection_, batch);
        } catch (const CollectionNotFoundError&) {
            // Dropped behind our back (auto-heal, layer clear); recreate once.
            ENGRAM_LOG_WARNING("Collection " + collection_ + " vanished, recreating it");
            ready_.store(false);
            ensure_collection(token);
            token.check(__func__);
            backend_->upsert(collection_, batch);
        }
    }
}

std::vector<Point> CollectionStore::scroll_all(const std::string& collection,
                                               const PointFilter& filter,
                                               const CancellationToken& token) const {
    std::vector<Point> points;
    std::optional<std::string> offset;
    try {
        do {
            token.check(__func__);
            ScrollPage page = backend_->scroll(collection, filter, config_.scroll_page_size, offset);
            for (auto& point : page.points) {
                points.push_back(std::move(point));
            }
            offset = page.next_offset;
        } while (offset);
    } catch (const CollectionNotFoundError& e) {
        ENGRAM_LOG_DEBUG("Reading missing collection " + e.collection() + " as empty");
        return {};
    }
    return points;
}

std::vector<ScoredPoint> CollectionStore::search_points(const std::vector<float>& vector,
                                                        const PointFilter& filter,
                                                        size_t limit,
                                                        const CancellationToken& token) const {
    token.check(__func__);
    try {
        return backend_->search(collection_, vector, filter, limit);
    } catch (const CollectionNotFoundError& e) {
        ENGRAM_LOG_DEBUG("Searching missing collection " + e.collection() + " as empty");
        return {};
    }
}

void CollectionStore::delete_matching(const std::string& collection, const PointFilter& filter,
                                      const CancellationToken& token) {
    token.check(__func__);
    try {
        backend_->delete_points(collection, filter);
    } catch (const CollectionNotFoundError& e) {
        ENGRAM_LOG_DEBUG("Nothing to delete in missing collection " + e.collection());
    }
}

void CollectionStore::note_skipped(const std::string& point_id) const {
    ++skipped_;
    ENGRAM_LOG_WARNING("Skipping undecodable point " + point_id + " in " + collection_);
}

} // namespace engram
