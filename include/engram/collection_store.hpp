#pragma once

#include "engram/cancellation.hpp"
#include "engram/config.hpp"
#include "engram/embedding_client.hpp"
#include "engram/keyed_mutex.hpp"
#include "engram/vector_backend.hpp"
#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace engram {

/**
 * Shared plumbing for the session-scoped stores: lazy collection creation,
 * embedding with a zero-vector fallback, paged scrolling and the lenient read
 * policy (a missing collection reads as empty).
 */
class CollectionStore {
public:
    CollectionStore(std::shared_ptr<VectorBackendClient> backend,
                    std::string collection,
                    const StoreConfig& config,
                    EmbeddingFunction embed);
    virtual ~CollectionStore() = default;

    CollectionStore(const CollectionStore&) = delete;
    CollectionStore& operator=(const CollectionStore&) = delete;

    const std::string& collection() const { return collection_; }
    bool has_embeddings() const { return static_cast<bool>(embed_); }

    // Creates the collection when it does not exist yet.
    void ensure_collection(const CancellationToken& token = {});

    // Points whose payload could not be decoded since construction.
    size_t skipped_records() const { return skipped_.load(); }

protected:
    std::vector<float> embed(const std::string& text) const;

    // Upserts in chunks of batch_size, one after another.
    void write_points(const std::vector<Point>& points, const CancellationToken& token);

    // Every page matching the filter. Empty when the collection is missing.
    std::vector<Point> scroll_all(const std::string& collection,
                                  const PointFilter& filter,
                                  const CancellationToken& token) const;
    std::vector<Point> scroll_all(const PointFilter& filter, const CancellationToken& token) const {
        return scroll_all(collection_, filter, token);
    }

    std::vector<ScoredPoint> search_points(const std::vector<float>& vector,
                                           const PointFilter& filter,
                                           size_t limit,
                                           const CancellationToken& token) const;

    // No-op when the collection is missing.
    void delete_matching(const std::string& collection, const PointFilter& filter,
                         const CancellationToken& token);

    template <typename Record, typename Decoder>
    std::vector<Record> decode_points(const std::vector<Point>& points, Decoder decode) const {
        std::vector<Record> records;
        records.reserve(points.size());
        for (const auto& point : points) {
            auto record = decode(point.payload);
            if (record) {
                records.push_back(std::move(*record));
            } else {
                note_skipped(point.id);
            }
        }
        return records;
    }

    void note_skipped(const std::string& point_id) const;

    std::shared_ptr<VectorBackendClient> backend_;
    std::string collection_;
    StoreConfig config_;
    EmbeddingFunction embed_;
    KeyedMutex session_locks_;

private:
    std::mutex init_mutex_;
    std::atomic<bool> ready_{false};
    mutable std::atomic<size_t> skipped_{0};
};

} // namespace engram
