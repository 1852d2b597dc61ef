#pragma once

#include "engram/vector_backend.hpp"
#include <map>
#include <mutex>
#include <string>

namespace engram {

/**
 * Process-local VectorBackendClient with the same error contract as
 * QdrantClient. Scroll pages are ordered by point id. Used by tests and
 * offline runs.
 */
class InMemoryVectorBackend : public VectorBackendClient {
public:
    InMemoryVectorBackend() = default;

    bool collection_exists(const std::string& collection) override;
    void create_collection(const std::string& collection, uint64_t vector_size,
                           Distance distance) override;
    bool delete_collection(const std::string& collection) override;
    std::optional<CollectionInfo> get_collection_info(const std::string& collection) override;
    std::vector<std::string> list_collections() override;

    void upsert(const std::string& collection, const std::vector<Point>& points) override;

    std::vector<ScoredPoint> search(const std::string& collection,
                                    const std::vector<float>& vector,
                                    const PointFilter& filter,
                                    size_t limit,
                                    std::optional<double> score_threshold = std::nullopt) override;

    ScrollPage scroll(const std::string& collection,
                      const PointFilter& filter,
                      size_t limit,
                      const std::optional<std::string>& offset = std::nullopt) override;

    void delete_points(const std::string& collection, const std::vector<std::string>& ids) override;
    void delete_points(const std::string& collection, const PointFilter& filter) override;

    uint64_t count(const std::string& collection, const PointFilter& filter) override;

    // Overrides the optimizer status reported for a collection.
    void set_status(const std::string& collection, CollectionStatus status);

    // When set, every call throws BackendUnavailableError.
    void set_unavailable(bool unavailable);

    size_t call_count() const;

private:
    struct Collection {
        uint64_t vector_size = 0;
        Distance distance = Distance::COSINE;
        CollectionStatus status = CollectionStatus::GREEN;
        std::map<std::string, Point> points;
    };

    Collection& require(const std::string& collection, const char* context);
    void begin_call(const char* context);

    mutable std::mutex mutex_;
    std::map<std::string, Collection> collections_;
    bool unavailable_ = false;
    size_t calls_ = 0;
};

} // namespace engram
