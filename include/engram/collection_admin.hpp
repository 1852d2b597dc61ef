#pragma once

#include "engram/vector_backend.hpp"
#include "engram/types.hpp"
#include <map>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace engram {

constexpr uint64_t kDefaultVectorSize = 768;

// Purpose of every collection the agent is known to use.
const std::map<std::string, std::string>& known_collections();

// Declared relationships between those collections.
const std::vector<CollectionLink>& default_collection_links();

/**
 * Collection lifecycle, dimension health and the declared link graph.
 *
 * Keeps a cache of backend metadata merged with purposes and links. The cache
 * and link list may be shared between threads; backend calls are made outside
 * the lock.
 */
class CollectionAdmin {
public:
    explicit CollectionAdmin(std::shared_ptr<VectorBackendClient> backend,
                             uint64_t default_vector_size = kDefaultVectorSize);

    // Seeds the default links (once) and loads the collection cache.
    void initialize();

    std::vector<CollectionInfo> get_all_collections();

    // nullopt when the collection does not exist.
    std::optional<CollectionInfo> get_collection_info(const std::string& name);

    // false when the collection already exists.
    bool create_collection(const std::string& name,
                           std::optional<uint64_t> vector_size = std::nullopt,
                           Distance distance = Distance::COSINE,
                           const std::optional<std::string>& purpose = std::nullopt);

    // false when there was nothing to delete. Links mentioning it go too.
    bool delete_collection(const std::string& name);

    /**
     * Drops and recreates a collection empty at `vector_size`, keeping its
     * distance, purpose and links. Returns false when it did not exist.
     */
    bool recreate_collection(const std::string& name, uint64_t vector_size);

    /**
     * One report per collection. A collection is mismatched when its size is
     * non-zero and differs from `expected_dimension`; never-written
     * collections (size 0) are not flagged. Healthy means not mismatched and
     * status green.
     */
    std::vector<CollectionHealthReport> health_check(std::optional<uint64_t> expected_dimension = std::nullopt);

    /**
     * Recreates every mismatched collection empty at `target_dimension`.
     * All points in those collections are lost, so nothing happens unless
     * `confirmed` is true. Returns the names that were recreated.
     */
    std::vector<std::string> auto_heal(std::optional<uint64_t> target_dimension, bool confirmed);

    // Ignored when a link with the same source, target and type exists.
    void add_collection_link(const CollectionLink& link);

    // Links where the collection is either end.
    std::vector<CollectionLink> get_linked_collections(const std::string& name) const;

    // Names on the other end of links of one type, in both directions.
    std::vector<std::string> get_collections_by_relation(const std::string& name, LinkType type) const;

    std::vector<CollectionLink> links() const;

    // Human-readable overview grouped by naming convention. Display only.
    std::string generate_memory_map();

    MemoryStatistics get_memory_statistics();

    uint64_t default_vector_size() const { return default_vector_size_; }

private:
    void refresh_cache();
    void decorate(CollectionInfo& info) const;
    std::vector<CollectionInfo> cached_collections() const;

    std::shared_ptr<VectorBackendClient> backend_;
    uint64_t default_vector_size_;

    mutable std::shared_mutex mutex_;
    std::map<std::string, CollectionInfo> cache_;
    std::vector<CollectionLink> links_;
    std::map<std::string, std::string> purposes_;
    bool initialized_ = false;
};

} // namespace engram
