#pragma once

#include "engram/collection_admin.hpp"
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace engram {

const std::vector<MemoryLayerMapping>& default_layer_mappings();

/**
 * Maps the five cognitive memory layers onto sets of collections.
 *
 * A collection belongs to at most one layer; mappings that share a
 * collection, repeat a layer or carry a retention priority outside [0, 1]
 * are rejected with InvalidArgumentError.
 */
class MemoryLayerManager {
public:
    explicit MemoryLayerManager(std::shared_ptr<CollectionAdmin> admin,
                                std::vector<MemoryLayerMapping> mappings = default_layer_mappings());

    // Initializes the admin and creates every mapped collection that is missing.
    // Later calls do nothing once a call has succeeded.
    void initialize();
    bool is_initialized() const;

    std::vector<std::string> get_collections_for_layer(MemoryLayer layer) const;
    std::optional<MemoryLayer> get_layer_for_collection(const std::string& collection) const;
    std::optional<MemoryLayerMapping> get_mapping(MemoryLayer layer) const;

    // Sum of point counts over the layer's existing collections.
    uint64_t get_layer_vector_count(MemoryLayer layer);
    uint64_t get_total_memory_vectors();

    /**
     * Recreates every collection of the layer empty. Without `confirmed`
     * nothing is touched and false is returned. Also false when one of the
     * layer's collections did not exist.
     */
    bool clear_memory_layer(MemoryLayer layer, bool confirmed);

    // Passing auto_heal is the confirmation for destructive repair.
    MemoryHealthReport perform_health_check(bool auto_heal = false);

    MemorySnapshot create_snapshot();

    void link_collections(const std::string& source, const std::string& target, LinkType type,
                          const std::optional<std::string>& description = std::nullopt);
    std::vector<CollectionLink> get_related_collections(const std::string& collection) const;

    std::string get_memory_map();

    CollectionAdmin& admin() { return *admin_; }

private:
    std::shared_ptr<CollectionAdmin> admin_;
    std::map<MemoryLayer, MemoryLayerMapping> mappings_;
    std::map<std::string, MemoryLayer> owners_;
    mutable std::mutex init_mutex_;
    bool initialized_ = false;
};

} // namespace engram
