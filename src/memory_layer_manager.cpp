#include "engram/memory_layer_manager.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"

namespace engram {

const std::vector<MemoryLayerMapping>& default_layer_mappings() {
    static const std::vector<MemoryLayerMapping> mappings = {
        {MemoryLayer::WORKING,
         {"ouroboros_neuro_thoughts"},
         "Active thought processes and immediate reasoning", 1.0},
        {MemoryLayer::EPISODIC,
         {"ouroboros_conversations", "ouroboros_thought_results"},
         "Recent interactions and their outcomes", 0.9},
        {MemoryLayer::SEMANTIC,
         {"core", "fullcore", "codebase", "qdrant_documentation"},
         "Learned facts, concepts, and domain knowledge", 0.7},
        {MemoryLayer::PROCEDURAL,
         {"ouroboros_skills", "ouroboros_tool_patterns", "tools"},
         "Learned skills, tool usage patterns, and procedures", 0.8},
        {MemoryLayer::AUTOBIOGRAPHICAL,
         {"ouroboros_personalities", "ouroboros_persons", "ouroboros_selfindex"},
         "Self-model, identity, and known entities", 0.95},
    };
    return mappings;
}

MemoryLayerManager::MemoryLayerManager(std::shared_ptr<CollectionAdmin> admin,
                                       std::vector<MemoryLayerMapping> mappings)
    : admin_(std::move(admin)) {
    ENGRAM_CHECK_ARGUMENT(admin_ != nullptr, "MemoryLayerManager requires a CollectionAdmin");

    for (auto& mapping : mappings) {
        const std::string layer_name = to_string(mapping.layer);
        if (mappings_.count(mapping.layer) > 0) {
            throw InvalidArgumentError("Layer " + layer_name + " is mapped twice", __func__);
        }
        if (mapping.retention_priority < 0.0 || mapping.retention_priority > 1.0) {
            throw InvalidArgumentError("Retention priority of layer " + layer_name + " must lie in [0, 1]",
                                       __func__);
        }
        for (const auto& collection : mapping.collections) {
            auto owner = owners_.find(collection);
            if (owner != owners_.end() && owner->second != mapping.layer) {
                throw InvalidArgumentError(
                    "Collection " + collection + " is mapped to both " + to_string(owner->second) +
                    " and " + layer_name, __func__,
                    "Assign every collection to a single memory layer");
            }
            owners_[collection] = mapping.layer;
        }
        mappings_.emplace(mapping.layer, std::move(mapping));
    }
}

void MemoryLayerManager::initialize() {
    std::lock_guard<std::mutex> lock(init_mutex_);
    if (initialized_) {
        ENGRAM_LOG_DEBUG("Memory layers already initialized");
        return;
    }
    admin_->initialize();

    const auto& registry = known_collections();
    size_t created = 0;
    for (const auto& entry : mappings_) {
        for (const auto& collection : entry.second.collections) {
            if (admin_->get_collection_info(collection)) continue;

            auto known = registry.find(collection);
            const std::string purpose = known != registry.end() ? known->second : entry.second.description;
            if (admin_->create_collection(collection, std::nullopt, Distance::COSINE, purpose)) {
                ++created;
            }
        }
    }
    initialized_ = true;
    ENGRAM_LOG_INFO("Memory layers initialized, " + std::to_string(created) + " collection(s) created");
}

bool MemoryLayerManager::is_initialized() const {
    std::lock_guard<std::mutex> lock(init_mutex_);
    return initialized_;
}

std::vector<std::string> MemoryLayerManager::get_collections_for_layer(MemoryLayer layer) const {
    auto it = mappings_.find(layer);
    return it != mappings_.end() ? it->second.collections : std::vector<std::string>{};
}

std::optional<MemoryLayer> MemoryLayerManager::get_layer_for_collection(const std::string& collection) const {
    auto it = owners_.find(collection);
    if (it == owners_.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<MemoryLayerMapping> MemoryLayerManager::get_mapping(MemoryLayer layer) const {
    auto it = mappings_.find(layer);
    if (it == mappings_.end()) {
        return std::nullopt;
    }
    return it->second;
}

uint64_t MemoryLayerManager::get_layer_vector_count(MemoryLayer layer) {
    uint64_t total = 0;
    for (const auto& collection : get_collections_for_layer(layer)) {
        if (auto info = admin_->get_collection_info(collection)) {
            total += info->points_count;
        }
    }
    return total;
}

uint64_t MemoryLayerManager::get_total_memory_vectors() {
    return admin_->get_memory_statistics().total_vectors;
}

bool MemoryLayerManager::clear_memory_layer(MemoryLayer layer, bool confirmed) {
    if (!confirmed) {
        ENGRAM_LOG_WARNING(std::string("Refusing to clear layer ") + to_string(layer) +
                           " without confirmation");
        return false;
    }

    bool success = true;
    for (const auto& collection : get_collections_for_layer(layer)) {
        if (!admin_->recreate_collection(collection, admin_->default_vector_size())) {
            ENGRAM_LOG_WARNING("Collection " + collection + " of layer " + to_string(layer) +
                               " does not exist");
            success = false;
        }
    }
    ENGRAM_LOG_INFO(std::string("Cleared memory layer ") + to_string(layer));
    return success;
}

MemoryHealthReport MemoryLayerManager::perform_health_check(bool auto_heal) {
    MemoryHealthReport report;
    for (const auto& collection : admin_->health_check()) {
        if (collection.healthy) {
            ++report.healthy_count;
        } else {
            ++report.unhealthy_count;
            report.unhealthy_collections.push_back(collection.collection);
        }
    }

    if (auto_heal && report.unhealthy_count > 0) {
        report.healed_collections = admin_->auto_heal(std::nullopt, true);
    }
    report.statistics = admin_->get_memory_statistics();
    return report;
}

MemorySnapshot MemoryLayerManager::create_snapshot() {
    MemorySnapshot snapshot;
    snapshot.taken_at = std::chrono::system_clock::now();
    snapshot.collections = admin_->get_all_collections();
    snapshot.links = admin_->links();
    snapshot.statistics = admin_->get_memory_statistics();

    std::map<std::string, uint64_t> points;
    for (const auto& info : snapshot.collections) {
        points[info.name] = info.points_count;
    }
    for (MemoryLayer layer : all_memory_layers()) {
        uint64_t total = 0;
        for (const auto& collection : get_collections_for_layer(layer)) {
            auto it = points.find(collection);
            if (it != points.end()) total += it->second;
        }
        snapshot.layer_vector_counts[layer] = total;
    }
    return snapshot;
}

void MemoryLayerManager::link_collections(const std::string& source, const std::string& target, LinkType type,
                                          const std::optional<std::string>& description) {
    CollectionLink link;
    link.source = source;
    link.target = target;
    link.type = type;
    link.description = description;
    admin_->add_collection_link(link);
}

std::vector<CollectionLink> MemoryLayerManager::get_related_collections(const std::string& collection) const {
    return admin_->get_linked_collections(collection);
}

std::string MemoryLayerManager::get_memory_map() {
    return admin_->generate_memory_map();
}

} // namespace engram
