#include "engram/collection_admin.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"
#include <algorithm>
#include <iomanip>
#include <iterator>
#include <mutex>
#include <sstream>

namespace engram {

namespace {

constexpr size_t kMapLinkLimit = 10;

bool same_link(const CollectionLink& a, const CollectionLink& b) {
    return a.source == b.source && a.target == b.target && a.type == b.type;
}

bool mentions(const CollectionLink& link, const std::string& name) {
    return link.source == name || link.target == name;
}

bool contains(const std::string& name, const char* fragment) {
    return name.find(fragment) != std::string::npos;
}

} // namespace

const std::map<std::string, std::string>& known_collections() {
    static const std::map<std::string, std::string> registry = {
        {"ouroboros_neuro_thoughts", "Neural-symbolic thought storage for inner dialog"},
        {"ouroboros_thought_relations", "Symbolic relations between thoughts"},
        {"ouroboros_thought_results", "Outcomes and results of thought chains"},
        {"ouroboros_conversations", "Conversation history and context"},
        {"ouroboros_skills", "Learned skills and capabilities"},
        {"ouroboros_tool_patterns", "Tool usage patterns and preferences"},
        {"ouroboros_personalities", "Personality trait vectors"},
        {"ouroboros_persons", "Known persons and their attributes"},
        {"ouroboros_selfindex", "Self-referential knowledge index"},
        {"ouroboros_filehashes", "File content hashes for deduplication"},
        {"pipeline_vectors", "General pipeline vector storage"},
        {"tools", "Tool definitions and embeddings"},
        {"core", "Core knowledge embeddings"},
        {"fullcore", "Full codebase embeddings"},
        {"codebase", "Source code embeddings"},
        {"prefix_cache", "Prefix-based completion cache"},
        {"qdrant_documentation", "Qdrant documentation embeddings"},
    };
    return registry;
}

const std::vector<CollectionLink>& default_collection_links() {
    static const std::vector<CollectionLink> links = {
        {"ouroboros_neuro_thoughts", "ouroboros_thought_relations", LinkType::INDEXES, 1.0,
         std::string("Thoughts indexed by relations")},
        {"ouroboros_neuro_thoughts", "ouroboros_thought_results", LinkType::EXTENDS, 1.0,
         std::string("Thoughts extend to results")},
        {"ouroboros_skills", "ouroboros_tool_patterns", LinkType::RELATED_TO, 0.8,
         std::string("Skills inform tool patterns")},
        {"ouroboros_conversations", "ouroboros_neuro_thoughts", LinkType::DEPENDS_ON, 0.9,
         std::string("Conversations feed thoughts")},
        {"ouroboros_personalities", "ouroboros_persons", LinkType::RELATED_TO, 0.7,
         std::string("Personalities relate to persons")},
        {"ouroboros_selfindex", "ouroboros_neuro_thoughts", LinkType::AGGREGATES, 1.0,
         std::string("Self-index aggregates thoughts")},
        {"core", "fullcore", LinkType::PART_OF, 1.0, std::string("Core is part of fullcore")},
        {"codebase", "fullcore", LinkType::PART_OF, 1.0, std::string("Codebase is part of fullcore")},
    };
    return links;
}

CollectionAdmin::CollectionAdmin(std::shared_ptr<VectorBackendClient> backend, uint64_t default_vector_size)
    : backend_(std::move(backend))
    , default_vector_size_(default_vector_size)
    , purposes_(known_collections()) {
    ENGRAM_CHECK_ARGUMENT(backend_ != nullptr, "CollectionAdmin requires a vector backend");
    ENGRAM_CHECK_ARGUMENT(default_vector_size_ > 0, "default_vector_size must be positive");
}

void CollectionAdmin::initialize() {
    {
        std::unique_lock<std::shared_mutex> lock(mutex_);
        if (!initialized_) {
            for (const auto& link : default_collection_links()) {
                if (std::none_of(links_.begin(), links_.end(),
                                 [&](const CollectionLink& l) { return same_link(l, link); })) {
                    links_.push_back(link);
                }
            }
            initialized_ = true;
        }
    }
    refresh_cache();
    ENGRAM_LOG_INFO("Collection admin initialized");
}

// -----------------------------------------------------------------------------
// Cache
// -----------------------------------------------------------------------------

void CollectionAdmin::decorate(CollectionInfo& info) const {
    auto purpose = purposes_.find(info.name);
    if (purpose != purposes_.end()) {
        info.purpose = purpose->second;
    }
    info.linked_collections.clear();
    for (const auto& link : links_) {
        if (!mentions(link, info.name)) continue;
        const std::string& other = link.source == info.name ? link.target : link.source;
        if (std::find(info.linked_collections.begin(), info.linked_collections.end(), other) ==
            info.linked_collections.end()) {
            info.linked_collections.push_back(other);
        }
    }
}

void CollectionAdmin::refresh_cache() {
    std::map<std::string, CollectionInfo> fresh;
    for (const auto& name : backend_->list_collections()) {
        // A collection can vanish between listing and describing it.
        if (auto info = backend_->get_collection_info(name)) {
            fresh.emplace(name, std::move(*info));
        }
    }

    std::unique_lock<std::shared_mutex> lock(mutex_);
    for (auto& entry : fresh) {
        decorate(entry.second);
    }
    cache_ = std::move(fresh);
}

std::vector<CollectionInfo> CollectionAdmin::cached_collections() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<CollectionInfo> out;
    out.reserve(cache_.size());
    for (const auto& entry : cache_) {
        out.push_back(entry.second);
    }
    return out;
}

// -----------------------------------------------------------------------------
// Lifecycle
// -----------------------------------------------------------------------------

std::vector<CollectionInfo> CollectionAdmin::get_all_collections() {
    refresh_cache();
    return cached_collections();
}

std::optional<CollectionInfo> CollectionAdmin::get_collection_info(const std::string& name) {
    auto info = backend_->get_collection_info(name);
    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (!info) {
        cache_.erase(name);
        return std::nullopt;
    }
    decorate(*info);
    cache_[name] = *info;
    return info;
}

bool CollectionAdmin::create_collection(const std::string& name,
                                        std::optional<uint64_t> vector_size,
                                        Distance distance,
                                        const std::optional<std::string>& purpose) {
    ENGRAM_CHECK_ARGUMENT(!name.empty(), "Collection name must not be empty");

    if (backend_->collection_exists(name)) {
        return false;
    }
    const uint64_t size = vector_size.value_or(default_vector_size_);
    backend_->create_collection(name, size, distance);

    CollectionInfo info;
    info.name = name;
    info.vector_size = size;
    info.distance = distance;
    info.status = CollectionStatus::GREEN;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (purpose) {
        purposes_[name] = *purpose;
    }
    decorate(info);
    cache_[name] = std::move(info);
    ENGRAM_LOG_INFO("Created collection " + name + " [" + std::to_string(size) + "d]");
    return true;
}

bool CollectionAdmin::delete_collection(const std::string& name) {
    if (!backend_->collection_exists(name)) {
        return false;
    }
    backend_->delete_collection(name);

    std::unique_lock<std::shared_mutex> lock(mutex_);
    cache_.erase(name);
    links_.erase(std::remove_if(links_.begin(), links_.end(),
                                [&](const CollectionLink& link) { return mentions(link, name); }),
                 links_.end());
    for (auto& entry : cache_) {
        decorate(entry.second);
    }
    ENGRAM_LOG_INFO("Deleted collection " + name);
    return true;
}

bool CollectionAdmin::recreate_collection(const std::string& name, uint64_t vector_size) {
    auto previous = backend_->get_collection_info(name);
    if (!previous) {
        return false;
    }

    backend_->delete_collection(name);
    backend_->create_collection(name, vector_size, previous->distance);

    CollectionInfo info;
    info.name = name;
    info.vector_size = vector_size;
    info.distance = previous->distance;
    info.status = CollectionStatus::GREEN;

    std::unique_lock<std::shared_mutex> lock(mutex_);
    decorate(info);
    cache_[name] = std::move(info);
    ENGRAM_LOG_WARNING("Recreated collection " + name + " empty at " + std::to_string(vector_size) +
                       "d (" + std::to_string(previous->points_count) + " points dropped)");
    return true;
}

// -----------------------------------------------------------------------------
// Health
// -----------------------------------------------------------------------------

std::vector<CollectionHealthReport> CollectionAdmin::health_check(std::optional<uint64_t> expected_dimension) {
    const uint64_t expected = expected_dimension.value_or(default_vector_size_);
    refresh_cache();

    std::vector<CollectionHealthReport> reports;
    for (const auto& info : cached_collections()) {
        CollectionHealthReport report;
        report.collection = info.name;
        report.expected_dimension = expected;
        report.actual_dimension = info.vector_size;
        report.dimension_mismatch = info.vector_size != expected && info.vector_size > 0;
        report.healthy = !report.dimension_mismatch && info.status == CollectionStatus::GREEN;
        if (report.dimension_mismatch) {
            report.issue = "Dimension mismatch: expected " + std::to_string(expected) + ", got " +
                           std::to_string(info.vector_size);
            report.recommendation = "Delete and recreate collection, or migrate vectors to " +
                                    std::to_string(expected) + " dimensions";
        } else if (info.status != CollectionStatus::GREEN) {
            report.issue = std::string("Collection status is ") + to_string(info.status);
        }
        reports.push_back(std::move(report));
    }
    return reports;
}

std::vector<std::string> CollectionAdmin::auto_heal(std::optional<uint64_t> target_dimension, bool confirmed) {
    const uint64_t target = target_dimension.value_or(default_vector_size_);
    std::vector<std::string> healed;

    if (!confirmed) {
        ENGRAM_LOG_WARNING("auto_heal refused: recreating collections deletes their points, "
                           "pass confirmation to proceed");
        return healed;
    }

    for (const auto& report : health_check(target)) {
        if (!report.dimension_mismatch) continue;
        try {
            if (recreate_collection(report.collection, target)) {
                healed.push_back(report.collection);
            }
        } catch (const EngramException& e) {
            // Remaining collections are still attempted; this one stays mismatched.
            ENGRAM_LOG_ERROR("Failed to heal " + report.collection + ": " + e.what());
        }
    }

    refresh_cache();
    return healed;
}

// -----------------------------------------------------------------------------
// Links
// -----------------------------------------------------------------------------

void CollectionAdmin::add_collection_link(const CollectionLink& link) {
    ENGRAM_CHECK_ARGUMENT(!link.source.empty() && !link.target.empty(),
                          "Collection links need a source and a target");

    std::unique_lock<std::shared_mutex> lock(mutex_);
    if (std::any_of(links_.begin(), links_.end(),
                    [&](const CollectionLink& l) { return same_link(l, link); })) {
        return;
    }
    links_.push_back(link);
    for (const auto* name : {&link.source, &link.target}) {
        auto it = cache_.find(*name);
        if (it != cache_.end()) {
            decorate(it->second);
        }
    }
}

std::vector<CollectionLink> CollectionAdmin::get_linked_collections(const std::string& name) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<CollectionLink> out;
    std::copy_if(links_.begin(), links_.end(), std::back_inserter(out),
                 [&](const CollectionLink& link) { return mentions(link, name); });
    return out;
}

std::vector<std::string> CollectionAdmin::get_collections_by_relation(const std::string& name,
                                                                      LinkType type) const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    std::vector<std::string> out;
    auto add = [&out](const std::string& other) {
        if (std::find(out.begin(), out.end(), other) == out.end()) {
            out.push_back(other);
        }
    };
    for (const auto& link : links_) {
        if (link.type == type && link.source == name) add(link.target);
    }
    for (const auto& link : links_) {
        if (link.type == type && link.target == name) add(link.source);
    }
    return out;
}

std::vector<CollectionLink> CollectionAdmin::links() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return links_;
}

// -----------------------------------------------------------------------------
// Reporting
// -----------------------------------------------------------------------------

std::string CollectionAdmin::generate_memory_map() {
    refresh_cache();
    const auto collections = cached_collections();
    const auto all_links = links();

    // Each collection lands in the first group whose fragment it contains.
    struct Section {
        const char* title;
        std::vector<const char*> fragments;
        std::vector<const CollectionInfo*> members;
    };
    std::vector<Section> sections = {
        {"THOUGHT SYSTEM", {"thought"}, {}},
        {"SKILLS & TOOLS", {"skill", "tool"}, {}},
        {"KNOWLEDGE BASE", {"core", "code"}, {}},
        {"PERSONALITY & SELF", {"person", "self"}, {}},
        {"OTHER", {}, {}},
    };
    for (const auto& info : collections) {
        Section* home = &sections.back();
        for (auto& section : sections) {
            if (std::any_of(section.fragments.begin(), section.fragments.end(),
                            [&](const char* f) { return contains(info.name, f); })) {
                home = &section;
                break;
            }
        }
        home->members.push_back(&info);
    }

    const std::string rule(68, '=');
    std::ostringstream out;
    out << rule << "\n";
    out << "  MEMORY ARCHITECTURE\n";
    out << rule << "\n";

    for (const auto& section : sections) {
        if (section.members.empty()) continue;
        out << " " << section.title << "\n";
        for (const auto* info : section.members) {
            out << "   " << (info->status == CollectionStatus::GREEN ? "[ok]" : "[!!]") << " "
                << std::left << std::setw(40) << info->name << std::right
                << " [" << std::setw(4) << info->vector_size << "d] "
                << std::setw(8) << info->points_count << " pts\n";
        }
    }

    out << rule << "\n";
    out << " COLLECTION LINKS\n";
    for (size_t i = 0; i < all_links.size() && i < kMapLinkLimit; ++i) {
        const auto& link = all_links[i];
        out << "   " << std::left << std::setw(28) << link.source
            << " --" << to_string(link.type) << "--> " << link.target << "\n";
    }
    if (all_links.size() > kMapLinkLimit) {
        out << "   ... and " << (all_links.size() - kMapLinkLimit) << " more links\n";
    }
    out << rule << "\n";
    return out.str();
}

MemoryStatistics CollectionAdmin::get_memory_statistics() {
    refresh_cache();

    MemoryStatistics stats;
    for (const auto& info : cached_collections()) {
        ++stats.total_collections;
        stats.total_vectors += info.points_count;
        if (info.status == CollectionStatus::GREEN) {
            ++stats.healthy_collections;
        }
        ++stats.dimension_distribution[info.vector_size];
    }
    stats.unhealthy_collections = stats.total_collections - stats.healthy_collections;
    stats.link_count = links().size();
    return stats;
}

} // namespace engram
