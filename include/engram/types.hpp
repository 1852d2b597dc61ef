#pragma once

#include "engram/time_util.hpp"
#include "engram/uuid.hpp"
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace engram {

// =============================================================================
// Thought vocabulary
// =============================================================================

/**
 * Kind of reasoning a thought represents. Callers outside the engine may
 * introduce new kinds, so unknown names are kept verbatim under OTHER.
 */
class ThoughtType {
public:
    enum class Kind {
        OBSERVATION,
        ANALYTICAL,
        DECISION,
        EMOTIONAL,
        SELF_REFLECTION,
        MEMORY_RECALL,
        STRATEGIC,
        SYNTHESIS,
        CREATIVE,
        PLANNING,
        HYPOTHESIS,
        OTHER
    };

    ThoughtType() : kind_(Kind::OBSERVATION) {}
    ThoughtType(Kind kind) : kind_(kind) {}

    static ThoughtType parse(const std::string& name);
    static ThoughtType other(const std::string& name);

    Kind kind() const { return kind_; }
    std::string name() const;

    bool operator==(const ThoughtType& rhs) const { return name() == rhs.name(); }
    bool operator!=(const ThoughtType& rhs) const { return !(*this == rhs); }
    bool operator<(const ThoughtType& rhs) const { return name() < rhs.name(); }

private:
    Kind kind_;
    std::string other_;
};

class ThoughtOrigin {
public:
    enum class Kind { REACTIVE, AUTONOMOUS, CHAINED, OTHER };

    ThoughtOrigin() : kind_(Kind::REACTIVE) {}
    ThoughtOrigin(Kind kind) : kind_(kind) {}

    static ThoughtOrigin parse(const std::string& name);

    Kind kind() const { return kind_; }
    std::string name() const;

    bool operator==(const ThoughtOrigin& rhs) const { return name() == rhs.name(); }
    bool operator!=(const ThoughtOrigin& rhs) const { return !(*this == rhs); }
    bool operator<(const ThoughtOrigin& rhs) const { return name() < rhs.name(); }

private:
    Kind kind_;
    std::string other_;
};

struct Thought {
    Uuid id{};
    std::string session_id;
    ThoughtType type;
    ThoughtOrigin origin;
    std::string content;
    double confidence = 1.0;
    double relevance = 1.0;
    Timestamp timestamp;
    std::optional<Uuid> parent_thought_id;
    std::optional<std::string> topic;
    std::vector<std::string> tags;
    std::optional<std::string> metadata_json;

    bool operator==(const Thought& rhs) const;
    bool operator!=(const Thought& rhs) const { return !(*this == rhs); }
};

// =============================================================================
// Relations and results
// =============================================================================

enum class RelationType {
    CAUSED_BY,
    LEADS_TO,
    CONTRADICTS,
    SUPPORTS,
    REFINES,
    ABSTRACTS,
    ELABORATES,
    SIMILAR_TO,
    INSTANCE_OF,
    PART_OF,
    TRIGGERS,
    RESOLVES
};

const char* to_string(RelationType type);
std::optional<RelationType> parse_relation_type(const std::string& name);

struct Relation {
    Uuid id{};
    Uuid source_thought_id{};
    Uuid target_thought_id{};
    RelationType type = RelationType::SIMILAR_TO;
    double strength = 1.0;
    Timestamp created_at;
    std::optional<std::string> metadata_json;

    bool operator==(const Relation& rhs) const;
};

enum class ResultType {
    ACTION,
    RESPONSE,
    INSIGHT,
    DECISION,
    SKILL_LEARNED,
    FACT_DISCOVERED,
    ERROR,
    DEFERRED
};

const char* to_string(ResultType type);
std::optional<ResultType> parse_result_type(const std::string& name);

struct ThoughtResult {
    Uuid id{};
    Uuid thought_id{};
    ResultType type = ResultType::RESPONSE;
    std::string content;
    bool success = true;
    double confidence = 1.0;
    Timestamp created_at;
    std::optional<double> execution_time_ms;
    std::optional<std::string> metadata_json;

    bool operator==(const ThoughtResult& rhs) const;
};

// =============================================================================
// Statistics
// =============================================================================

struct ThoughtStatistics {
    size_t total_count = 0;
    std::map<std::string, size_t> count_by_type;
    std::map<std::string, size_t> count_by_origin;
    double average_confidence = 0.0;
    double average_relevance = 0.0;
    std::optional<Timestamp> earliest;
    std::optional<Timestamp> latest;
    // Root thoughts (no parent) that have at least one child
    size_t chain_count = 0;
};

struct NeuroSymbolicStats {
    size_t total_thoughts = 0;
    size_t total_relations = 0;
    size_t total_results = 0;
    std::map<std::string, size_t> thoughts_by_type;
    std::map<std::string, size_t> relations_by_type;
    std::map<std::string, size_t> results_by_type;
    size_t causal_chain_count = 0;
    double average_chain_length = 0.0;
    std::optional<Timestamp> oldest;
    std::optional<Timestamp> newest;
};

// =============================================================================
// Collections and memory layers
// =============================================================================

enum class Distance { COSINE, EUCLID, DOT, MANHATTAN };

const char* to_string(Distance distance);
std::optional<Distance> parse_distance(const std::string& name);

enum class CollectionStatus { GREEN, YELLOW, RED, GREY };

const char* to_string(CollectionStatus status);
CollectionStatus parse_collection_status(const std::string& name);

struct CollectionInfo {
    std::string name;
    uint64_t vector_size = 0;
    uint64_t points_count = 0;
    Distance distance = Distance::COSINE;
    CollectionStatus status = CollectionStatus::GREEN;
    std::optional<std::string> purpose;
    std::vector<std::string> linked_collections;
};

enum class LinkType {
    DEPENDS_ON,
    INDEXES,
    EXTENDS,
    MIRRORS,
    AGGREGATES,
    PART_OF,
    RELATED_TO
};

const char* to_string(LinkType type);
std::optional<LinkType> parse_link_type(const std::string& name);

struct CollectionLink {
    std::string source;
    std::string target;
    LinkType type = LinkType::RELATED_TO;
    double strength = 1.0;
    std::optional<std::string> description;
};

struct CollectionHealthReport {
    std::string collection;
    bool healthy = true;
    uint64_t expected_dimension = 0;
    uint64_t actual_dimension = 0;
    bool dimension_mismatch = false;
    std::optional<std::string> issue;
    std::optional<std::string> recommendation;
};

struct MemoryStatistics {
    size_t total_collections = 0;
    uint64_t total_vectors = 0;
    size_t healthy_collections = 0;
    size_t unhealthy_collections = 0;
    size_t link_count = 0;
    std::map<uint64_t, size_t> dimension_distribution;
};

enum class MemoryLayer { WORKING, EPISODIC, SEMANTIC, PROCEDURAL, AUTOBIOGRAPHICAL };

const char* to_string(MemoryLayer layer);
std::optional<MemoryLayer> parse_memory_layer(const std::string& name);
const std::vector<MemoryLayer>& all_memory_layers();

struct MemoryLayerMapping {
    MemoryLayer layer = MemoryLayer::WORKING;
    std::vector<std::string> collections;
    std::string description;
    double retention_priority = 1.0;
};

struct MemoryHealthReport {
    size_t healthy_count = 0;
    size_t unhealthy_count = 0;
    std::vector<std::string> healed_collections;
    std::vector<std::string> unhealthy_collections;
    MemoryStatistics statistics;
};

struct MemorySnapshot {
    Timestamp taken_at;
    std::vector<CollectionInfo> collections;
    std::vector<CollectionLink> links;
    std::map<MemoryLayer, uint64_t> layer_vector_counts;
    MemoryStatistics statistics;
};

} // namespace engram
