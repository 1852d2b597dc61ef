#include "engram/types.hpp"
#include <algorithm>
#include <cctype>
#include <utility>

namespace engram {

namespace {

template <typename Enum, size_t N>
std::optional<Enum> lookup(const std::pair<Enum, const char*> (&table)[N], const std::string& name) {
    for (const auto& entry : table) {
        if (name == entry.second) {
            return entry.first;
        }
    }
    return std::nullopt;
}

template <typename Enum, size_t N>
const char* reverse_lookup(const std::pair<Enum, const char*> (&table)[N], Enum value) {
    for (const auto& entry : table) {
        if (entry.first == value) {
            return entry.second;
        }
    }
    return "unknown";
}

const std::pair<ThoughtType::Kind, const char*> kThoughtTypeNames[] = {
    {ThoughtType::Kind::OBSERVATION, "Observation"},
    {ThoughtType::Kind::ANALYTICAL, "Analytical"},
    {ThoughtType::Kind::DECISION, "Decision"},
    {ThoughtType::Kind::EMOTIONAL, "Emotional"},
    {ThoughtType::Kind::SELF_REFLECTION, "SelfReflection"},
    {ThoughtType::Kind::MEMORY_RECALL, "MemoryRecall"},
    {ThoughtType::Kind::STRATEGIC, "Strategic"},
    {ThoughtType::Kind::SYNTHESIS, "Synthesis"},
    {ThoughtType::Kind::CREATIVE, "Creative"},
    {ThoughtType::Kind::PLANNING, "Planning"},
    {ThoughtType::Kind::HYPOTHESIS, "Hypothesis"},
};

const std::pair<ThoughtOrigin::Kind, const char*> kOriginNames[] = {
    {ThoughtOrigin::Kind::REACTIVE, "Reactive"},
    {ThoughtOrigin::Kind::AUTONOMOUS, "Autonomous"},
    {ThoughtOrigin::Kind::CHAINED, "Chained"},
};

const std::pair<RelationType, const char*> kRelationNames[] = {
    {RelationType::CAUSED_BY, "caused_by"},
    {RelationType::LEADS_TO, "leads_to"},
    {RelationType::CONTRADICTS, "contradicts"},
    {RelationType::SUPPORTS, "supports"},
    {RelationType::REFINES, "refines"},
    {RelationType::ABSTRACTS, "abstracts"},
    {RelationType::ELABORATES, "elaborates"},
    {RelationType::SIMILAR_TO, "similar_to"},
    {RelationType::INSTANCE_OF, "instance_of"},
    {RelationType::PART_OF, "part_of"},
    {RelationType::TRIGGERS, "triggers"},
    {RelationType::RESOLVES, "resolves"},
};

const std::pair<ResultType, const char*> kResultNames[] = {
    {ResultType::ACTION, "action"},
    {ResultType::RESPONSE, "response"},
    {ResultType::INSIGHT, "insight"},
    {ResultType::DECISION, "decision"},
    {ResultType::SKILL_LEARNED, "skill_learned"},
    {ResultType::FACT_DISCOVERED, "fact_discovered"},
    {ResultType::ERROR, "error"},
    {ResultType::DEFERRED, "deferred"},
};

// Qdrant spells distances in PascalCase
const std::pair<Distance, const char*> kDistanceNames[] = {
    {Distance::COSINE, "Cosine"},
    {Distance::EUCLID, "Euclid"},
    {Distance::DOT, "Dot"},
    {Distance::MANHATTAN, "Manhattan"},
};

const std::pair<CollectionStatus, const char*> kStatusNames[] = {
    {CollectionStatus::GREEN, "green"},
    {CollectionStatus::YELLOW, "yellow"},
    {CollectionStatus::RED, "red"},
    {CollectionStatus::GREY, "grey"},
};

const std::pair<LinkType, const char*> kLinkNames[] = {
    {LinkType::DEPENDS_ON, "depends_on"},
    {LinkType::INDEXES, "indexes"},
    {LinkType::EXTENDS, "extends"},
    {LinkType::MIRRORS, "mirrors"},
    {LinkType::AGGREGATES, "aggregates"},
    {LinkType::PART_OF, "part_of"},
    {LinkType::RELATED_TO, "related_to"},
};

const std::pair<MemoryLayer, const char*> kLayerNames[] = {
    {MemoryLayer::WORKING, "Working"},
    {MemoryLayer::EPISODIC, "Episodic"},
    {MemoryLayer::SEMANTIC, "Semantic"},
    {MemoryLayer::PROCEDURAL, "Procedural"},
    {MemoryLayer::AUTOBIOGRAPHICAL, "Autobiographical"},
};

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // namespace

// -----------------------------------------------------------------------------
// ThoughtType / ThoughtOrigin
// -----------------------------------------------------------------------------

ThoughtType ThoughtType::parse(const std::string& name) {
    if (auto kind = lookup(kThoughtTypeNames, name)) {
        return ThoughtType(*kind);
    }
    ThoughtType type(Kind::OTHER);
    type.other_ = name;
    return type;
}

ThoughtType ThoughtType::other(const std::string& name) {
    return parse(name);
}

std::string ThoughtType::name() const {
    if (kind_ == Kind::OTHER) {
        return other_;
    }
    return reverse_lookup(kThoughtTypeNames, kind_);
}

ThoughtOrigin ThoughtOrigin::parse(const std::string& name) {
    if (auto kind = lookup(kOriginNames, name)) {
        return ThoughtOrigin(*kind);
    }
    ThoughtOrigin origin(Kind::OTHER);
    origin.other_ = name;
    return origin;
}

std::string ThoughtOrigin::name() const {
    if (kind_ == Kind::OTHER) {
        return other_;
    }
    return reverse_lookup(kOriginNames, kind_);
}

// -----------------------------------------------------------------------------
// Records
// -----------------------------------------------------------------------------

bool Thought::operator==(const Thought& rhs) const {
    return id == rhs.id &&
           session_id == rhs.session_id &&
           type == rhs.type &&
           origin == rhs.origin &&
           content == rhs.content &&
           confidence == rhs.confidence &&
           relevance == rhs.relevance &&
           timestamp == rhs.timestamp &&
           parent_thought_id == rhs.parent_thought_id &&
           topic == rhs.topic &&
           tags == rhs.tags &&
           metadata_json == rhs.metadata_json;
}

bool Relation::operator==(const Relation& rhs) const {
    return id == rhs.id &&
           source_thought_id == rhs.source_thought_id &&
           target_thought_id == rhs.target_thought_id &&
           type == rhs.type &&
           strength == rhs.strength &&
           created_at == rhs.created_at &&
           metadata_json == rhs.metadata_json;
}

bool ThoughtResult::operator==(const ThoughtResult& rhs) const {
    return id == rhs.id &&
           thought_id == rhs.thought_id &&
           type == rhs.type &&
           content == rhs.content &&
           success == rhs.success &&
           confidence == rhs.confidence &&
           created_at == rhs.created_at &&
           execution_time_ms == rhs.execution_time_ms &&
           metadata_json == rhs.metadata_json;
}

// -----------------------------------------------------------------------------
// Enum names
// -----------------------------------------------------------------------------

const char* to_string(RelationType type) {
    return reverse_lookup(kRelationNames, type);
}

std::optional<RelationType> parse_relation_type(const std::string& name) {
    return lookup(kRelationNames, lowercase(name));
}

const char* to_string(ResultType type) {
    return reverse_lookup(kResultNames, type);
}

std::optional<ResultType> parse_result_type(const std::string& name) {
    return lookup(kResultNames, lowercase(name));
}

const char* to_string(Distance distance) {
    return reverse_lookup(kDistanceNames, distance);
}

std::optional<Distance> parse_distance(const std::string& name) {
    for (const auto& entry : kDistanceNames) {
        if (lowercase(name) == lowercase(entry.second)) {
            return entry.first;
        }
    }
    return std::nullopt;
}

const char* to_string(CollectionStatus status) {
    return reverse_lookup(kStatusNames, status);
}

CollectionStatus parse_collection_status(const std::string& name) {
    return lookup(kStatusNames, lowercase(name)).value_or(CollectionStatus::GREY);
}

const char* to_string(LinkType type) {
    return reverse_lookup(kLinkNames, type);
}

std::optional<LinkType> parse_link_type(const std::string& name) {
    return lookup(kLinkNames, lowercase(name));
}

const char* to_string(MemoryLayer layer) {
    return reverse_lookup(kLayerNames, layer);
}

std::optional<MemoryLayer> parse_memory_layer(const std::string& name) {
    for (const auto& entry : kLayerNames) {
        if (lowercase(name) == lowercase(entry.second)) {
            return entry.first;
        }
    }
    return std::nullopt;
}

const std::vector<MemoryLayer>& all_memory_layers() {
    static const std::vector<MemoryLayer> layers = {
        MemoryLayer::WORKING,
        MemoryLayer::EPISODIC,
        MemoryLayer::SEMANTIC,
        MemoryLayer::PROCEDURAL,
        MemoryLayer::AUTOBIOGRAPHICAL,
    };
    return layers;
}

} // namespace engram
