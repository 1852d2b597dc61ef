#include "engram/relation_inference.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"
#include "engram/similarity.hpp"
#include <algorithm>

namespace engram {

bool RelationTypeRule::matches(const ThoughtType& existing_type, const ThoughtType& incoming_type) const {
    return (!existing || *existing == existing_type) &&
           (!incoming || *incoming == incoming_type);
}

std::vector<RelationTypeRule> default_relation_rules() {
    using K = ThoughtType::Kind;
    const std::optional<ThoughtType> any;
    return {
        {ThoughtType(K::OBSERVATION), ThoughtType(K::ANALYTICAL), RelationType::LEADS_TO},
        {ThoughtType(K::ANALYTICAL), ThoughtType(K::DECISION), RelationType::LEADS_TO},
        {ThoughtType(K::EMOTIONAL), ThoughtType(K::SELF_REFLECTION), RelationType::TRIGGERS},
        {ThoughtType(K::MEMORY_RECALL), any, RelationType::SUPPORTS},
        {ThoughtType(K::STRATEGIC), ThoughtType(K::DECISION), RelationType::LEADS_TO},
        {ThoughtType(K::SYNTHESIS), any, RelationType::ABSTRACTS},
        {ThoughtType(K::CREATIVE), any, RelationType::ELABORATES},
        {any, ThoughtType(K::SYNTHESIS), RelationType::PART_OF},
        {any, ThoughtType(K::DECISION), RelationType::LEADS_TO},
    };
}

RelationInferenceEngine::RelationInferenceEngine(std::shared_ptr<ThoughtStore> thoughts,
                                                 std::shared_ptr<RelationGraph> relations,
                                                 EmbeddingFunction embed,
                                                 InferenceOptions options)
    : thoughts_(std::move(thoughts))
    , relations_(std::move(relations))
    , embed_(std::move(embed))
    , options_(std::move(options)) {
    ENGRAM_CHECK_ARGUMENT(thoughts_ != nullptr && relations_ != nullptr,
                          "RelationInferenceEngine requires a thought store and a relation graph");
    ENGRAM_CHECK_ARGUMENT(options_.similarity_threshold >= 0.0 && options_.similarity_threshold <= 1.0,
                          "similarity_threshold must lie in [0, 1]");
}

RelationType RelationInferenceEngine::infer_relation_type(const Thought& existing,
                                                          const Thought& incoming) const {
    if (incoming.parent_thought_id && *incoming.parent_thought_id == existing.id) {
        return RelationType::REFINES;
    }
    for (const auto& rule : options_.rules) {
        if (rule.matches(existing.type, incoming.type)) {
            return rule.relation;
        }
    }
    return options_.fallback;
}

std::vector<Relation> RelationInferenceEngine::save_with_relations(const std::string& session_id,
                                                                   const Thought& thought,
                                                                   bool auto_infer,
                                                                   const CancellationToken& token) {
    thoughts_->save_thought(session_id, thought, token);

    std::vector<Relation> created;
    if (!auto_infer || !embed_) {
        return created;
    }

    // One extra so the window still holds recent_window others after
    // dropping the thought just saved.
    auto recent = thoughts_->get_recent_thoughts(session_id, options_.recent_window + 1, token);
    recent.erase(std::remove_if(recent.begin(), recent.end(),
                                [&](const Thought& t) { return t.id == thought.id; }),
                 recent.end());
    if (recent.size() > options_.recent_window) {
        recent.resize(options_.recent_window);
    }
    if (recent.empty()) {
        return created;
    }

    const auto embedding = embed_(thought.content);
    for (const auto& existing : recent) {
        token.check(__func__);
        const double similarity = cosine_similarity(embedding, embed_(existing.content));
        const bool is_parent = thought.parent_thought_id && *thought.parent_thought_id == existing.id;
        if (!is_parent && similarity <= options_.similarity_threshold) {
            continue;
        }

        Relation relation;
        relation.id = generate_uuid();
        relation.source_thought_id = existing.id;
        relation.target_thought_id = thought.id;
        relation.type = infer_relation_type(existing, thought);
        relation.strength = std::clamp(similarity, 0.0, 1.0);
        relation.created_at = std::chrono::system_clock::now();

        relations_->save_relation(session_id, relation, token);
        created.push_back(relation);
    }

    if (!created.empty()) {
        ENGRAM_LOG_DEBUG("Inferred " + std::to_string(created.size()) + " relation(s) for thought " +
                         to_string(thought.id));
    }
    return created;
}

} // namespace engram
