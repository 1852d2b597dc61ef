#pragma once

#include "engram/embedding_client.hpp"
#include "engram/relation_graph.hpp"
#include "engram/thought_store.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace engram {

/**
 * One row of the (existing type, new type) -> relation type table.
 * An empty side matches any type.
 */
struct RelationTypeRule {
    std::optional<ThoughtType> existing;
    std::optional<ThoughtType> incoming;
    RelationType relation = RelationType::SIMILAR_TO;

    bool matches(const ThoughtType& existing_type, const ThoughtType& incoming_type) const;
};

// Fixed heuristic table, first match wins. Not learned.
std::vector<RelationTypeRule> default_relation_rules();

struct InferenceOptions {
    // Pairs must score strictly above this to be linked.
    double similarity_threshold = 0.7;
    // How many of the session's most recent thoughts are compared.
    size_t recent_window = 10;
    std::vector<RelationTypeRule> rules = default_relation_rules();
    RelationType fallback = RelationType::SIMILAR_TO;
};

/**
 * Links a newly saved thought to similar recent thoughts of its session.
 *
 * Edges run from the earlier thought to the new one, with the cosine
 * similarity (clamped to [0, 1]) as strength. A recent thought that is the
 * new thought's parent is always linked with `refines`, whatever the score.
 * Without an embedding function nothing is inferred.
 */
class RelationInferenceEngine {
public:
    RelationInferenceEngine(std::shared_ptr<ThoughtStore> thoughts,
                            std::shared_ptr<RelationGraph> relations,
                            EmbeddingFunction embed,
                            InferenceOptions options = {});

    // Saves the thought, then the inferred relations, and returns the latter.
    std::vector<Relation> save_with_relations(const std::string& session_id,
                                              const Thought& thought,
                                              bool auto_infer = true,
                                              const CancellationToken& token = {});

    RelationType infer_relation_type(const Thought& existing, const Thought& incoming) const;

    const InferenceOptions& options() const { return options_; }

private:
    std::shared_ptr<ThoughtStore> thoughts_;
    std::shared_ptr<RelationGraph> relations_;
    EmbeddingFunction embed_;
    InferenceOptions options_;
};

} // namespace engram
