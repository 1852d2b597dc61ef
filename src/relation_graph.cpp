#include "engram/relation_graph.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"
#include "engram/payload_codec.hpp"
#include <algorithm>

namespace engram {

// =============================================================================
// RelationGraph
// =============================================================================

RelationGraph::RelationGraph(std::shared_ptr<VectorBackendClient> backend,
                             const CollectionNames& collections,
                             const StoreConfig& config,
                             EmbeddingFunction embed)
    : CollectionStore(std::move(backend), collections.relations, config, std::move(embed)) {}

void RelationGraph::save_relation(const std::string& session_id, const Relation& relation,
                                  const CancellationToken& token) {
    ENGRAM_CHECK_ARGUMENT(!session_id.empty(), "session_id must not be empty");

    auto lock = session_locks_.acquire(session_id);
    token.check(__func__);

    const std::string text = std::string(to_string(relation.type)) + ": " +
                             to_string(relation.source_thought_id) + " -> " +
                             to_string(relation.target_thought_id);
    Point point;
    point.id = to_string(relation.id);
    point.vector = embed(text);
    point.payload = encode_relation(session_id, relation);
    write_points({point}, token);

    ENGRAM_LOG_DEBUG("Saved relation " + text);
}

std::vector<Relation> RelationGraph::read(const PointFilter& filter, const CancellationToken& token) const {
    auto relations = decode_points<Relation>(scroll_all(filter, token), decode_relation);
    std::stable_sort(relations.begin(), relations.end(),
                     [](const Relation& a, const Relation& b) { return a.created_at < b.created_at; });
    return relations;
}

std::vector<Relation> RelationGraph::get_relations_for_thought(const Uuid& thought_id,
                                                               const CancellationToken& token) const {
    PointFilter filter;
    filter.or_equals("source_thought_id", to_string(thought_id));
    filter.or_equals("target_thought_id", to_string(thought_id));
    return read(filter, token);
}

std::vector<Relation> RelationGraph::get_outgoing_relations(const Uuid& thought_id,
                                                            const CancellationToken& token) const {
    return read(PointFilter::field_equals("source_thought_id", to_string(thought_id)), token);
}

std::vector<Relation> RelationGraph::get_session_relations(const std::string& session_id,
                                                           const CancellationToken& token) const {
    return read(PointFilter::field_equals("session_id", session_id), token);
}

std::vector<Relation> RelationGraph::get_relations_by_type(const std::string& session_id,
                                                           RelationType type,
                                                           const CancellationToken& token) const {
    auto filter = PointFilter::field_equals("session_id", session_id);
    filter.and_equals("relation_type", to_string(type));
    return read(filter, token);
}

// =============================================================================
// ResultStore
// =============================================================================

ResultStore::ResultStore(std::shared_ptr<VectorBackendClient> backend,
                         std::shared_ptr<RelationGraph> relations,
                         const CollectionNames& collections,
                         const StoreConfig& config,
                         EmbeddingFunction embed)
    : CollectionStore(std::move(backend), collections.results, config, std::move(embed))
    , relations_(std::move(relations)) {
    ENGRAM_CHECK_ARGUMENT(relations_ != nullptr, "ResultStore requires a RelationGraph");
}

Relation ResultStore::save_result(const std::string& session_id, const ThoughtResult& result,
                                  const CancellationToken& token) {
    ENGRAM_CHECK_ARGUMENT(!session_id.empty(), "session_id must not be empty");

    {
        auto lock = session_locks_.acquire(session_id);
        token.check(__func__);

        Point point;
        point.id = to_string(result.id);
        point.vector = embed(result.content);
        point.payload = encode_result(session_id, result);
        write_points({point}, token);
    }

    Relation relation;
    relation.id = generate_uuid();
    relation.source_thought_id = result.thought_id;
    relation.target_thought_id = result.id;
    relation.type = result.success ? RelationType::LEADS_TO : RelationType::TRIGGERS;
    relation.strength = std::clamp(result.confidence, 0.0, 1.0);
    relation.created_at = std::chrono::system_clock::now();
    relations_->save_relation(session_id, relation, token);
    return relation;
}

std::vector<ThoughtResult> ResultStore::read(const PointFilter& filter, const CancellationToken& token) const {
    auto results = decode_points<ThoughtResult>(scroll_all(filter, token), decode_result);
    std::stable_sort(results.begin(), results.end(),
                     [](const ThoughtResult& a, const ThoughtResult& b) { return a.created_at < b.created_at; });
    return results;
}

std::vector<ThoughtResult> ResultStore::get_results_for_thought(const Uuid& thought_id,
                                                                const CancellationToken& token) const {
    return read(PointFilter::field_equals("thought_id", to_string(thought_id)), token);
}

std::vector<ThoughtResult> ResultStore::get_session_results(const std::string& session_id,
                                                            const CancellationToken& token) const {
    return read(PointFilter::field_equals("session_id", session_id), token);
}

} // namespace engram
