#pragma once

#include "engram/collection_store.hpp"
#include "engram/types.hpp"
#include <memory>
#include <string>
#include <vector>

namespace engram {

/**
 * Typed, directed edges between thoughts. Each edge is a point whose vector
 * embeds "<type>: <source> -> <target>" so relations are searchable too.
 * Referential integrity with the thoughts collection is not enforced.
 */
class RelationGraph : public CollectionStore {
public:
    RelationGraph(std::shared_ptr<VectorBackendClient> backend,
                  const CollectionNames& collections,
                  const StoreConfig& config,
                  EmbeddingFunction embed = nullptr);

    void save_relation(const std::string& session_id, const Relation& relation,
                       const CancellationToken& token = {});

    // Incoming and outgoing edges of a thought, in any session.
    std::vector<Relation> get_relations_for_thought(const Uuid& thought_id,
                                                    const CancellationToken& token = {}) const;

    std::vector<Relation> get_outgoing_relations(const Uuid& thought_id,
                                                 const CancellationToken& token = {}) const;

    std::vector<Relation> get_session_relations(const std::string& session_id,
                                                const CancellationToken& token = {}) const;

    std::vector<Relation> get_relations_by_type(const std::string& session_id,
                                                RelationType type,
                                                const CancellationToken& token = {}) const;

private:
    std::vector<Relation> read(const PointFilter& filter, const CancellationToken& token) const;
};

/**
 * Outcome records attached to thoughts. Saving a result also records a
 * thought -> result edge: leads_to on success, triggers on failure, with the
 * result's confidence as strength.
 */
class ResultStore : public CollectionStore {
public:
    ResultStore(std::shared_ptr<VectorBackendClient> backend,
                std::shared_ptr<RelationGraph> relations,
                const CollectionNames& collections,
                const StoreConfig& config,
                EmbeddingFunction embed = nullptr);

    // Returns the implicit relation that was saved with the result.
    Relation save_result(const std::string& session_id, const ThoughtResult& result,
                         const CancellationToken& token = {});

    std::vector<ThoughtResult> get_results_for_thought(const Uuid& thought_id,
                                                       const CancellationToken& token = {}) const;

    std::vector<ThoughtResult> get_session_results(const std::string& session_id,
                                                   const CancellationToken& token = {}) const;

private:
    std::vector<ThoughtResult> read(const PointFilter& filter, const CancellationToken& token) const;

    std::shared_ptr<RelationGraph> relations_;
};

} // namespace engram
