#pragma once

#include "engram/causal_chain.hpp"
#include "engram/config.hpp"
#include "engram/relation_graph.hpp"
#include "engram/relation_inference.hpp"
#include "engram/thought_store.hpp"
#include <memory>
#include <optional>
#include <vector>

namespace engram {

struct SymbolicMatch {
    Thought source;
    Relation relation;
};

/**
 * Thought store, relation graph, result store, inference and chain finding
 * wired over one backend and one embedding function.
 */
class NeuroSymbolicMemory {
public:
    NeuroSymbolicMemory(std::shared_ptr<VectorBackendClient> backend,
                        const EngramConfig& config,
                        EmbeddingFunction embed = nullptr);

    // Creates the thought, relation and result collections if absent.
    void initialize(const CancellationToken& token = {});

    ThoughtStore& thoughts() { return *thoughts_; }
    RelationGraph& relations() { return *relations_; }
    ResultStore& results() { return *results_; }
    RelationInferenceEngine& inference() { return *inference_; }
    const CausalChainFinder& chains() const { return *chains_; }

    bool supports_semantic_search() const { return thoughts_->has_embeddings(); }

    /**
     * Counts per kind plus chain figures. Chain roots are thoughts that no
     * relation points at; the average chain length is the mean of the longest
     * chain from at most chain_sample_size roots, walked to depth 10.
     */
    NeuroSymbolicStats get_neuro_symbolic_stats(const std::string& session_id,
                                                const CancellationToken& token = {}) const;

    /**
     * "?x <relation> <target_type>": every relation of the given type whose
     * source is a thought of the session, optionally restricted to targets of
     * one thought type.
     */
    std::vector<SymbolicMatch> query_symbolic(const std::string& session_id,
                                              RelationType relation_type,
                                              const std::optional<ThoughtType>& target_type = std::nullopt,
                                              const CancellationToken& token = {}) const;

    size_t skipped_records() const;

private:
    std::shared_ptr<ThoughtStore> thoughts_;
    std::shared_ptr<RelationGraph> relations_;
    std::shared_ptr<ResultStore> results_;
    std::shared_ptr<RelationInferenceEngine> inference_;
    std::shared_ptr<CausalChainFinder> chains_;
    size_t chain_sample_size_;
};

} // namespace engram
