#pragma once

#include "engram/relation_graph.hpp"
#include "engram/thought_store.hpp"
#include <map>
#include <memory>
#include <optional>
#include <vector>

namespace engram {

using CausalChain = std::vector<Thought>;

/**
 * Thoughts of one session and their outgoing relation edges, loaded with one
 * scroll per collection so a walk issues no further backend calls.
 */
struct SessionGraph {
    std::map<Uuid, Thought> thoughts;
    std::map<Uuid, std::vector<Uuid>> outgoing;
};

/**
 * Reconstructs reasoning traces by walking outgoing relations depth-first.
 *
 * The visited set only covers the current path, so a thought can appear in
 * several chains but never twice in one. A path ends when it holds max_depth
 * thoughts (the finder's default depth when none is given) or its last thought has no edge to an unvisited thought of the
 * session; every such path longer than one thought is returned.
 *
 * The number of chains grows exponentially with branching and depth. Keep
 * max_depth small and sample start nodes for aggregate statistics.
 */
class CausalChainFinder {
public:
    CausalChainFinder(std::shared_ptr<ThoughtStore> thoughts,
                      std::shared_ptr<RelationGraph> relations,
                      size_t default_depth = 5);

    std::vector<CausalChain> find_causal_chains(const std::string& session_id,
                                                const Uuid& start_id,
                                                std::optional<size_t> max_depth = std::nullopt,
                                                const CancellationToken& token = {}) const;

    SessionGraph load_session_graph(const std::string& session_id,
                                    const CancellationToken& token = {}) const;

    // Empty when start_id is not a thought of the graph.
    static std::vector<CausalChain> find_chains(const SessionGraph& graph,
                                                const Uuid& start_id,
                                                size_t max_depth);

private:
    std::shared_ptr<ThoughtStore> thoughts_;
    std::shared_ptr<RelationGraph> relations_;
    size_t default_depth_;
};

} // namespace engram
