#include "engram/causal_chain.hpp"
#include "engram/error.hpp"
#include <set>

namespace engram {

CausalChainFinder::CausalChainFinder(std::shared_ptr<ThoughtStore> thoughts,
                                     std::shared_ptr<RelationGraph> relations,
                                     size_t default_depth)
    : thoughts_(std::move(thoughts))
    , relations_(std::move(relations))
    , default_depth_(default_depth) {
    ENGRAM_CHECK_ARGUMENT(thoughts_ != nullptr && relations_ != nullptr,
                          "CausalChainFinder requires a thought store and a relation graph");
}

SessionGraph CausalChainFinder::load_session_graph(const std::string& session_id,
                                                   const CancellationToken& token) const {
    SessionGraph graph;
    for (auto& thought : thoughts_->get_thoughts(session_id, token)) {
        Uuid id = thought.id;
        graph.thoughts.emplace(id, std::move(thought));
    }
    // Relations come back ordered by creation time, so edge order is stable.
    for (const auto& relation : relations_->get_session_relations(session_id, token)) {
        graph.outgoing[relation.source_thought_id].push_back(relation.target_thought_id);
    }
    return graph;
}

std::vector<CausalChain> CausalChainFinder::find_causal_chains(const std::string& session_id,
                                                               const Uuid& start_id,
                                                               std::optional<size_t> max_depth,
                                                               const CancellationToken& token) const {
    return find_chains(load_session_graph(session_id, token), start_id,
                       max_depth.value_or(default_depth_));
}

std::vector<CausalChain> CausalChainFinder::find_chains(const SessionGraph& graph,
                                                        const Uuid& start_id,
                                                        size_t max_depth) {
    std::vector<CausalChain> chains;
    if (graph.thoughts.count(start_id) == 0 || max_depth < 2) {
        return chains;
    }

    struct Frame {
        Uuid node;
        size_t next_edge = 0;
        bool extended = false;
    };

    static const std::vector<Uuid> kNoEdges;
    auto edges_of = [&graph](const Uuid& node) -> const std::vector<Uuid>& {
        auto it = graph.outgoing.find(node);
        return it == graph.outgoing.end() ? kNoEdges : it->second;
    };

    auto record = [&](const std::vector<Frame>& stack) {
        if (stack.size() < 2) return;
        CausalChain chain;
        chain.reserve(stack.size());
        for (const auto& frame : stack) {
            chain.push_back(graph.thoughts.at(frame.node));
        }
        chains.push_back(std::move(chain));
    };

    std::vector<Frame> stack;
    std::set<Uuid> on_path;
    stack.push_back({start_id});
    on_path.insert(start_id);

    while (!stack.empty()) {
        Frame& top = stack.back();

        bool descended = false;
        if (stack.size() < max_depth) {
            const auto& edges = edges_of(top.node);
            while (top.next_edge < edges.size()) {
                const Uuid& next = edges[top.next_edge++];
                if (on_path.count(next) > 0 || graph.thoughts.count(next) == 0) {
                    continue;
                }
                top.extended = true;
                on_path.insert(next);
                stack.push_back({next});
                descended = true;
                break;
            }
        }
        if (descended) {
            continue;
        }

        // Nothing left to explore below this node; a leaf ends a chain.
        if (!stack.back().extended) {
            record(stack);
        }
        on_path.erase(stack.back().node);
        stack.pop_back();
    }
    return chains;
}

} // namespace engram
