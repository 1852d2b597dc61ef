#include "engram/neuro_symbolic_memory.hpp"
#include "engram/logging.hpp"
#include <algorithm>
#include <set>

namespace engram {

namespace {

constexpr size_t kStatsChainDepth = 10;

InferenceOptions inference_options(const InferenceConfig& config) {
    InferenceOptions options;
    options.similarity_threshold = config.similarity_threshold;
    options.recent_window = config.recent_window;
    return options;
}

} // namespace

NeuroSymbolicMemory::NeuroSymbolicMemory(std::shared_ptr<VectorBackendClient> backend,
                                         const EngramConfig& config,
                                         EmbeddingFunction embed)
    : chain_sample_size_(config.store.chain_sample_size) {
    thoughts_ = std::make_shared<ThoughtStore>(backend, config.collections, config.store, embed);
    relations_ = std::make_shared<RelationGraph>(backend, config.collections, config.store, embed);
    results_ = std::make_shared<ResultStore>(backend, relations_, config.collections, config.store, embed);
    inference_ = std::make_shared<RelationInferenceEngine>(thoughts_, relations_, embed,
                                                           inference_options(config.inference));
    chains_ = std::make_shared<CausalChainFinder>(thoughts_, relations_,
                                                  config.store.chain_max_depth);
}

void NeuroSymbolicMemory::initialize(const CancellationToken& token) {
    thoughts_->ensure_collection(token);
    relations_->ensure_collection(token);
    results_->ensure_collection(token);
    ENGRAM_LOG_INFO("Neuro-symbolic memory ready (" + thoughts_->collection() + ", " +
                    relations_->collection() + ", " + results_->collection() + ")");
}

NeuroSymbolicStats NeuroSymbolicMemory::get_neuro_symbolic_stats(const std::string& session_id,
                                                                 const CancellationToken& token) const {
    auto relations = relations_->get_session_relations(session_id, token);
    SessionGraph graph;
    for (auto& thought : thoughts_->get_thoughts(session_id, token)) {
        Uuid id = thought.id;
        graph.thoughts.emplace(id, std::move(thought));
    }
    for (const auto& relation : relations) {
        graph.outgoing[relation.source_thought_id].push_back(relation.target_thought_id);
    }
    auto results = results_->get_session_results(session_id, token);

    NeuroSymbolicStats stats;
    stats.total_thoughts = graph.thoughts.size();
    stats.total_relations = relations.size();
    stats.total_results = results.size();

    std::set<Uuid> targets;
    for (const auto& relation : relations) {
        ++stats.relations_by_type[to_string(relation.type)];
        targets.insert(relation.target_thought_id);
    }
    for (const auto& result : results) {
        ++stats.results_by_type[to_string(result.type)];
    }

    // Roots in timestamp order so the sample is deterministic
    std::vector<const Thought*> roots;
    for (const auto& entry : graph.thoughts) {
        const Thought& thought = entry.second;
        ++stats.thoughts_by_type[thought.type.name()];
        if (!stats.oldest || thought.timestamp < *stats.oldest) stats.oldest = thought.timestamp;
        if (!stats.newest || thought.timestamp > *stats.newest) stats.newest = thought.timestamp;
        if (targets.count(thought.id) == 0) {
            roots.push_back(&thought);
        }
    }
    std::stable_sort(roots.begin(), roots.end(),
                     [](const Thought* a, const Thought* b) { return a->timestamp < b->timestamp; });
    stats.causal_chain_count = roots.size();

    const size_t sample = std::min(roots.size(), chain_sample_size_);
    if (sample > 0) {
        size_t total_length = 0;
        for (size_t i = 0; i < sample; ++i) {
            token.check(__func__);
            size_t longest = 0;
            for (const auto& chain : CausalChainFinder::find_chains(graph, roots[i]->id, kStatsChainDepth)) {
                longest = std::max(longest, chain.size());
            }
            total_length += longest;
        }
        stats.average_chain_length = static_cast<double>(total_length) / sample;
    }
    return stats;
}

std::vector<SymbolicMatch> NeuroSymbolicMemory::query_symbolic(const std::string& session_id,
                                                               RelationType relation_type,
                                                               const std::optional<ThoughtType>& target_type,
                                                               const CancellationToken& token) const {
    auto relations = relations_->get_relations_by_type(session_id, relation_type, token);
    std::map<Uuid, Thought> thoughts;
    for (auto& thought : thoughts_->get_thoughts(session_id, token)) {
        Uuid id = thought.id;
        thoughts.emplace(id, std::move(thought));
    }

    std::vector<SymbolicMatch> matches;
    for (const auto& relation : relations) {
        auto source = thoughts.find(relation.source_thought_id);
        if (source == thoughts.end()) {
            continue;
        }
        if (target_type) {
            auto target = thoughts.find(relation.target_thought_id);
            if (target == thoughts.end() || target->second.type != *target_type) {
                continue;
            }
        }
        matches.push_back({source->second, relation});
    }
    return matches;
}

size_t NeuroSymbolicMemory::skipped_records() const {
    return thoughts_->skipped_records() + relations_->skipped_records() + results_->skipped_records();
}

} // namespace engram
