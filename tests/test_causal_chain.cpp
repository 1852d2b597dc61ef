// =============================================================================
// Causal Chain and Neuro-Symbolic Memory Tests
// =============================================================================

#include <gtest/gtest.h>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "engram/causal_chain.hpp"
#include "engram/config.hpp"
#include "engram/in_memory_backend.hpp"
#include "engram/neuro_symbolic_memory.hpp"

using namespace engram;

namespace {

std::vector<std::string> contents(const CausalChain& chain) {
    std::vector<std::string> out;
    for (const auto& thought : chain) {
        out.push_back(thought.content);
    }
    return out;
}

} // namespace

// -----------------------------------------------------------------------------
// Graph walk
// -----------------------------------------------------------------------------

class CausalChainWalkTest : public ::testing::Test {
protected:
    Uuid add(const std::string& name) {
        Thought thought;
        thought.id = generate_uuid();
        thought.content = name;
        ids_[name] = thought.id;
        graph_.thoughts.emplace(thought.id, thought);
        return thought.id;
    }

    void link(const std::string& from, const std::string& to) {
        graph_.outgoing[ids_.at(from)].push_back(ids_.at(to));
    }

    SessionGraph graph_;
    std::map<std::string, Uuid> ids_;
};

TEST_F(CausalChainWalkTest, LinearChain) {
    add("A"); add("B"); add("C");
    link("A", "B");
    link("B", "C");

    auto chains = CausalChainFinder::find_chains(graph_, ids_["A"], 5);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(contents(chains[0]), (std::vector<std::string>{"A", "B", "C"}));
}

TEST_F(CausalChainWalkTest, CycleDoesNotRepeatThoughts) {
    add("A"); add("B");
    link("A", "B");
    link("B", "A");

    auto chains = CausalChainFinder::find_chains(graph_, ids_["A"], 5);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(contents(chains[0]), (std::vector<std::string>{"A", "B"}));
}

TEST_F(CausalChainWalkTest, BranchingYieldsOneChainPerLeaf) {
    add("A"); add("B"); add("C"); add("D");
    link("A", "B");
    link("A", "C");
    link("B", "D");

    auto chains = CausalChainFinder::find_chains(graph_, ids_["A"], 5);
    ASSERT_EQ(chains.size(), 2u);
    EXPECT_EQ(contents(chains[0]), (std::vector<std::string>{"A", "B", "D"}));
    EXPECT_EQ(contents(chains[1]), (std::vector<std::string>{"A", "C"}));
}

TEST_F(CausalChainWalkTest, DepthBoundsChainLength) {
    add("A"); add("B"); add("C"); add("D");
    link("A", "B");
    link("B", "C");
    link("C", "D");

    auto chains = CausalChainFinder::find_chains(graph_, ids_["A"], 2);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(contents(chains[0]), (std::vector<std::string>{"A", "B"}));

    EXPECT_TRUE(CausalChainFinder::find_chains(graph_, ids_["A"], 1).empty());
}

TEST_F(CausalChainWalkTest, IsolatedOrUnknownStartHasNoChains) {
    add("A");
    EXPECT_TRUE(CausalChainFinder::find_chains(graph_, ids_["A"], 5).empty());
    EXPECT_TRUE(CausalChainFinder::find_chains(graph_, generate_uuid(), 5).empty());
}

TEST_F(CausalChainWalkTest, EdgesToUnknownNodesIgnored) {
    add("A"); add("B");
    link("A", "B");
    graph_.outgoing[ids_["B"]].push_back(generate_uuid());

    auto chains = CausalChainFinder::find_chains(graph_, ids_["A"], 5);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(contents(chains[0]), (std::vector<std::string>{"A", "B"}));
}

// -----------------------------------------------------------------------------
// Backed by stores
// -----------------------------------------------------------------------------

class NeuroSymbolicMemoryTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<InMemoryVectorBackend>();
        config_ = default_config();
        config_.store.vector_size = 3;
        memory_ = std::make_unique<NeuroSymbolicMemory>(backend_, config_);
        memory_->initialize();
    }

    Thought save(const std::string& content, ThoughtType type, int seconds) {
        Thought thought;
        thought.id = generate_uuid();
        thought.session_id = "session-1";
        thought.type = type;
        thought.content = content;
        thought.timestamp = *parse_iso8601("2024-05-01T12:00:00Z") + std::chrono::seconds(seconds);
        memory_->thoughts().save_thought("session-1", thought);
        return thought;
    }

    void relate(const Thought& source, const Thought& target, RelationType type) {
        Relation relation;
        relation.id = generate_uuid();
        relation.source_thought_id = source.id;
        relation.target_thought_id = target.id;
        relation.type = type;
        relation.created_at = std::chrono::system_clock::now();
        memory_->relations().save_relation("session-1", relation);
    }

    std::shared_ptr<InMemoryVectorBackend> backend_;
    EngramConfig config_;
    std::unique_ptr<NeuroSymbolicMemory> memory_;
};

TEST_F(NeuroSymbolicMemoryTest, InitializeCreatesCollections) {
    EXPECT_TRUE(backend_->collection_exists(config_.collections.thoughts));
    EXPECT_TRUE(backend_->collection_exists(config_.collections.relations));
    EXPECT_TRUE(backend_->collection_exists(config_.collections.results));
    EXPECT_FALSE(memory_->supports_semantic_search());
}

TEST_F(NeuroSymbolicMemoryTest, FindsChainsThroughStores) {
    Thought a = save("A", ThoughtType::Kind::OBSERVATION, 0);
    Thought b = save("B", ThoughtType::Kind::ANALYTICAL, 1);
    Thought c = save("C", ThoughtType::Kind::DECISION, 2);
    relate(a, b, RelationType::LEADS_TO);
    relate(b, c, RelationType::LEADS_TO);

    auto chains = memory_->chains().find_causal_chains("session-1", a.id);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(contents(chains[0]), (std::vector<std::string>{"A", "B", "C"}));

    EXPECT_TRUE(memory_->chains().find_causal_chains("session-2", a.id).empty());
}

TEST_F(NeuroSymbolicMemoryTest, ConfiguredDepthBoundsChains) {
    EngramConfig shallow = config_;
    shallow.store.chain_max_depth = 2;
    NeuroSymbolicMemory memory(backend_, shallow);

    Thought a = save("A", ThoughtType::Kind::OBSERVATION, 0);
    Thought b = save("B", ThoughtType::Kind::ANALYTICAL, 1);
    Thought c = save("C", ThoughtType::Kind::DECISION, 2);
    relate(a, b, RelationType::LEADS_TO);
    relate(b, c, RelationType::LEADS_TO);

    auto chains = memory.chains().find_causal_chains("session-1", a.id);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(contents(chains[0]), (std::vector<std::string>{"A", "B"}));

    // An explicit depth overrides the configured one
    chains = memory.chains().find_causal_chains("session-1", a.id, 3);
    ASSERT_EQ(chains.size(), 1u);
    EXPECT_EQ(contents(chains[0]), (std::vector<std::string>{"A", "B", "C"}));
}

TEST_F(NeuroSymbolicMemoryTest, StatisticsCountRootsAndChainLength) {
    Thought a = save("A", ThoughtType::Kind::OBSERVATION, 0);
    Thought b = save("B", ThoughtType::Kind::ANALYTICAL, 1);
    Thought c = save("C", ThoughtType::Kind::DECISION, 2);
    save("D", ThoughtType::Kind::OBSERVATION, 3);
    relate(a, b, RelationType::LEADS_TO);
    relate(b, c, RelationType::LEADS_TO);

    ThoughtResult result;
    result.id = generate_uuid();
    result.thought_id = c.id;
    result.type = ResultType::ACTION;
    result.content = "done";
    result.created_at = std::chrono::system_clock::now();
    memory_->results().save_result("session-1", result);

    NeuroSymbolicStats stats = memory_->get_neuro_symbolic_stats("session-1");
    EXPECT_EQ(stats.total_thoughts, 4u);
    // Two explicit edges plus the implicit thought -> result edge
    EXPECT_EQ(stats.total_relations, 3u);
    EXPECT_EQ(stats.total_results, 1u);
    EXPECT_EQ(stats.thoughts_by_type["Observation"], 2u);
    EXPECT_EQ(stats.relations_by_type["leads_to"], 3u);
    EXPECT_EQ(stats.results_by_type["action"], 1u);
    // Roots: A and D
    EXPECT_EQ(stats.causal_chain_count, 2u);
    EXPECT_DOUBLE_EQ(stats.average_chain_length, 1.5);
    ASSERT_TRUE(stats.oldest.has_value());
    EXPECT_EQ(stats.oldest, a.timestamp);
}

TEST_F(NeuroSymbolicMemoryTest, EmptySessionStats) {
    NeuroSymbolicStats stats = memory_->get_neuro_symbolic_stats("nobody");
    EXPECT_EQ(stats.total_thoughts, 0u);
    EXPECT_EQ(stats.causal_chain_count, 0u);
    EXPECT_DOUBLE_EQ(stats.average_chain_length, 0.0);
    EXPECT_FALSE(stats.oldest.has_value());
}

TEST_F(NeuroSymbolicMemoryTest, SymbolicQueryFiltersByTargetType) {
    Thought obs = save("obs", ThoughtType::Kind::OBSERVATION, 0);
    Thought analysis = save("analysis", ThoughtType::Kind::ANALYTICAL, 1);
    Thought decision = save("decision", ThoughtType::Kind::DECISION, 2);
    relate(obs, analysis, RelationType::LEADS_TO);
    relate(analysis, decision, RelationType::LEADS_TO);
    relate(obs, decision, RelationType::SUPPORTS);

    auto all = memory_->query_symbolic("session-1", RelationType::LEADS_TO);
    EXPECT_EQ(all.size(), 2u);

    auto to_decisions = memory_->query_symbolic("session-1", RelationType::LEADS_TO,
                                                ThoughtType(ThoughtType::Kind::DECISION));
    ASSERT_EQ(to_decisions.size(), 1u);
    EXPECT_EQ(to_decisions[0].source.id, analysis.id);
    EXPECT_EQ(to_decisions[0].relation.target_thought_id, decision.id);
}
