// =============================================================================
// Thought Store Tests
// =============================================================================

#include <gtest/gtest.h>
#include <memory>
#include <string>
#include <vector>
#include "engram/error.hpp"
#include "engram/in_memory_backend.hpp"
#include "engram/payload_codec.hpp"
#include "engram/thought_store.hpp"

using namespace engram;
using namespace std::chrono_literals;

namespace {

Timestamp at(int seconds) {
    return *parse_iso8601("2024-05-01T12:00:00Z") + std::chrono::seconds(seconds);
}

Thought make_thought(const std::string& content, int seconds,
                     ThoughtType type = ThoughtType::Kind::OBSERVATION) {
    Thought thought;
    thought.id = generate_uuid();
    thought.session_id = "session-1";
    thought.type = type;
    thought.content = content;
    thought.timestamp = at(seconds);
    return thought;
}

} // namespace

class ThoughtStoreTest : public ::testing::Test {
protected:
    void SetUp() override {
        backend_ = std::make_shared<InMemoryVectorBackend>();
        config_.vector_size = 3;
        config_.batch_size = 2;
        config_.scroll_page_size = 2;
        store_ = std::make_unique<ThoughtStore>(backend_, names_, config_);
    }

    void TearDown() override {}

    std::shared_ptr<InMemoryVectorBackend> backend_;
    CollectionNames names_;
    StoreConfig config_;
    std::unique_ptr<ThoughtStore> store_;
};

TEST_F(ThoughtStoreTest, SaveCreatesCollectionLazily) {
    EXPECT_FALSE(backend_->collection_exists(names_.thoughts));

    store_->save_thought("session-1", make_thought("first", 0));

    auto info = backend_->get_collection_info(names_.thoughts);
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info->vector_size, 3u);
    EXPECT_EQ(info->distance, Distance::COSINE);
    EXPECT_EQ(info->points_count, 1u);
}

TEST_F(ThoughtStoreTest, SavedThoughtReadsBackUnchanged) {
    Thought thought = make_thought("The deploy failed on step three", 5, ThoughtType::Kind::ANALYTICAL);
    thought.topic = "deploys";
    thought.tags = {"ci"};
    thought.parent_thought_id = generate_uuid();
    thought.metadata_json = R"({"run":17})";

    store_->save_thought("session-1", thought);

    auto thoughts = store_->get_thoughts("session-1");
    ASSERT_EQ(thoughts.size(), 1u);
    EXPECT_EQ(thoughts[0], thought);
}

TEST_F(ThoughtStoreTest, MismatchedSessionRejected) {
    Thought thought = make_thought("elsewhere", 0);
    thought.session_id = "session-2";

    EXPECT_THROW(store_->save_thought("session-1", thought), InvalidArgumentError);
    EXPECT_THROW(store_->save_thoughts("session-1", {make_thought("fine", 1), thought}),
                 InvalidArgumentError);
    EXPECT_TRUE(store_->get_thoughts("session-1").empty());
    EXPECT_TRUE(store_->get_thoughts("session-2").empty());
}

TEST_F(ThoughtStoreTest, EmptySessionIdTakesSavedSession) {
    Thought thought = make_thought("anonymous", 0);
    thought.session_id.clear();

    store_->save_thought("session-1", thought);

    auto thoughts = store_->get_thoughts("session-1");
    ASSERT_EQ(thoughts.size(), 1u);
    EXPECT_EQ(thoughts[0].session_id, "session-1");
    EXPECT_EQ(thoughts[0].content, "anonymous");
}

TEST_F(ThoughtStoreTest, SavingTwiceIsIdempotent) {
    Thought thought = make_thought("only once", 0);
    store_->save_thought("session-1", thought);
    store_->save_thought("session-1", thought);

    EXPECT_EQ(store_->get_thoughts("session-1").size(), 1u);
}

TEST_F(ThoughtStoreTest, ThoughtsReturnedInTimestampOrder) {
    store_->save_thoughts("session-1", {
        make_thought("third", 30), make_thought("first", 10), make_thought("second", 20),
    });

    auto thoughts = store_->get_thoughts("session-1");
    ASSERT_EQ(thoughts.size(), 3u);
    EXPECT_EQ(thoughts[0].content, "first");
    EXPECT_EQ(thoughts[1].content, "second");
    EXPECT_EQ(thoughts[2].content, "third");
}

TEST_F(ThoughtStoreTest, UnknownSessionAndMissingCollectionReadEmpty) {
    EXPECT_TRUE(store_->get_thoughts("nobody").empty());

    store_->save_thought("session-1", make_thought("x", 0));
    EXPECT_TRUE(store_->get_thoughts("nobody").empty());
}

TEST_F(ThoughtStoreTest, SessionsAreIsolated) {
    store_->save_thought("session-1", make_thought("mine", 0));
    Thought other = make_thought("theirs", 0);
    other.session_id = "session-2";
    store_->save_thought("session-2", other);

    auto thoughts = store_->get_thoughts("session-1");
    ASSERT_EQ(thoughts.size(), 1u);
    EXPECT_EQ(thoughts[0].content, "mine");
}

TEST_F(ThoughtStoreTest, BatchesRespectBatchSize) {
    store_->ensure_collection();
    const size_t before = backend_->call_count();

    std::vector<Thought> thoughts;
    for (int i = 0; i < 5; ++i) {
        thoughts.push_back(make_thought("t" + std::to_string(i), i));
    }
    store_->save_thoughts("session-1", thoughts);

    // ceil(5 / 2) upserts
    EXPECT_EQ(backend_->call_count() - before, 3u);
    EXPECT_EQ(store_->get_thoughts("session-1").size(), 5u);
}

TEST_F(ThoughtStoreTest, EmptySessionIdRejected) {
    EXPECT_THROW(store_->save_thought("", make_thought("x", 0)), InvalidArgumentError);
}

TEST_F(ThoughtStoreTest, RangeIsInclusive) {
    store_->save_thoughts("session-1", {
        make_thought("a", 0), make_thought("b", 10), make_thought("c", 20), make_thought("d", 30),
    });

    auto thoughts = store_->get_thoughts_in_range("session-1", at(10), at(20));
    ASSERT_EQ(thoughts.size(), 2u);
    EXPECT_EQ(thoughts[0].content, "b");
    EXPECT_EQ(thoughts[1].content, "c");
}

TEST_F(ThoughtStoreTest, ByTypeFiltersAndLimits) {
    store_->save_thoughts("session-1", {
        make_thought("d1", 0, ThoughtType::Kind::DECISION),
        make_thought("o1", 1),
        make_thought("d2", 2, ThoughtType::Kind::DECISION),
        make_thought("d3", 3, ThoughtType::Kind::DECISION),
    });

    auto decisions = store_->get_thoughts_by_type("session-1", ThoughtType::Kind::DECISION, 2);
    ASSERT_EQ(decisions.size(), 2u);
    EXPECT_EQ(decisions[0].content, "d1");
    EXPECT_EQ(decisions[1].content, "d2");
}

TEST_F(ThoughtStoreTest, RecentThoughtsNewestFirst) {
    store_->save_thoughts("session-1", {
        make_thought("a", 0), make_thought("b", 1), make_thought("c", 2),
    });

    auto recent = store_->get_recent_thoughts("session-1", 2);
    ASSERT_EQ(recent.size(), 2u);
    EXPECT_EQ(recent[0].content, "c");
    EXPECT_EQ(recent[1].content, "b");
}

TEST_F(ThoughtStoreTest, SubstringSearchWithoutEmbeddings) {
    Thought tagged = make_thought("unrelated content", 0);
    tagged.tags = {"Database"};
    Thought topical = make_thought("more content", 1);
    topical.topic = "database tuning";
    store_->save_thoughts("session-1", {
        make_thought("The DATABASE index is stale", 2), tagged, topical, make_thought("cats", 3),
    });

    EXPECT_EQ(store_->search_thoughts("session-1", "database").size(), 3u);
    EXPECT_EQ(store_->search_thoughts("session-1", "database", 1).size(), 1u);
    EXPECT_TRUE(store_->search_thoughts("session-1", "dogs").empty());
}

TEST_F(ThoughtStoreTest, VectorSearchWithEmbeddings) {
    EmbeddingFunction embed = [](const std::string& text) {
        return text.find("cat") != std::string::npos ? std::vector<float>{1, 0, 0}
                                                     : std::vector<float>{0, 1, 0};
    };
    ThoughtStore store(backend_, names_, config_, embed);
    store.save_thoughts("session-1", {make_thought("a cat sat", 0), make_thought("stock prices", 1)});

    auto hits = store.search_thoughts("session-1", "cat", 1);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].content, "a cat sat");
}

TEST_F(ThoughtStoreTest, ChainedThoughtsFollowParents) {
    Thought root = make_thought("root", 0);
    Thought child = make_thought("child", 1);
    child.parent_thought_id = root.id;
    Thought grandchild = make_thought("grandchild", 2);
    grandchild.parent_thought_id = child.id;
    Thought unrelated = make_thought("unrelated", 3);
    store_->save_thoughts("session-1", {grandchild, unrelated, child, root});

    auto chained = store_->get_chained_thoughts("session-1", root.id);
    ASSERT_EQ(chained.size(), 2u);
    EXPECT_EQ(chained[0].content, "child");
    EXPECT_EQ(chained[1].content, "grandchild");

    EXPECT_TRUE(store_->get_chained_thoughts("session-1", unrelated.id).empty());
}

TEST_F(ThoughtStoreTest, ChainedThoughtsSurviveParentCycle) {
    Thought a = make_thought("a", 0);
    Thought b = make_thought("b", 1);
    a.parent_thought_id = b.id;
    b.parent_thought_id = a.id;
    store_->save_thoughts("session-1", {a, b});

    auto chained = store_->get_chained_thoughts("session-1", a.id);
    ASSERT_EQ(chained.size(), 1u);
    EXPECT_EQ(chained[0].content, "b");
}

TEST_F(ThoughtStoreTest, ClearSessionRemovesAllRecordKinds) {
    store_->save_thought("session-1", make_thought("doomed", 0));
    Thought kept = make_thought("kept", 0);
    kept.session_id = "session-2";
    store_->save_thought("session-2", kept);

    backend_->create_collection(names_.relations, 3, Distance::COSINE);
    Point relation;
    relation.id = to_string(generate_uuid());
    relation.vector = {0, 0, 0};
    relation.payload["session_id"] = "session-1";
    backend_->upsert(names_.relations, {relation});

    store_->clear_session("session-1");

    EXPECT_TRUE(store_->get_thoughts("session-1").empty());
    EXPECT_EQ(store_->get_thoughts("session-2").size(), 1u);
    EXPECT_EQ(backend_->count(names_.relations, PointFilter{}), 0u);
}

TEST_F(ThoughtStoreTest, StatisticsSummarizeSession) {
    Thought root = make_thought("root", 0, ThoughtType::Kind::DECISION);
    root.confidence = 0.5;
    Thought child = make_thought("child", 10);
    child.parent_thought_id = root.id;
    child.origin = ThoughtOrigin::Kind::CHAINED;
    store_->save_thoughts("session-1", {root, child, make_thought("loner", 5)});

    ThoughtStatistics stats = store_->get_statistics("session-1");
    EXPECT_EQ(stats.total_count, 3u);
    EXPECT_EQ(stats.count_by_type["Decision"], 1u);
    EXPECT_EQ(stats.count_by_type["Observation"], 2u);
    EXPECT_EQ(stats.count_by_origin["Chained"], 1u);
    EXPECT_EQ(stats.count_by_origin["Reactive"], 2u);
    EXPECT_NEAR(stats.average_confidence, 2.5 / 3.0, 1e-9);
    EXPECT_EQ(stats.earliest, at(0));
    EXPECT_EQ(stats.latest, at(10));
    EXPECT_EQ(stats.chain_count, 1u);

    EXPECT_EQ(store_->get_statistics("nobody").total_count, 0u);
}

TEST_F(ThoughtStoreTest, ListSessionsDistinctAndSorted) {
    for (const char* session : {"b", "a", "b", "c"}) {
        Thought thought = make_thought(session, 0);
        thought.session_id = session;
        store_->save_thought(session, thought);
    }
    EXPECT_EQ(store_->list_sessions(), (std::vector<std::string>{"a", "b", "c"}));
}

TEST_F(ThoughtStoreTest, UndecodablePointsAreSkippedAndCounted) {
    store_->save_thought("session-1", make_thought("good", 0));

    Point broken;
    broken.id = to_string(generate_uuid());
    broken.vector = {0, 0, 0};
    broken.payload["session_id"] = "session-1";
    broken.payload["content"] = "no id, type or timestamp";
    backend_->upsert(names_.thoughts, {broken});

    auto thoughts = store_->get_thoughts("session-1");
    ASSERT_EQ(thoughts.size(), 1u);
    EXPECT_EQ(thoughts[0].content, "good");
    EXPECT_EQ(store_->skipped_records(), 1u);
}

TEST_F(ThoughtStoreTest, CollectionDroppedBehindOurBackIsRecreated) {
    store_->save_thought("session-1", make_thought("before", 0));
    backend_->delete_collection(names_.thoughts);

    store_->save_thought("session-1", make_thought("after", 1));

    auto thoughts = store_->get_thoughts("session-1");
    ASSERT_EQ(thoughts.size(), 1u);
    EXPECT_EQ(thoughts[0].content, "after");
}

TEST_F(ThoughtStoreTest, CancelledTokenStopsBeforeBackendCall) {
    auto token = CancellationToken::create();
    token.cancel();
    const size_t before = backend_->call_count();

    EXPECT_THROW(store_->save_thought("session-1", make_thought("x", 0), token), OperationCancelledError);
    EXPECT_THROW(store_->get_thoughts("session-1", token), OperationCancelledError);
    EXPECT_EQ(backend_->call_count(), before);
}

TEST_F(ThoughtStoreTest, UnavailableBackendPropagates) {
    store_->save_thought("session-1", make_thought("x", 0));
    backend_->set_unavailable(true);

    EXPECT_THROW(store_->get_thoughts("session-1"), BackendUnavailableError);
    EXPECT_THROW(store_->save_thought("session-1", make_thought("y", 1)), BackendUnavailableError);
}
