// =============================================================================
// Session Locking and Cancellation Tests
// =============================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <memory>
#include <string>
#include <thread>
#include <vector>
#include "engram/cancellation.hpp"
#include "engram/in_memory_backend.hpp"
#include "engram/keyed_mutex.hpp"
#include "engram/similarity.hpp"
#include "engram/thought_store.hpp"

using namespace engram;

TEST(KeyedMutexTest, SameKeySerializes) {
    KeyedMutex locks;
    int counter = 0;
    std::atomic<int> inside{0};
    std::atomic<bool> overlapped{false};

    std::vector<std::thread> workers;
    for (int t = 0; t < 4; ++t) {
        workers.emplace_back([&] {
            for (int i = 0; i < 500; ++i) {
                auto lock = locks.acquire("session-1");
                if (inside.fetch_add(1) != 0) overlapped = true;
                ++counter;
                inside.fetch_sub(1);
            }
        });
    }
    for (auto& worker : workers) worker.join();

    EXPECT_EQ(counter, 2000);
    EXPECT_FALSE(overlapped.load());
}

TEST(KeyedMutexTest, DifferentKeysDoNotBlock) {
    KeyedMutex locks;
    auto first = locks.acquire("a");

    std::atomic<bool> acquired{false};
    std::thread other([&] {
        auto second = locks.acquire("b");
        acquired = true;
    });
    other.join();

    EXPECT_TRUE(acquired.load());
    // "b" was released when the thread finished
    EXPECT_EQ(locks.key_count(), 1u);
}

TEST(KeyedMutexTest, ReleasedKeysAreDropped) {
    KeyedMutex locks;
    for (int i = 0; i < 100; ++i) {
        auto lock = locks.acquire("session-" + std::to_string(i));
    }
    EXPECT_EQ(locks.key_count(), 0u);
}

TEST(KeyedMutexTest, KeyKeptWhileAnotherThreadWaits) {
    KeyedMutex locks;
    std::atomic<bool> acquired{false};
    std::thread waiter;
    {
        auto held = locks.acquire("session-1");
        waiter = std::thread([&] {
            auto lock = locks.acquire("session-1");
            acquired = true;
        });
        // Give the waiter time to block on the key
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
        EXPECT_FALSE(acquired.load());
        EXPECT_EQ(locks.key_count(), 1u);
    }
    waiter.join();

    EXPECT_TRUE(acquired.load());
    EXPECT_EQ(locks.key_count(), 0u);
}

TEST(KeyedMutexTest, MovedLockReleasesOnce) {
    KeyedMutex locks;
    {
        auto first = locks.acquire("a");
        KeyedMutex::Lock moved = std::move(first);
        EXPECT_EQ(locks.key_count(), 1u);
    }
    EXPECT_EQ(locks.key_count(), 0u);
    auto again = locks.acquire("a");
    EXPECT_EQ(locks.key_count(), 1u);
}

TEST(CancellationTokenTest, DefaultTokenNeverCancels) {
    CancellationToken token;
    token.cancel();
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_NO_THROW(token.check("noop"));
}

TEST(CancellationTokenTest, CopiesShareState) {
    auto token = CancellationToken::create();
    CancellationToken copy = token;
    copy.cancel();
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_THROW(token.check("copy"), OperationCancelledError);
}

TEST(SimilarityTest, CosineEdgeCases) {
    EXPECT_DOUBLE_EQ(cosine_similarity({1, 0}, {1, 0}), 1.0);
    EXPECT_DOUBLE_EQ(cosine_similarity({1, 0}, {0, 1}), 0.0);
    EXPECT_DOUBLE_EQ(cosine_similarity({1, 0}, {-1, 0}), -1.0);
    EXPECT_DOUBLE_EQ(cosine_similarity({}, {}), 0.0);
    EXPECT_DOUBLE_EQ(cosine_similarity({1, 0}, {1, 0, 0}), 0.0);
    EXPECT_DOUBLE_EQ(cosine_similarity({0, 0}, {1, 0}), 0.0);
}

TEST(ConcurrentStoreTest, ParallelSessionsDoNotLoseWrites) {
    auto backend = std::make_shared<InMemoryVectorBackend>();
    StoreConfig config;
    config.vector_size = 2;
    ThoughtStore store(backend, CollectionNames{}, config);

    std::vector<std::thread> workers;
    for (int s = 0; s < 4; ++s) {
        workers.emplace_back([&store, s] {
            const std::string session = "session-" + std::to_string(s);
            for (int i = 0; i < 25; ++i) {
                Thought thought;
                thought.id = generate_uuid();
                thought.session_id = session;
                thought.content = "thought " + std::to_string(i);
                thought.timestamp = std::chrono::system_clock::now();
                store.save_thought(session, thought);
            }
        });
    }
    for (auto& worker : workers) worker.join();

    for (int s = 0; s < 4; ++s) {
        EXPECT_EQ(store.get_thoughts("session-" + std::to_string(s)).size(), 25u);
    }
    EXPECT_EQ(store.list_sessions().size(), 4u);
}
