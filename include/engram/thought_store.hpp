#pragma once

#include "engram/collection_store.hpp"
#include "engram/types.hpp"
#include <string>
#include <vector>

namespace engram {

/**
 * Session-scoped persistence of thoughts.
 *
 * Reads never fail because a collection is missing; they return what is
 * currently readable. An empty answer therefore means "nothing readable",
 * not "nothing stored". Transport failures propagate as
 * BackendUnavailableError.
 */
class ThoughtStore : public CollectionStore {
public:
    ThoughtStore(std::shared_ptr<VectorBackendClient> backend,
                 const CollectionNames& collections,
                 const StoreConfig& config,
                 EmbeddingFunction embed = nullptr);

    void save_thought(const std::string& session_id, const Thought& thought,
                      const CancellationToken& token = {});

    void save_thoughts(const std::string& session_id, const std::vector<Thought>& thoughts,
                       const CancellationToken& token = {});

    // Ascending by timestamp.
    std::vector<Thought> get_thoughts(const std::string& session_id,
                                      const CancellationToken& token = {}) const;

    // Inclusive on both ends.
    std::vector<Thought> get_thoughts_in_range(const std::string& session_id,
                                               Timestamp from, Timestamp to,
                                               const CancellationToken& token = {}) const;

    std::vector<Thought> get_thoughts_by_type(const std::string& session_id,
                                              const ThoughtType& type,
                                              size_t limit = 100,
                                              const CancellationToken& token = {}) const;

    // Newest first.
    std::vector<Thought> get_recent_thoughts(const std::string& session_id,
                                             size_t count = 10,
                                             const CancellationToken& token = {}) const;

    /**
     * Nearest-neighbour search within the session when embeddings are
     * available, ordered by score. Otherwise a case-insensitive substring
     * match over content, topic and tags, in timestamp order.
     */
    std::vector<Thought> search_thoughts(const std::string& session_id,
                                         const std::string& query,
                                         size_t limit = 20,
                                         const CancellationToken& token = {}) const;

    /**
     * Every transitive descendant of `parent_id` through parent_thought_id,
     * ascending by timestamp. The walk is breadth-first, visits each thought
     * once and stops at chained_depth_limit levels.
     */
    std::vector<Thought> get_chained_thoughts(const std::string& session_id,
                                              const Uuid& parent_id,
                                              const CancellationToken& token = {}) const;

    // Deletes the session's thoughts, relations and results.
    void clear_session(const std::string& session_id, const CancellationToken& token = {});

    ThoughtStatistics get_statistics(const std::string& session_id,
                                     const CancellationToken& token = {}) const;

    // Distinct session ids present in the thoughts collection, sorted.
    std::vector<std::string> list_sessions(const CancellationToken& token = {}) const;

private:
    Point to_point(const std::string& session_id, const Thought& thought) const;

    CollectionNames collections_;
};

} // namespace engram
