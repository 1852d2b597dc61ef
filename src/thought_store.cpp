#include "engram/thought_store.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"
#include "engram/payload_codec.hpp"
#include <algorithm>
#include <cctype>
#include <deque>
#include <map>
#include <set>

namespace engram {

namespace {

const char* kSessionField = "session_id";

void sort_by_timestamp(std::vector<Thought>& thoughts) {
    std::stable_sort(thoughts.begin(), thoughts.end(),
                     [](const Thought& a, const Thought& b) { return a.timestamp < b.timestamp; });
}

std::string to_lower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

bool contains_ignore_case(const std::string& haystack, const std::string& lowered_needle) {
    return to_lower(haystack).find(lowered_needle) != std::string::npos;
}

} // namespace

ThoughtStore::ThoughtStore(std::shared_ptr<VectorBackendClient> backend,
                           const CollectionNames& collections,
                           const StoreConfig& config,
                           EmbeddingFunction embed)
    : CollectionStore(std::move(backend), collections.thoughts, config, std::move(embed))
    , collections_(collections) {}

Point ThoughtStore::to_point(const std::string& session_id, const Thought& thought) const {
    // An empty thought.session_id takes the session it is saved under
    ENGRAM_CHECK_ARGUMENT(thought.session_id.empty() || thought.session_id == session_id,
                          "Thought " + to_string(thought.id) + " belongs to session '" +
                          thought.session_id + "', not '" + session_id + "'");
    Point point;
    point.id = to_string(thought.id);
    point.vector = embed(thought.content);
    point.payload = encode_thought(session_id, thought);
    return point;
}

void ThoughtStore::save_thought(const std::string& session_id, const Thought& thought,
                                const CancellationToken& token) {
    ENGRAM_CHECK_ARGUMENT(!session_id.empty(), "session_id must not be empty");

    auto lock = session_locks_.acquire(session_id);
    token.check(__func__);
    write_points({to_point(session_id, thought)}, token);
}

void ThoughtStore::save_thoughts(const std::string& session_id, const std::vector<Thought>& thoughts,
                                 const CancellationToken& token) {
    ENGRAM_CHECK_ARGUMENT(!session_id.empty(), "session_id must not be empty");
    if (thoughts.empty()) {
        return;
    }

    auto lock = session_locks_.acquire(session_id);
    std::vector<Point> points;
    points.reserve(thoughts.size());
    for (const auto& thought : thoughts) {
        token.check(__func__);
        points.push_back(to_point(session_id, thought));
    }
    write_points(points, token);
    ENGRAM_LOG_DEBUG("Saved " + std::to_string(thoughts.size()) + " thoughts for session " + session_id);
}

std::vector<Thought> ThoughtStore::get_thoughts(const std::string& session_id,
                                                const CancellationToken& token) const {
    auto points = scroll_all(PointFilter::field_equals(kSessionField, session_id), token);
    auto thoughts = decode_points<Thought>(points, decode_thought);
    sort_by_timestamp(thoughts);
    return thoughts;
}

std::vector<Thought> ThoughtStore::get_thoughts_in_range(const std::string& session_id,
                                                         Timestamp from, Timestamp to,
                                                         const CancellationToken& token) const {
    auto thoughts = get_thoughts(session_id, token);
    thoughts.erase(std::remove_if(thoughts.begin(), thoughts.end(),
                                  [&](const Thought& t) { return t.timestamp < from || t.timestamp > to; }),
                   thoughts.end());
    return thoughts;
}

std::vector<Thought> ThoughtStore::get_thoughts_by_type(const std::string& session_id,
                                                        const ThoughtType& type,
                                                        size_t limit,
                                                        const CancellationToken& token) const {
    auto filter = PointFilter::field_equals(kSessionField, session_id);
    filter.and_equals("type", type.name());

    auto thoughts = decode_points<Thought>(scroll_all(filter, token), decode_thought);
    sort_by_timestamp(thoughts);
    if (thoughts.size() > limit) {
        thoughts.resize(limit);
    }
    return thoughts;
}

std::vector<Thought> ThoughtStore::get_recent_thoughts(const std::string& session_id,
                                                       size_t count,
                                                       const CancellationToken& token) const {
    auto thoughts = get_thoughts(session_id, token);
    std::reverse(thoughts.begin(), thoughts.end());
    if (thoughts.size() > count) {
        thoughts.resize(count);
    }
    return thoughts;
}

std::vector<Thought> ThoughtStore::search_thoughts(const std::string& session_id,
                                                   const std::string& query,
                                                   size_t limit,
                                                   const CancellationToken& token) const {
    if (limit == 0) {
        return {};
    }

    if (has_embeddings()) {
        token.check(__func__);
        auto hits = search_points(embed(query), PointFilter::field_equals(kSessionField, session_id),
                                  limit, token);
        std::vector<Thought> thoughts;
        for (const auto& hit : hits) {
            if (auto thought = decode_thought(hit.payload)) {
                thoughts.push_back(std::move(*thought));
            } else {
                note_skipped(hit.id);
            }
        }
        return thoughts;
    }

    const std::string needle = to_lower(query);
    std::vector<Thought> matches;
    for (auto& thought : get_thoughts(session_id, token)) {
        bool hit = contains_ignore_case(thought.content, needle) ||
                   (thought.topic && contains_ignore_case(*thought.topic, needle)) ||
                   std::any_of(thought.tags.begin(), thought.tags.end(),
                               [&](const std::string& tag) { return contains_ignore_case(tag, needle); });
        if (hit) {
            matches.push_back(std::move(thought));
            if (matches.size() == limit) break;
        }
    }
    return matches;
}

std::vector<Thought> ThoughtStore::get_chained_thoughts(const std::string& session_id,
                                                        const Uuid& parent_id,
                                                        const CancellationToken& token) const {
    auto thoughts = get_thoughts(session_id, token);

    std::multimap<Uuid, size_t> children;
    for (size_t i = 0; i < thoughts.size(); ++i) {
        if (thoughts[i].parent_thought_id) {
            children.emplace(*thoughts[i].parent_thought_id, i);
        }
    }

    std::set<Uuid> visited{parent_id};
    std::vector<size_t> found;
    std::deque<std::pair<Uuid, size_t>> queue;
    queue.emplace_back(parent_id, 0);
    while (!queue.empty()) {
        auto [id, depth] = queue.front();
        queue.pop_front();
        if (depth >= config_.chained_depth_limit) {
            ENGRAM_LOG_WARNING("Chained thought walk from " + to_string(parent_id) +
                               " stopped at depth " + std::to_string(depth));
            continue;
        }
        auto range = children.equal_range(id);
        for (auto it = range.first; it != range.second; ++it) {
            const Thought& child = thoughts[it->second];
            if (visited.insert(child.id).second) {
                found.push_back(it->second);
                queue.emplace_back(child.id, depth + 1);
            }
        }
    }

    std::sort(found.begin(), found.end());
    std::vector<Thought> chained;
    chained.reserve(found.size());
    for (size_t index : found) {
        chained.push_back(thoughts[index]);
    }
    return chained;
}

void ThoughtStore::clear_session(const std::string& session_id, const CancellationToken& token) {
    ENGRAM_CHECK_ARGUMENT(!session_id.empty(), "session_id must not be empty");

    auto lock = session_locks_.acquire(session_id);
    const auto filter = PointFilter::field_equals(kSessionField, session_id);
    delete_matching(collections_.thoughts, filter, token);
    delete_matching(collections_.relations, filter, token);
    delete_matching(collections_.results, filter, token);
    ENGRAM_LOG_INFO("Cleared session " + session_id);
}

ThoughtStatistics ThoughtStore::get_statistics(const std::string& session_id,
                                               const CancellationToken& token) const {
    auto thoughts = get_thoughts(session_id, token);

    ThoughtStatistics stats;
    stats.total_count = thoughts.size();
    if (thoughts.empty()) {
        return stats;
    }

    double confidence = 0.0;
    double relevance = 0.0;
    std::set<Uuid> parents;
    for (const auto& thought : thoughts) {
        ++stats.count_by_type[thought.type.name()];
        ++stats.count_by_origin[thought.origin.name()];
        confidence += thought.confidence;
        relevance += thought.relevance;
        if (thought.parent_thought_id) {
            parents.insert(*thought.parent_thought_id);
        }
    }
    stats.average_confidence = confidence / thoughts.size();
    stats.average_relevance = relevance / thoughts.size();
    // get_thoughts is sorted, so the ends are the extremes
    stats.earliest = thoughts.front().timestamp;
    stats.latest = thoughts.back().timestamp;

    for (const auto& thought : thoughts) {
        if (!thought.parent_thought_id && parents.count(thought.id) > 0) {
            ++stats.chain_count;
        }
    }
    return stats;
}

std::vector<std::string> ThoughtStore::list_sessions(const CancellationToken& token) const {
    std::set<std::string> sessions;
    for (const auto& point : scroll_all(PointFilter{}, token)) {
        if (auto session = payload_session(point.payload); session && !session->empty()) {
            sessions.insert(*session);
        }
    }
    return {sessions.begin(), sessions.end()};
}

} // namespace engram
