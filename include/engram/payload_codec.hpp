#pragma once

#include "engram/types.hpp"
#include <boost/json.hpp>
#include <optional>
#include <string>

namespace engram {

/**
 * Point payload layouts. Field names are part of the storage format shared
 * with other writers of the same collections:
 *
 *   thought: id, session_id, type, origin, content, confidence, relevance,
 *            timestamp, topic, tags, parent_thought_id?, metadata_json?
 *   relation: id, session_id, source_thought_id, target_thought_id,
 *             relation_type, strength, created_at, metadata_json?
 *   result: id, session_id, thought_id, result_type, content, success,
 *           confidence, created_at, execution_time_ms?, metadata_json?
 *
 * Decoders return nullopt instead of throwing when a payload is incomplete or
 * holds values of the wrong type.
 */

boost::json::object encode_thought(const std::string& session_id, const Thought& thought);
std::optional<Thought> decode_thought(const boost::json::object& payload);

boost::json::object encode_relation(const std::string& session_id, const Relation& relation);
std::optional<Relation> decode_relation(const boost::json::object& payload);

boost::json::object encode_result(const std::string& session_id, const ThoughtResult& result);
std::optional<ThoughtResult> decode_result(const boost::json::object& payload);

// session_id field of any of the three layouts.
std::optional<std::string> payload_session(const boost::json::object& payload);

} // namespace engram
