#include "engram/payload_codec.hpp"

namespace engram {

namespace json = boost::json;

namespace {

std::optional<std::string> get_string(const json::object& payload, const char* key) {
    const auto* value = payload.if_contains(key);
    if (value == nullptr || !value->is_string()) {
        return std::nullopt;
    }
    return std::string(value->as_string().c_str());
}

std::optional<double> get_number(const json::object& payload, const char* key) {
    const auto* value = payload.if_contains(key);
    if (value == nullptr || !value->is_number()) {
        return std::nullopt;
    }
    return value->to_number<double>();
}

std::optional<Uuid> get_uuid(const json::object& payload, const char* key) {
    auto text = get_string(payload, key);
    return text ? try_parse_uuid(*text) : std::nullopt;
}

std::optional<Timestamp> get_timestamp(const json::object& payload, const char* key) {
    auto text = get_string(payload, key);
    return text ? parse_iso8601(*text) : std::nullopt;
}

// Optional field: absent or null is fine, anything else must be a string.
bool get_optional_string(const json::object& payload, const char* key, std::optional<std::string>& out) {
    const auto* value = payload.if_contains(key);
    if (value == nullptr || value->is_null()) {
        out.reset();
        return true;
    }
    if (!value->is_string()) {
        return false;
    }
    out = std::string(value->as_string().c_str());
    return true;
}

void put_metadata(json::object& payload, const std::optional<std::string>& metadata_json) {
    if (metadata_json) {
        payload["metadata_json"] = *metadata_json;
    }
}

} // namespace

// -----------------------------------------------------------------------------
// Thought
// -----------------------------------------------------------------------------

json::object encode_thought(const std::string& session_id, const Thought& thought) {
    json::object payload;
    payload["id"] = to_string(thought.id);
    payload["session_id"] = session_id;
    payload["type"] = thought.type.name();
    payload["origin"] = thought.origin.name();
    payload["content"] = thought.content;
    payload["confidence"] = thought.confidence;
    payload["relevance"] = thought.relevance;
    payload["timestamp"] = format_iso8601(thought.timestamp);
    payload["topic"] = thought.topic ? json::value(*thought.topic) : json::value(nullptr);

    json::array tags;
    for (const auto& tag : thought.tags) {
        tags.emplace_back(tag);
    }
    payload["tags"] = std::move(tags);

    if (thought.parent_thought_id) {
        payload["parent_thought_id"] = to_string(*thought.parent_thought_id);
    }
    put_metadata(payload, thought.metadata_json);
    return payload;
}

std::optional<Thought> decode_thought(const json::object& payload) {
    auto id = get_uuid(payload, "id");
    auto session = get_string(payload, "session_id");
    auto type = get_string(payload, "type");
    auto content = get_string(payload, "content");
    auto timestamp = get_timestamp(payload, "timestamp");
    if (!id || !session || !type || !content || !timestamp) {
        return std::nullopt;
    }

    Thought thought;
    thought.id = *id;
    thought.session_id = *session;
    thought.type = ThoughtType::parse(*type);
    thought.content = *content;
    thought.timestamp = *timestamp;

    if (auto origin = get_string(payload, "origin")) {
        thought.origin = ThoughtOrigin::parse(*origin);
    }
    thought.confidence = get_number(payload, "confidence").value_or(1.0);
    thought.relevance = get_number(payload, "relevance").value_or(1.0);

    if (!get_optional_string(payload, "topic", thought.topic) ||
        !get_optional_string(payload, "metadata_json", thought.metadata_json)) {
        return std::nullopt;
    }

    std::optional<std::string> parent;
    if (!get_optional_string(payload, "parent_thought_id", parent)) {
        return std::nullopt;
    }
    if (parent && !parent->empty()) {
        thought.parent_thought_id = try_parse_uuid(*parent);
        if (!thought.parent_thought_id) {
            return std::nullopt;
        }
    }

    if (const auto* tags = payload.if_contains("tags"); tags && !tags->is_null()) {
        if (!tags->is_array()) {
            return std::nullopt;
        }
        for (const auto& tag : tags->as_array()) {
            if (!tag.is_string()) {
                return std::nullopt;
            }
            thought.tags.emplace_back(tag.as_string().c_str());
        }
    }
    return thought;
}

// -----------------------------------------------------------------------------
// Relation
// -----------------------------------------------------------------------------

json::object encode_relation(const std::string& session_id, const Relation& relation) {
    json::object payload;
    payload["id"] = to_string(relation.id);
    payload["session_id"] = session_id;
    payload["source_thought_id"] = to_string(relation.source_thought_id);
    payload["target_thought_id"] = to_string(relation.target_thought_id);
    payload["relation_type"] = to_string(relation.type);
    payload["strength"] = relation.strength;
    payload["created_at"] = format_iso8601(relation.created_at);
    put_metadata(payload, relation.metadata_json);
    return payload;
}

std::optional<Relation> decode_relation(const json::object& payload) {
    auto id = get_uuid(payload, "id");
    auto source = get_uuid(payload, "source_thought_id");
    auto target = get_uuid(payload, "target_thought_id");
    auto type_name = get_string(payload, "relation_type");
    auto strength = get_number(payload, "strength");
    auto created_at = get_timestamp(payload, "created_at");
    if (!id || !source || !target || !type_name || !strength || !created_at) {
        return std::nullopt;
    }
    auto type = parse_relation_type(*type_name);
    if (!type) {
        return std::nullopt;
    }

    Relation relation;
    relation.id = *id;
    relation.source_thought_id = *source;
    relation.target_thought_id = *target;
    relation.type = *type;
    relation.strength = *strength;
    relation.created_at = *created_at;
    if (!get_optional_string(payload, "metadata_json", relation.metadata_json)) {
        return std::nullopt;
    }
    return relation;
}

// -----------------------------------------------------------------------------
// Result
// -----------------------------------------------------------------------------

json::object encode_result(const std::string& session_id, const ThoughtResult& result) {
    json::object payload;
    payload["id"] = to_string(result.id);
    payload["session_id"] = session_id;
    payload["thought_id"] = to_string(result.thought_id);
    payload["result_type"] = to_string(result.type);
    payload["content"] = result.content;
    payload["success"] = result.success;
    payload["confidence"] = result.confidence;
    payload["created_at"] = format_iso8601(result.created_at);
    if (result.execution_time_ms) {
        payload["execution_time_ms"] = *result.execution_time_ms;
    }
    put_metadata(payload, result.metadata_json);
    return payload;
}

std::optional<ThoughtResult> decode_result(const json::object& payload) {
    auto id = get_uuid(payload, "id");
    auto thought_id = get_uuid(payload, "thought_id");
    auto type_name = get_string(payload, "result_type");
    auto content = get_string(payload, "content");
    auto created_at = get_timestamp(payload, "created_at");
    const auto* success = payload.if_contains("success");
    if (!id || !thought_id || !type_name || !content || !created_at || !success || !success->is_bool()) {
        return std::nullopt;
    }
    auto type = parse_result_type(*type_name);
    if (!type) {
        return std::nullopt;
    }

    ThoughtResult result;
    result.id = *id;
    result.thought_id = *thought_id;
    result.type = *type;
    result.content = *content;
    result.success = success->as_bool();
    result.confidence = get_number(payload, "confidence").value_or(1.0);
    result.created_at = *created_at;
    result.execution_time_ms = get_number(payload, "execution_time_ms");
    if (!get_optional_string(payload, "metadata_json", result.metadata_json)) {
        return std::nullopt;
    }
    return result;
}

std::optional<std::string> payload_session(const json::object& payload) {
    return get_string(payload, "session_id");
}

} // namespace engram
