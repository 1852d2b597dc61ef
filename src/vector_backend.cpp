#include "engram/vector_backend.hpp"

namespace engram {

namespace {

bool condition_holds(const FieldCondition& condition, const boost::json::object& payload) {
    auto it = payload.find(condition.key);
    if (it == payload.end()) {
        return false;
    }
    // Keyword match against array payloads matches any element.
    if (it->value().is_array() && !condition.value.is_array()) {
        for (const auto& element : it->value().as_array()) {
            if (element == condition.value) {
                return true;
            }
        }
        return false;
    }
    return it->value() == condition.value;
}

boost::json::array conditions_to_json(const std::vector<FieldCondition>& conditions) {
    boost::json::array out;
    for (const auto& condition : conditions) {
        boost::json::object match;
        match["value"] = condition.value;
        boost::json::object entry;
        entry["key"] = condition.key;
        entry["match"] = std::move(match);
        out.push_back(std::move(entry));
    }
    return out;
}

} // namespace

PointFilter PointFilter::field_equals(const std::string& key, const std::string& value) {
    PointFilter filter;
    filter.and_equals(key, value);
    return filter;
}

PointFilter& PointFilter::and_equals(const std::string& key, const std::string& value) {
    must.push_back({key, boost::json::value(value)});
    return *this;
}

PointFilter& PointFilter::or_equals(const std::string& key, const std::string& value) {
    should.push_back({key, boost::json::value(value)});
    return *this;
}

bool PointFilter::matches(const boost::json::object& payload) const {
    for (const auto& condition : must) {
        if (!condition_holds(condition, payload)) {
            return false;
        }
    }
    if (should.empty()) {
        return true;
    }
    for (const auto& condition : should) {
        if (condition_holds(condition, payload)) {
            return true;
        }
    }
    return false;
}

boost::json::object PointFilter::to_json() const {
    boost::json::object filter;
    if (!must.empty()) {
        filter["must"] = conditions_to_json(must);
    }
    if (!should.empty()) {
        filter["should"] = conditions_to_json(should);
    }
    return filter;
}

} // namespace engram
