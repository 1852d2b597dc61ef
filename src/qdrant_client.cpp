#include "engram/qdrant_client.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"
#include <cerrno>
#include <cstdlib>

namespace engram {

namespace json = boost::json;

namespace {

// Responses that parse as JSON but do not have the documented shape are
// reported like any other backend failure.
[[noreturn]] void malformed(const std::string& what, const char* context) {
    throw BackendUnavailableError("Qdrant returned a malformed response: " + what, context,
                                  "Check that the server speaks the Qdrant REST API");
}

std::string point_id_to_string(const json::value* id, const char* context) {
    if (id == nullptr) {
        malformed("point without an id", context);
    }
    if (id->is_string()) {
        return std::string(id->as_string().c_str());
    }
    if (id->is_uint64()) {
        return std::to_string(id->as_uint64());
    }
    if (id->is_int64() && id->as_int64() >= 0) {
        return std::to_string(id->as_int64());
    }
    malformed("unexpected point id " + json::serialize(*id), context);
}

json::value point_id_to_json(const std::string& id) {
    // Numeric ids are sent as integers, everything else as UUID strings
    if (!id.empty() && id.find_first_not_of("0123456789") == std::string::npos) {
        errno = 0;
        unsigned long long value = std::strtoull(id.c_str(), nullptr, 10);
        if (errno == ERANGE) {
            throw InvalidArgumentError("Point id out of range: " + id, "QdrantClient",
                                       "Numeric point ids must fit in 64 bits");
        }
        return json::value(static_cast<uint64_t>(value));
    }
    return json::value(id);
}

double to_double(const json::value& value, const char* field, const char* context) {
    if (!value.is_number()) {
        malformed(std::string(field) + " is not a number: " + json::serialize(value), context);
    }
    return value.to_number<double>();
}

json::array vector_to_json(const std::vector<float>& vector) {
    json::array out;
    out.reserve(vector.size());
    for (float v : vector) {
        out.push_back(static_cast<double>(v));
    }
    return out;
}

std::vector<float> vector_from_json(const json::value* value, const char* context) {
    std::vector<float> out;
    if (value == nullptr || !value->is_array()) {
        return out;
    }
    const auto& array = value->as_array();
    out.reserve(array.size());
    for (const auto& v : array) {
        out.push_back(static_cast<float>(to_double(v, "vector component", context)));
    }
    return out;
}

json::object payload_from_json(const json::value* value) {
    if (value != nullptr && value->is_object()) {
        return value->as_object();
    }
    return {};
}

uint64_t to_count(const json::value* value, const char* field, const char* context) {
    if (value == nullptr || value->is_null()) {
        return 0;
    }
    if (value->is_uint64()) {
        return value->as_uint64();
    }
    if (value->is_int64() && value->as_int64() >= 0) {
        return static_cast<uint64_t>(value->as_int64());
    }
    malformed(std::string(field) + " is not a count: " + json::serialize(*value), context);
}

void add_filter(json::object& body, const PointFilter& filter) {
    if (!filter.empty()) {
        body["filter"] = filter.to_json();
    }
}

} // namespace

QdrantClient::QdrantClient(std::shared_ptr<HttpClient> http_client, const ServiceConfig& config)
    : http_client_(std::move(http_client))
    , host_(config.host)
    , port_(config.port) {
    ENGRAM_CHECK_ARGUMENT(http_client_ != nullptr, "QdrantClient requires an HttpClient");
    if (!config.api_key.empty()) {
        http_client_->set_header("api-key", config.api_key);
    }
}

std::string QdrantClient::collection_path(const std::string& collection) {
    return "/collections/" + collection;
}

json::value QdrantClient::call(const std::string& method,
                               const std::string& target,
                               const std::string& body,
                               const std::string& collection,
                               const char* context) {
    std::string response;
    const unsigned status = http_client_->send_request(method, target, body, response, host_, port_);

    if (status == 404) {
        throw CollectionNotFoundError(collection, context);
    }

    json::error_code ec;
    json::value parsed = json::parse(response, ec);

    if (status < 200 || status >= 300) {
        std::string detail = response;
        if (!ec && parsed.is_object()) {
            if (const auto* st = parsed.as_object().if_contains("status")) {
                if (st->is_object()) {
                    if (const auto* err = st->as_object().if_contains("error")) {
                        if (err->is_string()) detail = err->as_string().c_str();
                    }
                }
            }
        }
        throw BackendUnavailableError("Qdrant returned HTTP " + std::to_string(status) +
                                      " for " + method + " " + target + ": " + detail,
                                      context);
    }

    if (ec || !parsed.is_object()) {
        throw BackendUnavailableError("Qdrant returned a malformed response for " + method + " " + target,
                                      context);
    }

    const auto* result = parsed.as_object().if_contains("result");
    return result != nullptr ? *result : json::value(nullptr);
}

bool QdrantClient::collection_exists(const std::string& collection) {
    try {
        call("GET", collection_path(collection), std::string(), collection, __func__);
        return true;
    } catch (const CollectionNotFoundError&) {
        return false;
    }
}

void QdrantClient::create_collection(const std::string& collection, uint64_t vector_size,
                                     Distance distance) {
    json::object vectors;
    vectors["size"] = vector_size;
    vectors["distance"] = to_string(distance);
    json::object body;
    body["vectors"] = std::move(vectors);

    ENGRAM_LOG_INFO("Creating collection " + collection + " (" + std::to_string(vector_size) +
                    ", " + to_string(distance) + ")");
    call("PUT", collection_path(collection), json::serialize(body), collection, __func__);
}

bool QdrantClient::delete_collection(const std::string& collection) {
    try {
        json::value result = call("DELETE", collection_path(collection), std::string(), collection, __func__);
        return result.is_bool() ? result.as_bool() : true;
    } catch (const CollectionNotFoundError&) {
        return false;
    }
}

std::optional<CollectionInfo> QdrantClient::get_collection_info(const std::string& collection) {
    json::value result;
    try {
        result = call("GET", collection_path(collection), std::string(), collection, __func__);
    } catch (const CollectionNotFoundError&) {
        return std::nullopt;
    }

    CollectionInfo info;
    info.name = collection;
    if (!result.is_object()) {
        return info;
    }
    const auto& obj = result.as_object();

    if (const auto* status = obj.if_contains("status"); status && status->is_string()) {
        info.status = parse_collection_status(status->as_string().c_str());
    }
    info.points_count = to_count(obj.if_contains("points_count"), "points_count", __func__);

    // config.params.vectors is either {size, distance} or a map of named vectors
    const json::value* vectors = nullptr;
    if (const auto* config = obj.if_contains("config"); config && config->is_object()) {
        if (const auto* params = config->as_object().if_contains("params"); params && params->is_object()) {
            vectors = params->as_object().if_contains("vectors");
        }
    }
    if (vectors && vectors->is_object()) {
        const json::object* params = &vectors->as_object();
        if (!params->contains("size") && !params->empty() && params->begin()->value().is_object()) {
            params = &params->begin()->value().as_object();
        }
        info.vector_size = to_count(params->if_contains("size"), "vector size", __func__);
        if (const auto* distance = params->if_contains("distance"); distance && distance->is_string()) {
            info.distance = parse_distance(distance->as_string().c_str()).value_or(Distance::COSINE);
        }
    }
    return info;
}

std::vector<std::string> QdrantClient::list_collections() {
    json::value result = call("GET", "/collections", std::string(), std::string(), __func__);

    std::vector<std::string> names;
    if (!result.is_object()) {
        return names;
    }
    if (const auto* collections = result.as_object().if_contains("collections");
        collections && collections->is_array()) {
        for (const auto& entry : collections->as_array()) {
            if (!entry.is_object()) continue;
            if (const auto* name = entry.as_object().if_contains("name"); name && name->is_string()) {
                names.emplace_back(name->as_string().c_str());
            }
        }
    }
    return names;
}

void QdrantClient::upsert(const std::string& collection, const std::vector<Point>& points) {
    if (points.empty()) {
        return;
    }

    json::array array;
    array.reserve(points.size());
    for (const auto& point : points) {
        json::object p;
        p["id"] = point_id_to_json(point.id);
        p["vector"] = vector_to_json(point.vector);
        p["payload"] = point.payload;
        array.push_back(std::move(p));
    }
    json::object body;
    body["points"] = std::move(array);

    ENGRAM_LOG_DEBUG("Upserting " + std::to_string(points.size()) + " points into " + collection);
    call("PUT", collection_path(collection) + "/points?wait=true", json::serialize(body), collection, __func__);
}

std::vector<ScoredPoint> QdrantClient::search(const std::string& collection,
                                              const std::vector<float>& vector,
                                              const PointFilter& filter,
                                              size_t limit,
                                              std::optional<double> score_threshold) {
    json::object body;
    body["vector"] = vector_to_json(vector);
    body["limit"] = limit;
    body["with_payload"] = true;
    add_filter(body, filter);
    if (score_threshold) {
        body["score_threshold"] = *score_threshold;
    }

    json::value result = call("POST", collection_path(collection) + "/points/search",
                              json::serialize(body), collection, __func__);

    std::vector<ScoredPoint> hits;
    if (!result.is_array()) {
        return hits;
    }
    for (const auto& entry : result.as_array()) {
        if (!entry.is_object()) continue;
        const auto& obj = entry.as_object();
        ScoredPoint hit;
        hit.id = point_id_to_string(obj.if_contains("id"), __func__);
        if (const auto* score = obj.if_contains("score")) {
            hit.score = to_double(*score, "score", __func__);
        }
        hit.payload = payload_from_json(obj.if_contains("payload"));
        hits.push_back(std::move(hit));
    }
    return hits;
}

ScrollPage QdrantClient::scroll(const std::string& collection,
                                const PointFilter& filter,
                                size_t limit,
                                const std::optional<std::string>& offset) {
    json::object body;
    body["limit"] = limit;
    body["with_payload"] = true;
    body["with_vector"] = false;
    add_filter(body, filter);
    if (offset) {
        body["offset"] = point_id_to_json(*offset);
    }

    json::value result = call("POST", collection_path(collection) + "/points/scroll",
                              json::serialize(body), collection, __func__);

    ScrollPage page;
    if (!result.is_object()) {
        return page;
    }
    const auto& obj = result.as_object();
    if (const auto* points = obj.if_contains("points"); points && points->is_array()) {
        for (const auto& entry : points->as_array()) {
            if (!entry.is_object()) continue;
            const auto& p = entry.as_object();
            Point point;
            point.id = point_id_to_string(p.if_contains("id"), __func__);
            point.vector = vector_from_json(p.if_contains("vector"), __func__);
            point.payload = payload_from_json(p.if_contains("payload"));
            page.points.push_back(std::move(point));
        }
    }
    if (const auto* next = obj.if_contains("next_page_offset"); next && !next->is_null()) {
        page.next_offset = point_id_to_string(next, __func__);
    }
    return page;
}

void QdrantClient::delete_points(const std::string& collection, const std::vector<std::string>& ids) {
    if (ids.empty()) {
        return;
    }
    json::array array;
    for (const auto& id : ids) {
        array.push_back(point_id_to_json(id));
    }
    json::object body;
    body["points"] = std::move(array);

    call("POST", collection_path(collection) + "/points/delete?wait=true",
         json::serialize(body), collection, __func__);
}

void QdrantClient::delete_points(const std::string& collection, const PointFilter& filter) {
    ENGRAM_CHECK_ARGUMENT(!filter.empty(), "Refusing to delete points with an empty filter");

    json::object body;
    body["filter"] = filter.to_json();
    call("POST", collection_path(collection) + "/points/delete?wait=true",
         json::serialize(body), collection, __func__);
}

uint64_t QdrantClient::count(const std::string& collection, const PointFilter& filter) {
    json::object body;
    body["exact"] = true;
    add_filter(body, filter);

    json::value result = call("POST", collection_path(collection) + "/points/count",
                              json::serialize(body), collection, __func__);
    if (!result.is_object()) {
        return 0;
    }
    return to_count(result.as_object().if_contains("count"), "count", __func__);
}

} // namespace engram
