#pragma once

#include "engram/types.hpp"
#include <boost/json.hpp>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace engram {

// =============================================================================
// Points and filters
// =============================================================================

struct FieldCondition {
    std::string key;
    boost::json::value value;
};

/**
 * Payload filter with Qdrant semantics: every `must` condition holds and, when
 * `should` is non-empty, at least one `should` condition holds.
 */
struct PointFilter {
    std::vector<FieldCondition> must;
    std::vector<FieldCondition> should;

    static PointFilter field_equals(const std::string& key, const std::string& value);

    PointFilter& and_equals(const std::string& key, const std::string& value);
    PointFilter& or_equals(const std::string& key, const std::string& value);

    bool empty() const { return must.empty() && should.empty(); }
    bool matches(const boost::json::object& payload) const;
    boost::json::object to_json() const;
};

struct Point {
    std::string id;
    std::vector<float> vector;
    boost::json::object payload;
};

struct ScoredPoint {
    std::string id;
    double score = 0.0;
    boost::json::object payload;
};

struct ScrollPage {
    std::vector<Point> points;
    // Offset for the next page; absent on the last page.
    std::optional<std::string> next_offset;
};

// =============================================================================
// VectorBackendClient
// =============================================================================

/**
 * Collection lifecycle and point operations of a remote vector store.
 *
 * Operations on a collection that does not exist throw
 * CollectionNotFoundError. Transport failures and other server errors throw
 * BackendUnavailableError. Nothing is retried.
 */
class VectorBackendClient {
public:
    virtual ~VectorBackendClient() = default;

    virtual bool collection_exists(const std::string& collection) = 0;
    virtual void create_collection(const std::string& collection, uint64_t vector_size,
                                   Distance distance) = 0;
    // Returns false when there was nothing to delete.
    virtual bool delete_collection(const std::string& collection) = 0;
    // Backend-side fields only (name, size, points, distance, status).
    virtual std::optional<CollectionInfo> get_collection_info(const std::string& collection) = 0;
    virtual std::vector<std::string> list_collections() = 0;

    virtual void upsert(const std::string& collection, const std::vector<Point>& points) = 0;

    virtual std::vector<ScoredPoint> search(const std::string& collection,
                                            const std::vector<float>& vector,
                                            const PointFilter& filter,
                                            size_t limit,
                                            std::optional<double> score_threshold = std::nullopt) = 0;

    virtual ScrollPage scroll(const std::string& collection,
                              const PointFilter& filter,
                              size_t limit,
                              const std::optional<std::string>& offset = std::nullopt) = 0;

    virtual void delete_points(const std::string& collection, const std::vector<std::string>& ids) = 0;
    virtual void delete_points(const std::string& collection, const PointFilter& filter) = 0;

    virtual uint64_t count(const std::string& collection, const PointFilter& filter) = 0;
};

} // namespace engram
