#pragma once

#include "engram/config.hpp"
#include "engram/http_client.hpp"
#include "engram/vector_backend.hpp"
#include <boost/json.hpp>
#include <memory>
#include <string>

namespace engram {

/**
 * VectorBackendClient over the Qdrant REST API.
 *
 * HTTP 404 becomes CollectionNotFoundError; any other non-2xx status or a
 * body that is not valid JSON becomes BackendUnavailableError.
 */
class QdrantClient : public VectorBackendClient {
public:
    QdrantClient(std::shared_ptr<HttpClient> http_client, const ServiceConfig& config);

    bool collection_exists(const std::string& collection) override;
    void create_collection(const std::string& collection, uint64_t vector_size,
                           Distance distance) override;
    bool delete_collection(const std::string& collection) override;
    std::optional<CollectionInfo> get_collection_info(const std::string& collection) override;
    std::vector<std::string> list_collections() override;

    void upsert(const std::string& collection, const std::vector<Point>& points) override;

    std::vector<ScoredPoint> search(const std::string& collection,
                                    const std::vector<float>& vector,
                                    const PointFilter& filter,
                                    size_t limit,
                                    std::optional<double> score_threshold = std::nullopt) override;

    ScrollPage scroll(const std::string& collection,
                      const PointFilter& filter,
                      size_t limit,
                      const std::optional<std::string>& offset = std::nullopt) override;

    void delete_points(const std::string& collection, const std::vector<std::string>& ids) override;
    void delete_points(const std::string& collection, const PointFilter& filter) override;

    uint64_t count(const std::string& collection, const PointFilter& filter) override;

    const std::string& host() const { return host_; }
    uint16_t port() const { return port_; }

private:
    // Sends the request and returns the "result" member of the response.
    boost::json::value call(const std::string& method,
                            const std::string& target,
                            const std::string& body,
                            const std::string& collection,
                            const char* context);

    static std::string collection_path(const std::string& collection);

    std::shared_ptr<HttpClient> http_client_;
    std::string host_;
    uint16_t port_;
};

} // namespace engram
