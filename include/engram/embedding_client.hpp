#pragma once

#include "engram/config.hpp"
#include "engram/http_client.hpp"
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace engram {

// text -> fixed-length vector. An empty function means "no embeddings".
using EmbeddingFunction = std::function<std::vector<float>(const std::string&)>;

/**
 * Client for an OpenAI-compatible embeddings endpoint
 * (POST {"model", "input": [...]} -> {"data": [{"embedding", "index"}]}).
 */
class EmbeddingClient {
public:
    EmbeddingClient(std::shared_ptr<HttpClient> http_client, const EmbeddingServiceConfig& config);
    virtual ~EmbeddingClient() = default;

    std::vector<float> generate_embeddings(const std::string& text);

    std::vector<std::vector<float>> generate_embeddings_batch(const std::vector<std::string>& texts);

    // Bound function that keeps this client alive.
    static EmbeddingFunction as_function(std::shared_ptr<EmbeddingClient> client);

    const std::string& model() const { return model_; }

private:
    std::string build_embedding_request(const std::vector<std::string>& texts) const;
    std::vector<std::vector<float>> parse_batch_response(const std::string& response, size_t expected) const;

    std::shared_ptr<HttpClient> http_client_;
    std::string host_;
    uint16_t port_;
    std::string target_;
    std::string model_;
};

} // namespace engram
