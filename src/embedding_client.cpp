#include "engram/embedding_client.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"
#include <boost/json.hpp>

namespace engram {

namespace json = boost::json;

EmbeddingClient::EmbeddingClient(std::shared_ptr<HttpClient> http_client,
                                 const EmbeddingServiceConfig& config)
    : http_client_(std::move(http_client))
    , host_(config.host)
    , port_(config.port)
    , target_(config.target)
    , model_(config.model) {
    ENGRAM_CHECK_ARGUMENT(http_client_ != nullptr, "EmbeddingClient requires an HttpClient");
    if (!config.api_key.empty()) {
        http_client_->set_header("Authorization", "Bearer " + config.api_key);
    }
}

std::vector<float> EmbeddingClient::generate_embeddings(const std::string& text) {
    auto batch = generate_embeddings_batch({text});
    return std::move(batch.front());
}

std::vector<std::vector<float>> EmbeddingClient::generate_embeddings_batch(
    const std::vector<std::string>& texts) {
    ENGRAM_CHECK_ARGUMENT(!texts.empty(), "No texts to embed");

    ENGRAM_LOG_DEBUG("Embedding " + std::to_string(texts.size()) + " text(s) with " + model_);

    std::string response;
    const unsigned status = http_client_->send_request(
        "POST", target_, build_embedding_request(texts), response, host_, port_);
    if (status < 200 || status >= 300) {
        throw BackendUnavailableError("Embedding service returned HTTP " + std::to_string(status) +
                                      ": " + response, __func__);
    }
    return parse_batch_response(response, texts.size());
}

EmbeddingFunction EmbeddingClient::as_function(std::shared_ptr<EmbeddingClient> client) {
    return [client](const std::string& text) { return client->generate_embeddings(text); };
}

std::string EmbeddingClient::build_embedding_request(const std::vector<std::string>& texts) const {
    json::array input;
    for (const auto& text : texts) {
        input.emplace_back(text);
    }
    json::object body;
    body["model"] = model_;
    body["input"] = std::move(input);
    return json::serialize(body);
}

std::vector<std::vector<float>> EmbeddingClient::parse_batch_response(const std::string& response,
                                                                      size_t expected) const {
    json::error_code ec;
    json::value parsed = json::parse(response, ec);
    if (ec || !parsed.is_object()) {
        throw EngramException(ErrorCode::BACKEND_PROTOCOL, "Malformed embedding response", __func__);
    }

    const auto* data = parsed.as_object().if_contains("data");
    if (data == nullptr || !data->is_array() || data->as_array().size() != expected) {
        throw EngramException(ErrorCode::BACKEND_PROTOCOL,
                              "Embedding response does not contain " + std::to_string(expected) +
                              " embedding(s)", __func__);
    }

    std::vector<std::vector<float>> out(expected);
    size_t position = 0;
    for (const auto& entry : data->as_array()) {
        const auto* embedding = entry.is_object() ? entry.as_object().if_contains("embedding") : nullptr;
        if (embedding == nullptr || !embedding->is_array()) {
            throw EngramException(ErrorCode::BACKEND_PROTOCOL, "Embedding entry without vector", __func__);
        }

        // Entries are ordered by "index" when present
        size_t index = position++;
        if (const auto* idx = entry.as_object().if_contains("index"); idx && !idx->is_null()) {
            if (idx->is_uint64()) {
                index = static_cast<size_t>(idx->as_uint64());
            } else if (idx->is_int64() && idx->as_int64() >= 0) {
                index = static_cast<size_t>(idx->as_int64());
            } else {
                throw EngramException(ErrorCode::BACKEND_PROTOCOL,
                                      "Embedding index is not a position: " + json::serialize(*idx),
                                      __func__);
            }
        }
        if (index >= expected) {
            throw EngramException(ErrorCode::BACKEND_PROTOCOL,
                                  "Embedding index out of range: " + std::to_string(index), __func__);
        }

        auto& vector = out[index];
        vector.reserve(embedding->as_array().size());
        for (const auto& v : embedding->as_array()) {
            if (!v.is_number()) {
                throw EngramException(ErrorCode::BACKEND_PROTOCOL,
                                      "Embedding component is not a number", __func__);
            }
            vector.push_back(static_cast<float>(v.to_number<double>()));
        }
    }
    return out;
}

} // namespace engram
