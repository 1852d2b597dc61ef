#pragma once

#include <cstdint>
#include <optional>
#include <string>

namespace engram {

struct ServiceConfig {
    std::string host;
    uint16_t port = 0;
    std::string api_key;
    bool enabled = true;
};

struct EmbeddingServiceConfig : ServiceConfig {
    std::string target = "/v1/embeddings";
    std::string model = "nomic-embed-text";
};

struct CollectionNames {
    std::string thoughts = "ouroboros_neuro_thoughts";
    std::string relations = "ouroboros_thought_relations";
    std::string results = "ouroboros_thought_results";
};

struct InferenceConfig {
    double similarity_threshold = 0.7;
    size_t recent_window = 10;
};

struct StoreConfig {
    size_t vector_size = 768;
    size_t batch_size = 100;
    size_t scroll_page_size = 256;
    size_t chained_depth_limit = 64;
    size_t chain_max_depth = 5;
    size_t chain_sample_size = 10;
};

struct EngramConfig {
    ServiceConfig qdrant_service;
    EmbeddingServiceConfig embedding_service;
    CollectionNames collections;
    InferenceConfig inference;
    StoreConfig store;
    std::string log_level;
    std::string log_file;
    std::string config_file;
    uint32_t request_timeout_ms = 30000;
};

// Defaults for every field, without reading any file or environment.
EngramConfig default_config();

// TCP port in 1..65535 with no trailing characters, nullopt otherwise.
std::optional<uint16_t> parse_port(const std::string& text);

// Load configuration from a YAML file. A missing or empty path yields the
// defaults; a file that exists but cannot be parsed raises ConfigError.
// ENGRAM_QDRANT_HOST, ENGRAM_QDRANT_PORT, ENGRAM_QDRANT_API_KEY and
// ENGRAM_LOG_LEVEL override the file.
EngramConfig load_config(const std::string& config_file = "engram.yaml");

} // namespace engram
