#include "engram/config.hpp"
#include "engram/error.hpp"
#include "engram/logging.hpp"
#include <yaml-cpp/yaml.h>
#include <cctype>
#include <cstdlib>
#include <filesystem>
#include <string>

namespace engram {

namespace {

void read_service(const YAML::Node& node, ServiceConfig& service) {
    if (node["host"]) service.host = node["host"].as<std::string>();
    if (node["port"]) service.port = node["port"].as<uint16_t>();
    if (node["api_key"]) service.api_key = node["api_key"].as<std::string>();
    if (node["enabled"]) service.enabled = node["enabled"].as<bool>();
}

void apply_env_overrides(EngramConfig& config) {
    if (const char* host = std::getenv("ENGRAM_QDRANT_HOST"); host && *host) {
        config.qdrant_service.host = host;
    }
    if (const char* port = std::getenv("ENGRAM_QDRANT_PORT"); port && *port) {
        auto value = parse_port(port);
        if (!value) {
            throw ConfigError("Invalid ENGRAM_QDRANT_PORT: " + std::string(port),
                              "apply_env_overrides", "Use a port between 1 and 65535");
        }
        config.qdrant_service.port = *value;
    }
    if (const char* key = std::getenv("ENGRAM_QDRANT_API_KEY"); key && *key) {
        config.qdrant_service.api_key = key;
    }
    if (const char* level = std::getenv("ENGRAM_LOG_LEVEL"); level && *level) {
        config.log_level = level;
    }
}

} // namespace

std::optional<uint16_t> parse_port(const std::string& text) {
    if (text.empty() || !std::isdigit(static_cast<unsigned char>(text[0]))) {
        return std::nullopt;
    }
    try {
        size_t consumed = 0;
        unsigned long value = std::stoul(text, &consumed);
        if (consumed != text.size() || value == 0 || value > 65535) {
            return std::nullopt;
        }
        return static_cast<uint16_t>(value);
    } catch (const std::logic_error&) {
        return std::nullopt;
    }
}

EngramConfig default_config() {
    EngramConfig config;

    config.qdrant_service.host = "localhost";
    config.qdrant_service.port = 6333;
    config.qdrant_service.enabled = true;

    config.embedding_service.host = "localhost";
    config.embedding_service.port = 11434;
    config.embedding_service.enabled = true;

    config.log_level = "info";
    config.log_file = "";
    config.request_timeout_ms = 30000;

    return config;
}

EngramConfig load_config(const std::string& config_file) {
    EngramConfig config = default_config();
    config.config_file = config_file;

    if (!config_file.empty() && std::filesystem::exists(config_file)) {
        try {
            YAML::Node yaml = YAML::LoadFile(config_file);

            if (yaml["qdrant_service"]) {
                read_service(yaml["qdrant_service"], config.qdrant_service);
            }

            if (yaml["embedding_service"]) {
                const auto& emb = yaml["embedding_service"];
                read_service(emb, config.embedding_service);
                if (emb["target"]) config.embedding_service.target = emb["target"].as<std::string>();
                if (emb["model"]) config.embedding_service.model = emb["model"].as<std::string>();
            }

            if (yaml["collections"]) {
                const auto& cols = yaml["collections"];
                if (cols["thoughts"]) config.collections.thoughts = cols["thoughts"].as<std::string>();
                if (cols["relations"]) config.collections.relations = cols["relations"].as<std::string>();
                if (cols["results"]) config.collections.results = cols["results"].as<std::string>();
            }

            if (yaml["inference"]) {
                const auto& inf = yaml["inference"];
                if (inf["similarity_threshold"]) {
                    config.inference.similarity_threshold = inf["similarity_threshold"].as<double>();
                }
                if (inf["recent_window"]) config.inference.recent_window = inf["recent_window"].as<size_t>();
            }

            if (yaml["store"]) {
                const auto& store = yaml["store"];
                if (store["vector_size"]) config.store.vector_size = store["vector_size"].as<size_t>();
                if (store["batch_size"]) config.store.batch_size = store["batch_size"].as<size_t>();
                if (store["scroll_page_size"]) config.store.scroll_page_size = store["scroll_page_size"].as<size_t>();
                if (store["chained_depth_limit"]) {
                    config.store.chained_depth_limit = store["chained_depth_limit"].as<size_t>();
                }
                if (store["chain_max_depth"]) config.store.chain_max_depth = store["chain_max_depth"].as<size_t>();
                if (store["chain_sample_size"]) config.store.chain_sample_size = store["chain_sample_size"].as<size_t>();
            }

            if (yaml["logging"]) {
                const auto& log = yaml["logging"];
                if (log["level"]) config.log_level = log["level"].as<std::string>();
                if (log["file"]) config.log_file = log["file"].as<std::string>();
            }

            if (yaml["request_timeout_ms"]) config.request_timeout_ms = yaml["request_timeout_ms"].as<uint32_t>();
        } catch (const YAML::Exception& e) {
            throw ConfigError("Failed to parse configuration file: " + std::string(e.what()),
                              config_file, "Check the YAML syntax and value types");
        }
    } else if (!config_file.empty()) {
        ENGRAM_LOG_DEBUG("Configuration file not found, using defaults: " + config_file);
    }

    apply_env_overrides(config);

    if (config.inference.similarity_threshold < 0.0 || config.inference.similarity_threshold > 1.0) {
        throw ConfigError("inference.similarity_threshold must be within [0, 1]", config_file);
    }
    if (config.store.batch_size == 0) {
        throw ConfigError("store.batch_size must be positive", config_file);
    }
    if (config.store.scroll_page_size == 0) {
        throw ConfigError("store.scroll_page_size must be positive", config_file);
    }

    return config;
}

} // namespace engram
