// =============================================================================
// engram CLI - Memory Administration Interface
// =============================================================================
//
// Single entry point for operating on an agent's memory store.
//
// Usage:
//   engram [global options] <command> [options]
//
// Commands:
//   health        Check collection dimensions and status
//   heal          Recreate collections with mismatched dimensions
//   map           Print the memory map
//   snapshot      Show per-layer vector counts
//   init-layers   Create the collections of every memory layer
//   clear-layer   Empty every collection of one memory layer
//   clear-session Delete one session's thoughts, relations and results
//   stats         Show thought and relation statistics for a session
//   chains        Print the causal chains starting at a thought
//   version       Show version information
//
// Examples:
//   engram health
//   engram heal --confirm
//   engram --host qdrant.local stats session-42
//   engram chains session-42 0b7c2f7e-4d7e-4c55-9d61-9a0c1f2b3e44 -d 4
//
// =============================================================================

#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "engram/collection_admin.hpp"
#include "engram/config.hpp"
#include "engram/embedding_client.hpp"
#include "engram/error.hpp"
#include "engram/http_client.hpp"
#include "engram/logging.hpp"
#include "engram/memory_layer_manager.hpp"
#include "engram/neuro_symbolic_memory.hpp"
#include "engram/qdrant_client.hpp"

namespace engram::cli {
    int cmd_health(int argc, char* argv[]);
    int cmd_heal(int argc, char* argv[]);
    int cmd_map(int argc, char* argv[]);
    int cmd_snapshot(int argc, char* argv[]);
    int cmd_init_layers(int argc, char* argv[]);
    int cmd_clear_layer(int argc, char* argv[]);
    int cmd_clear_session(int argc, char* argv[]);
    int cmd_stats(int argc, char* argv[]);
    int cmd_chains(int argc, char* argv[]);
    int cmd_version(int argc, char* argv[]);
    int cmd_help(int argc, char* argv[]);
}

// =============================================================================
// Version Info
// =============================================================================

#define ENGRAM_VERSION_MAJOR 0
#define ENGRAM_VERSION_MINOR 3
#define ENGRAM_VERSION_PATCH 0
#define ENGRAM_VERSION_STRING "0.3.0"

// =============================================================================
// Command Registry
// =============================================================================

struct Command {
    const char* name;
    const char* description;
    int (*handler)(int argc, char* argv[]);
};

static const Command g_commands[] = {
    {"health",        "Check collection dimensions and status", engram::cli::cmd_health},
    {"heal",          "Recreate mismatched collections (--confirm)", engram::cli::cmd_heal},
    {"map",           "Print the memory map", engram::cli::cmd_map},
    {"snapshot",      "Show per-layer vector counts", engram::cli::cmd_snapshot},
    {"init-layers",   "Create the collections of every memory layer", engram::cli::cmd_init_layers},
    {"clear-layer",   "Empty one memory layer (--confirm)", engram::cli::cmd_clear_layer},
    {"clear-session", "Delete everything stored for a session", engram::cli::cmd_clear_session},
    {"stats",         "Show statistics for a session", engram::cli::cmd_stats},
    {"chains",        "Print causal chains from a thought", engram::cli::cmd_chains},
    {"version",       "Show version information", engram::cli::cmd_version},
    {"help",          "Show this help message", engram::cli::cmd_help},
    {nullptr, nullptr, nullptr}
};

// =============================================================================
// Global Options
// =============================================================================

struct GlobalOptions {
    std::string config_file = "engram.yaml";
    std::string host;
    std::string port;
    bool verbose = false;
    bool quiet = false;
};

static GlobalOptions g_options;

namespace engram::cli {

namespace {

struct Services {
    EngramConfig config;
    std::shared_ptr<HttpClient> http;
    std::shared_ptr<QdrantClient> qdrant;
};

Services connect() {
    Services services;
    services.config = load_config(g_options.config_file);
    auto& config = services.config;

    if (!g_options.host.empty()) {
        config.qdrant_service.host = g_options.host;
    }
    if (!g_options.port.empty()) {
        auto port = parse_port(g_options.port);
        if (!port) {
            throw InvalidArgumentError("Invalid port: " + g_options.port, "--port");
        }
        config.qdrant_service.port = *port;
    }

    std::string level = config.log_level;
    if (g_options.verbose) level = "debug";
    if (g_options.quiet) level = "error";
    initialize_logging(level, config.log_file);

    services.http = std::make_shared<HttpClient>();
    services.http->set_timeout(std::chrono::milliseconds(config.request_timeout_ms));
    services.qdrant = std::make_shared<QdrantClient>(services.http, config.qdrant_service);

    ENGRAM_LOG_DEBUG("Connected to Qdrant at " + config.qdrant_service.host + ":" +
                     std::to_string(config.qdrant_service.port));
    return services;
}

std::unique_ptr<NeuroSymbolicMemory> open_memory(const Services& services) {
    EmbeddingFunction embed;
    if (services.config.embedding_service.enabled) {
        auto client = std::make_shared<EmbeddingClient>(services.http, services.config.embedding_service);
        embed = EmbeddingClient::as_function(client);
    }
    return std::make_unique<NeuroSymbolicMemory>(services.qdrant, services.config, embed);
}

bool has_flag(int argc, char* argv[], const char* flag) {
    for (int i = 0; i < argc; ++i) {
        if (std::strcmp(argv[i], flag) == 0) return true;
    }
    return false;
}

// Positional arguments, skipping flags and the values of "-x value" options.
std::vector<std::string> positionals(int argc, char* argv[]) {
    std::vector<std::string> args;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-d" || arg == "--depth") {
            ++i;
        } else if (arg.empty() || arg[0] != '-') {
            args.push_back(arg);
        }
    }
    return args;
}

void print_counts(const char* title, const std::map<std::string, size_t>& counts) {
    std::cout << title << ":\n";
    if (counts.empty()) {
        std::cout << "  (none)\n";
    }
    for (const auto& [name, count] : counts) {
        std::cout << "  " << std::left << std::setw(20) << name << count << "\n";
    }
}

} // namespace

// =============================================================================
// Help Command
// =============================================================================

int cmd_help([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "Engram - Agent Memory Engine\n";
    std::cout << "Version " << ENGRAM_VERSION_STRING << "\n\n";
    std::cout << "Usage: engram [global options] <command> [options]\n\n";
    std::cout << "Commands:\n";

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        std::cout << "  " << cmd->name;
        for (size_t i = strlen(cmd->name); i < 15; ++i) std::cout << ' ';
        std::cout << cmd->description << "\n";
    }

    std::cout << "\nGlobal Options:\n";
    std::cout << "  -c, --config <file>     Configuration file (default: engram.yaml)\n";
    std::cout << "  -h, --host <host>       Qdrant host (overrides config)\n";
    std::cout << "  -p, --port <port>       Qdrant port (overrides config)\n";
    std::cout << "  -v, --verbose           Debug logging\n";
    std::cout << "  -q, --quiet             Only log errors\n";
    std::cout << "\nEnvironment:\n";
    std::cout << "  ENGRAM_QDRANT_HOST      Qdrant host\n";
    std::cout << "  ENGRAM_QDRANT_PORT      Qdrant port\n";
    std::cout << "  ENGRAM_QDRANT_API_KEY   Qdrant API key\n";
    std::cout << "  ENGRAM_LOG_LEVEL        trace|debug|info|warning|error|critical|off\n";
    std::cout << "\nExamples:\n";
    std::cout << "  engram health\n";
    std::cout << "  engram heal --confirm\n";
    std::cout << "  engram clear-layer working --confirm\n";
    std::cout << "  engram chains session-42 <thought-id> -d 4\n";

    return 0;
}

// =============================================================================
// Version Command
// =============================================================================

int cmd_version([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    std::cout << "Engram " << ENGRAM_VERSION_STRING << "\n";
    std::cout << "Default vector size: " << kDefaultVectorSize << "\n";
    return 0;
}

// =============================================================================
// Collection Administration
// =============================================================================

int cmd_health([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    auto services = connect();
    MemoryLayerManager layers(std::make_shared<CollectionAdmin>(services.qdrant));

    auto report = layers.perform_health_check(false);
    for (const auto& health : layers.admin().health_check()) {
        std::cout << (health.healthy ? "[ok] " : "[!!] ") << health.collection;
        if (health.issue) {
            std::cout << "  " << *health.issue;
        }
        std::cout << "\n";
        if (health.recommendation && g_options.verbose) {
            std::cout << "     " << *health.recommendation << "\n";
        }
    }

    std::cout << "\nHealthy: " << report.healthy_count
              << "  Unhealthy: " << report.unhealthy_count
              << "  Vectors: " << report.statistics.total_vectors << "\n";
    return report.unhealthy_count == 0 ? 0 : 2;
}

int cmd_heal(int argc, char* argv[]) {
    if (!has_flag(argc, argv, "--confirm")) {
        std::cerr << "Healing recreates mismatched collections and deletes their points.\n";
        std::cerr << "Re-run with --confirm to proceed.\n";
        return 1;
    }

    auto services = connect();
    MemoryLayerManager layers(std::make_shared<CollectionAdmin>(services.qdrant));
    auto report = layers.perform_health_check(true);

    if (report.healed_collections.empty()) {
        std::cout << "Nothing to heal.\n";
    }
    for (const auto& name : report.healed_collections) {
        std::cout << "Recreated " << name << "\n";
    }
    return 0;
}

int cmd_map([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    auto services = connect();
    MemoryLayerManager layers(std::make_shared<CollectionAdmin>(services.qdrant));
    layers.admin().initialize();
    std::cout << layers.get_memory_map();
    return 0;
}

int cmd_snapshot([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    auto services = connect();
    MemoryLayerManager layers(std::make_shared<CollectionAdmin>(services.qdrant));
    layers.admin().initialize();
    auto snapshot = layers.create_snapshot();

    std::cout << "Snapshot at " << format_iso8601(snapshot.taken_at) << "\n\n";
    for (const auto& [layer, count] : snapshot.layer_vector_counts) {
        std::cout << "  " << std::left << std::setw(20) << to_string(layer) << count << "\n";
    }
    std::cout << "\nCollections: " << snapshot.statistics.total_collections
              << "  Vectors: " << snapshot.statistics.total_vectors
              << "  Links: " << snapshot.links.size() << "\n";
    return 0;
}

int cmd_init_layers([[maybe_unused]] int argc, [[maybe_unused]] char* argv[]) {
    auto services = connect();
    MemoryLayerManager layers(std::make_shared<CollectionAdmin>(services.qdrant));
    layers.initialize();

    auto memory = open_memory(services);
    memory->initialize();

    std::cout << "Memory layers initialized.\n";
    return 0;
}

int cmd_clear_layer(int argc, char* argv[]) {
    auto args = positionals(argc, argv);
    if (args.empty()) {
        std::cerr << "Usage: engram clear-layer <layer> --confirm\n";
        std::cerr << "Layers: working, episodic, semantic, procedural, autobiographical\n";
        return 1;
    }

    auto layer = parse_memory_layer(args[0]);
    if (!layer) {
        std::cerr << "Unknown memory layer: " << args[0] << "\n";
        return 1;
    }
    bool confirmed = has_flag(argc, argv, "--confirm");
    if (!confirmed) {
        std::cerr << "Clearing deletes every point in the " << to_string(*layer) << " layer.\n";
        std::cerr << "Re-run with --confirm to proceed.\n";
        return 1;
    }

    auto services = connect();
    MemoryLayerManager layers(std::make_shared<CollectionAdmin>(services.qdrant));
    if (!layers.clear_memory_layer(*layer, confirmed)) {
        std::cerr << "Some collections of the " << to_string(*layer) << " layer did not exist.\n";
        return 2;
    }
    std::cout << "Cleared " << to_string(*layer) << " layer.\n";
    return 0;
}

// =============================================================================
// Thought Memory
// =============================================================================

int cmd_clear_session(int argc, char* argv[]) {
    auto args = positionals(argc, argv);
    if (args.empty()) {
        std::cerr << "Usage: engram clear-session <session_id>\n";
        return 1;
    }

    auto services = connect();
    auto memory = open_memory(services);
    memory->thoughts().clear_session(args[0]);
    std::cout << "Cleared session " << args[0] << "\n";
    return 0;
}

int cmd_stats(int argc, char* argv[]) {
    auto args = positionals(argc, argv);
    if (args.empty()) {
        std::cerr << "Usage: engram stats <session_id>\n";
        return 1;
    }

    auto services = connect();
    auto memory = open_memory(services);
    auto stats = memory->get_neuro_symbolic_stats(args[0]);

    std::cout << "\n=== Session " << args[0] << " ===\n\n";
    std::cout << "Thoughts:             " << stats.total_thoughts << "\n";
    std::cout << "Relations:            " << stats.total_relations << "\n";
    std::cout << "Results:              " << stats.total_results << "\n";
    std::cout << "Causal chains:        " << stats.causal_chain_count << "\n";
    std::cout << "Average chain length: " << std::fixed << std::setprecision(2)
              << stats.average_chain_length << "\n";
    if (stats.oldest && stats.newest) {
        std::cout << "Span:                 " << format_iso8601(*stats.oldest)
                  << " .. " << format_iso8601(*stats.newest) << "\n";
    }
    std::cout << "\n";
    print_counts("Thoughts by type", stats.thoughts_by_type);
    print_counts("Relations by type", stats.relations_by_type);
    print_counts("Results by type", stats.results_by_type);

    if (memory->skipped_records() > 0) {
        std::cout << "\nSkipped " << memory->skipped_records() << " undecodable records\n";
    }
    return 0;
}

int cmd_chains(int argc, char* argv[]) {
    std::optional<size_t> depth;
    for (int i = 0; i < argc; ++i) {
        std::string arg = argv[i];
        if ((arg == "-d" || arg == "--depth") && i + 1 < argc) {
            try {
                depth = std::stoul(argv[++i]);
            } catch (const std::logic_error&) {
                std::cerr << "Invalid depth: " << argv[i] << "\n";
                return 1;
            }
        }
    }

    auto args = positionals(argc, argv);
    if (args.size() < 2) {
        std::cerr << "Usage: engram chains <session_id> <thought_id> [options]\n";
        std::cerr << "Options:\n";
        std::cerr << "  -d, --depth <n>         Maximum thoughts per chain (default: store.chain_max_depth)\n";
        return 1;
    }

    Uuid start = parse_uuid(args[1]);
    auto services = connect();
    auto memory = open_memory(services);
    auto chains = memory->chains().find_causal_chains(args[0], start, depth);

    if (chains.empty()) {
        std::cout << "No chains found.\n";
        return 0;
    }
    for (size_t i = 0; i < chains.size(); ++i) {
        std::cout << "Chain " << i + 1 << " (" << chains[i].size() << " thoughts)\n";
        for (const auto& thought : chains[i]) {
            std::cout << "  [" << thought.type.name() << "] " << thought.content << "\n";
            if (g_options.verbose) {
                std::cout << "    " << to_string(thought.id) << "  "
                          << format_iso8601(thought.timestamp) << "\n";
            }
        }
    }
    return 0;
}

}  // namespace engram::cli

// =============================================================================
// Main Entry Point
// =============================================================================

void parse_global_options(int& argc, char**& argv) {
    int i = 1;  // Skip program name
    while (i < argc) {
        std::string arg = argv[i];

        if ((arg == "-c" || arg == "--config") && i + 1 < argc) {
            g_options.config_file = argv[++i];
        } else if ((arg == "-h" || arg == "--host") && i + 1 < argc) {
            g_options.host = argv[++i];
        } else if ((arg == "-p" || arg == "--port") && i + 1 < argc) {
            g_options.port = argv[++i];
        } else if (arg == "-v" || arg == "--verbose") {
            g_options.verbose = true;
        } else if (arg == "-q" || arg == "--quiet") {
            g_options.quiet = true;
        } else {
            // First non-option is the command
            break;
        }
        ++i;
    }

    argc -= i;
    argv += i;
}

int main(int argc, char* argv[]) {
    parse_global_options(argc, argv);

    if (argc < 1) {
        engram::cli::cmd_help(0, nullptr);
        return 1;
    }

    const char* cmd_name = argv[0];
    ++argv;
    --argc;

    for (const Command* cmd = g_commands; cmd->name; ++cmd) {
        if (strcmp(cmd->name, cmd_name) == 0) {
            try {
                return cmd->handler(argc, argv);
            } catch (const engram::EngramException& e) {
                std::cerr << e.what() << "\n";
                return 1;
            } catch (const std::exception& e) {
                std::cerr << "Error: " << e.what() << "\n";
                return 1;
            }
        }
    }

    std::cerr << "Unknown command: " << cmd_name << "\n";
    std::cerr << "Run 'engram help' for usage.\n";
    return 1;
}
