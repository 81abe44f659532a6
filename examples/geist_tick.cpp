/**
 * Geist Tick Runner
 *
 * Builds an agent from a JSON config file and drives its tick loop.
 *
 * Usage:
 *   ./geist_tick --config <file> [options]
 *
 * Options:
 *   --task <text>            Queue a task before ticking
 *   --ticks <int>            Run exactly N ticks, then exit (default: 0 = supervised ticking)
 *   --interval-ms <int>      Pause between supervised ticks (default: 1000)
 *   --world                  Enable the world phase
 *   --local <model.gguf>     Use a local model instead of the configured gateway
 *   --help                   Show this help message
 */

#include "geist/geist.hpp"
#ifdef GEIST_HAS_LOCAL_BACKEND
#include "geist/gateway/llama_gateway.hpp"
#endif

#include <spdlog/spdlog.h>
#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

// Global flag for Ctrl+C handling
std::atomic<bool> g_interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT) {
        g_interrupted = true;
    }
}

struct CLIArgs {
    std::string config_path;
    std::optional<std::string> task;
    int ticks = 0;
    int interval_ms = 1000;
    bool world = false;
    std::optional<std::string> local_model;
    bool help = false;
};

void print_usage(const char* program_name) {
    std::cout << "Geist Tick Runner\n\n";
    std::cout << "Usage:\n";
    std::cout << "  " << program_name << " --config <file> [options]\n\n";
    std::cout << "Options:\n";
    std::cout << "  --task <text>            Queue a task before ticking\n";
    std::cout << "  --ticks <int>            Run exactly N ticks, then exit (default: supervised ticking)\n";
    std::cout << "  --interval-ms <int>      Pause between supervised ticks (default: 1000)\n";
    std::cout << "  --world                  Enable the world phase\n";
    std::cout << "  --local <model.gguf>     Use a local model instead of the configured gateway\n";
    std::cout << "  --help                   Show this help message\n\n";
    std::cout << "Example:\n";
    std::cout << "  " << program_name << " --config geist.json --task \"write a haiku about autumn\" --ticks 1\n\n";
    std::cout << "Ctrl+C stops ticking; the context is persisted before exit.\n";
}

CLIArgs parse_args(int argc, char** argv) {
    CLIArgs args;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        try {
            if (arg == "--help") {
                args.help = true;
                return args;
            }
            else if (arg == "--config" && i + 1 < argc) {
                args.config_path = argv[++i];
            }
            else if (arg == "--task" && i + 1 < argc) {
                args.task = argv[++i];
            }
            else if (arg == "--ticks" && i + 1 < argc) {
                args.ticks = std::stoi(argv[++i]);
            }
            else if (arg == "--interval-ms" && i + 1 < argc) {
                args.interval_ms = std::stoi(argv[++i]);
            }
            else if (arg == "--world") {
                args.world = true;
            }
            else if (arg == "--local" && i + 1 < argc) {
                args.local_model = argv[++i];
            }
            else {
                std::cerr << "Unknown option: " << arg << "\n";
                args.help = true;
                return args;
            }
        } catch (const std::exception&) {
            std::cerr << "Invalid value for " << arg << "\n";
            args.help = true;
            return args;
        }
    }

    if (args.config_path.empty() || args.ticks < 0 || args.interval_ms < 0) {
        args.help = true;
    }
    return args;
}

void print_results(const std::vector<nlohmann::json>& results) {
    for (const auto& result : results) {
        std::cout << result.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) << "\n";
    }
    std::cout.flush();
}

geist::Expected<std::shared_ptr<geist::gateway::ICompletionGateway>> make_gateway(
    const geist::RuntimeConfig& config,
    const CLIArgs& args,
    std::shared_ptr<geist::transport::ITransport> transport) {
    const bool want_local = args.local_model.has_value() || !config.gateway.has_value();
    if (want_local) {
#ifdef GEIST_HAS_LOCAL_BACKEND
        auto local = config.local_model.value_or(geist::gateway::LocalModelConfig{});
        if (args.local_model) {
            local.model_path = *args.local_model;
        }
        if (auto valid = local.validate(); !valid) {
            return tl::unexpected(valid.error());
        }
        return std::shared_ptr<geist::gateway::ICompletionGateway>(
            std::make_shared<geist::gateway::LlamaCompletionGateway>(std::move(local)));
#else
        return tl::unexpected(geist::Error{
            geist::ErrorCode::InvalidConfig,
            "Local model requested but this build has no local backend"
        });
#endif
    }

    auto remote = geist::gateway::HttpCompletionGateway::create(*config.gateway, std::move(transport));
    if (!remote) {
        return tl::unexpected(remote.error());
    }
    return std::shared_ptr<geist::gateway::ICompletionGateway>(std::move(*remote));
}

int main(int argc, char** argv) {
    CLIArgs args = parse_args(argc, argv);

    if (args.help) {
        print_usage(argv[0]);
        return args.config_path.empty() ? 1 : 0;
    }

    spdlog::set_pattern("[%H:%M:%S] [%^%l%$] %v");

    auto config = geist::load_runtime_config(args.config_path);
    if (!config) {
        std::cerr << "Error: " << config.error().to_string() << "\n";
        return 1;
    }
    spdlog::set_level(spdlog::level::from_str(config->log_level));

    if (args.world) {
        config->agent.include_world_processing = true;
    }

    std::signal(SIGINT, signal_handler);

    auto transport = geist::transport::create_transport();

    auto gateway = make_gateway(*config, args, transport);
    if (!gateway) {
        std::cerr << "Error: " << gateway.error().to_string() << "\n";
        return 1;
    }

    auto registry = geist::capability::CapabilityRegistry::from_table(
        geist::capability::builtin_capabilities(transport), config->capabilities);
    if (!registry) {
        std::cerr << "Error: " << registry.error().to_string() << "\n";
        return 1;
    }

    std::shared_ptr<geist::persistence::ISnapshotSink> sink;
    if (!config->database_path.empty()) {
        auto store = geist::persistence::SqliteSnapshotStore::open(config->database_path);
        if (!store) {
            std::cerr << "Error: " << store.error().to_string() << "\n";
            return 1;
        }
        sink = std::move(*store);
    }

    auto agent_result = geist::Agent::create(*config, std::move(*gateway), std::move(*registry), sink);
    if (!agent_result) {
        std::cerr << "Error: " << agent_result.error().to_string() << "\n";
        return 1;
    }
    auto agent = std::move(*agent_result);

    if (auto restored = agent->phase_in(); !restored) {
        std::cerr << "Error: " << restored.error().to_string() << "\n";
        return 1;
    }
    agent->initialize(args.task);

    int exit_code = 0;
    if (args.ticks > 0) {
        for (int i = 0; i < args.ticks && !g_interrupted; ++i) {
            auto results = agent->tick();
            if (!results) {
                if (results.error().category() == geist::ErrorCategory::State) {
                    std::cout << "Nothing to do: " << results.error().message << "\n";
                    break;
                }
                std::cerr << "Error: " << results.error().to_string() << "\n";
                exit_code = 1;
                break;
            }
            print_results(*results);
        }
    } else {
        if (auto started = agent->start(std::chrono::milliseconds(args.interval_ms), print_results); !started) {
            std::cerr << "Error: " << started.error().to_string() << "\n";
            return 1;
        }
        while (!g_interrupted && agent->is_running()) {
            std::this_thread::sleep_for(std::chrono::milliseconds(100));
        }
        if (auto error = agent->last_error()) {
            std::cerr << "Error: " << error->to_string() << "\n";
            exit_code = 1;
        }
        std::cout << "Completed " << agent->ticks_completed() << " tick(s)\n";
    }

    if (auto saved = agent->phase_out(); !saved) {
        std::cerr << "Error: " << saved.error().to_string() << "\n";
        return 1;
    }
    return exit_code;
}
