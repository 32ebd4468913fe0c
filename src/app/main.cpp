/**
 * @file main.cpp
 * @brief model_meshd daemon entry point.
 *
 * Admin role: Config → Logger → Repository → Allocator → Health → Failover → Telemetry.
 * Worker role: Config → Logger → Block receiver + heartbeat responder.
 */

#include "app/service_runner.hpp"
#include "core/config.hpp"
#include "core/json_util.hpp"
#include "core/logger.hpp"
#include "telemetry/json_sink.hpp"

#include <chrono>
#include <csignal>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

using namespace model_mesh;

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void signal_handler(int /*signal*/) {
    g_shutdown_requested = 1;
}

void print_banner() {
    std::cout << R"(
  ╔═══════════════════════════════════════════╗
  ║             ModelMesh v1.0.0              ║
  ║   Secure Model Block Distribution and     ║
  ║   Failover for Edge Inference Networks    ║
  ╚═══════════════════════════════════════════╝
)" << std::endl;
}

void print_usage() {
    std::cout << "Usage: model_meshd [OPTIONS]\n"
              << "  --config <path>        Configuration file (default: config/default.toml)\n"
              << "  --role <admin|worker>  Node role\n"
              << "  --node-id <id>         Node identifier\n"
              << "  --port <port>          Block receiver / heartbeat port\n"
              << "  --log-level <level>    debug, info, warn or error\n"
              << "  --export <model_file>  Split a model into encrypted blocks, then exit\n"
              << "  --model-id <id>        Model id for --export (default: file stem)\n"
              << "  --help, -h             Show this help message\n";
}

struct CLIArgs {
    std::filesystem::path config_path = "config/default.toml";
    std::string role;
    std::string node_id;
    uint16_t port = 0;
    std::string log_level;
    std::filesystem::path export_path;
    std::string model_id;
    bool help = false;
};

Result<CLIArgs> parse_args(int argc, char* argv[]) {
    CLIArgs args;
    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        auto next = [&]() -> Result<std::string> {
            if (i + 1 >= argc) return Error{arg + " needs a value", ErrorKind::InvalidInput};
            return std::string{argv[++i]};
        };

        if (arg == "--help" || arg == "-h") {
            args.help = true;
            continue;
        }
        auto value = next();
        if (!value) return value.error();

        if (arg == "--config") {
            args.config_path = *value;
        } else if (arg == "--role") {
            args.role = *value;
        } else if (arg == "--node-id") {
            args.node_id = *value;
        } else if (arg == "--port") {
            int port = 0;
            try {
                port = std::stoi(*value);
            } catch (const std::exception&) {
                return Error{"invalid port: " + *value, ErrorKind::InvalidInput};
            }
            if (port <= 0 || port > 65535) {
                return Error{"port out of range: " + *value, ErrorKind::InvalidInput};
            }
            args.port = static_cast<uint16_t>(port);
        } else if (arg == "--log-level") {
            args.log_level = *value;
        } else if (arg == "--export") {
            args.export_path = *value;
        } else if (arg == "--model-id") {
            args.model_id = *value;
        } else {
            return Error{"unknown option: " + arg, ErrorKind::InvalidInput};
        }
    }
    return args;
}

}  // namespace

int main(int argc, char* argv[]) {
    auto parsed = parse_args(argc, argv);
    if (!parsed) {
        std::cerr << parsed.error().message << "\n";
        print_usage();
        return 2;
    }
    auto args = *parsed;
    if (args.help) {
        print_usage();
        return 0;
    }

    print_banner();

    // Load configuration
    auto config_result = load_config(args.config_path);
    if (!config_result) {
        std::cerr << "Failed to load config: " << config_result.error().message << std::endl;
        std::cerr << "Using default configuration." << std::endl;
    }
    auto config = config_result ? *config_result : default_config();

    // Apply CLI overrides
    if (!args.role.empty()) config.node.role = args.role;
    if (!args.node_id.empty()) config.node.id = args.node_id;
    if (args.port != 0) config.node.port = args.port;
    if (!args.log_level.empty()) config.telemetry.log_level = args.log_level;

    if (config.node.role != "admin" && config.node.role != "worker") {
        std::cerr << "Unknown role: " << config.node.role << std::endl;
        return 2;
    }
    auto level = parse_log_level(config.telemetry.log_level);
    if (!level) {
        std::cerr << "Unknown log level: " << config.telemetry.log_level << std::endl;
        return 2;
    }

    // ── Initialize Logger ────────────────────
    std::unique_ptr<ILogSink> log_sink;
    std::unique_ptr<ILogSink> metrics_sink;
    if (!config.telemetry.log_dir.empty()) {
        log_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "model_mesh",
                                                  config.telemetry.max_file_size_mb,
                                                  config.telemetry.rotate_count);
        metrics_sink = std::make_unique<JsonFileSink>(config.telemetry.log_dir, "metrics",
                                                      config.telemetry.max_file_size_mb,
                                                      config.telemetry.rotate_count);
    } else {
        log_sink = std::make_unique<StdoutSink>();
        metrics_sink = std::make_unique<NullSink>();
    }
    Logger logger(std::move(log_sink), *level);
    logger.set_node_id(config.node.id);
    logger.info("ModelMesh starting...");
    logger.info("Node ID: " + config.node.id + " (" + config.node.role + ")");
    logger.info("License: " + config.license.tier
                + (config.license.valid ? "" : " (invalid)"));

    ServiceRunner runner(config, logger, std::move(metrics_sink));

    // ── Export shortcut ──────────────────────
    if (!args.export_path.empty()) {
        auto model_id = args.model_id.empty() ? args.export_path.stem().string() : args.model_id;
        auto exported = runner.export_model(model_id, args.export_path);
        if (!exported) {
            logger.error("Export failed: " + exported.error().message);
            std::cerr << "Export failed: " << exported.error().message << std::endl;
            return 1;
        }
        std::cout << "Exported " << exported->size() << " block(s) of model " << model_id
                  << " to " << config.transfer.storage_dir << std::endl;
        return 0;
    }

    // Register signal handlers
    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    if (auto started = runner.start(); !started) {
        std::cerr << "Failed to start: " << started.error().message << std::endl;
        return 1;
    }

    // ── Main Loop ────────────────────────────
    logger.info("Entering main loop. Press Ctrl+C to shutdown.");

    constexpr auto SUMMARY_INTERVAL = std::chrono::seconds{30};
    auto last_summary = std::chrono::steady_clock::now();
    while (!g_shutdown_requested) {
        std::this_thread::sleep_for(std::chrono::milliseconds(100));
        auto now = std::chrono::steady_clock::now();
        if (now - last_summary >= SUMMARY_INTERVAL) {
            runner.log_summary();
            last_summary = now;
        }
    }

    // ── Graceful Shutdown ────────────────────
    logger.info("Shutdown requested. Cleaning up...");
    runner.stop();
    logger.info("Final status: " + json::write_compact(runner.status_json()));
    logger.info("ModelMesh stopped.");
    return 0;
}
