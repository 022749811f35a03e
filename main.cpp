#include "core/Config.hpp"
#include "core/Logger.hpp"
#include "engine/DetectionEngine.hpp"
#include "engine/ModelPipeline.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>
#include <thread>

namespace ward {

std::atomic<bool> g_running{true};

void SignalHandler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        g_running = false;
    }
}

struct CommandLine {
    std::string config_path{"config/ward.yaml"};
    std::optional<std::string> model_path;
    std::optional<std::string> events_path;
    std::optional<double> threshold;
    bool no_quarantine{false};
    bool no_follow{false};
    bool show_help{false};
};

void PrintUsage(const char* program) {
    std::cout << "Usage: " << program << " [options]\n"
              << "  --config <path>     configuration file (default config/ward.yaml)\n"
              << "  --model <path>      classifier pipeline artifact\n"
              << "  --events <path>     NDJSON event file to consume\n"
              << "  --threshold <value> fused detection threshold in [0,1]\n"
              << "  --no-quarantine     detect and alert only, never terminate processes\n"
              << "  --no-follow         stop reading at end of the event file\n"
              << "  --help              show this message\n";
}

// Throws std::invalid_argument on unknown flags or missing values.
CommandLine ParseCommandLine(int argc, char* argv[]) {
    CommandLine cli;

    auto next_value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc) {
            throw std::invalid_argument(flag + " requires a value");
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--config") {
            cli.config_path = next_value(i, arg);
        } else if (arg == "--model") {
            cli.model_path = next_value(i, arg);
        } else if (arg == "--events") {
            cli.events_path = next_value(i, arg);
        } else if (arg == "--threshold") {
            std::string value = next_value(i, arg);
            size_t consumed = 0;
            double threshold = std::stod(value, &consumed);
            if (consumed != value.size() || threshold < 0.0 || threshold > 1.0) {
                throw std::invalid_argument("--threshold must be a number in [0,1]");
            }
            cli.threshold = threshold;
        } else if (arg == "--no-quarantine") {
            cli.no_quarantine = true;
        } else if (arg == "--no-follow") {
            cli.no_follow = true;
        } else if (arg == "--help" || arg == "-h") {
            cli.show_help = true;
        } else {
            throw std::invalid_argument("Unknown option: " + arg);
        }
    }
    return cli;
}

EngineConfig BuildConfig(const CommandLine& cli) {
    EngineConfig config = LoadConfig(cli.config_path);

    if (cli.model_path) config.model.path = *cli.model_path;
    if (cli.events_path) config.ingestion.source_path = *cli.events_path;
    if (cli.threshold) config.detection.detection_threshold = *cli.threshold;
    if (cli.no_quarantine) config.mitigation.quarantine_enabled = false;
    if (cli.no_follow) config.ingestion.follow = false;

    ValidateConfig(config);
    return config;
}

void LogStatus(const DetectionEngine& engine, std::chrono::seconds uptime) {
    EngineStats stats = engine.GetStats();
    LOG_INFO("Status: uptime={}s events={} tracked={} analyses={} detections={} quarantined={}",
             uptime.count(), stats.ingestion.raw_events, stats.processes_tracked,
             stats.sweeper.analyses, stats.mitigation.detections, stats.mitigation.quarantines);
}

void LogFinalStatistics(const DetectionEngine& engine) {
    EngineStats stats = engine.GetStats();
    LOG_INFO("==================== Final statistics ====================");
    LOG_INFO("  Raw events read:        {}", stats.ingestion.raw_events);
    LOG_INFO("  Events normalized:      {}", stats.events_normalized);
    LOG_INFO("  Events dropped:         {} malformed, {} unmonitored",
             stats.events_dropped, stats.events_unmonitored);
    LOG_INFO("  Whitelisted events:     {}", stats.ingestion.discarded);
    LOG_INFO("  Processes tracked:      {}", stats.processes_tracked);
    LOG_INFO("  Analyses:               {} ({} clear, {} positive)",
             stats.sweeper.analyses, stats.sweeper.clears, stats.sweeper.positives);
    LOG_INFO("  Detections:             {}", stats.mitigation.detections);
    LOG_INFO("  Quarantined:            {} ({} failed)",
             stats.mitigation.quarantines, stats.mitigation.termination_failures);
    LOG_INFO("  Evidence saved:         {} ({} failed)",
             stats.mitigation.evidence_saved, stats.mitigation.evidence_failures);
    LOG_INFO("  Alerts delivered:       {} ({} failed)",
             stats.mitigation.alert_successes, stats.mitigation.alert_failures);
    for (const auto& [name, count] : stats.mitigation.indicator_counts) {
        LOG_INFO("  Indicator {:<22} {}", name, count);
    }
    LOG_INFO("===========================================================");
}

int Run(const CommandLine& cli) {
    EngineConfig config = BuildConfig(cli);

    Logger::Initialize(config.logging.file);
    Logger::SetLevel(LogLevelFromString(config.logging.level));

    LOG_INFO("==========================================================");
    LOG_INFO("  Ward - Behavioral Detection Engine");
    LOG_INFO("==========================================================");
    LOG_INFO("Configuration: {} | model: {} | events: {}",
             cli.config_path, config.model.path, config.ingestion.source_path);
    if (!config.mitigation.quarantine_enabled) {
        LOG_WARN("Quarantine disabled, detections will not terminate processes");
    }

    std::unique_ptr<DetectionEngine> engine = DetectionEngine::Create(config);
    if (!engine->Initialize()) {
        LOG_CRITICAL("Failed to initialize detection engine");
        return 1;
    }

    engine->Start();
    LOG_INFO("Ward is now running. Press Ctrl+C to stop.");

    auto start_time = std::chrono::steady_clock::now();
    auto last_status = start_time;
    const auto status_interval = std::max<std::chrono::seconds>(
        std::chrono::seconds(1),
        std::chrono::duration_cast<std::chrono::seconds>(config.scheduler.maintenance_interval));

    while (g_running) {
        std::this_thread::sleep_for(std::chrono::milliseconds(500));

        auto now = std::chrono::steady_clock::now();
        if (now - last_status >= status_interval) {
            LogStatus(*engine, std::chrono::duration_cast<std::chrono::seconds>(now - start_time));
            last_status = now;
        }

        if (engine->GetIngestion().IsFinished()) {
            // Finite input: give pending evidence a last look before exiting.
            engine->GetSweeper().DrainImmediate(std::chrono::steady_clock::now());
            engine->GetSweeper().RunSweepPass(std::chrono::steady_clock::now());
            break;
        }
    }

    LOG_INFO("Stopping Ward...");
    engine->Stop();
    LogFinalStatistics(*engine);
    return 0;
}

} // namespace ward

int main(int argc, char* argv[]) {
    std::signal(SIGINT, ward::SignalHandler);
    std::signal(SIGTERM, ward::SignalHandler);

    ward::CommandLine cli;
    try {
        cli = ward::ParseCommandLine(argc, argv);
    } catch (const std::exception& ex) {
        std::cerr << "ward_engine: " << ex.what() << "\n";
        ward::PrintUsage(argv[0]);
        return 2;
    }

    if (cli.show_help) {
        ward::PrintUsage(argv[0]);
        return 0;
    }

    int rc = 1;
    try {
        rc = ward::Run(cli);
    } catch (const ward::ConfigError& ex) {
        LOG_CRITICAL("Configuration error: {}", ex.what());
    } catch (const ward::PipelineError& ex) {
        LOG_CRITICAL("Failed to load classifier pipeline: {}", ex.what());
    } catch (const std::exception& ex) {
        LOG_CRITICAL("Fatal error: {}", ex.what());
    }

    LOG_INFO("Ward shutdown complete");
    ward::Logger::Shutdown();
    return rc;
}
