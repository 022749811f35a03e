#pragma once

#include <chrono>
#include <cstdint>
#include <set>
#include <stdexcept>
#include <string>
#include <vector>

namespace YAML { class Node; }

namespace ward {

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message) : std::runtime_error(message) {}
};

struct DetectionConfig {
    double detection_threshold{0.5};
    int hard_heuristic_ceiling{70};
    double ml_soft_floor{0.4};
    int heuristic_soft_floor{50};
};

struct SchedulerConfig {
    std::chrono::milliseconds sweep_interval{10000};
    std::chrono::milliseconds maintenance_interval{60000};
    size_t min_evidence{5};
    size_t retain_after_clear{20};
    std::chrono::milliseconds positive_grace{30000};
    std::chrono::milliseconds stale_window{600000};
};

struct StoreConfig {
    size_t buffer_capacity{200};
    size_t lock_stripes{16};
    std::vector<std::string> whitelist{
        "svchost.exe", "System", "smss.exe", "csrss.exe", "wininit.exe", "services.exe"
    };
};

struct HeuristicConfig {
    std::vector<std::string> critical_processes{"lsass.exe", "winlogon.exe", "csrss.exe"};
    std::vector<std::string> suspicious_extensions{".exe", ".dll", ".scr", ".bat", ".ps1", ".vbs"};
    std::vector<std::string> suspicious_directories{
        "\\temp\\", "\\appdata\\local\\temp\\", "\\users\\public\\", "\\programdata\\",
        "/tmp/", "/dev/shm/", "/var/tmp/"
    };
    std::vector<std::string> ai_keywords{
        "openai", "anthropic", "claude", "chatgpt", "gemini", "generativelanguage",
        "huggingface", "cohere", "mistral.ai", "groq", "deepseek", "perplexity",
        "replicate.com", "together.ai", "ollama"
    };
    std::vector<std::string> persistence_key_patterns{
        "*\\currentversion\\run\\*", "*\\currentversion\\run",
        "*\\currentversion\\runonce*", "*\\winlogon\\*", "*\\services\\*"
    };

    int injection_delta{50};
    int critical_access_delta{30};
    int ai_communication_delta{60};
    int persistence_delta{25};
    int suspicious_extension_delta{15};
    int suspicious_directory_delta{20};
    int tampering_delta{50};

    int injection_chain_bonus{20};
    int dropper_bonus{20};
    int persistence_launch_bonus{15};

    // Subtracted from the stored score each time an analysis clears the process.
    int score_decay{10};
};

struct IngestionConfig {
    std::string source_path{"events.ndjson"};
    bool follow{true};
    size_t batch_size{256};
    std::chrono::milliseconds poll_timeout{500};
    std::chrono::milliseconds retry_delay{5000};
    std::set<uint32_t> monitored_events{1, 3, 7, 8, 10, 11, 12, 13, 14, 22, 25};
};

struct MitigationConfig {
    bool quarantine_enabled{true};
    bool save_evidence{true};
    std::string evidence_dir{"evidence"};
    std::chrono::milliseconds termination_timeout{5000};
    std::string alert_endpoint;
    std::chrono::milliseconds alert_timeout{5000};
    size_t alert_queue_size{256};
};

struct PersistenceConfig {
    bool enabled{true};
    std::string database_path{"data/ward.db"};
};

struct ModelConfig {
    std::string path{"models/pipeline.json"};
};

struct LoggingConfig {
    std::string file{"logs/ward.log"};
    std::string level{"info"};
};

struct EngineConfig {
    DetectionConfig detection;
    SchedulerConfig scheduler;
    StoreConfig store;
    HeuristicConfig heuristics;
    IngestionConfig ingestion;
    MitigationConfig mitigation;
    PersistenceConfig persistence;
    ModelConfig model;
    LoggingConfig logging;
};

// Loads a YAML configuration file. Keys that are absent keep their defaults.
// Throws ConfigError on unreadable files, malformed YAML, wrongly typed values
// or values outside their valid range.
EngineConfig LoadConfig(const std::string& path);
EngineConfig LoadConfigFromString(const std::string& yaml_text);

void ApplyConfig(const YAML::Node& root, EngineConfig& config);
void ValidateConfig(const EngineConfig& config);

} // namespace ward
