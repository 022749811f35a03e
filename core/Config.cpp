#include "core/Config.hpp"
#include "core/Logger.hpp"
#include <yaml-cpp/yaml.h>

namespace ward {

namespace {

template<typename T>
void Read(const YAML::Node& node, const char* key, T& out) {
    if (node[key]) {
        out = node[key].as<T>();
    }
}

void ReadMillis(const YAML::Node& node, const char* key, std::chrono::milliseconds& out) {
    if (node[key]) {
        int64_t value = node[key].as<int64_t>();
        if (value < 0) {
            throw ConfigError(std::string("negative duration for '") + key + "'");
        }
        out = std::chrono::milliseconds(value);
    }
}

void ReadList(const YAML::Node& node, const char* key, std::vector<std::string>& out) {
    const YAML::Node list = node[key];
    if (!list) {
        return;
    }
    if (!list.IsSequence()) {
        throw ConfigError(std::string("'") + key + "' must be a list");
    }
    out.clear();
    for (const auto& item : list) {
        out.push_back(item.as<std::string>());
    }
}

void ApplyDetection(const YAML::Node& node, DetectionConfig& cfg) {
    Read(node, "detection_threshold", cfg.detection_threshold);
    Read(node, "hard_heuristic_ceiling", cfg.hard_heuristic_ceiling);
    Read(node, "ml_soft_floor", cfg.ml_soft_floor);
    Read(node, "heuristic_soft_floor", cfg.heuristic_soft_floor);
}

void ApplyScheduler(const YAML::Node& node, SchedulerConfig& cfg) {
    ReadMillis(node, "sweep_interval_ms", cfg.sweep_interval);
    ReadMillis(node, "maintenance_interval_ms", cfg.maintenance_interval);
    Read(node, "min_evidence", cfg.min_evidence);
    Read(node, "retain_after_clear", cfg.retain_after_clear);
    ReadMillis(node, "positive_grace_ms", cfg.positive_grace);
    ReadMillis(node, "stale_window_ms", cfg.stale_window);
}

void ApplyStore(const YAML::Node& node, StoreConfig& cfg) {
    Read(node, "buffer_capacity", cfg.buffer_capacity);
    Read(node, "lock_stripes", cfg.lock_stripes);
    ReadList(node, "whitelist", cfg.whitelist);
}

void ApplyHeuristics(const YAML::Node& node, HeuristicConfig& cfg) {
    ReadList(node, "critical_processes", cfg.critical_processes);
    ReadList(node, "suspicious_extensions", cfg.suspicious_extensions);
    ReadList(node, "suspicious_directories", cfg.suspicious_directories);
    ReadList(node, "ai_keywords", cfg.ai_keywords);
    ReadList(node, "persistence_key_patterns", cfg.persistence_key_patterns);
    Read(node, "score_decay", cfg.score_decay);

    if (const YAML::Node deltas = node["deltas"]) {
        Read(deltas, "injection", cfg.injection_delta);
        Read(deltas, "critical_access", cfg.critical_access_delta);
        Read(deltas, "ai_communication", cfg.ai_communication_delta);
        Read(deltas, "persistence", cfg.persistence_delta);
        Read(deltas, "suspicious_extension", cfg.suspicious_extension_delta);
        Read(deltas, "suspicious_directory", cfg.suspicious_directory_delta);
        Read(deltas, "tampering", cfg.tampering_delta);
        Read(deltas, "injection_chain", cfg.injection_chain_bonus);
        Read(deltas, "dropper", cfg.dropper_bonus);
        Read(deltas, "persistence_launch", cfg.persistence_launch_bonus);
    }
}

void ApplyIngestion(const YAML::Node& node, IngestionConfig& cfg) {
    Read(node, "source_path", cfg.source_path);
    Read(node, "follow", cfg.follow);
    Read(node, "batch_size", cfg.batch_size);
    ReadMillis(node, "poll_timeout_ms", cfg.poll_timeout);
    ReadMillis(node, "retry_delay_ms", cfg.retry_delay);

    const YAML::Node events = node["monitored_events"];
    if (events) {
        if (!events.IsSequence()) {
            throw ConfigError("'monitored_events' must be a list");
        }
        cfg.monitored_events.clear();
        for (const auto& item : events) {
            cfg.monitored_events.insert(item.as<uint32_t>());
        }
    }
}

void ApplyMitigation(const YAML::Node& node, MitigationConfig& cfg) {
    Read(node, "quarantine_enabled", cfg.quarantine_enabled);
    Read(node, "save_evidence", cfg.save_evidence);
    Read(node, "evidence_dir", cfg.evidence_dir);
    ReadMillis(node, "termination_timeout_ms", cfg.termination_timeout);
    Read(node, "alert_endpoint", cfg.alert_endpoint);
    ReadMillis(node, "alert_timeout_ms", cfg.alert_timeout);
    Read(node, "alert_queue_size", cfg.alert_queue_size);
}

} // namespace

void ApplyConfig(const YAML::Node& root, EngineConfig& config) {
    if (!root || root.IsNull()) {
        return;
    }
    if (!root.IsMap()) {
        throw ConfigError("configuration root must be a mapping");
    }

    try {
        if (const YAML::Node n = root["detection"])   ApplyDetection(n, config.detection);
        if (const YAML::Node n = root["scheduler"])   ApplyScheduler(n, config.scheduler);
        if (const YAML::Node n = root["store"])       ApplyStore(n, config.store);
        if (const YAML::Node n = root["heuristics"])  ApplyHeuristics(n, config.heuristics);
        if (const YAML::Node n = root["ingestion"])   ApplyIngestion(n, config.ingestion);
        if (const YAML::Node n = root["mitigation"])  ApplyMitigation(n, config.mitigation);

        if (const YAML::Node n = root["persistence"]) {
            Read(n, "enabled", config.persistence.enabled);
            Read(n, "database_path", config.persistence.database_path);
        }
        if (const YAML::Node n = root["model"]) {
            Read(n, "path", config.model.path);
        }
        if (const YAML::Node n = root["logging"]) {
            Read(n, "file", config.logging.file);
            Read(n, "level", config.logging.level);
        }
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("invalid configuration value: ") + ex.what());
    }
}

void ValidateConfig(const EngineConfig& config) {
    const auto& d = config.detection;
    if (d.detection_threshold < 0.0 || d.detection_threshold > 1.0) {
        throw ConfigError("detection_threshold must be within [0, 1]");
    }
    if (d.ml_soft_floor < 0.0 || d.ml_soft_floor > 1.0) {
        throw ConfigError("ml_soft_floor must be within [0, 1]");
    }
    if (d.hard_heuristic_ceiling < 0 || d.hard_heuristic_ceiling > 100 ||
        d.heuristic_soft_floor < 0 || d.heuristic_soft_floor > 100) {
        throw ConfigError("heuristic thresholds must be within [0, 100]");
    }
    if (config.heuristics.score_decay < 0 || config.heuristics.score_decay > 100) {
        throw ConfigError("score_decay must be within [0, 100]");
    }
    if (config.store.buffer_capacity == 0) {
        throw ConfigError("buffer_capacity must be positive");
    }
    if (config.store.lock_stripes == 0) {
        throw ConfigError("lock_stripes must be positive");
    }
    if (config.ingestion.batch_size == 0) {
        throw ConfigError("batch_size must be positive");
    }
    if (config.scheduler.sweep_interval.count() == 0 ||
        config.scheduler.maintenance_interval.count() == 0) {
        throw ConfigError("scheduler intervals must be positive");
    }
    if (config.scheduler.sweep_interval > config.scheduler.maintenance_interval) {
        LOG_WARN("sweep interval ({} ms) is longer than maintenance interval ({} ms)",
                 config.scheduler.sweep_interval.count(),
                 config.scheduler.maintenance_interval.count());
    }
    if (config.scheduler.min_evidence > config.store.buffer_capacity) {
        LOG_WARN("min_evidence ({}) exceeds buffer_capacity ({}); periodic sweeps will never qualify",
                 config.scheduler.min_evidence, config.store.buffer_capacity);
    }
}

EngineConfig LoadConfig(const std::string& path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(path);
    } catch (const YAML::Exception& ex) {
        throw ConfigError("failed to load configuration " + path + ": " + ex.what());
    }

    EngineConfig config;
    ApplyConfig(root, config);
    ValidateConfig(config);

    LOG_INFO("Configuration loaded from {}", path);
    return config;
}

EngineConfig LoadConfigFromString(const std::string& yaml_text) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml_text);
    } catch (const YAML::Exception& ex) {
        throw ConfigError(std::string("failed to parse configuration: ") + ex.what());
    }

    EngineConfig config;
    ApplyConfig(root, config);
    ValidateConfig(config);
    return config;
}

} // namespace ward
