#include <gtest/gtest.h>
#include "core/Config.hpp"
#include <filesystem>
#include <fstream>

using namespace ward;

TEST(ConfigTest, EmptyDocumentKeepsDefaults) {
    EngineConfig config = LoadConfigFromString("");

    EXPECT_DOUBLE_EQ(config.detection.detection_threshold, 0.5);
    EXPECT_EQ(config.detection.hard_heuristic_ceiling, 70);
    EXPECT_DOUBLE_EQ(config.detection.ml_soft_floor, 0.4);
    EXPECT_EQ(config.detection.heuristic_soft_floor, 50);
    EXPECT_EQ(config.scheduler.min_evidence, 5u);
    EXPECT_EQ(config.scheduler.sweep_interval.count(), 10000);
    EXPECT_EQ(config.store.buffer_capacity, 200u);
    EXPECT_EQ(config.mitigation.alert_queue_size, 256u);
    EXPECT_TRUE(config.ingestion.follow);
    EXPECT_EQ(config.ingestion.monitored_events.count(8), 1u);
    EXPECT_EQ(config.heuristics.score_decay, 10);
}

TEST(ConfigTest, OverridesAreApplied) {
    EngineConfig config = LoadConfigFromString(R"(
detection:
  detection_threshold: 0.4
  hard_heuristic_ceiling: 80
scheduler:
  sweep_interval_ms: 2000
  min_evidence: 3
  positive_grace_ms: 1000
store:
  buffer_capacity: 50
  whitelist: [explorer.exe]
heuristics:
  score_decay: 5
  ai_keywords: [mycorp-llm]
  deltas:
    injection: 40
    dropper: 25
ingestion:
  source_path: /var/log/sysmon.ndjson
  follow: false
  monitored_events: [1, 8]
mitigation:
  quarantine_enabled: false
  alert_endpoint: http://127.0.0.1:9000/alerts
  alert_queue_size: 16
persistence:
  enabled: false
model:
  path: /opt/ward/model.json
logging:
  level: debug
)");

    EXPECT_DOUBLE_EQ(config.detection.detection_threshold, 0.4);
    EXPECT_EQ(config.detection.hard_heuristic_ceiling, 80);
    EXPECT_EQ(config.scheduler.sweep_interval.count(), 2000);
    EXPECT_EQ(config.scheduler.min_evidence, 3u);
    EXPECT_EQ(config.scheduler.positive_grace.count(), 1000);
    EXPECT_EQ(config.store.buffer_capacity, 50u);
    ASSERT_EQ(config.store.whitelist.size(), 1u);
    EXPECT_EQ(config.store.whitelist[0], "explorer.exe");
    ASSERT_EQ(config.heuristics.ai_keywords.size(), 1u);
    EXPECT_EQ(config.heuristics.injection_delta, 40);
    EXPECT_EQ(config.heuristics.dropper_bonus, 25);
    EXPECT_EQ(config.heuristics.score_decay, 5);
    EXPECT_EQ(config.heuristics.critical_access_delta, 30);
    EXPECT_EQ(config.ingestion.source_path, "/var/log/sysmon.ndjson");
    EXPECT_FALSE(config.ingestion.follow);
    EXPECT_EQ(config.ingestion.monitored_events, (std::set<uint32_t>{1, 8}));
    EXPECT_FALSE(config.mitigation.quarantine_enabled);
    EXPECT_EQ(config.mitigation.alert_endpoint, "http://127.0.0.1:9000/alerts");
    EXPECT_EQ(config.mitigation.alert_queue_size, 16u);
    EXPECT_FALSE(config.persistence.enabled);
    EXPECT_EQ(config.model.path, "/opt/ward/model.json");
    EXPECT_EQ(config.logging.level, "debug");
}

TEST(ConfigTest, RejectsOutOfRangeValues) {
    EXPECT_THROW(LoadConfigFromString("detection:\n  detection_threshold: 1.5\n"), ConfigError);
    EXPECT_THROW(LoadConfigFromString("detection:\n  hard_heuristic_ceiling: 101\n"), ConfigError);
    EXPECT_THROW(LoadConfigFromString("store:\n  buffer_capacity: 0\n"), ConfigError);
    EXPECT_THROW(LoadConfigFromString("heuristics:\n  score_decay: -1\n"), ConfigError);
    EXPECT_THROW(LoadConfigFromString("scheduler:\n  sweep_interval_ms: -5\n"), ConfigError);
}

TEST(ConfigTest, RejectsMalformedDocuments) {
    EXPECT_THROW(LoadConfigFromString("detection: [unterminated"), ConfigError);
    EXPECT_THROW(LoadConfigFromString("- just\n- a list\n"), ConfigError);
    EXPECT_THROW(LoadConfigFromString("detection:\n  detection_threshold: high\n"), ConfigError);
    EXPECT_THROW(LoadConfigFromString("store:\n  whitelist: explorer.exe\n"), ConfigError);
}

TEST(ConfigTest, LoadConfigFromFile) {
    auto path = std::filesystem::temp_directory_path() / "ward_config_test.yaml";
    {
        std::ofstream out(path);
        out << "detection:\n  detection_threshold: 0.3\n";
    }

    EngineConfig config = LoadConfig(path.string());
    EXPECT_DOUBLE_EQ(config.detection.detection_threshold, 0.3);

    std::filesystem::remove(path);
    EXPECT_THROW(LoadConfig(path.string()), ConfigError);
}
