#pragma once

#include "core/Config.hpp"
#include "engine/BehaviorSweeper.hpp"
#include "engine/Classifier.hpp"
#include "engine/FusionEngine.hpp"
#include "engine/HeuristicEngine.hpp"
#include "engine/ProcessBehaviorStore.hpp"
#include "ingest/EventNormalizer.hpp"
#include "ingest/EventSource.hpp"
#include "ingest/IngestionLoop.hpp"
#include "persistence/DetectionStore.hpp"
#include "response/AlertChannel.hpp"
#include "response/MitigationCoordinator.hpp"
#include "response/ProcessController.hpp"
#include <atomic>
#include <memory>

namespace ward {

struct EngineStats {
    uint64_t events_normalized{0};
    uint64_t events_dropped{0};
    uint64_t events_unmonitored{0};
    size_t processes_tracked{0};
    IngestionStats ingestion;
    SweeperStats sweeper;
    MitigationStats mitigation;
    DetectionStore::StatusSnapshot history;
};

class DetectionEngine {
public:
    DetectionEngine(const EngineConfig& config,
                    std::unique_ptr<Classifier> classifier,
                    std::unique_ptr<EventSource> source,
                    std::shared_ptr<ProcessController> controller,
                    std::shared_ptr<AlertChannel> alert_channel);
    ~DetectionEngine();

    DetectionEngine(const DetectionEngine&) = delete;
    DetectionEngine& operator=(const DetectionEngine&) = delete;

    // Production wiring: JSON pipeline, NDJSON source, system process control and
    // a curl webhook when an endpoint is configured. Throws PipelineError when the
    // model cannot be loaded.
    static std::unique_ptr<DetectionEngine> Create(const EngineConfig& config);

    // Opens the detection history. False only when persistence is enabled and
    // the database cannot be opened.
    bool Initialize();
    void Start();
    void Stop();
    bool IsRunning() const { return running_.load(); }

    EngineStats GetStats() const;

    const EngineConfig& GetConfig() const { return config_; }
    ProcessBehaviorStore& GetStore() { return *store_; }
    BehaviorSweeper& GetSweeper() { return *sweeper_; }
    IngestionLoop& GetIngestion() { return *ingestion_; }
    MitigationCoordinator& GetMitigation() { return *mitigation_; }

private:
    EngineConfig config_;

    std::unique_ptr<Classifier> classifier_;
    std::unique_ptr<EventSource> source_;
    std::shared_ptr<ProcessController> controller_;
    std::shared_ptr<DetectionStore> history_;

    std::unique_ptr<EventNormalizer> normalizer_;
    std::unique_ptr<ProcessBehaviorStore> store_;
    std::unique_ptr<HeuristicEngine> heuristics_;
    std::unique_ptr<FusionEngine> fusion_;
    std::unique_ptr<MitigationCoordinator> mitigation_;
    std::unique_ptr<BehaviorSweeper> sweeper_;
    std::unique_ptr<IngestionLoop> ingestion_;

    std::atomic<bool> running_{false};
};

} // namespace ward
