#include "engine/DetectionEngine.hpp"
#include "core/Logger.hpp"
#include "engine/ModelPipeline.hpp"
#include "ingest/NdjsonEventSource.hpp"

namespace ward {

DetectionEngine::DetectionEngine(const EngineConfig& config,
                                 std::unique_ptr<Classifier> classifier,
                                 std::unique_ptr<EventSource> source,
                                 std::shared_ptr<ProcessController> controller,
                                 std::shared_ptr<AlertChannel> alert_channel)
    : config_(config),
      classifier_(std::move(classifier)),
      source_(std::move(source)),
      controller_(std::move(controller)) {
    if (!classifier_ || !source_) {
        throw std::invalid_argument("DetectionEngine requires a classifier and an event source");
    }

    if (config_.persistence.enabled) {
        history_ = std::make_shared<DetectionStore>();
    }

    std::unique_ptr<AlertDispatcher> dispatcher;
    if (alert_channel) {
        dispatcher = std::make_unique<AlertDispatcher>(alert_channel, config_.mitigation.alert_queue_size);
    }

    normalizer_ = std::make_unique<EventNormalizer>(config_.ingestion.monitored_events);
    store_ = std::make_unique<ProcessBehaviorStore>(config_.store, config_.heuristics);
    heuristics_ = std::make_unique<HeuristicEngine>(config_.heuristics);
    fusion_ = std::make_unique<FusionEngine>(config_.detection);
    mitigation_ = std::make_unique<MitigationCoordinator>(
        config_.mitigation, config_.detection, controller_, std::move(dispatcher), history_);

    ProcessBehaviorStore::ExistsFn exists_fn;
    if (controller_) {
        auto controller_ref = controller_;
        exists_fn = [controller_ref](uint32_t pid) { return controller_ref->Exists(pid); };
    }

    sweeper_ = std::make_unique<BehaviorSweeper>(
        config_.scheduler, *store_, *heuristics_, *classifier_, *fusion_, mitigation_.get(), exists_fn);
    ingestion_ = std::make_unique<IngestionLoop>(
        config_.ingestion, *source_, *normalizer_, *store_, *heuristics_, sweeper_.get());
}

DetectionEngine::~DetectionEngine() {
    Stop();
    if (history_) {
        history_->Shutdown();
    }
}

std::unique_ptr<DetectionEngine> DetectionEngine::Create(const EngineConfig& config) {
    std::shared_ptr<const ModelPipeline> pipeline = LinearModelPipeline::LoadFromFile(config.model.path);
    auto classifier = std::make_unique<ClassifierAdapter>(pipeline);

    auto source = std::make_unique<NdjsonEventSource>(config.ingestion.source_path, config.ingestion.follow);
    auto controller = std::make_shared<SystemProcessController>();

    std::shared_ptr<AlertChannel> channel;
    if (!config.mitigation.alert_endpoint.empty()) {
        channel = std::make_shared<CurlWebhookChannel>(config.mitigation.alert_endpoint,
                                                       config.mitigation.alert_timeout);
    }

    return std::make_unique<DetectionEngine>(config, std::move(classifier), std::move(source),
                                             std::move(controller), std::move(channel));
}

bool DetectionEngine::Initialize() {
    if (history_ && !history_->Initialize(config_.persistence.database_path)) {
        LOG_ERROR("Failed to open detection history at {}", config_.persistence.database_path);
        return false;
    }

    LOG_INFO("DetectionEngine initialized (threshold {:.2f}, ceiling {}, buffer {}, whitelist {} entries)",
             config_.detection.detection_threshold, config_.detection.hard_heuristic_ceiling,
             config_.store.buffer_capacity, config_.store.whitelist.size());
    return true;
}

void DetectionEngine::Start() {
    if (running_.exchange(true)) {
        LOG_WARN("DetectionEngine already running");
        return;
    }

    sweeper_->Start();
    ingestion_->Start();
    LOG_INFO("DetectionEngine started");
}

void DetectionEngine::Stop() {
    if (!running_.exchange(false)) {
        return;
    }

    // Producer first, so nothing new is queued for the sweeper.
    ingestion_->Stop();
    sweeper_->Stop();
    mitigation_->Shutdown();
    LOG_INFO("DetectionEngine stopped");
}

EngineStats DetectionEngine::GetStats() const {
    EngineStats stats;
    stats.events_normalized = normalizer_->GetNormalizedCount();
    stats.events_dropped = normalizer_->GetDroppedCount();
    stats.events_unmonitored = normalizer_->GetUnmonitoredCount();
    stats.processes_tracked = store_->Size();
    stats.ingestion = ingestion_->GetStats();
    stats.sweeper = sweeper_->GetStats();
    stats.mitigation = mitigation_->GetStats();
    if (history_) {
        stats.history = history_->GetStatusSnapshot();
    }
    return stats;
}

} // namespace ward
