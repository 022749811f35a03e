#include <gtest/gtest.h>
#include "engine/BehaviorSweeper.hpp"
#include <chrono>
#include <functional>
#include <mutex>
#include <thread>

using namespace ward;

namespace {

class ScriptedClassifier : public Classifier {
public:
    Classification Classify(const std::vector<std::string>& tokens) override {
        if (during_classify) {
            during_classify();
        }
        std::lock_guard<std::mutex> lock(mutex_);
        calls++;
        last_tokens = tokens;
        return next;
    }

    // Runs inside Classify, standing in for ingestion or maintenance racing
    // with a slow model.
    std::function<void()> during_classify;
    Classification next;
    int calls{0};
    std::vector<std::string> last_tokens;

private:
    std::mutex mutex_;
};

class RecordingHandler : public DetectionHandler {
public:
    void OnDetection(const Verdict& verdict, const ProcessRecord& record,
                     const std::vector<std::string>& sequence_indicators) override {
        std::lock_guard<std::mutex> lock(mutex_);
        verdicts.push_back(verdict);
        records.push_back(record);
        sequences.push_back(sequence_indicators);
        if (throw_on_detection) {
            throw std::runtime_error("handler failure");
        }
    }

    size_t Count() {
        std::lock_guard<std::mutex> lock(mutex_);
        return verdicts.size();
    }

    bool throw_on_detection{false};
    std::vector<Verdict> verdicts;
    std::vector<ProcessRecord> records;
    std::vector<std::vector<std::string>> sequences;

private:
    std::mutex mutex_;
};

} // namespace

class BehaviorSweeperTest : public ::testing::Test {
protected:
    void SetUp() override {
        scheduler.min_evidence = 5;
        scheduler.retain_after_clear = 20;
        scheduler.positive_grace = std::chrono::seconds(30);
        scheduler.stale_window = std::chrono::minutes(10);
        scheduler.sweep_interval = std::chrono::milliseconds(50);
        scheduler.maintenance_interval = std::chrono::milliseconds(100);

        store = std::make_unique<ProcessBehaviorStore>(store_config, heuristic_config);
        heuristics = std::make_unique<HeuristicEngine>(heuristic_config);
        fusion = std::make_unique<FusionEngine>(detection);
    }

    std::unique_ptr<BehaviorSweeper> MakeSweeper(ProcessBehaviorStore::ExistsFn exists_fn = nullptr) {
        return std::make_unique<BehaviorSweeper>(scheduler, *store, *heuristics, classifier, *fusion,
                                                 &handler, std::move(exists_fn));
    }

    // Mirrors the ingestion path for one event.
    void Ingest(const BehaviorEvent& event, BehaviorSweeper& sweeper) {
        store->RecordEvent(event);
        HeuristicResult result = heuristics->Evaluate(event);
        store->ApplyIndicators(event.pid, result.hits, result.ai_communication);
        if (result.immediate) {
            sweeper.RequestImmediate(event.pid);
        }
    }

    SchedulerConfig scheduler;
    StoreConfig store_config;
    HeuristicConfig heuristic_config;
    DetectionConfig detection;

    std::unique_ptr<ProcessBehaviorStore> store;
    std::unique_ptr<HeuristicEngine> heuristics;
    std::unique_ptr<FusionEngine> fusion;
    ScriptedClassifier classifier;
    RecordingHandler handler;
    TimePoint t0 = Clock::now();
};

TEST_F(BehaviorSweeperTest, InjectionChainIsMitigatedOnce) {
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Trojan"), 0.6};

    store->RecordToken(4242, "VirtualAlloc", t0);
    store->RecordToken(4242, "WriteProcessMemory", t0);
    Ingest(BehaviorEvent(4242, BehaviorKind::REMOTE_THREAD_CREATE, t0), *sweeper);

    EXPECT_EQ(store->Snapshot(4242)->suspicion_score, 50);
    EXPECT_EQ(sweeper->PendingImmediate(), 1u);

    EXPECT_EQ(sweeper->DrainImmediate(t0), 1u);

    ASSERT_EQ(handler.Count(), 1u);
    const Verdict& verdict = handler.verdicts[0];
    EXPECT_EQ(verdict.pid, 4242u);
    EXPECT_EQ(verdict.heuristic_score, 70);
    EXPECT_NEAR(verdict.fused_confidence, 0.65, 1e-9);
    EXPECT_TRUE(verdict.is_malicious);
    EXPECT_EQ(verdict.contributing_tokens,
              (std::vector<std::string>{"VirtualAlloc", "WriteProcessMemory", "CreateRemoteThread"}));
    EXPECT_EQ(handler.sequences[0], (std::vector<std::string>{"injection_chain"}));
    EXPECT_EQ(classifier.last_tokens.size(), 3u);

    // The sequence bonus is per verdict, not folded into the stored score.
    EXPECT_EQ(store->Snapshot(4242)->suspicion_score, 50);
    EXPECT_EQ(store->Snapshot(4242)->state, ProcessState::ANALYZED_POSITIVE);

    // Further evidence, requests and sweeps never produce a second detection.
    Ingest(BehaviorEvent(4242, BehaviorKind::REMOTE_THREAD_CREATE, t0), *sweeper);
    for (int i = 0; i < 10; ++i) {
        store->RecordToken(4242, "CreateRemoteThread", t0);
    }
    EXPECT_EQ(sweeper->DrainImmediate(t0), 0u);
    EXPECT_EQ(sweeper->RunSweepPass(t0), 0u);
    EXPECT_EQ(handler.Count(), 1u);
    EXPECT_EQ(sweeper->GetStats().positives, 1u);
}

TEST_F(BehaviorSweeperTest, BenignProcessIsCleared) {
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Benign"), 0.95};

    for (const char* token : {"CreateProcess", "LoadLibrary:kernel32.dll", "CreateFile",
                              "RegSetValue", "DnsQuery:example.com"}) {
        store->RecordToken(10, token, t0);
    }

    EXPECT_EQ(sweeper->RunSweepPass(t0), 1u);
    EXPECT_EQ(handler.Count(), 0u);

    auto record = store->Snapshot(10);
    EXPECT_EQ(record->state, ProcessState::ANALYZED_CLEAR);
    EXPECT_EQ(record->analysis_count, 1u);
    EXPECT_EQ(sweeper->GetStats().clears, 1u);

    // Cleared without new evidence: not analyzed again.
    EXPECT_EQ(sweeper->RunSweepPass(t0), 0u);
    EXPECT_EQ(classifier.calls, 1);
}

TEST_F(BehaviorSweeperTest, BenignFileActivityIsNotMitigated) {
    scheduler.min_evidence = 3;
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Benign"), 0.95};

    for (const char* token : {"CreateFileA", "ReadFile", "CloseHandle"}) {
        store->RecordToken(10, token, t0);
    }

    EXPECT_EQ(sweeper->RunSweepPass(t0), 1u);
    EXPECT_EQ(classifier.last_tokens, (std::vector<std::string>{"CreateFileA", "ReadFile", "CloseHandle"}));
    EXPECT_EQ(handler.Count(), 0u);
    EXPECT_EQ(sweeper->GetStats().positives, 0u);

    auto verdict = sweeper->AnalyzeProcess(10, AnalysisTrigger::IMMEDIATE, t0);
    ASSERT_TRUE(verdict.has_value());
    EXPECT_FALSE(verdict->is_malicious);
    EXPECT_EQ(verdict->heuristic_score, 0);
    EXPECT_EQ(handler.Count(), 0u);
}

TEST_F(BehaviorSweeperTest, TokensArrivingDuringClassificationAreSweptAgain) {
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Benign"), 0.9};

    for (int i = 0; i < 5; ++i) {
        store->RecordToken(77, "CreateFile", t0);
    }
    bool appended = false;
    classifier.during_classify = [this, &appended]() {
        if (appended) {
            return;
        }
        appended = true;
        for (int i = 0; i < 5; ++i) {
            store->RecordToken(77, "connect", t0);
        }
    };

    EXPECT_EQ(sweeper->RunSweepPass(t0), 1u);
    auto record = store->Snapshot(77);
    EXPECT_EQ(record->token_buffer.size(), 10u);
    EXPECT_EQ(record->state, ProcessState::TRACKED);

    // No further events, yet the burst still gets its look.
    EXPECT_EQ(sweeper->RunSweepPass(t0), 1u);
    EXPECT_EQ(classifier.calls, 2);
    EXPECT_EQ(classifier.last_tokens.size(), 10u);
    EXPECT_EQ(store->Snapshot(77)->state, ProcessState::ANALYZED_CLEAR);
    EXPECT_EQ(sweeper->RunSweepPass(t0), 0u);
}

TEST_F(BehaviorSweeperTest, VerdictIsNotAppliedToProcessReusingPid) {
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Trojan"), 0.9};

    store->RecordToken(88, "CreateRemoteThread", t0);
    store->AdjustScore(88, 80);
    classifier.during_classify = [this]() {
        store->Evict(88);
        store->RecordToken(88, "CreateProcess", t0);
    };

    EXPECT_FALSE(sweeper->AnalyzeProcess(88, AnalysisTrigger::IMMEDIATE, t0).has_value());
    EXPECT_EQ(handler.Count(), 0u);
    EXPECT_EQ(sweeper->GetStats().positives, 0u);
    EXPECT_EQ(sweeper->GetStats().stale_verdicts, 1u);

    auto fresh = store->Snapshot(88);
    ASSERT_TRUE(fresh.has_value());
    EXPECT_EQ(fresh->state, ProcessState::TRACKED);
    EXPECT_EQ(fresh->analysis_count, 0u);
    EXPECT_EQ(fresh->suspicion_score, 0);
}

TEST_F(BehaviorSweeperTest, ClearVerdictDecaysStoredScore) {
    heuristic_config.score_decay = 10;
    heuristics = std::make_unique<HeuristicEngine>(heuristic_config);
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Benign"), 0.9};

    store->RecordToken(90, "RegSetValue", t0);
    store->AdjustScore(90, 25);

    sweeper->RequestImmediate(90);
    sweeper->DrainImmediate(t0);
    EXPECT_EQ(store->Snapshot(90)->suspicion_score, 15);

    sweeper->RequestImmediate(90);
    sweeper->DrainImmediate(t0);
    EXPECT_EQ(store->Snapshot(90)->suspicion_score, 5);
    EXPECT_EQ(handler.Count(), 0u);
}

TEST_F(BehaviorSweeperTest, BenignLabelCannotVetoHeuristicCeiling) {
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Benign"), 0.99};

    store->RecordToken(77, "ProcessTampering", t0);
    store->AdjustScore(77, 80);
    sweeper->RequestImmediate(77);

    EXPECT_EQ(sweeper->DrainImmediate(t0), 1u);
    ASSERT_EQ(handler.Count(), 1u);
    EXPECT_EQ(handler.verdicts[0].heuristic_score, 80);
}

TEST_F(BehaviorSweeperTest, PeriodicSweepNeedsMinimumEvidence) {
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Trojan"), 1.0};

    for (int i = 0; i < 4; ++i) {
        store->RecordToken(55, "CreateProcess", t0);
    }
    EXPECT_EQ(sweeper->RunSweepPass(t0), 0u);
    EXPECT_EQ(classifier.calls, 0);

    // An immediate request needs only one token.
    sweeper->RequestImmediate(55);
    EXPECT_EQ(sweeper->DrainImmediate(t0), 1u);
    EXPECT_EQ(classifier.calls, 1);

    // fused = (1.0 + 0.0) / 2 is not above the 0.5 threshold
    EXPECT_EQ(handler.Count(), 0u);
}

TEST_F(BehaviorSweeperTest, ImmediateRequestsCollapse) {
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Benign"), 0.9};
    store->RecordToken(3, "CreateProcess", t0);

    sweeper->RequestImmediate(3);
    sweeper->RequestImmediate(3);
    sweeper->RequestImmediate(3);
    EXPECT_EQ(sweeper->PendingImmediate(), 1u);

    sweeper->DrainImmediate(t0);
    EXPECT_EQ(classifier.calls, 1);
    EXPECT_EQ(sweeper->PendingImmediate(), 0u);

    // Unknown pids are skipped quietly.
    sweeper->RequestImmediate(999);
    EXPECT_EQ(sweeper->DrainImmediate(t0), 0u);
}

TEST_F(BehaviorSweeperTest, ClearedRecordKeepsRecentTokens) {
    auto sweeper = MakeSweeper();
    classifier.next = {std::nullopt, 0.0};

    for (int i = 0; i < 30; ++i) {
        store->RecordToken(8, "tok" + std::to_string(i), t0);
    }
    sweeper->RunSweepPass(t0);

    auto record = store->Snapshot(8);
    EXPECT_EQ(record->token_buffer.size(), 20u);
    EXPECT_EQ(record->token_buffer.back(), "tok29");
}

TEST_F(BehaviorSweeperTest, MaintenanceEvictsPositiveAfterGrace) {
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Trojan"), 0.9};

    store->RecordToken(21, "CreateRemoteThread", t0);
    store->AdjustScore(21, 50);
    sweeper->RequestImmediate(21);
    sweeper->DrainImmediate(t0);
    ASSERT_EQ(handler.Count(), 1u);

    EXPECT_EQ(sweeper->RunMaintenancePass(t0 + std::chrono::seconds(10)), 0u);
    EXPECT_TRUE(store->Snapshot(21).has_value());

    EXPECT_EQ(sweeper->RunMaintenancePass(t0 + std::chrono::seconds(31)), 1u);
    EXPECT_FALSE(store->Snapshot(21).has_value());
    EXPECT_EQ(sweeper->GetStats().evicted_positive, 1u);

    // A reused pid starts a fresh record and may be detected again.
    store->RecordToken(21, "CreateRemoteThread", t0 + std::chrono::seconds(40));
    store->AdjustScore(21, 50);
    sweeper->RequestImmediate(21);
    sweeper->DrainImmediate(t0 + std::chrono::seconds(40));
    EXPECT_EQ(handler.Count(), 2u);
}

TEST_F(BehaviorSweeperTest, MaintenanceEvictsExitedAndIdleProcesses) {
    auto sweeper = MakeSweeper([](uint32_t pid) { return pid != 31; });

    store->RecordToken(30, "CreateProcess", t0);
    store->RecordToken(31, "CreateProcess", t0 + std::chrono::minutes(5));
    store->RecordToken(32, "CreateProcess", t0 + std::chrono::minutes(5));

    EXPECT_EQ(sweeper->RunMaintenancePass(t0 + std::chrono::minutes(11)), 2u);
    EXPECT_FALSE(store->Snapshot(30).has_value());
    EXPECT_FALSE(store->Snapshot(31).has_value());
    EXPECT_TRUE(store->Snapshot(32).has_value());
    EXPECT_EQ(sweeper->GetStats().evicted_stale, 2u);
}

TEST_F(BehaviorSweeperTest, MaintenanceForgetsExitedWhitelistedPids) {
    auto sweeper = MakeSweeper([](uint32_t pid) { return pid != 600; });

    BehaviorEvent trusted(600, BehaviorKind::PROCESS_CREATE, t0);
    trusted.attributes[attr::IMAGE] = "C:\\Windows\\System32\\svchost.exe";
    EXPECT_EQ(store->RecordEvent(trusted), RecordOutcome::DISCARDED);
    EXPECT_EQ(store->RecordToken(600, "DnsQuery", t0), RecordOutcome::DISCARDED);

    sweeper->RunMaintenancePass(t0);
    EXPECT_EQ(store->RecordToken(600, "DnsQuery", t0), RecordOutcome::CREATED);
}

TEST_F(BehaviorSweeperTest, HandlerFailureDoesNotStopAnalysis) {
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Trojan"), 0.9};
    handler.throw_on_detection = true;

    store->RecordToken(40, "CreateRemoteThread", t0);
    store->AdjustScore(40, 60);
    auto verdict = sweeper->AnalyzeProcess(40, AnalysisTrigger::IMMEDIATE, t0);

    ASSERT_TRUE(verdict.has_value());
    EXPECT_TRUE(verdict->is_malicious);
    EXPECT_EQ(store->Snapshot(40)->state, ProcessState::ANALYZED_POSITIVE);
}

TEST_F(BehaviorSweeperTest, BackgroundThreadHandlesImmediateRequests) {
    scheduler.sweep_interval = std::chrono::seconds(60);
    auto sweeper = MakeSweeper();
    classifier.next = {std::string("Trojan"), 0.9};

    sweeper->Start();
    EXPECT_TRUE(sweeper->IsRunning());

    store->RecordToken(50, "CreateRemoteThread", Clock::now());
    store->AdjustScore(50, 50);
    sweeper->RequestImmediate(50);

    auto deadline = Clock::now() + std::chrono::seconds(5);
    while (handler.Count() == 0 && Clock::now() < deadline) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }

    sweeper->Stop();
    EXPECT_FALSE(sweeper->IsRunning());
    EXPECT_EQ(handler.Count(), 1u);
}
