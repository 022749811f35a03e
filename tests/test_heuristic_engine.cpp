#include <gtest/gtest.h>
#include "engine/HeuristicEngine.hpp"
#include <algorithm>

using namespace ward;

namespace {

bool HasHit(const std::vector<IndicatorHit>& hits, const std::string& name) {
    return std::any_of(hits.begin(), hits.end(),
                       [&name](const IndicatorHit& hit) { return hit.name == name; });
}

} // namespace

class HeuristicEngineTest : public ::testing::Test {
protected:
    HeuristicConfig config;
    HeuristicEngine engine{config};
};

TEST_F(HeuristicEngineTest, RemoteThreadIsInjection) {
    BehaviorEvent event(4242, BehaviorKind::REMOTE_THREAD_CREATE);
    auto result = engine.Evaluate(event);

    ASSERT_EQ(result.hits.size(), 1u);
    EXPECT_EQ(result.hits[0].name, indicator::INJECTION);
    EXPECT_EQ(result.hits[0].delta, 50);
    EXPECT_TRUE(result.immediate);
}

TEST_F(HeuristicEngineTest, CriticalProcessAccess) {
    BehaviorEvent lsass(1, BehaviorKind::PROCESS_ACCESS);
    lsass.attributes[attr::TARGET_IMAGE] = "C:\\Windows\\System32\\lsass.exe";
    auto result = engine.Evaluate(lsass);
    ASSERT_EQ(result.hits.size(), 1u);
    EXPECT_EQ(result.hits[0].name, indicator::CRITICAL_PROCESS_ACCESS);
    EXPECT_EQ(result.hits[0].delta, 30);
    EXPECT_TRUE(result.immediate);

    BehaviorEvent notepad(1, BehaviorKind::PROCESS_ACCESS);
    notepad.attributes[attr::TARGET_IMAGE] = "C:\\Windows\\notepad.exe";
    EXPECT_TRUE(engine.Evaluate(notepad).Empty());
}

TEST_F(HeuristicEngineTest, AiEndpointsByHostAndDns) {
    BehaviorEvent connect(1, BehaviorKind::NETWORK_CONNECT);
    connect.attributes[attr::DEST_HOST] = "API.OpenAI.com";
    auto result = engine.Evaluate(connect);
    ASSERT_TRUE(HasHit(result.hits, indicator::AI_COMMUNICATION));
    EXPECT_TRUE(result.ai_communication);
    EXPECT_TRUE(result.immediate);

    BehaviorEvent dns(1, BehaviorKind::DNS_QUERY);
    dns.attributes[attr::QUERY_NAME] = "generativelanguage.googleapis.com";
    EXPECT_TRUE(engine.Evaluate(dns).ai_communication);

    BehaviorEvent plain(1, BehaviorKind::NETWORK_CONNECT);
    plain.attributes[attr::DEST_HOST] = "example.com";
    plain.attributes[attr::DEST_IP] = "93.184.216.34";
    auto quiet = engine.Evaluate(plain);
    EXPECT_TRUE(quiet.Empty());
    EXPECT_FALSE(quiet.immediate);
}

TEST_F(HeuristicEngineTest, PersistenceKeysAreCaseInsensitive) {
    EXPECT_TRUE(engine.IsPersistenceKey(
        "HKLM\\SOFTWARE\\Microsoft\\Windows\\CurrentVersion\\Run\\Updater"));
    EXPECT_TRUE(engine.IsPersistenceKey(
        "HKCU\\Software\\Microsoft\\Windows\\CurrentVersion\\RunOnce"));
    EXPECT_FALSE(engine.IsPersistenceKey("HKCU\\Software\\Vendor\\Settings"));
    EXPECT_FALSE(engine.IsPersistenceKey(""));

    BehaviorEvent reg(1, BehaviorKind::REGISTRY_WRITE);
    reg.attributes[attr::TARGET_OBJECT] = "HKLM\\System\\CurrentControlSet\\Services\\evilsvc";
    auto result = engine.Evaluate(reg);
    ASSERT_EQ(result.hits.size(), 1u);
    EXPECT_EQ(result.hits[0].name, indicator::PERSISTENCE);
    EXPECT_FALSE(result.immediate);
}

TEST_F(HeuristicEngineTest, FileDropInSuspiciousDirectory) {
    BehaviorEvent drop(1, BehaviorKind::FILE_CREATE);
    drop.attributes[attr::TARGET_FILENAME] = "C:\\Users\\bob\\AppData\\Local\\Temp\\stage2.exe";
    auto result = engine.Evaluate(drop);

    EXPECT_TRUE(HasHit(result.hits, indicator::SUSPICIOUS_EXTENSION));
    EXPECT_TRUE(HasHit(result.hits, indicator::SUSPICIOUS_DIRECTORY));
    EXPECT_EQ(HeuristicEngine::TotalDelta(result.hits), 35);
    EXPECT_FALSE(result.immediate);

    BehaviorEvent doc(1, BehaviorKind::FILE_CREATE);
    doc.attributes[attr::TARGET_FILENAME] = "C:\\Users\\bob\\Documents\\report.docx";
    EXPECT_TRUE(engine.Evaluate(doc).Empty());
}

TEST_F(HeuristicEngineTest, TamperingIsImmediate) {
    auto result = engine.Evaluate(BehaviorEvent(1, BehaviorKind::PROCESS_TAMPERING));
    EXPECT_TRUE(HasHit(result.hits, indicator::PROCESS_TAMPERING));
    EXPECT_TRUE(result.immediate);
}

TEST_F(HeuristicEngineTest, BenignKindsProduceNothing) {
    EXPECT_TRUE(engine.Evaluate(BehaviorEvent(1, BehaviorKind::PROCESS_CREATE)).Empty());
    EXPECT_TRUE(engine.Evaluate(BehaviorEvent(1, BehaviorKind::IMAGE_LOAD)).Empty());
    EXPECT_TRUE(engine.Evaluate(BehaviorEvent(1, BehaviorKind::OTHER)).Empty());
}

TEST_F(HeuristicEngineTest, InjectionChainNeedsOrder) {
    std::deque<std::string> ordered{"VirtualAllocEx", "WriteProcessMemory", "CreateRemoteThread"};
    auto hits = engine.EvaluateSequence(ordered);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].name, indicator::INJECTION_CHAIN);
    EXPECT_EQ(hits[0].delta, 20);

    std::deque<std::string> reversed{"CreateRemoteThread", "VirtualAlloc"};
    EXPECT_TRUE(engine.EvaluateSequence(reversed).empty());
}

TEST_F(HeuristicEngineTest, DropperAndPersistenceLaunch) {
    std::deque<std::string> dropper{"CreateFile:.exe", "LoadLibrary:kernel32.dll",
                                    "CreateProcess", "connect:10.0.0.5:443"};
    auto hits = engine.EvaluateSequence(dropper);
    EXPECT_TRUE(HasHit(hits, indicator::DROPPER));
    EXPECT_FALSE(HasHit(hits, indicator::PERSISTENCE_LAUNCH));

    std::deque<std::string> launch{"RegSetValue", "CreateProcess"};
    hits = engine.EvaluateSequence(launch);
    ASSERT_EQ(hits.size(), 1u);
    EXPECT_EQ(hits[0].name, indicator::PERSISTENCE_LAUNCH);
    EXPECT_EQ(hits[0].delta, 15);

    EXPECT_TRUE(engine.EvaluateSequence({"CreateProcess"}).empty());
}

TEST_F(HeuristicEngineTest, CustomDeltasFromConfig) {
    HeuristicConfig custom;
    custom.injection_delta = 10;
    custom.ai_keywords = {"internal-llm"};
    HeuristicEngine tuned(custom);

    auto result = tuned.Evaluate(BehaviorEvent(1, BehaviorKind::REMOTE_THREAD_CREATE));
    EXPECT_EQ(result.hits[0].delta, 10);

    EXPECT_TRUE(tuned.MatchesAiKeyword("gw.internal-llm.corp"));
    EXPECT_FALSE(tuned.MatchesAiKeyword("api.openai.com"));
}
