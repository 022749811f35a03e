#include <gtest/gtest.h>
#include "persistence/DetectionStore.hpp"
#include <filesystem>

using namespace ward;

namespace {

DetectionRow MakeRow(const std::string& uuid, uint32_t pid, uint64_t at_ms, bool quarantined) {
    DetectionRow row;
    row.uuid = uuid;
    row.detected_at_ms = at_ms;
    row.pid = pid;
    row.image = "C:\\Temp\\sample.exe";
    row.command_line = "sample.exe /s";
    row.label = "Trojan";
    row.confidence = 0.6;
    row.heuristic_score = 70;
    row.fused_confidence = 0.65;
    row.severity = "high";
    row.quarantined = quarantined;
    row.tokens = {"VirtualAlloc", "CreateRemoteThread"};
    row.indicators["injection"] = 2;
    return row;
}

} // namespace

class DetectionStoreTest : public ::testing::Test {
protected:
    DetectionStore store;

    void SetUp() override {
        ASSERT_TRUE(store.Initialize(":memory:"));
    }

    void TearDown() override {
        store.Shutdown();
    }
};

TEST_F(DetectionStoreTest, InsertAndQueryByPid) {
    ASSERT_TRUE(store.InsertDetection(MakeRow("uuid-1", 4242, 1714566600123ULL, true)));

    auto rows = store.QueryByPid(4242);
    ASSERT_EQ(rows.size(), 1u);
    const DetectionRow& row = rows[0];
    EXPECT_GT(row.id, 0);
    EXPECT_EQ(row.uuid, "uuid-1");
    EXPECT_EQ(row.detected_at_ms, 1714566600123ULL);
    EXPECT_EQ(row.image, "C:\\Temp\\sample.exe");
    EXPECT_EQ(row.label, "Trojan");
    EXPECT_DOUBLE_EQ(row.fused_confidence, 0.65);
    EXPECT_EQ(row.heuristic_score, 70);
    EXPECT_TRUE(row.quarantined);
    EXPECT_EQ(row.tokens, (std::vector<std::string>{"VirtualAlloc", "CreateRemoteThread"}));
    EXPECT_EQ(row.indicators.at("injection"), 2u);

    EXPECT_TRUE(store.QueryByPid(1).empty());
}

TEST_F(DetectionStoreTest, DuplicateUuidIsRejected) {
    ASSERT_TRUE(store.InsertDetection(MakeRow("uuid-dup", 1, 1000, false)));
    EXPECT_FALSE(store.InsertDetection(MakeRow("uuid-dup", 2, 2000, false)));
    EXPECT_EQ(store.GetStatusSnapshot().total_detections, 1u);
}

TEST_F(DetectionStoreTest, RecentIsNewestFirst) {
    for (int i = 0; i < 10; ++i) {
        store.InsertDetection(MakeRow("uuid-" + std::to_string(i), 100 + i, 1000 + i, i % 2 == 0));
    }

    auto recent = store.QueryRecent(3);
    ASSERT_EQ(recent.size(), 3u);
    EXPECT_EQ(recent[0].uuid, "uuid-9");
    EXPECT_EQ(recent[2].uuid, "uuid-7");

    EXPECT_EQ(store.QueryRecent(0).size(), 10u);
}

TEST_F(DetectionStoreTest, StatusSnapshot) {
    auto empty = store.GetStatusSnapshot();
    EXPECT_EQ(empty.total_detections, 0u);
    EXPECT_TRUE(empty.last_detected_at.empty());

    store.InsertDetection(MakeRow("a", 1, 1714566600123ULL, true));
    store.InsertDetection(MakeRow("b", 2, 1714566000000ULL, false));

    auto snapshot = store.GetStatusSnapshot();
    EXPECT_EQ(snapshot.total_detections, 2u);
    EXPECT_EQ(snapshot.quarantined, 1u);
    EXPECT_EQ(snapshot.last_detected_at, "2024-05-01T12:30:00.123Z");
}

TEST(DetectionStoreLifecycleTest, ClosedStoreRefusesWrites) {
    DetectionStore store;
    EXPECT_FALSE(store.IsOpen());
    EXPECT_FALSE(store.InsertDetection(MakeRow("x", 1, 1, false)));
    EXPECT_TRUE(store.QueryRecent().empty());
}

TEST(DetectionStoreLifecycleTest, PersistsAcrossReopen) {
    auto path = std::filesystem::temp_directory_path() / "ward_history_test" / "ward.db";
    std::filesystem::remove_all(path.parent_path());

    {
        DetectionStore store;
        ASSERT_TRUE(store.Initialize(path.string()));
        ASSERT_TRUE(store.InsertDetection(MakeRow("persisted", 5, 5000, true)));
    }
    {
        DetectionStore store;
        ASSERT_TRUE(store.Initialize(path.string()));
        auto rows = store.QueryByPid(5);
        ASSERT_EQ(rows.size(), 1u);
        EXPECT_EQ(rows[0].uuid, "persisted");
    }

    std::filesystem::remove_all(path.parent_path());
}
