#include <gtest/gtest.h>
#include "engine/FusionEngine.hpp"

using namespace ward;

class FusionEngineTest : public ::testing::Test {
protected:
    DetectionConfig config;
    FusionEngine fusion{config};
};

TEST_F(FusionEngineTest, FusedConfidenceIsTheMean) {
    Verdict verdict = fusion.Decide(70, 0.6, std::string("Trojan"));

    EXPECT_DOUBLE_EQ(verdict.fused_confidence, 0.65);
    EXPECT_EQ(verdict.heuristic_score, 70);
    EXPECT_TRUE(verdict.is_malicious);
    ASSERT_TRUE(verdict.classifier_label.has_value());
    EXPECT_EQ(*verdict.classifier_label, "Trojan");
}

TEST_F(FusionEngineTest, ConfidentMlAloneIsBelowThreshold) {
    Verdict verdict = fusion.Decide(0, 0.9, std::string("Spyware"));

    EXPECT_DOUBLE_EQ(verdict.fused_confidence, 0.45);
    EXPECT_FALSE(verdict.is_malicious);

    DetectionConfig lowered;
    lowered.detection_threshold = 0.4;
    EXPECT_TRUE(FusionEngine(lowered).Decide(0, 0.9, std::string("Spyware")).is_malicious);
}

TEST_F(FusionEngineTest, HeuristicCeilingAloneIsMalicious) {
    Verdict verdict = fusion.Decide(71, 0.0, std::nullopt);
    EXPECT_TRUE(verdict.is_malicious);

    EXPECT_FALSE(fusion.Decide(70, 0.0, std::nullopt).is_malicious);
}

TEST_F(FusionEngineTest, SoftFloorsCombine) {
    // fused = (0.45 + 0.51) / 2 = 0.48, below threshold, but both soft floors pass
    EXPECT_TRUE(fusion.Decide(51, 0.45, std::string("Trojan")).is_malicious);
    EXPECT_FALSE(fusion.Decide(50, 0.45, std::string("Trojan")).is_malicious);
    EXPECT_FALSE(fusion.Decide(51, 0.40, std::string("Trojan")).is_malicious);
}

TEST_F(FusionEngineTest, BenignLabelVetoesBelowCeiling) {
    EXPECT_FALSE(fusion.Decide(0, 0.95, std::string("Benign")).is_malicious);
    EXPECT_FALSE(fusion.Decide(60, 0.99, std::string("benign")).is_malicious);
    EXPECT_TRUE(fusion.Decide(80, 0.99, std::string("Benign")).is_malicious);
}

TEST_F(FusionEngineTest, NoMlSignal) {
    Verdict verdict = fusion.Decide(40, 0.0, std::nullopt);
    EXPECT_FALSE(verdict.classifier_label.has_value());
    EXPECT_DOUBLE_EQ(verdict.fused_confidence, 0.2);
    EXPECT_FALSE(verdict.is_malicious);
}

TEST_F(FusionEngineTest, InputsAreClamped) {
    Verdict verdict = fusion.Decide(250, 1.7, std::string("Trojan"));
    EXPECT_EQ(verdict.heuristic_score, 100);
    EXPECT_DOUBLE_EQ(verdict.classifier_confidence, 1.0);
    EXPECT_DOUBLE_EQ(verdict.fused_confidence, 1.0);

    verdict = fusion.Decide(-20, -0.5, std::nullopt);
    EXPECT_EQ(verdict.heuristic_score, 0);
    EXPECT_DOUBLE_EQ(verdict.fused_confidence, 0.0);
}

TEST_F(FusionEngineTest, Severity) {
    EXPECT_EQ(fusion.Classify(fusion.Decide(100, 0.9, std::string("Trojan"))), Severity::CRITICAL);
    EXPECT_EQ(fusion.Classify(fusion.Decide(71, 0.0, std::nullopt)), Severity::CRITICAL);
    EXPECT_EQ(fusion.Classify(fusion.Decide(70, 0.6, std::string("Trojan"))), Severity::HIGH);
    EXPECT_EQ(SeverityToString(Severity::CRITICAL), "critical");
}
