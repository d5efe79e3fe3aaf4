#include <gtest/gtest.h>
#include "detection/threshold_detector.hpp"
#include "detection/graph_fraud_detector.hpp"
#include "common/errors.hpp"

#include <algorithm>
#include <memory>

using namespace fraudscope;

namespace {

TransactionDataset cards(const std::vector<std::string>& lines) {
    return TransactionDataset::build(lines, DatasetType::CreditCard);
}

TransactionDataset spikeDataset() {
    return cards({
        "1,100,M1,C1", "2,120,M2,C1", "3,110,M1,C2", "4,130,M3,C2",
        "5,90,M1,C3",  "6,105,M2,C3", "7,115,M3,C1", "8,125,M1,C2",
        "9,95,M2,C3",  "10,100,M3,C1", "11,5000,M9,C4",
    });
}

/// A -> X -> Y chain: a merchant that also appears as a card id.
TransactionDataset chainDataset() {
    return cards({"1,3000,X,A", "2,4000,Y,X"});
}

RelationshipGraph meshGraph() {
    RelationshipGraph g;
    const int n = 12;
    for (int i = 0; i < n; i++) {
        for (int j = 0; j < n; j++) {
            if (i == j || (i * 7 + j * 3) % 5 == 0) continue;
            g.addEdge("N" + std::to_string(i), "N" + std::to_string(j),
                      100.0 * ((i * j) % 9 + 1), 0.0);
        }
    }
    return g;
}

} // namespace

// ─── ThresholdDetector ─────────────────────────────────────────

TEST(ThresholdDetectorTest, FlagsTheSpike) {
    ThresholdDetector det;
    auto result = std::get<ThresholdResult>(det.detect(std::nullopt, spikeDataset()));
    ASSERT_EQ(result.indices, (std::vector<size_t>{10}));
    ASSERT_EQ(result.scores.size(), 1);
    EXPECT_NEAR(result.scores[0], result.z_scores[10] / 2.0, 1e-12);
    EXPECT_NEAR(result.z_scores[10], 3.162, 1e-3);
    EXPECT_EQ(result.z_scores.size(), 11);
}

TEST(ThresholdDetectorTest, ZScoresAreAbsolute) {
    ThresholdDetector det(1.0);
    ThresholdResult r = det.score({100, 250, 5000});
    for (double z : r.z_scores) {
        EXPECT_GE(z, 0.0);
    }
    EXPECT_NEAR(r.z_scores[0], 0.7398, 1e-4);
    EXPECT_EQ(r.indices, (std::vector<size_t>{2}));
}

TEST(ThresholdDetectorTest, DefaultThresholdMissesSmallSeries) {
    // Three points can never exceed |z| = sqrt(2)
    ThresholdDetector det;
    EXPECT_TRUE(det.score({100, 250, 5000}).indices.empty());
}

TEST(ThresholdDetectorTest, HigherThresholdFlagsSubset) {
    std::vector<double> amounts = spikeDataset().getAmounts();
    amounts.push_back(900);
    ThresholdResult loose = ThresholdDetector(0.2).score(amounts);
    ThresholdResult strict = ThresholdDetector(2.0).score(amounts);
    EXPECT_GT(loose.indices.size(), strict.indices.size());
    for (size_t idx : strict.indices) {
        EXPECT_NE(std::find(loose.indices.begin(), loose.indices.end(), idx),
                  loose.indices.end());
    }
}

TEST(ThresholdDetectorTest, ConstantSeriesFlagsNothing) {
    ThresholdDetector det(0.5);
    ThresholdResult r = det.score({10, 10, 10, 10});
    EXPECT_TRUE(r.indices.empty());
    EXPECT_EQ(r.z_scores, (std::vector<double>{0, 0, 0, 0}));
}

TEST(ThresholdDetectorTest, EmptyDataset) {
    ThresholdDetector det;
    auto r = std::get<ThresholdResult>(det.detect(std::nullopt, cards({})));
    EXPECT_TRUE(r.indices.empty());
    EXPECT_TRUE(r.z_scores.empty());
}

TEST(ThresholdDetectorTest, NameAndRequirement) {
    ThresholdDetector det(2.5);
    EXPECT_EQ(det.name(), "Threshold Detector (threshold=2.5)");
    EXPECT_EQ(det.requirement(), InputRequirement::SignalAndDataset);
    EXPECT_TRUE(det.needsSignal());
}

TEST(ThresholdDetectorTest, ThresholdMustBePositive) {
    EXPECT_THROW(ThresholdDetector(0.0), ConfigurationError);
    EXPECT_THROW(ThresholdDetector(-1.0), ConfigurationError);
}

// ─── GraphFraudDetector ────────────────────────────────────────

TEST(GraphFraudDetectorTest, FindsMultiHopPath) {
    GraphFraudDetector det(5000.0);
    auto r = std::get<GraphResult>(det.detect(std::nullopt, chainDataset()));
    ASSERT_EQ(r.suspicious_paths.size(), 1);
    EXPECT_EQ(r.suspicious_paths[0].path, (std::vector<std::string>{"A", "X", "Y"}));
    EXPECT_DOUBLE_EQ(r.suspicious_paths[0].total_amount, 7000.0);
}

TEST(GraphFraudDetectorTest, PathsInNodePairOrder) {
    GraphFraudDetector det(100.0);
    auto r = std::get<GraphResult>(det.detect(std::nullopt, chainDataset()));
    ASSERT_EQ(r.suspicious_paths.size(), 3);
    EXPECT_EQ(r.suspicious_paths[0].path, (std::vector<std::string>{"A", "X"}));
    EXPECT_EQ(r.suspicious_paths[1].path, (std::vector<std::string>{"A", "X", "Y"}));
    EXPECT_EQ(r.suspicious_paths[2].path, (std::vector<std::string>{"X", "Y"}));
}

TEST(GraphFraudDetectorTest, TotalsMatchEdgeSums) {
    auto ds = cards({"1,3000,M1,C1", "2,2500,M1,C1", "3,100,M1,C2", "4,700,C1,C5"});
    RelationshipGraph g = ds.buildTransactionGraph();
    GraphFraudDetector det(100.0);
    GraphResult r = det.search(g);
    ASSERT_FALSE(r.suspicious_paths.empty());
    for (const auto& p : r.suspicious_paths) {
        EXPECT_GE(p.path.size(), 2);
        EXPECT_GT(p.total_amount, 100.0);
        EXPECT_EQ(p.total_amount, *g.pathWeight(p.path));
    }
}

TEST(GraphFraudDetectorTest, MergedEdgesCrossThreshold) {
    // Neither charge alone exceeds the minimum; together they do
    GraphFraudDetector det(5000.0);
    auto r = std::get<GraphResult>(det.detect(std::nullopt,
                                              cards({"1,3000,M1,C1", "2,2500,M1,C1"})));
    ASSERT_EQ(r.suspicious_paths.size(), 1);
    EXPECT_DOUBLE_EQ(r.suspicious_paths[0].total_amount, 5500.0);
}

TEST(GraphFraudDetectorTest, ThresholdIsStrict) {
    GraphFraudDetector det(3000.0);
    auto r = std::get<GraphResult>(det.detect(std::nullopt, cards({"1,3000,M1,C1"})));
    EXPECT_TRUE(r.suspicious_paths.empty());
}

TEST(GraphFraudDetectorTest, EmptyAndEdgelessGraphs) {
    GraphFraudDetector det(0.0);
    EXPECT_TRUE(det.search(RelationshipGraph{}).suspicious_paths.empty());

    RelationshipGraph isolated;
    isolated.addNode("A");
    isolated.addNode("B");
    EXPECT_TRUE(det.search(isolated).suspicious_paths.empty());
}

TEST(GraphFraudDetectorTest, WorkerCountDoesNotChangeResult) {
    RelationshipGraph g = meshGraph();
    GraphResult serial = GraphFraudDetector(250.0, 1).search(g);
    GraphResult parallel = GraphFraudDetector(250.0, 4).search(g);

    ASSERT_FALSE(serial.suspicious_paths.empty());
    ASSERT_EQ(serial.suspicious_paths.size(), parallel.suspicious_paths.size());
    for (size_t i = 0; i < serial.suspicious_paths.size(); i++) {
        EXPECT_EQ(serial.suspicious_paths[i].path, parallel.suspicious_paths[i].path);
        EXPECT_EQ(serial.suspicious_paths[i].total_amount,
                  parallel.suspicious_paths[i].total_amount);
    }
}

TEST(GraphFraudDetectorTest, NegativeAmountsRejected) {
    GraphFraudDetector det;
    EXPECT_THROW(det.detect(std::nullopt, cards({"1,-50,M1,C1"})), ConfigurationError);
}

TEST(GraphFraudDetectorTest, CancelledTokenStopsSearch) {
    auto token = std::make_shared<CancellationToken>();
    token->cancel();
    GraphFraudDetector det(100.0, 2);
    det.setCancellationToken(token);
    EXPECT_THROW(det.search(meshGraph()), AnalysisCancelled);
}

TEST(GraphFraudDetectorTest, NameAndRequirement) {
    GraphFraudDetector det;
    EXPECT_EQ(det.name(), "Graph Dijkstra Detector (min_path_amount=5000)");
    EXPECT_EQ(det.requirement(), InputRequirement::DatasetOnly);
    EXPECT_FALSE(det.needsSignal());
    EXPECT_EQ(det.workerThreads(), 1u);
}

TEST(GraphFraudDetectorTest, ZeroWorkersRejected) {
    EXPECT_THROW(GraphFraudDetector(100.0, 0), ConfigurationError);
}

// ─── SearchBudget ──────────────────────────────────────────────

TEST(SearchBudgetTest, UnlimitedBudgetContinues) {
    SearchBudget budget(0.0, nullptr);
    budget.start();
    budget.recordExpansion();
    EXPECT_TRUE(budget.canContinue());
    EXPECT_FALSE(budget.isTimeExhausted());
    EXPECT_EQ(budget.expansions(), 1);
}

TEST(SearchBudgetTest, CancellationStops) {
    auto token = std::make_shared<CancellationToken>();
    SearchBudget budget(0.0, token);
    budget.start();
    EXPECT_TRUE(budget.canContinue());
    token->cancel();
    EXPECT_TRUE(budget.isCancelled());
    EXPECT_FALSE(budget.canContinue());
}
