// =============================================================================
// CredRank Pipeline Tests
// =============================================================================

#include <gtest/gtest.h>
#include "credrank/credrank.hpp"
#include "test_util.hpp"

#include <string>
#include <vector>

using namespace credrank;
using namespace credrank_test;

class CredRankTest : public ::testing::Test {
protected:
    void SetUp() override {
        scenario = scenario_d();
        declarations = {test_declaration()};
    }

    Result<CredGraph> rank(const MarkovParameters& parameters, const CredRankOptions& options = CredRankOptions()) {
        return cred_rank(scenario.graph, scenario.weights, declarations, scenario.participants, parameters,
                         scenario.intervals, options);
    }

    Scenario scenario;
    std::vector<PluginDeclaration> declarations;
};

TEST_F(CredRankTest, MatchesDirectComputation) {
    Result<CredGraph> result = rank(scenario.parameters);
    ASSERT_TRUE(result.ok()) << result.message();
    EXPECT_EQ(result.error_code(), ErrorCode::SUCCESS);
    EXPECT_EQ(result.value(), scenario.solve());
    EXPECT_NEAR(result.value().node_cred(node_addr("C")).value_or(-1.0), 1.0 / 1.96, 1e-5);
}

TEST_F(CredRankTest, IntervalWidthOverload) {
    Result<CredGraph> result = cred_rank(scenario.graph, scenario.weights, declarations, scenario.participants,
                                         scenario.parameters, TimestampMs(2));
    ASSERT_TRUE(result);
    EXPECT_EQ(result.value().mpg().intervals(), scenario.intervals);

    Result<CredGraph> bad_width = cred_rank(scenario.graph, scenario.weights, declarations, scenario.participants,
                                            scenario.parameters, TimestampMs(0));
    EXPECT_FALSE(bad_width);
    EXPECT_EQ(bad_width.error_code(), ErrorCode::PARAMETER_ERROR);
}

// Parameters summing to 1.01
TEST_F(CredRankTest, InvalidParametersReported) {
    Result<CredGraph> result = rank(MarkovParameters{0.2, 0.2, 0.31, 0.3});
    ASSERT_FALSE(result.ok());
    EXPECT_EQ(result.error_code(), ErrorCode::PARAMETER_ERROR);
    EXPECT_FALSE(result.message().empty());
    EXPECT_THROW((void)result.value(), InvalidArgumentError);
}

TEST_F(CredRankTest, UnclaimedAddressReported) {
    scenario.graph.add_node(Node{NodeAddress::from_parts({"elsewhere", "x"}), "x", std::nullopt});
    Result<CredGraph> result = rank(scenario.parameters);
    EXPECT_EQ(result.error_code(), ErrorCode::UNCLAIMED_ADDRESS);
}

TEST_F(CredRankTest, NonconvergenceReported) {
    CredRankOptions options;
    options.solver.max_iterations = 1;
    options.solver.convergence_threshold = 1e-15;
    Result<CredGraph> result = rank(scenario.parameters, options);
    EXPECT_EQ(result.error_code(), ErrorCode::NONCONVERGENT);
}

TEST_F(CredRankTest, DependenciesAddToTotal) {
    CredRankOptions options;
    options.dependencies.push_back(DependencyMintPolicy{node_addr("C"), {{0, 0.5}}});
    Result<CredGraph> result = rank(scenario.parameters, options);
    ASSERT_TRUE(result.ok()) << result.message();
    EXPECT_NEAR(result.value().total_cred(), 1.5, 1e-9);

    options.dependencies[0].address = node_addr("nobody");
    EXPECT_EQ(rank(scenario.parameters, options).error_code(), ErrorCode::UNKNOWN_RECIPIENT);
}

TEST_F(CredRankTest, AttributionsReachTheBuild) {
    Participant other = participant("Q", 2);
    scenario.graph.add_node(Node{user_addr("Q"), "Q", std::nullopt});
    scenario.participants.push_back(other);

    CredRankOptions options;
    options.attributions = {PersonalAttribution{participant_id(1), {AttributionRecipient{other.id, {{0, 0.5}}}}}};
    Result<CredGraph> result = rank(scenario.parameters, options);
    ASSERT_TRUE(result.ok()) << result.message();
    EXPECT_GT(result.value().participant_cred(other.id).value_or(0.0), 0.0);
}

TEST_F(CredRankTest, RunsFromConfiguration) {
    CredRankConfig config = load_config_from_string(R"(
interval_width_ms: 2
solver:
  convergence_threshold: 1.0e-9
dependencies:
  - address: [test, node, C]
    periods:
      - start_ms: 0
        weight: 0.5
)");
    Result<CredGraph> result = cred_rank(scenario.graph, declarations, scenario.participants, config);
    ASSERT_TRUE(result.ok()) << result.message();
    EXPECT_NEAR(result.value().total_cred(), 1.5, 1e-9);
    EXPECT_EQ(result.value().mpg().intervals(), scenario.intervals);

    config.parameters.alpha = 0.0;
    EXPECT_EQ(cred_rank(scenario.graph, declarations, scenario.participants, config).error_code(),
              ErrorCode::PARAMETER_ERROR);
}

TEST_F(CredRankTest, SnapshotResults) {
    CredGraph cred_graph = scenario.solve();
    Result<std::string> saved = save_snapshot(cred_graph);
    ASSERT_TRUE(saved.ok());

    Result<CredGraph> loaded = load_snapshot(saved.value());
    ASSERT_TRUE(loaded.ok()) << loaded.message();
    EXPECT_EQ(loaded.value(), cred_graph);

    EXPECT_EQ(load_snapshot("type: something/else\nversion: 0.1.0\npayload: {}\n").error_code(),
              ErrorCode::SNAPSHOT_VERSION);
    EXPECT_EQ(load_snapshot("{[ not yaml").error_code(), ErrorCode::MALFORMED_SNAPSHOT);
}

TEST_F(CredRankTest, MovedValueFromResult) {
    CredGraph cred_graph = rank(scenario.parameters).value();
    EXPECT_GT(cred_graph.total_cred(), 0.0);
    EXPECT_THROW((void)rank(MarkovParameters{0.0, 0.2, 0.1, 0.1}).value(), InvalidArgumentError);
}
