// =============================================================================
// Dependency Mint Tests
// =============================================================================

#include <gtest/gtest.h>
#include "credrank/dependency_mint.hpp"
#include "test_util.hpp"

#include <limits>
#include <vector>

using namespace credrank;
using namespace credrank_test;

class DependencyMintTest : public ::testing::Test {
protected:
    void SetUp() override {
        scenario = scenario_d();
        // C mints 1 at t=0, inside [0, 2)
        policy = DependencyMintPolicy{node_addr("C"), {{0, 0.5}}};
    }

    Scenario scenario;
    DependencyMintPolicy policy;
};

TEST_F(DependencyMintTest, PolicyValidation) {
    EXPECT_NO_THROW(validate_policy(policy));
    EXPECT_NO_THROW(validate_policy(DependencyMintPolicy{node_addr("C"), {}}));

    DependencyMintPolicy negative{node_addr("C"), {{0, -0.1}}};
    EXPECT_THROW(validate_policy(negative), PolicyError);

    DependencyMintPolicy infinite{node_addr("C"), {{0, std::numeric_limits<double>::infinity()}}};
    EXPECT_THROW(validate_policy(infinite), PolicyError);

    DependencyMintPolicy unordered{node_addr("C"), {{10, 0.1}, {5, 0.2}}};
    EXPECT_THROW(validate_policy(unordered), PolicyError);
}

TEST_F(DependencyMintTest, PeriodsAlignToIntervalStarts) {
    // (-inf,0) [0,10) [10,20) [20,inf)
    IntervalSequence intervals = partition_intervals({0, 15}, 10);
    std::vector<DependencyMintPeriod> periods = {{-5, 1.0}, {10, 2.0}, {15, 3.0}};
    EXPECT_EQ(align_periods_to_intervals(periods, intervals), (std::vector<double>{0.0, 1.0, 2.0, 3.0}));
    EXPECT_EQ(align_periods_to_intervals({}, intervals), (std::vector<double>{0.0, 0.0, 0.0, 0.0}));
}

TEST_F(DependencyMintTest, MintedCredPerInterval) {
    MarkovProcessGraph mpg = scenario.build();
    EXPECT_EQ(minted_cred_per_interval(mpg), (std::vector<double>{0.0, 1.0, 0.0}));

    // Timeless nodes mint in no interval
    MarkovProcessGraph timeless = scenario_b().build();
    for (double minted : minted_cred_per_interval(timeless)) {
        EXPECT_EQ(minted, 0.0);
    }
}

TEST_F(DependencyMintTest, AwardIsWeightTimesMint) {
    MarkovProcessGraph mpg = scenario.build();
    std::vector<DependencyCred> awards = compute_dependency_cred(mpg, {policy});
    ASSERT_EQ(awards.size(), 1u);
    EXPECT_EQ(awards[0].node, *mpg.node_index(node_addr("C")));
    EXPECT_EQ(awards[0].per_interval, (std::vector<double>{0.0, 0.5, 0.0}));
    EXPECT_DOUBLE_EQ(awards[0].total(), 0.5);

    EXPECT_TRUE(compute_dependency_cred(mpg, {}).empty());
}

TEST_F(DependencyMintTest, UnknownRecipientRejected) {
    MarkovProcessGraph mpg = scenario.build();
    DependencyMintPolicy stranger{node_addr("nobody"), {{0, 0.5}}};
    EXPECT_THROW(compute_dependency_cred(mpg, {stranger}), UnknownRecipientError);
}

TEST_F(DependencyMintTest, ApplyAddsOnTopOfWalk) {
    CredGraph base = scenario.solve();
    CredGraph awarded = apply_dependency_mint(base, {policy});

    EXPECT_NEAR(awarded.total_cred(), base.total_cred() + 0.5, 1e-12);
    EXPECT_DOUBLE_EQ(awarded.node_cred(node_addr("C")).value_or(-1.0),
                     base.node_cred(node_addr("C")).value_or(-1.0) + 0.5);
    EXPECT_EQ(awarded.scores(), base.scores());
    EXPECT_EQ(awarded.dependency_cred().size(), 1u);
    EXPECT_TRUE(base.dependency_cred().empty());
    EXPECT_NE(awarded, base);
}

// =============================================================================
// Subgraph form
// =============================================================================

TEST_F(DependencyMintTest, DeclarationClaimsMintAddresses) {
    PluginDeclaration declaration = dependency_mint_declaration();
    EXPECT_EQ(declaration.node_prefix, dependency_mint_node_prefix());
    EXPECT_EQ(declaration.edge_prefix, dependency_mint_edge_prefix());
    ASSERT_EQ(declaration.node_types.size(), 1u);
    ASSERT_EQ(declaration.edge_types.size(), 1u);
    EXPECT_DOUBLE_EQ(declaration.edge_types[0].default_backward, 0.0);
}

TEST_F(DependencyMintTest, SubgraphHasOneMintPerAwardedInterval) {
    WeightEvaluator evaluator({test_declaration()}, scenario.weights);
    DependencyMintSubgraph sub = dependency_mint_subgraph(scenario.graph, evaluator, scenario.intervals, {policy});

    // Recipient plus one mint node for [0, 2)
    EXPECT_EQ(sub.graph.node_count(), 2u);
    ASSERT_EQ(sub.graph.edge_count(), 1u);
    Edge edge = sub.graph.edge_list()[0];
    EXPECT_EQ(edge.dst, node_addr("C"));
    EXPECT_TRUE(edge.src.has_prefix(dependency_mint_node_prefix()));
    EXPECT_TRUE(edge.address.has_prefix(dependency_mint_edge_prefix()));
    EXPECT_EQ(edge.timestamp_ms, 0);
    ASSERT_EQ(sub.weights.node_weights.size(), 1u);
    EXPECT_DOUBLE_EQ(sub.weights.node_weights.at(edge.src), 0.5);
}

TEST_F(DependencyMintTest, SubgraphMintFlowsThroughWalk) {
    WeightEvaluator evaluator({test_declaration()}, scenario.weights);
    DependencyMintSubgraph sub = dependency_mint_subgraph(scenario.graph, evaluator, scenario.intervals, {policy});

    Graph merged = Graph::merge({scenario.graph, sub.graph});
    std::vector<PluginDeclaration> declarations = {test_declaration(), sub.declaration};
    EXPECT_NO_THROW(check_claims(merged, declarations));

    WeightEvaluator combined(declarations, compose_weights({scenario.weights, sub.weights}));
    MarkovProcessGraph mpg = MarkovProcessGraph::build(merged, combined, scenario.intervals,
                                                       scenario.participants, scenario.parameters);
    CredGraph cg = CredGraph::compute(std::move(mpg));
    EXPECT_NEAR(cg.total_cred(), 1.5, 1e-9);
    EXPECT_GT(cg.node_cred(node_addr("C")).value_or(0.0), scenario.solve().node_cred(node_addr("C")).value_or(0.0));
}

TEST_F(DependencyMintTest, SubgraphUnknownRecipientRejected) {
    WeightEvaluator evaluator({test_declaration()}, scenario.weights);
    DependencyMintPolicy stranger{node_addr("nobody"), {{0, 0.5}}};
    EXPECT_THROW(dependency_mint_subgraph(scenario.graph, evaluator, scenario.intervals, {stranger}),
                 UnknownRecipientError);
}

TEST_F(DependencyMintTest, ZeroWeightPolicyEmitsNoMint) {
    WeightEvaluator evaluator({test_declaration()}, scenario.weights);
    DependencyMintPolicy idle{node_addr("C"), {{0, 0.0}}};
    DependencyMintSubgraph sub = dependency_mint_subgraph(scenario.graph, evaluator, scenario.intervals, {idle});
    EXPECT_EQ(sub.graph.edge_count(), 0u);
    EXPECT_TRUE(sub.weights.node_weights.empty());
}
