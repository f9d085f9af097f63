// =============================================================================
// Stationary Distribution Tests
// =============================================================================

#include <gtest/gtest.h>
#include "credrank/markov_chain.hpp"
#include "test_util.hpp"

#include <numeric>
#include <vector>

using namespace credrank;

class MarkovChainTest : public ::testing::Test {
protected:
    void SetUp() override {
        config.convergence_threshold = 1e-10;
        config.max_iterations = 1000;
    }

    // 0 -> 1; 1 -> 0 or 1 with equal probability
    TransitionMatrix two_state() {
        TransitionMatrix matrix(2);
        matrix.add_transition(0, 1, 1.0);
        matrix.add_transition(1, 0, 0.5);
        matrix.add_transition(1, 1, 0.5);
        matrix.finalize();
        return matrix;
    }

    // 0 <-> 1, period 2
    TransitionMatrix flip_flop() {
        TransitionMatrix matrix(2);
        matrix.add_transition(0, 1, 1.0);
        matrix.add_transition(1, 0, 1.0);
        matrix.finalize();
        return matrix;
    }

    StationaryConfig config;
};

TEST_F(MarkovChainTest, ActionIsRowVectorProduct) {
    TransitionMatrix matrix = two_state();
    std::vector<double> y;
    matrix.action({1.0, 0.0}, y);
    EXPECT_EQ(y, (std::vector<double>{0.0, 1.0}));
    matrix.action({0.0, 1.0}, y);
    EXPECT_EQ(y, (std::vector<double>{0.5, 0.5}));
}

TEST_F(MarkovChainTest, FinalizedMatrixIsImmutable) {
    TransitionMatrix matrix = two_state();
    EXPECT_TRUE(matrix.is_finalized());
    EXPECT_EQ(matrix.nonzeros(), 3u);
    EXPECT_THROW(matrix.add_transition(0, 0, 0.1), InvalidArgumentError);

    TransitionMatrix open(2);
    EXPECT_THROW(open.add_transition(0, 2, 1.0), InvalidArgumentError);
    std::vector<double> y;
    EXPECT_THROW(open.action({0.5, 0.5}, y), InvalidArgumentError);
}

TEST_F(MarkovChainTest, DuplicateTransitionsAreSummed) {
    TransitionMatrix matrix(2);
    matrix.add_transition(0, 1, 0.25);
    matrix.add_transition(0, 1, 0.75);
    matrix.add_transition(1, 1, 1.0);
    matrix.finalize();
    EXPECT_EQ(matrix.row_sums(), (std::vector<double>{1.0, 1.0}));
}

TEST_F(MarkovChainTest, ConvergesToStationary) {
    TransitionMatrix matrix = two_state();
    StationaryResult result = find_stationary_distribution(matrix, config);
    ASSERT_TRUE(result.converged);
    ASSERT_EQ(result.pi.size(), 2u);
    EXPECT_NEAR(result.pi[0], 1.0 / 3.0, 1e-8);
    EXPECT_NEAR(result.pi[1], 2.0 / 3.0, 1e-8);
    EXPECT_LT(result.convergence_delta, config.convergence_threshold);
    EXPECT_GT(result.iterations_used, 1);
}

TEST_F(MarkovChainTest, ReturnedVectorMeetsThreshold) {
    TransitionMatrix matrix = two_state();
    StationaryResult result = find_stationary_distribution(matrix, {0.9, 0.1}, config);
    std::vector<double> next;
    matrix.action(result.pi, next);
    EXPECT_LT(max_abs_difference(result.pi, next), config.convergence_threshold);
    EXPECT_NEAR(std::accumulate(result.pi.begin(), result.pi.end(), 0.0), 1.0, 1e-12);
}

TEST_F(MarkovChainTest, DampingHandlesPeriodicChains) {
    TransitionMatrix matrix = flip_flop();
    StationaryResult result = find_stationary_distribution(matrix, {1.0, 0.0}, config);
    EXPECT_NEAR(result.pi[0], 0.5, 1e-9);
    EXPECT_NEAR(result.pi[1], 0.5, 1e-9);
}

TEST_F(MarkovChainTest, UndampedPeriodicChainDoesNotConverge) {
    TransitionMatrix matrix = flip_flop();
    config.damping = 0.0;
    config.max_iterations = 50;
    try {
        find_stationary_distribution(matrix, {1.0, 0.0}, config);
        FAIL() << "expected NonconvergentError";
    } catch (const NonconvergentError& e) {
        EXPECT_EQ(e.code(), ErrorCode::NONCONVERGENT);
        EXPECT_EQ(e.iterations(), 50);
        EXPECT_DOUBLE_EQ(e.delta(), 1.0);
    }
}

TEST_F(MarkovChainTest, NodesWithoutInflowAreExactlyZero) {
    // 0 and 2 feed 1; nothing feeds 0 or 2
    TransitionMatrix matrix(3);
    matrix.add_transition(0, 1, 1.0);
    matrix.add_transition(1, 1, 1.0);
    matrix.add_transition(2, 1, 1.0);
    matrix.finalize();

    StationaryResult result = find_stationary_distribution(matrix, config);
    EXPECT_EQ(result.pi[0], 0.0);
    EXPECT_EQ(result.pi[2], 0.0);
    EXPECT_DOUBLE_EQ(result.pi[1], 1.0);
}

TEST_F(MarkovChainTest, EmptyMatrix) {
    TransitionMatrix matrix(0);
    matrix.finalize();
    StationaryResult result = find_stationary_distribution(matrix, config);
    EXPECT_TRUE(result.pi.empty());
    EXPECT_TRUE(result.converged);
}

TEST_F(MarkovChainTest, ConfigValidation) {
    StationaryConfig bad = config;
    bad.damping = 1.0;
    EXPECT_THROW(bad.validate(), ParameterError);

    bad = config;
    bad.max_iterations = 0;
    EXPECT_THROW(bad.validate(), ParameterError);

    bad = config;
    bad.convergence_threshold = 0.0;
    EXPECT_THROW(bad.validate(), ParameterError);

    bad = config;
    bad.num_threads = -1;
    EXPECT_THROW(find_stationary_distribution(two_state(), bad), ParameterError);
}

TEST_F(MarkovChainTest, MatrixFromMarkovProcessGraph) {
    MarkovProcessGraph mpg = credrank_test::scenario_d().build();
    TransitionMatrix matrix = TransitionMatrix::from_markov_process_graph(mpg);
    EXPECT_EQ(matrix.size(), mpg.node_count());
    for (double sum : matrix.row_sums()) {
        EXPECT_NEAR(sum, 1.0, 1e-9);
    }
}
