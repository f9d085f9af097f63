/**
 * Stationary distribution of a Markov chain by damped power iteration
 *
 * The transition matrix M is row-stochastic; the distribution is a row
 * vector x with x M = x. TransitionMatrix stores M transposed in a
 * row-major Eigen sparse matrix, so y = x M is a row-by-row sparse
 * product with a fixed summation order per output entry. Eigen may spread
 * rows across OpenMP threads without changing any result bit.
 *
 * Iteration (d = damping):
 *   x0 = uniform, x1 = x0 M
 *   repeat: y = x M;  delta = |y - x|_inf;  stop with x if delta < epsilon
 *           x = (1 - d) y + d x
 *
 * The first step is undamped, so nodes that nothing flows into hold exactly
 * zero from then on. With d > 0 the iteration also converges on periodic
 * chains, where plain power iteration oscillates forever.
 */

#pragma once

#include "credrank/markov_process_graph.hpp"

#include <Eigen/Sparse>

#include <cstddef>
#include <vector>

namespace credrank {

/**
 * Configuration for the stationary solver
 */
struct StationaryConfig {
    double convergence_threshold = 1e-7;    // Stop when |xM - x|_inf falls below this
    int max_iterations = 255;               // NonconvergentError beyond this
    double damping = 0.25;                  // Weight of the previous iterate, in [0, 1)
    int num_threads = 0;                    // 0 = Eigen default
    bool verbose = false;                   // Log every iteration at DEBUG

    // Throws ParameterError for out-of-range settings
    void validate() const;
};

/**
 * Result of the stationary computation
 */
struct StationaryResult {
    std::vector<double> pi;         // Stationary distribution, sums to 1
    double convergence_delta;       // |pi M - pi|_inf at exit
    int iterations_used;            // Number of products computed
    bool converged;                 // Delta below threshold
};

class TransitionMatrix {
public:
    explicit TransitionMatrix(std::size_t n);

    static TransitionMatrix from_markov_process_graph(const MarkovProcessGraph& mpg);

    // Adds probability p to the transition src -> dst
    void add_transition(std::size_t src, std::size_t dst, double p);

    // Build the sparse storage; transitions added afterwards are rejected
    void finalize();

    // y = x M
    void action(const std::vector<double>& x, std::vector<double>& y) const;

    std::size_t size() const { return n_; }
    std::size_t nonzeros() const;
    bool is_finalized() const { return finalized_; }

    // Sum of each row of M
    std::vector<double> row_sums() const;

private:
    std::size_t n_;
    std::vector<Eigen::Triplet<double>> triplets_;
    Eigen::SparseMatrix<double, Eigen::RowMajor> transposed_;
    bool finalized_;
};

std::vector<double> uniform_distribution(std::size_t n);

// |a - b|_inf
double max_abs_difference(const std::vector<double>& a, const std::vector<double>& b);

/**
 * Compute the stationary distribution starting from `initial`.
 *
 * Throws NonconvergentError when the threshold is not met within
 * config.max_iterations products.
 */
StationaryResult find_stationary_distribution(const TransitionMatrix& matrix,
                                              const std::vector<double>& initial,
                                              const StationaryConfig& config = StationaryConfig());

// Same, from the uniform distribution
StationaryResult find_stationary_distribution(const TransitionMatrix& matrix,
                                              const StationaryConfig& config = StationaryConfig());

} // namespace credrank
