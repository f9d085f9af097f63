#include "credrank/markov_chain.hpp"
#include "credrank/logging.hpp"

#include <Eigen/Core>

#include <algorithm>
#include <cmath>

namespace credrank {

void StationaryConfig::validate() const {
    if (!(convergence_threshold > 0.0) || !std::isfinite(convergence_threshold)) {
        throw ParameterError("convergence threshold must be positive and finite", __func__);
    }
    if (max_iterations <= 0) {
        throw ParameterError("max_iterations must be positive", __func__);
    }
    if (!(damping >= 0.0 && damping < 1.0)) {
        throw ParameterError("damping must lie in [0, 1), got " + std::to_string(damping), __func__);
    }
    if (num_threads < 0) {
        throw ParameterError("num_threads must be non-negative", __func__);
    }
}

// =============================================================================
// TransitionMatrix
// =============================================================================

TransitionMatrix::TransitionMatrix(std::size_t n)
    : n_(n), transposed_(static_cast<Eigen::Index>(n), static_cast<Eigen::Index>(n)), finalized_(false) {}

TransitionMatrix TransitionMatrix::from_markov_process_graph(const MarkovProcessGraph& mpg) {
    TransitionMatrix matrix(mpg.node_count());
    matrix.triplets_.reserve(mpg.edge_count());
    for (const auto& edge : mpg.edges()) {
        matrix.add_transition(edge.src, edge.dst, edge.transition_probability);
    }
    matrix.finalize();
    return matrix;
}

void TransitionMatrix::add_transition(std::size_t src, std::size_t dst, double p) {
    CREDRANK_CHECK_ARGUMENT(!finalized_, "transition matrix is already finalized");
    CREDRANK_CHECK_ARGUMENT(src < n_ && dst < n_, "transition index out of range");
    // Stored transposed: column of x_src feeds row dst
    triplets_.emplace_back(static_cast<Eigen::Index>(dst), static_cast<Eigen::Index>(src), p);
}

void TransitionMatrix::finalize() {
    if (finalized_) return;
    // Duplicates are summed in insertion order
    transposed_.setFromTriplets(triplets_.begin(), triplets_.end());
    transposed_.makeCompressed();
    triplets_.clear();
    triplets_.shrink_to_fit();
    finalized_ = true;
}

void TransitionMatrix::action(const std::vector<double>& x, std::vector<double>& y) const {
    CREDRANK_CHECK_ARGUMENT(finalized_, "transition matrix is not finalized");
    CREDRANK_CHECK_ARGUMENT(x.size() == n_, "distribution size does not match the matrix");
    y.resize(n_);

    Eigen::Map<const Eigen::VectorXd> vx(x.data(), static_cast<Eigen::Index>(n_));
    Eigen::Map<Eigen::VectorXd> vy(y.data(), static_cast<Eigen::Index>(n_));
    vy.noalias() = transposed_ * vx;
}

std::size_t TransitionMatrix::nonzeros() const {
    return finalized_ ? static_cast<std::size_t>(transposed_.nonZeros()) : triplets_.size();
}

std::vector<double> TransitionMatrix::row_sums() const {
    CREDRANK_CHECK_ARGUMENT(finalized_, "transition matrix is not finalized");
    std::vector<double> sums(n_, 0.0);
    for (Eigen::Index row = 0; row < transposed_.outerSize(); ++row) {
        for (Eigen::SparseMatrix<double, Eigen::RowMajor>::InnerIterator it(transposed_, row); it; ++it) {
            sums[static_cast<std::size_t>(it.col())] += it.value();
        }
    }
    return sums;
}

// =============================================================================
// Power iteration
// =============================================================================

std::vector<double> uniform_distribution(std::size_t n) {
    if (n == 0) return {};
    return std::vector<double>(n, 1.0 / static_cast<double>(n));
}

double max_abs_difference(const std::vector<double>& a, const std::vector<double>& b) {
    CREDRANK_CHECK_ARGUMENT(a.size() == b.size(), "vectors differ in size");
    double delta = 0.0;
    for (std::size_t i = 0; i < a.size(); ++i) {
        delta = std::max(delta, std::fabs(a[i] - b[i]));
    }
    return delta;
}

StationaryResult find_stationary_distribution(const TransitionMatrix& matrix,
                                              const std::vector<double>& initial,
                                              const StationaryConfig& config) {
    config.validate();
    CREDRANK_CHECK_ARGUMENT(initial.size() == matrix.size(), "initial distribution size does not match the matrix");

    StationaryResult result;
    result.convergence_delta = 0.0;
    result.iterations_used = 0;
    result.converged = true;
    if (matrix.size() == 0) {
        return result;
    }

    if (config.num_threads > 0) {
        Eigen::setNbThreads(config.num_threads);
    }

    const double keep = config.damping;
    const double take = 1.0 - config.damping;
    const std::size_t n = matrix.size();

    std::vector<double> x(n);
    std::vector<double> y(n);
    matrix.action(initial, x);
    int iterations = 1;
    double delta = 0.0;

    while (true) {
        matrix.action(x, y);
        ++iterations;
        delta = max_abs_difference(x, y);

        if (config.verbose) {
            LOG_DEBUG("iteration ", iterations, " delta ", delta);
        }
        if (delta < config.convergence_threshold) {
            break;
        }
        if (iterations >= config.max_iterations) {
            LOG_ERROR("stationary distribution did not converge: delta ", delta, " after ", iterations,
                      " iterations");
            throw NonconvergentError(delta, iterations, __func__);
        }

        for (std::size_t i = 0; i < n; ++i) {
            x[i] = take * y[i] + keep * x[i];
        }
    }

    LOG_INFO("stationary distribution converged after ", iterations, " iterations (delta ", delta, ")");

    result.pi = std::move(x);
    result.convergence_delta = delta;
    result.iterations_used = iterations;
    result.converged = true;
    return result;
}

StationaryResult find_stationary_distribution(const TransitionMatrix& matrix, const StationaryConfig& config) {
    return find_stationary_distribution(matrix, uniform_distribution(matrix.size()), config);
}

} // namespace credrank
