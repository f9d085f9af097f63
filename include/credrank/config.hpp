/**
 * Run configuration
 *
 * A YAML document; every section is optional and missing keys keep their
 * defaults:
 *
 *   parameters:   { alpha, beta, gamma_forward, gamma_backward }
 *   interval_width_ms: 604800000
 *   solver:       { convergence_threshold, max_iterations, damping, num_threads, verbose }
 *   weights:
 *     nodes:      [ { address: [parts], weight } ]
 *     edges:      [ { address: [parts], forwards, backwards } ]
 *   dependencies: [ { address: [parts], periods: [ { start_ms, weight } ] } ]
 *   logging:      { level, file }
 *
 * Environment variables override the file:
 *   CREDRANK_LOG_LEVEL              logging.level
 *   CREDRANK_MAX_ITERATIONS         solver.max_iterations
 *   CREDRANK_CONVERGENCE_THRESHOLD  solver.convergence_threshold
 *   CREDRANK_NUM_THREADS            solver.num_threads
 */

#pragma once

#include "credrank/dependency_mint.hpp"
#include "credrank/markov_chain.hpp"
#include "credrank/markov_process_graph.hpp"
#include "credrank/weights.hpp"

#include <string>
#include <vector>

namespace credrank {

struct LoggingConfig {
    std::string level = "info";     // debug, info, warn, error, off
    std::string file;               // Extra file sink; empty = console only
};

struct CredRankConfig {
    MarkovParameters parameters;
    TimestampMs interval_width_ms = 604800000;     // One week
    StationaryConfig solver;
    WeightTable weights;
    std::vector<DependencyMintPolicy> dependencies;
    LoggingConfig logging;

    // ParameterError / PolicyError / ConfigError for the first invalid setting
    void validate() const;
};

// Parse and validate; YAML errors become ConfigError
CredRankConfig load_config(const std::string& path);
CredRankConfig load_config_from_string(const std::string& text);

// Apply CREDRANK_* environment variables; unparsable values are logged and ignored
void apply_env_overrides(CredRankConfig& config);

// Point the process logger at the configured level and file
void apply_logging_config(const LoggingConfig& logging);

} // namespace credrank
