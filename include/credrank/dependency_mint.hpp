/**
 * Dependency mint
 *
 * A project can award extra Cred to the things it depends on. A policy
 * names a recipient node and a schedule of weights:
 *
 *   { recipient, periods: [ { start_ms, weight }, ... ] }
 *
 * For every interval the weight in force is that of the latest period
 * starting at or before the interval start (0 before the first period).
 * The recipient receives weight * C, where C is the Cred minted in the
 * interval: the mint of organic nodes whose timestamp falls inside it.
 *
 * apply_dependency_mint() adds the award on top of a solved cred graph.
 * dependency_mint_subgraph() instead emits mint nodes that can be merged
 * into the contribution graph before solving, so the award flows through
 * the walk like any other mint.
 */

#pragma once

#include "credrank/cred_graph.hpp"
#include "credrank/graph.hpp"
#include "credrank/interval.hpp"
#include "credrank/weights.hpp"

#include <vector>

namespace credrank {

struct DependencyMintPeriod {
    double start_ms;
    double weight;
};

struct DependencyMintPolicy {
    NodeAddress address;
    std::vector<DependencyMintPeriod> periods;
};

// PolicyError for out-of-order periods or negative / non-finite weights
void validate_policy(const DependencyMintPolicy& policy);

// Weight in force for each interval
std::vector<double> align_periods_to_intervals(const std::vector<DependencyMintPeriod>& periods,
                                               const IntervalSequence& intervals);

// Organic mint per interval; timeless nodes mint in no interval
std::vector<double> minted_cred_per_interval(const MarkovProcessGraph& mpg);

// UnknownRecipientError when a recipient is not an MPG node
std::vector<DependencyCred> compute_dependency_cred(const MarkovProcessGraph& mpg,
                                                    const std::vector<DependencyMintPolicy>& policies);

CredGraph apply_dependency_mint(const CredGraph& cred_graph, const std::vector<DependencyMintPolicy>& policies);

/**
 * Contribution-graph form of the dependency mint
 */
struct DependencyMintSubgraph {
    Graph graph;                            // mint nodes and their edges to recipients
    WeightTable weights;                    // mint weight of each mint node
    PluginDeclaration declaration;          // claims the mint node and edge addresses
};

const NodeAddress& dependency_mint_node_prefix();
const EdgeAddress& dependency_mint_edge_prefix();

// Declaration of the dependency-mint node and edge types
PluginDeclaration dependency_mint_declaration();

/**
 * Build mint nodes for every (policy, interval) with a positive award.
 *
 * The Cred minted per interval is computed from `graph` and `weights`;
 * every recipient must be a node of `graph` (UnknownRecipientError).
 */
DependencyMintSubgraph dependency_mint_subgraph(const Graph& graph,
                                                const WeightEvaluator& weights,
                                                const IntervalSequence& intervals,
                                                const std::vector<DependencyMintPolicy>& policies);

} // namespace credrank
