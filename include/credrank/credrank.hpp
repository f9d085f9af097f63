/**
 * CredRank public interface
 *
 * cred_rank() runs the whole pipeline on a contribution graph:
 *
 *   1. every address must be claimed by exactly one plugin declaration
 *   2. weights resolve against the declarations' type defaults
 *   3. the Markov process graph is built over the intervals
 *   4. its stationary distribution is found and scaled to the total mint
 *   5. dependency-mint policies add their awards on top
 *
 * Failures come back as Result values carrying the ErrorCode of the
 * exception raised inside the core.
 */

#pragma once

#include "credrank/config.hpp"
#include "credrank/cred_graph.hpp"
#include "credrank/dependency_mint.hpp"
#include "credrank/graph.hpp"
#include "credrank/interval.hpp"
#include "credrank/markov_chain.hpp"
#include "credrank/markov_process_graph.hpp"
#include "credrank/participant.hpp"
#include "credrank/result.hpp"
#include "credrank/snapshot.hpp"
#include "credrank/weights.hpp"

#include <string>
#include <vector>

namespace credrank {

struct CredRankOptions {
    StationaryConfig solver;
    PersonalAttributions attributions;
    std::vector<DependencyMintPolicy> dependencies;
};

Result<CredGraph> cred_rank(const Graph& graph,
                            const WeightTable& weights,
                            const std::vector<PluginDeclaration>& declarations,
                            const std::vector<Participant>& participants,
                            const MarkovParameters& parameters,
                            const IntervalSequence& intervals,
                            const CredRankOptions& options = CredRankOptions());

// Intervals partitioned from the graph's edge timestamps
Result<CredGraph> cred_rank(const Graph& graph,
                            const WeightTable& weights,
                            const std::vector<PluginDeclaration>& declarations,
                            const std::vector<Participant>& participants,
                            const MarkovParameters& parameters,
                            TimestampMs interval_width_ms,
                            const CredRankOptions& options = CredRankOptions());

// Parameters, interval width, solver, weights and dependencies from a loaded configuration
Result<CredGraph> cred_rank(const Graph& graph,
                            const std::vector<PluginDeclaration>& declarations,
                            const std::vector<Participant>& participants,
                            const CredRankConfig& config,
                            const PersonalAttributions& attributions = {});

Result<CredGraph> load_snapshot(const std::string& text);
Result<std::string> save_snapshot(const CredGraph& cred_graph);

} // namespace credrank
