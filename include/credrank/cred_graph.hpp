/**
 * Cred graph
 *
 * Read-only view over a solved Markov process graph. The stationary
 * distribution pi is rescaled so that the non-seed nodes together hold the
 * total mint:
 *
 *   k = total_mint / sum(pi_i, i != seed),  cred_i = k * pi_i
 *
 * The seed's scaled score feeds the flow on mint edges but is not Cred.
 * Every edge carries cred_flow = cred[src] * transition_probability, and a
 * participant's Cred in an interval is the flow on its payout edge.
 *
 * Dependency-mint Cred is kept separately, per recipient and interval, and
 * is added on top of the walk's scores by node_cred() and total_cred().
 */

#pragma once

#include "credrank/markov_chain.hpp"
#include "credrank/markov_process_graph.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace credrank {

struct ScoredNode {
    NodeAddress address;
    std::string description;
    double mint;
    std::optional<TimestampMs> timestamp_ms;
    const char* kind;
    double cred;
};

struct ScoredEdge {
    EdgeAddress address;
    bool reversed;
    NodeAddress src;
    NodeAddress dst;
    double transition_probability;
    const char* kind;
    double cred_flow;
};

// Extra Cred awarded to one MPG node, per interval
struct DependencyCred {
    uint32_t node;
    std::vector<double> per_interval;

    double total() const;

    bool operator==(const DependencyCred& other) const {
        return node == other.node && per_interval == other.per_interval;
    }
};

// Scale a stationary distribution so the non-seed entries sum to total_mint
std::vector<double> scale_to_total_mint(const std::vector<double>& pi, double total_mint);

class CredGraph {
public:
    CredGraph() = default;

    CredGraph(std::shared_ptr<const MarkovProcessGraph> mpg,
              std::vector<double> scores,
              std::vector<DependencyCred> dependency_cred = {});

    // Solve the MPG and wrap the scaled scores
    static CredGraph compute(MarkovProcessGraph mpg, const StationaryConfig& config = StationaryConfig());

    const MarkovProcessGraph& mpg() const { return *mpg_; }
    const std::vector<double>& scores() const { return scores_; }
    const std::vector<DependencyCred>& dependency_cred() const { return dependency_cred_; }

    std::vector<ScoredNode> nodes() const;
    std::vector<ScoredEdge> edges() const;

    // MPG node Cred (plus dependency Cred); a participant address yields
    // that participant's total
    std::optional<double> node_cred(const NodeAddress& address) const;
    double node_cred(uint32_t index) const;

    // Sum over both directions of a contribution edge
    std::optional<double> edge_cred_flow(const EdgeAddress& address) const;
    std::optional<double> edge_cred_flow(const MarkovEdgeAddress& address) const;
    double edge_cred_flow(uint32_t edge) const;

    std::optional<std::vector<double>> participant_cred_per_interval(const ParticipantId& id) const;
    std::optional<double> participant_cred(const ParticipantId& id) const;

    // Cred over all non-seed nodes, dependency Cred included
    double total_cred() const;

    // Copy with dependency Cred replaced
    CredGraph with_dependency_cred(std::vector<DependencyCred> dependency_cred) const;

    // Versioned YAML snapshot; see snapshot.hpp
    std::string to_snapshot() const;
    static CredGraph from_snapshot(const std::string& text);

    bool operator==(const CredGraph& other) const;
    bool operator!=(const CredGraph& other) const { return !(*this == other); }

private:
    std::shared_ptr<const MarkovProcessGraph> mpg_ = std::make_shared<MarkovProcessGraph>();
    std::vector<double> scores_;
    std::vector<DependencyCred> dependency_cred_;
    std::vector<double> dependency_total_;     // per MPG node
};

} // namespace credrank
