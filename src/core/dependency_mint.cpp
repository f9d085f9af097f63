#include "credrank/dependency_mint.hpp"
#include "credrank/logging.hpp"

#include <cmath>

namespace credrank {

void validate_policy(const DependencyMintPolicy& policy) {
    for (std::size_t i = 0; i < policy.periods.size(); ++i) {
        const auto& period = policy.periods[i];
        if (!std::isfinite(period.weight) || period.weight < 0.0) {
            throw PolicyError("dependency " + policy.address.display() + " has invalid weight " +
                                  std::to_string(period.weight),
                              __func__, "weights must be finite and non-negative");
        }
        if (std::isnan(period.start_ms)) {
            throw PolicyError("dependency " + policy.address.display() + " has a NaN period start", __func__);
        }
        if (i > 0 && period.start_ms < policy.periods[i - 1].start_ms) {
            throw PolicyError("dependency " + policy.address.display() + " has periods out of order", __func__,
                              "sort periods by start_ms");
        }
    }
}

std::vector<double> align_periods_to_intervals(const std::vector<DependencyMintPeriod>& periods,
                                               const IntervalSequence& intervals) {
    std::vector<double> weights(intervals.size(), 0.0);
    std::size_t next = 0;
    double current = 0.0;
    for (std::size_t k = 0; k < intervals.size(); ++k) {
        while (next < periods.size() && periods[next].start_ms <= intervals[k].start_ms) {
            current = periods[next].weight;
            ++next;
        }
        weights[k] = current;
    }
    return weights;
}

std::vector<double> minted_cred_per_interval(const MarkovProcessGraph& mpg) {
    std::vector<double> minted(mpg.intervals().size(), 0.0);
    for (const auto& node : mpg.nodes()) {
        if (!std::holds_alternative<gadget::Organic>(node.gadget) || !node.timestamp_ms) continue;
        if (auto k = mpg.intervals().index_of(static_cast<double>(*node.timestamp_ms))) {
            minted[*k] += node.mint;
        }
    }
    return minted;
}

std::vector<DependencyCred> compute_dependency_cred(const MarkovProcessGraph& mpg,
                                                    const std::vector<DependencyMintPolicy>& policies) {
    std::vector<DependencyCred> result;
    if (policies.empty()) return result;

    const std::vector<double> minted = minted_cred_per_interval(mpg);
    for (const auto& policy : policies) {
        validate_policy(policy);
        auto node = mpg.node_index(policy.address);
        if (!node) {
            throw UnknownRecipientError("dependency recipient " + policy.address.display() +
                                            " is not a node of the Markov process graph",
                                        __func__);
        }

        std::vector<double> weights = align_periods_to_intervals(policy.periods, mpg.intervals());
        DependencyCred cred{*node, std::vector<double>(minted.size(), 0.0)};
        for (std::size_t k = 0; k < minted.size(); ++k) {
            cred.per_interval[k] = weights[k] * minted[k];
        }
        LOG_DEBUG("dependency ", policy.address.display(), " receives ", cred.total(), " Cred");
        result.push_back(std::move(cred));
    }
    return result;
}

CredGraph apply_dependency_mint(const CredGraph& cred_graph, const std::vector<DependencyMintPolicy>& policies) {
    std::vector<DependencyCred> dependency_cred = compute_dependency_cred(cred_graph.mpg(), policies);

    double total = 0.0;
    for (const auto& cred : dependency_cred) total += cred.total();
    LOG_INFO("dependency mint awarded ", total, " Cred to ", dependency_cred.size(), " recipients");

    return cred_graph.with_dependency_cred(std::move(dependency_cred));
}

// =============================================================================
// Subgraph form
// =============================================================================

const NodeAddress& dependency_mint_node_prefix() {
    static const NodeAddress prefix = NodeAddress::from_parts({"credrank", "core", "dependency-mint"});
    return prefix;
}

const EdgeAddress& dependency_mint_edge_prefix() {
    static const EdgeAddress prefix = EdgeAddress::from_parts({"credrank", "core", "dependency-mint"});
    return prefix;
}

PluginDeclaration dependency_mint_declaration() {
    PluginDeclaration declaration;
    declaration.name = "dependency mint";
    declaration.node_prefix = dependency_mint_node_prefix();
    declaration.edge_prefix = dependency_mint_edge_prefix();
    declaration.node_types.push_back(
        NodeType{"dependency mint", dependency_mint_node_prefix(), 1.0, "Cred minted for a project dependency"});
    declaration.edge_types.push_back(EdgeType{"mints for", "is minted by", dependency_mint_edge_prefix(), 1.0, 0.0,
                                              "connects a dependency mint to its recipient"});
    return declaration;
}

DependencyMintSubgraph dependency_mint_subgraph(const Graph& graph,
                                                const WeightEvaluator& weights,
                                                const IntervalSequence& intervals,
                                                const std::vector<DependencyMintPolicy>& policies) {
    std::vector<double> minted(intervals.size(), 0.0);
    for (const auto& node : graph.node_list()) {
        if (!node.timestamp_ms || node.address.has_prefix(dependency_mint_node_prefix())) continue;
        if (auto k = intervals.index_of(static_cast<double>(*node.timestamp_ms))) {
            minted[*k] += weights.node_weight(node.address);
        }
    }

    DependencyMintSubgraph result;
    result.declaration = dependency_mint_declaration();

    for (const auto& policy : policies) {
        validate_policy(policy);
        auto recipient = graph.node(policy.address);
        if (!recipient) {
            throw UnknownRecipientError("dependency recipient " + policy.address.display() +
                                            " is not a node of the contribution graph",
                                        __func__);
        }
        result.graph.add_node(*recipient);

        std::vector<double> aligned = align_periods_to_intervals(policy.periods, intervals);
        for (std::size_t k = 0; k < intervals.size(); ++k) {
            double award = aligned[k] * minted[k];
            // Sentinels have no integral start to timestamp the edge with
            if (!(award > 0.0) || !intervals[k].is_bounded()) continue;

            std::string start = format_interval_bound(intervals[k].start_ms);
            NodeAddress mint_node = dependency_mint_node_prefix().append(start).concat(policy.address);
            EdgeAddress mint_edge = dependency_mint_edge_prefix().append(start).append_parts(policy.address.to_parts());

            result.graph.add_node(Node{mint_node, "dependency mint for " + recipient->description, std::nullopt});
            result.graph.add_edge(Edge{mint_edge, mint_node, policy.address,
                                       static_cast<TimestampMs>(intervals[k].start_ms)});
            result.weights.node_weights.emplace(mint_node, award);
        }
    }

    LOG_DEBUG("dependency mint subgraph has ", result.graph.node_count(), " nodes");
    return result;
}

} // namespace credrank
