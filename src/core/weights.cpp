#include "credrank/weights.hpp"
#include "credrank/logging.hpp"

#include <cmath>

namespace credrank {

namespace {

void check_weight(double value, const std::string& where) {
    if (!std::isfinite(value) || value < 0.0) {
        throw ParameterError("invalid weight " + std::to_string(value) + " for " + where, "validate_weights",
                             "weights must be finite and non-negative");
    }
}

} // namespace

WeightTable compose_weights(const std::vector<WeightTable>& tables) {
    WeightTable result;
    for (const auto& table : tables) {
        for (const auto& [address, weight] : table.node_weights) {
            auto [it, inserted] = result.node_weights.emplace(address, weight);
            if (!inserted && it->second != weight) {
                throw WeightConflictError("node weight conflict at " + address.display() + ": " +
                                              std::to_string(it->second) + " vs " + std::to_string(weight),
                                          __func__);
            }
        }
        for (const auto& [address, weight] : table.edge_weights) {
            auto [it, inserted] = result.edge_weights.emplace(address, weight);
            if (!inserted && it->second != weight) {
                throw WeightConflictError("edge weight conflict at " + address.display(), __func__);
            }
        }
    }
    return result;
}

void validate_weights(const WeightTable& table) {
    for (const auto& [address, weight] : table.node_weights) {
        check_weight(weight, address.display());
    }
    for (const auto& [address, weight] : table.edge_weights) {
        check_weight(weight.forwards, address.display() + " (forwards)");
        check_weight(weight.backwards, address.display() + " (backwards)");
    }
}

void check_claims(const Graph& graph, const std::vector<PluginDeclaration>& declarations) {
    AddressTrie<NodeAddressTag, std::size_t> node_claims;
    AddressTrie<EdgeAddressTag, std::size_t> edge_claims;

    // Two declarations on one prefix are both recorded as claims of that prefix
    std::map<NodeAddress, std::vector<std::size_t>> node_owners;
    std::map<EdgeAddress, std::vector<std::size_t>> edge_owners;
    for (std::size_t i = 0; i < declarations.size(); ++i) {
        node_owners[declarations[i].node_prefix].push_back(i);
        edge_owners[declarations[i].edge_prefix].push_back(i);
    }
    for (const auto& [prefix, owners] : node_owners) node_claims.add(prefix, owners.size());
    for (const auto& [prefix, owners] : edge_owners) edge_claims.add(prefix, owners.size());

    auto count = [](const std::vector<std::size_t>& claims) {
        std::size_t total = 0;
        for (std::size_t c : claims) total += c;
        return total;
    };

    for (const auto& node : graph.node_list()) {
        std::size_t claims = count(node_claims.get(node.address));
        if (claims != 1) {
            throw UnclaimedAddressError(node.address.display() + " is claimed by " + std::to_string(claims) +
                                            " declarations",
                                        __func__, "every node must fall under exactly one plugin prefix");
        }
    }
    for (const auto& edge : graph.edge_list()) {
        std::size_t claims = count(edge_claims.get(edge.address));
        if (claims != 1) {
            throw UnclaimedAddressError(edge.address.display() + " is claimed by " + std::to_string(claims) +
                                            " declarations",
                                        __func__, "every edge must fall under exactly one plugin prefix");
        }
    }
}

WeightEvaluator::WeightEvaluator(const std::vector<PluginDeclaration>& declarations,
                                 const WeightTable& overrides) {
    validate_weights(overrides);
    for (const auto& declaration : declarations) {
        for (const auto& type : declaration.node_types) {
            check_weight(type.default_weight, "node type " + type.name);
            node_types_.add(type.prefix, NodeEntry{type.prefix, type.default_weight});
        }
        for (const auto& type : declaration.edge_types) {
            check_weight(type.default_forward, "edge type " + type.forward_name);
            check_weight(type.default_backward, "edge type " + type.backward_name);
            edge_types_.add(type.prefix, EdgeEntry{type.prefix, {type.default_forward, type.default_backward}});
        }
    }
    for (const auto& [address, weight] : overrides.node_weights) {
        node_overrides_.add(address, NodeEntry{address, weight});
    }
    for (const auto& [address, weight] : overrides.edge_weights) {
        edge_overrides_.add(address, EdgeEntry{address, weight});
    }
    LOG_DEBUG("weight evaluator: ", declarations.size(), " declarations, ", overrides.node_weights.size(),
              " node and ", overrides.edge_weights.size(), " edge overrides");
}

double WeightEvaluator::node_weight(const NodeAddress& address) const {
    auto type = node_types_.get_last(address);
    auto matches = node_overrides_.get(address);

    double base;
    if (type) {
        base = type->weight;
    } else if (!matches.empty()) {
        base = 1.0;
    } else {
        return 0.0;
    }

    double factor = 1.0;
    for (const auto& match : matches) {
        if (type && match.prefix == type->prefix) {
            base = match.weight;
        } else {
            factor *= match.weight;
        }
    }
    return base * factor;
}

EdgeWeight WeightEvaluator::edge_weight(const EdgeAddress& address) const {
    auto type = edge_types_.get_last(address);
    auto matches = edge_overrides_.get(address);

    EdgeWeight base;
    if (type) {
        base = type->weight;
    } else if (!matches.empty()) {
        base = EdgeWeight{1.0, 1.0};
    } else {
        return EdgeWeight{0.0, 0.0};
    }

    EdgeWeight factor{1.0, 1.0};
    for (const auto& match : matches) {
        if (type && match.prefix == type->prefix) {
            base = match.weight;
        } else {
            factor.forwards *= match.weight.forwards;
            factor.backwards *= match.weight.backwards;
        }
    }
    return EdgeWeight{base.forwards * factor.forwards, base.backwards * factor.backwards};
}

} // namespace credrank
