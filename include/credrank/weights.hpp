/**
 * Weight resolution
 *
 * Plugin declarations name the node and edge types of a plugin, each type
 * being an address prefix with default weights. Explicit overrides in a
 * WeightTable are keyed by address (or address prefix) and multiply onto
 * the type defaults:
 *
 *   base   = override at the most specific type prefix, else that type's default
 *            (1 if no type matches but some override does, 0 if nothing matches)
 *   weight = base * product of every other override at a prefix of the address
 *
 * An override of 1.0 is neutral. Edges resolve forwards and backwards
 * independently with the same rule.
 */

#pragma once

#include "credrank/address.hpp"
#include "credrank/graph.hpp"

#include <map>
#include <string>
#include <vector>

namespace credrank {

struct NodeType {
    std::string name;
    NodeAddress prefix;
    double default_weight = 1.0;
    std::string description;
};

struct EdgeType {
    std::string forward_name;
    std::string backward_name;
    EdgeAddress prefix;
    double default_forward = 1.0;
    double default_backward = 1.0;
    std::string description;
};

struct PluginDeclaration {
    std::string name;
    NodeAddress node_prefix;
    EdgeAddress edge_prefix;
    std::vector<NodeType> node_types;
    std::vector<EdgeType> edge_types;
};

struct EdgeWeight {
    double forwards = 1.0;
    double backwards = 1.0;

    bool operator==(const EdgeWeight& other) const {
        return forwards == other.forwards && backwards == other.backwards;
    }
    bool operator!=(const EdgeWeight& other) const { return !(*this == other); }
};

struct WeightTable {
    std::map<NodeAddress, double> node_weights;
    std::map<EdgeAddress, EdgeWeight> edge_weights;

    bool empty() const { return node_weights.empty() && edge_weights.empty(); }

    bool operator==(const WeightTable& other) const {
        return node_weights == other.node_weights && edge_weights == other.edge_weights;
    }
};

// Union of the tables; WeightConflictError when a key maps to different values
WeightTable compose_weights(const std::vector<WeightTable>& tables);

// ParameterError for negative or non-finite weights
void validate_weights(const WeightTable& table);

// UnclaimedAddressError unless every address matches exactly one declaration
void check_claims(const Graph& graph, const std::vector<PluginDeclaration>& declarations);

class WeightEvaluator {
public:
    WeightEvaluator(const std::vector<PluginDeclaration>& declarations, const WeightTable& overrides);

    double node_weight(const NodeAddress& address) const;
    EdgeWeight edge_weight(const EdgeAddress& address) const;

private:
    struct NodeEntry {
        NodeAddress prefix;
        double weight;
    };
    struct EdgeEntry {
        EdgeAddress prefix;
        EdgeWeight weight;
    };

    AddressTrie<NodeAddressTag, NodeEntry> node_types_;
    AddressTrie<EdgeAddressTag, EdgeEntry> edge_types_;
    AddressTrie<NodeAddressTag, NodeEntry> node_overrides_;
    AddressTrie<EdgeAddressTag, EdgeEntry> edge_overrides_;
};

} // namespace credrank
