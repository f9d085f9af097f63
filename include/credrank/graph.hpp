/**
 * Contribution graph
 *
 * Directed multigraph of addressed nodes and edges. Storage is an arena:
 * nodes_ and edges_ hold entries in insertion order, lookup tables map
 * addresses to uint32_t indices, and each node keeps the indices of its
 * incoming and outgoing edges. Self-loops and parallel edges are allowed.
 *
 * Adding an identical entry twice is a no-op; any other reuse of an
 * address fails. Entries are never mutated or removed once added.
 */

#pragma once

#include "credrank/address.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace credrank {

using TimestampMs = int64_t;

struct Node {
    NodeAddress address;
    std::string description;
    std::optional<TimestampMs> timestamp_ms;    // nullopt = timeless

    bool operator==(const Node& other) const {
        return address == other.address && description == other.description &&
               timestamp_ms == other.timestamp_ms;
    }
    bool operator!=(const Node& other) const { return !(*this == other); }
};

struct Edge {
    EdgeAddress address;
    NodeAddress src;
    NodeAddress dst;
    TimestampMs timestamp_ms = 0;

    bool operator==(const Edge& other) const {
        return address == other.address && src == other.src && dst == other.dst &&
               timestamp_ms == other.timestamp_ms;
    }
    bool operator!=(const Edge& other) const { return !(*this == other); }
};

class Graph {
public:
    Graph() = default;

    // Throws DuplicateAddressError if the address holds a different node
    Graph& add_node(const Node& node);

    // Throws DanglingEdgeError for missing endpoints, DuplicateAddressError on reuse
    Graph& add_edge(const Edge& edge);

    std::optional<Node> node(const NodeAddress& address) const;
    std::optional<Edge> edge(const EdgeAddress& address) const;

    bool has_node(const NodeAddress& address) const { return node_index_.count(address) > 0; }
    bool has_edge(const EdgeAddress& address) const { return edge_index_.count(address) > 0; }

    // Insertion-ordered iteration, optionally restricted to a prefix
    std::vector<Node> nodes(const NodeAddress& prefix = NodeAddress()) const;
    std::vector<Edge> edges(const EdgeAddress& prefix = EdgeAddress()) const;

    // Incident edges in insertion order; empty for unknown nodes
    std::vector<Edge> in_edges(const NodeAddress& address) const;
    std::vector<Edge> out_edges(const NodeAddress& address) const;

    // Raw arena access
    const std::vector<Node>& node_list() const { return nodes_; }
    const std::vector<Edge>& edge_list() const { return edges_; }
    std::optional<uint32_t> node_index(const NodeAddress& address) const;
    std::optional<uint32_t> edge_index(const EdgeAddress& address) const;
    const std::vector<uint32_t>& in_edge_indices(uint32_t node) const { return in_[node]; }
    const std::vector<uint32_t>& out_edge_indices(uint32_t node) const { return out_[node]; }

    std::size_t node_count() const { return nodes_.size(); }
    std::size_t edge_count() const { return edges_.size(); }

    // Union of the graphs in argument order; MergeConflictError on disagreement
    static Graph merge(const std::vector<Graph>& graphs);

    // Structural equality, independent of insertion order
    bool operator==(const Graph& other) const;
    bool operator!=(const Graph& other) const { return !(*this == other); }

private:
    std::vector<Node> nodes_;
    std::vector<Edge> edges_;
    std::unordered_map<NodeAddress, uint32_t> node_index_;
    std::unordered_map<EdgeAddress, uint32_t> edge_index_;
    std::vector<std::vector<uint32_t>> in_;
    std::vector<std::vector<uint32_t>> out_;
};

} // namespace credrank
