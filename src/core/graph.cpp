#include "credrank/graph.hpp"
#include "credrank/logging.hpp"

namespace credrank {

namespace {

std::string describe(const Node& node) {
    std::string out = node.address.display() + " \"" + node.description + "\" @";
    out += node.timestamp_ms ? std::to_string(*node.timestamp_ms) : "timeless";
    return out;
}

std::string describe(const Edge& edge) {
    return edge.address.display() + " " + edge.src.display() + " -> " + edge.dst.display() +
           " @" + std::to_string(edge.timestamp_ms);
}

} // namespace

Graph& Graph::add_node(const Node& node) {
    auto it = node_index_.find(node.address);
    if (it != node_index_.end()) {
        const Node& existing = nodes_[it->second];
        if (existing == node) {
            return *this;
        }
        throw DuplicateAddressError("node address already holds different content: " + describe(existing) +
                                        " vs " + describe(node),
                                    __func__);
    }

    uint32_t index = static_cast<uint32_t>(nodes_.size());
    nodes_.push_back(node);
    node_index_.emplace(node.address, index);
    in_.emplace_back();
    out_.emplace_back();
    return *this;
}

Graph& Graph::add_edge(const Edge& edge) {
    auto it = edge_index_.find(edge.address);
    if (it != edge_index_.end()) {
        const Edge& existing = edges_[it->second];
        if (existing == edge) {
            return *this;
        }
        throw DuplicateAddressError("edge address already holds different content: " + describe(existing) +
                                        " vs " + describe(edge),
                                    __func__);
    }

    auto src = node_index_.find(edge.src);
    if (src == node_index_.end()) {
        throw DanglingEdgeError("missing src for edge " + describe(edge), __func__,
                                "add both endpoints before the edge");
    }
    auto dst = node_index_.find(edge.dst);
    if (dst == node_index_.end()) {
        throw DanglingEdgeError("missing dst for edge " + describe(edge), __func__,
                                "add both endpoints before the edge");
    }

    uint32_t index = static_cast<uint32_t>(edges_.size());
    edges_.push_back(edge);
    edge_index_.emplace(edge.address, index);
    out_[src->second].push_back(index);
    in_[dst->second].push_back(index);
    return *this;
}

std::optional<Node> Graph::node(const NodeAddress& address) const {
    auto it = node_index_.find(address);
    if (it == node_index_.end()) return std::nullopt;
    return nodes_[it->second];
}

std::optional<Edge> Graph::edge(const EdgeAddress& address) const {
    auto it = edge_index_.find(address);
    if (it == edge_index_.end()) return std::nullopt;
    return edges_[it->second];
}

std::optional<uint32_t> Graph::node_index(const NodeAddress& address) const {
    auto it = node_index_.find(address);
    if (it == node_index_.end()) return std::nullopt;
    return it->second;
}

std::optional<uint32_t> Graph::edge_index(const EdgeAddress& address) const {
    auto it = edge_index_.find(address);
    if (it == edge_index_.end()) return std::nullopt;
    return it->second;
}

std::vector<Node> Graph::nodes(const NodeAddress& prefix) const {
    std::vector<Node> result;
    for (const auto& node : nodes_) {
        if (node.address.has_prefix(prefix)) result.push_back(node);
    }
    return result;
}

std::vector<Edge> Graph::edges(const EdgeAddress& prefix) const {
    std::vector<Edge> result;
    for (const auto& edge : edges_) {
        if (edge.address.has_prefix(prefix)) result.push_back(edge);
    }
    return result;
}

std::vector<Edge> Graph::in_edges(const NodeAddress& address) const {
    std::vector<Edge> result;
    auto index = node_index(address);
    if (!index) return result;
    for (uint32_t e : in_[*index]) result.push_back(edges_[e]);
    return result;
}

std::vector<Edge> Graph::out_edges(const NodeAddress& address) const {
    std::vector<Edge> result;
    auto index = node_index(address);
    if (!index) return result;
    for (uint32_t e : out_[*index]) result.push_back(edges_[e]);
    return result;
}

Graph Graph::merge(const std::vector<Graph>& graphs) {
    Graph result;
    for (const auto& g : graphs) {
        for (const auto& node : g.nodes_) {
            auto existing = result.node(node.address);
            if (existing && *existing != node) {
                throw MergeConflictError("conflicting nodes: " + describe(*existing) + " vs " + describe(node),
                                         __func__);
            }
            result.add_node(node);
        }
    }
    // Edges after all nodes so cross-graph endpoints resolve
    for (const auto& g : graphs) {
        for (const auto& edge : g.edges_) {
            auto existing = result.edge(edge.address);
            if (existing && *existing != edge) {
                throw MergeConflictError("conflicting edges: " + describe(*existing) + " vs " + describe(edge),
                                         __func__);
            }
            result.add_edge(edge);
        }
    }
    LOG_DEBUG("merged ", graphs.size(), " graphs into ", result.node_count(), " nodes and ",
              result.edge_count(), " edges");
    return result;
}

bool Graph::operator==(const Graph& other) const {
    if (nodes_.size() != other.nodes_.size() || edges_.size() != other.edges_.size()) {
        return false;
    }
    for (const auto& node : nodes_) {
        auto it = other.node_index_.find(node.address);
        if (it == other.node_index_.end() || other.nodes_[it->second] != node) return false;
    }
    for (const auto& edge : edges_) {
        auto it = other.edge_index_.find(edge.address);
        if (it == other.edge_index_.end() || other.edges_[it->second] != edge) return false;
    }
    return true;
}

} // namespace credrank
