/**
 * MPG construction
 *
 * Rows are assembled independently, one vector of edges per MPG node, then
 * flattened in node order. Within a row the order is fixed:
 *
 *   contribution edges (graph edge order, forward before backward)
 *   mint edges (seed only)
 *   payout, attributions, forward webbing, backward webbing (epochs only)
 *   radiation
 *
 * Contribution weights are unnormalized until the row is complete; they are
 * then scaled so that they share 1 - alpha (organic rows) or
 * 1 - alpha - beta - gamma_forward - gamma_backward (epoch rows). Radiation
 * takes whatever is left.
 */

#include "credrank/markov_process_graph.hpp"
#include "credrank/logging.hpp"

#include <cmath>
#include <limits>

namespace credrank {

static constexpr uint32_t NOT_ORGANIC = std::numeric_limits<uint32_t>::max();
static constexpr uint32_t NO_EDGE = std::numeric_limits<uint32_t>::max();

// Rows may overshoot 1 by this much before radiation is clamped at zero
static constexpr double NEGATIVE_RADIATION_TOLERANCE = 1e-12;

// =============================================================================
// Parameters
// =============================================================================

void MarkovParameters::validate() const {
    const std::pair<const char*, double> values[] = {
        {"alpha", alpha}, {"beta", beta}, {"gamma_forward", gamma_forward}, {"gamma_backward", gamma_backward}};
    for (const auto& [name, value] : values) {
        if (!(value >= 0.0 && value <= 1.0)) {
            throw ParameterError(std::string(name) + " = " + std::to_string(value) + " is outside [0, 1]",
                                 __func__);
        }
    }
    if (!(alpha > 0.0)) {
        throw ParameterError("alpha must be positive", __func__,
                             "without radiation the walk has no stationary distribution tied to the seed");
    }
    double sum = alpha + beta + gamma_forward + gamma_backward;
    if (sum > 1.0 + NEGATIVE_RADIATION_TOLERANCE) {
        throw ParameterError("alpha + beta + gamma_forward + gamma_backward = " + std::to_string(sum) +
                                 " exceeds 1",
                             __func__);
    }
}

double MarkovParameters::epoch_remainder() const {
    double remainder = 1.0 - (alpha + beta + gamma_forward + gamma_backward);
    return remainder < 0.0 ? 0.0 : remainder;
}

// =============================================================================
// Gadget addresses
// =============================================================================

namespace gadget {

const NodeAddress& node_prefix() {
    static const NodeAddress prefix = NodeAddress::from_parts({"credrank", "core", "mpg"});
    return prefix;
}

const EdgeAddress& edge_prefix() {
    static const EdgeAddress prefix = EdgeAddress::from_parts({"credrank", "core", "mpg"});
    return prefix;
}

NodeAddress seed_address() {
    return node_prefix().append("SEED");
}

NodeAddress accumulator_address(const Interval& interval) {
    return node_prefix().append("ACCUMULATOR", format_interval_bound(interval.start_ms));
}

NodeAddress epoch_address(const ParticipantId& participant, const Interval& interval) {
    return node_prefix().append("EPOCH", format_interval_bound(interval.start_ms), participant.to_hex());
}

EdgeAddress mint_address(const NodeAddress& target) {
    return edge_prefix().append("MINT").append_parts(target.to_parts());
}

EdgeAddress radiation_address(const NodeAddress& source) {
    return edge_prefix().append("RADIATION").append_parts(source.to_parts());
}

EdgeAddress payout_address(const ParticipantId& participant, const Interval& interval) {
    return edge_prefix().append("PAYOUT", format_interval_bound(interval.start_ms), participant.to_hex());
}

EdgeAddress webbing_address(const ParticipantId& participant, const Interval& earlier, const Interval& later) {
    return edge_prefix().append("WEBBING", format_interval_bound(earlier.start_ms),
                                format_interval_bound(later.start_ms), participant.to_hex());
}

EdgeAddress attribution_address(const ParticipantId& from, const ParticipantId& to, const Interval& interval) {
    return edge_prefix().append("ATTRIBUTION", format_interval_bound(interval.start_ms), from.to_hex(),
                                to.to_hex());
}

} // namespace gadget

namespace {

struct NodeGadgetName {
    const char* operator()(const gadget::Seed&) const { return "seed"; }
    const char* operator()(const gadget::Accumulator&) const { return "accumulator"; }
    const char* operator()(const gadget::Epoch&) const { return "epoch"; }
    const char* operator()(const gadget::Organic&) const { return "organic"; }
};

struct EdgeGadgetName {
    const char* operator()(const gadget::Contribution&) const { return "contribution"; }
    const char* operator()(const gadget::Mint&) const { return "mint"; }
    const char* operator()(const gadget::Radiation&) const { return "radiation"; }
    const char* operator()(const gadget::Payout&) const { return "payout"; }
    const char* operator()(const gadget::Webbing&) const { return "webbing"; }
    const char* operator()(const gadget::Attribution&) const { return "attribution"; }
};

} // namespace

const char* gadget_name(const NodeGadget& gadget) {
    return std::visit(NodeGadgetName{}, gadget);
}

const char* gadget_name(const EdgeGadget& gadget) {
    return std::visit(EdgeGadgetName{}, gadget);
}

// =============================================================================
// Construction
// =============================================================================

MarkovProcessGraph MarkovProcessGraph::build(const Graph& graph,
                                             const WeightEvaluator& weights,
                                             const IntervalSequence& intervals,
                                             const std::vector<Participant>& participants,
                                             const MarkovParameters& parameters,
                                             const PersonalAttributions& attributions) {
    parameters.validate();
    if (intervals.empty()) {
        throw ParameterError("at least one interval is required", __func__);
    }

    MarkovProcessGraph mpg;
    mpg.parameters_ = parameters;
    mpg.intervals_ = intervals;
    mpg.participants_ = sort_participants(participants);

    const std::size_t num_intervals = intervals.size();
    const std::size_t num_participants = mpg.participants_.size();
    const IndexedAttributions attribution_index(attributions, mpg.participants_, intervals);

    std::unordered_map<NodeAddress, std::size_t> participant_of;
    std::map<ParticipantId, std::size_t> participant_of_id;
    for (std::size_t p = 0; p < num_participants; ++p) {
        participant_of.emplace(mpg.participants_[p].address, p);
        participant_of_id.emplace(mpg.participants_[p].id, p);
    }

    // -------------------------------------------------------------------------
    // Nodes
    // -------------------------------------------------------------------------

    auto& nodes = mpg.nodes_;
    nodes.push_back(MarkovNode{gadget::seed_address(), "seed", 0.0, std::nullopt, gadget::Seed{}});

    for (std::size_t k = 0; k < num_intervals; ++k) {
        nodes.push_back(MarkovNode{gadget::accumulator_address(intervals[k]),
                                   "accumulator for the interval starting " +
                                       format_interval_bound(intervals[k].start_ms),
                                   0.0, std::nullopt,
                                   gadget::Accumulator{static_cast<uint32_t>(k)}});
    }

    for (std::size_t p = 0; p < num_participants; ++p) {
        const Participant& participant = mpg.participants_[p];
        for (std::size_t k = 0; k < num_intervals; ++k) {
            nodes.push_back(MarkovNode{gadget::epoch_address(participant.id, intervals[k]),
                                       participant.description + " in the interval starting " +
                                           format_interval_bound(intervals[k].start_ms),
                                       0.0, std::nullopt,
                                       gadget::Epoch{static_cast<uint32_t>(p), static_cast<uint32_t>(k)}});
        }
    }

    const std::size_t organic_offset = nodes.size();
    std::vector<uint32_t> organic_of_graph_node(graph.node_count(), NOT_ORGANIC);
    double total_mint = 0.0;

    for (std::size_t i = 0; i < graph.node_count(); ++i) {
        const Node& node = graph.node_list()[i];
        double mint = weights.node_weight(node.address);

        if (participant_of.count(node.address)) {
            if (mint > 0.0) {
                LOG_WARN("ignoring mint ", mint, " on participant ", node.address.display());
            }
            continue;
        }
        if (node.address.has_prefix(gadget::node_prefix())) {
            throw ConstructionError(nodes.size(), "organic node " + node.address.display() +
                                                      " lies under the reserved gadget prefix",
                                    __func__);
        }

        organic_of_graph_node[i] = static_cast<uint32_t>(nodes.size());
        nodes.push_back(MarkovNode{node.address, node.description, mint, node.timestamp_ms, gadget::Organic{}});
        total_mint += mint;
    }
    mpg.total_mint_ = total_mint;

    // -------------------------------------------------------------------------
    // Rows
    // -------------------------------------------------------------------------

    std::vector<std::vector<MarkovEdge>> rows(nodes.size());
    std::vector<double> contribution_weight(nodes.size(), 0.0);

    // Maps a graph endpoint to its MPG node, resolving participants to epochs
    auto lift = [&](uint32_t graph_node, const Edge& edge) -> uint32_t {
        if (organic_of_graph_node[graph_node] != NOT_ORGANIC) {
            return organic_of_graph_node[graph_node];
        }
        std::size_t p = participant_of.at(graph.node_list()[graph_node].address);
        auto k = intervals.index_of(static_cast<double>(edge.timestamp_ms));
        if (!k) {
            throw ConstructionError(mpg.epoch_index(p, 0),
                                    "edge " + edge.address.display() + " at " + std::to_string(edge.timestamp_ms) +
                                        " lies outside every interval",
                                    "MarkovProcessGraph::build");
        }
        return mpg.epoch_index(p, *k);
    };

    std::size_t skipped_edges = 0;
    for (const Edge& edge : graph.edge_list()) {
        EdgeWeight weight = weights.edge_weight(edge.address);
        if (weight.forwards == 0.0 && weight.backwards == 0.0) {
            ++skipped_edges;
            continue;
        }
        uint32_t src = lift(*graph.node_index(edge.src), edge);
        uint32_t dst = lift(*graph.node_index(edge.dst), edge);
        if (edge.address.has_prefix(gadget::edge_prefix())) {
            throw ConstructionError(src, "contribution edge " + edge.address.display() +
                                             " lies under the reserved gadget prefix",
                                    __func__);
        }

        if (weight.forwards > 0.0) {
            rows[src].push_back(MarkovEdge{edge.address, false, src, dst, weight.forwards, gadget::Contribution{}});
            contribution_weight[src] += weight.forwards;
        }
        if (weight.backwards > 0.0) {
            rows[dst].push_back(MarkovEdge{edge.address, true, dst, src, weight.backwards, gadget::Contribution{}});
            contribution_weight[dst] += weight.backwards;
        }
    }

    // Normalize contributions to the row's share
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (rows[i].empty()) continue;
        double share = std::holds_alternative<gadget::Epoch>(nodes[i].gadget)
                           ? parameters.epoch_remainder()
                           : 1.0 - parameters.alpha;
        double total = contribution_weight[i];
        for (auto& edge : rows[i]) {
            edge.transition_probability = edge.transition_probability / total * share;
        }
    }

    // Mint
    if (total_mint > 0.0) {
        for (std::size_t i = organic_offset; i < nodes.size(); ++i) {
            if (nodes[i].mint > 0.0) {
                rows[0].push_back(MarkovEdge{gadget::mint_address(nodes[i].address), false, 0,
                                             static_cast<uint32_t>(i), nodes[i].mint / total_mint, gadget::Mint{}});
            }
        }
    }

    // Payout, attribution and webbing
    for (std::size_t p = 0; p < num_participants; ++p) {
        const ParticipantId& id = mpg.participants_[p].id;
        for (std::size_t k = 0; k < num_intervals; ++k) {
            uint32_t epoch = mpg.epoch_index(p, k);
            auto& row = rows[epoch];

            double attributed = attribution_index.sum_proportions(id, k);
            row.push_back(MarkovEdge{gadget::payout_address(id, intervals[k]), false, epoch,
                                     mpg.accumulator_index(k), parameters.beta * (1.0 - attributed),
                                     gadget::Payout{static_cast<uint32_t>(p), static_cast<uint32_t>(k)}});

            for (const auto& [to, proportion] : attribution_index.recipients(id, k)) {
                std::size_t q = participant_of_id.at(to);
                row.push_back(MarkovEdge{gadget::attribution_address(id, to, intervals[k]), false, epoch,
                                         mpg.epoch_index(q, k), parameters.beta * proportion,
                                         gadget::Attribution{static_cast<uint32_t>(p), static_cast<uint32_t>(q),
                                                             static_cast<uint32_t>(k)}});
            }

            bool bounded = intervals[k].is_bounded();
            if (bounded && k + 1 < num_intervals && intervals[k + 1].is_bounded()) {
                row.push_back(MarkovEdge{gadget::webbing_address(id, intervals[k], intervals[k + 1]), false, epoch,
                                         mpg.epoch_index(p, k + 1), parameters.gamma_forward,
                                         gadget::Webbing{static_cast<uint32_t>(p), static_cast<uint32_t>(k)}});
            }
            if (bounded && k > 0 && intervals[k - 1].is_bounded()) {
                row.push_back(MarkovEdge{gadget::webbing_address(id, intervals[k - 1], intervals[k]), true, epoch,
                                         mpg.epoch_index(p, k - 1), parameters.gamma_backward,
                                         gadget::Webbing{static_cast<uint32_t>(p), static_cast<uint32_t>(k - 1)}});
            }
        }
    }

    // Radiation
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        auto& row = rows[i];
        if (i == seed_index()) {
            if (row.empty()) {
                row.push_back(MarkovEdge{gadget::radiation_address(nodes[i].address), false, 0, 0, 1.0,
                                         gadget::Radiation{}});
            }
            continue;
        }
        double assigned = 0.0;
        for (const auto& edge : row) assigned += edge.transition_probability;
        double radiation = 1.0 - assigned;
        if (radiation < -NEGATIVE_RADIATION_TOLERANCE) {
            throw ConstructionError(i, "outgoing probabilities sum to " + std::to_string(assigned), __func__);
        }
        if (radiation < 0.0) radiation = 0.0;
        row.push_back(MarkovEdge{gadget::radiation_address(nodes[i].address), false, static_cast<uint32_t>(i), 0,
                                 radiation, gadget::Radiation{}});
    }

    std::size_t edge_total = 0;
    for (const auto& row : rows) edge_total += row.size();
    mpg.edges_.reserve(edge_total);
    for (auto& row : rows) {
        for (auto& edge : row) mpg.edges_.push_back(std::move(edge));
    }

    mpg.index();
    mpg.check_rows();

    LOG_INFO("built Markov process graph: ", nodes.size(), " nodes (", graph.node_count(), " graph nodes, ",
             num_participants, " participants, ", num_intervals, " intervals), ", mpg.edges_.size(), " edges, ",
             skipped_edges, " zero-weight graph edges omitted");
    return mpg;
}

MarkovProcessGraph MarkovProcessGraph::from_parts(std::vector<MarkovNode> nodes,
                                                  std::vector<MarkovEdge> edges,
                                                  IntervalSequence intervals,
                                                  std::vector<Participant> participants,
                                                  MarkovParameters parameters) {
    parameters.validate();

    MarkovProcessGraph mpg;
    mpg.nodes_ = std::move(nodes);
    mpg.edges_ = std::move(edges);
    mpg.intervals_ = std::move(intervals);
    mpg.participants_ = std::move(participants);
    mpg.parameters_ = parameters;

    double total_mint = 0.0;
    for (const auto& node : mpg.nodes_) {
        if (std::holds_alternative<gadget::Organic>(node.gadget)) total_mint += node.mint;
    }
    mpg.total_mint_ = total_mint;

    mpg.index();
    mpg.check_rows();
    return mpg;
}

// =============================================================================
// Lookup
// =============================================================================

void MarkovProcessGraph::index() {
    const std::size_t num_intervals = intervals_.size();
    const std::size_t expected_gadget_nodes = 1 + num_intervals * (1 + participants_.size());
    if (nodes_.size() < expected_gadget_nodes) {
        throw ConstructionError(nodes_.size(), "graph is missing gadget nodes", __func__);
    }

    node_index_.clear();
    for (std::size_t i = 0; i < nodes_.size(); ++i) {
        if (!node_index_.emplace(nodes_[i].address, static_cast<uint32_t>(i)).second) {
            throw ConstructionError(i, "duplicate node " + nodes_[i].address.display(), __func__);
        }
    }

    participant_index_.clear();
    participant_address_index_.clear();
    for (std::size_t p = 0; p < participants_.size(); ++p) {
        participant_index_.emplace(participants_[p].id, p);
        participant_address_index_.emplace(participants_[p].address, p);
    }

    edge_index_.clear();
    row_begin_.assign(nodes_.size() + 1, 0);
    payout_edges_.assign(participants_.size() * num_intervals, NO_EDGE);

    uint32_t current = 0;
    for (std::size_t e = 0; e < edges_.size(); ++e) {
        const MarkovEdge& edge = edges_[e];
        if (edge.src >= nodes_.size() || edge.dst >= nodes_.size()) {
            throw ConstructionError(edge.src, "edge " + edge.address.display() + " points outside the graph",
                                    __func__);
        }
        if (edge.src < current) {
            throw ConstructionError(edge.src, "edges are not grouped by source row", __func__);
        }
        while (current < edge.src) {
            row_begin_[++current] = static_cast<uint32_t>(e);
        }
        if (!edge_index_.emplace(edge.key(), static_cast<uint32_t>(e)).second) {
            throw ConstructionError(edge.src, "duplicate edge " + edge.address.display(), __func__);
        }
        if (const auto* payout = std::get_if<gadget::Payout>(&edge.gadget)) {
            if (payout->participant >= participants_.size() || payout->interval >= num_intervals) {
                throw ConstructionError(edge.src, "payout edge " + edge.address.display() +
                                                      " names an unknown epoch",
                                        __func__);
            }
            payout_edges_[payout->participant * num_intervals + payout->interval] = static_cast<uint32_t>(e);
        }
    }
    while (current < nodes_.size()) {
        row_begin_[++current] = static_cast<uint32_t>(edges_.size());
    }

    for (std::size_t p = 0; p < participants_.size(); ++p) {
        for (std::size_t k = 0; k < num_intervals; ++k) {
            if (payout_edges_[p * num_intervals + k] == NO_EDGE) {
                throw ConstructionError(epoch_index(p, k), "epoch has no payout edge", __func__);
            }
        }
    }
}

std::optional<uint32_t> MarkovProcessGraph::node_index(const NodeAddress& address) const {
    auto it = node_index_.find(address);
    if (it == node_index_.end()) return std::nullopt;
    return it->second;
}

std::optional<uint32_t> MarkovProcessGraph::edge_index(const MarkovEdgeAddress& address) const {
    auto it = edge_index_.find(address);
    if (it == edge_index_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::size_t> MarkovProcessGraph::participant_index(const ParticipantId& id) const {
    auto it = participant_index_.find(id);
    if (it == participant_index_.end()) return std::nullopt;
    return it->second;
}

std::optional<std::size_t> MarkovProcessGraph::participant_index(const NodeAddress& address) const {
    auto it = participant_address_index_.find(address);
    if (it == participant_address_index_.end()) return std::nullopt;
    return it->second;
}

void MarkovProcessGraph::check_rows() const {
    for (uint32_t i = 0; i < nodes_.size(); ++i) {
        auto [begin, end] = row(i);
        if (begin == end) {
            throw ConstructionError(i, "node " + nodes_[i].address.display() + " has no outgoing edges",
                                    __func__);
        }
        double sum = 0.0;
        for (uint32_t e = begin; e < end; ++e) {
            double p = edges_[e].transition_probability;
            if (!std::isfinite(p) || p < 0.0) {
                throw ConstructionError(i, "edge " + edges_[e].address.display() + " has probability " +
                                               std::to_string(p),
                                        __func__);
            }
            sum += p;
        }
        if (std::fabs(sum - 1.0) > kRowTolerance) {
            throw ConstructionError(i, "row of " + nodes_[i].address.display() + " sums to " +
                                           std::to_string(sum),
                                    __func__);
        }
    }
}

bool MarkovProcessGraph::operator==(const MarkovProcessGraph& other) const {
    return nodes_ == other.nodes_ && edges_ == other.edges_ && intervals_ == other.intervals_ &&
           participants_ == other.participants_ && parameters_ == other.parameters_;
}

} // namespace credrank
