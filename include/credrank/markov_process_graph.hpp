/**
 * Markov Process Graph (MPG)
 *
 * Turns a contribution graph into a row-stochastic transition structure by
 * adding synthetic "gadget" nodes and edges:
 *
 *   seed          one node; target of radiation, source of mint
 *   accumulator   one per interval; collects payout from that interval's epochs
 *   epoch         one per (participant, interval); replaces the participant node
 *   organic       every non-participant node of the contribution graph
 *
 *   contribution  graph edges rewritten onto epoch nodes (forward and backward)
 *   mint          seed -> organic node, probability mint / total mint
 *   payout        epoch -> accumulator, probability beta (less attributions)
 *   attribution   epoch -> another participant's epoch, beta * proportion
 *   webbing       epoch <-> adjacent bounded epoch, gamma_forward / gamma_backward
 *   radiation     every non-seed node -> seed, the remainder of its row
 *
 * Node order: seed, accumulators by interval, epochs by (participant id,
 * interval), organic nodes in graph insertion order. Edges are grouped by
 * source row in node order, so row i occupies edges [row(i).first, row(i).second).
 *
 * Gadget kinds are plain tagged structs held in std::variant; code that needs
 * per-kind behaviour switches on the variant.
 */

#pragma once

#include "credrank/address.hpp"
#include "credrank/graph.hpp"
#include "credrank/interval.hpp"
#include "credrank/participant.hpp"
#include "credrank/weights.hpp"

#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace credrank {

/**
 * Transition parameters of the MPG
 */
struct MarkovParameters {
    double alpha = 0.2;             // Radiation back to the seed from every non-seed node
    double beta = 0.2;              // Payout from each epoch to its accumulator
    double gamma_forward = 0.15;    // Webbing to the next epoch of the same participant
    double gamma_backward = 0.1;    // Webbing to the previous epoch of the same participant

    // Throws ParameterError unless every value is in [0,1], alpha > 0 and the sum is <= 1
    void validate() const;

    // Probability mass left for contribution edges out of an epoch node
    double epoch_remainder() const;

    bool operator==(const MarkovParameters& other) const {
        return alpha == other.alpha && beta == other.beta && gamma_forward == other.gamma_forward &&
               gamma_backward == other.gamma_backward;
    }
};

namespace gadget {

// Node gadgets
struct Seed {
    bool operator==(const Seed&) const { return true; }
};

struct Accumulator {
    uint32_t interval;
    bool operator==(const Accumulator& o) const { return interval == o.interval; }
};

struct Epoch {
    uint32_t participant;
    uint32_t interval;
    bool operator==(const Epoch& o) const { return participant == o.participant && interval == o.interval; }
};

struct Organic {
    bool operator==(const Organic&) const { return true; }
};

// Edge gadgets
struct Contribution {
    bool operator==(const Contribution&) const { return true; }
};

struct Mint {
    bool operator==(const Mint&) const { return true; }
};

struct Radiation {
    bool operator==(const Radiation&) const { return true; }
};

struct Payout {
    uint32_t participant;
    uint32_t interval;
    bool operator==(const Payout& o) const { return participant == o.participant && interval == o.interval; }
};

// Between intervals `earlier` and earlier + 1; direction given by MarkovEdge::reversed
struct Webbing {
    uint32_t participant;
    uint32_t earlier;
    bool operator==(const Webbing& o) const { return participant == o.participant && earlier == o.earlier; }
};

struct Attribution {
    uint32_t from;
    uint32_t to;
    uint32_t interval;
    bool operator==(const Attribution& o) const {
        return from == o.from && to == o.to && interval == o.interval;
    }
};

// Address scheme
const NodeAddress& node_prefix();
const EdgeAddress& edge_prefix();

NodeAddress seed_address();
NodeAddress accumulator_address(const Interval& interval);
NodeAddress epoch_address(const ParticipantId& participant, const Interval& interval);

EdgeAddress mint_address(const NodeAddress& target);
EdgeAddress radiation_address(const NodeAddress& source);
EdgeAddress payout_address(const ParticipantId& participant, const Interval& interval);
EdgeAddress webbing_address(const ParticipantId& participant, const Interval& earlier, const Interval& later);
EdgeAddress attribution_address(const ParticipantId& from, const ParticipantId& to, const Interval& interval);

} // namespace gadget

using NodeGadget = std::variant<gadget::Seed, gadget::Accumulator, gadget::Epoch, gadget::Organic>;
using EdgeGadget = std::variant<gadget::Contribution, gadget::Mint, gadget::Radiation,
                                gadget::Payout, gadget::Webbing, gadget::Attribution>;

// Lower-case kind names used in logs and snapshots
const char* gadget_name(const NodeGadget& gadget);
const char* gadget_name(const EdgeGadget& gadget);

struct MarkovNode {
    NodeAddress address;
    std::string description;
    double mint = 0.0;
    std::optional<TimestampMs> timestamp_ms;
    NodeGadget gadget;

    bool operator==(const MarkovNode& other) const {
        return address == other.address && description == other.description && mint == other.mint &&
               timestamp_ms == other.timestamp_ms && gadget == other.gadget;
    }
};

struct MarkovEdgeAddress {
    EdgeAddress address;
    bool reversed = false;

    bool operator==(const MarkovEdgeAddress& other) const {
        return address == other.address && reversed == other.reversed;
    }
};

struct MarkovEdgeAddressHash {
    std::size_t operator()(const MarkovEdgeAddress& a) const noexcept {
        return std::hash<EdgeAddress>{}(a.address) * 2 + (a.reversed ? 1 : 0);
    }
};

struct MarkovEdge {
    EdgeAddress address;
    bool reversed = false;
    uint32_t src = 0;
    uint32_t dst = 0;
    double transition_probability = 0.0;
    EdgeGadget gadget;

    MarkovEdgeAddress key() const { return MarkovEdgeAddress{address, reversed}; }

    bool operator==(const MarkovEdge& other) const {
        return address == other.address && reversed == other.reversed && src == other.src &&
               dst == other.dst && transition_probability == other.transition_probability &&
               gadget == other.gadget;
    }
};

class MarkovProcessGraph {
public:
    static constexpr double kRowTolerance = 1e-9;

    MarkovProcessGraph() = default;

    /**
     * Build the MPG.
     *
     * Throws ParameterError for invalid parameters, participants, intervals
     * or attributions, and ConstructionError when a row cannot be formed or
     * does not sum to 1.
     */
    static MarkovProcessGraph build(const Graph& graph,
                                    const WeightEvaluator& weights,
                                    const IntervalSequence& intervals,
                                    const std::vector<Participant>& participants,
                                    const MarkovParameters& parameters,
                                    const PersonalAttributions& attributions = {});

    // Reassemble from stored parts and re-check every row
    static MarkovProcessGraph from_parts(std::vector<MarkovNode> nodes,
                                         std::vector<MarkovEdge> edges,
                                         IntervalSequence intervals,
                                         std::vector<Participant> participants,
                                         MarkovParameters parameters);

    const std::vector<MarkovNode>& nodes() const { return nodes_; }
    const std::vector<MarkovEdge>& edges() const { return edges_; }
    std::size_t node_count() const { return nodes_.size(); }
    std::size_t edge_count() const { return edges_.size(); }

    std::optional<uint32_t> node_index(const NodeAddress& address) const;
    std::optional<uint32_t> edge_index(const MarkovEdgeAddress& address) const;

    // Half-open edge index range of a node's row
    std::pair<uint32_t, uint32_t> row(uint32_t node) const {
        return {row_begin_[node], row_begin_[node + 1]};
    }

    const IntervalSequence& intervals() const { return intervals_; }
    const std::vector<Participant>& participants() const { return participants_; }
    const MarkovParameters& parameters() const { return parameters_; }

    // Sum of organic mint weights
    double total_mint() const { return total_mint_; }

    static constexpr uint32_t seed_index() { return 0; }
    uint32_t accumulator_index(std::size_t interval) const {
        return static_cast<uint32_t>(1 + interval);
    }
    uint32_t epoch_index(std::size_t participant, std::size_t interval) const {
        return static_cast<uint32_t>(1 + intervals_.size() + participant * intervals_.size() + interval);
    }

    std::optional<std::size_t> participant_index(const ParticipantId& id) const;
    std::optional<std::size_t> participant_index(const NodeAddress& address) const;

    // Index of the payout edge out of epoch (participant, interval)
    uint32_t payout_edge_index(std::size_t participant, std::size_t interval) const {
        return payout_edges_[participant * intervals_.size() + interval];
    }

    // ConstructionError for the first row that is empty or not stochastic
    void check_rows() const;

    bool operator==(const MarkovProcessGraph& other) const;
    bool operator!=(const MarkovProcessGraph& other) const { return !(*this == other); }

private:
    void index();

    std::vector<MarkovNode> nodes_;
    std::vector<MarkovEdge> edges_;
    IntervalSequence intervals_;
    std::vector<Participant> participants_;
    MarkovParameters parameters_;
    double total_mint_ = 0.0;

    std::unordered_map<NodeAddress, uint32_t> node_index_;
    std::unordered_map<MarkovEdgeAddress, uint32_t, MarkovEdgeAddressHash> edge_index_;
    std::map<ParticipantId, std::size_t> participant_index_;
    std::unordered_map<NodeAddress, std::size_t> participant_address_index_;
    std::vector<uint32_t> row_begin_;
    std::vector<uint32_t> payout_edges_;
};

} // namespace credrank
