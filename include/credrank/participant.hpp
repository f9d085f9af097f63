/**
 * Participants and personal attributions
 *
 * A participant is a contribution-graph node that stands for a person.
 * In the Markov process graph it is replaced by one epoch node per
 * interval. Participants are ordered by their 16-byte id.
 *
 * A personal attribution lets participant `from` hand a proportion of each
 * epoch's payout to participant `to`. Proportions change over time: the
 * proportion for an epoch is the latest one whose timestamp is at or before
 * the epoch start.
 */

#pragma once

#include "credrank/address.hpp"
#include "credrank/graph.hpp"
#include "credrank/interval.hpp"

#include <array>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace credrank {

struct ParticipantId {
    std::array<uint8_t, 16> bytes{};

    // 32 lowercase hex digits
    std::string to_hex() const;
    // Throws InvalidArgumentError for anything but 32 hex digits
    static ParticipantId from_hex(const std::string& hex);

    bool operator==(const ParticipantId& other) const { return bytes == other.bytes; }
    bool operator!=(const ParticipantId& other) const { return bytes != other.bytes; }
    bool operator<(const ParticipantId& other) const { return bytes < other.bytes; }
};

struct Participant {
    NodeAddress address;
    std::string description;
    ParticipantId id;

    bool operator==(const Participant& other) const {
        return address == other.address && description == other.description && id == other.id;
    }
};

// Sorted by id; ParameterError on duplicate ids or addresses
std::vector<Participant> sort_participants(std::vector<Participant> participants);

struct AttributionProportion {
    TimestampMs timestamp_ms;
    double proportion;
};

struct AttributionRecipient {
    ParticipantId to;
    std::vector<AttributionProportion> proportions;
};

struct PersonalAttribution {
    ParticipantId from;
    std::vector<AttributionRecipient> recipients;
};

using PersonalAttributions = std::vector<PersonalAttribution>;

/**
 * Validated lookup over personal attributions for a fixed interval sequence.
 */
class IndexedAttributions {
public:
    IndexedAttributions() = default;

    // ParameterError on invalid proportions, ordering, duplicates,
    // unknown participants, or per-epoch sums above 1
    IndexedAttributions(const PersonalAttributions& attributions,
                        const std::vector<Participant>& participants,
                        const IntervalSequence& intervals);

    // (recipient, proportion) pairs with positive proportion, ordered by recipient id
    std::vector<std::pair<ParticipantId, double>> recipients(const ParticipantId& from,
                                                             std::size_t interval) const;

    double sum_proportions(const ParticipantId& from, std::size_t interval) const;

    bool empty() const { return proportions_.empty(); }

private:
    // from -> to -> proportion per interval
    std::map<ParticipantId, std::map<ParticipantId, std::vector<double>>> proportions_;
};

} // namespace credrank
