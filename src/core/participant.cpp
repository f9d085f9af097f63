#include "credrank/participant.hpp"
#include "credrank/logging.hpp"

#include <algorithm>
#include <set>
#include <unordered_set>

namespace credrank {

static constexpr const char* HEX_DIGITS = "0123456789abcdef";

namespace {

int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // namespace

std::string ParticipantId::to_hex() const {
    std::string out;
    out.reserve(32);
    for (uint8_t b : bytes) {
        out += HEX_DIGITS[b >> 4];
        out += HEX_DIGITS[b & 0x0f];
    }
    return out;
}

ParticipantId ParticipantId::from_hex(const std::string& hex) {
    if (hex.size() != 32) {
        throw InvalidArgumentError("participant id must be 32 hex digits, got '" + hex + "'", __func__);
    }
    ParticipantId id;
    for (std::size_t i = 0; i < 16; ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            throw InvalidArgumentError("participant id has a non-hex digit: '" + hex + "'", __func__);
        }
        id.bytes[i] = static_cast<uint8_t>((hi << 4) | lo);
    }
    return id;
}

std::vector<Participant> sort_participants(std::vector<Participant> participants) {
    std::sort(participants.begin(), participants.end(),
              [](const Participant& a, const Participant& b) { return a.id < b.id; });

    std::unordered_set<NodeAddress> addresses;
    for (std::size_t i = 0; i < participants.size(); ++i) {
        if (i > 0 && participants[i - 1].id == participants[i].id) {
            throw ParameterError("duplicate participant id " + participants[i].id.to_hex(), __func__);
        }
        if (!addresses.insert(participants[i].address).second) {
            throw ParameterError("duplicate participant address " + participants[i].address.display(), __func__);
        }
    }
    return participants;
}

IndexedAttributions::IndexedAttributions(const PersonalAttributions& attributions,
                                         const std::vector<Participant>& participants,
                                         const IntervalSequence& intervals) {
    std::set<ParticipantId> known;
    for (const auto& participant : participants) known.insert(participant.id);

    for (const auto& attribution : attributions) {
        if (!known.count(attribution.from)) {
            throw ParameterError("attribution from unknown participant " + attribution.from.to_hex(), __func__);
        }
        auto& by_recipient = proportions_[attribution.from];

        for (const auto& recipient : attribution.recipients) {
            if (!known.count(recipient.to)) {
                throw ParameterError("attribution to unknown participant " + recipient.to.to_hex(), __func__);
            }
            if (by_recipient.count(recipient.to)) {
                throw ParameterError("duplicate attribution " + attribution.from.to_hex() + " -> " +
                                         recipient.to.to_hex(),
                                     __func__);
            }

            for (std::size_t i = 0; i < recipient.proportions.size(); ++i) {
                const auto& p = recipient.proportions[i];
                if (!(p.proportion >= 0.0 && p.proportion <= 1.0)) {
                    throw ParameterError("attribution proportion " + std::to_string(p.proportion) +
                                             " is outside [0, 1]",
                                         __func__);
                }
                if (i > 0 && recipient.proportions[i - 1].timestamp_ms >= p.timestamp_ms) {
                    throw ParameterError("attribution proportions for " + recipient.to.to_hex() +
                                             " are not in chronological order",
                                         __func__);
                }
            }

            // Latest proportion at or before each interval start
            std::vector<double> per_interval(intervals.size(), 0.0);
            for (std::size_t k = 0; k < intervals.size(); ++k) {
                double start = intervals[k].start_ms;
                for (const auto& p : recipient.proportions) {
                    if (static_cast<double>(p.timestamp_ms) > start) break;
                    per_interval[k] = p.proportion;
                }
            }
            by_recipient.emplace(recipient.to, std::move(per_interval));
        }

        for (std::size_t k = 0; k < intervals.size(); ++k) {
            double sum = sum_proportions(attribution.from, k);
            if (sum > 1.0) {
                throw ParameterError("attributions of " + attribution.from.to_hex() + " sum to " +
                                         std::to_string(sum) + " in the interval starting " +
                                         format_interval_bound(intervals[k].start_ms),
                                     __func__);
            }
        }
    }

    if (!proportions_.empty()) {
        LOG_DEBUG("indexed personal attributions for ", proportions_.size(), " participants");
    }
}

std::vector<std::pair<ParticipantId, double>> IndexedAttributions::recipients(const ParticipantId& from,
                                                                              std::size_t interval) const {
    std::vector<std::pair<ParticipantId, double>> result;
    auto it = proportions_.find(from);
    if (it == proportions_.end()) return result;
    for (const auto& [to, per_interval] : it->second) {
        if (per_interval[interval] > 0.0) result.emplace_back(to, per_interval[interval]);
    }
    return result;
}

double IndexedAttributions::sum_proportions(const ParticipantId& from, std::size_t interval) const {
    auto it = proportions_.find(from);
    if (it == proportions_.end()) return 0.0;
    double sum = 0.0;
    for (const auto& [to, per_interval] : it->second) sum += per_interval[interval];
    return sum;
}

} // namespace credrank
