/**
 * Interval partitioning
 *
 * An IntervalSequence is a contiguous run of half-open [start, end) windows.
 * Bounds are doubles so the sentinel epochs can start at -inf and end at
 * +inf. partition_intervals() derives the canonical sequence from a set of
 * timestamps:
 *
 *   (-inf, first) [first, first+w) ... [last-w, last) [last, +inf)
 *
 * where first = floor(t_min / w) * w and last = (floor(t_max / w) + 1) * w.
 * With no timestamps the sequence is (-inf, 0) [0, +inf).
 */

#pragma once

#include "credrank/graph.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace credrank {

struct Interval {
    double start_ms;
    double end_ms;

    bool contains(double t) const { return start_ms <= t && t < end_ms; }
    bool is_bounded() const;

    bool operator==(const Interval& other) const {
        return start_ms == other.start_ms && end_ms == other.end_ms;
    }
    bool operator!=(const Interval& other) const { return !(*this == other); }
};

class IntervalSequence {
public:
    IntervalSequence() = default;

    // Validates contiguity and bounds; throws ParameterError
    explicit IntervalSequence(std::vector<Interval> intervals);

    std::size_t size() const { return intervals_.size(); }
    bool empty() const { return intervals_.empty(); }
    const Interval& operator[](std::size_t i) const { return intervals_[i]; }
    const Interval& front() const { return intervals_.front(); }
    const Interval& back() const { return intervals_.back(); }

    std::vector<Interval>::const_iterator begin() const { return intervals_.begin(); }
    std::vector<Interval>::const_iterator end() const { return intervals_.end(); }

    // Index of the interval with start <= t < end
    std::optional<std::size_t> index_of(double t) const;

    std::vector<double> starts() const;

    bool operator==(const IntervalSequence& other) const { return intervals_ == other.intervals_; }
    bool operator!=(const IntervalSequence& other) const { return !(*this == other); }

private:
    std::vector<Interval> intervals_;
};

// Throws ParameterError when width_ms <= 0
IntervalSequence partition_intervals(const std::vector<TimestampMs>& timestamps, TimestampMs width_ms);

// Partition over the graph's edge timestamps
IntervalSequence graph_intervals(const Graph& graph, TimestampMs width_ms);

// "Infinity", "-Infinity", or the integral start
std::string format_interval_bound(double bound);

} // namespace credrank
