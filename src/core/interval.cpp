#include "credrank/interval.hpp"
#include "credrank/logging.hpp"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <limits>

namespace credrank {

static constexpr double INF = std::numeric_limits<double>::infinity();

namespace {

// Floor division that rounds toward negative infinity
TimestampMs floor_div(TimestampMs a, TimestampMs b) {
    TimestampMs q = a / b;
    if ((a % b != 0) && ((a < 0) != (b < 0))) --q;
    return q;
}

} // namespace

bool Interval::is_bounded() const {
    return std::isfinite(start_ms) && std::isfinite(end_ms);
}

IntervalSequence::IntervalSequence(std::vector<Interval> intervals) : intervals_(std::move(intervals)) {
    if (intervals_.empty()) {
        throw ParameterError("interval sequence is empty", __func__);
    }
    for (std::size_t i = 0; i < intervals_.size(); ++i) {
        const Interval& interval = intervals_[i];
        if (std::isnan(interval.start_ms) || std::isnan(interval.end_ms)) {
            throw ParameterError("interval " + std::to_string(i) + " has a NaN bound", __func__);
        }
        if (!(interval.start_ms < interval.end_ms)) {
            throw ParameterError("interval " + std::to_string(i) + " does not have positive length", __func__);
        }
        if (interval.start_ms == INF || interval.end_ms == -INF) {
            throw ParameterError("interval " + std::to_string(i) + " is empty at infinity", __func__);
        }
        if (i > 0 && std::isinf(interval.start_ms)) {
            throw ParameterError("only the first interval may start at -Infinity", __func__);
        }
        if (i + 1 < intervals_.size() && std::isinf(interval.end_ms)) {
            throw ParameterError("only the last interval may end at +Infinity", __func__);
        }
        if (i > 0 && intervals_[i - 1].end_ms != interval.start_ms) {
            throw ParameterError("intervals " + std::to_string(i - 1) + " and " + std::to_string(i) +
                                     " are not contiguous",
                                 __func__);
        }
    }
}

std::optional<std::size_t> IntervalSequence::index_of(double t) const {
    if (intervals_.empty() || std::isnan(t)) return std::nullopt;

    // First interval whose end is past t
    auto it = std::upper_bound(intervals_.begin(), intervals_.end(), t,
                               [](double value, const Interval& interval) { return value < interval.end_ms; });
    if (it == intervals_.end() || !it->contains(t)) return std::nullopt;
    return static_cast<std::size_t>(it - intervals_.begin());
}

std::vector<double> IntervalSequence::starts() const {
    std::vector<double> result;
    result.reserve(intervals_.size());
    for (const auto& interval : intervals_) result.push_back(interval.start_ms);
    return result;
}

IntervalSequence partition_intervals(const std::vector<TimestampMs>& timestamps, TimestampMs width_ms) {
    if (width_ms <= 0) {
        throw ParameterError("interval width must be positive, got " + std::to_string(width_ms), __func__);
    }

    std::vector<Interval> intervals;
    if (timestamps.empty()) {
        intervals.push_back({-INF, 0.0});
        intervals.push_back({0.0, INF});
        return IntervalSequence(std::move(intervals));
    }

    auto [min_it, max_it] = std::minmax_element(timestamps.begin(), timestamps.end());
    TimestampMs first = floor_div(*min_it, width_ms) * width_ms;
    TimestampMs last = (floor_div(*max_it, width_ms) + 1) * width_ms;

    intervals.push_back({-INF, static_cast<double>(first)});
    for (TimestampMs start = first; start < last; start += width_ms) {
        intervals.push_back({static_cast<double>(start), static_cast<double>(start + width_ms)});
    }
    intervals.push_back({static_cast<double>(last), INF});

    LOG_DEBUG("partitioned ", timestamps.size(), " timestamps into ", intervals.size(),
              " intervals of width ", width_ms, "ms");
    return IntervalSequence(std::move(intervals));
}

IntervalSequence graph_intervals(const Graph& graph, TimestampMs width_ms) {
    std::vector<TimestampMs> timestamps;
    timestamps.reserve(graph.edge_count());
    for (const auto& edge : graph.edge_list()) {
        timestamps.push_back(edge.timestamp_ms);
    }
    return partition_intervals(timestamps, width_ms);
}

std::string format_interval_bound(double bound) {
    if (bound == INF) return "Infinity";
    if (bound == -INF) return "-Infinity";
    if (bound == std::floor(bound) && std::fabs(bound) < 9.0e15) {
        return std::to_string(static_cast<long long>(bound));
    }
    std::ostringstream out;
    out << std::setprecision(17) << bound;
    return out.str();
}

} // namespace credrank
