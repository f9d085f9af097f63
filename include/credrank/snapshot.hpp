/**
 * Cred graph snapshots
 *
 * A snapshot is one YAML document:
 *
 *   type: credrank/credGraph
 *   version: 0.1.0
 *   payload:
 *     parameters: {alpha, beta, gammaForward, gammaBackward}
 *     intervals: [[start, end], ...]
 *     participants: [{address: [parts], description, id: hex}, ...]
 *     nodes: [{address, description, mint, timestampMs, kind, ...}, ...]
 *     edges: [{address, reversed, src, dst, probability, kind, ...}, ...]
 *     scores: [...]
 *     dependencyCred: [{node, perInterval: [...]}, ...]
 *
 * Node and edge order are stored as is. Doubles are written with 17
 * significant digits, so every value reads back bit for bit; infinite
 * interval bounds are written as .inf / -.inf.
 */

#pragma once

#include "credrank/cred_graph.hpp"

#include <string>

namespace credrank {

inline constexpr const char* kSnapshotType = "credrank/credGraph";
inline constexpr const char* kSnapshotVersion = "0.1.0";

struct CompatInfo {
    std::string type;
    std::string version;
};

// Throws SnapshotVersionError unless the type matches and the major version agrees
void check_compat(const CompatInfo& found);

std::string write_snapshot(const CredGraph& cred_graph);

// SnapshotVersionError for foreign documents, MalformedSnapshotError for broken payloads
CredGraph read_snapshot(const std::string& text);

} // namespace credrank
