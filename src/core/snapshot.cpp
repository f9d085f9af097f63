#include "credrank/snapshot.hpp"
#include "credrank/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <limits>

namespace credrank {

static constexpr std::size_t DOUBLE_DIGITS = std::numeric_limits<double>::max_digits10;

namespace {

std::string major_version(const std::string& version) {
    return version.substr(0, version.find('.'));
}

// =============================================================================
// Writing
// =============================================================================

template<typename Tag>
void emit_address(YAML::Emitter& out, const Address<Tag>& address) {
    out << YAML::Flow << YAML::BeginSeq;
    address.for_each_part([&out](std::string_view part) { out << std::string(part); });
    out << YAML::EndSeq;
}

struct NodeGadgetFields {
    YAML::Emitter& out;

    void operator()(const gadget::Seed&) const {}
    void operator()(const gadget::Organic&) const {}
    void operator()(const gadget::Accumulator& g) const {
        out << YAML::Key << "interval" << YAML::Value << g.interval;
    }
    void operator()(const gadget::Epoch& g) const {
        out << YAML::Key << "participant" << YAML::Value << g.participant;
        out << YAML::Key << "interval" << YAML::Value << g.interval;
    }
};

struct EdgeGadgetFields {
    YAML::Emitter& out;

    void operator()(const gadget::Contribution&) const {}
    void operator()(const gadget::Mint&) const {}
    void operator()(const gadget::Radiation&) const {}
    void operator()(const gadget::Payout& g) const {
        out << YAML::Key << "participant" << YAML::Value << g.participant;
        out << YAML::Key << "interval" << YAML::Value << g.interval;
    }
    void operator()(const gadget::Webbing& g) const {
        out << YAML::Key << "participant" << YAML::Value << g.participant;
        out << YAML::Key << "earlier" << YAML::Value << g.earlier;
    }
    void operator()(const gadget::Attribution& g) const {
        out << YAML::Key << "from" << YAML::Value << g.from;
        out << YAML::Key << "to" << YAML::Value << g.to;
        out << YAML::Key << "interval" << YAML::Value << g.interval;
    }
};

void emit_payload(YAML::Emitter& out, const CredGraph& cred_graph) {
    const MarkovProcessGraph& mpg = cred_graph.mpg();
    const MarkovParameters& parameters = mpg.parameters();

    out << YAML::BeginMap;

    out << YAML::Key << "parameters" << YAML::Value << YAML::BeginMap;
    out << YAML::Key << "alpha" << YAML::Value << parameters.alpha;
    out << YAML::Key << "beta" << YAML::Value << parameters.beta;
    out << YAML::Key << "gammaForward" << YAML::Value << parameters.gamma_forward;
    out << YAML::Key << "gammaBackward" << YAML::Value << parameters.gamma_backward;
    out << YAML::EndMap;

    out << YAML::Key << "intervals" << YAML::Value << YAML::BeginSeq;
    for (const auto& interval : mpg.intervals()) {
        out << YAML::Flow << YAML::BeginSeq << interval.start_ms << interval.end_ms << YAML::EndSeq;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "participants" << YAML::Value << YAML::BeginSeq;
    for (const auto& participant : mpg.participants()) {
        out << YAML::BeginMap;
        out << YAML::Key << "address" << YAML::Value;
        emit_address(out, participant.address);
        out << YAML::Key << "description" << YAML::Value << participant.description;
        out << YAML::Key << "id" << YAML::Value << participant.id.to_hex();
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "nodes" << YAML::Value << YAML::BeginSeq;
    for (const auto& node : mpg.nodes()) {
        out << YAML::BeginMap;
        out << YAML::Key << "address" << YAML::Value;
        emit_address(out, node.address);
        out << YAML::Key << "description" << YAML::Value << node.description;
        out << YAML::Key << "mint" << YAML::Value << node.mint;
        out << YAML::Key << "timestampMs" << YAML::Value;
        if (node.timestamp_ms) {
            out << static_cast<long long>(*node.timestamp_ms);
        } else {
            out << YAML::Null;
        }
        out << YAML::Key << "kind" << YAML::Value << gadget_name(node.gadget);
        std::visit(NodeGadgetFields{out}, node.gadget);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "edges" << YAML::Value << YAML::BeginSeq;
    for (const auto& edge : mpg.edges()) {
        out << YAML::BeginMap;
        out << YAML::Key << "address" << YAML::Value;
        emit_address(out, edge.address);
        out << YAML::Key << "reversed" << YAML::Value << edge.reversed;
        out << YAML::Key << "src" << YAML::Value << edge.src;
        out << YAML::Key << "dst" << YAML::Value << edge.dst;
        out << YAML::Key << "probability" << YAML::Value << edge.transition_probability;
        out << YAML::Key << "kind" << YAML::Value << gadget_name(edge.gadget);
        std::visit(EdgeGadgetFields{out}, edge.gadget);
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::Key << "scores" << YAML::Value << YAML::Flow << cred_graph.scores();

    out << YAML::Key << "dependencyCred" << YAML::Value << YAML::BeginSeq;
    for (const auto& dependency : cred_graph.dependency_cred()) {
        out << YAML::BeginMap;
        out << YAML::Key << "node" << YAML::Value << dependency.node;
        out << YAML::Key << "perInterval" << YAML::Value << YAML::Flow << dependency.per_interval;
        out << YAML::EndMap;
    }
    out << YAML::EndSeq;

    out << YAML::EndMap;
}

// =============================================================================
// Reading
// =============================================================================

template<typename Tag>
Address<Tag> read_address(const YAML::Node& node) {
    if (!node.IsSequence()) {
        throw MalformedSnapshotError("address is not a sequence of parts", "read_snapshot");
    }
    return Address<Tag>::from_parts(node.as<std::vector<std::string>>());
}

YAML::Node require(const YAML::Node& parent, const char* key) {
    const YAML::Node child = parent[key];
    if (!child) {
        throw MalformedSnapshotError(std::string("missing field '") + key + "'", "read_snapshot");
    }
    return child;
}

NodeGadget read_node_gadget(const YAML::Node& node) {
    const std::string kind = require(node, "kind").as<std::string>();
    if (kind == "seed") return gadget::Seed{};
    if (kind == "organic") return gadget::Organic{};
    if (kind == "accumulator") return gadget::Accumulator{require(node, "interval").as<uint32_t>()};
    if (kind == "epoch") {
        return gadget::Epoch{require(node, "participant").as<uint32_t>(), require(node, "interval").as<uint32_t>()};
    }
    throw MalformedSnapshotError("unknown node kind '" + kind + "'", "read_snapshot");
}

EdgeGadget read_edge_gadget(const YAML::Node& edge) {
    const std::string kind = require(edge, "kind").as<std::string>();
    if (kind == "contribution") return gadget::Contribution{};
    if (kind == "mint") return gadget::Mint{};
    if (kind == "radiation") return gadget::Radiation{};
    if (kind == "payout") {
        return gadget::Payout{require(edge, "participant").as<uint32_t>(), require(edge, "interval").as<uint32_t>()};
    }
    if (kind == "webbing") {
        return gadget::Webbing{require(edge, "participant").as<uint32_t>(), require(edge, "earlier").as<uint32_t>()};
    }
    if (kind == "attribution") {
        return gadget::Attribution{require(edge, "from").as<uint32_t>(), require(edge, "to").as<uint32_t>(),
                                   require(edge, "interval").as<uint32_t>()};
    }
    throw MalformedSnapshotError("unknown edge kind '" + kind + "'", "read_snapshot");
}

CredGraph read_payload(const YAML::Node& payload) {
    const YAML::Node params = require(payload, "parameters");
    MarkovParameters parameters;
    parameters.alpha = require(params, "alpha").as<double>();
    parameters.beta = require(params, "beta").as<double>();
    parameters.gamma_forward = require(params, "gammaForward").as<double>();
    parameters.gamma_backward = require(params, "gammaBackward").as<double>();

    std::vector<Interval> intervals;
    for (const auto& entry : require(payload, "intervals")) {
        if (!entry.IsSequence() || entry.size() != 2) {
            throw MalformedSnapshotError("interval is not a [start, end] pair", "read_snapshot");
        }
        intervals.push_back(Interval{entry[0].as<double>(), entry[1].as<double>()});
    }

    std::vector<Participant> participants;
    for (const auto& entry : require(payload, "participants")) {
        participants.push_back(Participant{read_address<NodeAddressTag>(require(entry, "address")),
                                           require(entry, "description").as<std::string>(),
                                           ParticipantId::from_hex(require(entry, "id").as<std::string>())});
    }

    std::vector<MarkovNode> nodes;
    for (const auto& entry : require(payload, "nodes")) {
        MarkovNode node;
        node.address = read_address<NodeAddressTag>(require(entry, "address"));
        node.description = require(entry, "description").as<std::string>();
        node.mint = require(entry, "mint").as<double>();
        const YAML::Node timestamp = require(entry, "timestampMs");
        if (!timestamp.IsNull()) {
            node.timestamp_ms = static_cast<TimestampMs>(timestamp.as<long long>());
        }
        node.gadget = read_node_gadget(entry);
        nodes.push_back(std::move(node));
    }

    std::vector<MarkovEdge> edges;
    for (const auto& entry : require(payload, "edges")) {
        MarkovEdge edge;
        edge.address = read_address<EdgeAddressTag>(require(entry, "address"));
        edge.reversed = require(entry, "reversed").as<bool>();
        edge.src = require(entry, "src").as<uint32_t>();
        edge.dst = require(entry, "dst").as<uint32_t>();
        edge.transition_probability = require(entry, "probability").as<double>();
        edge.gadget = read_edge_gadget(entry);
        edges.push_back(std::move(edge));
    }

    std::vector<double> scores = require(payload, "scores").as<std::vector<double>>();

    std::vector<DependencyCred> dependency_cred;
    for (const auto& entry : require(payload, "dependencyCred")) {
        dependency_cred.push_back(DependencyCred{require(entry, "node").as<uint32_t>(),
                                                 require(entry, "perInterval").as<std::vector<double>>()});
    }

    auto mpg = std::make_shared<const MarkovProcessGraph>(
        MarkovProcessGraph::from_parts(std::move(nodes), std::move(edges), IntervalSequence(std::move(intervals)),
                                       std::move(participants), parameters));
    return CredGraph(std::move(mpg), std::move(scores), std::move(dependency_cred));
}

} // namespace

void check_compat(const CompatInfo& found) {
    if (found.type != kSnapshotType) {
        throw SnapshotVersionError("expected snapshot type '" + std::string(kSnapshotType) + "', found '" +
                                       found.type + "'",
                                   __func__);
    }
    if (major_version(found.version) != major_version(kSnapshotVersion)) {
        throw SnapshotVersionError("snapshot version " + found.version + " is incompatible with " +
                                       kSnapshotVersion,
                                   __func__, "regenerate the snapshot with a matching release");
    }
}

std::string write_snapshot(const CredGraph& cred_graph) {
    YAML::Emitter out;
    out.SetDoublePrecision(DOUBLE_DIGITS);

    out << YAML::BeginMap;
    out << YAML::Key << "type" << YAML::Value << kSnapshotType;
    out << YAML::Key << "version" << YAML::Value << kSnapshotVersion;
    out << YAML::Key << "payload" << YAML::Value;
    emit_payload(out, cred_graph);
    out << YAML::EndMap;

    if (!out.good()) {
        throw InvalidArgumentError("failed to emit snapshot: " + out.GetLastError(), __func__);
    }
    LOG_DEBUG("wrote snapshot of ", cred_graph.mpg().node_count(), " nodes and ", cred_graph.mpg().edge_count(),
              " edges (", out.size(), " bytes)");
    return out.c_str();
}

CredGraph read_snapshot(const std::string& text) {
    YAML::Node document;
    CompatInfo compat;
    try {
        document = YAML::Load(text);
        if (!document.IsMap() || !document["type"] || !document["version"]) {
            throw MalformedSnapshotError("snapshot has no type/version header", __func__);
        }
        compat.type = document["type"].as<std::string>();
        compat.version = document["version"].as<std::string>();
    } catch (const YAML::Exception& e) {
        throw MalformedSnapshotError(std::string("unreadable snapshot: ") + e.what(), __func__);
    }

    check_compat(compat);

    try {
        return read_payload(require(document, "payload"));
    } catch (const YAML::Exception& e) {
        throw MalformedSnapshotError(std::string("invalid snapshot payload: ") + e.what(), __func__);
    } catch (const MalformedSnapshotError&) {
        throw;
    } catch (const CredRankException& e) {
        throw MalformedSnapshotError("inconsistent snapshot payload: " + e.message(), __func__);
    }
}

std::string CredGraph::to_snapshot() const {
    return write_snapshot(*this);
}

CredGraph CredGraph::from_snapshot(const std::string& text) {
    return read_snapshot(text);
}

} // namespace credrank
