#include "credrank/cred_graph.hpp"
#include "credrank/logging.hpp"

namespace credrank {

double DependencyCred::total() const {
    double sum = 0.0;
    for (double c : per_interval) sum += c;
    return sum;
}

std::vector<double> scale_to_total_mint(const std::vector<double>& pi, double total_mint) {
    std::vector<double> scores(pi.size(), 0.0);
    double non_seed = 0.0;
    for (std::size_t i = 0; i < pi.size(); ++i) {
        if (i != MarkovProcessGraph::seed_index()) non_seed += pi[i];
    }
    if (!(total_mint > 0.0) || !(non_seed > 0.0)) {
        return scores;
    }
    const double k = total_mint / non_seed;
    for (std::size_t i = 0; i < pi.size(); ++i) {
        scores[i] = pi[i] * k;
    }
    return scores;
}

CredGraph::CredGraph(std::shared_ptr<const MarkovProcessGraph> mpg,
                     std::vector<double> scores,
                     std::vector<DependencyCred> dependency_cred)
    : mpg_(std::move(mpg))
    , scores_(std::move(scores))
    , dependency_cred_(std::move(dependency_cred)) {
    CREDRANK_CHECK_ARGUMENT(mpg_ != nullptr, "cred graph requires a Markov process graph");
    CREDRANK_CHECK_ARGUMENT(scores_.size() == mpg_->node_count(), "one score per MPG node is required");

    dependency_total_.assign(scores_.size(), 0.0);
    for (const auto& dependency : dependency_cred_) {
        CREDRANK_CHECK_ARGUMENT(dependency.node < scores_.size(), "dependency Cred for an unknown node");
        CREDRANK_CHECK_ARGUMENT(dependency.per_interval.size() == mpg_->intervals().size(),
                                "dependency Cred needs one value per interval");
        dependency_total_[dependency.node] += dependency.total();
    }
}

CredGraph CredGraph::compute(MarkovProcessGraph mpg, const StationaryConfig& config) {
    auto shared = std::make_shared<const MarkovProcessGraph>(std::move(mpg));
    TransitionMatrix matrix = TransitionMatrix::from_markov_process_graph(*shared);
    StationaryResult result = find_stationary_distribution(matrix, config);
    std::vector<double> scores = scale_to_total_mint(result.pi, shared->total_mint());
    return CredGraph(std::move(shared), std::move(scores));
}

std::vector<ScoredNode> CredGraph::nodes() const {
    std::vector<ScoredNode> result;
    result.reserve(scores_.size());
    for (uint32_t i = 0; i < scores_.size(); ++i) {
        const MarkovNode& node = mpg_->nodes()[i];
        result.push_back(ScoredNode{node.address, node.description, node.mint, node.timestamp_ms,
                                    gadget_name(node.gadget), node_cred(i)});
    }
    return result;
}

std::vector<ScoredEdge> CredGraph::edges() const {
    std::vector<ScoredEdge> result;
    result.reserve(mpg_->edge_count());
    const auto& nodes = mpg_->nodes();
    for (uint32_t e = 0; e < mpg_->edge_count(); ++e) {
        const MarkovEdge& edge = mpg_->edges()[e];
        result.push_back(ScoredEdge{edge.address, edge.reversed, nodes[edge.src].address, nodes[edge.dst].address,
                                    edge.transition_probability, gadget_name(edge.gadget), edge_cred_flow(e)});
    }
    return result;
}

double CredGraph::node_cred(uint32_t index) const {
    return scores_[index] + dependency_total_[index];
}

std::optional<double> CredGraph::node_cred(const NodeAddress& address) const {
    if (auto index = mpg_->node_index(address)) {
        return node_cred(*index);
    }
    if (auto participant = mpg_->participant_index(address)) {
        return participant_cred(mpg_->participants()[*participant].id);
    }
    return std::nullopt;
}

double CredGraph::edge_cred_flow(uint32_t edge) const {
    const MarkovEdge& e = mpg_->edges()[edge];
    return scores_[e.src] * e.transition_probability;
}

std::optional<double> CredGraph::edge_cred_flow(const MarkovEdgeAddress& address) const {
    auto index = mpg_->edge_index(address);
    if (!index) return std::nullopt;
    return edge_cred_flow(*index);
}

std::optional<double> CredGraph::edge_cred_flow(const EdgeAddress& address) const {
    auto forward = mpg_->edge_index(MarkovEdgeAddress{address, false});
    auto backward = mpg_->edge_index(MarkovEdgeAddress{address, true});
    if (!forward && !backward) return std::nullopt;

    double flow = 0.0;
    if (forward) flow += edge_cred_flow(*forward);
    if (backward) flow += edge_cred_flow(*backward);
    return flow;
}

std::optional<std::vector<double>> CredGraph::participant_cred_per_interval(const ParticipantId& id) const {
    auto participant = mpg_->participant_index(id);
    if (!participant) return std::nullopt;

    std::vector<double> result(mpg_->intervals().size(), 0.0);
    for (std::size_t k = 0; k < result.size(); ++k) {
        result[k] = edge_cred_flow(mpg_->payout_edge_index(*participant, k));
    }
    return result;
}

std::optional<double> CredGraph::participant_cred(const ParticipantId& id) const {
    auto per_interval = participant_cred_per_interval(id);
    if (!per_interval) return std::nullopt;
    double total = 0.0;
    for (double c : *per_interval) total += c;
    return total;
}

double CredGraph::total_cred() const {
    double total = 0.0;
    for (std::size_t i = 0; i < scores_.size(); ++i) {
        if (i != MarkovProcessGraph::seed_index()) total += scores_[i];
    }
    for (const auto& dependency : dependency_cred_) {
        total += dependency.total();
    }
    return total;
}

CredGraph CredGraph::with_dependency_cred(std::vector<DependencyCred> dependency_cred) const {
    return CredGraph(mpg_, scores_, std::move(dependency_cred));
}

bool CredGraph::operator==(const CredGraph& other) const {
    return *mpg_ == *other.mpg_ && scores_ == other.scores_ && dependency_cred_ == other.dependency_cred_;
}

} // namespace credrank
