#include "credrank/credrank.hpp"
#include "credrank/logging.hpp"

#include <chrono>

namespace credrank {

namespace {

template<typename T, typename Fn>
Result<T> capture(const char* operation, Fn&& fn) {
    try {
        return Result<T>::success(fn());
    } catch (const CredRankException& e) {
        LOG_ERROR(operation, " failed: [", error_code_name(e.code()), "] ", e.message());
        return Result<T>::failure(e.code(), e.message());
    }
}

CredGraph run(const Graph& graph,
              const WeightTable& weights,
              const std::vector<PluginDeclaration>& declarations,
              const std::vector<Participant>& participants,
              const MarkovParameters& parameters,
              const IntervalSequence& intervals,
              const CredRankOptions& options) {
    auto start = std::chrono::steady_clock::now();

    check_claims(graph, declarations);
    const WeightEvaluator evaluator(declarations, weights);

    MarkovProcessGraph mpg = MarkovProcessGraph::build(graph, evaluator, intervals, participants, parameters,
                                                       options.attributions);
    CredGraph cred_graph = CredGraph::compute(std::move(mpg), options.solver);
    if (!options.dependencies.empty()) {
        cred_graph = apply_dependency_mint(cred_graph, options.dependencies);
    }

    auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - start);
    LOG_INFO("CredRank over ", graph.node_count(), " nodes and ", graph.edge_count(), " edges: total Cred ",
             cred_graph.total_cred(), " in ", elapsed.count(), " ms");
    return cred_graph;
}

} // namespace

Result<CredGraph> cred_rank(const Graph& graph,
                            const WeightTable& weights,
                            const std::vector<PluginDeclaration>& declarations,
                            const std::vector<Participant>& participants,
                            const MarkovParameters& parameters,
                            const IntervalSequence& intervals,
                            const CredRankOptions& options) {
    return capture<CredGraph>("cred_rank", [&] {
        return run(graph, weights, declarations, participants, parameters, intervals, options);
    });
}

Result<CredGraph> cred_rank(const Graph& graph,
                            const WeightTable& weights,
                            const std::vector<PluginDeclaration>& declarations,
                            const std::vector<Participant>& participants,
                            const MarkovParameters& parameters,
                            TimestampMs interval_width_ms,
                            const CredRankOptions& options) {
    return capture<CredGraph>("cred_rank", [&] {
        IntervalSequence intervals = graph_intervals(graph, interval_width_ms);
        return run(graph, weights, declarations, participants, parameters, intervals, options);
    });
}

Result<CredGraph> cred_rank(const Graph& graph,
                            const std::vector<PluginDeclaration>& declarations,
                            const std::vector<Participant>& participants,
                            const CredRankConfig& config,
                            const PersonalAttributions& attributions) {
    return capture<CredGraph>("cred_rank", [&] {
        config.validate();
        CredRankOptions options;
        options.solver = config.solver;
        options.attributions = attributions;
        options.dependencies = config.dependencies;
        IntervalSequence intervals = graph_intervals(graph, config.interval_width_ms);
        return run(graph, config.weights, declarations, participants, config.parameters, intervals, options);
    });
}

Result<CredGraph> load_snapshot(const std::string& text) {
    return capture<CredGraph>("load_snapshot", [&] { return read_snapshot(text); });
}

Result<std::string> save_snapshot(const CredGraph& cred_graph) {
    return capture<std::string>("save_snapshot", [&] { return write_snapshot(cred_graph); });
}

} // namespace credrank
