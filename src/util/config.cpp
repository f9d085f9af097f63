#include "credrank/config.hpp"
#include "credrank/logging.hpp"

#include <yaml-cpp/yaml.h>

#include <cstdlib>
#include <stdexcept>

namespace credrank {

namespace {

template<typename Tag>
Address<Tag> parse_address(const YAML::Node& node) {
    if (!node || !node.IsSequence()) {
        throw ConfigError("address must be a sequence of parts", "load_config");
    }
    return Address<Tag>::from_parts(node.as<std::vector<std::string>>());
}

void parse_parameters(const YAML::Node& node, MarkovParameters& parameters) {
    if (node["alpha"]) parameters.alpha = node["alpha"].as<double>();
    if (node["beta"]) parameters.beta = node["beta"].as<double>();
    if (node["gamma_forward"]) parameters.gamma_forward = node["gamma_forward"].as<double>();
    if (node["gamma_backward"]) parameters.gamma_backward = node["gamma_backward"].as<double>();
}

void parse_solver(const YAML::Node& node, StationaryConfig& solver) {
    if (node["convergence_threshold"]) solver.convergence_threshold = node["convergence_threshold"].as<double>();
    if (node["max_iterations"]) solver.max_iterations = node["max_iterations"].as<int>();
    if (node["damping"]) solver.damping = node["damping"].as<double>();
    if (node["num_threads"]) solver.num_threads = node["num_threads"].as<int>();
    if (node["verbose"]) solver.verbose = node["verbose"].as<bool>();
}

void parse_weights(const YAML::Node& node, WeightTable& weights) {
    for (const auto& entry : node["nodes"]) {
        NodeAddress address = parse_address<NodeAddressTag>(entry["address"]);
        double weight = entry["weight"].as<double>();
        if (!weights.node_weights.emplace(address, weight).second) {
            throw ConfigError("node weight for " + address.display() + " given twice", "load_config");
        }
    }
    for (const auto& entry : node["edges"]) {
        EdgeAddress address = parse_address<EdgeAddressTag>(entry["address"]);
        EdgeWeight weight;
        if (entry["forwards"]) weight.forwards = entry["forwards"].as<double>();
        if (entry["backwards"]) weight.backwards = entry["backwards"].as<double>();
        if (!weights.edge_weights.emplace(address, weight).second) {
            throw ConfigError("edge weight for " + address.display() + " given twice", "load_config");
        }
    }
}

std::vector<DependencyMintPolicy> parse_dependencies(const YAML::Node& node) {
    std::vector<DependencyMintPolicy> policies;
    for (const auto& entry : node) {
        DependencyMintPolicy policy;
        policy.address = parse_address<NodeAddressTag>(entry["address"]);
        for (const auto& period : entry["periods"]) {
            policy.periods.push_back(
                DependencyMintPeriod{period["start_ms"].as<double>(), period["weight"].as<double>()});
        }
        policies.push_back(std::move(policy));
    }
    return policies;
}

CredRankConfig parse_config(const YAML::Node& yaml) {
    CredRankConfig config;
    if (yaml.IsNull()) return config;
    if (!yaml.IsMap()) {
        throw ConfigError("configuration must be a YAML mapping", "load_config");
    }

    if (yaml["parameters"]) parse_parameters(yaml["parameters"], config.parameters);
    if (yaml["interval_width_ms"]) config.interval_width_ms = yaml["interval_width_ms"].as<TimestampMs>();
    if (yaml["solver"]) parse_solver(yaml["solver"], config.solver);
    if (yaml["weights"]) parse_weights(yaml["weights"], config.weights);
    if (yaml["dependencies"]) config.dependencies = parse_dependencies(yaml["dependencies"]);

    if (yaml["logging"]) {
        const auto& log = yaml["logging"];
        if (log["level"]) config.logging.level = log["level"].as<std::string>();
        if (log["file"]) config.logging.file = log["file"].as<std::string>();
    }
    return config;
}

template<typename T, typename Parse>
void override_from_env(const char* name, T& target, Parse parse) {
    const char* value = std::getenv(name);
    if (!value || !*value) return;
    try {
        target = parse(value);
    } catch (const std::logic_error&) {
        LOG_WARN("Failed to parse ", name, "='", value, "', keeping ", target);
    }
}

} // namespace

void CredRankConfig::validate() const {
    parameters.validate();
    solver.validate();
    if (interval_width_ms <= 0) {
        throw ParameterError("interval width must be positive, got " + std::to_string(interval_width_ms),
                             __func__);
    }
    validate_weights(weights);
    for (const auto& policy : dependencies) {
        validate_policy(policy);
    }
    parse_log_level(logging.level);
}

CredRankConfig load_config_from_string(const std::string& text) {
    CredRankConfig config;
    try {
        config = parse_config(YAML::Load(text));
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid configuration: ") + e.what(), __func__);
    }
    config.validate();
    return config;
}

CredRankConfig load_config(const std::string& path) {
    CredRankConfig config;
    try {
        config = parse_config(YAML::LoadFile(path));
    } catch (const YAML::BadFile&) {
        throw ConfigError("cannot read configuration file " + path, __func__, "check the path");
    } catch (const YAML::Exception& e) {
        throw ConfigError("invalid configuration in " + path + ": " + e.what(), __func__);
    }
    config.validate();
    LOG_INFO("Loaded configuration from ", path);
    return config;
}

void apply_env_overrides(CredRankConfig& config) {
    if (const char* level = std::getenv("CREDRANK_LOG_LEVEL"); level && *level) {
        try {
            parse_log_level(level);
            config.logging.level = level;
        } catch (const ConfigError& e) {
            LOG_WARN(e.message(), ", keeping log level ", config.logging.level);
        }
    }
    override_from_env("CREDRANK_MAX_ITERATIONS", config.solver.max_iterations,
                      [](const char* v) { return std::stoi(v); });
    override_from_env("CREDRANK_CONVERGENCE_THRESHOLD", config.solver.convergence_threshold,
                      [](const char* v) { return std::stod(v); });
    override_from_env("CREDRANK_NUM_THREADS", config.solver.num_threads,
                      [](const char* v) { return std::stoi(v); });
}

void apply_logging_config(const LoggingConfig& logging) {
    set_log_level(parse_log_level(logging.level));
    if (!logging.file.empty()) {
        set_log_file(logging.file);
    }
}

} // namespace credrank
