#pragma once

#include <stdexcept>
#include <string>
#include <cstddef>

namespace credrank {

/**
 * Structured error reporting for the CredRank core.
 *
 * Every failure the core can report is a CredRankException carrying an
 * ErrorCode, a message, and optional context (the throwing function) and
 * suggestion. The public facade turns these into Result<T> values.
 */

enum class ErrorCode {
    // General errors
    SUCCESS = 0,
    INVALID_ARGUMENT = 1,
    CONFIG_ERROR = 2,

    // Graph errors
    DUPLICATE_ADDRESS = 100,
    DANGLING_EDGE = 101,
    MERGE_CONFLICT = 102,

    // Weight and declaration errors
    WEIGHT_CONFLICT = 200,
    UNCLAIMED_ADDRESS = 201,

    // Markov process errors
    PARAMETER_ERROR = 300,
    CONSTRUCTION_ERROR = 301,
    NONCONVERGENT = 302,

    // Dependency mint errors
    POLICY_ERROR = 400,
    UNKNOWN_RECIPIENT = 401,

    // Snapshot errors
    SNAPSHOT_VERSION = 500,
    MALFORMED_SNAPSHOT = 501
};

inline const char* error_code_name(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::SUCCESS:            return "Success";
        case ErrorCode::INVALID_ARGUMENT:   return "InvalidArgument";
        case ErrorCode::CONFIG_ERROR:       return "ConfigError";
        case ErrorCode::DUPLICATE_ADDRESS:  return "DuplicateAddress";
        case ErrorCode::DANGLING_EDGE:      return "DanglingEdge";
        case ErrorCode::MERGE_CONFLICT:     return "MergeConflict";
        case ErrorCode::WEIGHT_CONFLICT:    return "WeightConflict";
        case ErrorCode::UNCLAIMED_ADDRESS:  return "UnclaimedAddress";
        case ErrorCode::PARAMETER_ERROR:    return "ParameterError";
        case ErrorCode::CONSTRUCTION_ERROR: return "ConstructionError";
        case ErrorCode::NONCONVERGENT:      return "Nonconvergent";
        case ErrorCode::POLICY_ERROR:       return "PolicyError";
        case ErrorCode::UNKNOWN_RECIPIENT:  return "UnknownRecipient";
        case ErrorCode::SNAPSHOT_VERSION:   return "SnapshotVersion";
        case ErrorCode::MALFORMED_SNAPSHOT: return "MalformedSnapshot";
    }
    return "Unknown";
}

class CredRankException : public std::runtime_error {
public:
    explicit CredRankException(ErrorCode code, const std::string& message,
                               const std::string& context = "",
                               const std::string& suggestion = "")
        : std::runtime_error(format_message(code, message, context, suggestion))
        , code_(code)
        , message_(message)
        , context_(context)
        , suggestion_(suggestion) {}

    ErrorCode code() const noexcept { return code_; }
    const std::string& message() const noexcept { return message_; }
    const std::string& context() const noexcept { return context_; }
    const std::string& suggestion() const noexcept { return suggestion_; }

private:
    static std::string format_message(ErrorCode code, const std::string& message,
                                      const std::string& context, const std::string& suggestion) {
        std::string result = "CredRank error [" + std::to_string(static_cast<int>(code)) + "]: " + message;
        if (!context.empty()) {
            result += "\nContext: " + context;
        }
        if (!suggestion.empty()) {
            result += "\nSuggestion: " + suggestion;
        }
        return result;
    }

    ErrorCode code_;
    std::string message_;
    std::string context_;
    std::string suggestion_;
};

// Convenience exception types
#define CREDRANK_DEFINE_ERROR(Name, Code)                                        \
    class Name : public CredRankException {                                      \
    public:                                                                      \
        explicit Name(const std::string& message,                                \
                      const std::string& context = "",                           \
                      const std::string& suggestion = "")                        \
            : CredRankException(Code, message, context, suggestion) {}           \
    };

CREDRANK_DEFINE_ERROR(InvalidArgumentError, ErrorCode::INVALID_ARGUMENT)
CREDRANK_DEFINE_ERROR(ConfigError, ErrorCode::CONFIG_ERROR)
CREDRANK_DEFINE_ERROR(DuplicateAddressError, ErrorCode::DUPLICATE_ADDRESS)
CREDRANK_DEFINE_ERROR(DanglingEdgeError, ErrorCode::DANGLING_EDGE)
CREDRANK_DEFINE_ERROR(MergeConflictError, ErrorCode::MERGE_CONFLICT)
CREDRANK_DEFINE_ERROR(WeightConflictError, ErrorCode::WEIGHT_CONFLICT)
CREDRANK_DEFINE_ERROR(UnclaimedAddressError, ErrorCode::UNCLAIMED_ADDRESS)
CREDRANK_DEFINE_ERROR(ParameterError, ErrorCode::PARAMETER_ERROR)
CREDRANK_DEFINE_ERROR(PolicyError, ErrorCode::POLICY_ERROR)
CREDRANK_DEFINE_ERROR(UnknownRecipientError, ErrorCode::UNKNOWN_RECIPIENT)
CREDRANK_DEFINE_ERROR(SnapshotVersionError, ErrorCode::SNAPSHOT_VERSION)
CREDRANK_DEFINE_ERROR(MalformedSnapshotError, ErrorCode::MALFORMED_SNAPSHOT)

#undef CREDRANK_DEFINE_ERROR

// A row of the transition matrix failed its checks
class ConstructionError : public CredRankException {
public:
    ConstructionError(std::size_t row, const std::string& message,
                      const std::string& context = "")
        : CredRankException(ErrorCode::CONSTRUCTION_ERROR,
                            "row " + std::to_string(row) + ": " + message, context)
        , row_(row) {}

    std::size_t row() const noexcept { return row_; }

private:
    std::size_t row_;
};

class NonconvergentError : public CredRankException {
public:
    NonconvergentError(double delta, int iterations, const std::string& context = "")
        : CredRankException(ErrorCode::NONCONVERGENT,
                            "power iteration did not converge after " + std::to_string(iterations) +
                                " iterations (delta " + std::to_string(delta) + ")",
                            context,
                            "raise solver.max_iterations or solver.damping")
        , delta_(delta)
        , iterations_(iterations) {}

    double delta() const noexcept { return delta_; }
    int iterations() const noexcept { return iterations_; }

private:
    double delta_;
    int iterations_;
};

// Macros for common error checking
#define CREDRANK_CHECK_ARGUMENT(condition, message) \
    do { if (!(condition)) throw credrank::InvalidArgumentError(message, __func__); } while (0)

} // namespace credrank
