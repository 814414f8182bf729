/**
 * @file freight_errors.hpp
 * @brief Error taxonomy of the DataFreight mover.
 *
 * Dispatch-level failures (bad configuration, nothing to do) are exceptions thrown before
 * any side effect. Everything that can go wrong inside one job is a value, a Failure,
 * carried through std::expected so it never crosses into a sibling worker.
 */

#ifndef FREIGHT_ERRORS_HPP
#define FREIGHT_ERRORS_HPP

#include <stdexcept>
#include <string>
#include <string_view>

/**
 * @brief Bad or missing required parameter, or an unknown move type.
 */
class ConfigurationError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief The ledger returned no eligible job for the requested move.
 */
class ZeroJobsError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/**
 * @brief Classification of a per-job failure.
 */
enum class ErrorKind {
    ToolExecution,  ///< An external dump/restore/archive tool reported errors.
    Integrity,      ///< A hash or remote tag did not match, or an archive is malformed.
    SecretConflict, ///< Supplied and stored archive secrets differ.
    InvalidState,   ///< A stage was requested from a state it cannot run from.
    Transfer,       ///< Object store upload or download failed.
    Ledger          ///< The ledger could not be read or written.
};

/**
 * @brief Returns a stable name for an error kind ("ToolExecutionError", ...).
 */
std::string_view errorKindName(ErrorKind kind);

/**
 * @brief A per-job failure: what kind, in which stage, and why.
 */
struct Failure {
    ErrorKind kind;
    std::string stage;
    std::string message;

    /**
     * @brief One-line description, "<stage>: <kind>: <message>".
     */
    std::string describe() const;
};

#endif // FREIGHT_ERRORS_HPP
