/**
 * @file freight_api.hpp
 * @brief High-level API for the DataFreight mover.
 *
 * Wires the configuration, ledger, tools, object store and notification channel
 * together and runs one move, or plans a job on the ledger. This is the entry point for
 * the command line and for any other caller.
 *
 * @note The configuration file names the ledger, so one file describes one installation.
 */

#ifndef FREIGHT_API_HPP
#define FREIGHT_API_HPP

#include "job.hpp"
#include "transport_strategy.hpp"
#include <expected>
#include <string>

/**
 * @brief API for running moves.
 */
class FreightAPI {
public:
    /**
     * @brief Runs every eligible job of a move.
     *
     * @param configFile Path to the JSON configuration.
     * @param request Move type and caller parameters.
     * @return std::expected<AggregateResult, std::string> Per-job outcomes, or why the move
     * could not start (bad configuration, no jobs, unreadable ledger).
     */
    static std::expected<AggregateResult, std::string> runMove(const std::string& configFile, const MoveRequest& request);

    /**
     * @brief Plans a job on the ledger.
     *
     * @param configFile Path to the JSON configuration.
     * @param moveType Move type the job belongs to.
     * @param sourceDatabase Control database of the job.
     * @param job Object, kind and optional destination schema.
     * @return std::expected<int, std::string> New job id or an error message.
     */
    static std::expected<int, std::string> planJob(const std::string& configFile, const std::string& moveType,
                                                   const std::string& sourceDatabase, const JobDescriptor& job);
};

#endif // FREIGHT_API_HPP
