/**
 * @file dispatcher.hpp
 * @brief Fans the eligible jobs of one move out to the worker pool.
 *
 * The dispatcher validates the request, resolves connections, lists the eligible jobs
 * from the ledger, builds one immutable JobContext per job and runs each context's
 * pipeline on a worker. A failing job never stops its siblings; the aggregate result
 * reports every outcome.
 */

#ifndef DISPATCHER_HPP
#define DISPATCHER_HPP

#include "job.hpp"
#include "notification.hpp"
#include "pipeline.hpp"
#include "transport_strategy.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

class JobDispatcher {
public:
    /**
     * @brief Constructs a dispatcher.
     *
     * @param config Configuration snapshot shared with every job.
     * @param services Collaborators handed to every pipeline.
     * @param notifier Optional channel receiving the run summary.
     */
    JobDispatcher(std::shared_ptr<const FreightConfig> config, PipelineServices services,
                  NotificationStrategy* notifier = nullptr);

    /**
     * @brief Runs every eligible job of a move.
     *
     * Unless the request turns logging off, the run is bracketed by a run log entry that
     * is closed with the summary, or with the error that stopped the run.
     *
     * @param strategy Profile of the move type.
     * @param request Caller parameters.
     * @return AggregateResult One outcome per attempted job, plus the partial-restore skip count.
     * @throws ConfigurationError If the request is incomplete or names a malformed table.
     * @throws ZeroJobsError If no job is eligible, or every job was skipped.
     * @throws std::runtime_error If the ledger cannot be prepared or read.
     */
    AggregateResult dispatch(const TransportStrategy& strategy, const MoveRequest& request);

    /**
     * @brief The ledger query a move lists its jobs with.
     */
    static JobQuery queryFor(const TransportStrategy& strategy, const MoveRequest& request);

    /**
     * @brief Builds the job contexts of a move from the listed jobs.
     *
     * Partial restores leave out jobs whose object is not in the table subset and count
     * them in @p skipped. A job row with a malformed object or schema name gets no context;
     * it is returned as a failed outcome in @p rejected instead.
     *
     * @throws ConfigurationError If a connection cannot be resolved or a requested table name is malformed.
     */
    std::vector<std::shared_ptr<const JobContext>> buildContexts(const TransportStrategy& strategy,
                                                                 const MoveRequest& request,
                                                                 const std::vector<JobDescriptor>& jobs,
                                                                 std::size_t& skipped,
                                                                 std::vector<JobOutcome>& rejected) const;

    /**
     * @brief Step name of a dispatch in the run log, "<move> <host>.<db>[ -> <host>.<db>]".
     */
    static std::string describeRun(const TransportStrategy& strategy, const MoveRequest& request);

    /// Ledger error_message of a job row whose names cannot be passed to a tool.
    static constexpr const char* kInvalidObjectLabel = "Invalid Object";
    /// Section of every run log entry written by a dispatch.
    static constexpr const char* kRunSection = "MoveData";

private:
    struct Stores {
        ConnectionDescriptor source;
        std::optional<ConnectionDescriptor> destination;
    };

    Stores resolveStores(const TransportStrategy& strategy, const MoveRequest& request) const;
    int workerCountFor(const TransportStrategy& strategy, const MoveRequest& request) const;
    AggregateResult runBatch(const TransportStrategy& strategy, const MoveRequest& request, int workers);
    void closeRunStep(std::optional<int> runStep, const std::string& results, const std::string& detail) const;
    void recordRejected(const JobOutcome& outcome) const;
    JobOutcome runJob(const TransportStrategy& strategy, const std::shared_ptr<const JobContext>& context) const;
    void report(const TransportStrategy& strategy, const AggregateResult& result) const;

    std::shared_ptr<const FreightConfig> config;
    PipelineServices services;
    NotificationStrategy* notifier;
};

#endif // DISPATCHER_HPP
