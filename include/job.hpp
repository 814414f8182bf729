/**
 * @file job.hpp
 * @brief Units of work handed from the ledger to the worker pool.
 *
 * A JobDescriptor is what the ledger stores. A JobContext is the resolved, immutable
 * unit of work built once per dispatch; workers only ever see it through a shared
 * pointer to const. JobOutcome and AggregateResult carry the results back.
 */

#ifndef JOB_HPP
#define JOB_HPP

#include "freight_config.hpp"
#include <cstddef>
#include <memory>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Kind of data object addressed by a job.
 */
enum class ObjectKind {
    Table,
    Schema
};

/**
 * @brief Returns "table" or "schema".
 */
std::string_view objectKindName(ObjectKind kind);

/**
 * @brief Parses "table" or "schema".
 *
 * @return std::optional<ObjectKind> The kind, or std::nullopt for any other name.
 */
std::optional<ObjectKind> parseObjectKind(std::string_view name);

/**
 * @brief Checks that a name is a plain identifier with at most one dotted member.
 *
 * Accepts "schema" and "schema.table"; rejects quoting, whitespace and anything that would
 * need escaping in SQL or on a command line.
 */
bool isValidObjectName(std::string_view name);

/**
 * @brief A job row as stored in the ledger.
 */
struct JobDescriptor {
    int id = 0;                                   ///< Ledger row id.
    std::string objectName;                       ///< "container" or "container.member".
    ObjectKind kind = ObjectKind::Schema;         ///< Table or schema job.
    std::optional<std::string> destinationSchema; ///< Schema to move the object to after restore.
    bool included = true;                         ///< Inclusion flag ('Y').
    int sequence = 0;                             ///< Ordering hint.
    std::optional<std::string> archiveLocation;   ///< Remote key, archive-log jobs only.
    std::optional<std::string> sealedSecret;      ///< Encrypted archive secret, archive-log jobs only.
};

/**
 * @brief Resolved, immutable unit of work for one job in one dispatch.
 */
struct JobContext {
    int jobId = 0;
    std::string objectName;
    ObjectKind kind = ObjectKind::Schema;
    std::optional<std::string> destinationSchema;
    std::string moveType;                               ///< Move-type name of the strategy.
    std::string runDate;                                ///< Dispatch start date, YYYYMMDD.
    ConnectionDescriptor source;                        ///< Store the object is extracted from.
    std::optional<ConnectionDescriptor> destination;    ///< Store the object is restored into.
    std::optional<std::set<std::string>> tableSubset;   ///< Tables restored by a partial restore.
    std::optional<std::string> archiveLocation;         ///< Remote key to download.
    std::optional<std::string> secretCandidate;         ///< Caller-supplied archive secret.
    std::optional<std::string> sealedSecret;            ///< Encrypted secret of the archive to download.
    std::string secretOwner;                            ///< Key under which the archive secret is kept.
    std::string version;                                ///< Release version (production moves).
    bool retainInclusion = false;                       ///< Leave include_flag='Y' after success.
    bool logArchive = true;                             ///< Append uploaded archives to the archive log.
    std::shared_ptr<const FreightConfig> config;        ///< Configuration snapshot.

    /**
     * @brief Short label for log lines, "<id>:<object>".
     */
    std::string label() const;
};

/**
 * @brief Result of running one job's pipeline.
 */
struct JobOutcome {
    int jobId = 0;
    std::string objectName;
    bool success = false;
    std::string finalState; ///< Name of the last pipeline state reached.
    std::string error;      ///< Failure description, empty on success.
};

/**
 * @brief Aggregate of all outcomes of one dispatch.
 */
struct AggregateResult {
    std::vector<JobOutcome> outcomes;
    std::size_t skipped = 0; ///< Jobs left out by a partial restore.

    std::size_t attempted() const { return outcomes.size(); }
    std::size_t succeeded() const;
    std::size_t failed() const { return attempted() - succeeded(); }

    /**
     * @brief True when every attempted job succeeded.
     */
    bool ok() const { return failed() == 0 && attempted() > 0; }

    /**
     * @brief Multi-line human-readable summary, one line per failed job.
     */
    std::string summary(const std::string& moveType) const;
};

#endif // JOB_HPP
