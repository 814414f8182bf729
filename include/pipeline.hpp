/**
 * @file pipeline.hpp
 * @brief Per-job pipeline state machine.
 *
 * A Pipeline carries one job from extraction to finalization. Every stage is a transition
 * between named states; a stage may only run from the states listed in the transition
 * table, and a stage requested from any other state fails before touching anything.
 * A failed stage records results='Error' and the stage's error label on the job's ledger
 * row and ends the pipeline in the Failed state. Its scratch directory is kept.
 */

#ifndef PIPELINE_HPP
#define PIPELINE_HPP

#include "archive_tool.hpp"
#include "checksum.hpp"
#include "database_tools.hpp"
#include "freight_errors.hpp"
#include "job.hpp"
#include "ledger.hpp"
#include "object_store.hpp"
#include "secret_manager.hpp"
#include <chrono>
#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief States of a job's pipeline.
 */
enum class PipelineState {
    Created,
    Extracted,
    ContentHashed,
    Archived,
    ArchiveHashed,
    RemoteHashPredicted,
    Uploaded,
    Logged,
    Relocated,
    Restored,
    Finalized,
    Failed
};

/**
 * @brief Returns the state's name ("Created", "Extracted", ...).
 */
std::string_view pipelineStateName(PipelineState state);

/**
 * @brief The stages a pipeline can run.
 */
enum class StageKind {
    Extract,
    Download,
    HashContent,
    Archive,
    Unarchive,
    HashArchive,
    PredictRemoteHash,
    Upload,
    LogResult,
    Restore,
    Relocate,
    Finalize,
    ForceFailure ///< Diagnostic stage that always fails.
};

/**
 * @brief Returns the stage's name ("Extract", "Download", ...).
 */
std::string_view stageName(StageKind stage);

/**
 * @brief Returns the label written to error_message when the stage fails ("Dump Error", ...).
 */
std::string_view stageErrorLabel(StageKind stage);

/**
 * @brief Checks the transition table: may the stage run from this state?
 */
bool stageAllowedFrom(StageKind stage, PipelineState state);

/**
 * @brief Returns the state a successful stage moves the pipeline to.
 */
PipelineState stageTarget(StageKind stage);

/**
 * @brief One entry of a strategy's stage list.
 */
struct StageSpec {
    StageKind kind;
    bool schemaOnly = false; ///< Extract the structure only (Extract stage).
};

/**
 * @brief Replays a stage list through the transition table from Created.
 *
 * @return std::expected<void, std::string> Success, or the first illegal step.
 */
std::expected<void, std::string> validateStageOrder(const std::vector<StageSpec>& stages);

/**
 * @brief External collaborators a pipeline drives.
 *
 * Shared between all pipelines of a dispatch; every collaborator must be safe to call
 * from several worker threads.
 */
struct PipelineServices {
    LedgerStore& ledger;
    SecretManager& secrets;
    DumpTool& dumper;
    RestoreTool& restorer;
    SqlExecutor& sql;
    ArchiveTool& archiver;
    ObjectStore* objectStore = nullptr; ///< Required by Upload and Download only.
};

/**
 * @brief Mutable working data of one pipeline.
 */
struct PipelineData {
    std::filesystem::path scratchDir;   ///< Fresh directory under the configured work directory.
    std::filesystem::path dumpFile;     ///< Extracted (or unarchived) dump.
    std::filesystem::path archiveFile;  ///< Encrypted archive of the dump.
    std::string contentDigest;          ///< MD5 of the dump.
    std::string archiveDigest;          ///< MD5 of the archive.
    std::optional<CompositeHash> remotePrediction; ///< Predicted remote tag of the archive.
    std::string remoteTag;              ///< Tag reported by the object store.
    std::string remoteKey;              ///< Key the archive was uploaded to.
    std::optional<ResolvedSecret> secret; ///< Archive secret, once resolved.
    std::string toolOutput;             ///< Output of every external tool run so far.
    std::size_t dumpErrors = 0;         ///< Failed dump runs.
    std::size_t restoreErrors = 0;      ///< Failed restore runs.
    std::chrono::system_clock::time_point startedAt;
};

/**
 * @brief State machine carrying one job through its stages.
 */
class Pipeline {
public:
    /**
     * @brief Creates a pipeline in the Created state. Nothing is written yet.
     */
    Pipeline(std::shared_ptr<const JobContext> context, PipelineServices services);

    /**
     * @brief Creates the scratch directory and records the job's start_time.
     */
    std::expected<void, Failure> start();

    /**
     * @brief Runs one stage.
     *
     * A stage requested from a state the transition table does not allow fails with
     * ErrorKind::InvalidState and leaves the pipeline and the ledger untouched. Any other
     * failure is recorded on the ledger row and moves the pipeline to Failed.
     */
    std::expected<void, Failure> run(const StageSpec& stage);

    /**
     * @brief Starts the pipeline and runs the stages in order until one fails.
     *
     * @return JobOutcome Success flag, last state reached and the failure, if any.
     */
    JobOutcome execute(const std::vector<StageSpec>& stages);

    PipelineState state() const { return current; }
    const PipelineData& data() const { return artifacts; }

    /**
     * @brief Remote key for an archive: "<move>/<db>/<date>/<prefix>_<move>_[<version>_]<file>".
     */
    static std::string remoteKeyFor(const JobContext& context, const std::string& archiveName);

private:
    std::expected<void, Failure> extract(const StageSpec& stage);
    std::expected<void, Failure> download();
    std::expected<void, Failure> hashContent();
    std::expected<void, Failure> archive();
    std::expected<void, Failure> unarchive();
    std::expected<void, Failure> hashArchive();
    std::expected<void, Failure> predictRemoteHash();
    std::expected<void, Failure> upload();
    std::expected<void, Failure> logResult();
    std::expected<void, Failure> restore();
    std::expected<void, Failure> relocate();
    std::expected<void, Failure> finalize();
    std::expected<void, Failure> forceFailure();

    std::expected<void, Failure> record(StageKind stage, LedgerField field, const std::string& value);
    std::expected<std::string, Failure> acquireSecret(StageKind stage);
    void markFailed(const Failure& failure, std::string_view label);
    void removeArtifacts();

    std::shared_ptr<const JobContext> context;
    PipelineServices services;
    PipelineState current = PipelineState::Created;
    PipelineData artifacts;
};

#endif // PIPELINE_HPP
