/**
 * @file transport_strategy.hpp
 * @brief Declarative move-type profiles.
 *
 * A TransportStrategy describes one move type: which stages a job runs, which store each
 * side of the move is, what the caller must supply, and whether jobs may run in parallel.
 * Strategies are selected by name from a closed table.
 */

#ifndef TRANSPORT_STRATEGY_HPP
#define TRANSPORT_STRATEGY_HPP

#include "ledger.hpp"
#include "pipeline.hpp"
#include "secret_manager.hpp"
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

/**
 * @brief Which store a side of the move refers to.
 */
enum class StoreRole {
    Control,  ///< The --source store, holding the data the ledger describes.
    Remote,   ///< The --destination store.
    Template  ///< The standard template database on the control host.
};

/**
 * @brief Broad shape of a move.
 */
enum class StrategyProfile {
    StoreToArchive,
    StoreToStore,
    StoreToStoreReverse,
    ArchiveToStore,
    StructureOnly,
    TemplateSeed,
    Diagnostic ///< Jobs always fail; exercises error recording and notification.
};

/**
 * @brief Returns the profile's name ("store-to-archive", ...).
 */
std::string_view strategyProfileName(StrategyProfile profile);

/**
 * @brief Caller parameters of one move.
 */
struct MoveRequest {
    std::string moveType;
    std::string controlHost;
    std::string controlDatabase;
    std::string remoteHost;
    std::string remoteDatabase;
    std::optional<std::string> password;                   ///< Archive secret supplied by the caller.
    std::string version;                                   ///< Release version, production moves.
    std::map<std::string, std::set<std::string>> tables;   ///< Partial restore: schema -> table names.
    std::optional<int> threads;                            ///< Overrides processing_threads.
    std::optional<std::string> archiveSource;              ///< Archive restores: database the archives were taken from.
    std::optional<std::string> archiveMoveType;            ///< Archive restores: only archives written by this move type.
    bool logging = true;                                   ///< Record the run log and the archive log.
};

/**
 * @brief Full description of a strategy, as held in the strategy table.
 */
struct StrategyDefinition {
    std::string moveType;
    StrategyProfile profile;
    std::vector<StageSpec> stages;
    StoreRole extractFrom = StoreRole::Control;
    StoreRole restoreInto = StoreRole::Remote;
    JobSource jobSource = JobSource::JobTable;
    bool parallel = true;
    bool needsRemote = true;
    bool needsObjectStore = false;
    bool needsVersion = false;
    bool needsTableSubset = false;
};

/**
 * @brief A validated move-type profile.
 */
class TransportStrategy {
public:
    /**
     * @brief Builds a strategy from its definition.
     *
     * @throws ConfigurationError If the stage list cannot be replayed through the pipeline's
     * transition table.
     */
    explicit TransportStrategy(StrategyDefinition definition);

    /**
     * @brief Checks that a request carries everything this strategy needs.
     *
     * @param request Caller parameters.
     * @param hasObjectStore Whether an object store is configured.
     * @param hasSecretKey Whether a master key for archive secrets is configured.
     * @throws ConfigurationError Naming the first missing field.
     */
    void validateRequest(const MoveRequest& request, bool hasObjectStore, bool hasSecretKey) const;

    /**
     * @brief Prepares the ledger before jobs are listed.
     *
     * The template-seed profile clears its rows' bookkeeping and re-includes them when
     * the previous run fully succeeded. Other profiles do nothing.
     */
    std::expected<void, std::string> prepareSession(LedgerStore& ledger) const;

    /**
     * @brief Cleans up after all jobs have run.
     *
     * The template-seed profile forgets the control store's archive secret.
     */
    std::expected<void, std::string> cleanupSession(SecretManager& secrets, const MoveRequest& request) const;

    const std::string& moveType() const { return definition.moveType; }
    StrategyProfile profile() const { return definition.profile; }
    const std::vector<StageSpec>& stages() const { return definition.stages; }
    StoreRole extractFrom() const { return definition.extractFrom; }
    StoreRole restoreInto() const { return definition.restoreInto; }
    JobSource jobSource() const { return definition.jobSource; }
    bool parallel() const { return definition.parallel; }
    bool partialRestore() const { return definition.needsTableSubset; }

    /**
     * @brief True when the strategy has a stage of the given kind.
     */
    bool runs(StageKind kind) const;

private:
    StrategyDefinition definition;
};

/**
 * @brief Looks up a strategy by move-type name.
 *
 * @throws ConfigurationError If the name is not a known move type.
 */
TransportStrategy selectStrategy(const std::string& moveType);

/**
 * @brief Lists every known move-type name.
 */
std::vector<std::string> knownMoveTypes();

#endif // TRANSPORT_STRATEGY_HPP
