#include "transport_strategy.hpp"
#include "freight_errors.hpp"
#include <algorithm>
#include <format>

namespace {

const std::vector<StageSpec> kArchiveStages = {
    {StageKind::Extract}, {StageKind::HashContent}, {StageKind::Archive}, {StageKind::HashArchive},
    {StageKind::PredictRemoteHash}, {StageKind::Upload}, {StageKind::LogResult}, {StageKind::Finalize}};

const std::vector<StageSpec> kStoreStages = {
    {StageKind::Extract}, {StageKind::HashContent}, {StageKind::Restore}, {StageKind::Relocate}, {StageKind::Finalize}};

const std::vector<StageSpec> kDownloadStages = {
    {StageKind::Download}, {StageKind::Unarchive}, {StageKind::Restore}, {StageKind::Finalize}};

const std::vector<StageSpec> kStructureStages = {
    {StageKind::Extract, true}, {StageKind::HashContent}, {StageKind::Archive}, {StageKind::HashArchive},
    {StageKind::PredictRemoteHash}, {StageKind::Upload}, {StageKind::Finalize}};

const std::vector<StageSpec> kSeedStages = {
    {StageKind::Extract}, {StageKind::HashContent}, {StageKind::Restore}, {StageKind::Finalize}};

const std::vector<StageSpec> kFailStages = {{StageKind::ForceFailure}, {StageKind::Finalize}};

StrategyDefinition storeToArchive(const std::string& moveType) {
    StrategyDefinition d{moveType, StrategyProfile::StoreToArchive, kArchiveStages};
    d.needsObjectStore = true;
    d.needsVersion = moveType == "production";
    return d;
}

StrategyDefinition storeToStore(const std::string& moveType) {
    return StrategyDefinition{moveType, StrategyProfile::StoreToStore, kStoreStages};
}

std::vector<StrategyDefinition> strategyTable() {
    std::vector<StrategyDefinition> table;
    for (const char* name : {"backup_runner", "backup_lake", "dev_databases", "raw_files", "staging_database", "production"}) {
        table.push_back(storeToArchive(name));
    }
    for (const char* name : {"runner_to_lake", "move_schemas", "process_to_staging"}) {
        table.push_back(storeToStore(name));
    }

    StrategyDefinition reverse{"staging_to_process", StrategyProfile::StoreToStoreReverse, kStoreStages};
    reverse.extractFrom = StoreRole::Remote;
    reverse.restoreInto = StoreRole::Control;
    table.push_back(reverse);

    for (const char* name : {"s3_to_lake", "s3_to_lake_partial"}) {
        StrategyDefinition d{name, StrategyProfile::ArchiveToStore, kDownloadStages};
        d.jobSource = JobSource::ArchiveLog;
        d.parallel = false;
        d.needsObjectStore = true;
        d.needsTableSubset = std::string(name) == "s3_to_lake_partial";
        table.push_back(d);
    }

    StrategyDefinition structure{"structure_backup", StrategyProfile::StructureOnly, kStructureStages};
    structure.needsRemote = false;
    structure.needsObjectStore = true;
    table.push_back(structure);

    StrategyDefinition seed{"build_runner_server", StrategyProfile::TemplateSeed, kSeedStages};
    seed.extractFrom = StoreRole::Template;
    seed.parallel = false;
    table.push_back(seed);

    StrategyDefinition fail{"test_fail", StrategyProfile::Diagnostic, kFailStages};
    fail.needsRemote = false;
    table.push_back(fail);
    return table;
}

} // namespace

std::string_view strategyProfileName(StrategyProfile profile) {
    switch (profile) {
        case StrategyProfile::StoreToArchive: return "store-to-archive";
        case StrategyProfile::StoreToStore: return "store-to-store";
        case StrategyProfile::StoreToStoreReverse: return "store-to-store (reverse)";
        case StrategyProfile::ArchiveToStore: return "archive-to-store";
        case StrategyProfile::StructureOnly: return "structure-only";
        case StrategyProfile::TemplateSeed: return "template-seed";
        case StrategyProfile::Diagnostic: return "diagnostic";
    }
    return "unknown";
}

TransportStrategy::TransportStrategy(StrategyDefinition definition) : definition(std::move(definition)) {
    if (this->definition.moveType.empty()) {
        throw ConfigurationError("Move type not set");
    }
    auto order = validateStageOrder(this->definition.stages);
    if (!order) {
        throw ConfigurationError(std::format("Invalid stage list for {}: {}", this->definition.moveType, order.error()));
    }
}

void TransportStrategy::validateRequest(const MoveRequest& request, bool hasObjectStore, bool hasSecretKey) const {
    const auto& type = definition.moveType;
    if (request.moveType != type) {
        throw ConfigurationError(std::format("Request is for {}, strategy is {}", request.moveType, type));
    }
    if (request.controlHost.empty() || request.controlDatabase.empty()) {
        throw ConfigurationError(std::format("Missing source host or database for {} move", type));
    }
    if (definition.needsRemote && (request.remoteHost.empty() || request.remoteDatabase.empty())) {
        throw ConfigurationError(std::format("Missing destination host or database for {} move", type));
    }
    if (definition.needsVersion && request.version.empty()) {
        throw ConfigurationError(std::format("Version not set for {} run", type));
    }
    if (definition.needsObjectStore && !hasObjectStore) {
        throw ConfigurationError(std::format("No object store configured for {} move", type));
    }
    if ((runs(StageKind::Archive) || runs(StageKind::Unarchive)) && !hasSecretKey) {
        throw ConfigurationError(std::format("secret_key is not configured, required for {} move", type));
    }
    if (definition.needsTableSubset && request.tables.empty()) {
        throw ConfigurationError(std::format("No tables given for {} move", type));
    }
    if (request.password && request.password->empty()) {
        throw ConfigurationError("Password must not be empty");
    }
    if ((request.archiveSource || request.archiveMoveType) && definition.jobSource != JobSource::ArchiveLog) {
        throw ConfigurationError(std::format("Archive selection applies to archive restores, not to {} moves", type));
    }
    if (request.archiveSource && !isValidObjectName(*request.archiveSource)) {
        throw ConfigurationError(std::format("Invalid archive source database: '{}'", *request.archiveSource));
    }
    if (request.archiveMoveType) {
        const auto names = knownMoveTypes();
        if (std::find(names.begin(), names.end(), *request.archiveMoveType) == names.end()) {
            throw ConfigurationError(std::format("Unknown archive move type: {}", *request.archiveMoveType));
        }
    }
}

std::expected<void, std::string> TransportStrategy::prepareSession(LedgerStore& ledger) const {
    if (definition.profile != StrategyProfile::TemplateSeed) {
        return {};
    }
    auto succeeded = ledger.allSucceeded(definition.moveType);
    if (!succeeded) {
        return std::unexpected(succeeded.error());
    }
    return ledger.resetJobs(definition.moveType, *succeeded);
}

std::expected<void, std::string> TransportStrategy::cleanupSession(SecretManager& secrets, const MoveRequest& request) const {
    if (definition.profile != StrategyProfile::TemplateSeed) {
        return {};
    }
    return secrets.forget(request.controlDatabase);
}

bool TransportStrategy::runs(StageKind kind) const {
    return std::any_of(definition.stages.begin(), definition.stages.end(),
                       [kind](const StageSpec& stage) { return stage.kind == kind; });
}

TransportStrategy selectStrategy(const std::string& moveType) {
    for (auto& definition : strategyTable()) {
        if (definition.moveType == moveType) {
            return TransportStrategy(std::move(definition));
        }
    }
    throw ConfigurationError(std::format("Unknown move type: {}", moveType));
}

std::vector<std::string> knownMoveTypes() {
    std::vector<std::string> names;
    for (const auto& definition : strategyTable()) {
        names.push_back(definition.moveType);
    }
    return names;
}
