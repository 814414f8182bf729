#include "pipeline.hpp"
#include <algorithm>
#include <cstdlib>
#include <format>
#include <stdexcept>

namespace fs = std::filesystem;

namespace {

std::string fileStem(const std::string& objectName) {
    std::string stem = objectName;
    std::replace(stem.begin(), stem.end(), '.', '_');
    return stem;
}

Failure failure(ErrorKind kind, StageKind stage, std::string message) {
    return Failure{kind, std::string(stageName(stage)), std::move(message)};
}

} // namespace

std::string_view pipelineStateName(PipelineState state) {
    switch (state) {
        case PipelineState::Created: return "Created";
        case PipelineState::Extracted: return "Extracted";
        case PipelineState::ContentHashed: return "ContentHashed";
        case PipelineState::Archived: return "Archived";
        case PipelineState::ArchiveHashed: return "ArchiveHashed";
        case PipelineState::RemoteHashPredicted: return "RemoteHashPredicted";
        case PipelineState::Uploaded: return "Uploaded";
        case PipelineState::Logged: return "Logged";
        case PipelineState::Relocated: return "Relocated";
        case PipelineState::Restored: return "Restored";
        case PipelineState::Finalized: return "Finalized";
        case PipelineState::Failed: return "Failed";
    }
    return "Unknown";
}

std::string_view stageName(StageKind stage) {
    switch (stage) {
        case StageKind::Extract: return "Extract";
        case StageKind::Download: return "Download";
        case StageKind::HashContent: return "HashContent";
        case StageKind::Archive: return "Archive";
        case StageKind::Unarchive: return "Unarchive";
        case StageKind::HashArchive: return "HashArchive";
        case StageKind::PredictRemoteHash: return "PredictRemoteHash";
        case StageKind::Upload: return "Upload";
        case StageKind::LogResult: return "LogResult";
        case StageKind::Restore: return "Restore";
        case StageKind::Relocate: return "Relocate";
        case StageKind::Finalize: return "Finalize";
        case StageKind::ForceFailure: return "ForceFailure";
    }
    return "Unknown";
}

std::string_view stageErrorLabel(StageKind stage) {
    switch (stage) {
        case StageKind::Extract: return "Dump Error";
        case StageKind::Download: return "Download Error";
        case StageKind::HashContent:
        case StageKind::HashArchive:
        case StageKind::PredictRemoteHash: return "Hash Error";
        case StageKind::Archive: return "Zip Error";
        case StageKind::Unarchive: return "Unzip Error";
        case StageKind::Upload: return "S3 Upload Error";
        case StageKind::LogResult: return "Backup Log Error";
        case StageKind::Restore: return "Restore Error";
        case StageKind::Relocate: return "Relocate Error";
        case StageKind::Finalize: return "Finalize Error";
        case StageKind::ForceFailure: return "Test Fail Error";
    }
    return "Error";
}

bool stageAllowedFrom(StageKind stage, PipelineState state) {
    using S = PipelineState;
    switch (stage) {
        case StageKind::Extract:
        case StageKind::Download: return state == S::Created;
        case StageKind::HashContent: return state == S::Extracted;
        case StageKind::Archive:
        case StageKind::Restore: return state == S::Extracted || state == S::ContentHashed;
        case StageKind::Unarchive: return state == S::Archived || state == S::ArchiveHashed;
        case StageKind::HashArchive: return state == S::Archived;
        case StageKind::PredictRemoteHash: return state == S::ArchiveHashed;
        case StageKind::Upload: return state == S::RemoteHashPredicted;
        case StageKind::LogResult: return state == S::Uploaded;
        case StageKind::Relocate: return state == S::Restored;
        case StageKind::Finalize: return state != S::Created && state != S::Finalized && state != S::Failed;
        case StageKind::ForceFailure: return state == S::Created;
    }
    return false;
}

PipelineState stageTarget(StageKind stage) {
    switch (stage) {
        case StageKind::Extract: return PipelineState::Extracted;
        case StageKind::Download: return PipelineState::Archived;
        case StageKind::HashContent: return PipelineState::ContentHashed;
        case StageKind::Archive: return PipelineState::Archived;
        case StageKind::Unarchive: return PipelineState::Extracted;
        case StageKind::HashArchive: return PipelineState::ArchiveHashed;
        case StageKind::PredictRemoteHash: return PipelineState::RemoteHashPredicted;
        case StageKind::Upload: return PipelineState::Uploaded;
        case StageKind::LogResult: return PipelineState::Logged;
        case StageKind::Restore: return PipelineState::Restored;
        case StageKind::Relocate: return PipelineState::Relocated;
        case StageKind::Finalize: return PipelineState::Finalized;
        // Never reached at run time; Extracted keeps a following Finalize legal
        case StageKind::ForceFailure: return PipelineState::Extracted;
    }
    return PipelineState::Failed;
}

std::expected<void, std::string> validateStageOrder(const std::vector<StageSpec>& stages) {
    if (stages.empty()) {
        return std::unexpected("Stage list is empty");
    }
    PipelineState state = PipelineState::Created;
    for (const auto& stage : stages) {
        if (!stageAllowedFrom(stage.kind, state)) {
            return std::unexpected(std::format("Stage {} cannot run from state {}", stageName(stage.kind),
                                               pipelineStateName(state)));
        }
        state = stageTarget(stage.kind);
    }
    if (state != PipelineState::Finalized) {
        return std::unexpected(std::format("Stage list ends in state {} instead of Finalized", pipelineStateName(state)));
    }
    return {};
}

Pipeline::Pipeline(std::shared_ptr<const JobContext> context, PipelineServices services)
    : context(std::move(context)), services(services) {
    if (!this->context || !this->context->config) {
        throw std::invalid_argument("Pipeline requires a job context with a configuration");
    }
}

std::string Pipeline::remoteKeyFor(const JobContext& context, const std::string& archiveName) {
    std::string prefix = std::format("{}_{}_", context.config->backupPrefix, context.moveType);
    if (!context.version.empty()) {
        prefix += context.version + "_";
    }
    return std::format("{}/{}/{}/{}{}", context.moveType, context.source.database, context.runDate, prefix, archiveName);
}

std::expected<void, Failure> Pipeline::start() {
    const auto& config = *context->config;
    if (current != PipelineState::Created || !artifacts.scratchDir.empty()) {
        return std::unexpected(Failure{ErrorKind::InvalidState, "Start", "Pipeline already started"});
    }

    std::error_code ec;
    fs::create_directories(config.workDir, ec);
    if (ec) {
        Failure f{ErrorKind::ToolExecution, "Start", std::format("Failed to create {}: {}", config.workDir, ec.message())};
        markFailed(f, "Start Error");
        return std::unexpected(f);
    }
    std::string pattern = (fs::path(config.workDir) / (context->moveType + "_XXXXXX")).string();
    if (!mkdtemp(pattern.data())) {
        Failure f{ErrorKind::ToolExecution, "Start", std::format("Failed to create scratch directory under {}", config.workDir)};
        markFailed(f, "Start Error");
        return std::unexpected(f);
    }

    artifacts.scratchDir = pattern;
    artifacts.dumpFile = artifacts.scratchDir / (fileStem(context->objectName) + ".dump");
    artifacts.archiveFile = artifacts.scratchDir / (fileStem(context->objectName) + ".7z");
    artifacts.startedAt = std::chrono::system_clock::now();

    auto written = services.ledger.writeField(context->jobId, LedgerField::StartTime, localTimeNow());
    if (!written) {
        Failure f{ErrorKind::Ledger, "Start", written.error()};
        markFailed(f, "Start Error");
        return std::unexpected(f);
    }
    config.logMessage(std::format("{} {}: started in {}", context->moveType, context->label(), artifacts.scratchDir.string()));
    return {};
}

std::expected<void, Failure> Pipeline::run(const StageSpec& stage) {
    if (!stageAllowedFrom(stage.kind, current)) {
        return std::unexpected(failure(ErrorKind::InvalidState, stage.kind,
            std::format("cannot run from state {}", pipelineStateName(current))));
    }

    std::expected<void, Failure> result;
    switch (stage.kind) {
        case StageKind::Extract: result = extract(stage); break;
        case StageKind::Download: result = download(); break;
        case StageKind::HashContent: result = hashContent(); break;
        case StageKind::Archive: result = archive(); break;
        case StageKind::Unarchive: result = unarchive(); break;
        case StageKind::HashArchive: result = hashArchive(); break;
        case StageKind::PredictRemoteHash: result = predictRemoteHash(); break;
        case StageKind::Upload: result = upload(); break;
        case StageKind::LogResult: result = logResult(); break;
        case StageKind::Restore: result = restore(); break;
        case StageKind::Relocate: result = relocate(); break;
        case StageKind::Finalize: result = finalize(); break;
        case StageKind::ForceFailure: result = forceFailure(); break;
    }

    if (!result) {
        markFailed(result.error(), stageErrorLabel(stage.kind));
        return result;
    }
    current = stageTarget(stage.kind);
    return {};
}

JobOutcome Pipeline::execute(const std::vector<StageSpec>& stages) {
    JobOutcome outcome;
    outcome.jobId = context->jobId;
    outcome.objectName = context->objectName;

    auto started = start();
    if (!started) {
        outcome.finalState = std::string(pipelineStateName(current));
        outcome.error = started.error().describe();
        return outcome;
    }
    for (const auto& stage : stages) {
        auto result = run(stage);
        if (!result) {
            outcome.finalState = std::string(pipelineStateName(current));
            outcome.error = result.error().describe();
            return outcome;
        }
    }
    outcome.success = current == PipelineState::Finalized;
    outcome.finalState = std::string(pipelineStateName(current));
    if (!outcome.success) {
        outcome.error = std::format("pipeline stopped in state {}", outcome.finalState);
    }
    return outcome;
}

std::expected<void, Failure> Pipeline::record(StageKind stage, LedgerField field, const std::string& value) {
    auto written = services.ledger.writeField(context->jobId, field, value);
    if (!written) {
        return std::unexpected(failure(ErrorKind::Ledger, stage, written.error()));
    }
    return {};
}

void Pipeline::markFailed(const Failure& failed, std::string_view label) {
    const auto& config = *context->config;
    current = PipelineState::Failed;
    config.logError(std::format("{} {}: {}", context->moveType, context->label(), failed.describe()));

    auto results = services.ledger.writeField(context->jobId, LedgerField::Results, "Error");
    auto message = services.ledger.writeField(context->jobId, LedgerField::ErrorMessage, std::string(label));
    if (!results || !message) {
        config.logError(std::format("{}: failed to record the error on the ledger: {}", context->label(),
                                    !results ? results.error() : message.error()));
    }
    if (!artifacts.scratchDir.empty()) {
        config.logError(std::format("{}: artifacts kept in {}", context->label(), artifacts.scratchDir.string()));
    }
}

std::expected<std::string, Failure> Pipeline::acquireSecret(StageKind stage) {
    if (artifacts.secret) {
        return artifacts.secret->value;
    }

    // An archive being restored keeps the secret it was created with
    if (context->sealedSecret) {
        auto opened = services.secrets.unseal(context->secretOwner, *context->sealedSecret);
        if (!opened) {
            return std::unexpected(failure(opened.error().kind, stage, opened.error().message));
        }
        artifacts.secret = ResolvedSecret{*opened, *context->sealedSecret};
        return artifacts.secret->value;
    }

    auto resolved = services.secrets.resolve(context->secretOwner, context->secretCandidate);
    if (!resolved) {
        return std::unexpected(failure(resolved.error().kind, stage, resolved.error().message));
    }
    artifacts.secret = std::move(*resolved);
    return artifacts.secret->value;
}

std::expected<void, Failure> Pipeline::extract(const StageSpec& stage) {
    if (stage.schemaOnly && context->kind == ObjectKind::Table) {
        return std::unexpected(failure(ErrorKind::InvalidState, StageKind::Extract,
            std::format("structure-only extracts apply to schemas, {} is a table", context->objectName)));
    }

    DumpRequest request;
    request.source = context->source;
    request.objectName = context->objectName;
    request.kind = context->kind;
    request.schemaOnly = stage.schemaOnly;
    request.outputFile = artifacts.dumpFile;

    context->config->logMessage(std::format("{}: dumping from {}", context->label(), context->source.describe()));
    auto report = services.dumper.dump(request);
    if (!report) {
        ++artifacts.dumpErrors;
        return std::unexpected(failure(ErrorKind::ToolExecution, StageKind::Extract, report.error()));
    }
    artifacts.toolOutput += report->output;
    return {};
}

std::expected<void, Failure> Pipeline::download() {
    if (!services.objectStore) {
        return std::unexpected(failure(ErrorKind::Transfer, StageKind::Download, "No object store configured"));
    }
    if (!context->archiveLocation || context->archiveLocation->empty()) {
        return std::unexpected(failure(ErrorKind::Transfer, StageKind::Download, "Job has no archive location"));
    }

    context->config->logMessage(std::format("{}: downloading {}", context->label(), *context->archiveLocation));
    auto fetched = services.objectStore->download(context->config->bucket, *context->archiveLocation, artifacts.archiveFile);
    if (!fetched) {
        return std::unexpected(failure(ErrorKind::Transfer, StageKind::Download, fetched.error()));
    }
    return {};
}

std::expected<void, Failure> Pipeline::hashContent() {
    auto digest = contentHash(artifacts.dumpFile);
    if (!digest) {
        return std::unexpected(failure(ErrorKind::Integrity, StageKind::HashContent, digest.error()));
    }
    artifacts.contentDigest = *digest;
    return record(StageKind::HashContent, LedgerField::DumpHash, artifacts.contentDigest);
}

std::expected<void, Failure> Pipeline::archive() {
    auto secret = acquireSecret(StageKind::Archive);
    if (!secret) {
        return std::unexpected(secret.error());
    }
    auto stored = record(StageKind::Archive, LedgerField::EncryptedPassword, artifacts.secret->sealed);
    if (!stored) {
        return stored;
    }

    auto report = services.archiver.compress(artifacts.dumpFile, artifacts.archiveFile, *secret);
    if (!report) {
        return std::unexpected(failure(ErrorKind::ToolExecution, StageKind::Archive, report.error()));
    }
    artifacts.toolOutput += report->output;

    std::error_code ec;
    const auto dumpSize = fs::file_size(artifacts.dumpFile, ec);
    if (ec) {
        return std::unexpected(failure(ErrorKind::Integrity, StageKind::Archive,
            std::format("Cannot stat {}: {}", artifacts.dumpFile.string(), ec.message())));
    }
    auto verified = services.archiver.verify(artifacts.archiveFile, artifacts.dumpFile.filename().string(), dumpSize);
    if (!verified) {
        return std::unexpected(failure(ErrorKind::Integrity, StageKind::Archive, verified.error()));
    }
    return {};
}

std::expected<void, Failure> Pipeline::unarchive() {
    auto secret = acquireSecret(StageKind::Unarchive);
    if (!secret) {
        return std::unexpected(secret.error());
    }

    auto report = services.archiver.extract(artifacts.archiveFile, artifacts.scratchDir, *secret);
    if (!report) {
        return std::unexpected(failure(ErrorKind::ToolExecution, StageKind::Unarchive, report.error()));
    }
    artifacts.toolOutput += report->output;

    if (!fs::exists(artifacts.dumpFile)) {
        return std::unexpected(failure(ErrorKind::Integrity, StageKind::Unarchive,
            std::format("Archive {} did not contain {}", artifacts.archiveFile.string(), artifacts.dumpFile.filename().string())));
    }
    return {};
}

std::expected<void, Failure> Pipeline::hashArchive() {
    auto digest = contentHash(artifacts.archiveFile);
    if (!digest) {
        return std::unexpected(failure(ErrorKind::Integrity, StageKind::HashArchive, digest.error()));
    }
    artifacts.archiveDigest = *digest;
    return record(StageKind::HashArchive, LedgerField::ZipHash, artifacts.archiveDigest);
}

std::expected<void, Failure> Pipeline::predictRemoteHash() {
    auto prediction = compositeHash(artifacts.archiveFile, context->config->uploadChunkSize);
    if (!prediction) {
        return std::unexpected(failure(ErrorKind::Integrity, StageKind::PredictRemoteHash, prediction.error()));
    }
    artifacts.remotePrediction = *prediction;
    return record(StageKind::PredictRemoteHash, LedgerField::S3Hash, prediction->tag());
}

std::expected<void, Failure> Pipeline::upload() {
    if (!services.objectStore) {
        return std::unexpected(failure(ErrorKind::Transfer, StageKind::Upload, "No object store configured"));
    }

    const std::string key = remoteKeyFor(*context, artifacts.archiveFile.filename().string());
    context->config->logMessage(std::format("{}: uploading to {}/{}", context->label(), context->config->bucket, key));
    auto tag = services.objectStore->upload(artifacts.archiveFile, context->config->bucket, key,
                                            context->config->uploadChunkSize);
    if (!tag) {
        return std::unexpected(failure(ErrorKind::Transfer, StageKind::Upload, tag.error()));
    }
    artifacts.remoteTag = *tag;

    const std::string predicted = artifacts.remotePrediction ? artifacts.remotePrediction->tag() : std::string();
    if (!tagsMatch(artifacts.remoteTag, artifacts.archiveDigest, predicted)) {
        return std::unexpected(failure(ErrorKind::Integrity, StageKind::Upload,
            std::format("Remote tag {} matches neither {} nor {}", artifacts.remoteTag, artifacts.archiveDigest, predicted)));
    }
    artifacts.remoteKey = key;
    return record(StageKind::Upload, LedgerField::S3Location, key);
}

std::expected<void, Failure> Pipeline::logResult() {
    if (!context->logArchive) {
        context->config->logMessage(std::format("{}: archive log disabled, {} not recorded; its secret stays with owner {}",
                                                context->label(), artifacts.remoteKey, context->secretOwner));
        return {};
    }

    ArchiveRecord entry;
    entry.results = "Success";
    entry.moveType = context->moveType;
    entry.sourceDatabase = context->source.database;
    entry.objectName = context->objectName;
    entry.kind = context->kind;
    entry.location = artifacts.remoteKey;
    entry.startDate = context->runDate;
    entry.endTime = localTimeNow();
    entry.sealedSecret = artifacts.secret ? artifacts.secret->sealed : std::string();

    auto appended = services.ledger.appendArchiveRecord(entry);
    if (!appended) {
        return std::unexpected(failure(ErrorKind::Ledger, StageKind::LogResult, appended.error()));
    }
    return {};
}

std::expected<void, Failure> Pipeline::restore() {
    if (!context->destination) {
        return std::unexpected(failure(ErrorKind::InvalidState, StageKind::Restore, "No destination store"));
    }
    const auto& target = *context->destination;

    const bool stagingTarget = context->moveType == "process_to_staging" &&
                               target.database.find("staging") != std::string::npos;
    std::vector<std::string> prep;
    if (stagingTarget || context->objectName.find("_new.") != std::string::npos) {
        prep.push_back(std::format("DROP TABLE IF EXISTS {}", context->objectName));
    }
    if (context->kind == ObjectKind::Table) {
        prep.push_back(std::format("CREATE SCHEMA IF NOT EXISTS {}", context->objectName.substr(0, context->objectName.find('.'))));
    }
    if (context->tableSubset) {
        prep.push_back(std::format("CREATE SCHEMA IF NOT EXISTS {}", context->objectName));
    }
    for (const auto& sql : prep) {
        auto executed = services.sql.execute(target, sql);
        if (!executed) {
            ++artifacts.restoreErrors;
            return std::unexpected(failure(ErrorKind::ToolExecution, StageKind::Restore, executed.error()));
        }
    }

    RestoreRequest request;
    request.destination = target;
    request.inputFile = artifacts.dumpFile;
    request.tables = context->tableSubset;

    context->config->logMessage(std::format("{}: restoring into {}", context->label(), target.describe()));
    auto report = services.restorer.restore(request);
    if (!report) {
        ++artifacts.restoreErrors;
        return std::unexpected(failure(ErrorKind::ToolExecution, StageKind::Restore, report.error()));
    }
    artifacts.toolOutput += report->output;
    return {};
}

std::expected<void, Failure> Pipeline::relocate() {
    if (!context->destinationSchema || context->destinationSchema->empty()) {
        return {};
    }
    if (!context->destination) {
        return std::unexpected(failure(ErrorKind::InvalidState, StageKind::Relocate, "No destination store"));
    }
    const auto& target = *context->destination;
    const auto& newSchema = *context->destinationSchema;

    std::string sql;
    if (context->kind == ObjectKind::Schema) {
        sql = std::format("ALTER SCHEMA {} RENAME TO {};", context->objectName, newSchema);
    } else {
        if (context->moveType == "process_to_staging" && target.database.find("staging") != std::string::npos) {
            sql = std::format("DROP TABLE IF EXISTS {}.{}; ", newSchema,
                              context->objectName.substr(context->objectName.find('.') + 1));
        }
        sql += std::format("ALTER TABLE {} SET SCHEMA {};", context->objectName, newSchema);
    }

    context->config->logMessage(std::format("{}: moving to schema {}", context->label(), newSchema));
    auto executed = services.sql.execute(target, sql);
    if (!executed) {
        return std::unexpected(failure(ErrorKind::ToolExecution, StageKind::Relocate, executed.error()));
    }
    return record(StageKind::Relocate, LedgerField::RelocatedSchema, newSchema);
}

std::expected<void, Failure> Pipeline::finalize() {
    const auto ended = std::chrono::system_clock::now();
    const auto minutes = std::chrono::duration_cast<std::chrono::minutes>(ended - artifacts.startedAt).count();

    auto written = record(StageKind::Finalize, LedgerField::EndTime, localTimeNow());
    if (written) {
        written = record(StageKind::Finalize, LedgerField::RunningTime, std::to_string(minutes));
    }
    if (written) {
        written = record(StageKind::Finalize, LedgerField::Results, "Success");
    }
    if (written && !context->retainInclusion) {
        written = record(StageKind::Finalize, LedgerField::IncludeFlag, "N");
    }
    if (!written) {
        return written;
    }

    removeArtifacts();
    context->config->logMessage(std::format("{} {}: finished in {} minute(s), dump errors {}, restore errors {}",
        context->moveType, context->label(), minutes, artifacts.dumpErrors, artifacts.restoreErrors));
    return {};
}

std::expected<void, Failure> Pipeline::forceFailure() {
    return std::unexpected(failure(ErrorKind::ToolExecution, StageKind::ForceFailure,
        std::format("test_fail called for {} on {}", context->objectName, context->source.describe())));
}

void Pipeline::removeArtifacts() {
    std::error_code ec;
    for (const auto& file : {artifacts.dumpFile, artifacts.archiveFile}) {
        if (!file.empty() && !fs::remove(file, ec) && ec) {
            context->config->logError(std::format("Failed to remove {}: {}", file.string(), ec.message()));
        }
    }
    if (fs::is_empty(artifacts.scratchDir, ec) && !fs::remove(artifacts.scratchDir, ec)) {
        context->config->logError(std::format("Failed to remove {}: {}", artifacts.scratchDir.string(), ec.message()));
    }
}
