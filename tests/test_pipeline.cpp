#include "ledger.hpp"
#include "pipeline.hpp"
#include "test_support.hpp"
#include "transport_strategy.hpp"
#include <cassert>
#include <iostream>
#include <memory>
#include <string>

namespace {

using testsupport::TempDir;
using testsupport::readFile;
namespace fs = std::filesystem;

// Everything one pipeline needs, wired to the fake tools
struct Harness {
    TempDir dir;
    fs::path tools = dir / "tools";
    std::shared_ptr<const FreightConfig> config;
    SqliteLedger ledger;
    SecretManager secrets;
    PgDumpTool dumper;
    PgRestoreTool restorer;
    PsqlConnection sql;
    testsupport::FakeArchiveTool archiver;
    testsupport::DirectoryObjectStore store;

    explicit Harness(std::size_t chunkSize = 0)
        : config(makeConfig(chunkSize)),
          ledger(config->ledgerPath),
          secrets(ledger, SecretCipher(config->secretKey), SecretPolicy{}),
          dumper(config->tools),
          restorer(config->tools),
          sql(config->tools),
          store(dir / "store") {}

    std::shared_ptr<const FreightConfig> makeConfig(std::size_t chunkSize) {
        testsupport::writeFakeDump(tools);
        testsupport::writeFakeRestore(tools);
        testsupport::writeFakePsql(tools);
        Json::Value json = testsupport::baseConfig(dir.path(), tools);
        if (chunkSize > 0) {
            json["upload_chunk_size"] = Json::UInt64(chunkSize);
        }
        return std::make_shared<const FreightConfig>(json);
    }

    PipelineServices services() { return PipelineServices{ledger, secrets, dumper, restorer, sql, archiver, &store}; }

    std::shared_ptr<JobContext> context(const std::string& moveType, const std::string& objectName,
                                        ObjectKind kind = ObjectKind::Schema) {
        JobDescriptor job;
        job.objectName = objectName;
        job.kind = kind;
        auto ctx = std::make_shared<JobContext>();
        ctx->jobId = ledger.addJob(moveType, "sales", job).value();
        ctx->objectName = objectName;
        ctx->kind = kind;
        ctx->moveType = moveType;
        ctx->runDate = "20261018";
        ctx->source = config->resolveConnection("dev1", "sales");
        ctx->destination = config->resolveConnection("lake", "lake_db");
        ctx->secretOwner = "sales";
        ctx->config = config;
        return ctx;
    }

    std::string field(int jobId, LedgerField f) { return ledger.readField(jobId, f).value().value_or(""); }
};

void TestBackupRunsToFinalized() {
    Harness h;
    auto ctx = h.context("backup_lake", "events");
    Pipeline pipeline(ctx, h.services());
    auto outcome = pipeline.execute(selectStrategy("backup_lake").stages());

    assert(outcome.success && "a backup with working tools succeeds");
    assert(outcome.finalState == "Finalized");
    assert(pipeline.state() == PipelineState::Finalized);

    const int id = ctx->jobId;
    const std::string key = "backup_lake/sales/20261018/acme_backup_lake_events.7z";
    assert(h.field(id, LedgerField::DumpHash) == pipeline.data().contentDigest);
    assert(!h.field(id, LedgerField::ZipHash).empty());
    assert(h.field(id, LedgerField::S3Hash) == pipeline.data().archiveDigest && "a small archive predicts the plain digest");
    assert(h.field(id, LedgerField::S3Location) == key);
    assert(h.field(id, LedgerField::Results) == "Success");
    assert(h.field(id, LedgerField::IncludeFlag) == "N" && "finished jobs leave the eligible set");
    assert(!h.field(id, LedgerField::StartTime).empty() && !h.field(id, LedgerField::EndTime).empty());
    assert(!h.field(id, LedgerField::EncryptedPassword).empty());
    assert(h.field(id, LedgerField::ErrorMessage).empty());

    assert(fs::exists(h.dir / "store" / "archive-bucket" / key) && "the archive reached the object store");
    assert(!fs::exists(pipeline.data().scratchDir) && "successful jobs clean their scratch directory");

    auto archived = h.ledger.listEligibleJobs({"s3_to_lake", "sales", JobSource::ArchiveLog});
    assert(archived && archived->size() == 1 && "the upload is logged");
    assert((*archived)[0].archiveLocation.value_or("") == key);
    assert((*archived)[0].sealedSecret.value_or("") == h.field(id, LedgerField::EncryptedPassword));
}

void TestMultipartUploadMatchesPrediction() {
    // Archives here hold the secret and the dump, well over one 32-byte chunk
    Harness h(32);
    h.store.multipartTags = true;
    auto ctx = h.context("backup_lake", "events");
    Pipeline pipeline(ctx, h.services());
    auto outcome = pipeline.execute(selectStrategy("backup_lake").stages());

    assert(outcome.success && "a multipart ETag matches the composite prediction");
    const std::string predicted = h.field(ctx->jobId, LedgerField::S3Hash);
    assert(predicted != pipeline.data().archiveDigest);
    assert("\"" + predicted + "\"" == pipeline.data().remoteTag && "the prediction is exactly the reported tag");
    const auto dash = predicted.find('-');
    assert(dash == 32 && predicted.find('-', dash + 1) == std::string::npos && "one part-count suffix");
}

void TestRetainInclusion() {
    Harness h;
    auto ctx = h.context("move_schemas", "orders");
    ctx->retainInclusion = true;
    Pipeline pipeline(ctx, h.services());
    assert(pipeline.execute(selectStrategy("move_schemas").stages()).success);
    assert(h.field(ctx->jobId, LedgerField::IncludeFlag) == "Y" && "repeat jobs stay included");
}

void TestWrongStateHasNoSideEffects() {
    Harness h;
    auto ctx = h.context("backup_lake", "events");
    Pipeline pipeline(ctx, h.services());
    assert(pipeline.start());

    auto upload = pipeline.run({StageKind::Upload});
    assert(!upload && upload.error().kind == ErrorKind::InvalidState);
    assert(upload.error().stage == "Upload");
    assert(pipeline.state() == PipelineState::Created && "the state is unchanged");
    assert(h.field(ctx->jobId, LedgerField::Results).empty() && "nothing is written to the ledger");
    assert(h.field(ctx->jobId, LedgerField::ErrorMessage).empty());
    assert((!fs::exists(h.dir / "store") || fs::is_empty(h.dir / "store")) && "nothing is uploaded");

    auto finalize = pipeline.run({StageKind::Finalize});
    assert(!finalize && finalize.error().kind == ErrorKind::InvalidState && "finalize needs a started job");

    assert(pipeline.run({StageKind::Extract}));
    assert(!pipeline.run({StageKind::Extract}) && "extract runs once");
    assert(pipeline.state() == PipelineState::Extracted);
    assert(!pipeline.start() && "a pipeline starts once");
}

void TestCorruptRemoteTagFailsUpload() {
    Harness h;
    h.store.corruptTag = true;
    auto ctx = h.context("backup_lake", "events");
    Pipeline pipeline(ctx, h.services());
    auto outcome = pipeline.execute(selectStrategy("backup_lake").stages());

    assert(!outcome.success);
    assert(outcome.finalState == "Failed");
    assert(outcome.error.find("Integrity") != std::string::npos);
    assert(h.field(ctx->jobId, LedgerField::Results) == "Error");
    assert(h.field(ctx->jobId, LedgerField::ErrorMessage) == "S3 Upload Error");
    assert(h.field(ctx->jobId, LedgerField::S3Location).empty() && "an unverified upload is not recorded");
    assert(fs::exists(pipeline.data().archiveFile) && "failed jobs keep their artifacts");
    assert(h.field(ctx->jobId, LedgerField::IncludeFlag) == "Y" && "failed jobs stay eligible");
}

void TestDumpErrorsFailExtract() {
    Harness h;
    auto ctx = h.context("move_schemas", "broken_schema");
    Pipeline pipeline(ctx, h.services());
    auto outcome = pipeline.execute(selectStrategy("move_schemas").stages());

    assert(!outcome.success);
    assert(outcome.error.find("Extract") != std::string::npos);
    assert(h.field(ctx->jobId, LedgerField::ErrorMessage) == "Dump Error");
    assert(pipeline.data().dumpErrors == 1);
    assert(!fs::exists(h.tools / "pg_restore.log") && "nothing is restored after a failed dump");
}

void TestSecretConflictFailsArchive() {
    Harness h;
    assert(h.secrets.resolve("sales", std::nullopt));
    auto ctx = h.context("backup_lake", "events");
    ctx->secretCandidate = "not-the-stored-secret-123";
    Pipeline pipeline(ctx, h.services());
    auto outcome = pipeline.execute(selectStrategy("backup_lake").stages());

    assert(!outcome.success);
    assert(outcome.error.find("SecretConflict") != std::string::npos);
    assert(h.field(ctx->jobId, LedgerField::ErrorMessage) == "Zip Error");
    assert(!fs::exists(pipeline.data().archiveFile) && "no archive is written under a conflicting secret");
}

void TestForcedFailure() {
    Harness h;
    auto ctx = h.context("test_fail", "anything");
    Pipeline pipeline(ctx, h.services());
    auto outcome = pipeline.execute(selectStrategy("test_fail").stages());

    assert(!outcome.success && outcome.finalState == "Failed");
    assert(outcome.error.find("ForceFailure") != std::string::npos);
    assert(h.field(ctx->jobId, LedgerField::Results) == "Error");
    assert(h.field(ctx->jobId, LedgerField::ErrorMessage) == "Test Fail Error");
    assert(h.field(ctx->jobId, LedgerField::EndTime).empty() && "finalize never runs");
    assert(!fs::exists(h.tools / "pg_restore.log") && !fs::exists(pipeline.data().dumpFile));
}

void TestArchiveLogCanBeTurnedOff() {
    Harness h;
    auto ctx = h.context("backup_lake", "events");
    ctx->logArchive = false;
    Pipeline pipeline(ctx, h.services());
    auto outcome = pipeline.execute(selectStrategy("backup_lake").stages());

    assert(outcome.success && "the upload still completes");
    assert(!h.field(ctx->jobId, LedgerField::S3Location).empty());
    auto archived = h.ledger.listEligibleJobs({"s3_to_lake", "sales", JobSource::ArchiveLog});
    assert(archived && archived->empty() && "nothing is appended to the archive log");
    assert(h.ledger.loadSecret("sales").value().has_value() && "the secret is still kept for the owner");
}

void TestArchiveToStore() {
    Harness h;
    auto backup = h.context("backup_lake", "events");
    assert(Pipeline(backup, h.services()).execute(selectStrategy("backup_lake").stages()).success);

    auto archived = h.ledger.listEligibleJobs({"s3_to_lake", "sales", JobSource::ArchiveLog}).value();
    auto ctx = std::make_shared<JobContext>(*backup);
    ctx->jobId = archived[0].id;
    ctx->moveType = "s3_to_lake";
    ctx->archiveLocation = archived[0].archiveLocation;
    ctx->sealedSecret = archived[0].sealedSecret;

    Pipeline pipeline(ctx, h.services());
    auto outcome = pipeline.execute(selectStrategy("s3_to_lake").stages());
    assert(outcome.success && "a logged archive restores");
    const std::string restoreLog = readFile(h.tools / "pg_restore.log");
    assert(restoreLog.find("lake_db") != std::string::npos);
    assert(restoreLog.find("events.dump") != std::string::npos);
    assert(!fs::exists(h.tools / "psql.log") && "a whole-schema restore needs no preparation");
    assert(h.field(ctx->jobId, LedgerField::Results) == "Success");
}

void TestPartialArchiveRestore() {
    Harness h;
    auto backup = h.context("backup_lake", "events");
    assert(Pipeline(backup, h.services()).execute(selectStrategy("backup_lake").stages()).success);

    auto archived = h.ledger.listEligibleJobs({"s3_to_lake_partial", "sales", JobSource::ArchiveLog}).value();
    auto ctx = std::make_shared<JobContext>(*backup);
    ctx->jobId = archived[0].id;
    ctx->moveType = "s3_to_lake_partial";
    ctx->archiveLocation = archived[0].archiveLocation;
    ctx->sealedSecret = archived[0].sealedSecret;
    ctx->tableSubset = std::set<std::string>{"daily"};

    Pipeline pipeline(ctx, h.services());
    assert(pipeline.execute(selectStrategy("s3_to_lake_partial").stages()).success);
    assert(readFile(h.tools / "psql.log").find("CREATE SCHEMA IF NOT EXISTS events") != std::string::npos);
    assert(readFile(h.tools / "pg_restore.log").find("-t daily") != std::string::npos && "only the subset is restored");
}

void TestDownloadFailures() {
    Harness h;
    auto ctx = h.context("s3_to_lake", "events");
    ctx->archiveLocation = "backup_lake/sales/20260101/missing.7z";
    ctx->sealedSecret = "00";
    Pipeline pipeline(ctx, h.services());
    auto outcome = pipeline.execute(selectStrategy("s3_to_lake").stages());
    assert(!outcome.success && outcome.error.find("Transfer") != std::string::npos);
    assert(h.field(ctx->jobId, LedgerField::ErrorMessage) == "Download Error");

    // an archive whose stored secret cannot be opened fails in unarchive
    Harness other;
    auto backup = other.context("backup_lake", "events");
    assert(Pipeline(backup, other.services()).execute(selectStrategy("backup_lake").stages()).success);
    auto archived = other.ledger.listEligibleJobs({"s3_to_lake", "sales", JobSource::ArchiveLog}).value();
    auto restore = std::make_shared<JobContext>(*backup);
    restore->jobId = archived[0].id;
    restore->moveType = "s3_to_lake";
    restore->archiveLocation = archived[0].archiveLocation;
    restore->sealedSecret = archived[0].sealedSecret;
    restore->secretOwner = "someone_else";
    Pipeline failing(restore, other.services());
    assert(!failing.execute(selectStrategy("s3_to_lake").stages()).success);
    assert(other.field(restore->jobId, LedgerField::ErrorMessage) == "Unzip Error");
}

void TestStructureBackupRejectsTables() {
    Harness h;
    auto table = h.context("structure_backup", "billing.invoices", ObjectKind::Table);
    Pipeline rejected(table, h.services());
    auto outcome = rejected.execute(selectStrategy("structure_backup").stages());
    assert(!outcome.success && outcome.error.find("InvalidState") != std::string::npos);
    assert(h.field(table->jobId, LedgerField::ErrorMessage) == "Dump Error");

    auto schema = h.context("structure_backup", "billing");
    Pipeline accepted(schema, h.services());
    assert(accepted.execute(selectStrategy("structure_backup").stages()).success);
    assert(h.ledger.listEligibleJobs({"s3_to_lake", "sales", JobSource::ArchiveLog}).value().empty() &&
           "structure backups are not logged for restore");
}

void TestRelocateSql() {
    Harness h;
    auto schema = h.context("move_schemas", "orders");
    schema->destinationSchema = "orders_archive";
    assert(Pipeline(schema, h.services()).execute(selectStrategy("move_schemas").stages()).success);
    assert(readFile(h.tools / "psql.log").find("ALTER SCHEMA orders RENAME TO orders_archive;") != std::string::npos);
    assert(h.field(schema->jobId, LedgerField::RelocatedSchema) == "orders_archive");

    auto table = h.context("process_to_staging", "billing.invoices", ObjectKind::Table);
    table->destination = h.config->resolveConnection("lake", "staging_db");
    table->destinationSchema = "reporting";
    assert(Pipeline(table, h.services()).execute(selectStrategy("process_to_staging").stages()).success);
    const std::string log = readFile(h.tools / "psql.log");
    assert(log.find("DROP TABLE IF EXISTS billing.invoices") != std::string::npos && "staging targets are cleared first");
    assert(log.find("CREATE SCHEMA IF NOT EXISTS billing") != std::string::npos);
    assert(log.find("DROP TABLE IF EXISTS reporting.invoices; ALTER TABLE billing.invoices SET SCHEMA reporting;") !=
           std::string::npos);

    auto unmoved = h.context("move_schemas", "plain");
    Pipeline pipeline(unmoved, h.services());
    assert(pipeline.execute(selectStrategy("move_schemas").stages()).success);
    assert(h.field(unmoved->jobId, LedgerField::RelocatedSchema).empty() && "no destination schema, no move");
}

void TestRemoteKey() {
    Harness h;
    auto ctx = h.context("production", "core.accounts", ObjectKind::Table);
    ctx->version = "2.4.0";
    assert(Pipeline::remoteKeyFor(*ctx, "core_accounts.7z") ==
           "production/sales/20261018/acme_production_2.4.0_core_accounts.7z");
}

void TestStageOrderValidation() {
    assert(validateStageOrder({{StageKind::Extract}, {StageKind::Finalize}}));
    assert(!validateStageOrder({}));
    assert(!validateStageOrder({{StageKind::HashContent}, {StageKind::Finalize}}));
    assert(!validateStageOrder({{StageKind::Extract}, {StageKind::Finalize}, {StageKind::Finalize}}));
    assert(stageAllowedFrom(StageKind::Unarchive, PipelineState::Archived));
    assert(stageTarget(StageKind::Download) == PipelineState::Archived);
    assert(stageErrorLabel(StageKind::PredictRemoteHash) == "Hash Error");
}

} // namespace

int main() {
    TestBackupRunsToFinalized();
    TestMultipartUploadMatchesPrediction();
    TestRetainInclusion();
    TestWrongStateHasNoSideEffects();
    TestCorruptRemoteTagFailsUpload();
    TestDumpErrorsFailExtract();
    TestSecretConflictFailsArchive();
    TestForcedFailure();
    TestArchiveLogCanBeTurnedOff();
    TestArchiveToStore();
    TestPartialArchiveRestore();
    TestDownloadFailures();
    TestStructureBackupRejectsTables();
    TestRelocateSql();
    TestRemoteKey();
    TestStageOrderValidation();
    std::cout << "pipeline test ok\n";
    return 0;
}
