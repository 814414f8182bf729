#include "ledger.hpp"
#include "freight_config.hpp"
#include <filesystem>
#include <format>
#include <memory>
#include <stdexcept>
#include <sqlite3.h>

namespace fs = std::filesystem;

namespace {

constexpr int kBusyTimeoutMs = 30000;

struct StatementDeleter {
    void operator()(sqlite3_stmt* st) const noexcept { sqlite3_finalize(st); }
};

using StatementPtr = std::unique_ptr<sqlite3_stmt, StatementDeleter>;

void execAll(sqlite3* db, const std::string& sql) {
    char* err = nullptr;
    if (sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err) != SQLITE_OK) {
        std::string msg = err ? err : "unknown error";
        sqlite3_free(err);
        throw std::runtime_error("SQLite exec failed: " + msg);
    }
}

std::expected<StatementPtr, std::string> prepare(sqlite3* db, const std::string& sql) {
    sqlite3_stmt* st = nullptr;
    if (sqlite3_prepare_v2(db, sql.c_str(), -1, &st, nullptr) != SQLITE_OK) {
        std::string err = sqlite3_errmsg(db);
        sqlite3_finalize(st);
        return std::unexpected(std::format("Failed to prepare ledger statement: {}", err));
    }
    return StatementPtr(st);
}

void bindText(sqlite3_stmt* st, int index, const std::string& value) {
    sqlite3_bind_text(st, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

void bindOptionalText(sqlite3_stmt* st, int index, const std::optional<std::string>& value) {
    if (value) {
        bindText(st, index, *value);
    } else {
        sqlite3_bind_null(st, index);
    }
}

std::optional<std::string> columnText(sqlite3_stmt* st, int index) {
    if (sqlite3_column_type(st, index) == SQLITE_NULL) {
        return std::nullopt;
    }
    return std::string(reinterpret_cast<const char*>(sqlite3_column_text(st, index)));
}

std::expected<void, std::string> stepDone(sqlite3* db, sqlite3_stmt* st, std::string_view what) {
    if (sqlite3_step(st) != SQLITE_DONE) {
        return std::unexpected(std::format("{} failed: {}", what, sqlite3_errmsg(db)));
    }
    return {};
}

std::pair<std::string, std::optional<std::string>> splitForRow(const std::string& objectName, ObjectKind kind) {
    if (kind == ObjectKind::Schema) {
        return {objectName, std::nullopt};
    }
    const auto dot = objectName.find('.');
    return {dot == std::string::npos ? std::string() : objectName.substr(0, dot), objectName};
}

std::string objectNameOfRow(const std::optional<std::string>& schemaName, const std::optional<std::string>& tableName) {
    if (tableName && !tableName->empty()) {
        if (tableName->find('.') != std::string::npos || !schemaName || schemaName->empty()) {
            return *tableName;
        }
        return std::format("{}.{}", *schemaName, *tableName);
    }
    return schemaName.value_or("");
}

} // namespace

std::string_view ledgerColumn(LedgerField field) {
    switch (field) {
        case LedgerField::DumpHash: return "dump_hash";
        case LedgerField::ZipHash: return "zip_hash";
        case LedgerField::S3Hash: return "s3_hash";
        case LedgerField::S3Location: return "s3_location";
        case LedgerField::StartTime: return "start_time";
        case LedgerField::EndTime: return "end_time";
        case LedgerField::RunningTime: return "running_time";
        case LedgerField::Results: return "results";
        case LedgerField::ErrorMessage: return "error_message";
        case LedgerField::EncryptedPassword: return "encrypted_password";
        case LedgerField::IncludeFlag: return "include_flag";
        case LedgerField::RelocatedSchema: return "relocated_schema";
    }
    return "results";
}

SqliteLedger::SqliteLedger(const std::string& path) {
    fs::path ledgerPath(path);
    if (ledgerPath.has_parent_path()) {
        fs::create_directories(ledgerPath.parent_path());
    }

    int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX,
                             nullptr);
    if (rc != SQLITE_OK) {
        std::string err = db ? sqlite3_errmsg(db) : "out of memory";
        sqlite3_close(db);
        db = nullptr;
        throw std::runtime_error(std::format("Failed to open ledger {}: {}", path, err));
    }

    try {
        sqlite3_busy_timeout(db, kBusyTimeoutMs);
        execAll(db, "PRAGMA journal_mode=WAL;");
        execAll(db, "PRAGMA synchronous=NORMAL;");
        ensureSchema();
    } catch (const std::exception&) {
        sqlite3_close(db);
        db = nullptr;
        throw;
    }
}

SqliteLedger::~SqliteLedger() {
    if (db) {
        sqlite3_close(db);
    }
}

void SqliteLedger::ensureSchema() {
    execAll(db, R"SQL(
        CREATE TABLE IF NOT EXISTS jobs (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            move_type TEXT NOT NULL,
            source_database TEXT NOT NULL DEFAULT '',
            schema_name TEXT,
            table_name TEXT,
            new_schema_name TEXT,
            include_flag TEXT NOT NULL DEFAULT 'Y',
            sequence INTEGER NOT NULL DEFAULT 0,
            archive_record_id INTEGER,
            dump_hash TEXT,
            zip_hash TEXT,
            s3_hash TEXT,
            s3_location TEXT,
            start_time TEXT,
            end_time TEXT,
            running_time TEXT,
            results TEXT CHECK (results IS NULL OR results IN ('Success', 'Error')),
            error_message TEXT,
            encrypted_password TEXT,
            relocated_schema TEXT
        );
        CREATE UNIQUE INDEX IF NOT EXISTS jobs_archive_record
            ON jobs (move_type, archive_record_id) WHERE archive_record_id IS NOT NULL;
        CREATE TABLE IF NOT EXISTS backup_log (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            results TEXT,
            move_type TEXT,
            source_database TEXT,
            object_name TEXT,
            object_type TEXT,
            s3_location TEXT,
            start_date TEXT,
            end_time TEXT,
            error_message TEXT,
            encrypted_password TEXT
        );
        CREATE TABLE IF NOT EXISTS secrets (
            owner TEXT PRIMARY KEY,
            sealed TEXT NOT NULL
        );
        CREATE TABLE IF NOT EXISTS run_steps (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            section TEXT NOT NULL,
            step TEXT NOT NULL,
            start_time TEXT NOT NULL,
            end_time TEXT,
            results TEXT CHECK (results IS NULL OR results IN ('Success', 'Error')),
            detail TEXT
        );
    )SQL");
}

std::expected<std::vector<JobDescriptor>, std::string> SqliteLedger::listEligibleJobs(const JobQuery& query) {
    std::lock_guard<std::mutex> lock(mutex);
    if (query.source == JobSource::ArchiveLog) {
        return listArchivedJobs(query);
    }
    return listPlannedJobs(query);
}

std::expected<std::vector<JobDescriptor>, std::string> SqliteLedger::listPlannedJobs(const JobQuery& query) {
    auto st = prepare(db, R"SQL(
        SELECT id, schema_name, table_name, new_schema_name, include_flag, sequence
        FROM jobs
        WHERE move_type = ?1 AND include_flag = 'Y' AND archive_record_id IS NULL
          AND (?2 = '' OR source_database = ?2)
        ORDER BY sequence, id
    )SQL");
    if (!st) {
        return std::unexpected(st.error());
    }
    bindText(st->get(), 1, query.moveType);
    bindText(st->get(), 2, query.sourceDatabase);

    std::vector<JobDescriptor> jobs;
    int rc;
    while ((rc = sqlite3_step(st->get())) == SQLITE_ROW) {
        JobDescriptor job;
        job.id = sqlite3_column_int(st->get(), 0);
        auto schemaName = columnText(st->get(), 1);
        auto tableName = columnText(st->get(), 2);
        job.kind = tableName && !tableName->empty() ? ObjectKind::Table : ObjectKind::Schema;
        job.objectName = objectNameOfRow(schemaName, tableName);
        job.destinationSchema = columnText(st->get(), 3);
        if (job.destinationSchema && job.destinationSchema->empty()) {
            job.destinationSchema.reset();
        }
        job.included = columnText(st->get(), 4).value_or("N") == "Y";
        job.sequence = sqlite3_column_int(st->get(), 5);
        jobs.push_back(std::move(job));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(std::format("Failed to list jobs: {}", sqlite3_errmsg(db)));
    }
    return jobs;
}

std::expected<std::vector<JobDescriptor>, std::string> SqliteLedger::listArchivedJobs(const JobQuery& query) {
    auto st = prepare(db, R"SQL(
        SELECT MAX(id), object_name, object_type, s3_location, encrypted_password
        FROM backup_log
        WHERE results = 'Success' AND (?1 = '' OR source_database = ?1) AND (?2 = '' OR move_type = ?2)
        GROUP BY object_name, object_type, encrypted_password
        ORDER BY object_name
    )SQL");
    if (!st) {
        return std::unexpected(st.error());
    }
    bindText(st->get(), 1, query.sourceDatabase);
    bindText(st->get(), 2, query.archivedBy);

    std::vector<std::pair<int, JobDescriptor>> archived;
    int rc;
    while ((rc = sqlite3_step(st->get())) == SQLITE_ROW) {
        JobDescriptor job;
        const int recordId = sqlite3_column_int(st->get(), 0);
        job.objectName = columnText(st->get(), 1).value_or("");
        job.kind = parseObjectKind(columnText(st->get(), 2).value_or("")).value_or(ObjectKind::Schema);
        job.archiveLocation = columnText(st->get(), 3);
        job.sealedSecret = columnText(st->get(), 4);
        archived.emplace_back(recordId, std::move(job));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(std::format("Failed to list archive log: {}", sqlite3_errmsg(db)));
    }

    // Each archive gets its own job row so restores keep their own bookkeeping
    std::vector<JobDescriptor> jobs;
    for (auto& [recordId, job] : archived) {
        auto insert = prepare(db, R"SQL(
            INSERT OR IGNORE INTO jobs (move_type, source_database, schema_name, table_name, archive_record_id)
            VALUES (?1, ?2, ?3, ?4, ?5)
        )SQL");
        if (!insert) {
            return std::unexpected(insert.error());
        }
        auto [schemaName, tableName] = splitForRow(job.objectName, job.kind);
        bindText(insert->get(), 1, query.moveType);
        bindText(insert->get(), 2, query.sourceDatabase);
        bindText(insert->get(), 3, schemaName);
        bindOptionalText(insert->get(), 4, tableName);
        sqlite3_bind_int(insert->get(), 5, recordId);
        if (auto done = stepDone(db, insert->get(), "Registering archive job"); !done) {
            return std::unexpected(done.error());
        }

        auto select = prepare(db, "SELECT id FROM jobs WHERE move_type = ?1 AND archive_record_id = ?2");
        if (!select) {
            return std::unexpected(select.error());
        }
        bindText(select->get(), 1, query.moveType);
        sqlite3_bind_int(select->get(), 2, recordId);
        if (sqlite3_step(select->get()) != SQLITE_ROW) {
            return std::unexpected(std::format("Archive job for record {} not found: {}", recordId, sqlite3_errmsg(db)));
        }
        job.id = sqlite3_column_int(select->get(), 0);
        jobs.push_back(std::move(job));
    }
    return jobs;
}

std::expected<void, std::string> SqliteLedger::writeField(int jobId, LedgerField field, const std::string& value) {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, std::format("UPDATE jobs SET {} = ?1 WHERE id = ?2", ledgerColumn(field)));
    if (!st) {
        return std::unexpected(st.error());
    }
    bindText(st->get(), 1, value);
    sqlite3_bind_int(st->get(), 2, jobId);
    if (auto done = stepDone(db, st->get(), std::format("Writing {} of job {}", ledgerColumn(field), jobId)); !done) {
        return done;
    }
    if (sqlite3_changes(db) == 0) {
        return std::unexpected(std::format("No ledger row with id {}", jobId));
    }
    return {};
}

std::expected<void, std::string> SqliteLedger::appendArchiveRecord(const ArchiveRecord& record) {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, R"SQL(
        INSERT INTO backup_log
            (results, move_type, source_database, object_name, object_type, s3_location,
             start_date, end_time, error_message, encrypted_password)
        VALUES (?,?,?,?,?,?,?,?,?,?)
    )SQL");
    if (!st) {
        return std::unexpected(st.error());
    }
    int i = 1;
    bindText(st->get(), i++, record.results);
    bindText(st->get(), i++, record.moveType);
    bindText(st->get(), i++, record.sourceDatabase);
    bindText(st->get(), i++, record.objectName);
    bindText(st->get(), i++, std::string(objectKindName(record.kind)));
    bindText(st->get(), i++, record.location);
    bindText(st->get(), i++, record.startDate);
    bindText(st->get(), i++, record.endTime);
    bindText(st->get(), i++, record.errorMessage);
    bindText(st->get(), i++, record.sealedSecret);
    return stepDone(db, st->get(), "Appending archive record");
}

std::expected<void, std::string> SqliteLedger::resetJobs(const std::string& moveType, bool reinclude) {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, R"SQL(
        UPDATE jobs
        SET dump_hash = NULL, zip_hash = NULL, s3_hash = NULL, s3_location = NULL,
            start_time = NULL, end_time = NULL, running_time = NULL, results = NULL,
            error_message = NULL, encrypted_password = NULL, relocated_schema = NULL,
            include_flag = CASE WHEN ?2 THEN 'Y' ELSE include_flag END
        WHERE move_type = ?1
    )SQL");
    if (!st) {
        return std::unexpected(st.error());
    }
    bindText(st->get(), 1, moveType);
    sqlite3_bind_int(st->get(), 2, reinclude ? 1 : 0);
    return stepDone(db, st->get(), std::format("Resetting {} jobs", moveType));
}

std::expected<bool, std::string> SqliteLedger::allSucceeded(const std::string& moveType) {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, R"SQL(
        SELECT COUNT(*) FROM jobs
        WHERE move_type = ?1 AND (results IS NULL OR results <> 'Success')
    )SQL");
    if (!st) {
        return std::unexpected(st.error());
    }
    bindText(st->get(), 1, moveType);
    if (sqlite3_step(st->get()) != SQLITE_ROW) {
        return std::unexpected(std::format("Failed to count {} results: {}", moveType, sqlite3_errmsg(db)));
    }
    return sqlite3_column_int(st->get(), 0) == 0;
}

std::expected<int, std::string> SqliteLedger::beginRunStep(const std::string& section, const std::string& step) {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, "INSERT INTO run_steps (section, step, start_time) VALUES (?1, ?2, ?3)");
    if (!st) {
        return std::unexpected(st.error());
    }
    bindText(st->get(), 1, section);
    bindText(st->get(), 2, step);
    bindText(st->get(), 3, localTimeNow());
    if (auto done = stepDone(db, st->get(), std::format("Starting run step {}", step)); !done) {
        return std::unexpected(done.error());
    }
    return static_cast<int>(sqlite3_last_insert_rowid(db));
}

std::expected<void, std::string> SqliteLedger::endRunStep(int stepId, const std::string& results, const std::string& detail) {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, "UPDATE run_steps SET end_time = ?1, results = ?2, detail = ?3 WHERE id = ?4 AND end_time IS NULL");
    if (!st) {
        return std::unexpected(st.error());
    }
    bindText(st->get(), 1, localTimeNow());
    bindText(st->get(), 2, results);
    bindText(st->get(), 3, detail);
    sqlite3_bind_int(st->get(), 4, stepId);
    if (auto done = stepDone(db, st->get(), std::format("Ending run step {}", stepId)); !done) {
        return done;
    }
    if (sqlite3_changes(db) == 0) {
        return std::unexpected(std::format("No open run step with id {}", stepId));
    }
    return {};
}

std::expected<std::vector<RunStep>, std::string> SqliteLedger::listRunSteps() {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, "SELECT id, section, step, start_time, end_time, results, detail FROM run_steps ORDER BY id");
    if (!st) {
        return std::unexpected(st.error());
    }
    std::vector<RunStep> steps;
    int rc;
    while ((rc = sqlite3_step(st->get())) == SQLITE_ROW) {
        RunStep step;
        step.id = sqlite3_column_int(st->get(), 0);
        step.section = columnText(st->get(), 1).value_or("");
        step.step = columnText(st->get(), 2).value_or("");
        step.startTime = columnText(st->get(), 3).value_or("");
        step.endTime = columnText(st->get(), 4);
        step.results = columnText(st->get(), 5);
        step.detail = columnText(st->get(), 6);
        steps.push_back(std::move(step));
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(std::format("Failed to list run steps: {}", sqlite3_errmsg(db)));
    }
    return steps;
}

std::expected<std::optional<std::string>, std::string> SqliteLedger::loadSecret(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, "SELECT sealed FROM secrets WHERE owner = ?1");
    if (!st) {
        return std::unexpected(st.error());
    }
    bindText(st->get(), 1, owner);
    int rc = sqlite3_step(st->get());
    if (rc == SQLITE_DONE) {
        return std::optional<std::string>();
    }
    if (rc != SQLITE_ROW) {
        return std::unexpected(std::format("Failed to load secret for {}: {}", owner, sqlite3_errmsg(db)));
    }
    return columnText(st->get(), 0);
}

std::expected<void, std::string> SqliteLedger::insertSecretIfAbsent(const std::string& owner, const std::string& sealed) {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, "INSERT OR IGNORE INTO secrets (owner, sealed) VALUES (?1, ?2)");
    if (!st) {
        return std::unexpected(st.error());
    }
    bindText(st->get(), 1, owner);
    bindText(st->get(), 2, sealed);
    return stepDone(db, st->get(), std::format("Storing secret for {}", owner));
}

std::expected<void, std::string> SqliteLedger::clearSecret(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, "DELETE FROM secrets WHERE owner = ?1");
    if (!st) {
        return std::unexpected(st.error());
    }
    bindText(st->get(), 1, owner);
    return stepDone(db, st->get(), std::format("Clearing secret for {}", owner));
}

std::expected<int, std::string> SqliteLedger::addJob(const std::string& moveType, const std::string& sourceDatabase,
                                                     const JobDescriptor& job) {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, R"SQL(
        INSERT INTO jobs (move_type, source_database, schema_name, table_name, new_schema_name, include_flag, sequence)
        VALUES (?,?,?,?,?,?,?)
    )SQL");
    if (!st) {
        return std::unexpected(st.error());
    }
    auto [schemaName, tableName] = splitForRow(job.objectName, job.kind);
    int i = 1;
    bindText(st->get(), i++, moveType);
    bindText(st->get(), i++, sourceDatabase);
    bindText(st->get(), i++, schemaName);
    bindOptionalText(st->get(), i++, tableName);
    bindOptionalText(st->get(), i++, job.destinationSchema);
    bindText(st->get(), i++, job.included ? "Y" : "N");
    sqlite3_bind_int(st->get(), i++, job.sequence);
    if (auto done = stepDone(db, st->get(), "Adding job"); !done) {
        return std::unexpected(done.error());
    }
    return static_cast<int>(sqlite3_last_insert_rowid(db));
}

std::expected<std::optional<std::string>, std::string> SqliteLedger::readField(int jobId, LedgerField field) {
    std::lock_guard<std::mutex> lock(mutex);
    auto st = prepare(db, std::format("SELECT {} FROM jobs WHERE id = ?1", ledgerColumn(field)));
    if (!st) {
        return std::unexpected(st.error());
    }
    sqlite3_bind_int(st->get(), 1, jobId);
    if (sqlite3_step(st->get()) != SQLITE_ROW) {
        return std::unexpected(std::format("No ledger row with id {}", jobId));
    }
    return columnText(st->get(), 0);
}
