/**
 * @file ledger.hpp
 * @brief The job ledger: planned jobs, their bookkeeping, the archive log and secrets.
 *
 * The ledger is the source of truth for which jobs exist, whether they have run, and
 * which secret protects an owner's archives. Each worker only writes the row of the job
 * it owns.
 */

#ifndef LEDGER_HPP
#define LEDGER_HPP

#include "job.hpp"
#include "secret_manager.hpp"
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct sqlite3;

/**
 * @brief Bookkeeping columns of a ledger row.
 */
enum class LedgerField {
    DumpHash,
    ZipHash,
    S3Hash,
    S3Location,
    StartTime,
    EndTime,
    RunningTime,
    Results,
    ErrorMessage,
    EncryptedPassword,
    IncludeFlag,
    RelocatedSchema
};

/**
 * @brief Column name of a ledger field ("dump_hash", ...).
 */
std::string_view ledgerColumn(LedgerField field);

/**
 * @brief Where the eligible jobs of a move type come from.
 */
enum class JobSource {
    JobTable,  ///< Planned jobs of the move type with include_flag='Y'.
    ArchiveLog ///< Latest successful archive per object, kind and secret.
};

struct JobQuery {
    std::string moveType;
    std::string sourceDatabase; ///< Control database (archive log: database the archives were taken from); empty matches every row.
    JobSource source = JobSource::JobTable;
    std::string archivedBy;     ///< Archive log only: move type that wrote the archives; empty matches every move type.
};

/**
 * @brief One uploaded archive, appended by the log stage.
 */
struct ArchiveRecord {
    std::string results;
    std::string moveType;
    std::string sourceDatabase;
    std::string objectName;
    ObjectKind kind = ObjectKind::Schema;
    std::string location;
    std::string startDate;
    std::string endTime;
    std::string errorMessage;
    std::string sealedSecret;
};

/**
 * @brief One dispatch as recorded in the run log.
 */
struct RunStep {
    int id = 0;
    std::string section;
    std::string step;
    std::string startTime;
    std::optional<std::string> endTime;
    std::optional<std::string> results; ///< "Success" or "Error" once the run has ended.
    std::optional<std::string> detail;  ///< Run summary, or why the run stopped.
};

/**
 * @brief Interface of the job ledger.
 */
class LedgerStore {
public:
    virtual ~LedgerStore() = default;

    virtual std::expected<std::vector<JobDescriptor>, std::string> listEligibleJobs(const JobQuery& query) = 0;

    /**
     * @brief Writes one bookkeeping field of a job row.
     *
     * @return std::expected<void, std::string> Success, or an error when the row does not exist.
     */
    virtual std::expected<void, std::string> writeField(int jobId, LedgerField field, const std::string& value) = 0;

    virtual std::expected<void, std::string> appendArchiveRecord(const ArchiveRecord& record) = 0;

    /**
     * @brief Clears the bookkeeping of every row of a move type.
     *
     * @param moveType Move type whose rows are reset.
     * @param reinclude Also set include_flag='Y' on every row.
     */
    virtual std::expected<void, std::string> resetJobs(const std::string& moveType, bool reinclude) = 0;

    /**
     * @brief True when every row of the move type has results='Success'.
     */
    virtual std::expected<bool, std::string> allSucceeded(const std::string& moveType) = 0;

    /**
     * @brief Opens a run log entry with the current time as its start.
     *
     * @return std::expected<int, std::string> Id to close the entry with.
     */
    virtual std::expected<int, std::string> beginRunStep(const std::string& section, const std::string& step) = 0;

    virtual std::expected<void, std::string> endRunStep(int stepId, const std::string& results,
                                                       const std::string& detail) = 0;
};

/**
 * @brief Ledger and secret store kept in a single SQLite file.
 *
 * The connection is shared by all workers and serialised with a mutex; other processes
 * are waited for through SQLite's busy timeout.
 */
class SqliteLedger : public LedgerStore, public SecretStore {
public:
    /**
     * @brief Opens (and creates, if needed) the ledger file.
     *
     * @param path SQLite database file.
     * @throws std::runtime_error If the file cannot be opened or the schema cannot be created.
     */
    explicit SqliteLedger(const std::string& path);
    ~SqliteLedger() override;

    SqliteLedger(const SqliteLedger&) = delete;
    SqliteLedger& operator=(const SqliteLedger&) = delete;

    std::expected<std::vector<JobDescriptor>, std::string> listEligibleJobs(const JobQuery& query) override;
    std::expected<void, std::string> writeField(int jobId, LedgerField field, const std::string& value) override;
    std::expected<void, std::string> appendArchiveRecord(const ArchiveRecord& record) override;
    std::expected<void, std::string> resetJobs(const std::string& moveType, bool reinclude) override;
    std::expected<bool, std::string> allSucceeded(const std::string& moveType) override;
    std::expected<int, std::string> beginRunStep(const std::string& section, const std::string& step) override;
    std::expected<void, std::string> endRunStep(int stepId, const std::string& results, const std::string& detail) override;

    std::expected<std::optional<std::string>, std::string> loadSecret(const std::string& owner) override;
    std::expected<void, std::string> insertSecretIfAbsent(const std::string& owner, const std::string& sealed) override;
    std::expected<void, std::string> clearSecret(const std::string& owner) override;

    /**
     * @brief Plans a job for a move type.
     *
     * @return std::expected<int, std::string> The new row id or an error message.
     */
    std::expected<int, std::string> addJob(const std::string& moveType, const std::string& sourceDatabase,
                                           const JobDescriptor& job);

    std::expected<std::optional<std::string>, std::string> readField(int jobId, LedgerField field);

    /**
     * @brief Run log entries, oldest first.
     */
    std::expected<std::vector<RunStep>, std::string> listRunSteps();

private:
    void ensureSchema();
    std::expected<std::vector<JobDescriptor>, std::string> listPlannedJobs(const JobQuery& query);
    std::expected<std::vector<JobDescriptor>, std::string> listArchivedJobs(const JobQuery& query);

    sqlite3* db = nullptr;
    std::mutex mutex;
};

#endif // LEDGER_HPP
