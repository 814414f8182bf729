/**
 * @file database_tools.hpp
 * @brief Dump, restore and SQL execution against a data store.
 *
 * The pipeline talks to data stores only through these interfaces. The shipped
 * implementations drive the PostgreSQL client programs as external processes; the login
 * password reaches them through PGPASSWORD in the child environment.
 *
 * @note Requires pg_dump, pg_restore and psql at runtime, at the locations given in the
 * "tools" section of the configuration.
 */

#ifndef DATABASE_TOOLS_HPP
#define DATABASE_TOOLS_HPP

#include "freight_config.hpp"
#include "job.hpp"
#include <cstddef>
#include <expected>
#include <filesystem>
#include <optional>
#include <set>
#include <string>

/**
 * @brief Output of a tool run that completed without errors.
 */
struct ToolReport {
    std::string output; ///< Combined tool output.
};

struct DumpRequest {
    ConnectionDescriptor source;
    std::string objectName;
    ObjectKind kind = ObjectKind::Schema;
    bool schemaOnly = false;
    std::filesystem::path outputFile;
};

struct RestoreRequest {
    ConnectionDescriptor destination;
    std::filesystem::path inputFile;
    std::optional<std::set<std::string>> tables; ///< Restrict the restore to these tables.
};

/**
 * @brief Interface for dump tools.
 */
class DumpTool {
public:
    virtual ~DumpTool() = default;

    /**
     * @brief Dumps one object into a file.
     *
     * @param request What to dump and where to.
     * @return std::expected<ToolReport, std::string> The tool output, or an error message when the
     * tool could not run, exited non-zero or reported errors.
     */
    virtual std::expected<ToolReport, std::string> dump(const DumpRequest& request) = 0;
};

/**
 * @brief Interface for restore tools.
 */
class RestoreTool {
public:
    virtual ~RestoreTool() = default;

    virtual std::expected<ToolReport, std::string> restore(const RestoreRequest& request) = 0;
};

/**
 * @brief Executes SQL statements on a data store.
 */
class SqlExecutor {
public:
    virtual ~SqlExecutor() = default;

    virtual std::expected<ToolReport, std::string> execute(const ConnectionDescriptor& target, const std::string& sql) = 0;
};

/**
 * @brief pg_dump in custom format, one table (-t) or one schema (-n) per file.
 */
class PgDumpTool : public DumpTool {
public:
    explicit PgDumpTool(const ToolSettings& settings);

    std::expected<ToolReport, std::string> dump(const DumpRequest& request) override;

private:
    ToolSettings settings;
};

/**
 * @brief pg_restore with parallel jobs, skipping data for tables that failed to create.
 */
class PgRestoreTool : public RestoreTool {
public:
    explicit PgRestoreTool(const ToolSettings& settings);

    std::expected<ToolReport, std::string> restore(const RestoreRequest& request) override;

private:
    ToolSettings settings;
};

/**
 * @brief psql with ON_ERROR_STOP, one command per call.
 */
class PsqlConnection : public SqlExecutor {
public:
    explicit PsqlConnection(const ToolSettings& settings);

    std::expected<ToolReport, std::string> execute(const ConnectionDescriptor& target, const std::string& sql) override;

private:
    ToolSettings settings;
};

#endif // DATABASE_TOOLS_HPP
