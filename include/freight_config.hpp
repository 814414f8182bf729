/**
 * @file freight_config.hpp
 * @brief Configuration management for the DataFreight mover.
 *
 * Defines the configuration snapshot shared by the dispatcher and every worker: working
 * directories, ledger location, external tool locations, connection profiles, object
 * store and notification settings. Also owns the log and error-log writers.
 *
 * @note Configuration is loaded from a JSON file. A loaded configuration is never mutated
 * afterwards; workers receive it through a shared pointer to const.
 */

#ifndef FREIGHT_CONFIG_HPP
#define FREIGHT_CONFIG_HPP

#include <cstddef>
#include <map>
#include <string>
#include <json/json.h>

/**
 * @brief Resolved address and credentials of one data store.
 */
struct ConnectionDescriptor {
    std::string host;     ///< Database host (e.g., "db-dev1.example.internal").
    int port = 5432;      ///< Database port.
    std::string database; ///< Database name.
    std::string user;     ///< Login role.
    std::string password; ///< Login password. Passed to tools through the child environment only.

    /**
     * @brief Short printable form, "host.database". Never includes the password.
     */
    std::string describe() const;
};

/**
 * @brief Locations and limits for the external programs the pipeline drives.
 */
struct ToolSettings {
    std::string pgDump = "pg_dump";      ///< Dump tool executable.
    std::string pgRestore = "pg_restore"; ///< Restore tool executable.
    std::string psql = "psql";           ///< SQL client used for schema moves.
    std::string sevenZip = "7z";         ///< Archive tool executable.
    int restoreJobs = 4;                 ///< Parallel jobs passed to the restore tool (-j).
    int timeoutSeconds = 6 * 60 * 60;    ///< Upper bound for any single tool invocation.
};

/**
 * @brief Configuration class for the mover.
 *
 * Loads and manages settings from a JSON configuration file, providing defaults and
 * validation.
 */
class FreightConfig {
public:
    /**
     * @brief Constructs a configuration instance from a JSON file.
     *
     * @param configFile Path to the JSON configuration file.
     * @throws ConfigurationError If the file is invalid or inaccessible.
     */
    explicit FreightConfig(const std::string& configFile);

    /**
     * @brief Constructs a configuration instance from an already parsed document.
     *
     * @param configJson Parsed configuration document.
     * @throws ConfigurationError If a value is out of range.
     */
    explicit FreightConfig(const Json::Value& configJson);

    /**
     * @brief Logs a message to the configured log file and stdout.
     *
     * @param message Message to log.
     * @note Safe to call from worker threads; lines are never interleaved.
     */
    void logMessage(const std::string& message) const;

    /**
     * @brief Logs an error to the configured error log file and stderr.
     *
     * @param message Error message to log.
     */
    void logError(const std::string& message) const;

    /**
     * @brief Resolves a host name or nickname plus database into a connection descriptor.
     *
     * A fully qualified host name is reduced to its nickname for the profile lookup, but
     * the given host name is kept as the connection host.
     *
     * @param hostOrAlias Nickname (e.g., "dev1") or host name (e.g., "db-dev1.corp.net").
     * @param database Database name.
     * @return ConnectionDescriptor The resolved descriptor.
     * @throws ConfigurationError If no connection profile matches.
     */
    ConnectionDescriptor resolveConnection(const std::string& hostOrAlias, const std::string& database) const;

    /**
     * @brief Reduces a host name to its nickname ("db-dev99.x.y" -> "dev99").
     */
    static std::string hostNickname(const std::string& hostOrAlias);

    std::string workDir;                               ///< Parent of the per-job scratch directories.
    std::string logFile;                               ///< Path to the log file.
    std::string errorLogFile;                          ///< Path to the error log file.
    std::string ledgerPath;                            ///< SQLite ledger file.
    int processingThreads;                             ///< Worker count for parallel profiles.
    std::size_t uploadChunkSize;                       ///< Multipart threshold and part size in bytes.
    std::size_t passwordLength;                        ///< Length of generated archive secrets.
    std::string secretKey;                             ///< Master key protecting stored archive secrets.
    std::string backupPrefix;                          ///< Prefix of uploaded archive names.
    std::string bucket;                                ///< Object store bucket (or remote directory).
    std::string standardTemplateName;                  ///< Template database used to seed runner servers.
    int startJitterSeconds;                            ///< Maximum random delay before a job starts.
    bool repeatJobs;                                   ///< Keep include_flag='Y' after a successful job.
    ToolSettings tools;                                ///< External tool settings.
    std::map<std::string, ConnectionDescriptor> connections; ///< Connection profiles by nickname.
    Json::Value objectStoreConfig;                     ///< Object store settings ("type": "s3" | "sftp").
    Json::Value telegramConfig;                        ///< Telegram configuration for run notifications.
    Json::Value emailConfig;                           ///< Email configuration for run notifications.

    static constexpr int kMinProcessingThreads = 1;
    static constexpr int kMaxProcessingThreads = 12;
    static constexpr int kMinPasswordLength = 16;
    static constexpr int kMaxPasswordLength = 1024;
};

/**
 * @brief Formats the current local time.
 *
 * @param format strftime pattern.
 * @return std::string The formatted time, as used in log lines and ledger timestamps.
 */
std::string localTimeNow(const char* format = "%Y-%m-%d %H:%M:%S");

#endif // FREIGHT_CONFIG_HPP
