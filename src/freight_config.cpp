#include "freight_config.hpp"
#include "freight_errors.hpp"
#include <chrono>
#include <ctime>
#include <filesystem>
#include <format>
#include <fstream>
#include <mutex>
#include <print>

namespace fs = std::filesystem;

namespace {

std::mutex gLogMutex;

void appendLine(const std::string& path, const std::string& line) {
    if (path.empty()) {
        return;
    }
    fs::path logPath(path);
    if (logPath.has_parent_path()) {
        std::error_code ec;
        fs::create_directories(logPath.parent_path(), ec);
    }
    std::ofstream log(path, std::ios::app);
    if (log.is_open()) {
        log << line << '\n';
        log.flush();
    } else {
        std::println(stderr, "Error: Cannot write to log file: {}", path);
    }
}

} // namespace

std::string localTimeNow(const char* format) {
    auto timeT = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tmNow{};
#ifdef _WIN32
    localtime_s(&tmNow, &timeT);
#else
    localtime_r(&timeT, &tmNow);
#endif
    char timeBuf[64];
    std::strftime(timeBuf, sizeof(timeBuf), format, &tmNow);
    return timeBuf;
}

std::string ConnectionDescriptor::describe() const {
    return std::format("{}.{}", host, database);
}

FreightConfig::FreightConfig(const std::string& configFile)
    : FreightConfig([&configFile] {
          std::ifstream file(configFile);
          if (!file.is_open()) {
              throw ConfigurationError(std::format("Failed to open config file: {}", configFile));
          }
          Json::Value configJson;
          Json::Reader reader;
          if (!reader.parse(file, configJson)) {
              throw ConfigurationError(std::format("Failed to parse config file: {}", configFile));
          }
          return configJson;
      }()) {}

FreightConfig::FreightConfig(const Json::Value& configJson) {
    workDir = configJson.get("work_dir", "./freight_work/").asString();
    logFile = configJson.get("log_file", workDir + "freight.log").asString();
    errorLogFile = configJson.get("error_log_file", workDir + "errors.log").asString();
    ledgerPath = configJson.get("ledger_path", workDir + "ledger.db").asString();
    processingThreads = configJson.get("processing_threads", 3).asInt();
    if (processingThreads < kMinProcessingThreads || processingThreads > kMaxProcessingThreads) {
        throw ConfigurationError(std::format("processing_threads must be between {} and {}, got {}",
                                             kMinProcessingThreads, kMaxProcessingThreads, processingThreads));
    }

    // 8MB, the object store's multipart threshold
    const auto chunkSize = configJson.get("upload_chunk_size", Json::UInt64(8 * 1024 * 1024)).asUInt64();
    if (chunkSize == 0) {
        throw ConfigurationError("upload_chunk_size must be positive");
    }
    uploadChunkSize = static_cast<std::size_t>(chunkSize);

    const Json::Value lengthJson = configJson.get("password_length", 128);
    if (!lengthJson.isInt() || lengthJson.asInt() < kMinPasswordLength || lengthJson.asInt() > kMaxPasswordLength) {
        throw ConfigurationError(std::format("password_length must be an integer between {} and {}, got {}",
                                             kMinPasswordLength, kMaxPasswordLength, lengthJson.toStyledString()));
    }
    passwordLength = static_cast<std::size_t>(lengthJson.asInt());
    secretKey = configJson.get("secret_key", "").asString();
    backupPrefix = configJson.get("backup_prefix", "").asString();
    bucket = configJson.get("bucket", "").asString();
    standardTemplateName = configJson.get("standard_template_name", "v1_standard").asString();
    startJitterSeconds = configJson.get("start_jitter_seconds", 0).asInt();
    repeatJobs = configJson.get("repeat_jobs", false).asBool();

    const Json::Value toolsJson = configJson["tools"];
    tools.pgDump = toolsJson.get("pg_dump", tools.pgDump).asString();
    tools.pgRestore = toolsJson.get("pg_restore", tools.pgRestore).asString();
    tools.psql = toolsJson.get("psql", tools.psql).asString();
    tools.sevenZip = toolsJson.get("seven_zip", tools.sevenZip).asString();
    tools.restoreJobs = toolsJson.get("restore_jobs", tools.restoreJobs).asInt();
    tools.timeoutSeconds = toolsJson.get("timeout_seconds", tools.timeoutSeconds).asInt();
    if (tools.timeoutSeconds <= 0) {
        throw ConfigurationError("tools.timeout_seconds must be positive");
    }

    // Parse connection profiles
    const Json::Value connectionsJson = configJson["connections"];
    for (const auto& nickname : connectionsJson.getMemberNames()) {
        const Json::Value& profile = connectionsJson[nickname];
        ConnectionDescriptor descriptor;
        descriptor.host = profile.get("host", nickname).asString();
        descriptor.port = profile.get("port", 5432).asInt();
        descriptor.user = profile.get("user", "dbpython").asString();
        descriptor.password = profile.get("password", "").asString();
        connections.emplace(nickname, descriptor);
    }

    objectStoreConfig = configJson["object_store"];
    telegramConfig = configJson["telegram"];
    emailConfig = configJson["email"];
}

void FreightConfig::logMessage(const std::string& message) const {
    std::string logEntry = std::format("[{}] {}", localTimeNow(), message);

    std::lock_guard<std::mutex> lock(gLogMutex);
    std::println("{}", logEntry);
    appendLine(logFile, logEntry);
}

void FreightConfig::logError(const std::string& message) const {
    std::string logEntry = std::format("[{}] ERROR: {}", localTimeNow(), message);

    std::lock_guard<std::mutex> lock(gLogMutex);
    std::println(stderr, "{}", logEntry);
    appendLine(errorLogFile, logEntry);
    appendLine(logFile, logEntry);
}

std::string FreightConfig::hostNickname(const std::string& hostOrAlias) {
    if (hostOrAlias.find('.') == std::string::npos) {
        return hostOrAlias;
    }
    std::string nickname = hostOrAlias.substr(0, hostOrAlias.find('.'));
    if (nickname.starts_with("db-")) {
        nickname.erase(0, 3);
    }
    return nickname;
}

ConnectionDescriptor FreightConfig::resolveConnection(const std::string& hostOrAlias, const std::string& database) const {
    if (hostOrAlias.empty()) {
        throw ConfigurationError("Host nickname not set");
    }
    if (database.empty()) {
        throw ConfigurationError(std::format("Database not set for host {}", hostOrAlias));
    }

    const std::string nickname = hostNickname(hostOrAlias);
    auto it = connections.find(nickname);
    if (it == connections.end()) {
        throw ConfigurationError(std::format("No connection profile for host {} (nickname {})", hostOrAlias, nickname));
    }

    ConnectionDescriptor descriptor = it->second;
    if (nickname != hostOrAlias) {
        descriptor.host = hostOrAlias;
    }
    descriptor.database = database;
    return descriptor;
}
