#include "database_tools.hpp"
#include "process_runner.hpp"
#include <format>
#include <map>
#include <vector>

namespace {

std::string lastLine(const std::string& output) {
    auto end = output.find_last_not_of("\r\n");
    if (end == std::string::npos) {
        return "";
    }
    auto start = output.find_last_of('\n', end);
    start = start == std::string::npos ? 0 : start + 1;
    return output.substr(start, end - start + 1);
}

std::vector<std::string> connectionArgs(const ConnectionDescriptor& target) {
    return {"-h", target.host, "-p", std::to_string(target.port), "-U", target.user, "-d", target.database};
}

std::map<std::string, std::string> connectionEnvironment(const ConnectionDescriptor& target) {
    std::map<std::string, std::string> env;
    if (!target.password.empty()) {
        env["PGPASSWORD"] = target.password;
    }
    return env;
}

std::expected<ToolReport, std::string> runTool(const ProcessRequest& request) {
    auto result = runProcess(request);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->timedOut) {
        return std::unexpected(std::format("{} timed out after {}s", request.program, request.timeout.count()));
    }
    const auto errors = countErrorMarkers(result->output);
    if (result->exitCode != 0 || errors > 0) {
        return std::unexpected(std::format("{} exited with {} and reported {} error(s): {}", request.program,
                                           result->exitCode, errors, lastLine(result->output)));
    }
    return ToolReport{std::move(result->output)};
}

} // namespace

PgDumpTool::PgDumpTool(const ToolSettings& settings) : settings(settings) {}

std::expected<ToolReport, std::string> PgDumpTool::dump(const DumpRequest& request) {
    if (request.source.host.empty() || request.source.database.empty() || request.source.user.empty()) {
        return std::unexpected("Invalid source connection: host, database or user missing");
    }

    std::error_code ec;
    std::filesystem::create_directories(request.outputFile.parent_path(), ec);
    if (ec) {
        return std::unexpected(std::format("Failed to create {}: {}", request.outputFile.parent_path().string(), ec.message()));
    }

    ProcessRequest process;
    process.program = settings.pgDump;
    process.args = {"-Fc"};
    auto conn = connectionArgs(request.source);
    process.args.insert(process.args.end(), conn.begin(), conn.end());
    if (request.schemaOnly) {
        process.args.push_back("--schema-only");
    }
    process.args.push_back(request.kind == ObjectKind::Table ? "-t" : "-n");
    process.args.push_back(request.objectName);
    process.args.push_back("-f");
    process.args.push_back(request.outputFile.string());
    process.environment = connectionEnvironment(request.source);
    process.timeout = std::chrono::seconds(settings.timeoutSeconds);

    auto report = runTool(process);
    if (!report) {
        return report;
    }
    if (!std::filesystem::exists(request.outputFile)) {
        return std::unexpected(std::format("{} did not produce {}", settings.pgDump, request.outputFile.string()));
    }
    return report;
}

PgRestoreTool::PgRestoreTool(const ToolSettings& settings) : settings(settings) {}

std::expected<ToolReport, std::string> PgRestoreTool::restore(const RestoreRequest& request) {
    if (request.destination.host.empty() || request.destination.database.empty() || request.destination.user.empty()) {
        return std::unexpected("Invalid destination connection: host, database or user missing");
    }
    if (!std::filesystem::exists(request.inputFile)) {
        return std::unexpected(std::format("Dump file {} does not exist", request.inputFile.string()));
    }

    ProcessRequest process;
    process.program = settings.pgRestore;
    process.args = {"-v", "--no-data-for-failed-tables", "-j", std::to_string(settings.restoreJobs)};
    auto conn = connectionArgs(request.destination);
    process.args.insert(process.args.end(), conn.begin(), conn.end());
    if (request.tables) {
        for (const auto& table : *request.tables) {
            process.args.push_back("-t");
            process.args.push_back(table);
        }
    }
    process.args.push_back(request.inputFile.string());
    process.environment = connectionEnvironment(request.destination);
    process.timeout = std::chrono::seconds(settings.timeoutSeconds);
    return runTool(process);
}

PsqlConnection::PsqlConnection(const ToolSettings& settings) : settings(settings) {}

std::expected<ToolReport, std::string> PsqlConnection::execute(const ConnectionDescriptor& target, const std::string& sql) {
    ProcessRequest process;
    process.program = settings.psql;
    process.args = {"-X", "-q", "-v", "ON_ERROR_STOP=1"};
    auto conn = connectionArgs(target);
    process.args.insert(process.args.end(), conn.begin(), conn.end());
    process.args.push_back("-c");
    process.args.push_back(sql);
    process.environment = connectionEnvironment(target);
    process.timeout = std::chrono::seconds(settings.timeoutSeconds);
    return runTool(process);
}
