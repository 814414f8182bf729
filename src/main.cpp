#include "freight_api.hpp"
#include <iostream>
#include <string>

namespace {

void printUsage(const char* program) {
    std::cerr << "Usage: " << program << " <move_type> --control-host <host> --control-db <db>"
              << " [--remote-host <host> --remote-db <db>] [--password <pw>] [--version <v>]"
              << " [--table <schema.table>]... [--threads <n>] [--config <path>]"
              << " [--archive-source <db>] [--archive-move-type <type>] [--no-logging]" << std::endl;
    std::cerr << "       " << program << " plan <move_type> --control-db <db> --object <name>"
              << " [--kind table|schema] [--new-schema <schema>] [--sequence <n>] [--config <path>]" << std::endl;
    std::cerr << "Move types:";
    for (const auto& name : knownMoveTypes()) {
        std::cerr << " " << name;
    }
    std::cerr << std::endl;
}

bool parseInt(const std::string& text, int& value) {
    try {
        std::size_t used = 0;
        value = std::stoi(text, &used);
        return used == text.size();
    } catch (const std::exception&) {
        return false;
    }
}

} // namespace

int main(int argc, char* argv[]) {
    MoveRequest request;
    JobDescriptor job;
    bool planMode = false;
    std::string kindName = "schema";
    std::string configFile = "datafreight_config.json";

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "--control-host" && i + 1 < argc) {
            request.controlHost = argv[++i];
        } else if (arg == "--control-db" && i + 1 < argc) {
            request.controlDatabase = argv[++i];
        } else if (arg == "--remote-host" && i + 1 < argc) {
            request.remoteHost = argv[++i];
        } else if (arg == "--remote-db" && i + 1 < argc) {
            request.remoteDatabase = argv[++i];
        } else if (arg == "--password" && i + 1 < argc) {
            request.password = argv[++i];
        } else if (arg == "--version" && i + 1 < argc) {
            request.version = argv[++i];
        } else if (arg == "--table" && i + 1 < argc) {
            std::string qualified = argv[++i];
            auto dot = qualified.find('.');
            if (dot == std::string::npos || dot == 0 || dot + 1 == qualified.size()) {
                std::cerr << "Error: --table expects schema.table, got " << qualified << std::endl;
                return 1;
            }
            request.tables[qualified.substr(0, dot)].insert(qualified.substr(dot + 1));
        } else if (arg == "--threads" && i + 1 < argc) {
            int threads = 0;
            if (!parseInt(argv[++i], threads)) {
                std::cerr << "Error: --threads expects a number" << std::endl;
                return 1;
            }
            request.threads = threads;
        } else if (arg == "--archive-source" && i + 1 < argc) {
            request.archiveSource = argv[++i];
        } else if (arg == "--archive-move-type" && i + 1 < argc) {
            request.archiveMoveType = argv[++i];
        } else if (arg == "--no-logging") {
            request.logging = false;
        } else if (arg == "--config" && i + 1 < argc) {
            configFile = argv[++i];
        } else if (arg == "--object" && i + 1 < argc) {
            job.objectName = argv[++i];
        } else if (arg == "--kind" && i + 1 < argc) {
            kindName = argv[++i];
        } else if (arg == "--new-schema" && i + 1 < argc) {
            job.destinationSchema = argv[++i];
        } else if (arg == "--sequence" && i + 1 < argc) {
            if (!parseInt(argv[++i], job.sequence)) {
                std::cerr << "Error: --sequence expects a number" << std::endl;
                return 1;
            }
        } else if (arg == "plan" && !planMode && request.moveType.empty()) {
            planMode = true;
        } else if (!arg.starts_with("--") && request.moveType.empty()) {
            request.moveType = arg;
        } else {
            printUsage(argv[0]);
            return 1;
        }
    }

    if (request.moveType.empty()) {
        printUsage(argv[0]);
        return 1;
    }

    if (planMode) {
        auto kind = parseObjectKind(kindName);
        if (!kind || job.objectName.empty() || request.controlDatabase.empty()) {
            printUsage(argv[0]);
            return 1;
        }
        job.kind = *kind;
        auto id = FreightAPI::planJob(configFile, request.moveType, request.controlDatabase, job);
        if (!id) {
            std::cerr << "Error: " << id.error() << std::endl;
            return 1;
        }
        std::cout << "Planned job " << *id << std::endl;
        return 0;
    }

    auto result = FreightAPI::runMove(configFile, request);
    if (!result) {
        std::cerr << "Error: " << result.error() << std::endl;
        return 1;
    }
    std::cout << result->summary(request.moveType) << std::endl;
    return result->ok() ? 0 : 1;
}
