#include "freight_config.hpp"
#include "freight_errors.hpp"
#include "test_support.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using testsupport::TempDir;
using testsupport::readFile;
using testsupport::writeFile;

void TestDefaults() {
    FreightConfig config{Json::Value(Json::objectValue)};
    assert(config.processingThreads == 3 && "three workers by default");
    assert(config.uploadChunkSize == 8 * 1024 * 1024 && "8 MiB multipart threshold");
    assert(config.passwordLength == 128);
    assert(config.standardTemplateName == "v1_standard");
    assert(!config.repeatJobs);
    assert(config.tools.pgDump == "pg_dump");
    assert(config.connections.empty());
}

void TestLoadFromFile() {
    TempDir dir;
    Json::Value json = testsupport::baseConfig(dir.path(), dir.path());
    json["processing_threads"] = 5;
    json["repeat_jobs"] = true;
    Json::StreamWriterBuilder writer;
    writeFile(dir / "config.json", Json::writeString(writer, json));

    FreightConfig config((dir / "config.json").string());
    assert(config.processingThreads == 5);
    assert(config.repeatJobs);
    assert(config.backupPrefix == "acme");
    assert(config.tools.timeoutSeconds == 30);
    assert(config.connections.size() == 2);
    assert(config.connections.at("dev1").user == "mover");
}

void TestBadFiles() {
    TempDir dir;
    bool threw = false;
    try {
        FreightConfig config((dir / "missing.json").string());
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw && "missing file is a configuration error");

    writeFile(dir / "broken.json", "{ \"work_dir\": ");
    threw = false;
    try {
        FreightConfig config((dir / "broken.json").string());
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw && "unparsable file is a configuration error");
}

void TestThreadRange() {
    for (int threads : {0, 13, -1}) {
        Json::Value json(Json::objectValue);
        json["processing_threads"] = threads;
        bool threw = false;
        try {
            FreightConfig config(json);
        } catch (const ConfigurationError& e) {
            threw = std::string(e.what()).find("processing_threads") != std::string::npos;
        }
        assert(threw && "thread count outside 1..12 is rejected");
    }
    Json::Value json(Json::objectValue);
    json["processing_threads"] = 12;
    assert(FreightConfig(json).processingThreads == 12);
}

void TestPasswordLengthRange() {
    std::vector<Json::Value> rejected = {Json::Value(4), Json::Value(-8), Json::Value(2048), Json::Value("long")};
    for (const auto& length : rejected) {
        Json::Value json(Json::objectValue);
        json["password_length"] = length;
        bool threw = false;
        try {
            FreightConfig config(json);
        } catch (const ConfigurationError& e) {
            threw = std::string(e.what()).find("password_length") != std::string::npos;
        }
        assert(threw && "a secret length the generator cannot honour is rejected at load");
    }
    Json::Value json(Json::objectValue);
    json["password_length"] = 16;
    assert(FreightConfig(json).passwordLength == 16);
}

void TestHostNickname() {
    assert(FreightConfig::hostNickname("dev1") == "dev1");
    assert(FreightConfig::hostNickname("db-dev99.corp.net") == "dev99");
    assert(FreightConfig::hostNickname("lake.corp.net") == "lake");
}

void TestResolveConnection() {
    TempDir dir;
    FreightConfig config(testsupport::baseConfig(dir.path(), dir.path()));

    auto byAlias = config.resolveConnection("dev1", "sales");
    assert(byAlias.host == "db-dev1.example.internal" && "alias resolves to the profile host");
    assert(byAlias.database == "sales");
    assert(byAlias.port == 5432);
    assert(byAlias.describe() == "db-dev1.example.internal.sales");

    auto byHost = config.resolveConnection("db-dev1.other.net", "sales");
    assert(byHost.host == "db-dev1.other.net" && "a full host name is kept as given");
    assert(byHost.user == "mover");

    bool threw = false;
    try {
        config.resolveConnection("db-unknown.example.internal", "sales");
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw && "unknown hosts are configuration errors");

    threw = false;
    try {
        config.resolveConnection("dev1", "");
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw && "an empty database is a configuration error");
}

void TestLogging() {
    TempDir dir;
    FreightConfig config(testsupport::baseConfig(dir.path(), dir.path()));
    config.logMessage("job 7 started");
    config.logError("job 7 failed");

    const std::string log = readFile(dir / "freight.log");
    const std::string errors = readFile(dir / "errors.log");
    assert(log.find("job 7 started") != std::string::npos);
    assert(log.find("ERROR: job 7 failed") != std::string::npos && "errors are mirrored into the main log");
    assert(errors.find("job 7 failed") != std::string::npos);
    assert(errors.find("job 7 started") == std::string::npos);
}

} // namespace

int main() {
    TestDefaults();
    TestLoadFromFile();
    TestBadFiles();
    TestThreadRange();
    TestPasswordLengthRange();
    TestHostNickname();
    TestResolveConnection();
    TestLogging();
    std::cout << "config test ok\n";
    return 0;
}
