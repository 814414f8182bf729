#include "process_runner.hpp"
#include "test_support.hpp"
#include <cassert>
#include <chrono>
#include <iostream>
#include <string>

namespace {

using testsupport::TempDir;

ProcessRequest shell(const std::string& script) {
    ProcessRequest request;
    request.program = "/bin/sh";
    request.args = {"-c", script};
    request.timeout = std::chrono::seconds(20);
    return request;
}

void TestExitCodeAndOutput() {
    auto result = runProcess(shell("echo out; echo err >&2; exit 3"));
    assert(result && "sh starts");
    assert(result->exitCode == 3);
    assert(!result->timedOut);
    assert(result->output.find("out") != std::string::npos && "stdout is captured");
    assert(result->output.find("err") != std::string::npos && "stderr is captured");
}

void TestMissingProgram() {
    ProcessRequest request;
    request.program = "/nonexistent/datafreight-tool";
    auto result = runProcess(request);
    assert(!result && "a program that cannot start is an error");

    ProcessRequest empty;
    assert(!runProcess(empty) && "an empty program is an error");
}

void TestTimeoutKillsChild() {
    auto request = shell("sleep 30");
    request.timeout = std::chrono::seconds(1);
    const auto started = std::chrono::steady_clock::now();
    auto result = runProcess(request);
    const auto elapsed = std::chrono::steady_clock::now() - started;
    assert(result);
    assert(result->timedOut && "the timeout is reported");
    assert(result->exitCode == -1);
    assert(elapsed < std::chrono::seconds(10) && "the child is killed rather than waited for");
}

void TestEnvironmentOverlay() {
    auto request = shell("printf '%s' \"$PGPASSWORD\"");
    request.environment["PGPASSWORD"] = "s3cret";
    auto result = runProcess(request);
    assert(result && result->output == "s3cret" && "overlay variables reach the child");

    auto inherited = runProcess(shell("printf '%s' \"$PATH\""));
    assert(inherited && !inherited->output.empty() && "the parent environment is inherited");
}

void TestWorkingDirectory() {
    TempDir dir;
    auto request = shell("pwd");
    request.workingDirectory = dir.path();
    auto result = runProcess(request);
    assert(result && result->output.find(dir.path().filename().string()) != std::string::npos);
}

void TestCountErrorMarkers() {
    assert(countErrorMarkers("") == 0);
    assert(countErrorMarkers("pg_dump: dumping contents of table") == 0);
    assert(countErrorMarkers("pg_dump: error: query failed") == 1);
    assert(countErrorMarkers("pg_restore: ERROR: x\npg_restore: Error: y\n") == 2 && "markers are case-insensitive");
}

void TestDescribeCommandMasksSecrets() {
    ProcessRequest request;
    request.program = "7z";
    request.args = {"a", "-phunter2", "-mhe=on", "out.7z", "-p"};
    const std::string line = describeCommand(request);
    assert(line.find("hunter2") == std::string::npos && "archive passwords never reach logs");
    assert(line.find("-p****") != std::string::npos);
    assert(line.find("out.7z") != std::string::npos);
}

} // namespace

int main() {
    TestExitCodeAndOutput();
    TestMissingProgram();
    TestTimeoutKillsChild();
    TestEnvironmentOverlay();
    TestWorkingDirectory();
    TestCountErrorMarkers();
    TestDescribeCommandMasksSecrets();
    std::cout << "process runner test ok\n";
    return 0;
}
