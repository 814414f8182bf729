#include "process_runner.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cerrno>
#include <cstring>
#include <format>
#include <csignal>
#include <thread>
#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

extern char** environ;

namespace {

constexpr std::string_view kErrorMarker = " error:";

class Pipe {
public:
    Pipe() {
        if (::pipe2(fds, O_CLOEXEC) != 0) {
            fds[0] = fds[1] = -1;
        }
    }
    ~Pipe() {
        closeRead();
        closeWrite();
    }
    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    bool valid() const { return fds[0] >= 0 && fds[1] >= 0; }
    int readEnd() const { return fds[0]; }
    int writeEnd() const { return fds[1]; }
    void closeRead() {
        if (fds[0] >= 0) {
            ::close(fds[0]);
            fds[0] = -1;
        }
    }
    void closeWrite() {
        if (fds[1] >= 0) {
            ::close(fds[1]);
            fds[1] = -1;
        }
    }

private:
    int fds[2] = {-1, -1};
};

std::vector<std::string> buildEnvironment(const std::map<std::string, std::string>& overlay) {
    std::vector<std::string> env;
    for (char** entry = environ; entry && *entry; ++entry) {
        std::string_view var(*entry);
        auto eq = var.find('=');
        std::string name(var.substr(0, eq));
        if (!overlay.contains(name)) {
            env.emplace_back(var);
        }
    }
    for (const auto& [name, value] : overlay) {
        env.push_back(std::format("{}={}", name, value));
    }
    return env;
}

std::vector<char*> toArgv(std::vector<std::string>& strings) {
    std::vector<char*> argv;
    argv.reserve(strings.size() + 1);
    for (auto& s : strings) {
        argv.push_back(s.data());
    }
    argv.push_back(nullptr);
    return argv;
}

int exitCodeOf(int status) {
    return WIFEXITED(status) ? WEXITSTATUS(status) : -1;
}

int waitForChild(pid_t pid) {
    int status = 0;
    while (::waitpid(pid, &status, 0) < 0) {
        if (errno != EINTR) {
            return -1;
        }
    }
    return exitCodeOf(status);
}

// Reaps the child, killing its process group once the deadline passes
int reapBefore(pid_t pid, std::chrono::steady_clock::time_point deadline, bool& timedOut) {
    int status = 0;
    while (std::chrono::steady_clock::now() < deadline) {
        pid_t rc = ::waitpid(pid, &status, WNOHANG);
        if (rc == pid) {
            return exitCodeOf(status);
        }
        if (rc < 0 && errno != EINTR) {
            return -1;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(50));
    }
    timedOut = true;
    ::kill(-pid, SIGKILL);
    return waitForChild(pid);
}

} // namespace

std::expected<ProcessResult, std::string> runProcess(const ProcessRequest& request) {
    if (request.program.empty()) {
        return std::unexpected("No program given");
    }

    // Everything the child needs is built before fork
    std::vector<std::string> argStrings;
    argStrings.push_back(request.program);
    argStrings.insert(argStrings.end(), request.args.begin(), request.args.end());
    auto argv = toArgv(argStrings);
    auto envStrings = buildEnvironment(request.environment);
    auto envp = toArgv(envStrings);
    const std::string workDir = request.workingDirectory.string();

    Pipe output;
    Pipe execStatus;
    if (!output.valid() || !execStatus.valid()) {
        return std::unexpected(std::format("Failed to create pipes for {}: {}", request.program, std::strerror(errno)));
    }

    pid_t pid = ::fork();
    if (pid < 0) {
        return std::unexpected(std::format("Failed to fork for {}: {}", request.program, std::strerror(errno)));
    }

    if (pid == 0) {
        ::setpgid(0, 0);
        ::dup2(output.writeEnd(), STDOUT_FILENO);
        ::dup2(output.writeEnd(), STDERR_FILENO);
        int devNull = ::open("/dev/null", O_RDONLY);
        if (devNull >= 0) {
            ::dup2(devNull, STDIN_FILENO);
        }
        if (!workDir.empty() && ::chdir(workDir.c_str()) != 0) {
            int err = errno;
            [[maybe_unused]] auto n = ::write(execStatus.writeEnd(), &err, sizeof(err));
            ::_exit(127);
        }
        ::execvpe(argv[0], argv.data(), envp.data());
        int err = errno;
        [[maybe_unused]] auto n = ::write(execStatus.writeEnd(), &err, sizeof(err));
        ::_exit(127);
    }

    ::setpgid(pid, pid);
    output.closeWrite();
    execStatus.closeWrite();

    int execErrno = 0;
    ssize_t got;
    do {
        got = ::read(execStatus.readEnd(), &execErrno, sizeof(execErrno));
    } while (got < 0 && errno == EINTR);
    if (got == static_cast<ssize_t>(sizeof(execErrno))) {
        waitForChild(pid);
        return std::unexpected(std::format("Failed to start {}: {}", request.program, std::strerror(execErrno)));
    }

    ProcessResult result;
    const auto deadline = std::chrono::steady_clock::now() + request.timeout;
    std::array<char, 8192> buf;
    while (true) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        if (remaining.count() <= 0) {
            result.timedOut = true;
            ::kill(-pid, SIGKILL);
            break;
        }

        pollfd pfd{output.readEnd(), POLLIN, 0};
        int ready = ::poll(&pfd, 1, static_cast<int>(std::min<long long>(remaining.count(), 1000)));
        if (ready < 0) {
            if (errno == EINTR) {
                continue;
            }
            ::kill(-pid, SIGKILL);
            waitForChild(pid);
            return std::unexpected(std::format("poll failed for {}: {}", request.program, std::strerror(errno)));
        }
        if (ready == 0) {
            continue;
        }

        ssize_t n = ::read(output.readEnd(), buf.data(), buf.size());
        if (n > 0) {
            result.output.append(buf.data(), static_cast<std::size_t>(n));
        } else if (n == 0) {
            break;
        } else if (errno != EINTR) {
            break;
        }
    }

    result.exitCode = result.timedOut ? waitForChild(pid) : reapBefore(pid, deadline, result.timedOut);
    if (result.timedOut) {
        result.exitCode = -1;
    }
    return result;
}

std::size_t countErrorMarkers(std::string_view output) {
    std::string lowered(output);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    std::size_t count = 0;
    for (auto pos = lowered.find(kErrorMarker); pos != std::string::npos;
         pos = lowered.find(kErrorMarker, pos + 1)) {
        ++count;
    }
    return count;
}

std::string describeCommand(const ProcessRequest& request) {
    std::string line = request.program;
    for (const auto& arg : request.args) {
        line += ' ';
        if (arg.size() > 2 && arg.starts_with("-p")) {
            line += "-p****";
        } else {
            line += arg;
        }
    }
    return line;
}
