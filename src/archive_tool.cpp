#include "archive_tool.hpp"
#include "process_runner.hpp"
#include <archive.h>
#include <archive_entry.h>
#include <format>
#include <memory>

namespace fs = std::filesystem;

namespace {

struct ArchiveReadDeleter {
    void operator()(struct archive* a) const noexcept { archive_read_free(a); }
};

using ArchiveReadPtr = std::unique_ptr<struct archive, ArchiveReadDeleter>;

std::expected<ToolReport, std::string> runSevenZip(ProcessRequest& process) {
    auto result = runProcess(process);
    if (!result) {
        return std::unexpected(result.error());
    }
    if (result->timedOut) {
        return std::unexpected(std::format("{} timed out after {}s", describeCommand(process), process.timeout.count()));
    }
    const auto errors = countErrorMarkers(result->output);
    if (result->exitCode != 0 || errors > 0) {
        return std::unexpected(std::format("{} exited with {} and reported {} error(s)", describeCommand(process),
                                           result->exitCode, errors));
    }
    return ToolReport{std::move(result->output)};
}

} // namespace

SevenZipArchiveTool::SevenZipArchiveTool(const ToolSettings& settings) : settings(settings) {}

std::expected<ToolReport, std::string> SevenZipArchiveTool::compress(const fs::path& input, const fs::path& archive,
                                                                    const std::string& secret) {
    if (secret.empty()) {
        return std::unexpected("Refusing to create an archive without a password");
    }
    if (!fs::exists(input)) {
        return std::unexpected(std::format("Archive input {} does not exist", input.string()));
    }

    // Run from the input's directory so the archive entry is the bare file name
    ProcessRequest process;
    process.program = settings.sevenZip;
    process.args = {"a", "-bt", "-mx3", "-p" + secret, fs::absolute(archive).string(), input.filename().string()};
    process.workingDirectory = input.parent_path();
    process.timeout = std::chrono::seconds(settings.timeoutSeconds);

    auto report = runSevenZip(process);
    if (!report) {
        return report;
    }
    if (!fs::exists(archive)) {
        return std::unexpected(std::format("{} did not produce {}", settings.sevenZip, archive.string()));
    }
    return report;
}

std::expected<ToolReport, std::string> SevenZipArchiveTool::extract(const fs::path& archive, const fs::path& outputDir,
                                                                   const std::string& secret) {
    if (!fs::exists(archive)) {
        return std::unexpected(std::format("Archive {} does not exist", archive.string()));
    }

    ProcessRequest process;
    process.program = settings.sevenZip;
    process.args = {"e", fs::absolute(archive).string(), "-p" + secret, "-o" + fs::absolute(outputDir).string(), "-y"};
    process.timeout = std::chrono::seconds(settings.timeoutSeconds);
    return runSevenZip(process);
}

std::expected<void, std::string> SevenZipArchiveTool::verify(const fs::path& archive, const std::string& entryName,
                                                            std::uintmax_t entrySize) {
    return verifyArchive(archive, entryName, entrySize);
}

std::expected<void, std::string> verifyArchive(const fs::path& archive, const std::string& entryName,
                                               std::uintmax_t entrySize) {
    ArchiveReadPtr a(archive_read_new());
    if (!a) {
        return std::unexpected("Failed to allocate archive reader");
    }
    archive_read_support_filter_all(a.get());
    archive_read_support_format_all(a.get());
    if (archive_read_open_filename(a.get(), archive.c_str(), 10240) != ARCHIVE_OK) {
        return std::unexpected(std::format("Failed to open archive for verification: {} (error: {})", archive.string(),
                                           archive_error_string(a.get())));
    }

    struct archive_entry* entry;
    int entries = 0;
    bool found = false;
    int rc;
    while ((rc = archive_read_next_header(a.get(), &entry)) == ARCHIVE_OK) {
        ++entries;
        const char* name = archive_entry_pathname(entry);
        if (name && entryName == name) {
            found = true;
            if (archive_entry_size_is_set(entry) && static_cast<std::uintmax_t>(archive_entry_size(entry)) != entrySize) {
                return std::unexpected(std::format("Archive entry {} has size {}, expected {}", entryName,
                                                   archive_entry_size(entry), entrySize));
            }
            if (!archive_entry_is_data_encrypted(entry)) {
                return std::unexpected(std::format("Archive entry {} is not encrypted", entryName));
            }
        }
        // Encrypted data cannot always be skipped without the password; the listing ends there
        if (archive_read_data_skip(a.get()) != ARCHIVE_OK) {
            rc = ARCHIVE_EOF;
            break;
        }
    }
    if (rc != ARCHIVE_EOF) {
        return std::unexpected(std::format("Failed to read archive {}: {}", archive.string(), archive_error_string(a.get())));
    }
    if (!found) {
        return std::unexpected(std::format("Archive {} does not contain {}", archive.string(), entryName));
    }
    if (entries != 1) {
        return std::unexpected(std::format("Archive {} contains {} entries, expected 1", archive.string(), entries));
    }
    return {};
}
