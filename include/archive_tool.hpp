/**
 * @file archive_tool.hpp
 * @brief Password-protected archives of dump files.
 *
 * The archive tool compresses and encrypts a dump before upload and reverses it after
 * download. Archives written by the 7-Zip tool are checked with libarchive: the archive
 * must list exactly the dump, at its size, with its data encrypted.
 *
 * @note Requires the 7z executable at runtime and libarchive at build time.
 */

#ifndef ARCHIVE_TOOL_HPP
#define ARCHIVE_TOOL_HPP

#include "database_tools.hpp"
#include "freight_config.hpp"
#include <cstdint>
#include <expected>
#include <filesystem>
#include <string>

/**
 * @brief Interface for archive tools.
 */
class ArchiveTool {
public:
    virtual ~ArchiveTool() = default;

    /**
     * @brief Compresses and encrypts one file.
     *
     * @param input File to archive.
     * @param archive Archive to create.
     * @param secret Archive password.
     * @return std::expected<ToolReport, std::string> Tool output or an error message.
     */
    virtual std::expected<ToolReport, std::string> compress(const std::filesystem::path& input,
                                                            const std::filesystem::path& archive,
                                                            const std::string& secret) = 0;

    /**
     * @brief Decrypts and extracts an archive into a directory.
     */
    virtual std::expected<ToolReport, std::string> extract(const std::filesystem::path& archive,
                                                           const std::filesystem::path& outputDir,
                                                           const std::string& secret) = 0;

    /**
     * @brief Checks that a created archive holds exactly the given file, encrypted.
     */
    virtual std::expected<void, std::string> verify(const std::filesystem::path& archive, const std::string& entryName,
                                                    std::uintmax_t entrySize) = 0;
};

/**
 * @brief 7-Zip archives with AES encryption, compression level 3.
 */
class SevenZipArchiveTool : public ArchiveTool {
public:
    explicit SevenZipArchiveTool(const ToolSettings& settings);

    std::expected<ToolReport, std::string> compress(const std::filesystem::path& input,
                                                    const std::filesystem::path& archive,
                                                    const std::string& secret) override;
    std::expected<ToolReport, std::string> extract(const std::filesystem::path& archive,
                                                   const std::filesystem::path& outputDir,
                                                   const std::string& secret) override;
    std::expected<void, std::string> verify(const std::filesystem::path& archive, const std::string& entryName,
                                            std::uintmax_t entrySize) override;

private:
    ToolSettings settings;
};

/**
 * @brief Verifies an archive's listing without decrypting it.
 *
 * @param archive Archive to inspect.
 * @param entryName Name the archived file must have.
 * @param entrySize Size the archived file must have.
 * @return std::expected<void, std::string> Success, or a description of the mismatch.
 */
std::expected<void, std::string> verifyArchive(const std::filesystem::path& archive, const std::string& entryName,
                                               std::uintmax_t entrySize);

#endif // ARCHIVE_TOOL_HPP
