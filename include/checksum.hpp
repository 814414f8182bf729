/**
 * @file checksum.hpp
 * @brief Artifact checksums and object store tag prediction.
 *
 * Pure functions with no shared state; safe to call concurrently on different files.
 */

#ifndef CHECKSUM_HPP
#define CHECKSUM_HPP

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

/**
 * @brief Prediction of the object store's tag for an uploaded file.
 */
struct CompositeHash {
    std::string digest;        ///< Bare hex digest: the plain content hash, or the hash of the part digests.
    std::size_t chunkCount;    ///< Number of upload parts.
    bool multipart = false;    ///< True when the file is at least one chunk long.

    /**
     * @brief The tag the object store is expected to report.
     *
     * @return std::string "<digest>-<chunkCount>" for multipart uploads, the plain digest otherwise.
     */
    std::string tag() const;
};

/**
 * @brief Incremental MD5 for data that does not come from a local file.
 */
class ContentHasher {
public:
    ContentHasher();
    ~ContentHasher();

    ContentHasher(const ContentHasher&) = delete;
    ContentHasher& operator=(const ContentHasher&) = delete;

    void update(const void* data, std::size_t size);

    /**
     * @brief Finishes the digest. The hasher cannot be updated afterwards.
     *
     * @return std::expected<std::string, std::string> Lowercase hex digest or an error message.
     */
    std::expected<std::string, std::string> finish();

private:
    class Impl;
    std::unique_ptr<Impl> impl;
};

/**
 * @brief Computes the streaming MD5 of a file.
 *
 * @param path File to hash.
 * @return std::expected<std::string, std::string> Lowercase hex digest or an error message.
 */
std::expected<std::string, std::string> contentHash(const std::filesystem::path& path);

/**
 * @brief Predicts the multipart tag of a file uploaded in chunks of chunkSize bytes.
 *
 * Each chunk is hashed, the concatenated binary chunk digests are hashed again, and the
 * chunk count is appended. Files smaller than one chunk are uploaded in a single part,
 * so their prediction is the plain content hash.
 *
 * @param path File to hash.
 * @param chunkSize Part size in bytes. Must be positive.
 * @return std::expected<CompositeHash, std::string> The prediction or an error message.
 */
std::expected<CompositeHash, std::string> compositeHash(const std::filesystem::path& path, std::size_t chunkSize);

/**
 * @brief Compares a tag reported by the object store with the local digests.
 *
 * Surrounding quotes on the remote tag are ignored.
 *
 * @return bool True when the remote tag equals either the plain or the composite digest.
 */
bool tagsMatch(std::string_view remoteTag, std::string_view plainDigest, std::string_view compositeDigest);

#endif // CHECKSUM_HPP
