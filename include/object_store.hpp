/**
 * @file object_store.hpp
 * @brief Archival object storage for uploaded archives.
 *
 * Provides the object store interface and its S3 and SFTP implementations. S3 uploads
 * at or above the chunk size go through the multipart API, which is what makes the
 * reported tag a composite hash.
 *
 * @note Requires libcurl (S3) and libssh (SFTP).
 */

#ifndef OBJECT_STORE_HPP
#define OBJECT_STORE_HPP

#include <cstddef>
#include <expected>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include <json/json.h>

/**
 * @brief Interface for object stores.
 */
class ObjectStore {
public:
    virtual ~ObjectStore() = default;

    /**
     * @brief Uploads a local file.
     *
     * @param localFile File to upload.
     * @param bucket Bucket (or top-level directory) receiving the object.
     * @param key Object key within the bucket.
     * @param chunkSize Part size; files at least this large are uploaded in parts.
     * @return std::expected<std::string, std::string> The tag the store reports for the
     * object, or an error message.
     */
    virtual std::expected<std::string, std::string> upload(const std::filesystem::path& localFile, const std::string& bucket,
                                                           const std::string& key, std::size_t chunkSize) = 0;

    /**
     * @brief Downloads an object into a local file.
     */
    virtual std::expected<void, std::string> download(const std::string& bucket, const std::string& key,
                                                      const std::filesystem::path& localFile) = 0;
};

/**
 * @brief S3-compatible object store over the REST API, signed with AWS SigV4.
 */
class S3ObjectStore : public ObjectStore {
public:
    /**
     * @brief Constructs an S3 object store.
     *
     * @param config JSON configuration with endpoint, region, access_key, secret_key and
     * optional timeout_seconds.
     * @throws ConfigurationError If configuration is invalid.
     */
    explicit S3ObjectStore(const Json::Value& config);

    std::expected<std::string, std::string> upload(const std::filesystem::path& localFile, const std::string& bucket,
                                                   const std::string& key, std::size_t chunkSize) override;
    std::expected<void, std::string> download(const std::string& bucket, const std::string& key,
                                              const std::filesystem::path& localFile) override;

protected:
    struct HttpResponse {
        long status = 0;
        std::string body;
        std::string headers;
    };

    /**
     * @brief Sends one signed request and collects the status, body and headers.
     *
     * Every upload request goes through here.
     */
    virtual std::expected<HttpResponse, std::string> send(const std::string& method, const std::string& url,
                                                          const std::string& body) const;

private:
    std::string objectUrl(const std::string& bucket, const std::string& key) const;
    std::expected<std::string, std::string> initiateMultipartUpload(const std::string& url) const;
    std::expected<std::string, std::string> uploadPart(const std::string& url, const std::string& uploadId,
                                                       int partNumber, const std::string& partData) const;
    std::expected<std::string, std::string> completeMultipartUpload(const std::string& url, const std::string& uploadId,
                                                                    const std::vector<std::string>& etags) const;
    void abortMultipartUpload(const std::string& url, const std::string& uploadId) const;

    std::string endpoint;   ///< Service URL (e.g., "https://s3.us-east-1.amazonaws.com").
    std::string region;     ///< Signing region.
    std::string accessKey;  ///< Access key id.
    std::string secretKey;  ///< Secret access key.
    long timeoutSeconds;    ///< Per-request timeout.
};

/**
 * @brief Object store on a remote file system reached over SFTP.
 *
 * The bucket and key become a path below remote_dir. The returned tag is the MD5 of
 * the remote file as read back after the upload.
 */
class SftpObjectStore : public ObjectStore {
public:
    /**
     * @brief Constructs an SFTP object store.
     *
     * @param config JSON configuration containing host, user, password, port, and remote_dir.
     * @throws ConfigurationError If configuration is invalid.
     */
    explicit SftpObjectStore(const Json::Value& config);

    std::expected<std::string, std::string> upload(const std::filesystem::path& localFile, const std::string& bucket,
                                                   const std::string& key, std::size_t chunkSize) override;
    std::expected<void, std::string> download(const std::string& bucket, const std::string& key,
                                              const std::filesystem::path& localFile) override;

    /**
     * @brief Remote path of an object: remote_dir, then the bucket, then the key.
     */
    std::string remotePath(const std::string& bucket, const std::string& key) const;

private:

    std::string host_; ///< SFTP host address.
    std::string user_; ///< SFTP username.
    std::string password_; ///< SFTP password; empty selects public key authentication.
    int port_; ///< SFTP port (e.g., 22).
    std::string remote_dir_; ///< Remote directory holding the buckets.
};

/**
 * @brief Builds the object store named by config["type"] ("s3" or "sftp").
 *
 * @return std::unique_ptr<ObjectStore> The store, or nullptr when config is empty.
 * @throws ConfigurationError If the type is unknown or its settings are invalid.
 */
std::unique_ptr<ObjectStore> makeObjectStore(const Json::Value& config);

#endif // OBJECT_STORE_HPP
