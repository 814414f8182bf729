#include "object_store.hpp"
#include "checksum.hpp"
#include "freight_errors.hpp"
#include <curl/curl.h>
#include <libssh/libssh.h>
#include <libssh/sftp.h>
#include <openssl/evp.h>
#include <array>
#include <cstdint>
#include <format>
#include <fstream>
#include <mutex>
#include <optional>
#include <regex>
#include <fcntl.h>

namespace fs = std::filesystem;

namespace {

constexpr std::size_t kTransferBlockSize = 32768;

void ensureCurlGlobalInit() {
    static std::once_flag once;
    std::call_once(once, [] { curl_global_init(CURL_GLOBAL_DEFAULT); });
}

struct CurlDeleter {
    void operator()(CURL* curl) const noexcept { curl_easy_cleanup(curl); }
};

using CurlPtr = std::unique_ptr<CURL, CurlDeleter>;

struct HeaderList {
    std::vector<std::string> store;
    curl_slist* list = nullptr;
    ~HeaderList() {
        if (list) {
            curl_slist_free_all(list);
        }
    }

    void add(const std::string& h) {
        store.push_back(h);
        list = curl_slist_append(list, store.back().c_str());
    }
};

size_t writeToString(char* ptr, size_t size, size_t nmemb, void* userdata) {
    static_cast<std::string*>(userdata)->append(ptr, size * nmemb);
    return size * nmemb;
}

size_t writeToFile(char* ptr, size_t size, size_t nmemb, void* userdata) {
    auto* out = static_cast<std::ofstream*>(userdata);
    out->write(ptr, static_cast<std::streamsize>(size * nmemb));
    return *out ? size * nmemb : 0;
}

std::string sha256Hex(const std::string& data) {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int length = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &length, EVP_sha256(), nullptr) != 1) {
        return "UNSIGNED-PAYLOAD";
    }
    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    for (unsigned int i = 0; i < length; ++i) {
        hex.push_back(kHex[digest[i] >> 4]);
        hex.push_back(kHex[digest[i] & 0x0F]);
    }
    return hex;
}

std::string unquote(std::string tag) {
    for (const std::string entity : {"&quot;", "&#34;"}) {
        for (auto pos = tag.find(entity); pos != std::string::npos; pos = tag.find(entity)) {
            tag.erase(pos, entity.size());
        }
    }
    std::erase(tag, '"');
    return tag;
}

std::optional<std::string> etagFromHeaders(const std::string& headers) {
    std::smatch m;
    static const std::regex re(R"(etag:\s*([^\r\n]+))", std::regex::icase);
    if (std::regex_search(headers, m, re) && m.size() > 1) {
        return unquote(m[1].str());
    }
    return std::nullopt;
}

std::optional<std::string> xmlValue(const std::string& body, const std::string& element) {
    std::smatch m;
    std::regex re(std::format("<{0}>([^<]+)</{0}>", element));
    if (std::regex_search(body, m, re) && m.size() > 1) {
        return m[1].str();
    }
    return std::nullopt;
}

std::string composeCompleteBody(const std::vector<std::string>& etags) {
    std::string body = "<CompleteMultipartUpload>";
    for (std::size_t i = 0; i < etags.size(); ++i) {
        body += std::format("<Part><PartNumber>{}</PartNumber><ETag>\"{}\"</ETag></Part>", i + 1, etags[i]);
    }
    body += "</CompleteMultipartUpload>";
    return body;
}

/**
 * @brief Owns an authenticated SSH connection and its SFTP channel.
 */
class SftpConnection {
public:
    SftpConnection() = default;
    SftpConnection(const SftpConnection&) = delete;
    SftpConnection& operator=(const SftpConnection&) = delete;

    ~SftpConnection() {
        if (sftp) {
            sftp_free(sftp);
        }
        if (ssh) {
            if (connected) {
                ssh_disconnect(ssh);
            }
            ssh_free(ssh);
        }
    }

    std::expected<void, std::string> open(const std::string& host, int port, const std::string& user,
                                          const std::string& password) {
        ssh = ssh_new();
        if (!ssh) {
            return std::unexpected("Failed to create SSH session");
        }
        long timeout = 60;
        ssh_options_set(ssh, SSH_OPTIONS_HOST, host.c_str());
        ssh_options_set(ssh, SSH_OPTIONS_PORT, &port);
        ssh_options_set(ssh, SSH_OPTIONS_USER, user.c_str());
        ssh_options_set(ssh, SSH_OPTIONS_TIMEOUT, &timeout);
        if (ssh_connect(ssh) != SSH_OK) {
            return std::unexpected(std::format("SSH connection to {} failed: {}", host, ssh_get_error(ssh)));
        }
        connected = true;

        if (password.empty()) {
            if (ssh_userauth_publickey_auto(ssh, nullptr, nullptr) != SSH_AUTH_SUCCESS) {
                return std::unexpected("SSH authentication failed");
            }
        } else if (ssh_userauth_password(ssh, nullptr, password.c_str()) != SSH_AUTH_SUCCESS) {
            return std::unexpected("SSH password authentication failed");
        }

        sftp = sftp_new(ssh);
        if (!sftp || sftp_init(sftp) != SSH_OK) {
            return std::unexpected("SFTP initialization failed");
        }
        return {};
    }

    void makeParents(const std::string& path) {
        for (auto pos = path.find('/', 1); pos != std::string::npos; pos = path.find('/', pos + 1)) {
            // Existing directories make this fail; the later open reports real problems
            sftp_mkdir(sftp, path.substr(0, pos).c_str(), 0755);
        }
    }

    ssh_session ssh = nullptr;
    sftp_session sftp = nullptr;

private:
    bool connected = false;
};

struct SftpFileCloser {
    void operator()(sftp_file_struct* file) const noexcept { sftp_close(file); }
};

using SftpFilePtr = std::unique_ptr<sftp_file_struct, SftpFileCloser>;

} // namespace

S3ObjectStore::S3ObjectStore(const Json::Value& config)
    : endpoint(config["endpoint"].asString()),
      region(config.get("region", "us-east-1").asString()),
      accessKey(config["access_key"].asString()),
      secretKey(config["secret_key"].asString()),
      timeoutSeconds(config.get("timeout_seconds", 3600).asInt()) {
    if (endpoint.empty() || accessKey.empty() || secretKey.empty()) {
        throw ConfigurationError("S3 object store requires endpoint, access_key and secret_key");
    }
    while (endpoint.ends_with('/')) {
        endpoint.pop_back();
    }
    ensureCurlGlobalInit();
}

std::string S3ObjectStore::objectUrl(const std::string& bucket, const std::string& key) const {
    return std::format("{}/{}/{}", endpoint, bucket, key);
}

std::expected<S3ObjectStore::HttpResponse, std::string> S3ObjectStore::send(const std::string& method,
                                                                            const std::string& url,
                                                                            const std::string& body) const {
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }

    const std::string sigv4 = std::format("aws:amz:{}:s3", region);
    const std::string credentials = std::format("{}:{}", accessKey, secretKey);
    HeaderList headers;
    headers.add("x-amz-content-sha256: " + sha256Hex(body));
    if (!body.empty()) {
        headers.add("Content-Type: application/octet-stream");
    }

    HttpResponse response;
    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_CUSTOMREQUEST, method.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_AWS_SIGV4, sigv4.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERPWD, credentials.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSeconds);
    if (method == "PUT" || method == "POST") {
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDS, body.data());
        curl_easy_setopt(curl.get(), CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
    }
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToString);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &response.body);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERFUNCTION, writeToString);
    curl_easy_setopt(curl.get(), CURLOPT_HEADERDATA, &response.headers);

    CURLcode res = curl_easy_perform(curl.get());
    if (res != CURLE_OK) {
        return std::unexpected(std::format("{} {} failed: {}", method, url, curl_easy_strerror(res)));
    }
    curl_easy_getinfo(curl.get(), CURLINFO_RESPONSE_CODE, &response.status);
    return response;
}

std::expected<std::string, std::string> S3ObjectStore::initiateMultipartUpload(const std::string& url) const {
    auto response = send("POST", url + "?uploads", "");
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(std::format("Initiating multipart upload failed: HTTP {} {}", response->status, response->body));
    }
    auto uploadId = xmlValue(response->body, "UploadId");
    if (!uploadId) {
        return std::unexpected(std::format("No UploadId in response: {}", response->body));
    }
    return *uploadId;
}

std::expected<std::string, std::string> S3ObjectStore::uploadPart(const std::string& url, const std::string& uploadId,
                                                                  int partNumber, const std::string& partData) const {
    auto response = send("PUT", std::format("{}?partNumber={}&uploadId={}", url, partNumber, uploadId), partData);
    if (!response) {
        return std::unexpected(response.error());
    }
    if (response->status != 200) {
        return std::unexpected(std::format("Part {} failed: HTTP {}", partNumber, response->status));
    }
    auto etag = etagFromHeaders(response->headers);
    if (!etag) {
        return std::unexpected(std::format("Part {} returned no ETag", partNumber));
    }
    return *etag;
}

std::expected<std::string, std::string> S3ObjectStore::completeMultipartUpload(const std::string& url,
                                                                               const std::string& uploadId,
                                                                               const std::vector<std::string>& etags) const {
    auto response = send("POST", std::format("{}?uploadId={}", url, uploadId), composeCompleteBody(etags));
    if (!response) {
        return std::unexpected(response.error());
    }
    // S3 may report a failed completion with status 200 and an Error body
    if (response->status != 200 || response->body.find("<Error>") != std::string::npos) {
        return std::unexpected(std::format("Completing multipart upload failed: HTTP {} {}", response->status, response->body));
    }
    auto etag = xmlValue(response->body, "ETag");
    if (!etag) {
        return std::unexpected(std::format("No ETag in completion response: {}", response->body));
    }
    return unquote(*etag);
}

void S3ObjectStore::abortMultipartUpload(const std::string& url, const std::string& uploadId) const {
    // Best effort
    [[maybe_unused]] auto response = send("DELETE", std::format("{}?uploadId={}", url, uploadId), "");
}

std::expected<std::string, std::string> S3ObjectStore::upload(const fs::path& localFile, const std::string& bucket,
                                                              const std::string& key, std::size_t chunkSize) {
    std::error_code ec;
    const auto size = fs::file_size(localFile, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to stat {}: {}", localFile.string(), ec.message()));
    }
    std::ifstream file(localFile, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("Failed to open local file {}", localFile.string()));
    }

    const std::string url = objectUrl(bucket, key);
    if (size < chunkSize) {
        std::string body(static_cast<std::size_t>(size), '\0');
        file.read(body.data(), static_cast<std::streamsize>(size));
        if (static_cast<std::uintmax_t>(file.gcount()) != size) {
            return std::unexpected(std::format("Short read from {}", localFile.string()));
        }
        auto response = send("PUT", url, body);
        if (!response) {
            return std::unexpected(response.error());
        }
        if (response->status != 200) {
            return std::unexpected(std::format("PUT {} failed: HTTP {} {}", url, response->status, response->body));
        }
        auto etag = etagFromHeaders(response->headers);
        if (!etag) {
            return std::unexpected(std::format("PUT {} returned no ETag", url));
        }
        return *etag;
    }

    auto uploadId = initiateMultipartUpload(url);
    if (!uploadId) {
        return std::unexpected(uploadId.error());
    }

    std::vector<std::string> etags;
    int partNumber = 1;
    while (file) {
        std::string part(chunkSize, '\0');
        file.read(part.data(), static_cast<std::streamsize>(chunkSize));
        const auto bytesRead = file.gcount();
        if (bytesRead <= 0) {
            break;
        }
        part.resize(static_cast<std::size_t>(bytesRead));

        auto etag = uploadPart(url, *uploadId, partNumber++, part);
        if (!etag) {
            abortMultipartUpload(url, *uploadId);
            return std::unexpected(etag.error());
        }
        etags.push_back(std::move(*etag));
    }
    if (file.bad()) {
        abortMultipartUpload(url, *uploadId);
        return std::unexpected(std::format("Read error on {}", localFile.string()));
    }

    auto tag = completeMultipartUpload(url, *uploadId, etags);
    if (!tag) {
        abortMultipartUpload(url, *uploadId);
    }
    return tag;
}

std::expected<void, std::string> S3ObjectStore::download(const std::string& bucket, const std::string& key,
                                                         const fs::path& localFile) {
    CurlPtr curl(curl_easy_init());
    if (!curl) {
        return std::unexpected("Failed to initialize CURL");
    }
    std::ofstream out(localFile, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Failed to open {} for writing", localFile.string()));
    }

    const std::string url = objectUrl(bucket, key);
    const std::string sigv4 = std::format("aws:amz:{}:s3", region);
    const std::string credentials = std::format("{}:{}", accessKey, secretKey);
    HeaderList headers;
    headers.add("x-amz-content-sha256: " + sha256Hex(""));

    curl_easy_setopt(curl.get(), CURLOPT_URL, url.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPGET, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_AWS_SIGV4, sigv4.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_USERPWD, credentials.c_str());
    curl_easy_setopt(curl.get(), CURLOPT_HTTPHEADER, headers.list);
    curl_easy_setopt(curl.get(), CURLOPT_TIMEOUT, timeoutSeconds);
    curl_easy_setopt(curl.get(), CURLOPT_FAILONERROR, 1L);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEFUNCTION, writeToFile);
    curl_easy_setopt(curl.get(), CURLOPT_WRITEDATA, &out);

    CURLcode res = curl_easy_perform(curl.get());
    out.close();
    if (res != CURLE_OK) {
        std::error_code ec;
        fs::remove(localFile, ec);
        return std::unexpected(std::format("Download of {} failed: {}", url, curl_easy_strerror(res)));
    }
    return {};
}

SftpObjectStore::SftpObjectStore(const Json::Value& config)
    : host_(config["host"].asString()),
      user_(config["user"].asString()),
      password_(config["password"].asString()),
      port_(config.get("port", 22).asInt()),
      remote_dir_(config.get("remote_dir", "/").asString()) {
    if (host_.empty() || user_.empty()) {
        throw ConfigurationError("SFTP object store requires host and user");
    }
}

std::string SftpObjectStore::remotePath(const std::string& bucket, const std::string& key) const {
    std::string dir = remote_dir_;
    if (!dir.ends_with('/')) {
        dir += '/';
    }
    return bucket.empty() ? dir + key : std::format("{}{}/{}", dir, bucket, key);
}

std::expected<std::string, std::string> SftpObjectStore::upload(const fs::path& localFile, const std::string& bucket,
                                                                const std::string& key,
                                                                [[maybe_unused]] std::size_t chunkSize) {
    SftpConnection connection;
    if (auto opened = connection.open(host_, port_, user_, password_); !opened) {
        return std::unexpected(opened.error());
    }

    std::ifstream input(localFile, std::ios::binary);
    if (!input) {
        return std::unexpected(std::format("Failed to open local file {}", localFile.string()));
    }

    const std::string remoteFile = remotePath(bucket, key);
    connection.makeParents(remoteFile);
    {
        SftpFilePtr file(sftp_open(connection.sftp, remoteFile.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644));
        if (!file) {
            return std::unexpected(std::format("Failed to open remote file {}", remoteFile));
        }
        std::array<char, kTransferBlockSize> buf;
        while (input) {
            input.read(buf.data(), buf.size());
            const auto got = input.gcount();
            if (got <= 0) {
                break;
            }
            auto written = sftp_write(file.get(), buf.data(), static_cast<std::size_t>(got));
            if (written != got) {
                return std::unexpected(std::format("Write to {} failed: {}", remoteFile, ssh_get_error(connection.ssh)));
            }
        }
        if (input.bad()) {
            return std::unexpected(std::format("Read error on {}", localFile.string()));
        }
    }

    // The tag is what the remote side actually holds
    SftpFilePtr readBack(sftp_open(connection.sftp, remoteFile.c_str(), O_RDONLY, 0));
    if (!readBack) {
        return std::unexpected(std::format("Failed to reopen remote file {}", remoteFile));
    }
    ContentHasher hasher;
    std::array<char, kTransferBlockSize> buf;
    ssize_t got;
    while ((got = sftp_read(readBack.get(), buf.data(), buf.size())) > 0) {
        hasher.update(buf.data(), static_cast<std::size_t>(got));
    }
    if (got < 0) {
        return std::unexpected(std::format("Read back of {} failed: {}", remoteFile, ssh_get_error(connection.ssh)));
    }
    return hasher.finish();
}

std::expected<void, std::string> SftpObjectStore::download(const std::string& bucket, const std::string& key,
                                                           const fs::path& localFile) {
    SftpConnection connection;
    if (auto opened = connection.open(host_, port_, user_, password_); !opened) {
        return std::unexpected(opened.error());
    }

    const std::string remoteFile = remotePath(bucket, key);
    SftpFilePtr file(sftp_open(connection.sftp, remoteFile.c_str(), O_RDONLY, 0));
    if (!file) {
        return std::unexpected(std::format("Failed to open remote file {}", remoteFile));
    }
    std::ofstream out(localFile, std::ios::binary | std::ios::trunc);
    if (!out) {
        return std::unexpected(std::format("Failed to open {} for writing", localFile.string()));
    }

    std::array<char, kTransferBlockSize> buf;
    ssize_t got;
    while ((got = sftp_read(file.get(), buf.data(), buf.size())) > 0) {
        out.write(buf.data(), got);
        if (!out) {
            return std::unexpected(std::format("Write to {} failed", localFile.string()));
        }
    }
    if (got < 0) {
        return std::unexpected(std::format("Download of {} failed: {}", remoteFile, ssh_get_error(connection.ssh)));
    }
    return {};
}

std::unique_ptr<ObjectStore> makeObjectStore(const Json::Value& config) {
    if (config.isNull() || config.empty()) {
        return nullptr;
    }
    const std::string type = config.get("type", "s3").asString();
    if (type == "s3") {
        return std::make_unique<S3ObjectStore>(config);
    }
    if (type == "sftp") {
        return std::make_unique<SftpObjectStore>(config);
    }
    throw ConfigurationError(std::format("Unsupported object store type: {}", type));
}
