#include "checksum.hpp"
#include "freight_errors.hpp"
#include "object_store.hpp"
#include "test_support.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <vector>

namespace {

using testsupport::TempDir;
namespace fs = std::filesystem;

std::string md5Of(const std::string& data) {
    ContentHasher hasher;
    hasher.update(data.data(), data.size());
    return hasher.finish().value();
}

std::string unquoted(std::string tag) {
    std::erase(tag, '"');
    return tag;
}

Json::Value s3Config() {
    Json::Value config;
    config["type"] = "s3";
    config["endpoint"] = "https://s3.test/";
    config["access_key"] = "AKIDEXAMPLE";
    config["secret_key"] = "wJalrXUtnFEMI";
    return config;
}

// Answers S3 requests from memory and keeps every request it was sent
class RecordingS3Store : public S3ObjectStore {
public:
    struct Request {
        std::string method;
        std::string url;
        std::string body;
    };

    RecordingS3Store() : S3ObjectStore(s3Config()) {}

    mutable std::vector<Request> requests;
    int failingPart = 0;
    bool completionError = false;
    std::string completedTag;

    std::vector<const Request*> parts() const {
        std::vector<const Request*> found;
        for (const auto& request : requests) {
            if (request.method == "PUT" && request.url.find("partNumber=") != std::string::npos) {
                found.push_back(&request);
            }
        }
        return found;
    }

protected:
    std::expected<HttpResponse, std::string> send(const std::string& method, const std::string& url,
                                                  const std::string& body) const override {
        requests.push_back({method, url, body});
        HttpResponse response;
        response.status = 200;
        const auto partPos = url.find("partNumber=");
        if (method == "POST" && url.ends_with("?uploads")) {
            response.body = "<InitiateMultipartUploadResult><UploadId>up-1</UploadId></InitiateMultipartUploadResult>";
        } else if (method == "PUT" && partPos != std::string::npos) {
            if (std::stoi(url.substr(partPos + 11)) == failingPart) {
                response.status = 500;
                return response;
            }
            response.headers = "HTTP/1.1 200 OK\r\nETag: \"" + md5Of(body) + "\"\r\n";
        } else if (method == "PUT") {
            response.headers = "HTTP/1.1 200 OK\r\nETag: \"" + md5Of(body) + "\"\r\n";
        } else if (method == "POST") {
            response.body = completionError
                                ? "<Error><Code>InternalError</Code></Error>"
                                : "<CompleteMultipartUploadResult><ETag>&quot;" + unquoted(completedTag) +
                                      "&quot;</ETag></CompleteMultipartUploadResult>";
        } else if (method == "DELETE") {
            response.status = 204;
        }
        return response;
    }
};

std::string patterned(std::size_t size) {
    std::string content;
    for (std::size_t i = 0; i < size; ++i) {
        content.push_back(static_cast<char>('a' + i % 23));
    }
    return content;
}

void TestSmallFileIsOnePut() {
    TempDir dir;
    const std::string content = patterned(20);
    testsupport::writeFile(dir / "small.7z", content);

    RecordingS3Store store;
    auto tag = store.upload(dir / "small.7z", "archive-bucket", "sales/small.7z", 32);
    assert(tag && *tag == md5Of(content));
    assert(store.requests.size() == 1 && "below one chunk there is no multipart session");
    assert(store.requests[0].method == "PUT");
    assert(store.requests[0].url == "https://s3.test/archive-bucket/sales/small.7z");
    assert(store.requests[0].body == content);
}

void TestLargeFileIsSplitIntoParts() {
    TempDir dir;
    const std::string content = patterned(70);
    testsupport::writeFile(dir / "large.7z", content);

    RecordingS3Store store;
    store.completedTag = testsupport::multipartEtag(content, 32);
    auto tag = store.upload(dir / "large.7z", "archive-bucket", "sales/large.7z", 32);
    assert(tag && *tag == unquoted(store.completedTag));

    assert(store.requests.front().method == "POST" && store.requests.front().url.ends_with("?uploads"));
    auto parts = store.parts();
    assert(parts.size() == 3);
    assert(parts[0]->body.size() == 32 && parts[1]->body.size() == 32 && parts[2]->body.size() == 6);
    assert(parts[0]->body + parts[1]->body + parts[2]->body == content);
    for (std::size_t i = 0; i < parts.size(); ++i) {
        assert(parts[i]->url.find("partNumber=" + std::to_string(i + 1) + "&uploadId=up-1") != std::string::npos);
    }

    const auto& completion = store.requests.back();
    assert(completion.method == "POST" && completion.url.ends_with("?uploadId=up-1"));
    for (std::size_t i = 0; i < parts.size(); ++i) {
        const std::string entry = "<Part><PartNumber>" + std::to_string(i + 1) + "</PartNumber><ETag>\"" +
                                  md5Of(parts[i]->body) + "\"</ETag></Part>";
        assert(completion.body.find(entry) != std::string::npos && "parts are completed in order with their ETags");
    }

    auto plain = contentHash(dir / "large.7z");
    auto composite = compositeHash(dir / "large.7z", 32);
    assert(plain && composite);
    assert(tagsMatch(*tag, *plain, composite->tag()) && "the predicted tag matches what the store reports");
}

void TestExactlyOneChunkIsMultipart() {
    TempDir dir;
    const std::string content = patterned(32);
    testsupport::writeFile(dir / "exact.7z", content);

    RecordingS3Store store;
    store.completedTag = testsupport::multipartEtag(content, 32);
    auto tag = store.upload(dir / "exact.7z", "archive-bucket", "exact.7z", 32);
    assert(tag && tag->ends_with("-1"));
    assert(store.parts().size() == 1);
    auto composite = compositeHash(dir / "exact.7z", 32);
    assert(composite && composite->tag() == *tag);
}

void TestFailedPartAbortsUpload() {
    TempDir dir;
    testsupport::writeFile(dir / "large.7z", patterned(100));

    RecordingS3Store store;
    store.failingPart = 2;
    auto tag = store.upload(dir / "large.7z", "archive-bucket", "large.7z", 32);
    assert(!tag && tag.error().find("Part 2") != std::string::npos);
    assert(store.parts().size() == 2 && "no part is sent after a failure");
    assert(store.requests.back().method == "DELETE" && store.requests.back().url.ends_with("?uploadId=up-1"));
}

void TestCompletionErrorBodyIsAFailure() {
    TempDir dir;
    testsupport::writeFile(dir / "large.7z", patterned(64));

    RecordingS3Store store;
    store.completionError = true;
    auto tag = store.upload(dir / "large.7z", "archive-bucket", "large.7z", 32);
    assert(!tag && "a 200 response carrying an Error body is a failed completion");
    assert(store.requests.back().method == "DELETE");
}

void TestMissingFileSendsNothing() {
    TempDir dir;
    RecordingS3Store store;
    auto tag = store.upload(dir / "absent.7z", "archive-bucket", "absent.7z", 32);
    assert(!tag && store.requests.empty());
}

void TestStoreConfiguration() {
    assert(makeObjectStore(Json::Value()) == nullptr && "no object store configured");

    Json::Value unknown;
    unknown["type"] = "ftp";
    bool threw = false;
    try {
        makeObjectStore(unknown);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw);

    Json::Value incomplete = s3Config();
    incomplete.removeMember("secret_key");
    threw = false;
    try {
        makeObjectStore(incomplete);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw && "S3 needs credentials");

    Json::Value sftp;
    sftp["type"] = "sftp";
    sftp["user"] = "mover";
    threw = false;
    try {
        makeObjectStore(sftp);
    } catch (const ConfigurationError&) {
        threw = true;
    }
    assert(threw && "SFTP needs a host");

    sftp["host"] = "127.0.0.1";
    sftp["port"] = 1;
    sftp["remote_dir"] = "/srv/archives";
    auto store = makeObjectStore(sftp);
    auto* sftpStore = dynamic_cast<SftpObjectStore*>(store.get());
    assert(sftpStore);
    assert(sftpStore->remotePath("archive-bucket", "sales/a.7z") == "/srv/archives/archive-bucket/sales/a.7z");
    assert(sftpStore->remotePath("", "a.7z") == "/srv/archives/a.7z");

    TempDir dir;
    testsupport::writeFile(dir / "a.7z", "payload");
    auto tag = store->upload(dir / "a.7z", "archive-bucket", "a.7z", 32);
    assert(!tag && "an unreachable SFTP host is reported, not thrown");
    auto fetched = store->download("archive-bucket", "a.7z", dir / "b.7z");
    assert(!fetched);
}

} // namespace

int main() {
    TestSmallFileIsOnePut();
    TestLargeFileIsSplitIntoParts();
    TestExactlyOneChunkIsMultipart();
    TestFailedPartAbortsUpload();
    TestCompletionErrorBodyIsAFailure();
    TestMissingFileSendsNothing();
    TestStoreConfiguration();
    std::cout << "object store test ok\n";
    return 0;
}
