#include "checksum.hpp"
#include "test_support.hpp"
#include <cassert>
#include <iostream>
#include <string>
#include <thread>
#include <vector>

namespace {

using testsupport::TempDir;
using testsupport::writeFile;

void TestContentHashKnownValues() {
    TempDir dir;
    writeFile(dir / "empty", "");
    writeFile(dir / "abc", "abc");
    assert(contentHash(dir / "empty").value() == "d41d8cd98f00b204e9800998ecf8427e" && "md5 of empty input");
    assert(contentHash(dir / "abc").value() == "900150983cd24fb0d6963f7d28e17f72" && "md5 of abc");
}

void TestContentHashSpansReadBlocks() {
    TempDir dir;
    std::string big(3 * 8192 + 17, 'x');
    writeFile(dir / "big", big);

    ContentHasher hasher;
    hasher.update(big.data(), 100);
    hasher.update(big.data() + 100, big.size() - 100);
    assert(contentHash(dir / "big").value() == hasher.finish().value() && "streamed and incremental digests agree");
}

void TestContentHashMissingFile() {
    TempDir dir;
    auto digest = contentHash(dir / "missing");
    assert(!digest && "unreadable files are errors");
    assert(digest.error().find("missing") != std::string::npos);
}

void TestCompositeBelowOneChunkIsPlain() {
    TempDir dir;
    writeFile(dir / "small", std::string(1000, 'a'));
    auto plain = contentHash(dir / "small").value();
    auto composite = compositeHash(dir / "small", 4096).value();
    assert(composite.digest == plain && "below one chunk the prediction is the plain digest");
    assert(composite.chunkCount == 1 && !composite.multipart);
    assert(composite.tag() == plain);
}

void TestCompositeExactlyOneChunk() {
    TempDir dir;
    writeFile(dir / "one", std::string(1024, 'c'));
    auto composite = compositeHash(dir / "one", 1024).value();
    assert(composite.multipart && composite.chunkCount == 1);
    assert(composite.tag() == "78e9cfab142ef6e02ddfd5f17737682e-1" && "one full chunk is a one-part upload");
}

void TestCompositeMultipart() {
    TempDir dir;
    // 2.5 chunks of 1 KiB
    writeFile(dir / "parts", std::string(2560, 'b'));
    auto composite = compositeHash(dir / "parts", 1024).value();
    assert(composite.chunkCount == 3 && "partial last chunk counts");
    assert(composite.multipart);
    assert(composite.digest == "ac05208f4a27b04f1326eb1f71602f7a");
    assert(composite.tag() == "ac05208f4a27b04f1326eb1f71602f7a-3" && "the part count is appended once");
    assert(tagsMatch("\"ac05208f4a27b04f1326eb1f71602f7a-3\"", contentHash(dir / "parts").value(), composite.tag()));

    auto again = compositeHash(dir / "parts", 1024).value();
    assert(again.digest == composite.digest && "prediction is reproducible");

    auto other = compositeHash(dir / "parts", 2048).value();
    assert(other.digest != composite.digest && other.chunkCount == 2 && "chunk size changes the prediction");
}

void TestCompositeRejectsZeroChunk() {
    TempDir dir;
    writeFile(dir / "f", "data");
    assert(!compositeHash(dir / "f", 0) && "zero chunk size is an error");
}

void TestTagsMatch() {
    const std::string plain = "900150983cd24fb0d6963f7d28e17f72";
    const std::string composite = "0123456789abcdef0123456789abcdef-3";
    assert(tagsMatch("\"" + plain + "\"", plain, composite) && "quoted plain tag matches");
    assert(tagsMatch(composite, plain, composite) && "composite tag matches");
    assert(tagsMatch("\"" + composite + "\"", plain, composite));
    assert(!tagsMatch("\"ffff\"", plain, composite) && "foreign tag does not match");
    assert(!tagsMatch("", plain, composite) && "an empty tag never matches");
    assert(!tagsMatch("\"\"", "", "") && "nothing to compare against");
}

void TestConcurrentHashing() {
    TempDir dir;
    writeFile(dir / "shared", std::string(50000, 'z'));
    const auto expected = contentHash(dir / "shared").value();
    std::vector<std::thread> threads;
    std::vector<std::string> results(4);
    for (std::size_t i = 0; i < results.size(); ++i) {
        threads.emplace_back([&, i] { results[i] = contentHash(dir / "shared").value(); });
    }
    for (auto& thread : threads) {
        thread.join();
    }
    for (const auto& result : results) {
        assert(result == expected && "hashing is safe to call concurrently");
    }
}

} // namespace

int main() {
    TestContentHashKnownValues();
    TestContentHashSpansReadBlocks();
    TestContentHashMissingFile();
    TestCompositeBelowOneChunkIsPlain();
    TestCompositeExactlyOneChunk();
    TestCompositeMultipart();
    TestCompositeRejectsZeroChunk();
    TestTagsMatch();
    TestConcurrentHashing();
    std::cout << "checksum test ok\n";
    return 0;
}
