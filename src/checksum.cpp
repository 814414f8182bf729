#include "checksum.hpp"
#include <algorithm>
#include <array>
#include <format>
#include <fstream>
#include <memory>
#include <vector>
#include <openssl/evp.h>

namespace {

constexpr std::size_t kReadBlockSize = 8192;

struct MdContextDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

using MdContextPtr = std::unique_ptr<EVP_MD_CTX, MdContextDeleter>;

class Md5 {
public:
    Md5() : ctx(EVP_MD_CTX_new()) {
        ok = ctx && EVP_DigestInit_ex(ctx.get(), EVP_md5(), nullptr) == 1;
    }

    void update(const void* data, std::size_t size) {
        if (ok && size > 0) {
            ok = EVP_DigestUpdate(ctx.get(), data, size) == 1;
        }
    }

    std::expected<std::array<unsigned char, 16>, std::string> finish() {
        std::array<unsigned char, 16> digest{};
        unsigned int length = 0;
        if (!ok || EVP_DigestFinal_ex(ctx.get(), digest.data(), &length) != 1 || length != digest.size()) {
            return std::unexpected("MD5 digest computation failed");
        }
        return digest;
    }

private:
    MdContextPtr ctx;
    bool ok = false;
};

std::string toHex(const std::array<unsigned char, 16>& digest) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(digest.size() * 2);
    for (unsigned char byte : digest) {
        hex.push_back(kHex[byte >> 4]);
        hex.push_back(kHex[byte & 0x0F]);
    }
    return hex;
}

std::string_view stripQuotes(std::string_view tag) {
    while (!tag.empty() && tag.front() == '"') {
        tag.remove_prefix(1);
    }
    while (!tag.empty() && tag.back() == '"') {
        tag.remove_suffix(1);
    }
    return tag;
}

} // namespace

class ContentHasher::Impl {
public:
    Md5 md5;
};

ContentHasher::ContentHasher() : impl(std::make_unique<Impl>()) {}

ContentHasher::~ContentHasher() = default;

void ContentHasher::update(const void* data, std::size_t size) {
    impl->md5.update(data, size);
}

std::expected<std::string, std::string> ContentHasher::finish() {
    auto digest = impl->md5.finish();
    if (!digest) {
        return std::unexpected(digest.error());
    }
    return toHex(*digest);
}

std::string CompositeHash::tag() const {
    if (!multipart) {
        return digest;
    }
    return std::format("{}-{}", digest, chunkCount);
}

std::expected<std::string, std::string> contentHash(const std::filesystem::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("Failed to open file for hashing: {}", path.string()));
    }

    ContentHasher hasher;
    std::array<char, kReadBlockSize> buf;
    while (file) {
        file.read(buf.data(), buf.size());
        hasher.update(buf.data(), static_cast<std::size_t>(file.gcount()));
    }
    if (file.bad()) {
        return std::unexpected(std::format("Read error while hashing: {}", path.string()));
    }
    return hasher.finish();
}

std::expected<CompositeHash, std::string> compositeHash(const std::filesystem::path& path, std::size_t chunkSize) {
    if (chunkSize == 0) {
        return std::unexpected("Chunk size must be positive");
    }

    std::error_code ec;
    const auto fileSize = std::filesystem::file_size(path, ec);
    if (ec) {
        return std::unexpected(std::format("Failed to stat {}: {}", path.string(), ec.message()));
    }

    // Below the multipart threshold the object store reports the plain digest
    if (fileSize < chunkSize) {
        auto plain = contentHash(path);
        if (!plain) {
            return std::unexpected(plain.error());
        }
        return CompositeHash{*plain, fileSize == 0 ? 0u : 1u, false};
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return std::unexpected(std::format("Failed to open file for hashing: {}", path.string()));
    }

    std::vector<unsigned char> chunkDigests;
    std::size_t chunkCount = 0;
    std::array<char, kReadBlockSize> buf;
    while (true) {
        Md5 chunkMd5;
        std::size_t remaining = chunkSize;
        std::size_t chunkBytes = 0;
        while (remaining > 0 && file) {
            const auto want = std::min(remaining, buf.size());
            file.read(buf.data(), static_cast<std::streamsize>(want));
            const auto got = static_cast<std::size_t>(file.gcount());
            chunkMd5.update(buf.data(), got);
            chunkBytes += got;
            remaining -= got;
        }
        if (file.bad()) {
            return std::unexpected(std::format("Read error while hashing: {}", path.string()));
        }
        if (chunkBytes == 0) {
            break;
        }
        auto digest = chunkMd5.finish();
        if (!digest) {
            return std::unexpected(digest.error());
        }
        chunkDigests.insert(chunkDigests.end(), digest->begin(), digest->end());
        ++chunkCount;
        if (chunkBytes < chunkSize) {
            break;
        }
    }

    Md5 outer;
    outer.update(chunkDigests.data(), chunkDigests.size());
    auto digest = outer.finish();
    if (!digest) {
        return std::unexpected(digest.error());
    }
    return CompositeHash{toHex(*digest), chunkCount, true};
}

bool tagsMatch(std::string_view remoteTag, std::string_view plainDigest, std::string_view compositeDigest) {
    const auto tag = stripQuotes(remoteTag);
    if (tag.empty()) {
        return false;
    }
    return (!plainDigest.empty() && tag == plainDigest) || (!compositeDigest.empty() && tag == compositeDigest);
}
