#include "secret_manager.hpp"
#include <algorithm>
#include <format>
#include <memory>
#include <utility>
#include <vector>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/kdf.h>
#include <openssl/rand.h>

namespace {

constexpr std::size_t kNonceSize = 12;
constexpr std::size_t kTagSize = 16;
constexpr std::string_view kAlphabet = "abcdefghijkmnopqrstuvwxyzABCDEFGHIJKLMNPQRSTUVWXYZ123456789";
constexpr std::string_view kResolveStage = "ResolveSecret";

std::string buildOpenSSLErrorMessage(const char* context) {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return std::format("{}: unknown OpenSSL error", context);
    }
    char buf[256] = {0};
    ERR_error_string_n(err, buf, sizeof(buf));
    return std::format("{}: {}", context, buf);
}

struct CipherContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const noexcept { EVP_CIPHER_CTX_free(ctx); }
};

using CipherCtxPtr = std::unique_ptr<EVP_CIPHER_CTX, CipherContextDeleter>;

std::string toHex(const std::vector<unsigned char>& bytes) {
    static constexpr char kHex[] = "0123456789abcdef";
    std::string hex;
    hex.reserve(bytes.size() * 2);
    for (unsigned char byte : bytes) {
        hex.push_back(kHex[byte >> 4]);
        hex.push_back(kHex[byte & 0x0F]);
    }
    return hex;
}

std::optional<std::vector<unsigned char>> fromHex(std::string_view hex) {
    if (hex.size() % 2 != 0) {
        return std::nullopt;
    }
    auto nibble = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::vector<unsigned char> bytes;
    bytes.reserve(hex.size() / 2);
    for (std::size_t i = 0; i < hex.size(); i += 2) {
        int high = nibble(hex[i]);
        int low = nibble(hex[i + 1]);
        if (high < 0 || low < 0) {
            return std::nullopt;
        }
        bytes.push_back(static_cast<unsigned char>((high << 4) | low));
    }
    return bytes;
}

bool isLower(char c) { return c >= 'a' && c <= 'z'; }
bool isUpper(char c) { return c >= 'A' && c <= 'Z'; }
bool isDigit(char c) { return c >= '0' && c <= '9'; }

} // namespace

SecretCipher::SecretCipher(std::string masterKey) : masterKey(std::move(masterKey)) {}

std::expected<std::array<unsigned char, 32>, std::string> SecretCipher::deriveKey(const std::string& owner) const {
    if (masterKey.empty()) {
        return std::unexpected("secret_key is not configured");
    }
    std::array<unsigned char, 32> out{};
    std::unique_ptr<EVP_PKEY_CTX, decltype(&EVP_PKEY_CTX_free)> ctx(EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF, nullptr),
                                                                   &EVP_PKEY_CTX_free);
    if (!ctx) {
        return std::unexpected(buildOpenSSLErrorMessage("EVP_PKEY_CTX_new_id(EVP_PKEY_HKDF)"));
    }

    static constexpr std::string_view kInfo = "datafreight archive secret";
    const auto* salt = reinterpret_cast<const unsigned char*>(owner.data());
    const auto* ikm = reinterpret_cast<const unsigned char*>(masterKey.data());
    const auto* info = reinterpret_cast<const unsigned char*>(kInfo.data());

    if (EVP_PKEY_derive_init(ctx.get()) <= 0 ||
        EVP_PKEY_CTX_set_hkdf_md(ctx.get(), EVP_sha256()) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_salt(ctx.get(), owner.empty() ? nullptr : salt, static_cast<int>(owner.size())) <= 0 ||
        EVP_PKEY_CTX_set1_hkdf_key(ctx.get(), ikm, static_cast<int>(masterKey.size())) <= 0 ||
        EVP_PKEY_CTX_add1_hkdf_info(ctx.get(), info, static_cast<int>(kInfo.size())) <= 0) {
        return std::unexpected(buildOpenSSLErrorMessage("HKDF setup"));
    }
    std::size_t len = out.size();
    if (EVP_PKEY_derive(ctx.get(), out.data(), &len) <= 0 || len != out.size()) {
        return std::unexpected(buildOpenSSLErrorMessage("HKDF derive"));
    }
    return out;
}

std::expected<std::string, std::string> SecretCipher::seal(const std::string& owner, const std::string& plaintext) const {
    auto key = deriveKey(owner);
    if (!key) {
        return std::unexpected(key.error());
    }

    std::vector<unsigned char> sealed(kNonceSize + plaintext.size() + kTagSize);
    if (RAND_bytes(sealed.data(), static_cast<int>(kNonceSize)) != 1) {
        return std::unexpected(buildOpenSSLErrorMessage("RAND_bytes"));
    }

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected("Failed to allocate AES-GCM context");
    }
    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key->data(), sealed.data()) != 1) {
        return std::unexpected(buildOpenSSLErrorMessage("EVP_EncryptInit_ex"));
    }

    int len = 0;
    int total = 0;
    unsigned char* cipherOut = sealed.data() + kNonceSize;
    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), cipherOut, &len, reinterpret_cast<const unsigned char*>(plaintext.data()),
                              static_cast<int>(plaintext.size())) != 1) {
            return std::unexpected(buildOpenSSLErrorMessage("EVP_EncryptUpdate"));
        }
        total = len;
    }
    if (EVP_EncryptFinal_ex(ctx.get(), cipherOut + total, &len) != 1) {
        return std::unexpected(buildOpenSSLErrorMessage("EVP_EncryptFinal_ex"));
    }
    total += len;
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize), cipherOut + total) != 1) {
        return std::unexpected(buildOpenSSLErrorMessage("EVP_CTRL_GCM_GET_TAG"));
    }
    sealed.resize(kNonceSize + static_cast<std::size_t>(total) + kTagSize);
    return toHex(sealed);
}

std::expected<std::string, std::string> SecretCipher::open(const std::string& owner, const std::string& sealedHex) const {
    auto sealed = fromHex(sealedHex);
    if (!sealed || sealed->size() < kNonceSize + kTagSize) {
        return std::unexpected("Stored secret is malformed");
    }
    auto key = deriveKey(owner);
    if (!key) {
        return std::unexpected(key.error());
    }

    const std::size_t cipherSize = sealed->size() - kNonceSize - kTagSize;
    const unsigned char* nonce = sealed->data();
    const unsigned char* cipherIn = nonce + kNonceSize;
    unsigned char* tag = sealed->data() + kNonceSize + cipherSize;

    CipherCtxPtr ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected("Failed to allocate AES-GCM context");
    }
    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize), nullptr) != 1 ||
        EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key->data(), nonce) != 1) {
        return std::unexpected(buildOpenSSLErrorMessage("EVP_DecryptInit_ex"));
    }

    std::string plaintext(cipherSize, '\0');
    int len = 0;
    int total = 0;
    if (cipherSize > 0) {
        if (EVP_DecryptUpdate(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()), &len, cipherIn,
                              static_cast<int>(cipherSize)) != 1) {
            return std::unexpected(buildOpenSSLErrorMessage("EVP_DecryptUpdate"));
        }
        total = len;
    }
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize), tag) != 1) {
        return std::unexpected(buildOpenSSLErrorMessage("EVP_CTRL_GCM_SET_TAG"));
    }
    if (EVP_DecryptFinal_ex(ctx.get(), reinterpret_cast<unsigned char*>(plaintext.data()) + total, &len) != 1) {
        return std::unexpected("Stored secret failed authentication");
    }
    plaintext.resize(static_cast<std::size_t>(total + len));
    return plaintext;
}

std::string_view secretAlphabet() {
    return kAlphabet;
}

std::expected<std::string, std::string> generateSecret(const SecretPolicy& policy) {
    if (policy.length < policy.minLowercase + policy.minUppercase + policy.minDigits) {
        return std::unexpected(std::format("Secret length {} cannot satisfy the composition rules", policy.length));
    }

    // Rejection sampling keeps every character equally likely
    const auto alphabetSize = static_cast<unsigned>(kAlphabet.size());
    const unsigned limit = 256 - (256 % alphabetSize);
    std::array<unsigned char, 256> pool{};

    while (true) {
        std::string secret;
        secret.reserve(policy.length);
        while (secret.size() < policy.length) {
            if (RAND_bytes(pool.data(), static_cast<int>(pool.size())) != 1) {
                return std::unexpected(buildOpenSSLErrorMessage("RAND_bytes"));
            }
            for (unsigned char byte : pool) {
                if (byte < limit && secret.size() < policy.length) {
                    secret.push_back(kAlphabet[byte % alphabetSize]);
                }
            }
        }
        if (satisfiesPolicy(secret, policy)) {
            return secret;
        }
    }
}

bool satisfiesPolicy(std::string_view secret, const SecretPolicy& policy) {
    if (secret.size() < policy.length) {
        return false;
    }
    if (std::any_of(secret.begin(), secret.end(), [](char c) { return kAlphabet.find(c) == std::string_view::npos; })) {
        return false;
    }
    const auto lower = static_cast<std::size_t>(std::count_if(secret.begin(), secret.end(), isLower));
    const auto upper = static_cast<std::size_t>(std::count_if(secret.begin(), secret.end(), isUpper));
    const auto digits = static_cast<std::size_t>(std::count_if(secret.begin(), secret.end(), isDigit));
    return lower >= policy.minLowercase && upper >= policy.minUppercase && digits >= policy.minDigits;
}

SecretManager::SecretManager(SecretStore& store, SecretCipher cipher, SecretPolicy policy)
    : store(store), cipher(std::move(cipher)), policy(policy) {}

std::expected<ResolvedSecret, Failure> SecretManager::reconcile(const std::string& owner, const std::string& sealed,
                                                                const std::optional<std::string>& candidate) const {
    auto stored = cipher.open(owner, sealed);
    if (!stored) {
        return std::unexpected(Failure{ErrorKind::Integrity, std::string(kResolveStage),
                                       std::format("Stored secret for {} is unreadable: {}", owner, stored.error())});
    }
    if (candidate && *candidate != *stored) {
        return std::unexpected(Failure{ErrorKind::SecretConflict, std::string(kResolveStage),
                                       std::format("Supplied secret does not match the stored secret for {}", owner)});
    }
    return ResolvedSecret{*stored, sealed};
}

std::expected<ResolvedSecret, Failure> SecretManager::resolve(const std::string& owner,
                                                              const std::optional<std::string>& candidate) {
    std::optional<std::string> supplied = candidate;
    if (supplied && supplied->empty()) {
        supplied.reset();
    }

    std::lock_guard<std::mutex> lock(mutex);

    auto existing = store.loadSecret(owner);
    if (!existing) {
        return std::unexpected(Failure{ErrorKind::Ledger, std::string(kResolveStage), existing.error()});
    }
    if (*existing) {
        return reconcile(owner, **existing, supplied);
    }

    std::string value;
    if (supplied) {
        value = *supplied;
    } else {
        auto generated = generateSecret(policy);
        if (!generated) {
            return std::unexpected(Failure{ErrorKind::Integrity, std::string(kResolveStage), generated.error()});
        }
        value = *generated;
    }

    auto sealed = cipher.seal(owner, value);
    if (!sealed) {
        return std::unexpected(Failure{ErrorKind::Integrity, std::string(kResolveStage), sealed.error()});
    }
    if (auto inserted = store.insertSecretIfAbsent(owner, *sealed); !inserted) {
        return std::unexpected(Failure{ErrorKind::Ledger, std::string(kResolveStage), inserted.error()});
    }

    // Another process may have stored its secret first; the stored row wins
    auto readBack = store.loadSecret(owner);
    if (!readBack) {
        return std::unexpected(Failure{ErrorKind::Ledger, std::string(kResolveStage), readBack.error()});
    }
    if (!*readBack) {
        return std::unexpected(Failure{ErrorKind::Ledger, std::string(kResolveStage),
                                       std::format("Secret for {} vanished after insert", owner)});
    }
    if (**readBack == *sealed) {
        return ResolvedSecret{value, *sealed};
    }
    return reconcile(owner, **readBack, supplied);
}

std::expected<std::string, Failure> SecretManager::unseal(const std::string& owner, const std::string& sealed) const {
    auto opened = cipher.open(owner, sealed);
    if (!opened) {
        return std::unexpected(Failure{ErrorKind::Integrity, std::string(kResolveStage), opened.error()});
    }
    return *opened;
}

std::expected<void, std::string> SecretManager::forget(const std::string& owner) {
    std::lock_guard<std::mutex> lock(mutex);
    return store.clearSecret(owner);
}
