/**
 * @file secret_manager.hpp
 * @brief Lifecycle of the per-owner archive secret.
 *
 * An archive secret is generated once per owner (the source database), persisted
 * encrypted, and reused by every later run so that older archives stay readable. A
 * caller may supply its own candidate; a candidate that contradicts the stored secret is
 * a hard failure and never overwrites it.
 */

#ifndef SECRET_MANAGER_HPP
#define SECRET_MANAGER_HPP

#include "freight_errors.hpp"
#include <array>
#include <cstddef>
#include <expected>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

/**
 * @brief Persistence for sealed secrets, one row per owner.
 */
class SecretStore {
public:
    virtual ~SecretStore() = default;

    /**
     * @brief Loads the sealed secret of an owner.
     *
     * @return std::expected<std::optional<std::string>, std::string> The sealed value,
     * std::nullopt when none is stored, or an error message.
     */
    virtual std::expected<std::optional<std::string>, std::string> loadSecret(const std::string& owner) = 0;

    /**
     * @brief Stores a sealed secret unless one is already stored for the owner.
     *
     * An existing value is left untouched and is not an error.
     */
    virtual std::expected<void, std::string> insertSecretIfAbsent(const std::string& owner, const std::string& sealed) = 0;

    /**
     * @brief Removes the stored secret of an owner.
     */
    virtual std::expected<void, std::string> clearSecret(const std::string& owner) = 0;
};

/**
 * @brief AES-256-GCM sealing of secrets under a key derived from a master key.
 *
 * The per-owner key is HKDF-SHA256(masterKey, salt = owner). A sealed value is the hex
 * encoding of nonce, ciphertext and tag.
 */
class SecretCipher {
public:
    /**
     * @brief Constructs a cipher.
     *
     * @param masterKey Master key material. With an empty key every seal and open fails.
     */
    explicit SecretCipher(std::string masterKey);

    std::expected<std::string, std::string> seal(const std::string& owner, const std::string& plaintext) const;

    /**
     * @brief Decrypts a sealed value.
     *
     * @return std::expected<std::string, std::string> The plaintext, or an error when the
     * value is malformed or fails authentication.
     */
    std::expected<std::string, std::string> open(const std::string& owner, const std::string& sealed) const;

private:
    std::expected<std::array<unsigned char, 32>, std::string> deriveKey(const std::string& owner) const;

    std::string masterKey;
};

/**
 * @brief Composition rules for generated secrets.
 */
struct SecretPolicy {
    std::size_t length = 128;
    std::size_t minLowercase = 1;
    std::size_t minUppercase = 1;
    std::size_t minDigits = 3;
};

/**
 * @brief Characters a generated secret is drawn from: letters and digits without 0, O and l.
 */
std::string_view secretAlphabet();

/**
 * @brief Generates a secret satisfying the policy from a CSPRNG.
 *
 * @return std::expected<std::string, std::string> The secret, or an error if the policy
 * cannot be satisfied or the random source fails.
 */
std::expected<std::string, std::string> generateSecret(const SecretPolicy& policy);

/**
 * @brief Checks a secret against the policy and the alphabet.
 */
bool satisfiesPolicy(std::string_view secret, const SecretPolicy& policy);

/**
 * @brief A resolved secret together with its sealed, stored form.
 */
struct ResolvedSecret {
    std::string value;
    std::string sealed;
};

/**
 * @brief Reconciles a caller candidate with the stored secret of an owner.
 *
 * | candidate | stored | result                                  |
 * |-----------|--------|-----------------------------------------|
 * | X         | X      | X                                       |
 * | X         | none   | X, persisted                            |
 * | none      | Y      | Y                                       |
 * | none      | none   | new secret, persisted                   |
 * | X         | Y != X | SecretConflict, nothing written          |
 *
 * Persistence is insert-if-absent followed by a read-back, so concurrent resolvers of
 * the same owner, in this process or another, converge on a single stored secret.
 */
class SecretManager {
public:
    SecretManager(SecretStore& store, SecretCipher cipher, SecretPolicy policy);

    std::expected<ResolvedSecret, Failure> resolve(const std::string& owner, const std::optional<std::string>& candidate);

    /**
     * @brief Opens a sealed value found elsewhere (e.g., an archive log record).
     */
    std::expected<std::string, Failure> unseal(const std::string& owner, const std::string& sealed) const;

    /**
     * @brief Drops the owner's stored secret; the next resolve starts over.
     */
    std::expected<void, std::string> forget(const std::string& owner);

private:
    std::expected<ResolvedSecret, Failure> reconcile(const std::string& owner, const std::string& sealed,
                                                     const std::optional<std::string>& candidate) const;

    SecretStore& store;
    SecretCipher cipher;
    SecretPolicy policy;
    std::mutex mutex;
};

#endif // SECRET_MANAGER_HPP
