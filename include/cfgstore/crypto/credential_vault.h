#pragma once

#include <cfgstore/core/types.h>

#include <memory>
#include <string>
#include <string_view>

namespace cfgstore::crypto {

/**
 * @brief Field-level envelope encryption for stored secrets
 *
 * Envelope: `ENC:v1:` + base64(nonce[12] || ciphertext || tag[16]) using
 * AES-256-GCM. Values without the prefix are legacy plaintext.
 *
 * The key is fixed at construction and every call uses its own cipher
 * context, so one instance may be shared freely across threads.
 */
class CredentialVault {
public:
    static constexpr std::string_view kEnvelopePrefix = "ENC:v1:";
    static constexpr size_t kKeySize = 32;
    static constexpr size_t kNonceSize = 12;
    static constexpr size_t kTagSize = 16;

    /// Vault without key material: both directions are the identity
    CredentialVault();
    ~CredentialVault();

    CredentialVault(const CredentialVault&) = delete;
    CredentialVault& operator=(const CredentialVault&) = delete;

    /// Key given as base64 of exactly 32 bytes
    static Result<std::shared_ptr<CredentialVault>> fromBase64Key(std::string_view base64Key);

    /// Key derived as SHA-256 of the passphrase
    static Result<std::shared_ptr<CredentialVault>> fromPassphrase(std::string_view passphrase);

    /**
     * @brief Pick the key source from configuration values
     *
     * A base64 key wins over a passphrase; neither yields a keyless vault.
     */
    static Result<std::shared_ptr<CredentialVault>> fromSettings(std::string_view base64Key,
                                                                 std::string_view passphrase);

    [[nodiscard]] bool hasKey() const noexcept;

    /**
     * @brief Encrypt a value for storage
     *
     * Empty input stays empty. On failure the plaintext is returned and a
     * warning is logged.
     */
    std::string encryptForStorage(const std::string& plaintext) const;

    /**
     * @brief Decrypt a stored value
     *
     * Non-envelope values pass through. On failure (corrupt envelope, wrong
     * key, bad tag) the stored value is returned unchanged with a warning.
     */
    std::string decryptFromStorage(const std::string& stored) const;

    static bool isEncryptedStorageValue(std::string_view value) noexcept;

    /// Strict variants reporting CryptoError instead of degrading
    Result<std::string> encrypt(const std::string& plaintext) const;
    Result<std::string> decrypt(const std::string& envelope) const;

private:
    struct Impl;
    std::unique_ptr<Impl> pImpl;

    explicit CredentialVault(std::unique_ptr<Impl> impl);
};

} // namespace cfgstore::crypto
