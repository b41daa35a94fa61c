#include <openssl/evp.h>
#include <spdlog/spdlog.h>
#include <algorithm>
#include <array>
#include <cfgstore/crypto/credential_vault.h>
#include <cfgstore/crypto/encoding.h>

namespace cfgstore::crypto {

namespace {

struct CipherCtx {
    EVP_CIPHER_CTX* ctx = EVP_CIPHER_CTX_new();
    ~CipherCtx() {
        if (ctx)
            EVP_CIPHER_CTX_free(ctx);
    }
    CipherCtx() = default;
    CipherCtx(const CipherCtx&) = delete;
    CipherCtx& operator=(const CipherCtx&) = delete;
};

} // namespace

struct CredentialVault::Impl {
    bool hasKey = false;
    std::array<uint8_t, kKeySize> key{};
};

CredentialVault::CredentialVault() : pImpl(std::make_unique<Impl>()) {}

CredentialVault::CredentialVault(std::unique_ptr<Impl> impl) : pImpl(std::move(impl)) {}

CredentialVault::~CredentialVault() = default;

Result<std::shared_ptr<CredentialVault>>
CredentialVault::fromBase64Key(std::string_view base64Key) {
    auto decoded = base64Decode(base64Key);
    if (!decoded) {
        return Error{ErrorCode::InvalidArgument,
                     "Vault key is not valid base64: " + decoded.error().message};
    }
    const auto& bytes = decoded.value();
    if (bytes.size() != kKeySize) {
        return Error{ErrorCode::InvalidArgument,
                     fmt::format("Vault key must be {} bytes, got {}", kKeySize, bytes.size())};
    }

    auto impl = std::make_unique<Impl>();
    std::copy(bytes.begin(), bytes.end(), impl->key.begin());
    impl->hasKey = true;
    return std::shared_ptr<CredentialVault>(new CredentialVault(std::move(impl)));
}

Result<std::shared_ptr<CredentialVault>>
CredentialVault::fromPassphrase(std::string_view passphrase) {
    if (passphrase.empty()) {
        return Error{ErrorCode::InvalidArgument, "Vault passphrase is empty"};
    }

    auto impl = std::make_unique<Impl>();
    unsigned int len = 0;
    if (EVP_Digest(passphrase.data(), passphrase.size(), impl->key.data(), &len, EVP_sha256(),
                   nullptr) != 1 ||
        len != kKeySize) {
        return Error{ErrorCode::CryptoError, "Failed to derive vault key"};
    }
    impl->hasKey = true;
    return std::shared_ptr<CredentialVault>(new CredentialVault(std::move(impl)));
}

Result<std::shared_ptr<CredentialVault>>
CredentialVault::fromSettings(std::string_view base64Key, std::string_view passphrase) {
    if (!base64Key.empty()) {
        return fromBase64Key(base64Key);
    }
    if (!passphrase.empty()) {
        return fromPassphrase(passphrase);
    }
    return std::make_shared<CredentialVault>();
}

bool CredentialVault::hasKey() const noexcept {
    return pImpl->hasKey;
}

bool CredentialVault::isEncryptedStorageValue(std::string_view value) noexcept {
    return value.size() > kEnvelopePrefix.size() && value.substr(0, kEnvelopePrefix.size()) ==
                                                        kEnvelopePrefix;
}

Result<std::string> CredentialVault::encrypt(const std::string& plaintext) const {
    if (!pImpl->hasKey) {
        return Error{ErrorCode::NotInitialized, "Vault has no key material"};
    }

    auto nonceResult = randomBytes(kNonceSize);
    if (!nonceResult) {
        return nonceResult.error();
    }
    const auto& nonce = nonceResult.value();

    CipherCtx c;
    if (!c.ctx) {
        return Error{ErrorCode::CryptoError, "Failed to create cipher context"};
    }

    // nonce || ciphertext || tag
    std::vector<uint8_t> out(kNonceSize + plaintext.size() + kTagSize);
    std::copy(nonce.begin(), nonce.end(), out.begin());

    int len = 0;
    int total = 0;
    if (EVP_EncryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize),
                            nullptr) != 1 ||
        EVP_EncryptInit_ex(c.ctx, nullptr, nullptr, pImpl->key.data(), nonce.data()) != 1) {
        return Error{ErrorCode::CryptoError, "Failed to initialize AES-256-GCM"};
    }
    if (EVP_EncryptUpdate(c.ctx, out.data() + kNonceSize, &len,
                          reinterpret_cast<const unsigned char*>(plaintext.data()),
                          static_cast<int>(plaintext.size())) != 1) {
        return Error{ErrorCode::CryptoError, "Encryption failed"};
    }
    total = len;
    if (EVP_EncryptFinal_ex(c.ctx, out.data() + kNonceSize + total, &len) != 1) {
        return Error{ErrorCode::CryptoError, "Encryption finalization failed"};
    }
    total += len;
    if (EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_GET_TAG, static_cast<int>(kTagSize),
                            out.data() + kNonceSize + total) != 1) {
        return Error{ErrorCode::CryptoError, "Failed to read GCM tag"};
    }
    out.resize(kNonceSize + static_cast<size_t>(total) + kTagSize);

    return std::string(kEnvelopePrefix) + base64Encode(out);
}

Result<std::string> CredentialVault::decrypt(const std::string& envelope) const {
    if (!pImpl->hasKey) {
        return Error{ErrorCode::NotInitialized, "Vault has no key material"};
    }
    if (!isEncryptedStorageValue(envelope)) {
        return Error{ErrorCode::InvalidData, "Value is not an encrypted envelope"};
    }

    auto decoded = base64Decode(std::string_view(envelope).substr(kEnvelopePrefix.size()));
    if (!decoded) {
        return Error{ErrorCode::CryptoError, "Corrupt envelope: " + decoded.error().message};
    }
    const auto& raw = decoded.value();
    if (raw.size() < kNonceSize + kTagSize) {
        return Error{ErrorCode::CryptoError, "Corrupt envelope: too short"};
    }

    const size_t cipherLen = raw.size() - kNonceSize - kTagSize;
    const uint8_t* nonce = raw.data();
    const uint8_t* cipher = raw.data() + kNonceSize;
    std::array<uint8_t, kTagSize> tag{};
    std::copy(raw.end() - kTagSize, raw.end(), tag.begin());

    CipherCtx c;
    if (!c.ctx) {
        return Error{ErrorCode::CryptoError, "Failed to create cipher context"};
    }

    std::string plain(cipherLen, '\0');
    int len = 0;
    int total = 0;
    if (EVP_DecryptInit_ex(c.ctx, EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
        EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(kNonceSize),
                            nullptr) != 1 ||
        EVP_DecryptInit_ex(c.ctx, nullptr, nullptr, pImpl->key.data(), nonce) != 1) {
        return Error{ErrorCode::CryptoError, "Failed to initialize AES-256-GCM"};
    }
    if (cipherLen > 0 &&
        EVP_DecryptUpdate(c.ctx, reinterpret_cast<unsigned char*>(plain.data()), &len, cipher,
                          static_cast<int>(cipherLen)) != 1) {
        return Error{ErrorCode::CryptoError, "Decryption failed"};
    }
    total = len;
    if (EVP_CIPHER_CTX_ctrl(c.ctx, EVP_CTRL_GCM_SET_TAG, static_cast<int>(kTagSize),
                            tag.data()) != 1) {
        return Error{ErrorCode::CryptoError, "Failed to set GCM tag"};
    }
    if (EVP_DecryptFinal_ex(c.ctx, reinterpret_cast<unsigned char*>(plain.data()) + total, &len) !=
        1) {
        return Error{ErrorCode::CryptoError, "Authentication failed (wrong key or tampered value)"};
    }
    total += len;
    plain.resize(static_cast<size_t>(total));
    return plain;
}

std::string CredentialVault::encryptForStorage(const std::string& plaintext) const {
    if (!pImpl->hasKey || plaintext.empty()) {
        return plaintext;
    }
    auto result = encrypt(plaintext);
    if (!result) {
        spdlog::warn("Credential encryption failed, storing plaintext: {}", result.error().message);
        return plaintext;
    }
    return std::move(result).value();
}

std::string CredentialVault::decryptFromStorage(const std::string& stored) const {
    if (!pImpl->hasKey || stored.empty() || !isEncryptedStorageValue(stored)) {
        return stored;
    }
    auto result = decrypt(stored);
    if (!result) {
        spdlog::warn("Credential decryption failed, returning stored value: {}",
                     result.error().message);
        return stored;
    }
    return std::move(result).value();
}

} // namespace cfgstore::crypto
