#include <openssl/evp.h>
#include <openssl/rand.h>
#include <cfgstore/crypto/encoding.h>

namespace cfgstore::crypto {

std::string base64Encode(std::span<const uint8_t> data) {
    if (data.empty()) {
        return {};
    }
    std::string out(4 * ((data.size() + 2) / 3), '\0');
    int written = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(out.data()), data.data(),
                                  static_cast<int>(data.size()));
    out.resize(static_cast<size_t>(written));
    return out;
}

Result<std::vector<uint8_t>> base64Decode(std::string_view encoded) {
    if (encoded.empty()) {
        return std::vector<uint8_t>{};
    }
    if (encoded.size() % 4 != 0) {
        return Error{ErrorCode::InvalidData, "base64 length is not a multiple of 4"};
    }

    std::vector<uint8_t> out(3 * (encoded.size() / 4));
    int written = EVP_DecodeBlock(out.data(), reinterpret_cast<const unsigned char*>(encoded.data()),
                                  static_cast<int>(encoded.size()));
    if (written < 0) {
        return Error{ErrorCode::InvalidData, "Malformed base64"};
    }

    // EVP_DecodeBlock keeps the zero bytes produced by padding
    size_t padding = 0;
    if (encoded.back() == '=') {
        padding++;
        if (encoded[encoded.size() - 2] == '=')
            padding++;
    }
    out.resize(static_cast<size_t>(written) - padding);
    return out;
}

std::string base32Encode(std::span<const uint8_t> data) {
    static constexpr char kAlphabet[] = "ABCDEFGHIJKLMNOPQRSTUVWXYZ234567";

    std::string out;
    out.reserve((data.size() + 4) / 5 * 8);

    uint32_t buffer = 0;
    int bits = 0;
    for (uint8_t byte : data) {
        buffer = (buffer << 8) | byte;
        bits += 8;
        while (bits >= 5) {
            out.push_back(kAlphabet[(buffer >> (bits - 5)) & 0x1f]);
            bits -= 5;
        }
    }
    if (bits > 0) {
        out.push_back(kAlphabet[(buffer << (5 - bits)) & 0x1f]);
    }
    while (out.size() % 8 != 0) {
        out.push_back('=');
    }
    return out;
}

Result<std::vector<uint8_t>> randomBytes(size_t count) {
    std::vector<uint8_t> out(count);
    if (count > 0 && RAND_bytes(out.data(), static_cast<int>(count)) != 1) {
        return Error{ErrorCode::CryptoError, "RAND_bytes failed"};
    }
    return out;
}

Result<std::string> generateOtpSecret() {
    auto bytes = randomBytes(20);
    if (!bytes) {
        return bytes.error();
    }
    return base32Encode(bytes.value());
}

} // namespace cfgstore::crypto
