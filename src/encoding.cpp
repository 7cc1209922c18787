// ============================================================================
// Strongbox - Text Encoding Implementation
// ============================================================================

#include "strongbox/encoding.hpp"

// OpenSSL headers
#include <openssl/evp.h>

namespace strongbox {

std::string base64_encode(ByteSpan data) {
    if (data.empty()) {
        return {};
    }

    // 4 output characters per 3 input bytes, plus the NUL EVP_EncodeBlock writes
    std::string encoded(4 * ((data.size() + 2) / 3) + 1, '\0');
    int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(encoded.data()),
                              data.data(), static_cast<int>(data.size()));
    encoded.resize(static_cast<std::size_t>(len));
    return encoded;
}

Result<ByteBuffer> base64_decode(std::string_view text) {
    if (text.empty()) {
        return ByteBuffer{};
    }

    // EVP_DecodeBlock trims surrounding whitespace and ignores missing
    // padding rules, so the shape is checked here first
    if (text.size() % 4 != 0) {
        return std::unexpected(ErrorCode::InvalidEncoding);
    }

    std::size_t padding = 0;
    for (std::size_t i = 0; i < text.size(); ++i) {
        char c = text[i];
        bool alnum = (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z') || (c >= '0' && c <= '9');
        if (alnum || c == '+' || c == '/') {
            if (padding != 0) {
                return std::unexpected(ErrorCode::InvalidEncoding);
            }
        } else if (c == '=') {
            // Padding only in the last two positions
            if (i < text.size() - 2) {
                return std::unexpected(ErrorCode::InvalidEncoding);
            }
            ++padding;
        } else {
            return std::unexpected(ErrorCode::InvalidEncoding);
        }
    }

    ByteBuffer decoded(3 * (text.size() / 4));
    int len = EVP_DecodeBlock(decoded.data(),
                              reinterpret_cast<const unsigned char*>(text.data()),
                              static_cast<int>(text.size()));
    if (len < 0) {
        return std::unexpected(ErrorCode::InvalidEncoding);
    }

    // EVP_DecodeBlock counts padding as zero bytes
    decoded.resize(static_cast<std::size_t>(len) - padding);
    return decoded;
}

} // namespace strongbox
