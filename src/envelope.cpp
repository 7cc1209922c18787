// ============================================================================
// Strongbox - Envelope Codec Implementation
// ============================================================================

#include "strongbox/envelope.hpp"
#include "strongbox/encoding.hpp"
#include "strongbox/key_store.hpp"

// OpenSSL headers
#include <openssl/evp.h>

// Standard library
#include <memory>

namespace strongbox {

namespace {

struct ContextDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const {
        if (ctx) EVP_CIPHER_CTX_free(ctx);
    }
};

using CipherContext = std::unique_ptr<EVP_CIPHER_CTX, ContextDeleter>;

ByteSpan as_bytes(std::string_view text) {
    return ByteSpan{reinterpret_cast<const Byte*>(text.data()), text.size()};
}

} // namespace

// ============================================================================
// Internal Implementation
// ============================================================================

Result<ByteBuffer> EnvelopeCodec::encrypt_impl(ByteSpan plaintext, ByteSpan key, ByteSpan nonce) {
    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(ErrorCode::CipherInitFailed);
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return std::unexpected(ErrorCode::CipherInitFailed);
    }

    // The nonce length must be set before the key and nonce
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(constants::NONCE_SIZE), nullptr) != 1) {
        return std::unexpected(ErrorCode::CipherInitFailed);
    }

    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return std::unexpected(ErrorCode::CipherInitFailed);
    }

    // GCM is a stream mode: ciphertext is the same size as plaintext, and
    // the tag is appended after finalization
    ByteBuffer ciphertext(plaintext.size() + constants::TAG_SIZE);
    int len = 0;
    int ciphertext_len = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext.data(), &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return std::unexpected(ErrorCode::CipherUpdateFailed);
        }
        ciphertext_len = len;
    }

    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext.data() + ciphertext_len, &len) != 1) {
        return std::unexpected(ErrorCode::CipherFinalizeFailed);
    }
    ciphertext_len += len;

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(constants::TAG_SIZE),
                            ciphertext.data() + ciphertext_len) != 1) {
        return std::unexpected(ErrorCode::CipherFinalizeFailed);
    }

    ciphertext.resize(static_cast<std::size_t>(ciphertext_len) + constants::TAG_SIZE);
    return ciphertext;
}

Result<ByteBuffer> EnvelopeCodec::decrypt_impl(
    ByteSpan ciphertext,
    ByteSpan key,
    ByteSpan nonce,
    ByteSpan tag
) {
    CipherContext ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return std::unexpected(ErrorCode::CipherInitFailed);
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1) {
        return std::unexpected(ErrorCode::CipherInitFailed);
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(constants::NONCE_SIZE), nullptr) != 1) {
        return std::unexpected(ErrorCode::CipherInitFailed);
    }

    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return std::unexpected(ErrorCode::CipherInitFailed);
    }

    // One spare byte so EVP_DecryptFinal_ex gets a valid output pointer even
    // for an empty ciphertext
    ByteBuffer plaintext(ciphertext.size() + 1);
    int len = 0;
    int plaintext_len = 0;

    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                              ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
            secure_zero(plaintext);
            return std::unexpected(ErrorCode::DecryptionFailed);
        }
        plaintext_len = len;
    }

    // OpenSSL takes the expected tag through a non-const pointer
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(constants::TAG_SIZE),
                            const_cast<Byte*>(tag.data())) != 1) {
        secure_zero(plaintext);
        return std::unexpected(ErrorCode::DecryptionFailed);
    }

    // EVP_DecryptFinal_ex verifies the tag. On failure the partially
    // decrypted bytes are wiped and never returned.
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &len) <= 0) {
        secure_zero(plaintext);
        return std::unexpected(ErrorCode::AuthenticationFailed);
    }

    plaintext_len += len;
    plaintext.resize(static_cast<std::size_t>(plaintext_len));
    return plaintext;
}

// ============================================================================
// Raw Envelope
// ============================================================================

Result<ByteBuffer> EnvelopeCodec::seal_raw(ByteSpan plaintext, ByteSpan key, ByteSpan nonce) {
    if (!KeyStore::is_valid_key_size(key)) {
        return std::unexpected(ErrorCode::InvalidKeySize);
    }
    if (!KeyStore::is_valid_nonce_size(nonce)) {
        return std::unexpected(ErrorCode::InvalidArgument);
    }

    auto ciphertext = encrypt_impl(plaintext, key, nonce);
    if (!ciphertext) {
        return std::unexpected(ciphertext.error());
    }

    // [nonce] + [ciphertext + tag]
    ByteBuffer envelope;
    envelope.reserve(nonce.size() + ciphertext->size());
    envelope.insert(envelope.end(), nonce.begin(), nonce.end());
    envelope.insert(envelope.end(), ciphertext->begin(), ciphertext->end());
    return envelope;
}

Result<ByteBuffer> EnvelopeCodec::open_raw(ByteSpan envelope, ByteSpan key) {
    if (envelope.size() < constants::MIN_ENVELOPE_SIZE) {
        return std::unexpected(ErrorCode::RecordTooShort);
    }

    if (!KeyStore::is_valid_key_size(key)) {
        return std::unexpected(ErrorCode::InvalidKeySize);
    }

    // [nonce (12 bytes)] + [encrypted data] + [tag (16 bytes)]
    ByteSpan nonce = envelope.subspan(0, constants::NONCE_SIZE);
    ByteSpan tag = envelope.subspan(envelope.size() - constants::TAG_SIZE);
    ByteSpan encrypted = envelope.subspan(
        constants::NONCE_SIZE,
        envelope.size() - constants::NONCE_SIZE - constants::TAG_SIZE);

    return decrypt_impl(encrypted, key, nonce, tag);
}

// ============================================================================
// Sealing
// ============================================================================

Result<EncryptedRecord> EnvelopeCodec::seal(ByteSpan plaintext, ByteSpan key) {
    if (!KeyStore::is_valid_key_size(key)) {
        return std::unexpected(ErrorCode::InvalidKeySize);
    }

    // A fresh nonce for every call
    auto nonce = KeyStore::generate_nonce();
    if (!nonce) {
        return std::unexpected(nonce.error());
    }

    auto envelope = seal_raw(plaintext, key, *nonce);
    if (!envelope) {
        return std::unexpected(envelope.error());
    }

    return base64_encode(*envelope);
}

Result<EncryptedRecord> EnvelopeCodec::seal_text(std::string_view plaintext, ByteSpan key) {
    return seal(as_bytes(plaintext), key);
}

// ============================================================================
// Opening
// ============================================================================

Result<ByteBuffer> EnvelopeCodec::open(std::string_view record, ByteSpan key) {
    auto envelope = base64_decode(record);
    if (!envelope) {
        return std::unexpected(envelope.error());
    }

    return open_raw(*envelope, key);
}

Result<std::string> EnvelopeCodec::open_text(std::string_view record, ByteSpan key) {
    auto plaintext = open(record, key);
    if (!plaintext) {
        return std::unexpected(plaintext.error());
    }

    std::string text(reinterpret_cast<const char*>(plaintext->data()), plaintext->size());
    secure_zero(*plaintext);
    return text;
}

} // namespace strongbox
