// ============================================================================
// Strongbox - Envelope Codec
// ============================================================================
// The EnvelopeCodec turns a secret into a self-describing sealed record and
// back, using AES-256-GCM under the master key:
//
//   record = base64( nonce (12 bytes) || ciphertext || tag (16 bytes) )
//
// Every seal draws a fresh random nonce, so sealing the same secret twice
// yields two different records. Opening verifies the tag before any
// plaintext is returned; a failed check is reported as AuthenticationFailed,
// distinct from the format errors of a record that isn't even well-formed.
// ============================================================================

#ifndef STRONGBOX_ENVELOPE_HPP
#define STRONGBOX_ENVELOPE_HPP

#include "types.hpp"
#include <string>
#include <string_view>

namespace strongbox {

/// A sealed secret as stored in the data file (base64 text)
using EncryptedRecord = std::string;

/// Seals and opens secrets with AES-256-GCM
class EnvelopeCodec {
public:
    EnvelopeCodec() = delete;

    // ========================================================================
    // Sealing
    // ========================================================================

    /// Seal arbitrary bytes under the master key
    /// @param plaintext The secret (may be empty)
    /// @param key The 32-byte master key
    /// @return The base64 record, or an error
    [[nodiscard]] static Result<EncryptedRecord> seal(ByteSpan plaintext, ByteSpan key);

    /// Seal a text secret (UTF-8)
    [[nodiscard]] static Result<EncryptedRecord> seal_text(std::string_view plaintext, ByteSpan key);

    // ========================================================================
    // Opening
    // ========================================================================

    /// Open a sealed record
    /// @param record The base64 record produced by seal()
    /// @param key The 32-byte master key
    /// @return The plaintext, or InvalidEncoding / RecordTooShort (malformed
    ///         record) or AuthenticationFailed (wrong key or tampering)
    [[nodiscard]] static Result<ByteBuffer> open(std::string_view record, ByteSpan key);

    /// Open a sealed record holding text
    [[nodiscard]] static Result<std::string> open_text(std::string_view record, ByteSpan key);

    // ========================================================================
    // Raw Envelope
    // ========================================================================

    /// Seal with an explicit nonce, returning nonce || ciphertext || tag
    /// before text encoding. Callers must never reuse a nonce under one key.
    [[nodiscard]] static Result<ByteBuffer> seal_raw(ByteSpan plaintext, ByteSpan key, ByteSpan nonce);

    /// Open a decoded envelope (nonce || ciphertext || tag)
    [[nodiscard]] static Result<ByteBuffer> open_raw(ByteSpan envelope, ByteSpan key);

private:
    [[nodiscard]] static Result<ByteBuffer> encrypt_impl(
        ByteSpan plaintext,
        ByteSpan key,
        ByteSpan nonce
    );

    [[nodiscard]] static Result<ByteBuffer> decrypt_impl(
        ByteSpan ciphertext,  // Just the encrypted data (no nonce/tag)
        ByteSpan key,
        ByteSpan nonce,
        ByteSpan tag
    );
};

} // namespace strongbox

#endif // STRONGBOX_ENVELOPE_HPP
