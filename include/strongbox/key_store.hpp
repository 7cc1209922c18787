// ============================================================================
// Strongbox - Key Store
// ============================================================================
// The KeyStore owns the 256-bit master key:
// - Loading it from the key file (raw 32 bytes, no header)
// - Generating and persisting a fresh key on first use
// - Generating secure random nonces for the envelope codec
//
// Keys are held in SecureBuffer so they're zeroed on destruction.
// ============================================================================

#ifndef STRONGBOX_KEY_STORE_HPP
#define STRONGBOX_KEY_STORE_HPP

#include "types.hpp"
#include <filesystem>

namespace strongbox {

/// Where the master key returned by load_or_generate() came from
enum class KeyOrigin {
    Loaded,     // read from an existing, well-formed key file
    Generated,  // key file was absent; a new key was written
    Replaced,   // key file was unreadable or malformed; a new key overwrote it
};

/// The master key together with how it was obtained
struct MasterKey {
    SecureBuffer bytes;
    KeyOrigin origin = KeyOrigin::Loaded;

    [[nodiscard]] ByteSpan span() const noexcept { return bytes.span(); }
};

/// Loads, generates, and persists the master key
class KeyStore {
public:
    explicit KeyStore(std::filesystem::path key_path);
    ~KeyStore() = default;

    KeyStore(const KeyStore&) = delete;
    KeyStore& operator=(const KeyStore&) = delete;
    KeyStore(KeyStore&&) = default;
    KeyStore& operator=(KeyStore&&) = default;

    // ========================================================================
    // Key File
    // ========================================================================

    /// Load the master key, generating one if the key file cannot be used
    ///
    /// A missing, unreadable, short, or long key file is treated as "no key":
    /// 32 fresh random bytes are written to the key file and returned. The
    /// origin field tells the caller which case happened.
    /// @return The master key, or KeyGenerationFailed / KeyWriteError
    [[nodiscard]] Result<MasterKey> load_or_generate() const;

    /// Strictly load the key file, without any fallback
    /// @return The key, or FileNotFound / KeyReadError / InvalidKeySize
    [[nodiscard]] Result<SecureBuffer> load() const;

    /// Persist a key to the key file (atomic replace, mode 0600)
    /// @return Success, or InvalidKeySize / KeyWriteError
    [[nodiscard]] VoidResult store(ByteSpan key) const;

    /// Path of the key file
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return key_path_; }

    // ========================================================================
    // Random Generation
    // ========================================================================

    /// Generate a cryptographically secure random AES-256 key
    /// @return A 32-byte random key in a SecureBuffer, or an error
    [[nodiscard]] static Result<SecureBuffer> generate_key();

    /// Generate a cryptographically secure random nonce for AES-GCM
    /// @return A 12-byte random nonce, or an error
    [[nodiscard]] static Result<ByteBuffer> generate_nonce();

    /// Generate random bytes of specified length
    [[nodiscard]] static Result<ByteBuffer> generate_random_bytes(std::size_t length);

    // ========================================================================
    // Validation
    // ========================================================================

    [[nodiscard]] static bool is_valid_key_size(ByteSpan key) noexcept;
    [[nodiscard]] static bool is_valid_nonce_size(ByteSpan nonce) noexcept;

private:
    std::filesystem::path key_path_;
};

} // namespace strongbox

#endif // STRONGBOX_KEY_STORE_HPP
