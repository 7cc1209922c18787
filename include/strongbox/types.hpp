// ============================================================================
// Strongbox - Common Types and Error Handling
// ============================================================================
// This header defines the foundational types used throughout Strongbox:
// - Error codes, their taxonomy classes, and result types (std::expected)
// - Secure byte containers
// - Envelope and file format constants
// ============================================================================

#ifndef STRONGBOX_TYPES_HPP
#define STRONGBOX_TYPES_HPP

#include <cstdint>
#include <cstring>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace strongbox {

// ============================================================================
// Byte Types
// ============================================================================

/// A single byte (unsigned 8-bit integer)
using Byte = std::uint8_t;

/// A dynamically-sized container for bytes (keys, ciphertext, etc.)
using ByteBuffer = std::vector<Byte>;

/// A read-only view into a byte sequence
using ByteSpan = std::span<const Byte>;

/// A mutable view into a byte sequence
using MutableByteSpan = std::span<Byte>;

// ============================================================================
// Error Codes
// ============================================================================

/// All possible error conditions in Strongbox
enum class ErrorCode {
    Success = 0,

    // Master Key Errors (100-199)
    KeyGenerationFailed = 100,
    InvalidKeySize = 101,
    KeyReadError = 102,
    KeyWriteError = 103,

    // Sealing Errors (200-299)
    EncryptionFailed = 200,
    CipherInitFailed = 201,
    CipherUpdateFailed = 202,
    CipherFinalizeFailed = 203,

    // Opening Errors (300-399)
    DecryptionFailed = 300,
    InvalidEncoding = 301,
    RecordTooShort = 302,
    AuthenticationFailed = 303,  // Wrong key or tampered record

    // File I/O Errors (400-499)
    FileNotFound = 400,
    FileReadError = 401,
    FileWriteError = 402,
    FileTooLarge = 403,
    FileLockFailed = 404,

    // Record Store Errors (500-599)
    CorruptDataFile = 500,
    ServiceNotFound = 501,
    InvalidServiceName = 502,

    // General Errors (600-699)
    InvalidArgument = 600,
    InternalError = 601,
};

/// Convert an error code to a human-readable string
[[nodiscard]] constexpr std::string_view error_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";

        // Master key
        case ErrorCode::KeyGenerationFailed: return "Key generation failed";
        case ErrorCode::InvalidKeySize: return "Invalid key size (expected 32 bytes)";
        case ErrorCode::KeyReadError: return "Master key file could not be read";
        case ErrorCode::KeyWriteError: return "Master key file could not be written";

        // Sealing
        case ErrorCode::EncryptionFailed: return "Encryption failed";
        case ErrorCode::CipherInitFailed: return "Cipher initialization failed";
        case ErrorCode::CipherUpdateFailed: return "Cipher update failed";
        case ErrorCode::CipherFinalizeFailed: return "Cipher finalization failed";

        // Opening
        case ErrorCode::DecryptionFailed: return "Decryption failed";
        case ErrorCode::InvalidEncoding: return "Record is not valid base64";
        case ErrorCode::RecordTooShort: return "Record is too short to hold a nonce and tag";
        case ErrorCode::AuthenticationFailed: return "Authentication failed - wrong key or tampered record!";

        // File I/O
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";
        case ErrorCode::FileTooLarge: return "File too large";
        case ErrorCode::FileLockFailed: return "Could not lock the data file";

        // Record store
        case ErrorCode::CorruptDataFile: return "Data file is corrupt";
        case ErrorCode::ServiceNotFound: return "Service not found";
        case ErrorCode::InvalidServiceName: return "Invalid service name";

        // General
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";

        default: return "Unknown error";
    }
}

/// Taxonomy an error code belongs to. Callers branch on the class, not the
/// individual code, when deciding how to report a failure.
enum class ErrorClass {
    None,
    KeyIO,           // master key unreadable/unwritable/unusable
    Format,          // malformed record or data file
    Authentication,  // AEAD tag did not verify
    NotFound,        // expected negative result
    IO,              // data file I/O and locking
    Internal,        // cipher plumbing, programming errors
};

[[nodiscard]] constexpr ErrorClass classify(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success:
            return ErrorClass::None;

        case ErrorCode::KeyGenerationFailed:
        case ErrorCode::InvalidKeySize:
        case ErrorCode::KeyReadError:
        case ErrorCode::KeyWriteError:
            return ErrorClass::KeyIO;

        case ErrorCode::InvalidEncoding:
        case ErrorCode::RecordTooShort:
        case ErrorCode::CorruptDataFile:
            return ErrorClass::Format;

        case ErrorCode::AuthenticationFailed:
            return ErrorClass::Authentication;

        case ErrorCode::ServiceNotFound:
            return ErrorClass::NotFound;

        case ErrorCode::FileNotFound:
        case ErrorCode::FileReadError:
        case ErrorCode::FileWriteError:
        case ErrorCode::FileTooLarge:
        case ErrorCode::FileLockFailed:
            return ErrorClass::IO;

        default:
            return ErrorClass::Internal;
    }
}

// ============================================================================
// Result Type (using C++23 std::expected)
// ============================================================================

/// A result type that either contains a value T or an ErrorCode
template <typename T>
using Result = std::expected<T, ErrorCode>;

/// A result type for operations that don't return a value
using VoidResult = std::expected<void, ErrorCode>;

// ============================================================================
// Constants
// ============================================================================

namespace constants {

/// AES-256 master key size in bytes (256 bits)
inline constexpr std::size_t MASTER_KEY_SIZE = 32;

/// AES-GCM nonce size in bytes (96 bits, recommended by NIST)
inline constexpr std::size_t NONCE_SIZE = 12;

/// AES-GCM authentication tag size in bytes (128 bits)
inline constexpr std::size_t TAG_SIZE = 16;

/// Smallest decoded envelope: nonce + tag around an empty ciphertext
inline constexpr std::size_t MIN_ENVELOPE_SIZE = NONCE_SIZE + TAG_SIZE;

/// Maximum data file size read into memory (16 MB)
inline constexpr std::size_t MAX_DATA_FILE_SIZE = 16 * 1024 * 1024;

/// Default file names, relative to the working directory
inline constexpr const char* DEFAULT_DATA_FILE = "secrets.json";
inline constexpr const char* DEFAULT_KEY_FILE = "master.key";

/// Environment variables overriding the default paths
inline constexpr const char* ENV_DATA_FILE = "STRONGBOX_DATA_FILE";
inline constexpr const char* ENV_KEY_FILE = "STRONGBOX_KEY_FILE";

} // namespace constants

// ============================================================================
// Secure Memory Utilities
// ============================================================================

/// Securely zero out memory (prevents compiler optimization from removing it)
/// Uses C++23's std::memset_explicit if available, otherwise volatile hack
inline void secure_zero(MutableByteSpan buffer) noexcept {
#if __cpp_lib_memset_explicit >= 202207L
    std::memset_explicit(buffer.data(), 0, buffer.size());
#else
    volatile Byte* ptr = buffer.data();
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        ptr[i] = 0;
    }
#endif
}

/// Zero a string that held a secret before it is released
inline void secure_zero(std::string& text) noexcept {
    secure_zero(MutableByteSpan{reinterpret_cast<Byte*>(text.data()), text.size()});
}

/// RAII wrapper for secure memory that zeros itself on destruction
class SecureBuffer {
public:
    SecureBuffer() = default;

    explicit SecureBuffer(std::size_t size) : data_(size) {}

    explicit SecureBuffer(ByteSpan data) : data_(data.begin(), data.end()) {}

    SecureBuffer(SecureBuffer&& other) noexcept : data_(std::move(other.data_)) {}
    SecureBuffer& operator=(SecureBuffer&& other) noexcept {
        if (this != &other) {
            clear();
            data_ = std::move(other.data_);
        }
        return *this;
    }

    // No copying (avoid accidental key duplication)
    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    ~SecureBuffer() { clear(); }

    /// Securely clear the buffer
    void clear() noexcept {
        if (!data_.empty()) {
            secure_zero(data_);
            data_.clear();
        }
    }

    [[nodiscard]] Byte* data() noexcept { return data_.data(); }
    [[nodiscard]] const Byte* data() const noexcept { return data_.data(); }

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }
    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    [[nodiscard]] ByteSpan span() const noexcept { return ByteSpan{data_}; }
    [[nodiscard]] MutableByteSpan mutable_span() noexcept { return MutableByteSpan{data_}; }

private:
    ByteBuffer data_;
};

} // namespace strongbox

#endif // STRONGBOX_TYPES_HPP
