// ============================================================================
// Strongbox - Key Store Implementation
// ============================================================================

#include "strongbox/key_store.hpp"
#include "strongbox/file_io.hpp"

// OpenSSL headers
#include <openssl/rand.h>

namespace strongbox {

KeyStore::KeyStore(std::filesystem::path key_path)
    : key_path_(std::move(key_path)) {}

// ============================================================================
// Key File
// ============================================================================

Result<SecureBuffer> KeyStore::load() const {
    // Read at most one byte past the expected size so an oversized file is
    // recognised without pulling it into memory
    auto contents = read_file(key_path_, constants::MASTER_KEY_SIZE + 1);
    if (!contents) {
        switch (contents.error()) {
            case ErrorCode::FileNotFound:
                return std::unexpected(ErrorCode::FileNotFound);
            case ErrorCode::FileTooLarge:
                return std::unexpected(ErrorCode::InvalidKeySize);
            default:
                return std::unexpected(ErrorCode::KeyReadError);
        }
    }

    // Length is checked before the bytes become a key
    if (!is_valid_key_size(*contents)) {
        secure_zero(*contents);
        return std::unexpected(ErrorCode::InvalidKeySize);
    }

    SecureBuffer key(ByteSpan{*contents});
    secure_zero(*contents);
    return key;
}

VoidResult KeyStore::store(ByteSpan key) const {
    if (!is_valid_key_size(key)) {
        return std::unexpected(ErrorCode::InvalidKeySize);
    }

    if (auto written = atomic_write_file(key_path_, key); !written) {
        return std::unexpected(ErrorCode::KeyWriteError);
    }

    return {};
}

Result<MasterKey> KeyStore::load_or_generate() const {
    auto loaded = load();
    if (loaded) {
        return MasterKey{std::move(*loaded), KeyOrigin::Loaded};
    }

    KeyOrigin origin = loaded.error() == ErrorCode::FileNotFound
        ? KeyOrigin::Generated
        : KeyOrigin::Replaced;

    auto key = generate_key();
    if (!key) {
        return std::unexpected(key.error());
    }

    // Without a durable key every record sealed in this run would be lost
    if (auto stored = store(key->span()); !stored) {
        return std::unexpected(stored.error());
    }

    return MasterKey{std::move(*key), origin};
}

// ============================================================================
// Random Generation
// ============================================================================

Result<SecureBuffer> KeyStore::generate_key() {
    SecureBuffer key(constants::MASTER_KEY_SIZE);

    // RAND_bytes returns 1 on success, 0 or -1 on failure
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        return std::unexpected(ErrorCode::KeyGenerationFailed);
    }

    return key;
}

Result<ByteBuffer> KeyStore::generate_nonce() {
    return generate_random_bytes(constants::NONCE_SIZE);
}

Result<ByteBuffer> KeyStore::generate_random_bytes(std::size_t length) {
    if (length == 0) {
        return std::unexpected(ErrorCode::InvalidArgument);
    }

    ByteBuffer bytes(length);

    if (RAND_bytes(bytes.data(), static_cast<int>(length)) != 1) {
        return std::unexpected(ErrorCode::KeyGenerationFailed);
    }

    return bytes;
}

// ============================================================================
// Validation
// ============================================================================

bool KeyStore::is_valid_key_size(ByteSpan key) noexcept {
    return key.size() == constants::MASTER_KEY_SIZE;
}

bool KeyStore::is_valid_nonce_size(ByteSpan nonce) noexcept {
    return nonce.size() == constants::NONCE_SIZE;
}

} // namespace strongbox
