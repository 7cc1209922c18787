// ============================================================================
// Strongbox - Record Store
// ============================================================================
// The RecordStore keeps the mapping from service name to sealed record and
// persists it as a JSON document:
//
//   { "passwords": { "<service>": "<base64 record>", ... } }
//
// The whole document is rewritten (atomically) on every save. A missing data
// file is a normal first run and loads as an empty store; a data file that
// exists but can't be parsed is reported as CorruptDataFile so it is never
// silently replaced by an empty one.
// ============================================================================

#ifndef STRONGBOX_RECORD_STORE_HPP
#define STRONGBOX_RECORD_STORE_HPP

#include "envelope.hpp"
#include "types.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <string_view>
#include <vector>

namespace strongbox {

/// Service name -> sealed record. Keys are unique; iteration is sorted.
using SecretStore = std::map<std::string, EncryptedRecord, std::less<>>;

class RecordStore {
public:
    explicit RecordStore(std::filesystem::path data_path);

    // ========================================================================
    // Persistence
    // ========================================================================

    /// Replace the in-memory entries with the data file's contents
    /// @return Success (missing file -> empty store), or CorruptDataFile /
    ///         FileReadError / FileTooLarge
    [[nodiscard]] VoidResult load();

    /// Write every entry to the data file, replacing it atomically
    /// @return Success, or FileWriteError / InvalidServiceName
    [[nodiscard]] VoidResult save() const;

    // ========================================================================
    // Entries
    // ========================================================================

    /// Insert or replace the record for a service
    /// @return Success, or InvalidServiceName for an empty name
    [[nodiscard]] VoidResult add(std::string_view service, EncryptedRecord record);

    /// Remove a service. Removing an absent service is a no-op.
    /// @return true if an entry was removed
    bool remove(std::string_view service);

    /// Look up the record for a service
    /// @return The record, or ServiceNotFound
    [[nodiscard]] Result<EncryptedRecord> get(std::string_view service) const;

    [[nodiscard]] bool contains(std::string_view service) const;

    /// All service names, in sorted order
    [[nodiscard]] std::vector<std::string> list() const;

    [[nodiscard]] std::size_t size() const noexcept { return entries_.size(); }
    [[nodiscard]] bool empty() const noexcept { return entries_.empty(); }

    [[nodiscard]] const SecretStore& entries() const noexcept { return entries_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return data_path_; }

    // ========================================================================
    // Document Format
    // ========================================================================

    /// Serialize entries to the JSON document text
    /// @return The document, or InvalidServiceName if a name isn't UTF-8
    [[nodiscard]] static Result<std::string> serialize(const SecretStore& entries);

    /// Parse the JSON document text
    /// @return The entries, or CorruptDataFile
    [[nodiscard]] static Result<SecretStore> deserialize(std::string_view document);

private:
    std::filesystem::path data_path_;
    SecretStore entries_;
};

} // namespace strongbox

#endif // STRONGBOX_RECORD_STORE_HPP
