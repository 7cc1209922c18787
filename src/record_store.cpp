// ============================================================================
// Strongbox - Record Store Implementation
// ============================================================================

#include "strongbox/record_store.hpp"
#include "strongbox/file_io.hpp"

#include <nlohmann/json.hpp>

namespace strongbox {

namespace {

/// Name of the single top-level field holding the entries
constexpr const char* ENTRIES_FIELD = "passwords";

} // namespace

RecordStore::RecordStore(std::filesystem::path data_path)
    : data_path_(std::move(data_path)) {}

// ============================================================================
// Document Format
// ============================================================================

Result<std::string> RecordStore::serialize(const SecretStore& entries) {
    // An empty store still writes the field as {}
    nlohmann::json passwords = nlohmann::json::object();
    for (const auto& [service, record] : entries) {
        passwords[service] = record;
    }

    nlohmann::json document;
    document[ENTRIES_FIELD] = std::move(passwords);

    // dump() rejects strings that aren't valid UTF-8; records are base64, so
    // only a service name can trigger this
    try {
        return document.dump(2) + "\n";
    } catch (const nlohmann::json::type_error&) {
        return std::unexpected(ErrorCode::InvalidServiceName);
    }
}

Result<SecretStore> RecordStore::deserialize(std::string_view document) {
    nlohmann::json parsed = nlohmann::json::parse(document, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return std::unexpected(ErrorCode::CorruptDataFile);
    }

    auto field = parsed.find(ENTRIES_FIELD);
    if (field == parsed.end() || !field->is_object()) {
        return std::unexpected(ErrorCode::CorruptDataFile);
    }

    SecretStore entries;
    for (const auto& [service, record] : field->items()) {
        if (service.empty() || !record.is_string()) {
            return std::unexpected(ErrorCode::CorruptDataFile);
        }
        entries.emplace(service, record.get<std::string>());
    }

    return entries;
}

// ============================================================================
// Persistence
// ============================================================================

VoidResult RecordStore::load() {
    auto contents = read_file(data_path_);
    if (!contents) {
        if (contents.error() == ErrorCode::FileNotFound) {
            entries_.clear();
            return {};
        }
        return std::unexpected(contents.error());
    }

    std::string_view document{reinterpret_cast<const char*>(contents->data()), contents->size()};
    auto parsed = deserialize(document);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }

    entries_ = std::move(*parsed);
    return {};
}

VoidResult RecordStore::save() const {
    auto document = serialize(entries_);
    if (!document) {
        return std::unexpected(document.error());
    }

    ByteSpan bytes{reinterpret_cast<const Byte*>(document->data()), document->size()};
    return atomic_write_file(data_path_, bytes);
}

// ============================================================================
// Entries
// ============================================================================

VoidResult RecordStore::add(std::string_view service, EncryptedRecord record) {
    if (service.empty()) {
        return std::unexpected(ErrorCode::InvalidServiceName);
    }

    // Re-adding replaces the previous record outright
    auto it = entries_.find(service);
    if (it != entries_.end()) {
        it->second = std::move(record);
    } else {
        entries_.emplace(std::string(service), std::move(record));
    }
    return {};
}

bool RecordStore::remove(std::string_view service) {
    auto it = entries_.find(service);
    if (it == entries_.end()) {
        return false;
    }
    entries_.erase(it);
    return true;
}

Result<EncryptedRecord> RecordStore::get(std::string_view service) const {
    auto it = entries_.find(service);
    if (it == entries_.end()) {
        return std::unexpected(ErrorCode::ServiceNotFound);
    }
    return it->second;
}

bool RecordStore::contains(std::string_view service) const {
    return entries_.find(service) != entries_.end();
}

std::vector<std::string> RecordStore::list() const {
    std::vector<std::string> services;
    services.reserve(entries_.size());
    for (const auto& entry : entries_) {
        services.push_back(entry.first);
    }
    return services;
}

} // namespace strongbox
