#include "storage/record_store.hpp"
#include <filesystem>

namespace fs = std::filesystem;
using json = nlohmann::json;

namespace wdi {

std::string to_string(RecordKind kind) {
    switch (kind) {
        case RecordKind::Items: return "items";
        case RecordKind::Objects: return "objects";
        case RecordKind::Literals: return "literals";
        case RecordKind::Types: return "types";
        case RecordKind::Errors: return "log";
    }
    return "items";
}

const std::vector<RecordKind>& entity_record_kinds() {
    static const std::vector<RecordKind> kinds = {
        RecordKind::Items,
        RecordKind::Objects,
        RecordKind::Literals,
        RecordKind::Types
    };
    return kinds;
}

// ============================================================================
// JsonlRecordStore
// ============================================================================

JsonlRecordStore::JsonlRecordStore(const std::string& directory) : directory_(directory) {}

std::string JsonlRecordStore::path_for(RecordKind kind) const {
    return (fs::path(directory_) / (to_string(kind) + ".jsonl")).string();
}

void JsonlRecordStore::ensure_indexes() {
    std::error_code ec;
    fs::create_directories(directory_, ec);
    if (ec) {
        throw StoreError("Cannot create output directory " + directory_ + ": " + ec.message());
    }
}

void JsonlRecordStore::insert_many(RecordKind kind, const std::vector<json>& documents) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = files_.find(kind);
    if (it == files_.end()) {
        std::ofstream file(path_for(kind), std::ios::app);
        if (!file.is_open()) {
            throw StoreError("Cannot open " + path_for(kind) + " for writing");
        }
        it = files_.emplace(kind, std::move(file)).first;
    }

    for (const auto& doc : documents) {
        it->second << doc.dump(-1, ' ', false, json::error_handler_t::replace) << '\n';
    }
    it->second.flush();
    if (!it->second) {
        throw StoreError("Write to " + path_for(kind) + " failed");
    }
}

} // namespace wdi
