#include "shmkv/kvstore.hpp"

#include <boost/interprocess/sync/scoped_lock.hpp>
#include <chrono>
#include <cstring>
#include <iomanip>
#include <iostream>
#include <utility>

#include "shmkv/errors.hpp"
#include "shmkv/log.hpp"

using boost::interprocess::scoped_lock;

namespace shmkv {

namespace {

std::int64_t Now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::error_code ValidateKey(std::string_view key) {
    if (key.empty()) {
        return Errc::InvalidArgument;
    }
    if (key.size() >= KEY_SIZE) {
        return Errc::KeyTooLong;
    }
    if (key.find('\0') != std::string_view::npos) {
        return Errc::InvalidArgument;
    }
    return {};
}

std::error_code ValidateValue(std::string_view value) {
    if (value.size() >= VALUE_SIZE) {
        return Errc::ValueTooLong;
    }
    if (value.find('\0') != std::string_view::npos) {
        return Errc::InvalidArgument;
    }
    return {};
}

// Exact match against an occupied slot. Stored keys are NUL-terminated
// within KEY_SIZE.
bool KeyEquals(const Slot& slot, std::string_view key) {
    std::size_t len = strnlen(slot.key, KEY_SIZE);
    return len == key.size() && std::memcmp(slot.key, key.data(), len) == 0;
}

// Callers have validated sizes, so the terminator always fits.
void CopyField(char* dst, std::size_t capacity, std::string_view src) {
    std::memset(dst, 0, capacity);
    std::memcpy(dst, src.data(), src.size());
}

Slot* FindSlot(StoreLayout& store, std::string_view key) {
    for (auto& slot : store.table) {
        if (!IsFree(slot) && KeyEquals(slot, key)) {
            return &slot;
        }
    }
    return nullptr;
}

Entry ToEntry(const Slot& slot) {
    Entry entry;
    entry.key.assign(slot.key, strnlen(slot.key, KEY_SIZE));
    entry.value.assign(slot.value, strnlen(slot.value, VALUE_SIZE));
    entry.timestamp = slot.timestamp;
    return entry;
}

} // namespace

KvStore::KvStore(Segment& segment_ref) : segment(segment_ref) {}

std::error_code KvStore::CheckAttached() const {
    if (!segment.IsAttached()) {
        std::cout << "[KvStore] Store is not attached to a segment\n";
        return Errc::NotInitialized;
    }
    return {};
}

std::error_code KvStore::Put(std::string_view key, std::string_view value) {
    if (auto ec = CheckAttached()) {
        return ec;
    }
    if (auto ec = ValidateKey(key)) {
        std::cout << "[KvStore] Put rejected: " << Describe(ec) << "\n";
        return ec;
    }
    if (auto ec = ValidateValue(value)) {
        std::cout << "[KvStore] Put of '" << key << "' rejected: " << Describe(ec) << "\n";
        return ec;
    }

    StoreLayout& store = *segment.Layout();
    scoped_lock<Guard> lock(store.guard);

    if (Slot* slot = FindSlot(store, key)) {
        CopyField(slot->value, VALUE_SIZE, value);
        slot->timestamp = Now();
        ++store.version;
        if (IsVerbose()) {
            std::cout << "[KvStore] Updated key '" << key << "' (version " << store.version << ")\n";
        }
        return {};
    }

    for (auto& slot : store.table) {
        if (IsFree(slot)) {
            CopyField(slot.key, KEY_SIZE, key);
            CopyField(slot.value, VALUE_SIZE, value);
            slot.timestamp = Now();
            ++store.entry_count;
            ++store.version;
            if (IsVerbose()) {
                std::cout << "[KvStore] Inserted key '" << key << "' (version " << store.version
                          << ", " << store.entry_count << "/" << CAPACITY << " slots)\n";
            }
            return {};
        }
    }

    std::cout << "[KvStore] Put of '" << key << "' failed: all " << CAPACITY << " slots are in use\n";
    return Errc::StoreFull;
}

std::error_code KvStore::Get(std::string_view key, Entry& out) const {
    if (auto ec = CheckAttached()) {
        return ec;
    }
    if (auto ec = ValidateKey(key)) {
        std::cout << "[KvStore] Get rejected: " << Describe(ec) << "\n";
        return ec;
    }

    StoreLayout& store = *segment.Layout();
    scoped_lock<Guard> lock(store.guard);

    const Slot* slot = FindSlot(store, key);
    if (!slot) {
        std::cout << "[KvStore] Key '" << key << "' not found\n";
        return Errc::NotFound;
    }
    out = ToEntry(*slot);
    return {};
}

std::error_code KvStore::Delete(std::string_view key) {
    if (auto ec = CheckAttached()) {
        return ec;
    }
    if (auto ec = ValidateKey(key)) {
        std::cout << "[KvStore] Delete rejected: " << Describe(ec) << "\n";
        return ec;
    }

    StoreLayout& store = *segment.Layout();
    scoped_lock<Guard> lock(store.guard);

    Slot* slot = FindSlot(store, key);
    if (!slot) {
        std::cout << "[KvStore] Key '" << key << "' not found. Nothing to delete.\n";
        return Errc::NotFound;
    }
    ClearSlot(*slot);
    --store.entry_count;
    ++store.version;
    if (IsVerbose()) {
        std::cout << "[KvStore] Deleted key '" << key << "' (version " << store.version << ")\n";
    }
    return {};
}

std::error_code KvStore::Status(StatusSnapshot& out) const {
    if (auto ec = CheckAttached()) {
        return ec;
    }

    StoreLayout& store = *segment.Layout();
    std::vector<Entry> entries;
    entries.reserve(CAPACITY);

    scoped_lock<Guard> lock(store.guard);
    for (const auto& slot : store.table) {
        if (!IsFree(slot)) {
            entries.push_back(ToEntry(slot));
        }
    }
    out.version = store.version;
    out.entry_count = store.entry_count;
    out.capacity = CAPACITY;
    out.entries = std::move(entries);
    return {};
}

void KvStore::PrintStatus(const std::string& label) const {
    StatusSnapshot snapshot;
    if (auto ec = Status(snapshot)) {
        std::cout << "[KvStore] Status unavailable: " << Describe(ec) << "\n";
        return;
    }
    std::cout << "\n========== STORE STATUS [" << label << "] ==========\n";
    std::cout << "  Segment:  " << segment.Name() << "\n";
    std::cout << "  Version:  " << snapshot.version << "\n";
    std::cout << "  Entries:  " << snapshot.entry_count << "/" << snapshot.capacity << "\n";
    for (const auto& entry : snapshot.entries) {
        std::cout << "  " << std::left << std::setw(24) << entry.key << " = " << entry.value
                  << "  (t=" << entry.timestamp << ")\n";
    }
    std::cout << "===============================================\n";
}

} // namespace shmkv
