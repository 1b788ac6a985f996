#ifndef SHMKV_KVSTORE_HPP
#define SHMKV_KVSTORE_HPP

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <system_error>
#include <vector>

#include "shmkv/segment.hpp"

namespace shmkv {

struct Entry {
    std::string key;
    std::string value;
    std::int64_t timestamp = 0;
};

// Read-only view of the table taken under the guard.
struct StatusSnapshot {
    std::uint32_t version = 0;
    std::uint32_t entry_count = 0;
    std::size_t capacity = CAPACITY;
    std::vector<Entry> entries;  // occupied slots, index order
};

// Fixed-capacity key/value table living in a mapped segment.
//
// Every operation holds the segment guard for its whole duration, so all
// operations from all attached processes are linearized. Lookups are a
// linear scan over CAPACITY slots.
class KvStore {
public:
    // The segment must outlive the store.
    explicit KvStore(Segment& segment_ref);

    KvStore(const KvStore&) = delete;
    KvStore& operator=(const KvStore&) = delete;

    // Insert-or-update. An existing key is overwritten in place; a new key
    // takes the first free slot or fails StoreFull.
    std::error_code Put(std::string_view key, std::string_view value);

    std::error_code Get(std::string_view key, Entry& out) const;

    // Frees the slot holding the key.
    std::error_code Delete(std::string_view key);

    std::error_code Status(StatusSnapshot& out) const;

    // Dumps a status snapshot to stdout.
    void PrintStatus(const std::string& label) const;

private:
    std::error_code CheckAttached() const;

    Segment& segment;
};

} // namespace shmkv

#endif // SHMKV_KVSTORE_HPP
