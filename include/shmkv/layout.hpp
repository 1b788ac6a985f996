#ifndef SHMKV_LAYOUT_HPP
#define SHMKV_LAYOUT_HPP

#include <cstddef>
#include <cstdint>
#include <cstring>
#include <type_traits>

#include "shmkv/guard.hpp"

namespace shmkv {

// Default name of the backing segment. Every process of a deployment must
// agree on it.
constexpr const char* DEFAULT_SEGMENT_NAME = "shmkv_store";

// Build-time constants, part of the binary contract shared by all processes.
constexpr std::size_t CAPACITY = 10;
constexpr std::size_t KEY_SIZE = 64;     // KEY_SIZE - 1 usable bytes + NUL
constexpr std::size_t VALUE_SIZE = 256;  // VALUE_SIZE - 1 usable bytes + NUL

// One key/value/timestamp record. Free iff key[0] == '\0'.
struct Slot {
    char key[KEY_SIZE];
    char value[VALUE_SIZE];
    std::int64_t timestamp;  // seconds since epoch, last modification
};

// Byte layout of the whole segment, field order is fixed:
// table, guard, version, entry_count.
struct StoreLayout {
    Slot table[CAPACITY]{};
    Guard guard;
    std::uint32_t version = 1;
    std::uint32_t entry_count = 0;
};

static_assert(std::is_standard_layout_v<Slot>, "Slot must be standard layout");
static_assert(std::is_trivially_copyable_v<Slot>, "Slot must be trivially copyable");

constexpr std::size_t SEGMENT_SIZE = sizeof(StoreLayout);

inline bool IsFree(const Slot& slot) {
    return slot.key[0] == '\0';
}

inline void ClearSlot(Slot& slot) {
    std::memset(slot.key, 0, sizeof(slot.key));
    std::memset(slot.value, 0, sizeof(slot.value));
    slot.timestamp = 0;
}

} // namespace shmkv

#endif // SHMKV_LAYOUT_HPP
