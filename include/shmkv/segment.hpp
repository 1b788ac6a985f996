#ifndef SHMKV_SEGMENT_HPP
#define SHMKV_SEGMENT_HPP

#include <boost/interprocess/shared_memory_object.hpp>
#include <boost/interprocess/mapped_region.hpp>
#include <string>
#include <system_error>

#include "shmkv/layout.hpp"

namespace shmkv {

// Handle to the named shared-memory segment backing the store.
//
// Each process owns its own handle (descriptor + mapping). Destroying a
// handle only unmaps it locally; the segment itself lives until Unlink()
// removes the name and the last mapping goes away. Nothing enforces who
// unlinks: by convention it is the process that created the segment.
class Segment {
public:
    Segment() = default;
    ~Segment();

    Segment(Segment&& other) noexcept;
    Segment& operator=(Segment&& other) noexcept;
    Segment(const Segment&) = delete;
    Segment& operator=(const Segment&) = delete;

    // Creates and initializes a new segment: guard available, table zeroed,
    // version 1, no entries. Fails AlreadyExists if the name is taken.
    static std::error_code Create(std::string name, Segment& out);

    // Attaches to an existing segment without touching its contents.
    // The object size must equal SEGMENT_SIZE, otherwise InvalidLayout.
    // A segment whose creator has not finished initializing it (version 0)
    // fails NotInitialized; retrying later is the caller's choice.
    static std::error_code Open(std::string name, Segment& out);

    // Removes the name from the OS namespace. Mappings already held by
    // other processes stay valid; later Open() calls fail NotFound.
    static std::error_code Unlink(const std::string& name);

    // Unmaps and closes the local descriptor. Safe to call repeatedly.
    void Destroy();

    bool IsAttached() const { return layout != nullptr; }
    const std::string& Name() const { return name; }
    StoreLayout* Layout() const { return layout; }

private:
    std::string name;
    boost::interprocess::shared_memory_object shm;
    boost::interprocess::mapped_region region;
    StoreLayout* layout = nullptr;
};

} // namespace shmkv

#endif // SHMKV_SEGMENT_HPP
