#include "shmkv/segment.hpp"

#include <boost/interprocess/exceptions.hpp>
#include <cerrno>
#include <iostream>
#include <new>
#include <utility>

#include "shmkv/errors.hpp"

using namespace boost::interprocess;

namespace shmkv {

namespace {

std::error_code TranslateError(const interprocess_exception& e) {
    switch (e.get_error_code()) {
        case already_exists_error:
            return Errc::AlreadyExists;
        case not_found_error:
        case not_such_file_or_directory:
            return Errc::NotFound;
        case security_error:
            return Errc::PermissionDenied;
        default:
            return Errc::SystemResourceExhausted;
    }
}

} // namespace

Segment::~Segment() {
    Destroy();
}

Segment::Segment(Segment&& other) noexcept
    : name(std::move(other.name)),
      shm(std::move(other.shm)),
      region(std::move(other.region)),
      layout(std::exchange(other.layout, nullptr)) {}

Segment& Segment::operator=(Segment&& other) noexcept {
    if (this != &other) {
        Destroy();
        name = std::move(other.name);
        shm = std::move(other.shm);
        region = std::move(other.region);
        layout = std::exchange(other.layout, nullptr);
    }
    return *this;
}

std::error_code Segment::Create(std::string name, Segment& out) {
    out.Destroy();

    shared_memory_object shm;
    try {
        shm = shared_memory_object(create_only, name.c_str(), read_write);
    } catch (const interprocess_exception& e) {
        std::error_code ec = TranslateError(e);
        std::cout << "[Segment] Failed to create '" << name << "': " << e.what() << "\n";
        return ec;
    }

    mapped_region region;
    try {
        shm.truncate(static_cast<offset_t>(SEGMENT_SIZE));
        region = mapped_region(shm, read_write, 0, SEGMENT_SIZE);
    } catch (const interprocess_exception& e) {
        // The object exists but is unusable, do not leave it behind.
        std::cout << "[Segment] Failed to size or map '" << name << "': " << e.what() << "\n";
        if (!shared_memory_object::remove(name.c_str())) {
            std::cout << "[Segment] Could not remove half-created '" << name << "'\n";
        }
        return Errc::SystemResourceExhausted;
    }

    out.name = std::move(name);
    out.shm = std::move(shm);
    out.region = std::move(region);
    out.layout = new (out.region.get_address()) StoreLayout();

    std::cout << "[Segment] Created '" << out.name << "' (" << SEGMENT_SIZE << " bytes, "
              << CAPACITY << " slots)\n";
    return {};
}

std::error_code Segment::Open(std::string name, Segment& out) {
    out.Destroy();

    shared_memory_object shm;
    try {
        shm = shared_memory_object(open_only, name.c_str(), read_write);
    } catch (const interprocess_exception& e) {
        std::error_code ec = TranslateError(e);
        std::cout << "[Segment] Failed to open '" << name << "': " << e.what() << "\n";
        return ec;
    }

    offset_t size = 0;
    if (!shm.get_size(size)) {
        std::cout << "[Segment] Could not read the size of '" << name << "'\n";
        return Errc::SystemResourceExhausted;
    }
    if (static_cast<std::size_t>(size) != SEGMENT_SIZE) {
        std::cout << "[Segment] '" << name << "' is " << size << " bytes, expected "
                  << SEGMENT_SIZE << "; refusing to attach\n";
        return Errc::InvalidLayout;
    }

    mapped_region region;
    try {
        region = mapped_region(shm, read_write, 0, SEGMENT_SIZE);
    } catch (const interprocess_exception& e) {
        std::cout << "[Segment] Failed to map '" << name << "': " << e.what() << "\n";
        return Errc::SystemResourceExhausted;
    }

    // Create() leaves version at 1 and it only grows, so 0 means the creator
    // has sized the object but not constructed the layout (guard included) yet.
    const auto* layout = static_cast<const StoreLayout*>(region.get_address());
    if (layout->version == 0) {
        std::cout << "[Segment] '" << name << "' is not initialized yet; refusing to attach\n";
        return Errc::NotInitialized;
    }

    out.name = std::move(name);
    out.shm = std::move(shm);
    out.region = std::move(region);
    out.layout = static_cast<StoreLayout*>(out.region.get_address());

    std::cout << "[Segment] Opened '" << out.name << "' (version " << out.layout->version
              << ", " << out.layout->entry_count << " entries)\n";
    return {};
}

std::error_code Segment::Unlink(const std::string& name) {
    if (shared_memory_object::remove(name.c_str())) {
        std::cout << "[Segment] Unlinked '" << name << "'\n";
        return {};
    }
    int err = errno;
    std::cout << "[Segment] Failed to unlink '" << name << "': " << std::generic_category().message(err) << "\n";
    switch (err) {
        case ENOENT:
            return Errc::NotFound;
        case EACCES:
        case EPERM:
            return Errc::PermissionDenied;
        default:
            return Errc::SystemResourceExhausted;
    }
}

void Segment::Destroy() {
    if (!layout && name.empty()) {
        return;
    }
    // The guard is shared with other processes and must not be destructed here.
    layout = nullptr;
    region = mapped_region();
    shm = shared_memory_object();
    std::cout << "[Segment] Detached from '" << name << "'\n";
    name.clear();
}

} // namespace shmkv
