#include "shmkv/errors.hpp"

namespace shmkv {

namespace {

class ShmkvCategory : public std::error_category {
public:
    const char* name() const noexcept override { return "shmkv"; }

    std::string message(int ev) const override {
        switch (static_cast<Errc>(ev)) {
            case Errc::NotInitialized:          return "store is not attached to a segment";
            case Errc::KeyTooLong:              return "key too long";
            case Errc::ValueTooLong:            return "value too long";
            case Errc::NotFound:                return "not found";
            case Errc::StoreFull:               return "store is full";
            case Errc::InvalidLayout:           return "segment size does not match the expected layout";
            case Errc::SystemResourceExhausted: return "system resources exhausted";
            case Errc::AlreadyExists:           return "segment already exists";
            case Errc::InvalidArgument:         return "empty key or embedded NUL byte";
            case Errc::PermissionDenied:        return "permission denied";
        }
        return "unknown shmkv error";
    }
};

} // namespace

const std::error_category& shmkv_category() noexcept {
    static ShmkvCategory category;
    return category;
}

std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), shmkv_category()};
}

const char* ToString(Errc e) noexcept {
    switch (e) {
        case Errc::NotInitialized:          return "NotInitialized";
        case Errc::KeyTooLong:              return "KeyTooLong";
        case Errc::ValueTooLong:            return "ValueTooLong";
        case Errc::NotFound:                return "NotFound";
        case Errc::StoreFull:               return "StoreFull";
        case Errc::InvalidLayout:           return "InvalidLayout";
        case Errc::SystemResourceExhausted: return "SystemResourceExhausted";
        case Errc::AlreadyExists:           return "AlreadyExists";
        case Errc::InvalidArgument:         return "InvalidArgument";
        case Errc::PermissionDenied:        return "PermissionDenied";
    }
    return "Unknown";
}

std::string Describe(const std::error_code& ec) {
    if (!ec) {
        return "ok";
    }
    if (ec.category() == shmkv_category()) {
        return std::string(ToString(static_cast<Errc>(ec.value()))) + " (" + ec.message() + ")";
    }
    return ec.message();
}

} // namespace shmkv
