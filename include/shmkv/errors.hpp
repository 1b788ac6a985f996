#ifndef SHMKV_ERRORS_HPP
#define SHMKV_ERRORS_HPP

#include <string>
#include <system_error>

namespace shmkv {

// Failure kinds surfaced by the segment manager and the table engine.
// Zero is reserved for success so a default std::error_code means "ok".
enum class Errc {
    NotInitialized = 1,
    KeyTooLong,
    ValueTooLong,
    NotFound,
    StoreFull,
    InvalidLayout,
    SystemResourceExhausted,
    AlreadyExists,
    InvalidArgument,
    PermissionDenied,
};

const std::error_category& shmkv_category() noexcept;

std::error_code make_error_code(Errc e) noexcept;

// Stable name of a failure kind, e.g. "StoreFull".
const char* ToString(Errc e) noexcept;

// Name of the error when it belongs to the shmkv category, message otherwise.
std::string Describe(const std::error_code& ec);

} // namespace shmkv

namespace std {
template <>
struct is_error_code_enum<shmkv::Errc> : true_type {};
} // namespace std

#endif // SHMKV_ERRORS_HPP
