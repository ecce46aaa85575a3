#pragma once
/// @file Errors.hpp
/// @brief Error category for propfile-specific failures

#include <string>
#include <system_error>

namespace PropFile {

/// @brief Library-specific error conditions
///
/// I/O failures are reported with std::generic_category() instead.
enum class Errc {
    InvalidFormat = 1,  ///< Format string does not match the layout grammar
    UnsupportedCharset, ///< Charset name is not one of the supported charsets
};

/// @brief Returns the "propfile" error category singleton
const std::error_category& propfileCategory() noexcept;

/// @brief Creates an error code in the propfile category
inline std::error_code make_error_code(Errc e) noexcept {
    return {static_cast<int>(e), propfileCategory()};
}

} // namespace PropFile

namespace std {
template <> struct is_error_code_enum<PropFile::Errc> : true_type {};
} // namespace std
