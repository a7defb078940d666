// Expected.hpp
// -----------------------------------------------------------------------------
// Project-wide spelling of tl::expected. Fallible operations return
// expected<T> carrying a std::error_code; the project error enums in
// Errors.hpp convert to error codes implicitly, so callers can write
// `return unexpected(IdentifyError::Timeout);`.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace minerscan {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

/// Wraps an error for return from an expected<T> function. Error-code enums are
/// converted to std::error_code first so they match the default error type.
template <typename E>
[[nodiscard]] auto unexpected(E&& error) {
    if constexpr (std::is_error_code_enum<std::decay_t<E>>::value) {
        return unexpected_t<std::error_code>(make_error_code(error));
    } else {
        return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
    }
}

} // namespace minerscan
