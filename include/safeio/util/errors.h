#ifndef SAFEIO_UTIL_ERRORS
#define SAFEIO_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>

namespace safeio {

    /**
     * Root of the safeio exception hierarchy.
     *
     * Failures raised by a caller-supplied operation are never wrapped in these types, they are rethrown as-is.
     */
    struct SafeIOError : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

    // Unknown refugee ID, never-housed variable name, or unbound variable.
    struct NotFound : SafeIOError {
        using SafeIOError::SafeIOError;
    };

    // Malformed or reserved variable name.
    struct InvalidName : SafeIOError {
        using SafeIOError::SafeIOError;
    };

    // Attempt to rebind an immutable binding without allow_constant_overwrite.
    struct ConstantBinding : SafeIOError {
        using SafeIOError::SafeIOError;
    };

    // Snapshot, backup or rename step failed.
    struct IOFailure : SafeIOError {
        using SafeIOError::SafeIOError;
    };

    template<typename Error = std::runtime_error, typename... Ts>
        requires (!std::constructible_from<Error, std::string>)
    [[noreturn]] constexpr auto throw_error(Ts&&... args) {
        throw Error{std::forward<Ts>(args)...};
    }

    // Overload (I) - takes error msg and appends the source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format("{}\nFile: {}({}:{}): {}", msg, loc.file_name(), loc.line(), loc.column(),
                                loc.function_name())};
    }

    // Overload (II) - direct formatting of error msg from args, the message is used verbatim
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(fmt::format_string<Ts...> fmt_str, Ts&&... xs) {
        throw Error{fmt::format(fmt_str, std::forward<Ts>(xs)...)};
    }

} // namespace safeio

#endif // SAFEIO_UTIL_ERRORS
