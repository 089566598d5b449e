#ifndef LIVEPROP_UTIL_ERRORS
#define LIVEPROP_UTIL_ERRORS

#include <fmt/format.h>

#include <concepts>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>

namespace liveprop {

    // Overload (I) - takes error msg and appends the source location
    template<typename Error = std::runtime_error>
        requires std::constructible_from<Error, std::string>
    [[noreturn]] constexpr auto throw_error(
        std::string_view msg,
        std::source_location loc = std::source_location::current()
    ) {
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", msg,
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    /**
     * A format string paired with the location it was written at. The location is captured when the string
     * literal converts at the call site, so a variadic throw_error can still report it.
     */
    template<typename... Ts>
    struct located_format_string {
        template<typename S>
            requires std::convertible_to<const S &, std::string_view>
        consteval located_format_string(const S &str, std::source_location loc_ = std::source_location::current())
            : fmt_str{str}, loc{loc_} {}

        fmt::format_string<Ts...> fmt_str;
        std::source_location loc;
    };

    // Overload (II) - direct formatting of error msg from args, the source location is appended to the message
    template<typename Error = std::runtime_error, typename... Ts>
        requires (std::constructible_from<Error, std::string> && sizeof...(Ts) > 0)
    [[noreturn]] constexpr auto throw_error(located_format_string<std::type_identity_t<Ts>...> fmt_str, Ts&&... xs) {
        const auto &loc{fmt_str.loc};
        throw Error{fmt::format(
            "{}\nFile: {}({}:{}): {}", fmt::format(fmt_str.fmt_str, std::forward<Ts>(xs)...),
            loc.file_name(), loc.line(), loc.column(), loc.function_name()
        )};
    }

    /**
     * Raised when a PropertyValue is read as a type it does not hold.
     */
    struct bad_property_type : std::runtime_error {
        explicit bad_property_type(const std::string &msg) : std::runtime_error{msg} {}

        bad_property_type(std::string_view expected_type, std::string_view actual_type)
            : std::runtime_error{fmt::format("Expected property value of type '{}', got: {}", expected_type, actual_type)}
        {}
    };

    /**
     * Raised at construction of a LiveObject when cycle detection is enabled and the computed properties
     * form a dependency cycle.
     */
    struct dependency_cycle_error : std::runtime_error {
        using std::runtime_error::runtime_error;
    };

} // namespace liveprop

#endif // LIVEPROP_UTIL_ERRORS
