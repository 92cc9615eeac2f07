#ifndef utility_hpp
#define utility_hpp

#include <ostream>
#include <string>
#include <string_view>
#include <type_traits> // for std::underlying_type_t
#include <variant>

namespace mgmtsh {

namespace detail {
template<class... Ts>
struct overloaded : Ts... { using Ts::operator()...; };
template<class... Ts>
overloaded(Ts...) -> overloaded<Ts...>;
}

/// @brief Output streams whichever alternative the given variant holds.
/// @note Lives in this namespace so variants of this library's types find it
///   through argument dependent lookup.
template<class... Ts>
auto operator<<(std::ostream& os, const std::variant<Ts...>& value)
    -> std::ostream&
{
    std::visit([&os](const auto& v) { os << v; }, value);
    return os;
}

/// @brief Converts the given enumerate into its underlying value.
/// @note This is basically a back port from C++23.
template <class Enum>
constexpr auto to_underlying(Enum e) noexcept ->
    decltype(static_cast<std::underlying_type_t<Enum>>(e))
{
    return static_cast<std::underlying_type_t<Enum>>(e);
}

/// @brief Upper cases the ASCII letters of the given string.
auto to_upper(std::string_view s) -> std::string;

}

#endif /* utility_hpp */
