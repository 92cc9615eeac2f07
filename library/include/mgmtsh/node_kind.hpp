#ifndef node_kind_hpp
#define node_kind_hpp

#include <initializer_list>
#include <optional>
#include <ostream>
#include <string_view>

namespace mgmtsh {

/// @brief Schema node kind of a configuration or state data node.
/// @note Supplied by the schema system, never computed by this library.
enum class node_kind: unsigned {
    container,
    np_container,
    leaf,
    list_key,
    leaf_list,
    list,
    other,
};

constexpr auto to_cstring(node_kind kind) noexcept -> const char*
{
    switch (kind) {
    case node_kind::container: return "container";
    case node_kind::np_container: return "np-container";
    case node_kind::leaf: return "leaf";
    case node_kind::list_key: return "list-key";
    case node_kind::leaf_list: return "leaf-list";
    case node_kind::list: return "list";
    case node_kind::other: return "other";
    }
    return "unknown";
}

constexpr auto to_node_kind(const std::string_view& s)
    -> std::optional<node_kind>
{
    for (const auto kind: std::initializer_list<node_kind>{
        node_kind::container, node_kind::np_container, node_kind::leaf,
        node_kind::list_key, node_kind::leaf_list, node_kind::list,
        node_kind::other,
    }) {
        if (s == to_cstring(kind)) {
            return kind;
        }
    }
    return {};
}

/// @brief Whether nodes of the given kind correspond to a command line an
///   operator would type.
constexpr auto is_command(node_kind kind) noexcept -> bool
{
    switch (kind) {
    case node_kind::container:
    case node_kind::leaf:
    case node_kind::leaf_list:
    case node_kind::list:
        return true;
    case node_kind::np_container:
    case node_kind::list_key:
    case node_kind::other:
        return false;
    }
    return false;
}

/// @brief Whether nodes of the given kind carry a scalar value.
constexpr auto has_value(node_kind kind) noexcept -> bool
{
    switch (kind) {
    case node_kind::leaf:
    case node_kind::list_key:
    case node_kind::leaf_list:
        return true;
    case node_kind::container:
    case node_kind::np_container:
    case node_kind::list:
    case node_kind::other:
        return false;
    }
    return false;
}

auto operator<<(std::ostream& os, node_kind value) -> std::ostream&;

}

#endif /* node_kind_hpp */
