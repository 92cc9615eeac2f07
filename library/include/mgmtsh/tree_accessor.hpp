#ifndef tree_accessor_hpp
#define tree_accessor_hpp

#include <optional>
#include <string>
#include <string_view>
#include <utility> // for std::pair
#include <vector>

#include "mgmtsh/config_tree.hpp"

namespace mgmtsh {

/// @brief Placeholder shown in place of a value that is not present.
constexpr auto missing_value = "-";

/// @brief Key leaf names paired with their values, in schema order.
using key_values = std::vector<std::pair<std::string, std::string>>;

/// @brief Finds the first child of @p id named @p name.
auto find_child(const config_tree& tree, node_id id,
                const std::string_view& name) -> std::optional<node_id>;

/// @brief Canonical value of the first child of @p id named @p name.
/// @return Empty optional if there's no such child or it has no value.
auto child_opt_value(const config_tree& tree, node_id id,
                     const std::string_view& name)
    -> std::optional<std::string>;

/// @brief Canonical value of the first child of @p id named @p name, or
///   the <code>missing_value</code> placeholder.
auto child_value(const config_tree& tree, node_id id,
                 const std::string_view& name) -> std::string;

/// @brief Key children of the given list entry in schema order.
auto list_keys(const config_tree& tree, node_id id) -> std::vector<node_id>;

/// @brief Key names and values of the given list entry.
auto list_key_values(const config_tree& tree, node_id id) -> key_values;

/// @brief Finds the child of @p parent named @p name whose keys have the
///   given values.
/// @note With no keys given, this finds the first child of that name.
auto find_entry(const config_tree& tree, node_id parent,
                const std::string_view& name, const key_values& keys)
    -> std::optional<node_id>;

/// @brief Selects the nodes matched by the given path.
/// @details The path is a slash separated sequence of node names relative
///   to @p from. Each name may be followed by key predicates of the form
///   <code>[key='value']</code>, for example
///   <code>interfaces/interface[name='eth0']/mtu</code>.
/// @return Matches in document order.
/// @throws std::invalid_argument if the path is malformed.
auto select(const config_tree& tree, node_id from,
            const std::string_view& path) -> std::vector<node_id>;

}

#endif /* tree_accessor_hpp */
