#ifndef flatten_hpp
#define flatten_hpp

#include <ostream>
#include <string>

#include "mgmtsh/config_tree.hpp"

namespace mgmtsh {

/// @brief Marker line starting each list entry and ending the configuration.
constexpr auto entry_separator = '!';

/// @brief Writes the canonical command lines of the subtree rooted at
///   @p from, not including @p from itself.
/// @details Nodes are visited in document order. Every presence container,
///   non-key leaf, leaf-list value and list entry gives one line made of the
///   names (plus values or list keys) of the node and its ancestors up to
///   the nearest enclosing list entry. Lines are indented one space per
///   enclosing list entry and each list entry's line is preceded by an
///   indented <code>entry_separator</code> line. A final unindented
///   <code>entry_separator</code> line is always written.
/// @param[in] with_defaults Whether to include nodes whose values were not
///   explicitly configured.
/// @note Only reads from @p tree.
auto write_commands(std::ostream& os,
                    const config_tree& tree,
                    node_id from,
                    bool with_defaults) -> void;

/// @brief Flattens the subtree rooted at @p from into command text.
/// @see write_commands.
auto flatten(const config_tree& tree, node_id from, bool with_defaults)
    -> std::string;

/// @brief Flattens the whole of the given tree into command text.
auto flatten(const config_tree& tree, bool with_defaults) -> std::string;

}

#endif /* flatten_hpp */
