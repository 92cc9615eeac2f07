#ifndef config_edit_hpp
#define config_edit_hpp

#include <string>
#include <vector>

#include "mgmtsh/command_mode.hpp" // for path_entry
#include "mgmtsh/config_tree.hpp"

namespace mgmtsh {

/// @brief Finds or creates the context node named by the given nesting path.
/// @details Missing list entries are created together with their key leaves.
/// @return Identifier of the innermost context node, or the root for an
///   empty path.
auto ensure_path(config_tree& tree, const std::vector<path_entry>& path)
    -> node_id;

/// @brief Explicitly sets the value of the named leaf in the given context.
/// @return Identifier of the leaf.
/// @throws invalid_tree_error if a node of that name exists that is not a
///   leaf, for example a list key.
auto set_leaf(config_tree& tree,
              const std::vector<path_entry>& path,
              const std::string& name,
              const std::string& value) -> node_id;

/// @brief Explicitly adds the given value to the named leaf-list.
/// @note Adding a value already present only makes it explicit.
/// @return Identifier of the leaf-list instance holding the value.
/// @throws invalid_tree_error if a node of that name exists that is not a
///   leaf-list instance.
auto add_leaf_list_value(config_tree& tree,
                         const std::vector<path_entry>& path,
                         const std::string& name,
                         const std::string& value) -> node_id;

}

#endif /* config_edit_hpp */
