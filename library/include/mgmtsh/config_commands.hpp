#ifndef config_commands_hpp
#define config_commands_hpp

#include <cstddef> // for std::size_t
#include <functional> // for std::function
#include <string>
#include <vector>

#include "mgmtsh/command_mode.hpp" // for path_entry
#include "mgmtsh/command_trie.hpp"
#include "mgmtsh/commands.hpp"
#include "mgmtsh/config_tree.hpp"

namespace mgmtsh {

/// @brief Callbacks the schema-derived configuration commands run.
/// @note Paths given to these are absolute nesting paths.
struct config_handlers
{
    /// @brief Current nesting path.
    std::function<std::vector<path_entry>()> context;

    /// @brief Enters the given nesting path.
    std::function<void(std::vector<path_entry> path)> enter;

    /// @brief Sets the named leaf in the given context.
    std::function<void(const std::vector<path_entry>& path,
                       const std::string& name,
                       const std::string& value)> set;

    /// @brief Adds a value to the named leaf-list in the given context.
    std::function<void(const std::vector<path_entry>& path,
                       const std::string& name,
                       const std::string& value)> add;
};

/// @brief Absolute nesting path of a command typed in the given context.
/// @details Entries of @p schema_path beyond those of @p context take their
///   key values from @p args, consumed from the front in typed order.
/// @param[in] schema_path Nesting path of the command from the top
///   configuration context, with list key names but no key values.
/// @param[in,out] args Typed arguments. The ones used are removed.
/// @throws std::invalid_argument if there are fewer arguments than keys.
auto resolve_path(const std::vector<path_entry>& context,
                  const std::vector<path_entry>& schema_path,
                  parsed_args& args) -> std::vector<path_entry>;

/// @brief Adds the configuration commands for the shape of the given tree
///   below the configuration root of @p cmds.
/// @details Containers become keywords entering them. Lists become a
///   keyword followed by a word per key, the last of which enters the list
///   entry. Leaves and leaf-lists become a keyword followed by a word named
///   after them, setting or adding the typed value. Entries of a list are
///   merged, with commands for the union of their children.
/// @return Number of tokens added. Zero for a tree with no configuration
///   nodes, such as an empty one.
auto add_config_commands(commands& cmds,
                         const config_tree& schema,
                         const config_handlers& handlers) -> std::size_t;

}

#endif /* config_commands_hpp */
