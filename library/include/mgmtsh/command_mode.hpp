#ifndef command_mode_hpp
#define command_mode_hpp

#include <concepts> // for std::regular.
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "mgmtsh/commands.hpp"
#include "mgmtsh/node_kind.hpp"
#include "mgmtsh/tree_accessor.hpp"
#include "mgmtsh/utility.hpp" // for variant ostream support

namespace mgmtsh {

/// @brief One step of a configuration nesting path.
struct path_entry
{
    std::string name;

    /// @brief Kind of the node entered.
    /// @note One of container, np_container or list.
    node_kind kind{node_kind::container};

    /// @brief Key names and values identifying the list entry entered.
    key_values keys;

    auto operator==(const path_entry& other) const -> bool = default;
};

auto operator<<(std::ostream& os, const path_entry& value) -> std::ostream&;

struct operational_mode
{
    auto operator==(const operational_mode&) const -> bool = default;
};

auto operator<<(std::ostream& os, const operational_mode& value)
    -> std::ostream&;

struct configure_mode
{
    /// @brief Nested configuration contexts entered, outermost first.
    std::vector<path_entry> nodes;

    auto operator==(const configure_mode& other) const -> bool = default;
};

auto operator<<(std::ostream& os, const configure_mode& value)
    -> std::ostream&;

/// @brief Operating context of a shell session.
/// @note Owned by the session and passed to the functions needing it.
using command_mode = std::variant<operational_mode, configure_mode>;

static_assert(std::regular<command_mode>);

/// @brief Mode after descending into the given configuration context.
auto enter(const command_mode& mode, path_entry entry) -> command_mode;

/// @brief Mode after leaving the current context.
/// @details Leaves the innermost nested configuration context, or from the
///   top configuration context returns to operational mode.
auto leave(const command_mode& mode) -> command_mode;

/// @brief XPath-like data path of the nesting path, for example
///   <code>/interfaces/interface[name='eth0']</code>.
/// @return Empty optional when not nested in a configuration context.
auto data_path(const command_mode& mode) -> std::optional<std::string>;

/// @brief Schema-derived command root matching the nesting path.
/// @details Walks from the configuration root through the keyword token of
///   each path entry and the word tokens of its keys, stopping at the
///   deepest match.
/// @return The operational root in operational mode.
auto mode_token(const commands& cmds, const command_mode& mode) -> token_id;

/// @brief Roots whose commands are available in the given mode, in the
///   order they're consulted and listed.
auto enumeration_roots(const commands& cmds, const command_mode& mode)
    -> std::vector<token_id>;

/// @brief Separator line written between batches of listed commands.
constexpr auto listing_separator = "---";

/// @brief Writes the executable commands available in the given mode.
auto list_commands(std::ostream& os,
                   const commands& cmds,
                   const command_mode& mode) -> void;

/// @brief Prompt for the given hostname and mode.
auto prompt(const std::string_view& hostname, const command_mode& mode)
    -> std::string;

}

#endif /* command_mode_hpp */
