#ifndef command_trie_hpp
#define command_trie_hpp

#include <cstddef> // for std::size_t
#include <functional> // for std::function
#include <optional>
#include <ostream>
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <string_view>
#include <type_traits> // for std::underlying_type_t
#include <utility> // for std::pair
#include <vector>

namespace mgmtsh {

/// @brief Identifier of a token within a <code>command_trie</code>.
enum class token_id: std::size_t;

namespace tokens {
constexpr auto invalid_id = token_id{
    static_cast<std::underlying_type_t<token_id>>(-1)
};
}

auto operator<<(std::ostream& os, token_id value) -> std::ostream&;

enum class token_kind: unsigned {
    /// @brief Structural token anchoring a command vocabulary.
    root,
    /// @brief Fixed literal the operator types verbatim.
    keyword,
    /// @brief Placeholder the operator substitutes a value for.
    word,
};

constexpr auto to_cstring(token_kind kind) noexcept -> const char*
{
    switch (kind) {
    case token_kind::root: return "root";
    case token_kind::keyword: return "keyword";
    case token_kind::word: return "word";
    }
    return "unknown";
}

auto operator<<(std::ostream& os, token_kind value) -> std::ostream&;

/// @brief Arguments of a matched command as (token name, typed text) pairs
///   in the order typed.
using parsed_args = std::vector<std::pair<std::string, std::string>>;

using command_action = std::function<void(parsed_args& args)>;

struct command_token
{
    std::string name;
    token_kind kind{token_kind::keyword};
    std::string help;

    /// @brief Handler of the command ending at this token.
    /// @note Present only on tokens that complete an executable command.
    std::optional<command_action> action;

    token_id parent{tokens::invalid_id};

    /// @brief Children in registration order.
    std::vector<token_id> children;
};

struct invalid_token_error: public std::invalid_argument
{
    using invalid_argument::invalid_argument;
};

/// @brief Arena of command tokens forming one or more tries.
struct command_trie
{
    /// @brief Adds a new structural root token.
    auto add_root(std::string name) -> token_id;

    /// @brief Appends a new child token to the given parent.
    /// @throws std::out_of_range if @p parent does not identify a token.
    /// @throws invalid_token_error if @p kind is <code>token_kind::root</code>.
    auto add(token_id parent,
             std::string name,
             token_kind kind,
             std::optional<command_action> action = {},
             std::string help = {}) -> token_id;

    /// @brief Finds the first child of @p parent of the given name and kind.
    [[nodiscard]] auto find_child(token_id parent,
                                  const std::string_view& name,
                                  token_kind kind) const
        -> std::optional<token_id>;

    /// @throws std::out_of_range if @p id does not identify a token.
    auto set_action(token_id id, command_action action) -> void;

    /// @throws std::out_of_range if @p id does not identify a token.
    [[nodiscard]] auto at(token_id id) const -> const command_token&;

    auto operator[](token_id id) const -> const command_token&
    {
        return at(id);
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t;

private:
    std::vector<command_token> arena;
};

/// @brief Renders a token the way command listings show it.
/// @return The name upper cased for keywords, otherwise the name as is.
auto render(const command_token& token) -> std::string;

/// @brief Tokens from just below @p root down to @p id.
/// @note The walk stops at @p root by identity, so the result does not
///   depend on the order in which tokens were added.
auto token_path(const command_trie& trie, token_id root, token_id id)
    -> std::vector<token_id>;

/// @brief Removes the first argument of the given name.
/// @return Text of the argument removed, or empty optional if none.
auto take_arg(parsed_args& args, const std::string_view& name)
    -> std::optional<std::string>;

/// @brief Token the typed words lead to and the arguments typed on the way.
struct command_match
{
    token_id token{tokens::invalid_id};
    parsed_args args;
};

/// @brief Matches the given words against the tries of the given roots.
/// @details Each word matches the child keyword of that name, or else the
///   first child word token which takes the word as its argument. Roots are
///   tried in the order given until one matches all of the words.
/// @return Empty optional if no root matches all of the words.
auto match_command(const command_trie& trie,
                   const std::vector<token_id>& roots,
                   const std::vector<std::string>& words)
    -> std::optional<command_match>;

}

#endif /* command_trie_hpp */
