#ifndef enumerate_hpp
#define enumerate_hpp

#include <cstddef> // for std::ptrdiff_t
#include <iterator> // for std::default_sentinel_t, std::input_iterator_tag
#include <ostream>
#include <string>
#include <vector>

#include "mgmtsh/command_trie.hpp"

namespace mgmtsh {

/// @brief Renders the command path ending at @p id as a listing line.
/// @details The tokens from just below @p root down to @p id are rendered
///   with <code>render</code>, each followed by a single space.
auto command_line(const command_trie& trie, token_id root, token_id id)
    -> std::string;

/// @brief Lazy sequence of the executable command lines reachable from a
///   root token.
/// @details Iteration is a depth first pre-order walk of the descendants of
///   the root, in registration order, yielding the
///   <code>command_line</code> of each token that has an action.
/// @note Each call to <code>begin</code> starts a fresh walk. The trie must
///   outlive this object and not be modified while iterating.
struct command_listing
{
    struct iterator
    {
        using value_type = std::string;
        using difference_type = std::ptrdiff_t;
        using iterator_concept = std::input_iterator_tag;

        iterator() = default;
        iterator(const command_trie& trie, token_id root);

        auto operator*() const noexcept -> const std::string&
        {
            return current;
        }

        auto operator->() const noexcept -> const std::string*
        {
            return &current;
        }

        auto operator++() -> iterator&;

        auto operator++(int) -> void
        {
            ++*this;
        }

        friend auto operator==(const iterator& it,
                               std::default_sentinel_t) noexcept -> bool
        {
            return it.done;
        }

    private:
        auto advance() -> void;

        const command_trie* trie{};
        token_id root{tokens::invalid_id};
        std::vector<token_id> pending;
        std::string current;
        bool done{true};
    };

    [[nodiscard]] auto begin() const -> iterator
    {
        return iterator{*trie, root};
    }

    [[nodiscard]] auto end() const noexcept -> std::default_sentinel_t
    {
        return {};
    }

    const command_trie* trie{};
    token_id root{tokens::invalid_id};
};

static_assert(std::input_iterator<command_listing::iterator>);

/// @brief Enumerates the executable commands reachable from @p root.
/// @throws std::out_of_range if @p root does not identify a token of
///   @p trie.
auto enumerate(const command_trie& trie, token_id root) -> command_listing;

/// @brief Writes one line per executable command reachable from @p root.
auto write_command_lines(std::ostream& os,
                         const command_trie& trie,
                         token_id root) -> void;

}

#endif /* enumerate_hpp */
