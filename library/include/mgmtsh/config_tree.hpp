#ifndef config_tree_hpp
#define config_tree_hpp

#include <cstddef> // for std::size_t
#include <optional>
#include <ostream>
#include <stdexcept> // for std::invalid_argument
#include <string>
#include <type_traits> // for std::underlying_type_t
#include <vector>

#include "mgmtsh/node_kind.hpp"

namespace mgmtsh {

/// @brief Identifier of a node within a <code>config_tree</code>.
/// @note This is a strong type for an index into the tree's arena.
enum class node_id: std::size_t;

namespace nodes {
constexpr auto root_id = node_id{0u};
constexpr auto invalid_id = node_id{
    static_cast<std::underlying_type_t<node_id>>(-1)
};
}

auto operator<<(std::ostream& os, node_id value) -> std::ostream&;

/// @brief Data node of a schema-typed configuration or state tree.
struct config_node
{
    /// @brief Schema name of the node.
    std::string name;

    node_kind kind{node_kind::container};

    /// @brief Canonical scalar value.
    /// @note Present only for leaf, list key and leaf-list instances.
    std::optional<std::string> value;

    /// @brief Whether the value was not explicitly configured.
    bool is_default{};

    /// @brief Back reference for upward navigation only.
    node_id parent{nodes::invalid_id};

    /// @brief Children in schema order.
    std::vector<node_id> children;

    auto operator==(const config_node& other) const -> bool = default;
};

struct invalid_tree_error: public std::invalid_argument
{
    invalid_tree_error(node_id id, const std::string& what_arg);

    /// @brief Identifier of the node violating the tree's invariants.
    [[nodiscard]] auto node() const noexcept -> node_id;

private:
    node_id node_{nodes::invalid_id};
};

/// @brief Arena of configuration nodes.
/// @details Nodes are owned top-down by the arena and refer to each other by
///   <code>node_id</code>, so copies of a tree are fully independent
///   snapshots of it.
/// @note The root is a nameless container that is never itself rendered.
struct config_tree
{
    config_tree();

    [[nodiscard]] auto root() const noexcept -> node_id
    {
        return nodes::root_id;
    }

    [[nodiscard]] auto size() const noexcept -> std::size_t;

    /// @throws std::out_of_range if @p id does not identify a node of this.
    [[nodiscard]] auto at(node_id id) const -> const config_node&;

    /// @throws std::out_of_range if @p id does not identify a node of this.
    auto operator[](node_id id) const -> const config_node&
    {
        return at(id);
    }

    /// @brief Appends a new child to the given parent.
    /// @return Identifier of the new node.
    /// @throws std::out_of_range if @p parent does not identify a node.
    auto add(node_id parent,
             std::string name,
             node_kind kind,
             std::optional<std::string> value = {},
             bool is_default = false) -> node_id;

    /// @brief Replaces the value of the identified node.
    /// @throws std::out_of_range if @p id does not identify a node.
    /// @throws invalid_tree_error if the node's kind carries no value.
    auto set_value(node_id id, std::string value, bool is_default = false)
        -> void;

    auto operator==(const config_tree& other) const -> bool = default;

private:
    std::vector<config_node> arena;
};

/// @brief Checks the given tree against the data model's invariants.
/// @throws invalid_tree_error identifying the first node found in violation.
auto validate(const config_tree& tree) -> void;

/// @brief Number of strict ancestors of @p id that are lists, not counting
///   @p top or any node above it.
auto list_depth(const config_tree& tree, node_id id,
                node_id top = nodes::root_id) -> std::size_t;

}

#endif /* config_tree_hpp */
