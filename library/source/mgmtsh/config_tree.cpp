#include <iomanip> // for std::quoted
#include <sstream> // for std::ostringstream
#include <string_view>

#include "mgmtsh/config_tree.hpp"
#include "mgmtsh/utility.hpp"

namespace mgmtsh {

namespace {

auto describe(const config_tree& tree, node_id id,
              const std::string_view& problem) -> std::string
{
    std::ostringstream os;
    const auto& node = tree.at(id);
    os << node.kind << " " << std::quoted(node.name);
    os << " (node " << id << ") " << problem;
    return os.str();
}

auto validate_list(const config_tree& tree, node_id id) -> void
{
    auto keys_done = false;
    for (auto&& child: tree.at(id).children) {
        if (tree.at(child).kind != node_kind::list_key) {
            keys_done = true;
            continue;
        }
        if (keys_done) {
            throw invalid_tree_error{child, describe(tree, child,
                "follows a non-key child of its list")};
        }
    }
}

auto validate(const config_tree& tree, node_id id) -> void
{
    const auto& node = tree.at(id);
    if (has_value(node.kind)) {
        if (!node.value) {
            throw invalid_tree_error{id, describe(tree, id, "has no value")};
        }
        if (!empty(node.children)) {
            throw invalid_tree_error{id, describe(tree, id,
                "has children")};
        }
    }
    switch (node.kind) {
    case node_kind::list_key:
        if (node.parent == nodes::invalid_id ||
            tree.at(node.parent).kind != node_kind::list) {
            throw invalid_tree_error{id, describe(tree, id,
                "is not within a list")};
        }
        break;
    case node_kind::list:
        validate_list(tree, id);
        [[fallthrough]];
    case node_kind::container:
    case node_kind::np_container:
        if (node.value) {
            throw invalid_tree_error{id, describe(tree, id,
                "carries a value")};
        }
        break;
    case node_kind::leaf:
    case node_kind::leaf_list:
    case node_kind::other:
        break;
    }
    for (auto&& child: node.children) {
        validate(tree, child);
    }
}

}

auto operator<<(std::ostream& os, node_id value) -> std::ostream&
{
    os << to_underlying(value);
    return os;
}

invalid_tree_error::invalid_tree_error(node_id id,
                                       const std::string& what_arg):
    invalid_argument(what_arg), node_(id)
{
    // Intentionally empty.
}

auto invalid_tree_error::node() const noexcept -> node_id
{
    return node_;
}

config_tree::config_tree(): arena{config_node{}}
{
    // Intentionally empty.
}

auto config_tree::size() const noexcept -> std::size_t
{
    return arena.size();
}

auto config_tree::at(node_id id) const -> const config_node&
{
    return arena.at(to_underlying(id));
}

auto config_tree::add(node_id parent,
                      std::string name,
                      node_kind kind,
                      std::optional<std::string> value,
                      bool is_default) -> node_id
{
    // Checks parent before growing the arena.
    (void) at(parent);
    const auto id = node_id{arena.size()};
    arena.push_back(config_node{
        .name = std::move(name),
        .kind = kind,
        .value = std::move(value),
        .is_default = is_default,
        .parent = parent,
    });
    arena[to_underlying(parent)].children.push_back(id);
    return id;
}

auto config_tree::set_value(node_id id, std::string value, bool is_default)
    -> void
{
    if (!has_value(at(id).kind)) {
        throw invalid_tree_error{id, describe(*this, id,
            "cannot hold a value")};
    }
    auto& node = arena[to_underlying(id)];
    node.value = std::move(value);
    node.is_default = is_default;
}

auto validate(const config_tree& tree) -> void
{
    const auto& root = tree.at(tree.root());
    if (root.kind != node_kind::container) {
        throw invalid_tree_error{tree.root(), describe(tree, tree.root(),
            "is not a container")};
    }
    validate(tree, tree.root());
}

auto list_depth(const config_tree& tree, node_id id, node_id top)
    -> std::size_t
{
    auto depth = std::size_t{};
    if (id == top) {
        return depth;
    }
    for (auto p = tree.at(id).parent;
         p != nodes::invalid_id && p != top;
         p = tree.at(p).parent) {
        if (tree.at(p).kind == node_kind::list) {
            ++depth;
        }
    }
    return depth;
}

}
