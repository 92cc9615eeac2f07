#include <sstream> // for std::ostringstream
#include <vector>

#include "mgmtsh/flatten.hpp"
#include "mgmtsh/tree_accessor.hpp"

namespace mgmtsh {

namespace {

/// @brief Nodes from the nearest enclosing list entry (exclusive) or
///   @p top (exclusive) down to @p id (inclusive).
auto local_path(const config_tree& tree, node_id id, node_id top)
    -> std::vector<node_id>
{
    auto result = std::vector<node_id>{id};
    for (auto p = tree.at(id).parent;
         p != nodes::invalid_id && p != top &&
         tree.at(p).kind != node_kind::list;
         p = tree.at(p).parent) {
        result.push_back(p);
    }
    return std::vector<node_id>(rbegin(result), rend(result));
}

auto write_line(std::ostream& os, const config_tree& tree,
                node_id id, node_id top) -> void
{
    const auto indent = std::string(list_depth(tree, id, top), ' ');
    if (tree.at(id).kind == node_kind::list) {
        os << indent << entry_separator << '\n';
    }
    os << indent;
    auto prefix = "";
    for (auto&& p: local_path(tree, id, top)) {
        const auto& node = tree.at(p);
        os << prefix << node.name;
        prefix = " ";
        if (node.kind == node_kind::list) {
            for (auto&& key: list_keys(tree, p)) {
                if (const auto& value = tree.at(key).value) {
                    os << prefix << *value;
                }
            }
        }
        else if (node.value) {
            os << prefix << *node.value;
        }
    }
    os << '\n';
}

auto write_subtree(std::ostream& os, const config_tree& tree,
                   node_id id, node_id top, bool with_defaults) -> void
{
    for (auto&& child: tree.at(id).children) {
        const auto& node = tree.at(child);
        if (is_command(node.kind) && (with_defaults || !node.is_default)) {
            write_line(os, tree, child, top);
        }
        write_subtree(os, tree, child, top, with_defaults);
    }
}

}

auto write_commands(std::ostream& os,
                    const config_tree& tree,
                    node_id from,
                    bool with_defaults) -> void
{
    write_subtree(os, tree, from, from, with_defaults);
    os << entry_separator << '\n';
}

auto flatten(const config_tree& tree, node_id from, bool with_defaults)
    -> std::string
{
    std::ostringstream os;
    write_commands(os, tree, from, with_defaults);
    return os.str();
}

auto flatten(const config_tree& tree, bool with_defaults) -> std::string
{
    return flatten(tree, tree.root(), with_defaults);
}

}
