#include "mgmtsh/config_edit.hpp"
#include "mgmtsh/tree_accessor.hpp"

namespace mgmtsh {

auto ensure_path(config_tree& tree, const std::vector<path_entry>& path)
    -> node_id
{
    auto current = tree.root();
    for (auto&& entry: path) {
        if (const auto found = find_entry(tree, current, entry.name,
                                          entry.keys)) {
            current = *found;
            continue;
        }
        const auto id = tree.add(current, entry.name, entry.kind);
        for (auto&& key: entry.keys) {
            tree.add(id, key.first, node_kind::list_key, key.second);
        }
        current = id;
    }
    return current;
}

auto set_leaf(config_tree& tree,
              const std::vector<path_entry>& path,
              const std::string& name,
              const std::string& value) -> node_id
{
    const auto context = ensure_path(tree, path);
    if (const auto found = find_child(tree, context, name)) {
        if (tree[*found].kind != node_kind::leaf) {
            throw invalid_tree_error{*found, name + " is a " +
                to_cstring(tree[*found].kind) + ", not a leaf"};
        }
        tree.set_value(*found, value);
        return *found;
    }
    return tree.add(context, name, node_kind::leaf, value);
}

auto add_leaf_list_value(config_tree& tree,
                         const std::vector<path_entry>& path,
                         const std::string& name,
                         const std::string& value) -> node_id
{
    const auto context = ensure_path(tree, path);
    for (auto&& child: tree[context].children) {
        const auto& node = tree[child];
        if (node.name != name) {
            continue;
        }
        if (node.kind != node_kind::leaf_list) {
            throw invalid_tree_error{child, name + " is a " +
                to_cstring(node.kind) + ", not a leaf-list"};
        }
        if (node.value == value) {
            tree.set_value(child, value);
            return child;
        }
    }
    return tree.add(context, name, node_kind::leaf_list, value);
}

}
