#include <algorithm> // for std::min
#include <stdexcept> // for std::invalid_argument
#include <utility> // for std::move

#include "mgmtsh/config_commands.hpp"
#include "mgmtsh/tree_accessor.hpp"

namespace mgmtsh {

namespace {

auto take_front(parsed_args& args) -> std::string
{
    if (empty(args)) {
        throw std::invalid_argument{"missing argument"};
    }
    auto result = std::move(args.front().second);
    args.erase(begin(args));
    return result;
}

auto find_or_add(command_trie& trie, token_id parent,
                 const std::string& name, token_kind kind, std::string help)
    -> token_id
{
    if (const auto found = trie.find_child(parent, name, kind)) {
        return *found;
    }
    return trie.add(parent, name, kind, {}, std::move(help));
}

auto enter_action(const config_handlers& handlers,
                  std::vector<path_entry> schema_path) -> command_action
{
    return [handlers, schema_path = std::move(schema_path)](parsed_args& args){
        handlers.enter(resolve_path(handlers.context(), schema_path, args));
    };
}

auto value_action(const config_handlers& handlers,
                  std::vector<path_entry> schema_path,
                  std::string name, bool add) -> command_action
{
    return [handlers, schema_path = std::move(schema_path),
            name = std::move(name), add](parsed_args& args){
        const auto path = resolve_path(handlers.context(), schema_path, args);
        const auto value = take_front(args);
        if (add) {
            handlers.add(path, name, value);
        }
        else {
            handlers.set(path, name, value);
        }
    };
}

auto add_tokens(command_trie& trie, token_id parent,
                const config_tree& schema, node_id id,
                const std::vector<path_entry>& schema_path,
                const config_handlers& handlers) -> void
{
    for (auto&& child_id: schema[id].children) {
        const auto& child = schema[child_id];
        switch (child.kind) {
        case node_kind::container:
        case node_kind::np_container: {
            const auto token = find_or_add(trie, parent, child.name,
                                           token_kind::keyword,
                                           "Enter the " + child.name +
                                           " context");
            auto path = schema_path;
            path.push_back(path_entry{child.name, child.kind, {}});
            trie.set_action(token, enter_action(handlers, path));
            add_tokens(trie, token, schema, child_id, path, handlers);
            break;
        }
        case node_kind::list: {
            auto token = find_or_add(trie, parent, child.name,
                                     token_kind::keyword,
                                     "Enter a " + child.name + " entry");
            auto entry = path_entry{child.name, child.kind, {}};
            for (auto&& key: list_keys(schema, child_id)) {
                const auto& key_name = schema[key].name;
                token = find_or_add(trie, token, key_name, token_kind::word,
                                    child.name + " " + key_name);
                entry.keys.emplace_back(key_name, std::string{});
            }
            auto path = schema_path;
            path.push_back(std::move(entry));
            trie.set_action(token, enter_action(handlers, path));
            add_tokens(trie, token, schema, child_id, path, handlers);
            break;
        }
        case node_kind::leaf:
        case node_kind::leaf_list: {
            const auto add = (child.kind == node_kind::leaf_list);
            const auto keyword = find_or_add(trie, parent, child.name,
                                             token_kind::keyword,
                                             (add? "Add a ": "Set the ") +
                                             child.name + " value");
            const auto word = find_or_add(trie, keyword, child.name,
                                          token_kind::word, child.name);
            trie.set_action(word, value_action(handlers, schema_path,
                                               child.name, add));
            break;
        }
        case node_kind::list_key:
        case node_kind::other:
            break;
        }
    }
}

}

auto resolve_path(const std::vector<path_entry>& context,
                  const std::vector<path_entry>& schema_path,
                  parsed_args& args) -> std::vector<path_entry>
{
    auto result = context;
    const auto first = std::min(size(context), size(schema_path));
    result.resize(first);
    for (auto i = first; i < size(schema_path); ++i) {
        auto entry = schema_path[i];
        for (auto&& key: entry.keys) {
            key.second = take_front(args);
        }
        result.push_back(std::move(entry));
    }
    return result;
}

auto add_config_commands(commands& cmds,
                         const config_tree& schema,
                         const config_handlers& handlers) -> std::size_t
{
    const auto before = cmds.trie.size();
    add_tokens(cmds.trie, cmds.config_root, schema, schema.root(), {},
               handlers);
    return cmds.trie.size() - before;
}

}
