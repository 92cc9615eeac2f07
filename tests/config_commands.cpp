#include <stdexcept> // for std::invalid_argument
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "mgmtsh/config_commands.hpp"
#include "mgmtsh/enumerate.hpp"

using namespace mgmtsh;

namespace {

auto make_schema() -> config_tree
{
    auto tree = config_tree{};
    const auto system = tree.add(tree.root(), "system", node_kind::container);
    tree.add(system, "hostname", node_kind::leaf, "router1");
    const auto interfaces = tree.add(tree.root(), "interfaces",
                                     node_kind::np_container);
    const auto eth0 = tree.add(interfaces, "interface", node_kind::list);
    tree.add(eth0, "name", node_kind::list_key, "eth0");
    tree.add(eth0, "mtu", node_kind::leaf, "1500", true);
    const auto eth1 = tree.add(interfaces, "interface", node_kind::list);
    tree.add(eth1, "name", node_kind::list_key, "eth1");
    tree.add(eth1, "description", node_kind::leaf, "uplink");
    tree.add(eth1, "mtu", node_kind::leaf, "1500", true);
    const auto dns = tree.add(tree.root(), "dns", node_kind::np_container);
    tree.add(dns, "server", node_kind::leaf_list, "192.0.2.1");
    tree.add(dns, "server", node_kind::leaf_list, "192.0.2.2");
    return tree;
}

struct recorder
{
    std::vector<path_entry> context;
    std::vector<std::vector<path_entry>> entered;
    std::vector<std::string> edits;

    auto handlers() -> config_handlers
    {
        return config_handlers{
            [this](){
                return context;
            },
            [this](std::vector<path_entry> path){
                entered.push_back(path);
                context = std::move(path);
            },
            [this](const std::vector<path_entry>& path,
                   const std::string& name, const std::string& value){
                edits.push_back("set " + std::to_string(size(path)) + " " +
                                name + " " + value);
            },
            [this](const std::vector<path_entry>& path,
                   const std::string& name, const std::string& value){
                edits.push_back("add " + std::to_string(size(path)) + " " +
                                name + " " + value);
            },
        };
    }
};

auto collect(const command_trie& trie, token_id root)
    -> std::vector<std::string>
{
    auto result = std::vector<std::string>{};
    for (auto&& line: enumerate(trie, root)) {
        result.push_back(line);
    }
    return result;
}

auto run(commands& cmds, const std::vector<token_id>& roots,
         const std::vector<std::string>& words) -> void
{
    auto match = match_command(cmds.trie, roots, words);
    ASSERT_TRUE(match);
    ASSERT_TRUE(cmds.trie[match->token].action);
    (*cmds.trie[match->token].action)(match->args);
}

}

TEST(add_config_commands, listing)
{
    auto cmds = commands{};
    auto rec = recorder{};
    add_config_commands(cmds, make_schema(), rec.handlers());
    EXPECT_EQ(collect(cmds.trie, cmds.config_root),
              (std::vector<std::string>{
                  "SYSTEM ",
                  "SYSTEM HOSTNAME hostname ",
                  "INTERFACES ",
                  "INTERFACES INTERFACE name ",
                  "INTERFACES INTERFACE name MTU mtu ",
                  "INTERFACES INTERFACE name DESCRIPTION description ",
                  "DNS ",
                  "DNS SERVER server ",
              }));
}

TEST(add_config_commands, counts_added_tokens)
{
    auto cmds = commands{};
    auto rec = recorder{};
    const auto before = cmds.trie.size();
    EXPECT_EQ(add_config_commands(cmds, make_schema(), rec.handlers()),
              cmds.trie.size() - before);
    EXPECT_NE(cmds.trie.size(), before);
}

TEST(add_config_commands, empty_tree_adds_nothing)
{
    auto cmds = commands{};
    auto rec = recorder{};
    EXPECT_EQ(add_config_commands(cmds, config_tree{}, rec.handlers()), 0u);
    EXPECT_TRUE(empty(collect(cmds.trie, cmds.config_root)));
}

TEST(add_config_commands, merges_list_entries)
{
    auto cmds = commands{};
    auto rec = recorder{};
    add_config_commands(cmds, make_schema(), rec.handlers());
    const auto interfaces = cmds.trie.find_child(cmds.config_root,
                                                 "interfaces",
                                                 token_kind::keyword);
    ASSERT_TRUE(interfaces);
    EXPECT_EQ(size(cmds.trie[*interfaces].children), 1u);
}

TEST(add_config_commands, enter_list_entry)
{
    auto cmds = commands{};
    auto rec = recorder{};
    add_config_commands(cmds, make_schema(), rec.handlers());
    run(cmds, {cmds.config_root}, {"interfaces", "interface", "eth2"});
    ASSERT_EQ(size(rec.entered), 1u);
    EXPECT_EQ(rec.entered[0], (std::vector<path_entry>{
        {"interfaces", node_kind::np_container, {}},
        {"interface", node_kind::list, {{"name", "eth2"}}},
    }));
}

TEST(add_config_commands, set_from_nested_context)
{
    auto cmds = commands{};
    auto rec = recorder{};
    add_config_commands(cmds, make_schema(), rec.handlers());
    run(cmds, {cmds.config_root}, {"interfaces"});
    const auto root = cmds.trie.find_child(cmds.config_root, "interfaces",
                                           token_kind::keyword);
    ASSERT_TRUE(root);
    run(cmds, {*root}, {"interface", "eth0", "mtu", "9000"});
    EXPECT_EQ(rec.edits, (std::vector<std::string>{"set 2 mtu 9000"}));
    EXPECT_EQ(size(rec.context), 1u);
}

TEST(add_config_commands, add_leaf_list_value)
{
    auto cmds = commands{};
    auto rec = recorder{};
    add_config_commands(cmds, make_schema(), rec.handlers());
    run(cmds, {cmds.config_root}, {"dns", "server", "192.0.2.9"});
    EXPECT_EQ(rec.edits, (std::vector<std::string>{
        "add 1 server 192.0.2.9"
    }));
}

TEST(resolve_path, fills_keys_in_order)
{
    const auto schema_path = std::vector<path_entry>{
        {"routing", node_kind::container, {}},
        {"route", node_kind::list, {{"prefix", ""}, {"vrf", ""}}},
    };
    auto args = parsed_args{{"prefix", "10.0.0.0/8"}, {"vrf", "red"},
                            {"metric", "10"}};
    const auto path = resolve_path({}, schema_path, args);
    ASSERT_EQ(size(path), 2u);
    EXPECT_EQ(path[1].keys, (key_values{{"prefix", "10.0.0.0/8"},
                                        {"vrf", "red"}}));
    EXPECT_EQ(args, (parsed_args{{"metric", "10"}}));
}

TEST(resolve_path, keeps_context)
{
    const auto context = std::vector<path_entry>{
        {"interfaces", node_kind::np_container, {}},
        {"interface", node_kind::list, {{"name", "eth0"}}},
    };
    const auto schema_path = std::vector<path_entry>{
        {"interfaces", node_kind::np_container, {}},
        {"interface", node_kind::list, {{"name", ""}}},
    };
    auto args = parsed_args{{"mtu", "9000"}};
    EXPECT_EQ(resolve_path(context, schema_path, args), context);
    EXPECT_EQ(size(args), 1u);
}

TEST(resolve_path, missing_argument)
{
    const auto schema_path = std::vector<path_entry>{
        {"interface", node_kind::list, {{"name", ""}}},
    };
    auto args = parsed_args{};
    EXPECT_THROW(resolve_path({}, schema_path, args), std::invalid_argument);
}
