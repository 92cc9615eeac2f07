#include <stdexcept> // for std::out_of_range

#include <gtest/gtest.h>

#include "mgmtsh/command_trie.hpp"
#include "mgmtsh/commands.hpp"

using namespace mgmtsh;

TEST(command_trie, add_root)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    EXPECT_EQ(trie.size(), 1u);
    EXPECT_EQ(trie[root].kind, token_kind::root);
    EXPECT_EQ(trie[root].parent, tokens::invalid_id);
    EXPECT_FALSE(trie[root].action);
}

TEST(command_trie, add)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    const auto show = trie.add(root, "show", token_kind::keyword);
    const auto name = trie.add(show, "name", token_kind::word,
                               [](parsed_args&){}, "Name to show");
    EXPECT_EQ(trie[show].parent, root);
    EXPECT_EQ(trie[name].parent, show);
    EXPECT_EQ(trie[root].children, std::vector<token_id>{show});
    EXPECT_FALSE(trie[show].action);
    EXPECT_TRUE(trie[name].action);
    EXPECT_EQ(trie[name].help, "Name to show");
}

TEST(command_trie, add_invalid)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    EXPECT_THROW(trie.add(root, "x", token_kind::root), invalid_token_error);
    EXPECT_THROW(trie.add(token_id{5u}, "x", token_kind::keyword),
                 std::out_of_range);
    EXPECT_EQ(trie.size(), 1u);
}

TEST(command_trie, find_child)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("config");
    const auto keyword = trie.add(root, "mtu", token_kind::keyword);
    const auto word = trie.add(root, "mtu", token_kind::word);
    EXPECT_EQ(trie.find_child(root, "mtu", token_kind::keyword), keyword);
    EXPECT_EQ(trie.find_child(root, "mtu", token_kind::word), word);
    EXPECT_FALSE(trie.find_child(root, "MTU", token_kind::keyword));
    EXPECT_FALSE(trie.find_child(keyword, "mtu", token_kind::keyword));
}

TEST(command_trie, set_action)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    const auto list = trie.add(root, "list", token_kind::keyword);
    auto called = 0;
    trie.set_action(list, [&called](parsed_args&){ ++called; });
    ASSERT_TRUE(trie[list].action);
    auto args = parsed_args{};
    (*trie[list].action)(args);
    EXPECT_EQ(called, 1);
    EXPECT_THROW(trie.set_action(token_id{9u}, [](parsed_args&){}),
                 std::out_of_range);
}

TEST(render, by_kind)
{
    EXPECT_EQ(render(command_token{"show", token_kind::keyword}), "SHOW");
    EXPECT_EQ(render(command_token{"name", token_kind::word}), "name");
    EXPECT_EQ(render(command_token{"with-defaults", token_kind::keyword}),
              "WITH-DEFAULTS");
}

TEST(token_path, stops_at_root)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    const auto a = trie.add(root, "a", token_kind::keyword);
    const auto b = trie.add(a, "b", token_kind::word);
    EXPECT_EQ(token_path(trie, root, b), (std::vector<token_id>{a, b}));
    EXPECT_EQ(token_path(trie, a, b), (std::vector<token_id>{b}));
    EXPECT_TRUE(empty(token_path(trie, root, root)));
}

TEST(take_arg, by_name)
{
    auto args = parsed_args{{"name", "eth0"}, {"comment", "x"},
                            {"name", "eth1"}};
    EXPECT_EQ(take_arg(args, "name"), "eth0");
    EXPECT_EQ(take_arg(args, "name"), "eth1");
    EXPECT_FALSE(take_arg(args, "name"));
    EXPECT_EQ(size(args), 1u);
}

TEST(match_command, keywords_and_words)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    const auto show = trie.add(root, "show", token_kind::keyword);
    const auto changes = trie.add(show, "changes", token_kind::keyword,
                                  [](parsed_args&){});
    const auto name = trie.add(show, "name", token_kind::word,
                               [](parsed_args&){});

    const auto exact = match_command(trie, {root}, {"show", "changes"});
    ASSERT_TRUE(exact);
    EXPECT_EQ(exact->token, changes);
    EXPECT_TRUE(empty(exact->args));

    const auto word = match_command(trie, {root}, {"show", "eth0"});
    ASSERT_TRUE(word);
    EXPECT_EQ(word->token, name);
    EXPECT_EQ(word->args, (parsed_args{{"name", "eth0"}}));

    const auto prefix = match_command(trie, {root}, {"show"});
    ASSERT_TRUE(prefix);
    EXPECT_EQ(prefix->token, show);

    EXPECT_FALSE(match_command(trie, {root}, {"list"}));
    EXPECT_FALSE(match_command(trie, {root}, {}));
}

TEST(match_command, roots_in_order)
{
    auto cmds = commands{};
    const auto first = cmds.trie.add(cmds.config_default_root, "exit",
                                     token_kind::keyword, [](parsed_args&){});
    cmds.trie.add(cmds.config_root, "exit", token_kind::keyword,
                  [](parsed_args&){});
    const auto other = cmds.trie.add(cmds.config_root, "mtu",
                                     token_kind::keyword);
    const auto roots = std::vector<token_id>{
        cmds.config_default_root, cmds.config_internal_root, cmds.config_root
    };
    EXPECT_EQ(match_command(cmds.trie, roots, {"exit"})->token, first);
    EXPECT_EQ(match_command(cmds.trie, roots, {"mtu"})->token, other);
}

TEST(commands, roots)
{
    const auto cmds = commands{};
    EXPECT_EQ(cmds.trie.size(), 4u);
    EXPECT_EQ(cmds.trie[cmds.exec_root].kind, token_kind::root);
    EXPECT_EQ(cmds.trie[cmds.config_default_root].kind, token_kind::root);
    EXPECT_EQ(cmds.trie[cmds.config_internal_root].kind, token_kind::root);
    EXPECT_EQ(cmds.trie[cmds.config_root].kind, token_kind::root);
    EXPECT_NE(cmds.exec_root, cmds.config_root);
}
