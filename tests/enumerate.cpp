#include <sstream> // for std::ostringstream
#include <stdexcept> // for std::out_of_range
#include <string>
#include <vector>

#include <gtest/gtest.h>

#include "mgmtsh/enumerate.hpp"

using namespace mgmtsh;

namespace {

auto collect(const command_listing& listing) -> std::vector<std::string>
{
    auto result = std::vector<std::string>{};
    for (auto&& line: listing) {
        result.push_back(line);
    }
    return result;
}

const auto no_op = command_action{[](parsed_args&){}};

}

TEST(enumerate, empty_root)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    EXPECT_TRUE(empty(collect(enumerate(trie, root))));
}

TEST(enumerate, insertion_order)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    trie.add(root, "zebra", token_kind::keyword, no_op);
    trie.add(root, "alpha", token_kind::keyword, no_op);
    EXPECT_EQ(collect(enumerate(trie, root)),
              (std::vector<std::string>{"ZEBRA ", "ALPHA "}));
}

TEST(enumerate, keyword_case_rendering)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    const auto interface = trie.add(root, "interface", token_kind::word);
    const auto name = trie.add(interface, "NAME", token_kind::word);
    trie.add(name, "state", token_kind::keyword, no_op);
    EXPECT_EQ(collect(enumerate(trie, root)),
              (std::vector<std::string>{"interface NAME STATE "}));
}

TEST(enumerate, structural_tokens_skipped)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("config");
    const auto commit = trie.add(root, "commit", token_kind::keyword, no_op);
    const auto comment = trie.add(commit, "comment", token_kind::keyword);
    trie.add(comment, "comment", token_kind::word, no_op);
    trie.add(root, "validate", token_kind::keyword, no_op);
    EXPECT_EQ(collect(enumerate(trie, root)), (std::vector<std::string>{
        "COMMIT ", "COMMIT COMMENT comment ", "VALIDATE "
    }));
}

TEST(enumerate, restartable)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    trie.add(root, "list", token_kind::keyword, no_op);
    trie.add(root, "exit", token_kind::keyword, no_op);
    const auto listing = enumerate(trie, root);
    auto it = listing.begin();
    ASSERT_FALSE(it == listing.end());
    EXPECT_EQ(*it, "LIST ");
    EXPECT_EQ(collect(listing), (std::vector<std::string>{"LIST ", "EXIT "}));
    EXPECT_EQ(collect(listing), collect(enumerate(trie, root)));
}

TEST(enumerate, subtree_root)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("config");
    const auto interface = trie.add(root, "interface", token_kind::keyword);
    const auto name = trie.add(interface, "name", token_kind::word, no_op);
    trie.add(name, "mtu", token_kind::keyword);
    const auto mtu = trie.find_child(name, "mtu", token_kind::keyword);
    ASSERT_TRUE(mtu);
    trie.add(*mtu, "mtu", token_kind::word, no_op);
    EXPECT_EQ(collect(enumerate(trie, name)),
              (std::vector<std::string>{"MTU mtu "}));
}

TEST(enumerate, unknown_root)
{
    const auto trie = command_trie{};
    EXPECT_THROW(enumerate(trie, token_id{0u}), std::out_of_range);
}

TEST(write_command_lines, one_per_line)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    trie.add(root, "configure", token_kind::keyword, no_op);
    trie.add(root, "exit", token_kind::keyword, no_op);
    std::ostringstream os;
    write_command_lines(os, trie, root);
    EXPECT_EQ(os.str(), "CONFIGURE \nEXIT \n");
}

TEST(command_line, from_root)
{
    auto trie = command_trie{};
    const auto root = trie.add_root("exec");
    const auto show = trie.add(root, "show", token_kind::keyword);
    const auto name = trie.add(show, "name", token_kind::word);
    EXPECT_EQ(command_line(trie, root, name), "SHOW name ");
    EXPECT_EQ(command_line(trie, show, name), "name ");
}
