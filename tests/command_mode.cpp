#include <sstream> // for std::ostringstream

#include <gtest/gtest.h>

#include "mgmtsh/command_mode.hpp"

using namespace mgmtsh;

namespace {

const auto no_op = command_action{[](parsed_args&){}};

const auto interfaces_entry = path_entry{"interfaces",
                                         node_kind::np_container, {}};
const auto eth0_entry = path_entry{"interface", node_kind::list,
                                   {{"name", "eth0"}}};

}

TEST(command_mode, default_is_operational)
{
    const auto mode = command_mode{};
    EXPECT_TRUE(std::holds_alternative<operational_mode>(mode));
}

TEST(command_mode, ostream)
{
    std::ostringstream os;
    os << command_mode{} << " ";
    os << command_mode{configure_mode{{interfaces_entry, eth0_entry}}};
    EXPECT_EQ(os.str(),
              "operational configure{/interfaces/interface[name='eth0']}");
}

TEST(enter, from_operational)
{
    const auto mode = enter(operational_mode{}, interfaces_entry);
    EXPECT_EQ(mode, command_mode{configure_mode{{interfaces_entry}}});
}

TEST(enter, nests)
{
    const auto mode = enter(enter(configure_mode{}, interfaces_entry),
                            eth0_entry);
    EXPECT_EQ(mode,
              (command_mode{configure_mode{{interfaces_entry, eth0_entry}}}));
}

TEST(leave, pops_then_returns_to_operational)
{
    auto mode = command_mode{configure_mode{{interfaces_entry, eth0_entry}}};
    mode = leave(mode);
    EXPECT_EQ(mode, command_mode{configure_mode{{interfaces_entry}}});
    mode = leave(mode);
    EXPECT_EQ(mode, command_mode{configure_mode{}});
    mode = leave(mode);
    EXPECT_EQ(mode, command_mode{operational_mode{}});
    mode = leave(mode);
    EXPECT_EQ(mode, command_mode{operational_mode{}});
}

TEST(data_path, by_mode)
{
    EXPECT_FALSE(data_path(operational_mode{}));
    EXPECT_FALSE(data_path(configure_mode{}));
    EXPECT_EQ(data_path(configure_mode{{interfaces_entry}}), "/interfaces");
    EXPECT_EQ(data_path(configure_mode{{interfaces_entry, eth0_entry}}),
              "/interfaces/interface[name='eth0']");
}

TEST(prompt, by_mode)
{
    EXPECT_EQ(prompt("r1", operational_mode{}), "r1# ");
    EXPECT_EQ(prompt("r1", configure_mode{}), "r1(config)# ");
    EXPECT_EQ(prompt("r1", configure_mode{{interfaces_entry, eth0_entry}}),
              "r1(config-interface)# ");
}

TEST(mode_token, walks_nesting_path)
{
    auto cmds = commands{};
    auto& trie = cmds.trie;
    const auto interfaces = trie.add(cmds.config_root, "interfaces",
                                     token_kind::keyword, no_op);
    const auto interface = trie.add(interfaces, "interface",
                                    token_kind::keyword);
    const auto name = trie.add(interface, "name", token_kind::word, no_op);

    EXPECT_EQ(mode_token(cmds, operational_mode{}), cmds.exec_root);
    EXPECT_EQ(mode_token(cmds, configure_mode{}), cmds.config_root);
    EXPECT_EQ(mode_token(cmds, configure_mode{{interfaces_entry}}),
              interfaces);
    EXPECT_EQ(mode_token(cmds, configure_mode{{interfaces_entry,
                                                eth0_entry}}), name);
    const auto unknown = path_entry{"routing", node_kind::container, {}};
    EXPECT_EQ(mode_token(cmds, configure_mode{{interfaces_entry, unknown}}),
              interfaces);
}

TEST(enumeration_roots, by_mode)
{
    const auto cmds = commands{};
    EXPECT_EQ(enumeration_roots(cmds, operational_mode{}),
              std::vector<token_id>{cmds.exec_root});
    EXPECT_EQ(enumeration_roots(cmds, configure_mode{}),
              (std::vector<token_id>{cmds.config_default_root,
                                     cmds.config_internal_root,
                                     cmds.config_root}));
}

TEST(list_commands, operational)
{
    auto cmds = commands{};
    cmds.trie.add(cmds.exec_root, "configure", token_kind::keyword, no_op);
    cmds.trie.add(cmds.config_default_root, "end", token_kind::keyword,
                  no_op);
    std::ostringstream os;
    list_commands(os, cmds, operational_mode{});
    EXPECT_EQ(os.str(), "CONFIGURE \n");
}

TEST(list_commands, configure)
{
    auto cmds = commands{};
    cmds.trie.add(cmds.exec_root, "configure", token_kind::keyword, no_op);
    cmds.trie.add(cmds.config_default_root, "end", token_kind::keyword,
                  no_op);
    cmds.trie.add(cmds.config_internal_root, "commit", token_kind::keyword,
                  no_op);
    const auto interfaces = cmds.trie.add(cmds.config_root, "interfaces",
                                          token_kind::keyword, no_op);
    const auto mtu = cmds.trie.add(interfaces, "mtu", token_kind::keyword);
    cmds.trie.add(mtu, "mtu", token_kind::word, no_op);

    std::ostringstream top;
    list_commands(top, cmds, configure_mode{});
    EXPECT_EQ(top.str(), "END \n---\nCOMMIT \n---\nINTERFACES \n"
                         "INTERFACES MTU mtu \n");

    std::ostringstream nested;
    list_commands(nested, cmds, configure_mode{{interfaces_entry}});
    EXPECT_EQ(nested.str(), "END \n---\nCOMMIT \n---\nMTU mtu \n");
}
