#include <sstream> // for std::ostringstream

#include "mgmtsh/command_mode.hpp"
#include "mgmtsh/enumerate.hpp"

namespace mgmtsh {

auto operator<<(std::ostream& os, const path_entry& value) -> std::ostream&
{
    os << value.name;
    for (auto&& key: value.keys) {
        os << "[" << key.first << "='" << key.second << "']";
    }
    return os;
}

auto operator<<(std::ostream& os, const operational_mode&) -> std::ostream&
{
    os << "operational";
    return os;
}

auto operator<<(std::ostream& os, const configure_mode& value)
    -> std::ostream&
{
    os << "configure{";
    for (auto&& entry: value.nodes) {
        os << "/" << entry;
    }
    os << "}";
    return os;
}

auto enter(const command_mode& mode, path_entry entry) -> command_mode
{
    auto result = configure_mode{};
    if (const auto p = std::get_if<configure_mode>(&mode)) {
        result = *p;
    }
    result.nodes.push_back(std::move(entry));
    return result;
}

auto leave(const command_mode& mode) -> command_mode
{
    return std::visit(detail::overloaded{
        [](const operational_mode&) -> command_mode {
            return operational_mode{};
        },
        [](const configure_mode& value) -> command_mode {
            if (empty(value.nodes)) {
                return operational_mode{};
            }
            auto result = value;
            result.nodes.pop_back();
            return result;
        },
    }, mode);
}

auto data_path(const command_mode& mode) -> std::optional<std::string>
{
    const auto p = std::get_if<configure_mode>(&mode);
    if (!p || empty(p->nodes)) {
        return {};
    }
    std::ostringstream os;
    for (auto&& entry: p->nodes) {
        os << "/" << entry;
    }
    return os.str();
}

auto mode_token(const commands& cmds, const command_mode& mode) -> token_id
{
    const auto p = std::get_if<configure_mode>(&mode);
    if (!p) {
        return cmds.exec_root;
    }
    auto token = cmds.config_root;
    for (auto&& entry: p->nodes) {
        const auto found = cmds.trie.find_child(token, entry.name,
                                                token_kind::keyword);
        if (!found) {
            return token;
        }
        token = *found;
        for (auto&& key: entry.keys) {
            const auto key_token = cmds.trie.find_child(token, key.first,
                                                        token_kind::word);
            if (!key_token) {
                return token;
            }
            token = *key_token;
        }
    }
    return token;
}

auto enumeration_roots(const commands& cmds, const command_mode& mode)
    -> std::vector<token_id>
{
    return std::visit(detail::overloaded{
        [&cmds](const operational_mode&) {
            return std::vector<token_id>{cmds.exec_root};
        },
        [&cmds, &mode](const configure_mode&) {
            return std::vector<token_id>{
                cmds.config_default_root,
                cmds.config_internal_root,
                mode_token(cmds, mode),
            };
        },
    }, mode);
}

auto list_commands(std::ostream& os,
                   const commands& cmds,
                   const command_mode& mode) -> void
{
    auto first = true;
    for (auto&& root: enumeration_roots(cmds, mode)) {
        if (!first) {
            os << listing_separator << '\n';
        }
        write_command_lines(os, cmds.trie, root);
        first = false;
    }
}

auto prompt(const std::string_view& hostname, const command_mode& mode)
    -> std::string
{
    auto result = std::string{hostname};
    if (const auto p = std::get_if<configure_mode>(&mode)) {
        result += "(config";
        if (!empty(p->nodes)) {
            result += '-';
            result += p->nodes.back().name;
        }
        result += ')';
    }
    result += "# ";
    return result;
}

}
