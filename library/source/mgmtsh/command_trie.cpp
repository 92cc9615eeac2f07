#include <algorithm> // for std::find_if
#include <sstream> // for std::ostringstream
#include <utility> // for std::move

#include "mgmtsh/command_trie.hpp"
#include "mgmtsh/utility.hpp"

namespace mgmtsh {

auto operator<<(std::ostream& os, token_id value) -> std::ostream&
{
    os << to_underlying(value);
    return os;
}

auto operator<<(std::ostream& os, token_kind value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

auto command_trie::add_root(std::string name) -> token_id
{
    const auto id = token_id{arena.size()};
    arena.push_back(command_token{
        .name = std::move(name),
        .kind = token_kind::root,
    });
    return id;
}

auto command_trie::add(token_id parent,
                       std::string name,
                       token_kind kind,
                       std::optional<command_action> action,
                       std::string help) -> token_id
{
    (void) at(parent);
    if (kind == token_kind::root) {
        std::ostringstream os;
        os << "root token " << name << " may not have a parent";
        throw invalid_token_error{os.str()};
    }
    const auto id = token_id{arena.size()};
    arena.push_back(command_token{
        .name = std::move(name),
        .kind = kind,
        .help = std::move(help),
        .action = std::move(action),
        .parent = parent,
    });
    arena[to_underlying(parent)].children.push_back(id);
    return id;
}

auto command_trie::find_child(token_id parent,
                              const std::string_view& name,
                              token_kind kind) const
    -> std::optional<token_id>
{
    for (auto&& child: at(parent).children) {
        const auto& token = at(child);
        if (token.kind == kind && token.name == name) {
            return child;
        }
    }
    return {};
}

auto command_trie::set_action(token_id id, command_action action) -> void
{
    (void) at(id);
    arena[to_underlying(id)].action = std::move(action);
}

auto command_trie::at(token_id id) const -> const command_token&
{
    return arena.at(to_underlying(id));
}

auto command_trie::size() const noexcept -> std::size_t
{
    return arena.size();
}

auto render(const command_token& token) -> std::string
{
    switch (token.kind) {
    case token_kind::keyword:
        return to_upper(token.name);
    case token_kind::root:
    case token_kind::word:
        break;
    }
    return token.name;
}

auto token_path(const command_trie& trie, token_id root, token_id id)
    -> std::vector<token_id>
{
    auto result = std::vector<token_id>{};
    for (auto p = id; p != root && p != tokens::invalid_id;
         p = trie.at(p).parent) {
        result.push_back(p);
    }
    return std::vector<token_id>(rbegin(result), rend(result));
}

auto take_arg(parsed_args& args, const std::string_view& name)
    -> std::optional<std::string>
{
    const auto found = std::find_if(begin(args), end(args),
                                    [&name](const auto& arg){
        return arg.first == name;
    });
    if (found == end(args)) {
        return {};
    }
    auto result = std::move(found->second);
    args.erase(found);
    return result;
}

auto match_command(const command_trie& trie,
                   const std::vector<token_id>& roots,
                   const std::vector<std::string>& words)
    -> std::optional<command_match>
{
    if (empty(words)) {
        return {};
    }
    for (auto&& root: roots) {
        auto result = command_match{root, {}};
        auto matched = true;
        for (auto&& word: words) {
            if (const auto keyword = trie.find_child(result.token, word,
                                                     token_kind::keyword)) {
                result.token = *keyword;
                continue;
            }
            const auto& children = trie.at(result.token).children;
            const auto found = std::find_if(begin(children), end(children),
                                            [&trie](token_id child){
                return trie.at(child).kind == token_kind::word;
            });
            if (found == end(children)) {
                matched = false;
                break;
            }
            result.token = *found;
            result.args.emplace_back(trie.at(*found).name, word);
        }
        if (matched) {
            return result;
        }
    }
    return {};
}

}
