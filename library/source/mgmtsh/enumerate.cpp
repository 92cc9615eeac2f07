#include "mgmtsh/enumerate.hpp"

namespace mgmtsh {

auto command_line(const command_trie& trie, token_id root, token_id id)
    -> std::string
{
    auto result = std::string{};
    for (auto&& p: token_path(trie, root, id)) {
        result += render(trie.at(p));
        result += ' ';
    }
    return result;
}

command_listing::iterator::iterator(const command_trie& trie_,
                                    token_id root_):
    trie{&trie_}, root{root_}, done{false}
{
    const auto& children = trie->at(root).children;
    pending.assign(rbegin(children), rend(children));
    advance();
}

auto command_listing::iterator::operator++() -> iterator&
{
    advance();
    return *this;
}

auto command_listing::iterator::advance() -> void
{
    while (!empty(pending)) {
        const auto id = pending.back();
        pending.pop_back();
        const auto& token = trie->at(id);
        pending.insert(std::end(pending),
                       rbegin(token.children), rend(token.children));
        if (token.action) {
            current = command_line(*trie, root, id);
            return;
        }
    }
    current.clear();
    done = true;
}

auto enumerate(const command_trie& trie, token_id root) -> command_listing
{
    (void) trie.at(root);
    return command_listing{&trie, root};
}

auto write_command_lines(std::ostream& os,
                         const command_trie& trie,
                         token_id root) -> void
{
    for (auto&& line: enumerate(trie, root)) {
        os << line << '\n';
    }
}

}
