#include <iomanip> // for std::quoted
#include <sstream> // for std::ostringstream
#include <stdexcept> // for std::invalid_argument

#include "mgmtsh/tree_accessor.hpp"

namespace mgmtsh {

namespace {

struct path_step
{
    std::string name;
    key_values keys;
};

[[noreturn]]
auto throw_bad_path(const std::string_view& path, const std::string& msg)
    -> void
{
    std::ostringstream os;
    os << "bad path " << std::quoted(path) << ": " << msg;
    throw std::invalid_argument{os.str()};
}

auto parse_predicate(const std::string_view& path, std::string_view& rest)
    -> std::pair<std::string, std::string>
{
    // rest starts just after the opening bracket.
    const auto eq = rest.find('=');
    if (eq == std::string_view::npos || eq == 0u) {
        throw_bad_path(path, "predicate without key name");
    }
    auto key = std::string{rest.substr(0u, eq)};
    rest.remove_prefix(eq + 1u);
    if (empty(rest) || (rest.front() != '\'' && rest.front() != '"')) {
        throw_bad_path(path, "predicate value not quoted");
    }
    const auto quote = rest.front();
    rest.remove_prefix(1u);
    const auto close = rest.find(quote);
    if (close == std::string_view::npos) {
        throw_bad_path(path, "unterminated predicate value");
    }
    auto value = std::string{rest.substr(0u, close)};
    rest.remove_prefix(close + 1u);
    if (empty(rest) || rest.front() != ']') {
        throw_bad_path(path, "predicate not closed");
    }
    rest.remove_prefix(1u);
    return {std::move(key), std::move(value)};
}

auto parse_path(const std::string_view& path) -> std::vector<path_step>
{
    auto result = std::vector<path_step>{};
    auto rest = path;
    if (!empty(rest) && rest.front() == '/') {
        rest.remove_prefix(1u);
    }
    while (!empty(rest)) {
        const auto end = rest.find_first_of("/[");
        auto step = path_step{std::string{rest.substr(0u, end)}, {}};
        if (empty(step.name)) {
            throw_bad_path(path, "empty step");
        }
        rest.remove_prefix((end == std::string_view::npos)? size(rest): end);
        while (!empty(rest) && rest.front() == '[') {
            rest.remove_prefix(1u);
            step.keys.push_back(parse_predicate(path, rest));
        }
        if (!empty(rest)) {
            if (rest.front() != '/') {
                throw_bad_path(path, "unexpected characters after step");
            }
            rest.remove_prefix(1u);
            if (empty(rest)) {
                throw_bad_path(path, "trailing separator");
            }
        }
        result.push_back(std::move(step));
    }
    return result;
}

auto matches(const config_tree& tree, node_id id, const key_values& keys)
    -> bool
{
    for (auto&& key: keys) {
        if (child_opt_value(tree, id, key.first) != key.second) {
            return false;
        }
    }
    return true;
}

}

auto find_child(const config_tree& tree, node_id id,
                const std::string_view& name) -> std::optional<node_id>
{
    for (auto&& child: tree.at(id).children) {
        if (tree.at(child).name == name) {
            return child;
        }
    }
    return {};
}

auto child_opt_value(const config_tree& tree, node_id id,
                     const std::string_view& name)
    -> std::optional<std::string>
{
    if (const auto child = find_child(tree, id, name)) {
        return tree.at(*child).value;
    }
    return {};
}

auto child_value(const config_tree& tree, node_id id,
                 const std::string_view& name) -> std::string
{
    return child_opt_value(tree, id, name).value_or(missing_value);
}

auto list_keys(const config_tree& tree, node_id id) -> std::vector<node_id>
{
    auto result = std::vector<node_id>{};
    for (auto&& child: tree.at(id).children) {
        if (tree.at(child).kind == node_kind::list_key) {
            result.push_back(child);
        }
    }
    return result;
}

auto list_key_values(const config_tree& tree, node_id id) -> key_values
{
    auto result = key_values{};
    for (auto&& key: list_keys(tree, id)) {
        const auto& node = tree.at(key);
        result.emplace_back(node.name, node.value.value_or(std::string{}));
    }
    return result;
}

auto find_entry(const config_tree& tree, node_id parent,
                const std::string_view& name, const key_values& keys)
    -> std::optional<node_id>
{
    for (auto&& child: tree.at(parent).children) {
        if (tree.at(child).name == name && matches(tree, child, keys)) {
            return child;
        }
    }
    return {};
}

auto select(const config_tree& tree, node_id from,
            const std::string_view& path) -> std::vector<node_id>
{
    auto current = std::vector<node_id>{from};
    for (auto&& step: parse_path(path)) {
        auto next = std::vector<node_id>{};
        for (auto&& id: current) {
            for (auto&& child: tree.at(id).children) {
                if (tree.at(child).name == step.name &&
                    matches(tree, child, step.keys)) {
                    next.push_back(child);
                }
            }
        }
        current = std::move(next);
    }
    return current;
}

}
