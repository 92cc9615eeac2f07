#include <fstream> // for std::ifstream
#include <optional>
#include <string>
#include <utility> // for std::move

#include <nlohmann/json.hpp>

#include "mgmtsh/snapshot.hpp"

namespace mgmtsh {

namespace {

constexpr auto name_member = "name";
constexpr auto kind_member = "kind";
constexpr auto value_member = "value";
constexpr auto default_member = "default";
constexpr auto children_member = "children";

auto scalar_text(const nlohmann::json& value) -> std::string
{
    if (value.is_string()) {
        return value.get<std::string>();
    }
    if (value.is_number() || value.is_boolean()) {
        return value.dump();
    }
    throw snapshot_error{"value must be a scalar, not " +
                         std::string{value.type_name()}};
}

auto add_nodes(config_tree& tree, node_id parent,
               const nlohmann::json& array, std::ostream& diags) -> void
{
    if (!array.is_array()) {
        throw snapshot_error{"expected an array of nodes"};
    }
    for (auto&& object: array) {
        if (!object.is_object()) {
            throw snapshot_error{"expected a node object"};
        }
        const auto name = object.find(name_member);
        if ((name == object.end()) || !name->is_string()) {
            throw snapshot_error{"node without a string name"};
        }
        const auto kind_text = object.find(kind_member);
        if ((kind_text == object.end()) || !kind_text->is_string()) {
            throw snapshot_error{"node " + name->get<std::string>() +
                                 " without a string kind"};
        }
        const auto kind = to_node_kind(kind_text->get<std::string>());
        if (!kind) {
            throw snapshot_error{"node " + name->get<std::string>() +
                                 " has unknown kind " +
                                 kind_text->get<std::string>()};
        }
        auto value = std::optional<std::string>{};
        if (const auto it = object.find(value_member); it != object.end()) {
            value = scalar_text(*it);
        }
        auto is_default = false;
        if (const auto it = object.find(default_member); it != object.end()) {
            if (!it->is_boolean()) {
                throw snapshot_error{"default of node " +
                                     name->get<std::string>() +
                                     " must be a boolean"};
            }
            is_default = it->get<bool>();
        }
        for (auto it = object.begin(); it != object.end(); ++it) {
            if (it.key() != name_member && it.key() != kind_member &&
                it.key() != value_member && it.key() != default_member &&
                it.key() != children_member) {
                diags << "ignoring unknown member " << it.key();
                diags << " of node " << name->get<std::string>() << '\n';
            }
        }
        const auto id = tree.add(parent, name->get<std::string>(), *kind,
                                 std::move(value), is_default);
        if (const auto it = object.find(children_member); it != object.end()) {
            add_nodes(tree, id, *it, diags);
        }
    }
}

}

auto load_snapshot(std::istream& is, std::ostream& diags) -> config_tree
{
    auto document = nlohmann::json{};
    try {
        is >> document;
    }
    catch (const nlohmann::json::parse_error& ex) {
        throw snapshot_error{ex.what()};
    }
    auto result = config_tree{};
    add_nodes(result, result.root(), document, diags);
    validate(result);
    return result;
}

auto load_snapshot(const std::filesystem::path& path, std::ostream& diags)
    -> config_tree
{
    std::ifstream is{path};
    if (!is) {
        throw snapshot_error{"unable to open " + path.string()};
    }
    return load_snapshot(is, diags);
}

}
