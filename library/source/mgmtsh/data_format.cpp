#include <memory> // for std::unique_ptr
#include <stdexcept> // for std::runtime_error
#include <string>
#include <utility> // for std::move

#include <libxml/tree.h>
#include <nlohmann/json.hpp>

#include "mgmtsh/data_format.hpp"

namespace mgmtsh {

namespace {

using json = nlohmann::ordered_json;

auto is_printed(const config_node& node, bool with_defaults) -> bool
{
    return with_defaults || !node.is_default;
}

auto to_json(const config_tree& tree, node_id id, bool with_defaults)
    -> json
{
    auto result = json::object();
    for (auto&& child_id: tree[id].children) {
        const auto& child = tree[child_id];
        switch (child.kind) {
        case node_kind::leaf:
        case node_kind::list_key:
            if (is_printed(child, with_defaults)) {
                result[child.name] = child.value.value_or(std::string{});
            }
            break;
        case node_kind::leaf_list:
            if (is_printed(child, with_defaults)) {
                auto& values = result[child.name];
                if (values.is_null()) {
                    values = json::array();
                }
                values.push_back(child.value.value_or(std::string{}));
            }
            break;
        case node_kind::list: {
            auto& entries = result[child.name];
            if (entries.is_null()) {
                entries = json::array();
            }
            entries.push_back(to_json(tree, child_id, with_defaults));
            break;
        }
        case node_kind::container:
        case node_kind::np_container:
        case node_kind::other: {
            auto object = to_json(tree, child_id, with_defaults);
            if (object.empty() && ((child.kind == node_kind::np_container) ||
                                   !is_printed(child, with_defaults))) {
                break;
            }
            result[child.name] = std::move(object);
            break;
        }
        }
    }
    return result;
}

struct xml_doc_deleter
{
    auto operator()(xmlDocPtr doc) const noexcept -> void
    {
        xmlFreeDoc(doc);
    }
};

struct xml_buffer_deleter
{
    auto operator()(xmlBufferPtr buf) const noexcept -> void
    {
        xmlBufferFree(buf);
    }
};

/// @brief Adds an element for each printed child of @p id below @p parent.
auto add_xml_children(const config_tree& tree, node_id id,
                      xmlNodePtr parent, bool with_defaults) -> void
{
    for (auto&& child_id: tree[id].children) {
        const auto& child = tree[child_id];
        const auto name = BAD_CAST child.name.c_str();
        if (has_value(child.kind)) {
            if (is_printed(child, with_defaults)) {
                const auto value = child.value.value_or(std::string{});
                xmlNewTextChild(parent, nullptr, name, BAD_CAST value.c_str());
            }
            continue;
        }
        const auto element = xmlNewChild(parent, nullptr, name, nullptr);
        if (!element) {
            throw std::runtime_error{"unable to create XML element"};
        }
        add_xml_children(tree, child_id, element, with_defaults);
        if (!element->children && (child.kind != node_kind::list) &&
            ((child.kind == node_kind::np_container) ||
             !is_printed(child, with_defaults))) {
            xmlUnlinkNode(element);
            xmlFreeNode(element);
        }
    }
}

auto to_xml(const config_tree& tree, bool with_defaults) -> std::string
{
    const auto doc = std::unique_ptr<xmlDoc, xml_doc_deleter>{
        xmlNewDoc(BAD_CAST "1.0")
    };
    if (!doc) {
        throw std::runtime_error{"unable to create XML document"};
    }
    const auto top = xmlNewDocNode(doc.get(), nullptr, BAD_CAST "data",
                                   nullptr);
    if (!top) {
        throw std::runtime_error{"unable to create XML element"};
    }
    xmlDocSetRootElement(doc.get(), top);
    add_xml_children(tree, tree.root(), top, with_defaults);

    const auto buf = std::unique_ptr<xmlBuffer, xml_buffer_deleter>{
        xmlBufferCreate()
    };
    if (!buf) {
        throw std::runtime_error{"unable to create XML buffer"};
    }
    for (auto node = top->children; node; node = node->next) {
        if (xmlNodeDump(buf.get(), doc.get(), node, 0, 1) < 0) {
            throw std::runtime_error{"unable to print XML"};
        }
        xmlBufferCCat(buf.get(), "\n");
    }
    const auto content = reinterpret_cast<const char*>(
        xmlBufferContent(buf.get()));
    return std::string(content, static_cast<std::size_t>(
        xmlBufferLength(buf.get())));
}

}

auto operator<<(std::ostream& os, data_format value) -> std::ostream&
{
    return os << to_cstring(value);
}

auto to_data_format(const std::string_view& name)
    -> std::optional<data_format>
{
    for (auto format: {data_format::json, data_format::xml}) {
        if (name == to_cstring(format)) {
            return format;
        }
    }
    return {};
}

auto print_config(const config_tree& tree,
                  data_format format,
                  bool with_defaults) -> std::string
{
    switch (format) {
    case data_format::json:
        return to_json(tree, tree.root(), with_defaults).dump(2) + '\n';
    case data_format::xml:
        return to_xml(tree, with_defaults);
    }
    throw std::invalid_argument{"unknown data format"};
}

}
