#ifndef data_format_hpp
#define data_format_hpp

#include <optional>
#include <ostream>
#include <string>
#include <string_view>

#include "mgmtsh/config_tree.hpp"

namespace mgmtsh {

enum class data_format {
    json,
    xml,
};

constexpr auto to_cstring(data_format format) noexcept -> const char*
{
    switch (format) {
    case data_format::json: return "json";
    case data_format::xml: return "xml";
    }
    return "unknown";
}

auto operator<<(std::ostream& os, data_format value) -> std::ostream&;

/// @brief Data format of the given name.
/// @return Empty optional if the name is not that of a known format.
auto to_data_format(const std::string_view& name)
    -> std::optional<data_format>;

/// @brief Prints the given configuration in the given data format.
/// @details JSON output is an object per container or list entry, with list
///   entries and leaf-list values collected into arrays, indented by two
///   spaces. XML output is an element per node, top-level elements one
///   after another.
/// @param[in] with_defaults Whether to include values that were not
///   explicitly configured. Non-presence containers left empty are always
///   omitted.
/// @throws std::runtime_error if the underlying library fails.
auto print_config(const config_tree& tree,
                  data_format format,
                  bool with_defaults) -> std::string;

}

#endif /* data_format_hpp */
