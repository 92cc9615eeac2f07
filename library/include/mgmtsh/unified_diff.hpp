#ifndef unified_diff_hpp
#define unified_diff_hpp

#include <cstddef> // for std::size_t
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

namespace mgmtsh {

struct unified_diff_options
{
    static constexpr auto default_context_radius = std::size_t{3u};

    /// @brief Number of unchanged lines shown around each change.
    std::size_t context_radius{default_context_radius};

    /// @brief Label of the old text in the <code>---</code> header line.
    std::string old_header;

    /// @brief Label of the new text in the <code>+++</code> header line.
    std::string new_header;
};

/// @brief Splits text into lines, each keeping its line feed if it had one.
auto split_lines(const std::string_view& text)
    -> std::vector<std::string_view>;

/// @brief Writes the line differences between two texts in unified format.
/// @details Computes a shortest edit script (Myers) and groups its changes
///   into hunks surrounded by up to <code>context_radius</code> unchanged
///   lines. Hunks closer than twice the radius are merged. Nothing at all is
///   written when the texts have the same lines.
auto write_unified_diff(std::ostream& os,
                        const std::string_view& old_text,
                        const std::string_view& new_text,
                        const unified_diff_options& opts = {}) -> void;

/// @see write_unified_diff.
auto unified_diff(const std::string_view& old_text,
                  const std::string_view& new_text,
                  const unified_diff_options& opts = {}) -> std::string;

}

#endif /* unified_diff_hpp */
