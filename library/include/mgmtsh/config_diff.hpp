#ifndef config_diff_hpp
#define config_diff_hpp

#include <cstddef> // for std::size_t
#include <string>

#include "mgmtsh/config_tree.hpp"

namespace mgmtsh {

/// @brief Number of unchanged command lines shown around each change.
constexpr auto config_diff_context_radius = std::size_t{9u};

constexpr auto running_header = "running configuration";
constexpr auto candidate_header = "candidate configuration";

/// @brief Unified diff of the explicitly configured commands of the given
///   running and candidate configurations.
/// @note Both trees are flattened without defaults so only configured
///   differences show.
/// @return Empty string if there are no differences.
auto config_changes(const config_tree& running, const config_tree& candidate)
    -> std::string;

}

#endif /* config_diff_hpp */
