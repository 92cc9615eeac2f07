#include "mgmtsh/config_diff.hpp"
#include "mgmtsh/flatten.hpp"
#include "mgmtsh/unified_diff.hpp"

namespace mgmtsh {

auto config_changes(const config_tree& running, const config_tree& candidate)
    -> std::string
{
    const auto old_text = flatten(running, false);
    const auto new_text = flatten(candidate, false);
    return unified_diff(old_text, new_text, unified_diff_options{
        config_diff_context_radius, running_header, candidate_header
    });
}

}
