#include <utility> // for std::move
#include <variant> // for std::get_if

#include "mgmtsh/config_edit.hpp"
#include "mgmtsh/session.hpp"

namespace mgmtsh {

auto operator<<(std::ostream& os, datastore value) -> std::ostream&
{
    return os << to_cstring(value);
}

auto to_datastore(const std::string_view& name) -> std::optional<datastore>
{
    for (auto value: {datastore::running, datastore::candidate}) {
        if (name == to_cstring(value)) {
            return value;
        }
    }
    return {};
}

session::session(session_options options, config_tree config):
    opts{std::move(options)},
    running{std::move(config)},
    candidate{running}
{
    // Intentionally empty.
}

auto session::options() const noexcept -> const session_options&
{
    return opts;
}

auto session::set_hostname(std::string hostname) -> void
{
    opts.hostname = std::move(hostname);
}

auto session::mode() const noexcept -> const command_mode&
{
    return current_mode;
}

auto session::mode_set(command_mode mode) -> void
{
    current_mode = std::move(mode);
}

auto session::mode_config_enter(path_entry entry) -> void
{
    current_mode = enter(current_mode, std::move(entry));
}

auto session::mode_config_exit() -> void
{
    current_mode = leave(current_mode);
}

auto session::context() const -> std::vector<path_entry>
{
    if (const auto p = std::get_if<configure_mode>(&current_mode)) {
        return p->nodes;
    }
    return {};
}

auto session::configuration(datastore which) const noexcept
    -> const config_tree&
{
    return (which == datastore::running)? running: candidate;
}

auto session::candidate_discard() -> void
{
    candidate = running;
}

auto session::candidate_validate() const -> void
{
    validate(candidate);
}

auto session::candidate_commit(std::optional<std::string> comment)
    -> const commit_record&
{
    validate(candidate);
    running = candidate;
    history.push_back(commit_record{size(history) + 1u, std::move(comment)});
    return history.back();
}

auto session::candidate_edit_set(const std::vector<path_entry>& path,
                                 const std::string& name,
                                 const std::string& value) -> node_id
{
    return set_leaf(candidate, path, name, value);
}

auto session::candidate_edit_add(const std::vector<path_entry>& path,
                                 const std::string& name,
                                 const std::string& value) -> node_id
{
    return add_leaf_list_value(candidate, path, name, value);
}

auto session::commits() const noexcept -> const std::vector<commit_record>&
{
    return history;
}

}
