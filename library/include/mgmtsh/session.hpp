#ifndef session_hpp
#define session_hpp

#include <cstddef> // for std::size_t
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <vector>

#include "mgmtsh/command_mode.hpp"
#include "mgmtsh/config_tree.hpp"
#include "mgmtsh/pager.hpp"

namespace mgmtsh {

struct session_options
{
    static constexpr auto default_hostname = "mgmtsh";

    std::string hostname{default_hostname};

    /// @brief Pager to page output through.
    /// @note Output is written directly when this is empty.
    std::optional<pager_options> pager{pager_options{}};
};

enum class datastore {
    running,
    candidate,
};

constexpr auto to_cstring(datastore value) noexcept -> const char*
{
    switch (value) {
    case datastore::running: return "running";
    case datastore::candidate: return "candidate";
    }
    return "unknown";
}

auto operator<<(std::ostream& os, datastore value) -> std::ostream&;

auto to_datastore(const std::string_view& name) -> std::optional<datastore>;

struct commit_record
{
    /// @brief Sequence number of the commit, starting from 1.
    std::size_t id{};

    std::optional<std::string> comment;

    auto operator==(const commit_record& other) const -> bool = default;
};

/// @brief State of one operator's shell session.
/// @details Edits are made to the candidate configuration and only reach
///   the running configuration when committed.
struct session
{
    explicit session(session_options options = {},
                     config_tree config = {});

    [[nodiscard]] auto options() const noexcept -> const session_options&;

    auto set_hostname(std::string hostname) -> void;

    [[nodiscard]] auto mode() const noexcept -> const command_mode&;

    auto mode_set(command_mode mode) -> void;

    /// @brief Enters the given context nested in the current one.
    auto mode_config_enter(path_entry entry) -> void;

    /// @brief Leaves the current configuration context.
    auto mode_config_exit() -> void;

    /// @brief Nesting path of the current configuration context.
    /// @return Empty path in operational mode.
    [[nodiscard]] auto context() const -> std::vector<path_entry>;

    [[nodiscard]] auto configuration(datastore which) const noexcept
        -> const config_tree&;

    /// @brief Discards all uncommitted changes.
    auto candidate_discard() -> void;

    /// @throws invalid_tree_error if the candidate is not valid.
    auto candidate_validate() const -> void;

    /// @brief Validates the candidate, then makes it the running
    ///   configuration.
    /// @throws invalid_tree_error if the candidate is not valid. Nothing is
    ///   committed then.
    auto candidate_commit(std::optional<std::string> comment = {})
        -> const commit_record&;

    /// @brief Sets the named leaf in the candidate.
    /// @param[in] path Absolute nesting path of the leaf's context.
    auto candidate_edit_set(const std::vector<path_entry>& path,
                            const std::string& name,
                            const std::string& value) -> node_id;

    /// @brief Adds the value to the named leaf-list in the candidate.
    /// @param[in] path Absolute nesting path of the leaf-list's context.
    auto candidate_edit_add(const std::vector<path_entry>& path,
                            const std::string& name,
                            const std::string& value) -> node_id;

    [[nodiscard]] auto commits() const noexcept
        -> const std::vector<commit_record>&;

private:
    session_options opts;
    command_mode current_mode;
    config_tree running;
    config_tree candidate;
    std::vector<commit_record> history;
};

}

#endif /* session_hpp */
