#ifndef pager_hpp
#define pager_hpp

#include <concepts> // for std::regular.
#include <optional>
#include <ostream>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "mgmtsh/utility.hpp" // for variant ostream support

namespace mgmtsh {

/// @brief Program output is paged through and the arguments it's run with.
struct pager_options
{
    static constexpr auto default_file = "less";

    /// @brief Name of the pager program, looked up in <code>PATH</code>.
    std::string file{default_file};

    /// @brief Arguments given after the program name.
    /// @note The defaults have <code>less</code> exit at once when the text
    ///   fits on one screen and not clear the screen on exit.
    std::vector<std::string> arguments{"-F", "-X"};

    auto operator==(const pager_options& other) const -> bool = default;
};

struct exit_status {
    int value{};
    auto operator==(const exit_status& other) const -> bool = default;
};

auto operator<<(std::ostream& os, const exit_status& value)
    -> std::ostream&;

struct signaled_status {
    int signal{};
    bool core_dumped{};
    auto operator==(const signaled_status& other) const -> bool = default;
};

auto operator<<(std::ostream& os, const signaled_status& value)
    -> std::ostream&;

/// @brief How a child process terminated.
using process_status = std::variant<exit_status, signaled_status>;

static_assert(std::regular<process_status>);

/// @brief Pages the given text.
/// @details Runs the pager with a pipe as its standard input, writes the
///   whole of @p data into the pipe, closes it, and waits for the pager to
///   terminate. The pager is waited for even if writing fails.
///   <code>SIGPIPE</code> is ignored while writing so that a pager exiting
///   before reading everything shows up as a <code>EPIPE</code> error.
/// @return Status of the terminated pager. A program that couldn't be
///   executed exits with status 127.
/// @throws std::system_error if a system call fails.
auto page(const std::string_view& data, const pager_options& opts = {})
    -> process_status;

/// @brief Pages @p data if a pager is given, otherwise writes it to @p os.
/// @note Written text always ends with a line feed.
/// @throws std::system_error if paging fails or the pager does not exit
///   successfully.
auto page_output(std::ostream& os,
                 const std::string_view& data,
                 const std::optional<pager_options>& pager) -> void;

}

#endif /* pager_hpp */
