#include <array>
#include <cerrno> // for errno
#include <csignal> // for ::sigaction
#include <ios> // for std::boolalpha
#include <sstream> // for std::ostringstream
#include <string>
#include <system_error> // for std::system_error, std::errc
#include <vector>

#include <sys/wait.h> // for ::waitpid
#include <unistd.h> // for ::fork, ::pipe, ::execvp, ::_exit

#include "mgmtsh/pager.hpp"

namespace mgmtsh {

namespace {

constexpr auto exec_failure_code = 127;

/// @brief Throws the <code>std::system_error</code> for a failed call.
/// @param[in] err Value of <code>errno</code> the call left.
[[noreturn]]
auto throw_os_error(int err, const std::string& call) -> void
{
    throw std::system_error{err, std::system_category(), call + " failed"};
}

/// @brief Ignores <code>SIGPIPE</code> for as long as this exists.
struct sigpipe_ignorer
{
    sigpipe_ignorer()
    {
        struct ::sigaction act{};
        act.sa_handler = SIG_IGN; // NOLINT(cppcoreguidelines-pro-type-union-access)
        ::sigemptyset(&act.sa_mask);
        if (::sigaction(SIGPIPE, &act, &old) == -1) {
            throw_os_error(errno, "sigaction");
        }
    }

    ~sigpipe_ignorer()
    {
        ::sigaction(SIGPIPE, &old, nullptr);
    }

    sigpipe_ignorer(const sigpipe_ignorer&) = delete;
    auto operator=(const sigpipe_ignorer&) -> sigpipe_ignorer& = delete;

private:
    struct ::sigaction old{};
};

auto wait_for(::pid_t pid) -> process_status
{
    auto status = 0;
    for (;;) {
        if (::waitpid(pid, &status, 0) != -1) {
            break;
        }
        if (errno != EINTR) {
            throw_os_error(errno, "waitpid");
        }
    }
    if (WIFSIGNALED(status)) {
        return signaled_status{WTERMSIG(status), WCOREDUMP(status) != 0};
    }
    return exit_status{WEXITSTATUS(status)};
}

/// @brief Forked pager and the write end of the pipe to it.
/// @note Destruction closes the pipe and reaps the pager if that hasn't
///   already been done.
struct pager_process
{
    ::pid_t pid{-1};
    int fd{-1};

    pager_process(::pid_t p, int d) noexcept: pid{p}, fd{d}
    {
        // Intentionally empty.
    }

    ~pager_process()
    {
        close();
        if (pid > 0) {
            auto status = 0;
            while ((::waitpid(pid, &status, 0) == -1) && (errno == EINTR)) {
                continue;
            }
        }
    }

    pager_process(const pager_process&) = delete;
    auto operator=(const pager_process&) -> pager_process& = delete;

    auto close() noexcept -> void
    {
        if (fd != -1) {
            ::close(fd);
            fd = -1;
        }
    }

    auto wait() -> process_status
    {
        close();
        const auto result = wait_for(pid);
        pid = -1;
        return result;
    }
};

[[noreturn]]
auto exec_child(const pager_options& opts, int read_fd, int write_fd) -> void
{
    ::close(write_fd);
    if (read_fd != STDIN_FILENO) {
        if (::dup2(read_fd, STDIN_FILENO) == -1) {
            ::_exit(exec_failure_code);
        }
        ::close(read_fd);
    }
    auto argv = std::vector<char*>{};
    argv.push_back(const_cast<char*>(opts.file.c_str()));
    for (auto&& arg: opts.arguments) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);
    ::execvp(opts.file.c_str(), argv.data());
    ::_exit(exec_failure_code);
}

auto write_all(int fd, std::string_view data) -> void
{
    while (!empty(data)) {
        const auto n = ::write(fd, data.data(), size(data));
        if (n == -1) {
            if (errno == EINTR) {
                continue;
            }
            throw_os_error(errno, "write to pager");
        }
        data.remove_prefix(static_cast<std::size_t>(n));
    }
}

}

auto operator<<(std::ostream& os, const exit_status& value)
    -> std::ostream&
{
    os << "exit-status=" << value.value;
    return os;
}

auto operator<<(std::ostream& os, const signaled_status& value)
    -> std::ostream&
{
    os << "signal=" << value.signal;
    os << ", core-dumped=" << std::boolalpha << value.core_dumped;
    return os;
}

auto page(const std::string_view& data, const pager_options& opts)
    -> process_status
{
    auto fds = std::array<int, 2>{-1, -1};
    if (::pipe(fds.data()) == -1) {
        throw_os_error(errno, "pipe");
    }
    const auto pid = ::fork();
    if (pid == -1) {
        const auto err = errno;
        ::close(fds[0]);
        ::close(fds[1]);
        throw_os_error(err, "fork");
    }
    if (pid == 0) {
        exec_child(opts, fds[0], fds[1]);
    }
    ::close(fds[0]);
    pager_process pager{pid, fds[1]};
    {
        const sigpipe_ignorer ignorer;
        write_all(pager.fd, data);
    }
    return pager.wait();
}

auto page_output(std::ostream& os,
                 const std::string_view& data,
                 const std::optional<pager_options>& pager) -> void
{
    if (!pager) {
        os << data;
        if (empty(data) || data.back() != '\n') {
            os << '\n';
        }
        return;
    }
    auto text = std::string{data};
    if (empty(text) || text.back() != '\n') {
        text += '\n';
    }
    const auto status = page(text, *pager);
    if (status != process_status{exit_status{}}) {
        std::ostringstream msg;
        msg << pager->file << " terminated with " << status;
        throw std::system_error{
            std::make_error_code(std::errc::io_error), msg.str()
        };
    }
}

}
