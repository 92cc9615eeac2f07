#include <cerrno> // for errno, EINTR
#include <cstddef> // for std::size_t
#include <cstdlib> // for EXIT_SUCCESS, EXIT_FAILURE
#include <exception> // for std::exception
#include <filesystem>
#include <functional> // for std::function
#include <iostream>
#include <memory> // for std::unique_ptr
#include <optional>
#include <string>
#include <string_view>
#include <system_error> // for std::system_error
#include <utility> // for std::move
#include <variant> // for std::holds_alternative
#include <vector>

#include <unistd.h> // for ::gethostname

#include <histedit.h>

#include "mgmtsh/command_mode.hpp"
#include "mgmtsh/commands.hpp"
#include "mgmtsh/config_commands.hpp"
#include "mgmtsh/config_diff.hpp"
#include "mgmtsh/data_format.hpp"
#include "mgmtsh/flatten.hpp"
#include "mgmtsh/pager.hpp"
#include "mgmtsh/session.hpp"
#include "mgmtsh/snapshot.hpp"

namespace {

using arguments = std::vector<std::string>;

constexpr auto shell_name = "mgmtsh";

const auto config_prefix = std::string{"--config="};
const auto hostname_prefix = std::string{"--hostname="};
const auto pager_prefix = std::string{"--pager="};
const auto no_pager_argument = std::string{"--no-pager"};
const auto help_argument = std::string{"--help"};

constexpr auto emacs_editor_str = "emacs";
constexpr auto error_prefix = "% ";
constexpr auto hist_size = 100;

/// @brief Makes the stated return type from given argument count and vector.
/// @param[in] ac Argument count.
/// @param[in] av Argument vector.
auto make_arguments(int ac, const char*av[]) -> arguments
{
    auto args = arguments{};
    for (auto i = 0; i < ac; ++i) {
        args.emplace_back(av[i]);
    }
    return args;
}

struct EditLineDeleter
{
    void operator()(EditLine *p)
    {
        el_end(p);
    }
};

using edit_line_ptr = std::unique_ptr<EditLine, EditLineDeleter>;

struct HistoryDeleter
{
    void operator()(History *p)
    {
        history_end(p);
    }
};

using history_ptr = std::unique_ptr<History, HistoryDeleter>;

struct TokenizerDeleter
{
    void operator()(Tokenizer *p)
    {
        tok_end(p);
    }
};

using tokenizer_ptr = std::unique_ptr<Tokenizer, TokenizerDeleter>;

auto continuation = false;
auto prompt_buf = std::string{};

char *prompt([[maybe_unused]] EditLine *el)
{
    static auto cl_buf = std::string{"> "};
    return continuation? cl_buf.data(): prompt_buf.data();
}

auto default_hostname() -> std::string
{
    char buf[256]{}; // NOLINT(cppcoreguidelines-avoid-c-arrays)
    if (::gethostname(buf, sizeof(buf) - 1u) == -1 || buf[0] == '\0') {
        return mgmtsh::session_options::default_hostname;
    }
    return buf;
}

auto print_usage(std::ostream& os, const std::string_view& name) -> void
{
    os << "usage: " << name;
    os << " [" << config_prefix << "<file>]";
    os << " [" << hostname_prefix << "<name>]";
    os << " [" << pager_prefix << "<program>|" << no_pager_argument << "]";
    os << " [" << help_argument << "]\n";
    os << "Configuration commands follow the shape of the " << config_prefix;
    os << " snapshot. Without one, configure mode has only its built-in";
    os << " commands.\n";
}

auto show_config(const mgmtsh::session& session,
                 mgmtsh::datastore which,
                 bool with_defaults,
                 const std::optional<std::string>& format) -> void
{
    const auto& config = session.configuration(which);
    auto data = std::string{};
    if (format) {
        const auto data_format = mgmtsh::to_data_format(*format);
        if (!data_format) {
            std::cerr << error_prefix << "unknown format: " << *format << "\n";
            return;
        }
        try {
            data = mgmtsh::print_config(config, *data_format, with_defaults);
        }
        catch (const std::exception& ex) {
            std::cerr << error_prefix << "failed to print configuration: ";
            std::cerr << ex.what() << "\n";
            return;
        }
    }
    else {
        data = mgmtsh::flatten(config, with_defaults);
    }
    try {
        mgmtsh::page_output(std::cout, data, session.options().pager);
    }
    catch (const std::system_error& ex) {
        std::cerr << error_prefix << "failed to print configuration: ";
        std::cerr << ex.what() << "\n";
    }
}

auto show_changes(const mgmtsh::session& session) -> void
{
    std::cout << mgmtsh::config_changes(
        session.configuration(mgmtsh::datastore::running),
        session.configuration(mgmtsh::datastore::candidate));
}

auto add_show_commands(mgmtsh::command_trie& trie,
                       mgmtsh::token_id root,
                       mgmtsh::session& session) -> void
{
    using mgmtsh::token_kind;
    using mgmtsh::parsed_args;
    const auto show = trie.add(root, "show", token_kind::keyword, {},
                               "Show configuration");
    for (const auto which: {mgmtsh::datastore::running,
                            mgmtsh::datastore::candidate}) {
        const auto name = std::string{to_cstring(which)};
        const auto config = trie.add(show, name, token_kind::keyword,
            [&session, which](parsed_args&){
                show_config(session, which, false, {});
            }, "Show the " + name + " configuration");
        const auto format = trie.add(config, "format", token_kind::keyword,
                                     {}, "Data format");
        trie.add(format, "format", token_kind::word,
            [&session, which](parsed_args& args){
                show_config(session, which, false,
                            mgmtsh::take_arg(args, "format"));
            }, "json or xml");
        const auto with_defaults = trie.add(config, "with-defaults",
            token_kind::keyword, [&session, which](parsed_args&){
                show_config(session, which, true, {});
            }, "Include default values");
        const auto wd_format = trie.add(with_defaults, "format",
                                        token_kind::keyword, {},
                                        "Data format");
        trie.add(wd_format, "format", token_kind::word,
            [&session, which](parsed_args& args){
                show_config(session, which, true,
                            mgmtsh::take_arg(args, "format"));
            }, "json or xml");
    }
    trie.add(show, "changes", token_kind::keyword,
        [&session](parsed_args&){
            show_changes(session);
        }, "Show uncommitted changes");
}

auto run(const mgmtsh::command_action& action,
         mgmtsh::parsed_args& args) -> void
{
    try {
        action(args);
    }
    catch (const std::exception& ex) {
        std::cerr << error_prefix << ex.what() << "\n";
    }
}

}

auto main(int argc, const char * argv[]) -> int
{
    auto options = mgmtsh::session_options{default_hostname()};
    auto config = mgmtsh::config_tree{};

    for (auto&& arg: make_arguments(argc - 1, argv + 1)) {
        if (arg == help_argument) {
            print_usage(std::cout, argv[0]);
            return EXIT_SUCCESS;
        }
        if (arg == no_pager_argument) {
            options.pager.reset();
            continue;
        }
        if (arg.starts_with(hostname_prefix)) {
            options.hostname = arg.substr(size(hostname_prefix));
            continue;
        }
        if (arg.starts_with(pager_prefix)) {
            options.pager = mgmtsh::pager_options{
                arg.substr(size(pager_prefix))
            };
            continue;
        }
        if (arg.starts_with(config_prefix)) {
            const auto path = std::filesystem::path{
                arg.substr(size(config_prefix))
            };
            try {
                config = mgmtsh::load_snapshot(path, std::cerr);
            }
            catch (const std::exception& ex) {
                std::cerr << error_prefix << "failed to load configuration: ";
                std::cerr << ex.what() << "\n";
                return EXIT_FAILURE;
            }
            continue;
        }
        std::cerr << error_prefix << "unrecognized argument " << arg << "\n";
        print_usage(std::cerr, argv[0]);
        return EXIT_FAILURE;
    }

    auto session = mgmtsh::session{std::move(options), std::move(config)};
    auto cmds = mgmtsh::commands{};
    auto do_loop = true;

    using mgmtsh::token_kind;
    using mgmtsh::parsed_args;
    auto& trie = cmds.trie;

    auto config_tokens = std::size_t{};
    const auto list_lambda = [&](parsed_args&){
        mgmtsh::list_commands(std::cout, cmds, session.mode());
        if ((config_tokens == 0u) &&
            std::holds_alternative<mgmtsh::configure_mode>(session.mode())) {
            std::cout << error_prefix << "no configuration commands: start ";
            std::cout << "with " << config_prefix << "<file> to load a ";
            std::cout << "configuration\n";
        }
    };

    // Operational commands.
    trie.add(cmds.exec_root, "configure", token_kind::keyword,
        [&](parsed_args&){
            session.mode_set(mgmtsh::configure_mode{});
        }, "Enter configuration mode");
    trie.add(cmds.exec_root, "exit", token_kind::keyword,
        [&](parsed_args&){
            do_loop = false;
        }, "Exit this shell");
    trie.add(cmds.exec_root, "list", token_kind::keyword, list_lambda,
             "List available commands");
    add_show_commands(trie, cmds.exec_root, session);

    // Commands of every configuration context.
    trie.add(cmds.config_default_root, "exit", token_kind::keyword,
        [&](parsed_args&){
            session.mode_config_exit();
        }, "Exit from the current context");
    trie.add(cmds.config_default_root, "end", token_kind::keyword,
        [&](parsed_args&){
            session.mode_set(mgmtsh::operational_mode{});
        }, "Exit to operational mode");
    trie.add(cmds.config_default_root, "list", token_kind::keyword,
             list_lambda, "List available commands");
    trie.add(cmds.config_default_root, "pwd", token_kind::keyword,
        [&](parsed_args&){
            std::cout << mgmtsh::data_path(session.mode()).value_or("/");
            std::cout << "\n";
        }, "Print the current context");
    const auto hostname = trie.add(cmds.config_default_root, "hostname",
                                   token_kind::keyword, {}, "Set hostname");
    trie.add(hostname, "hostname", token_kind::word,
        [&](parsed_args& args){
            if (auto name = mgmtsh::take_arg(args, "hostname")) {
                session.set_hostname(std::move(*name));
            }
        }, "Name of this system");

    // Commands of the top configuration context.
    trie.add(cmds.config_internal_root, "discard", token_kind::keyword,
        [&](parsed_args&){
            session.candidate_discard();
        }, "Discard uncommitted changes");
    const auto commit_lambda = [&](parsed_args& args){
        try {
            session.candidate_commit(mgmtsh::take_arg(args, "comment"));
            std::cout << error_prefix;
            std::cout << "configuration committed successfully\n";
        }
        catch (const mgmtsh::invalid_tree_error& ex) {
            std::cerr << error_prefix << ex.what() << "\n";
        }
    };
    const auto commit = trie.add(cmds.config_internal_root, "commit",
                                 token_kind::keyword, commit_lambda,
                                 "Commit the candidate configuration");
    const auto comment = trie.add(commit, "comment", token_kind::keyword,
                                  {}, "Comment on this commit");
    trie.add(comment, "comment", token_kind::word, commit_lambda,
             "Text of the comment");
    trie.add(cmds.config_internal_root, "validate", token_kind::keyword,
        [&](parsed_args&){
            try {
                session.candidate_validate();
                std::cout << error_prefix;
                std::cout << "candidate configuration validated successfully\n";
            }
            catch (const mgmtsh::invalid_tree_error& ex) {
                std::cerr << error_prefix << ex.what() << "\n";
            }
        }, "Validate the candidate configuration");
    add_show_commands(trie, cmds.config_internal_root, session);

    // Commands derived from the configuration itself.
    config_tokens = mgmtsh::add_config_commands(cmds,
        session.configuration(mgmtsh::datastore::running),
        mgmtsh::config_handlers{
            [&](){
                return session.context();
            },
            [&](std::vector<mgmtsh::path_entry> path){
                session.mode_set(mgmtsh::configure_mode{std::move(path)});
            },
            [&](const std::vector<mgmtsh::path_entry>& path,
                const std::string& name, const std::string& value){
                session.candidate_edit_set(path, name, value);
            },
            [&](const std::vector<mgmtsh::path_entry>& path,
                const std::string& name, const std::string& value){
                session.candidate_edit_add(path, name, value);
            },
        });

    // For example of using libedit, see: https://tinyurl.com/3ez9utzc
    HistEvent ev{};
    auto hist = history_ptr{history_init()};
    history(hist.get(), &ev, H_SETSIZE, hist_size);

    auto tok = tokenizer_ptr{tok_init(NULL)};

    auto el = edit_line_ptr{el_init(shell_name, stdin, stdout, stderr)};
    el_set(el.get(), EL_SIGNAL, 1); // installs sig handlers for resizing, etc.
    el_set(el.get(), EL_HIST, history, hist.get());
    el_set(el.get(), EL_PROMPT, prompt);
    el_set(el.get(), EL_EDITOR, emacs_editor_str);
    el_source(el.get(), NULL);

    while (do_loop) {
        prompt_buf = mgmtsh::prompt(session.options().hostname,
                                    session.mode());
        auto count = 0;
        const auto buf = el_gets(el.get(), &count);
        if (!buf || count == 0) {
            if (errno == EINTR) {
                continue;
            }
            std::cout << "\n";
            break;
        }
        if (!continuation && (count == 1)) {
            continue;
        }
        const auto li = el_line(el.get());
        auto ac = 0; // arg count
        auto av = static_cast<const char**>(nullptr);
        auto cc = 0;
        auto co = 0;
        const auto tok_line_rv = tok_line(tok.get(), li, &ac, &av, &cc, &co);
        if (tok_line_rv == -1) {
            std::cerr << error_prefix << "internal error\n";
            continuation = false;
            tok_reset(tok.get());
            continue;
        }
        if (history(hist.get(), &ev,
                    continuation? H_APPEND: H_ENTER, buf) == -1) {
            std::cerr << "history error (" << ev.num << ")" << ev.str << "\n";
        }
        continuation = tok_line_rv > 0;
        if (continuation) {
            continue;
        }
        const auto args = make_arguments(ac, av);
        tok_reset(tok.get());
        if (empty(args)) {
            continue;
        }
        auto match = mgmtsh::match_command(trie,
            mgmtsh::enumeration_roots(cmds, session.mode()), args);
        if (!match) {
            std::cerr << error_prefix << "unknown command\n";
            continue;
        }
        const auto& action = trie[match->token].action;
        if (!action) {
            std::cerr << error_prefix << "incomplete command\n";
            continue;
        }
        run(*action, match->args);
    }
    return EXIT_SUCCESS;
}
