#ifndef commands_hpp
#define commands_hpp

#include "mgmtsh/command_trie.hpp"

namespace mgmtsh {

/// @brief Command vocabulary of the shell.
/// @note The roots are added on construction in the order declared here.
struct commands
{
    commands();

    command_trie trie;

    /// @brief Root of the operational (EXEC level) commands.
    token_id exec_root{tokens::invalid_id};

    /// @brief Root of the built-in commands available in every
    ///   configuration context.
    token_id config_default_root{tokens::invalid_id};

    /// @brief Root of the built-in commands of the top configuration
    ///   context.
    token_id config_internal_root{tokens::invalid_id};

    /// @brief Root of the commands derived from the configuration schema.
    token_id config_root{tokens::invalid_id};
};

}

#endif /* commands_hpp */
