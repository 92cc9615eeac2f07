#include "mgmtsh/commands.hpp"

namespace mgmtsh {

commands::commands():
    exec_root{trie.add_root("exec")},
    config_default_root{trie.add_root("config-default")},
    config_internal_root{trie.add_root("config-internal")},
    config_root{trie.add_root("config")}
{
    // Intentionally empty.
}

}
