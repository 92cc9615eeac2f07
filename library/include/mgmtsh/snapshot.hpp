#ifndef snapshot_hpp
#define snapshot_hpp

#include <filesystem>
#include <istream>
#include <ostream>
#include <stdexcept> // for std::runtime_error

#include "mgmtsh/config_tree.hpp"

namespace mgmtsh {

struct snapshot_error: public std::runtime_error
{
    using runtime_error::runtime_error;
};

/// @brief Loads a configuration snapshot.
/// @details A snapshot is a JSON array of node objects. Each has the string
///   members <code>name</code> and <code>kind</code> (a node kind's text
///   form), and optionally <code>value</code> (a scalar),
///   <code>default</code> (a boolean) and <code>children</code> (an array of
///   node objects). For example:
/// @code
/// [{"name": "system", "kind": "container", "children": [
///     {"name": "hostname", "kind": "leaf", "value": "router1"}]}]
/// @endcode
/// @param[in,out] diags Stream warnings about ignored members are written to.
/// @throws snapshot_error if the input is not a well-formed snapshot.
/// @throws invalid_tree_error if the snapshot violates the data model.
auto load_snapshot(std::istream& is, std::ostream& diags) -> config_tree;

/// @brief Loads the configuration snapshot in the file at the given path.
/// @throws snapshot_error if the file can't be read or isn't well-formed.
/// @throws invalid_tree_error if the snapshot violates the data model.
auto load_snapshot(const std::filesystem::path& path, std::ostream& diags)
    -> config_tree;

}

#endif /* snapshot_hpp */
