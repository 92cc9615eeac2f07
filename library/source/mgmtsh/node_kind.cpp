#include "mgmtsh/node_kind.hpp"

namespace mgmtsh {

auto operator<<(std::ostream& os, node_kind value) -> std::ostream&
{
    os << to_cstring(value);
    return os;
}

}
