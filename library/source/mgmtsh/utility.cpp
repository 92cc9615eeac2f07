#include <algorithm> // for std::transform
#include <cctype> // for std::toupper

#include "mgmtsh/utility.hpp"

namespace mgmtsh {

auto to_upper(std::string_view s) -> std::string
{
    auto result = std::string{s};
    std::transform(begin(result), end(result), begin(result), [](char c){
        return static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
    });
    return result;
}

}
