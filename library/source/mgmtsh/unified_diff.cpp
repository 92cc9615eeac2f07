#include <algorithm> // for std::any_of, std::max, std::min
#include <cstddef> // for std::ptrdiff_t
#include <optional>
#include <span>
#include <sstream> // for std::ostringstream
#include <utility> // for std::pair

#include "mgmtsh/unified_diff.hpp"

namespace mgmtsh {

namespace {

using lines = std::vector<std::string_view>;

enum class op_tag { equal, remove, insert };

/// @brief Range <code>[i1,i2)</code> of old lines and <code>[j1,j2)</code>
///   of new lines sharing a tag.
struct opcode
{
    op_tag tag{op_tag::equal};
    std::size_t i1{};
    std::size_t i2{};
    std::size_t j1{};
    std::size_t j2{};
};

using hunk = std::vector<opcode>;

using line_span = std::span<const std::string_view>;
using match_list = std::vector<std::pair<std::size_t, std::size_t>>;

/// @brief Point where a shortest edit script between two texts can be split
///   into two independent halves.
/// @details Runs the forward and reverse searches of the linear space Myers
///   algorithm until their furthest reaching paths overlap. Both texts must
///   be non-empty and must neither start nor end with the same line.
/// @return Empty optional if no overlap is found, in which case every line
///   of <code>a</code> is removed and every line of <code>b</code> inserted.
/// @see Eugene W. Myers, "An O(ND) Difference Algorithm and Its
///   Variations", Algorithmica 1 (1986), section 4b.
auto middle_split(line_span a, line_span b)
    -> std::optional<std::pair<std::size_t, std::size_t>>
{
    const auto n = static_cast<std::ptrdiff_t>(size(a));
    const auto m = static_cast<std::ptrdiff_t>(size(b));
    const auto max_d = (n + m + 1) / 2;
    const auto offset = max_d;
    const auto length = 2 * max_d + 2;
    auto forward = std::vector<std::ptrdiff_t>(
        static_cast<std::size_t>(length), std::ptrdiff_t{-1});
    auto reverse = forward;
    const auto at = [offset](std::vector<std::ptrdiff_t>& v,
                             std::ptrdiff_t k) -> std::ptrdiff_t& {
        return v[static_cast<std::size_t>(k + offset)];
    };
    const auto in_range = [length, offset](std::ptrdiff_t k) {
        return (k + offset >= 0) && (k + offset < length);
    };
    const auto line_a = [&a](std::ptrdiff_t i) {
        return a[static_cast<std::size_t>(i)];
    };
    const auto line_b = [&b](std::ptrdiff_t i) {
        return b[static_cast<std::size_t>(i)];
    };
    at(forward, 1) = 0;
    at(reverse, 1) = 0;
    const auto delta = n - m;
    const auto odd = (delta % 2) != 0;
    auto k1_start = std::ptrdiff_t{};
    auto k1_end = std::ptrdiff_t{};
    auto k2_start = std::ptrdiff_t{};
    auto k2_end = std::ptrdiff_t{};
    for (auto d = std::ptrdiff_t{}; d < max_d; ++d) {
        for (auto k = -d + k1_start; k <= d - k1_end; k += 2) {
            auto x = ((k == -d) ||
                      ((k != d) && (at(forward, k - 1) < at(forward, k + 1))))
                ? at(forward, k + 1)
                : at(forward, k - 1) + 1;
            auto y = x - k;
            while ((x < n) && (y < m) && (line_a(x) == line_b(y))) {
                ++x;
                ++y;
            }
            at(forward, k) = x;
            if (x > n) {
                k1_end += 2;
            }
            else if (y > m) {
                k1_start += 2;
            }
            else if (odd && in_range(delta - k) &&
                     (at(reverse, delta - k) != -1) &&
                     (x >= n - at(reverse, delta - k))) {
                return std::make_pair(static_cast<std::size_t>(x),
                                      static_cast<std::size_t>(y));
            }
        }
        for (auto k = -d + k2_start; k <= d - k2_end; k += 2) {
            auto x = ((k == -d) ||
                      ((k != d) && (at(reverse, k - 1) < at(reverse, k + 1))))
                ? at(reverse, k + 1)
                : at(reverse, k - 1) + 1;
            auto y = x - k;
            while ((x < n) && (y < m) &&
                   (line_a(n - x - 1) == line_b(m - y - 1))) {
                ++x;
                ++y;
            }
            at(reverse, k) = x;
            if (x > n) {
                k2_end += 2;
            }
            else if (y > m) {
                k2_start += 2;
            }
            else if (!odd && in_range(delta - k) &&
                     (at(forward, delta - k) != -1)) {
                const auto fx = at(forward, delta - k);
                const auto fy = fx - (delta - k);
                if (fx >= n - x) {
                    return std::make_pair(static_cast<std::size_t>(fx),
                                          static_cast<std::size_t>(fy));
                }
            }
        }
    }
    return {};
}

/// @brief Appends the matched line pairs of a shortest edit script between
///   <code>a</code> and <code>b</code>, in order.
/// @note Memory use is linear in the number of lines.
auto add_matches(line_span a, line_span b,
                 std::size_t a_offset, std::size_t b_offset,
                 match_list& matches) -> void
{
    auto prefix = std::size_t{};
    while ((prefix < size(a)) && (prefix < size(b)) &&
           (a[prefix] == b[prefix])) {
        matches.emplace_back(a_offset + prefix, b_offset + prefix);
        ++prefix;
    }
    a = a.subspan(prefix);
    b = b.subspan(prefix);
    a_offset += prefix;
    b_offset += prefix;
    auto suffix = std::size_t{};
    while ((suffix < size(a)) && (suffix < size(b)) &&
           (a[size(a) - suffix - 1u] == b[size(b) - suffix - 1u])) {
        ++suffix;
    }
    a = a.first(size(a) - suffix);
    b = b.first(size(b) - suffix);
    if (!empty(a) && !empty(b)) {
        if (const auto split = middle_split(a, b)) {
            const auto [x, y] = *split;
            add_matches(a.first(x), b.first(y), a_offset, b_offset, matches);
            add_matches(a.subspan(x), b.subspan(y),
                        a_offset + x, b_offset + y, matches);
        }
    }
    for (auto i = std::size_t{}; i < suffix; ++i) {
        matches.emplace_back(a_offset + size(a) + i, b_offset + size(b) + i);
    }
}

auto matched_lines(const lines& a, const lines& b) -> match_list
{
    auto result = match_list{};
    add_matches(line_span{a}, line_span{b}, 0u, 0u, result);
    return result;
}

/// @brief Opcodes covering both texts, removals before insertions.
auto make_opcodes(const lines& a, const lines& b) -> std::vector<opcode>
{
    auto result = std::vector<opcode>{};
    auto i = std::size_t{};
    auto j = std::size_t{};
    const auto flush = [&](std::size_t to_i, std::size_t to_j) {
        if (i < to_i) {
            result.push_back(opcode{op_tag::remove, i, to_i, j, j});
        }
        if (j < to_j) {
            result.push_back(opcode{op_tag::insert, to_i, to_i, j, to_j});
        }
        i = to_i;
        j = to_j;
    };
    for (auto&& match: matched_lines(a, b)) {
        flush(match.first, match.second);
        if (!empty(result) && result.back().tag == op_tag::equal &&
            result.back().i2 == i && result.back().j2 == j) {
            ++result.back().i2;
            ++result.back().j2;
        }
        else {
            result.push_back(opcode{op_tag::equal, i, i + 1u, j, j + 1u});
        }
        ++i;
        ++j;
    }
    flush(size(a), size(b));
    return result;
}

auto group_opcodes(std::vector<opcode> codes, std::size_t n)
    -> std::vector<hunk>
{
    auto result = std::vector<hunk>{};
    const auto changed = std::any_of(begin(codes), end(codes),
                                     [](const opcode& code){
        return code.tag != op_tag::equal;
    });
    if (!changed) {
        return result;
    }
    if (auto& first = codes.front(); first.tag == op_tag::equal) {
        first.i1 = std::max(first.i1, (first.i2 > n)? first.i2 - n: 0u);
        first.j1 = std::max(first.j1, (first.j2 > n)? first.j2 - n: 0u);
    }
    if (auto& last = codes.back(); last.tag == op_tag::equal) {
        last.i2 = std::min(last.i2, last.i1 + n);
        last.j2 = std::min(last.j2, last.j1 + n);
    }
    auto group = hunk{};
    for (auto code: codes) {
        if (code.tag == op_tag::equal && (code.i2 - code.i1) > (2u * n)) {
            group.push_back(opcode{op_tag::equal,
                code.i1, std::min(code.i2, code.i1 + n),
                code.j1, std::min(code.j2, code.j1 + n)});
            result.push_back(std::move(group));
            group = hunk{};
            code.i1 = std::max(code.i1, code.i2 - n);
            code.j1 = std::max(code.j1, code.j2 - n);
        }
        group.push_back(code);
    }
    if (!empty(group) &&
        !((size(group) == 1u) && (group.front().tag == op_tag::equal))) {
        result.push_back(std::move(group));
    }
    return result;
}

auto write_range(std::ostream& os, std::size_t first, std::size_t last)
    -> void
{
    const auto length = last - first;
    if (length == 1u) {
        os << (first + 1u);
        return;
    }
    os << ((length == 0u)? first: first + 1u) << ',' << length;
}

auto write_line(std::ostream& os, char prefix, const std::string_view& line)
    -> void
{
    os << prefix << line;
    if (empty(line) || line.back() != '\n') {
        os << "\n\\ No newline at end of file\n";
    }
}

auto write_hunk(std::ostream& os, const hunk& ops,
                const lines& a, const lines& b) -> void
{
    os << "@@ -";
    write_range(os, ops.front().i1, ops.back().i2);
    os << " +";
    write_range(os, ops.front().j1, ops.back().j2);
    os << " @@\n";
    for (auto&& op: ops) {
        switch (op.tag) {
        case op_tag::equal:
            for (auto i = op.i1; i < op.i2; ++i) {
                write_line(os, ' ', a[i]);
            }
            break;
        case op_tag::remove:
            for (auto i = op.i1; i < op.i2; ++i) {
                write_line(os, '-', a[i]);
            }
            break;
        case op_tag::insert:
            for (auto j = op.j1; j < op.j2; ++j) {
                write_line(os, '+', b[j]);
            }
            break;
        }
    }
}

}

auto split_lines(const std::string_view& text)
    -> std::vector<std::string_view>
{
    auto result = std::vector<std::string_view>{};
    auto rest = text;
    while (!empty(rest)) {
        const auto found = rest.find('\n');
        const auto length = (found == std::string_view::npos)
            ? size(rest)
            : found + 1u;
        result.push_back(rest.substr(0u, length));
        rest.remove_prefix(length);
    }
    return result;
}

auto write_unified_diff(std::ostream& os,
                        const std::string_view& old_text,
                        const std::string_view& new_text,
                        const unified_diff_options& opts) -> void
{
    const auto a = split_lines(old_text);
    const auto b = split_lines(new_text);
    auto header_done = false;
    for (auto&& ops: group_opcodes(make_opcodes(a, b), opts.context_radius)) {
        if (!header_done) {
            os << "--- " << opts.old_header << '\n';
            os << "+++ " << opts.new_header << '\n';
            header_done = true;
        }
        write_hunk(os, ops, a, b);
    }
}

auto unified_diff(const std::string_view& old_text,
                  const std::string_view& new_text,
                  const unified_diff_options& opts) -> std::string
{
    std::ostringstream os;
    write_unified_diff(os, old_text, new_text, opts);
    return os.str();
}

}
