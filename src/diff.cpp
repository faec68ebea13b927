#include <docpatch-cpp/diff.hpp>

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <sstream>
#include <string>
#include <string_view>
#include <vector>

namespace docpatch_cpp {

namespace {

/// Split into lines, keeping each line's '\n' so that a missing final
/// newline still counts as a difference.
auto split_lines(std::string_view text) -> std::vector<std::string_view> {
    auto lines = std::vector<std::string_view>{};
    auto pos = std::size_t{0};
    while (pos < text.size()) {
        auto next = text.find('\n', pos);
        if (next == std::string_view::npos) {
            lines.push_back(text.substr(pos));
            break;
        }
        lines.push_back(text.substr(pos, next - pos + 1));
        pos = next + 1;
    }
    return lines;
}

enum class EditKind : std::uint8_t { equal, remove, insert };

struct Edit {
    EditKind kind;
    std::size_t a;  // index into the old lines (position for inserts)
    std::size_t b;  // index into the new lines (position for removals)
};

/// Line-level edit script: common prefix and suffix are matched directly,
/// the middle by longest common subsequence.
auto edit_script(const std::vector<std::string_view>& old_lines,
                 const std::vector<std::string_view>& new_lines) -> std::vector<Edit> {
    const auto n = old_lines.size();
    const auto m = new_lines.size();

    auto head = std::size_t{0};
    while (head < n && head < m && old_lines[head] == new_lines[head]) ++head;
    auto tail = std::size_t{0};
    while (tail < n - head && tail < m - head &&
           old_lines[n - 1 - tail] == new_lines[m - 1 - tail]) {
        ++tail;
    }

    const auto rows = n - head - tail;
    const auto cols = m - head - tail;
    auto lcs = std::vector<std::uint32_t>((rows + 1) * (cols + 1), 0);
    auto at = [&](std::size_t i, std::size_t j) -> std::uint32_t& {
        return lcs[i * (cols + 1) + j];
    };
    for (auto i = rows; i-- > 0;) {
        for (auto j = cols; j-- > 0;) {
            if (old_lines[head + i] == new_lines[head + j]) {
                at(i, j) = at(i + 1, j + 1) + 1;
            } else {
                at(i, j) = std::max(at(i + 1, j), at(i, j + 1));
            }
        }
    }

    auto edits = std::vector<Edit>{};
    edits.reserve(n + m);
    for (std::size_t k = 0; k < head; ++k) {
        edits.push_back({EditKind::equal, k, k});
    }
    auto i = std::size_t{0};
    auto j = std::size_t{0};
    while (i < rows || j < cols) {
        if (i < rows && j < cols && old_lines[head + i] == new_lines[head + j]) {
            edits.push_back({EditKind::equal, head + i, head + j});
            ++i;
            ++j;
        } else if (i < rows && (j == cols || at(i + 1, j) >= at(i, j + 1))) {
            edits.push_back({EditKind::remove, head + i, head + j});
            ++i;
        } else {
            edits.push_back({EditKind::insert, head + i, head + j});
            ++j;
        }
    }
    for (std::size_t k = 0; k < tail; ++k) {
        edits.push_back({EditKind::equal, head + rows + k, head + cols + k});
    }
    return edits;
}

/// Format a hunk range: "start,len", or "start" alone when len is 1.
/// An empty range names the line before it.
auto range(std::size_t start, std::size_t len) -> std::string {
    auto first = (len == 0) ? start : start + 1;
    if (len == 1) return std::to_string(first);
    return std::to_string(first) + "," + std::to_string(len);
}

void write_line(std::ostringstream& out, char tag, std::string_view line) {
    out << tag << line;
    if (line.empty() || line.back() != '\n') {
        out << "\n\\ No newline at end of file\n";
    }
}

}  // anonymous namespace

auto unified_diff(std::string_view before, std::string_view after,
                  std::string_view before_label, std::string_view after_label)
    -> std::string {
    if (before == after) return {};

    const auto old_lines = split_lines(before);
    const auto new_lines = split_lines(after);
    const auto edits = edit_script(old_lines, new_lines);

    auto out = std::ostringstream{};
    out << "--- " << before_label << "\n";
    out << "+++ " << after_label << "\n";

    auto k = std::size_t{0};
    while (k < edits.size()) {
        if (edits[k].kind == EditKind::equal) {
            ++k;
            continue;
        }
        // Grow the hunk while the next change is within two contexts
        auto last_change = k;
        auto scan = k + 1;
        while (scan < edits.size()) {
            if (edits[scan].kind != EditKind::equal) {
                last_change = scan;
            } else if (scan - last_change > 2 * diff_context_lines) {
                break;
            }
            ++scan;
        }
        auto begin = (k > diff_context_lines) ? k - diff_context_lines : 0;
        auto end = std::min(edits.size(), last_change + diff_context_lines + 1);

        auto a_len = std::size_t{0};
        auto b_len = std::size_t{0};
        for (auto e = begin; e < end; ++e) {
            if (edits[e].kind != EditKind::insert) ++a_len;
            if (edits[e].kind != EditKind::remove) ++b_len;
        }
        out << "@@ -" << range(edits[begin].a, a_len)
            << " +" << range(edits[begin].b, b_len) << " @@\n";
        for (auto e = begin; e < end; ++e) {
            switch (edits[e].kind) {
                case EditKind::equal:  write_line(out, ' ', old_lines[edits[e].a]); break;
                case EditKind::remove: write_line(out, '-', old_lines[edits[e].a]); break;
                case EditKind::insert: write_line(out, '+', new_lines[edits[e].b]); break;
            }
        }
        k = end;
    }
    return out.str();
}

auto diff_documents(const Document& before, const Document& after,
                    std::string_view before_label, std::string_view after_label,
                    const SerializeOptions& options) -> std::string {
    return unified_diff(serialize(before, options), serialize(after, options),
                        before_label, after_label);
}

}  // namespace docpatch_cpp
