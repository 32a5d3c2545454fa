#include <algorithm>
#include <base/Base.hh>
#include <diff.hh>
#include <vector>

using namespace base;

namespace {
constexpr std::string_view NoNewline = "\\ No newline at end of file";

/// Split text into lines, dropping the line terminators.
auto SplitLines(std::string_view text) -> std::vector<std::string_view> {
    std::vector<std::string_view> lines;
    while (not text.empty()) {
        auto nl = text.find('\n');
        if (nl == std::string_view::npos) {
            lines.push_back(text);
            lines.push_back(NoNewline);
            break;
        }

        lines.push_back(text.substr(0, nl));
        text.remove_prefix(nl + 1);
    }
    return lines;
}
} // namespace

auto golden::GenDiff(std::string_view actual, std::string_view expected) -> std::string {
    auto a = SplitLines(actual);
    auto b = SplitLines(expected);

    std::string out;
    const auto Emit = [&](std::string_view prefix, std::string_view line) {
        if (not out.empty()) out += '\n';
        out += prefix;
        out += line;
    };

    /// Lines shared at the start and end never need the table.
    usz prefix = 0;
    while (prefix < a.size() and prefix < b.size() and a[prefix] == b[prefix]) prefix++;
    usz suffix = 0;
    while (
        suffix < a.size() - prefix and
        suffix < b.size() - prefix and
        a[a.size() - 1 - suffix] == b[b.size() - 1 - suffix]
    ) suffix++;

    for (usz k = 0; k < prefix; k++) Emit("  ", a[k]);

    /// lcs[i][j] is the length of the longest common subsequence
    /// of a[prefix + i..n] and b[prefix + j..m], where n and m
    /// exclude the common suffix.
    const usz n = a.size() - prefix - suffix;
    const usz m = b.size() - prefix - suffix;
    const auto A = [&](usz i) { return a[prefix + i]; };
    const auto B = [&](usz j) { return b[prefix + j]; };
    std::vector<std::vector<usz>> lcs(n + 1, std::vector<usz>(m + 1, 0));
    for (usz i = n; i-- > 0;) {
        for (usz j = m; j-- > 0;) {
            lcs[i][j] = A(i) == B(j)
                          ? lcs[i + 1][j + 1] + 1
                          : std::max(lcs[i + 1][j], lcs[i][j + 1]);
        }
    }

    /// Walk the table and emit the edit script.
    usz i = 0, j = 0;
    while (i < n and j < m) {
        if (A(i) == B(j)) {
            Emit("  ", A(i));
            i++;
            j++;
        } else if (lcs[i + 1][j] >= lcs[i][j + 1]) {
            Emit("- ", A(i++));
        } else {
            Emit("+ ", B(j++));
        }
    }

    while (i < n) Emit("- ", A(i++));
    while (j < m) Emit("+ ", B(j++));
    for (usz k = a.size() - suffix; k < a.size(); k++) Emit("  ", a[k]);
    return out;
}
