#ifndef GOLDEN_DIFF_HH
#define GOLDEN_DIFF_HH

#include <functional>
#include <string>
#include <string_view>

namespace golden {
/// Signature of a diff engine. The first argument is the text that
/// is currently on disk, the second the newly generated text.
using DiffEngine = std::function<std::string(std::string_view actual, std::string_view expected)>;

/// Render a line-based diff between two texts.
///
/// Lines present in both texts are prefixed with two spaces, lines
/// that only occur in \p actual with '- ', and lines that only occur
/// in \p expected with '+ '. A missing newline at the end of either
/// text is shown as a separate '\ No newline at end of file' line.
///
/// Lines shared at the start and end of both texts are skipped
/// cheaply; the lines in between are compared with a quadratic
/// table, so time and memory grow with the product of the sizes
/// of the changed regions.
///
/// \param actual The old text.
/// \param expected The new text.
/// \return The diff, one line per line of input, without a trailing newline.
auto GenDiff(std::string_view actual, std::string_view expected) -> std::string;
} // namespace golden

#endif // GOLDEN_DIFF_HH
