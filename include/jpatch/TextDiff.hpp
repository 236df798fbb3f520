/**
 * @file TextDiff.hpp
 * @brief Line diff used to show how a patch file changed after an edit
 */

#ifndef JPATCH_TEXTDIFF_HPP
#define JPATCH_TEXTDIFF_HPP

#include <cstddef>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace jpatch {

enum class LineTag {
    Equal,
    Delete,
    Insert
};

/**
 * @brief One line of a line diff
 *
 * old_index is set for Equal and Delete lines, new_index for Equal and
 * Insert lines. Both are 0-based.
 */
struct LineChange {
    LineTag tag;
    std::optional<std::size_t> old_index;
    std::optional<std::size_t> new_index;
    std::string text;
};

/// A run of changes with surrounding context lines
using LineHunk = std::vector<LineChange>;

/**
 * @brief Split text into lines (without terminators)
 *
 * A trailing newline does not produce an extra empty line.
 */
std::vector<std::string> split_lines(const std::string& text);

/**
 * @brief Longest-common-subsequence diff of two texts, line by line
 *
 * Uses Hirschberg's divide and conquer, so memory stays linear in the
 * number of lines.
 *
 * @return Every line of both inputs, tagged; deletions precede insertions
 *         within a changed region.
 */
std::vector<LineChange> diff_lines(const std::string& old_text,
                                   const std::string& new_text);

/**
 * @brief Group a line diff into hunks with context lines around changes
 *
 * Changes closer than 2 * context lines apart share a hunk. Identical
 * inputs produce no hunks.
 */
std::vector<LineHunk> group_hunks(const std::vector<LineChange>& changes,
                                  std::size_t context = 3);

/**
 * @brief Unchanged head and tail of a modified line
 *
 * The changed segment of a line is text.substr(prefix, size - prefix - suffix).
 */
struct InlineSpan {
    std::size_t prefix = 0;
    std::size_t suffix = 0;
};

/**
 * @brief Common prefix and (non-overlapping) common suffix of two lines
 */
InlineSpan inline_span(const std::string& old_line, const std::string& new_line);

/**
 * @brief Render hunks as "OLD NEW |±text" lines
 *
 * Line numbers are 1-based and left aligned in 4 columns; hunks are
 * separated by a row of 80 dashes. With color, deletions are red,
 * insertions green and context dim; when a run of deletions is followed by
 * a run of insertions, the k-th lines of both runs are paired and the
 * segment that differs between them is underlined.
 */
void print_line_diff(std::ostream& os, const std::vector<LineHunk>& hunks,
                     bool color);

} // namespace jpatch

#endif // JPATCH_TEXTDIFF_HPP
