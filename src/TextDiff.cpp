/**
 * @file TextDiff.cpp
 * @brief Implementation of the line diff
 */

#include "jpatch/TextDiff.hpp"

#include <fmt/color.h>
#include <fmt/format.h>

#include <algorithm>
#include <sstream>
#include <utility>

namespace jpatch {

namespace {

std::string line_number(const std::optional<std::size_t>& index) {
    if (!index) {
        return "    ";
    }
    return fmt::format("{:<4}", *index + 1);
}

using Lines = std::vector<std::string>;

/// (old index, new index) of a line common to both inputs
using MatchedLine = std::pair<std::size_t, std::size_t>;

/**
 * @brief LCS lengths of a[a0, a1) against every prefix of b[b0, b1)
 *
 * Entry k is the LCS length against b[b0, b0 + k).
 */
std::vector<std::size_t> lcs_forward(const Lines& a, std::size_t a0, std::size_t a1,
                                     const Lines& b, std::size_t b0, std::size_t b1) {
    const std::size_t m = b1 - b0;
    std::vector<std::size_t> row(m + 1, 0);
    for (std::size_t i = a0; i < a1; ++i) {
        std::size_t diagonal = 0;
        for (std::size_t k = 1; k <= m; ++k) {
            const std::size_t above = row[k];
            row[k] = a[i] == b[b0 + k - 1] ? diagonal + 1 : std::max(above, row[k - 1]);
            diagonal = above;
        }
    }
    return row;
}

/**
 * @brief LCS lengths of a[a0, a1) against every suffix of b[b0, b1)
 *
 * Entry k is the LCS length against b[b0 + k, b1).
 */
std::vector<std::size_t> lcs_backward(const Lines& a, std::size_t a0, std::size_t a1,
                                      const Lines& b, std::size_t b0, std::size_t b1) {
    const std::size_t m = b1 - b0;
    std::vector<std::size_t> row(m + 1, 0);
    for (std::size_t i = a1; i-- > a0;) {
        std::size_t diagonal = 0;
        for (std::size_t k = m; k-- > 0;) {
            const std::size_t above = row[k];
            row[k] = a[i] == b[b0 + k] ? diagonal + 1 : std::max(above, row[k + 1]);
            diagonal = above;
        }
    }
    return row;
}

/**
 * @brief Append the lines of an LCS of a[a0, a1) and b[b0, b1) to out, in order
 *
 * Hirschberg: split a in half, find where the halves' LCS split b, and
 * recurse on both sides.
 */
void common_lines(const Lines& a, std::size_t a0, std::size_t a1,
                  const Lines& b, std::size_t b0, std::size_t b1,
                  std::vector<MatchedLine>& out) {
    while (a0 < a1 && b0 < b1 && a[a0] == b[b0]) {
        out.emplace_back(a0++, b0++);
    }
    std::size_t tail = 0;
    while (a1 > a0 && b1 > b0 && a[a1 - 1] == b[b1 - 1]) {
        --a1;
        --b1;
        ++tail;
    }

    if (a0 < a1 && b0 < b1) {
        if (a1 - a0 == 1) {
            for (std::size_t j = b0; j < b1; ++j) {
                if (a[a0] == b[j]) {
                    out.emplace_back(a0, j);
                    break;
                }
            }
        } else {
            const std::size_t mid = a0 + (a1 - a0) / 2;
            const auto head = lcs_forward(a, a0, mid, b, b0, b1);
            const auto rest = lcs_backward(a, mid, a1, b, b0, b1);
            std::size_t split = 0;
            for (std::size_t k = 1; k < head.size(); ++k) {
                if (head[k] + rest[k] > head[split] + rest[split]) {
                    split = k;
                }
            }
            common_lines(a, a0, mid, b, b0, b0 + split, out);
            common_lines(a, mid, a1, b, b0 + split, b1, out);
        }
    }

    for (std::size_t t = 0; t < tail; ++t) {
        out.emplace_back(a1 + t, b1 + t);
    }
}

/**
 * @brief For each line of a hunk, the span to underline if it is paired
 */
std::vector<std::optional<InlineSpan>> pair_modified_lines(const LineHunk& hunk) {
    std::vector<std::optional<InlineSpan>> spans(hunk.size());
    std::size_t k = 0;
    while (k < hunk.size()) {
        if (hunk[k].tag != LineTag::Delete) {
            ++k;
            continue;
        }
        const std::size_t first_delete = k;
        while (k < hunk.size() && hunk[k].tag == LineTag::Delete) ++k;
        const std::size_t first_insert = k;
        while (k < hunk.size() && hunk[k].tag == LineTag::Insert) ++k;

        const std::size_t pairs = std::min(first_insert - first_delete, k - first_insert);
        for (std::size_t p = 0; p < pairs; ++p) {
            const InlineSpan span = inline_span(hunk[first_delete + p].text,
                                                hunk[first_insert + p].text);
            spans[first_delete + p] = span;
            spans[first_insert + p] = span;
        }
    }
    return spans;
}

void print_colored_text(std::ostream& os, const std::string& text,
                        const fmt::text_style& style,
                        const std::optional<InlineSpan>& span) {
    if (!span || span->prefix + span->suffix >= text.size()) {
        os << fmt::format(style, "{}", text);
        return;
    }
    const std::size_t changed = text.size() - span->prefix - span->suffix;
    os << fmt::format(style, "{}", text.substr(0, span->prefix))
       << fmt::format(style | fmt::emphasis::underline, "{}",
                      text.substr(span->prefix, changed))
       << fmt::format(style, "{}", text.substr(span->prefix + changed));
}

} // anonymous namespace

InlineSpan inline_span(const std::string& old_line, const std::string& new_line) {
    const std::size_t shorter = std::min(old_line.size(), new_line.size());
    InlineSpan span;
    while (span.prefix < shorter && old_line[span.prefix] == new_line[span.prefix]) {
        ++span.prefix;
    }
    while (span.prefix + span.suffix < shorter &&
           old_line[old_line.size() - 1 - span.suffix] ==
               new_line[new_line.size() - 1 - span.suffix]) {
        ++span.suffix;
    }
    return span;
}

std::vector<std::string> split_lines(const std::string& text) {
    std::vector<std::string> lines;
    std::istringstream iss(text);
    std::string line;
    while (std::getline(iss, line)) {
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        lines.push_back(line);
    }
    return lines;
}

std::vector<LineChange> diff_lines(const std::string& old_text,
                                   const std::string& new_text) {
    const Lines a = split_lines(old_text);
    const Lines b = split_lines(new_text);

    std::vector<MatchedLine> matches;
    common_lines(a, 0, a.size(), b, 0, b.size(), matches);

    std::vector<LineChange> changes;
    changes.reserve(a.size() + b.size() - matches.size());
    std::size_t i = 0;
    std::size_t j = 0;
    auto flush_until = [&](std::size_t old_end, std::size_t new_end) {
        for (; i < old_end; ++i) {
            changes.push_back({LineTag::Delete, i, std::nullopt, a[i]});
        }
        for (; j < new_end; ++j) {
            changes.push_back({LineTag::Insert, std::nullopt, j, b[j]});
        }
    };

    for (const auto& match : matches) {
        flush_until(match.first, match.second);
        changes.push_back({LineTag::Equal, i, j, a[i]});
        ++i;
        ++j;
    }
    flush_until(a.size(), b.size());
    return changes;
}

std::vector<LineHunk> group_hunks(const std::vector<LineChange>& changes,
                                  std::size_t context) {
    // Ranges [begin, end) of change indices to show
    std::vector<std::pair<std::size_t, std::size_t>> ranges;
    for (std::size_t k = 0; k < changes.size(); ++k) {
        if (changes[k].tag == LineTag::Equal) {
            continue;
        }
        const std::size_t begin = k > context ? k - context : 0;
        const std::size_t end = std::min(changes.size(), k + context + 1);
        if (!ranges.empty() && begin <= ranges.back().second) {
            ranges.back().second = end;
        } else {
            ranges.emplace_back(begin, end);
        }
    }

    std::vector<LineHunk> hunks;
    hunks.reserve(ranges.size());
    for (const auto& range : ranges) {
        hunks.emplace_back(changes.begin() + static_cast<std::ptrdiff_t>(range.first),
                           changes.begin() + static_cast<std::ptrdiff_t>(range.second));
    }
    return hunks;
}

void print_line_diff(std::ostream& os, const std::vector<LineHunk>& hunks,
                     bool color) {
    for (std::size_t h = 0; h < hunks.size(); ++h) {
        if (h > 0) {
            os << std::string(80, '-') << '\n';
        }
        const auto spans = pair_modified_lines(hunks[h]);
        for (std::size_t k = 0; k < hunks[h].size(); ++k) {
            const LineChange& change = hunks[h][k];
            const char* sign = " ";
            fmt::text_style style = fmt::emphasis::faint;
            switch (change.tag) {
                case LineTag::Delete:
                    sign = "-";
                    style = fmt::fg(fmt::terminal_color::red);
                    break;
                case LineTag::Insert:
                    sign = "+";
                    style = fmt::fg(fmt::terminal_color::green);
                    break;
                case LineTag::Equal:
                    break;
            }

            const std::string numbers = line_number(change.old_index) +
                                        line_number(change.new_index);
            if (color) {
                os << fmt::format(fmt::emphasis::faint, "{} |", numbers)
                   << fmt::format(style | fmt::emphasis::bold, "{}", sign);
                print_colored_text(os, change.text, style, spans[k]);
                os << '\n';
            } else {
                os << numbers << " |" << sign << change.text << '\n';
            }
        }
    }
}

} // namespace jpatch
