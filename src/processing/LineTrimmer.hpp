#pragma once

#include "TrimTypes.hpp"

#include <string_view>
#include <vector>

namespace trim::processing
{

/// Space, tab, vertical tab, form feed and carriage return.
[[nodiscard]] bool isHorizontalWhitespace(char c) noexcept;

/// Strip trailing horizontal whitespace from a single line body.
[[nodiscard]] std::string_view rtrim(std::string_view line) noexcept;

/// Split content on "\n", keeping "\r\n" terminators intact.
/// Empty content yields no lines; a trailing "\n" does not produce an extra empty line.
[[nodiscard]] std::vector<Line> splitLines(std::string_view content);

/**
 * @brief Removes trailing whitespace from every line and normalizes the end of the content
 *
 * Leading and interior whitespace, leading blank lines and interior blank lines are kept.
 * Trailing blank lines collapse into one newline (or none with suppress_newline), and
 * non-empty content always ends with exactly one newline unless suppress_newline is set.
 * Each line keeps its own terminator style; an appended newline reuses the style of the
 * last kept line, falling back to the first terminator in the content and then "\n".
 *
 * The transformation is pure and idempotent.
 */
class LineTrimmer
{
public:
    explicit LineTrimmer(TrimOptions options = {});

    [[nodiscard]] TrimResult trim(std::string_view content) const;

private:
    TrimOptions options_;
};

} // namespace trim::processing
