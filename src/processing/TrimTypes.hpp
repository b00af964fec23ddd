#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace trim::processing
{

// One line of input. `terminator` is "\n", "\r\n" or empty for a final
// unterminated line. Both views point into the content that was split.
struct Line
{
    std::string_view body;
    std::string_view terminator;
};

// A line whose trailing whitespace was removed, or a trailing blank line
// that was dropped altogether.
struct LineChange
{
    std::size_t line_number = 0; // 1-based
    std::string kept;            // Text left on the line after trimming
    std::size_t removed = 0;     // Bytes of trailing whitespace removed
    bool dropped = false;        // Line was a trailing blank line
};

struct TrimOptions
{
    bool suppress_newline = false; // Omit the newline after the last line
};

struct TrimResult
{
    std::string content;                 // Trimmed output
    std::vector<LineChange> changes;     // In line order

    std::size_t total_lines = 0;
    std::size_t lines_trimmed = 0;       // Kept lines that lost trailing whitespace
    std::size_t trailing_lines_removed = 0;
    bool had_trailing_newline = false;
    bool ends_with_newline = false;

    std::size_t original_size = 0;
    std::size_t trimmed_size = 0;

    // Negative when a newline had to be appended.
    [[nodiscard]] std::int64_t bytesSaved() const
    {
        return static_cast<std::int64_t>(original_size) - static_cast<std::int64_t>(trimmed_size);
    }

    [[nodiscard]] bool changed() const { return !changes.empty() || original_size != trimmed_size; }
};

} // namespace trim::processing
