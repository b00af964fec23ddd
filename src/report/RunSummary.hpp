#pragma once

#include "../processing/TrimTypes.hpp"

#include <cstddef>
#include <cstdint>

namespace trim::report
{

// Totals over every target of a run.
struct RunSummary
{
    std::size_t targets = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    std::size_t lines_trimmed = 0;
    std::size_t trailing_lines_removed = 0;
    std::int64_t bytes_saved = 0;
    bool aborted = false; // stdin was unreadable, remaining targets skipped

    void add(const processing::TrimResult& result)
    {
        ++succeeded;
        lines_trimmed += result.lines_trimmed;
        trailing_lines_removed += result.trailing_lines_removed;
        bytes_saved += result.bytesSaved();
    }

    [[nodiscard]] bool ok() const { return failed == 0 && !aborted; }
};

} // namespace trim::report
