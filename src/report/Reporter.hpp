#pragma once

#include "RunSummary.hpp"
#include "../processing/TrimTypes.hpp"

#include <ostream>
#include <string>
#include <string_view>

namespace trim::report
{

struct ReportOptions
{
    bool show_visual = true;
    bool show_summary = true;
    bool color = false; // ANSI background on the removed-whitespace marker
};

/// Rows of the form "    12|kept text____", one per changed line.
[[nodiscard]] std::string renderVisual(const processing::TrimResult& result, bool color);

/// Per-target counts.
[[nodiscard]] std::string renderSummary(const processing::TrimResult& result);

/// Counts over the whole run.
[[nodiscard]] std::string renderTotals(const RunSummary& summary);

// Writes the visualization and summaries to a diagnostic stream. Never touches
// the trimmed output.
class Reporter
{
public:
    Reporter(std::ostream& out, ReportOptions options);

    void reportTarget(std::string_view name, const processing::TrimResult& result);
    void reportTotals(const RunSummary& summary);

private:
    std::ostream& out_;
    ReportOptions options_;
};

} // namespace trim::report
