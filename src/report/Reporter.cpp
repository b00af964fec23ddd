#include "Reporter.hpp"

#include <iomanip>
#include <sstream>

namespace trim::report
{

namespace
{
constexpr int kGutterWidth = 6;
constexpr char kMarkerChar = '_';
constexpr const char* kMarkerStyle = "\x1b[41;37m"; // white on red
constexpr const char* kResetStyle = "\x1b[0m";

void appendMarker(std::ostringstream& ss, std::size_t length, bool color)
{
    if (length == 0)
        return;
    if (color)
        ss << kMarkerStyle;
    ss << std::string(length, kMarkerChar);
    if (color)
        ss << kResetStyle;
}

void appendCount(std::ostringstream& ss, long long value, const char* label)
{
    ss << std::setw(kGutterWidth) << value << ' ' << label << '\n';
}
} // namespace

std::string renderVisual(const processing::TrimResult& result, bool color)
{
    std::ostringstream ss;
    for (const auto& change : result.changes)
    {
        ss << std::setw(kGutterWidth) << change.line_number << '|' << change.kept;
        appendMarker(ss, change.removed, color);
        ss << '\n';
    }
    return ss.str();
}

std::string renderSummary(const processing::TrimResult& result)
{
    std::ostringstream ss;
    appendCount(ss, static_cast<long long>(result.lines_trimmed), "lines trimmed");
    appendCount(ss, static_cast<long long>(result.trailing_lines_removed), "trailing newlines trimmed");
    appendCount(ss, static_cast<long long>(result.bytesSaved()), "bytes saved overall");
    return ss.str();
}

std::string renderTotals(const RunSummary& summary)
{
    std::ostringstream ss;
    ss << std::setw(kGutterWidth) << "total" << '|' << summary.targets << " targets, " << summary.failed
       << " failed\n";
    appendCount(ss, static_cast<long long>(summary.lines_trimmed), "lines trimmed");
    appendCount(ss, static_cast<long long>(summary.trailing_lines_removed), "trailing newlines trimmed");
    appendCount(ss, static_cast<long long>(summary.bytes_saved), "bytes saved overall");
    return ss.str();
}

Reporter::Reporter(std::ostream& out, ReportOptions options)
    : out_(out)
    , options_(options)
{
}

void Reporter::reportTarget(std::string_view name, const processing::TrimResult& result)
{
    const bool visual = options_.show_visual && !result.changes.empty();
    if (!visual && !options_.show_summary)
        return;

    out_ << std::setw(kGutterWidth) << "file" << '|' << name << '\n';
    if (visual)
        out_ << renderVisual(result, options_.color);
    if (options_.show_summary)
        out_ << renderSummary(result);
    out_.flush();
}

void Reporter::reportTotals(const RunSummary& summary)
{
    if (!options_.show_summary || summary.targets < 2)
        return;
    out_ << renderTotals(summary);
    out_.flush();
}

} // namespace trim::report
