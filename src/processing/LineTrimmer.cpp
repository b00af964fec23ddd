#include "LineTrimmer.hpp"

#include <string>

namespace trim::processing
{

namespace
{
constexpr std::string_view kDefaultTerminator = "\n";

std::string_view firstTerminator(const std::vector<Line>& lines)
{
    for (const auto& line : lines)
    {
        if (!line.terminator.empty())
            return line.terminator;
    }
    return kDefaultTerminator;
}
} // namespace

bool isHorizontalWhitespace(char c) noexcept
{
    switch (c)
    {
    case ' ':
    case '\t':
    case '\v':
    case '\f':
    case '\r':
        return true;
    default:
        return false;
    }
}

std::string_view rtrim(std::string_view line) noexcept
{
    std::size_t end = line.size();
    while (end > 0 && isHorizontalWhitespace(line[end - 1]))
        --end;
    return line.substr(0, end);
}

std::vector<Line> splitLines(std::string_view content)
{
    std::vector<Line> lines;
    std::size_t start = 0;
    while (start < content.size())
    {
        std::size_t newline = content.find('\n', start);
        if (newline == std::string_view::npos)
        {
            lines.push_back(Line{ content.substr(start), {} });
            break;
        }

        std::size_t body_end = newline;
        if (body_end > start && content[body_end - 1] == '\r')
            --body_end;

        lines.push_back(Line{ content.substr(start, body_end - start),
                              content.substr(body_end, newline + 1 - body_end) });
        start = newline + 1;
    }
    return lines;
}

LineTrimmer::LineTrimmer(TrimOptions options)
    : options_(options)
{
}

TrimResult LineTrimmer::trim(std::string_view content) const
{
    TrimResult result;
    result.original_size = content.size();
    if (content.empty())
        return result;

    const auto lines = splitLines(content);
    result.total_lines = lines.size();
    result.had_trailing_newline = content.back() == '\n';

    // Everything past the last line with visible content is a trailing blank line.
    std::size_t keep = lines.size();
    while (keep > 0 && rtrim(lines[keep - 1].body).empty())
        --keep;

    std::string out;
    out.reserve(content.size() + 2);

    for (std::size_t i = 0; i < keep; ++i)
    {
        const auto& line = lines[i];
        const auto kept = rtrim(line.body);
        const std::size_t removed = line.body.size() - kept.size();
        if (removed > 0)
        {
            ++result.lines_trimmed;
            result.changes.push_back(LineChange{ i + 1, std::string(kept), removed, false });
        }

        out.append(kept);
        if (i + 1 < keep)
            out.append(line.terminator);
    }

    for (std::size_t i = keep; i < lines.size(); ++i)
    {
        ++result.trailing_lines_removed;
        result.changes.push_back(LineChange{ i + 1, std::string(), lines[i].body.size(), true });
    }

    if (!options_.suppress_newline)
    {
        std::string_view terminator = firstTerminator(lines);
        if (keep > 0 && !lines[keep - 1].terminator.empty())
            terminator = lines[keep - 1].terminator;
        out.append(terminator);
        result.ends_with_newline = true;
    }

    result.trimmed_size = out.size();
    result.content = std::move(out);
    return result;
}

} // namespace trim::processing
