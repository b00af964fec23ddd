#pragma once

#include <plog/Record.h>
#include <plog/Util.h>

namespace trim::log
{

// Formatter for the stderr appender: "trim: error: notes.txt: target not found".
// File logs keep plog's TxtFormatter.
struct CliFormatter
{
    static plog::util::nstring header()
    {
        return plog::util::nstring();
    }

    static plog::util::nstring format(const plog::Record& record)
    {
        plog::util::nostringstream ss;
        ss << PLOG_NSTR("trim: ") << severityLabel(record.getSeverity()) << PLOG_NSTR(": ") << record.getMessage()
           << PLOG_NSTR("\n");
        return ss.str();
    }

    static const plog::util::nchar* severityLabel(plog::Severity severity)
    {
        switch (severity)
        {
        case plog::fatal:
            return PLOG_NSTR("fatal");
        case plog::error:
            return PLOG_NSTR("error");
        case plog::warning:
            return PLOG_NSTR("warning");
        case plog::info:
            return PLOG_NSTR("info");
        case plog::debug:
            return PLOG_NSTR("debug");
        default:
            return PLOG_NSTR("trace");
        }
    }
};

} // namespace trim::log
