#include "TrimDriver.hpp"
#include "../io/AtomicFileWriter.hpp"
#include "../io/IFileSystem.hpp"
#include "../processing/EncodingValidator.hpp"
#include "../report/Reporter.hpp"
#include "../utils/ErrorReporter.hpp"

#include <system_error>

#include <plog/Log.h>

namespace trim::driver
{

namespace
{
utils::ErrorCategory categoryFor(TrimErrorKind kind)
{
    switch (kind)
    {
    case TrimErrorKind::InvalidEncoding:
        return utils::ErrorCategory::Encoding;
    case TrimErrorKind::IoWriteFailure:
        return utils::ErrorCategory::Output;
    default:
        return utils::ErrorCategory::Input;
    }
}
} // namespace

TrimDriver::TrimDriver(const config::RunOptions& options, io::IFileSystem& fs, std::ostream& out,
                       report::Reporter& reporter)
    : options_(options)
    , fs_(fs)
    , out_(out)
    , reporter_(reporter)
    , trimmer_(processing::TrimOptions{ options.suppress_newline })
{
}

report::RunSummary TrimDriver::run(const std::vector<Target>& targets)
{
    report::RunSummary summary;
    outcomes_.clear();
    outcomes_.reserve(targets.size());

    for (const auto& target : targets)
    {
        ++summary.targets;
        auto outcome = process(target);
        if (outcome.ok())
        {
            summary.add(*outcome.result);
        }
        else
        {
            ++summary.failed;
            if (outcome.error && outcome.error->isFatal())
            {
                summary.aborted = true;
                outcomes_.push_back(std::move(outcome));
                break;
            }
        }
        outcomes_.push_back(std::move(outcome));
    }

    out_.flush();
    reporter_.reportTotals(summary);
    return summary;
}

TargetOutcome TrimDriver::process(const Target& target)
{
    TargetOutcome outcome{ target, std::nullopt, std::nullopt, false };
    TrimError error;

    std::string content;
    if (!readTarget(target, content, error))
    {
        reportFailure(error);
        outcome.error = std::move(error);
        return outcome;
    }

    processing::EncodingIssue issue;
    if (!processing::validateUtf8(content, issue))
    {
        error = TrimError{ TrimErrorKind::InvalidEncoding, target.displayName(),
                           issue.reason + " at byte " + std::to_string(issue.offset) };
        reportFailure(error);
        outcome.error = std::move(error);
        return outcome;
    }

    auto result = trimmer_.trim(content);
    PLOG_DEBUG << target.displayName() << ": " << result.original_size << " -> " << result.trimmed_size
               << " bytes, " << result.lines_trimmed << " lines trimmed";

    if (!writeTarget(target, result, outcome.written_in_place, error))
    {
        reportFailure(error);
        outcome.error = std::move(error);
        return outcome;
    }

    reporter_.reportTarget(target.displayName(), result);
    outcome.result = std::move(result);
    return outcome;
}

bool TrimDriver::readTarget(const Target& target, std::string& content, TrimError& outError)
{
    std::error_code ec;
    if (target.isStdin())
    {
        // A repeated "-" reads whatever is left, usually nothing.
        if (!fs_.readStdin(content, ec))
        {
            outError = TrimError{ TrimErrorKind::StdinUnreadable, target.displayName(), ec.message() };
            return false;
        }
        return true;
    }

    if (!fs_.readFile(target.path(), content, ec))
    {
        outError = TrimError{ ClassifyReadError(ec), target.displayName(), ec.message() };
        return false;
    }
    return true;
}

bool TrimDriver::writeTarget(const Target& target, const processing::TrimResult& result, bool& outInPlace,
                             TrimError& outError)
{
    outInPlace = false;

    if (options_.in_place && target.isStdin())
    {
        PLOG_WARNING << "--in-place has no effect on " << target.displayName() << ", writing to standard output";
    }

    if (options_.in_place && !target.isStdin())
    {
        outInPlace = true;
        if (!result.changed())
        {
            PLOG_DEBUG << target.displayName() << " is already trimmed, leaving it untouched";
            return true;
        }

        io::AtomicFileWriter writer(fs_);
        std::string detail;
        if (!writer.write(target.path(), result.content, detail))
        {
            outError = TrimError{ TrimErrorKind::IoWriteFailure, target.displayName(), detail };
            return false;
        }
        return true;
    }

    out_.write(result.content.data(), static_cast<std::streamsize>(result.content.size()));
    if (!out_)
    {
        outError = TrimError{ TrimErrorKind::IoWriteFailure, target.displayName(),
                              "could not write to standard output" };
        return false;
    }
    return true;
}

void TrimDriver::reportFailure(const TrimError& error)
{
    if (error.isFatal())
        utils::ErrorReporter::ReportFatal(categoryFor(error.kind), error.message(), error.detail);
    else
        utils::ErrorReporter::ReportError(categoryFor(error.kind), error.message(), error.detail);
}

} // namespace trim::driver
