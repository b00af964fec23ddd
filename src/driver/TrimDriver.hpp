#pragma once

#include "Target.hpp"
#include "TrimError.hpp"
#include "../config/RunOptions.hpp"
#include "../processing/LineTrimmer.hpp"
#include "../report/RunSummary.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace trim::io
{
class IFileSystem;
}

namespace trim::report
{
class Reporter;
}

namespace trim::driver
{

struct TargetOutcome
{
    Target target;
    std::optional<processing::TrimResult> result;
    std::optional<TrimError> error;
    bool written_in_place = false;

    bool ok() const { return result.has_value(); }
};

/**
 * @brief Runs the trimmer over every target of a run
 *
 * Each target is read whole, validated as UTF-8, trimmed and written either to
 * the output stream (in argument order) or back to its file through
 * AtomicFileWriter. A failing file is reported and skipped; unreadable stdin
 * stops the run. The in-place flag does not apply to stdin, whose result
 * always goes to the output stream.
 */
class TrimDriver
{
public:
    TrimDriver(const config::RunOptions& options, io::IFileSystem& fs, std::ostream& out,
               report::Reporter& reporter);

    report::RunSummary run(const std::vector<Target>& targets);

    TargetOutcome process(const Target& target);

    const std::vector<TargetOutcome>& outcomes() const { return outcomes_; }

private:
    bool readTarget(const Target& target, std::string& content, TrimError& outError);
    bool writeTarget(const Target& target, const processing::TrimResult& result, bool& outInPlace,
                     TrimError& outError);
    void reportFailure(const TrimError& error);

    const config::RunOptions& options_;
    io::IFileSystem& fs_;
    std::ostream& out_;
    report::Reporter& reporter_;
    processing::LineTrimmer trimmer_;
    std::vector<TargetOutcome> outcomes_;
};

} // namespace trim::driver
