#include "Application.hpp"
#include "../driver/Target.hpp"
#include "../driver/TrimDriver.hpp"
#include "../report/Reporter.hpp"

#include <utility>

#include <plog/Log.h>

namespace trim::app
{

Application::Application(config::RunOptions options, config::AppSettings settings)
    : options_(std::move(options))
    , settings_(std::move(settings))
{
}

int Application::run(io::IFileSystem& fs, std::ostream& out, std::ostream& diag, bool diag_is_terminal)
{
    report::ReportOptions report_options;
    report_options.show_visual = !options_.suppress_visual;
    report_options.show_summary = !options_.suppress_summary;
    report_options.color = settings_.color == config::ColorMode::Always ||
                           (settings_.color == config::ColorMode::Auto && diag_is_terminal);

    report::Reporter reporter(diag, report_options);
    driver::TrimDriver trim_driver(options_, fs, out, reporter);

    const auto targets = driver::ResolveTargets(options_.paths);
    PLOG_DEBUG << "Trimming " << targets.size() << " target(s)" << (options_.in_place ? " in place" : "");

    const auto summary = trim_driver.run(targets);
    if (summary.aborted)
    {
        PLOG_DEBUG << "Run aborted after " << summary.targets << " target(s)";
    }
    return summary.ok() ? kExitSuccess : kExitFailure;
}

} // namespace trim::app
