#include <catch2/catch_test_macros.hpp>

#include "processing/LineTrimmer.hpp"
#include "report/Reporter.hpp"

#include <sstream>
#include <string>

using trim::processing::LineTrimmer;
using trim::report::ReportOptions;
using trim::report::Reporter;

TEST_CASE("renderVisual - marks removed whitespace per line", "[report]")
{
    auto result = LineTrimmer().trim("ab  \ncd\n\t\n \n");
    REQUIRE(trim::report::renderVisual(result, false) == "     1|ab__\n"
                                                          "     3|_\n"
                                                          "     4|_\n");
}

TEST_CASE("renderVisual - colors the marker only", "[report]")
{
    auto result = LineTrimmer().trim("x \n");
    REQUIRE(trim::report::renderVisual(result, true) == "     1|x\x1b[41;37m_\x1b[0m\n");
}

TEST_CASE("renderSummary - per target counts", "[report]")
{
    auto result = LineTrimmer().trim("a \nb\t\n\n\n");
    REQUIRE(trim::report::renderSummary(result) == "     2 lines trimmed\n"
                                                   "     2 trailing newlines trimmed\n"
                                                   "     4 bytes saved overall\n");
}

TEST_CASE("Reporter - suppressed visual still names the target in the summary", "[report]")
{
    std::ostringstream diag;
    ReportOptions options;
    options.show_visual = false;
    Reporter reporter(diag, options);

    reporter.reportTarget("notes.txt", LineTrimmer().trim("a \n"));
    REQUIRE(diag.str() == "  file|notes.txt\n"
                          "     1 lines trimmed\n"
                          "     0 trailing newlines trimmed\n"
                          "     1 bytes saved overall\n");
}

TEST_CASE("Reporter - nothing at all when both are suppressed", "[report]")
{
    std::ostringstream diag;
    ReportOptions options;
    options.show_visual = false;
    options.show_summary = false;
    Reporter reporter(diag, options);

    reporter.reportTarget("notes.txt", LineTrimmer().trim("a \n"));
    trim::report::RunSummary summary;
    summary.targets = 3;
    reporter.reportTotals(summary);
    REQUIRE(diag.str().empty());
}

TEST_CASE("Reporter - clean content without summary prints nothing", "[report]")
{
    std::ostringstream diag;
    ReportOptions options;
    options.show_summary = false;
    Reporter reporter(diag, options);

    reporter.reportTarget("clean.txt", LineTrimmer().trim("clean\n"));
    REQUIRE(diag.str().empty());
}

TEST_CASE("Reporter - totals only for multi-target runs", "[report]")
{
    std::ostringstream diag;
    Reporter reporter(diag, ReportOptions{});

    trim::report::RunSummary single;
    single.targets = 1;
    reporter.reportTotals(single);
    REQUIRE(diag.str().empty());

    trim::report::RunSummary multi;
    multi.targets = 3;
    multi.failed = 1;
    multi.add(LineTrimmer().trim("a \n\n"));
    multi.add(LineTrimmer().trim("b"));
    reporter.reportTotals(multi);
    REQUIRE(diag.str() == " total|3 targets, 1 failed\n"
                          "     1 lines trimmed\n"
                          "     1 trailing newlines trimmed\n"
                          "     1 bytes saved overall\n");
}
