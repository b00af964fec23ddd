#pragma once

#include <string>
#include <vector>

namespace trim::config
{

// Built once from the command line and passed down by const reference.
struct RunOptions
{
    bool in_place = false;
    bool suppress_newline = false;
    bool suppress_summary = false;
    bool suppress_visual = false;
    std::vector<std::string> paths; // "-" is stdin; empty means stdin
};

} // namespace trim::config
