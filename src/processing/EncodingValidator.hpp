#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace trim::processing
{

struct EncodingIssue
{
    std::size_t offset = 0; // Byte offset of the first offending sequence
    std::string reason;
};

// Content must be UTF-8 text. Malformed sequences and NUL bytes are rejected.
[[nodiscard]] bool validateUtf8(std::string_view content, EncodingIssue& outIssue);

} // namespace trim::processing
