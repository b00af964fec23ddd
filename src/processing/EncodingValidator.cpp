#include "EncodingValidator.hpp"

#include <utf8proc.h>

namespace trim::processing
{

bool validateUtf8(std::string_view content, EncodingIssue& outIssue)
{
    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(content.data());
    const auto len = static_cast<utf8proc_ssize_t>(content.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint = 0;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            outIssue.offset = static_cast<std::size_t>(pos);
            outIssue.reason = utf8proc_errmsg(bytes == 0 ? UTF8PROC_ERROR_INVALIDUTF8 : bytes);
            return false;
        }
        if (codepoint == 0)
        {
            outIssue.offset = static_cast<std::size_t>(pos);
            outIssue.reason = "NUL byte in content";
            return false;
        }
        pos += bytes;
    }
    return true;
}

} // namespace trim::processing
