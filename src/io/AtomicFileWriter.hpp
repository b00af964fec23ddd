#pragma once

#include <filesystem>
#include <string>
#include <string_view>

namespace trim::io
{

class IFileSystem;

// Replaces a file's content so that readers see either the old or the new
// content, never a mix. Content is staged next to the target and renamed over it.
class AtomicFileWriter
{
public:
    explicit AtomicFileWriter(IFileSystem& fs);

    bool write(const std::filesystem::path& target, std::string_view content, std::string& outError);

    // Hidden sibling of `target`, unique per process and call
    static std::filesystem::path MakeTempPath(const std::filesystem::path& target);

private:
    IFileSystem& fs_;
};

} // namespace trim::io
