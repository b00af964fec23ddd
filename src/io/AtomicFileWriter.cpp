#include "AtomicFileWriter.hpp"
#include "IFileSystem.hpp"
#include "TempFileGuard.hpp"

#include <atomic>
#include <system_error>

#include <plog/Log.h>
#include <unistd.h>

namespace trim::io
{

namespace
{
std::atomic<unsigned> g_temp_counter{ 0 };
}

AtomicFileWriter::AtomicFileWriter(IFileSystem& fs)
    : fs_(fs)
{
}

std::filesystem::path AtomicFileWriter::MakeTempPath(const std::filesystem::path& target)
{
    const unsigned seq = g_temp_counter.fetch_add(1, std::memory_order_relaxed);
    std::string name = "." + target.filename().string() + ".trim-" + std::to_string(::getpid()) + "-" +
                       std::to_string(seq) + ".tmp";
    return target.parent_path() / name;
}

bool AtomicFileWriter::write(const std::filesystem::path& target, std::string_view content, std::string& outError)
{
    std::error_code ec;

    // Replace the file a symlink points at, not the link itself.
    std::filesystem::path destination = target;
    if (std::filesystem::is_symlink(target, ec))
    {
        destination = std::filesystem::canonical(target, ec);
        if (ec)
        {
            outError = "could not resolve symlink: " + ec.message();
            return false;
        }
    }

    TempFileGuard guard(fs_, MakeTempPath(destination));

    if (!fs_.writeNewFile(guard.path(), content, ec))
    {
        outError = "could not stage " + guard.path().string() + ": " + ec.message();
        return false;
    }

    if (!fs_.copyPermissions(destination, guard.path(), ec))
    {
        outError = "could not copy permissions: " + ec.message();
        return false;
    }

    if (!guard.commit(destination, ec))
    {
        outError = "could not replace file: " + ec.message();
        return false;
    }

    PLOG_DEBUG << "Replaced " << destination.string() << " (" << content.size() << " bytes)";
    return true;
}

} // namespace trim::io
