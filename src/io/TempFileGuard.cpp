#include "TempFileGuard.hpp"
#include "IFileSystem.hpp"

#include <utility>

#include <plog/Log.h>

namespace trim::io
{

TempFileGuard::TempFileGuard(IFileSystem& fs, std::filesystem::path temp_path)
    : fs_(fs)
    , temp_path_(std::move(temp_path))
{
}

TempFileGuard::~TempFileGuard()
{
    if (committed_)
        return;

    std::error_code ec;
    if (!fs_.remove(temp_path_, ec))
    {
        PLOG_WARNING << "Could not remove temporary file " << temp_path_.string() << ": " << ec.message();
    }
}

bool TempFileGuard::commit(const std::filesystem::path& target, std::error_code& ec)
{
    if (committed_)
        return true;
    if (!fs_.rename(temp_path_, target, ec))
        return false;
    committed_ = true;
    return true;
}

} // namespace trim::io
