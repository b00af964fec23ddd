#pragma once

#include <filesystem>
#include <system_error>

namespace trim::io
{

class IFileSystem;

/**
 * @brief Scoped ownership of a staged temporary file
 *
 * The file is either renamed over its destination by commit() or removed when
 * the guard goes out of scope, on every exit path.
 */
class TempFileGuard
{
public:
    TempFileGuard(IFileSystem& fs, std::filesystem::path temp_path);
    ~TempFileGuard();

    TempFileGuard(const TempFileGuard&) = delete;
    TempFileGuard& operator=(const TempFileGuard&) = delete;

    // Atomically replaces `target` with the staged file.
    bool commit(const std::filesystem::path& target, std::error_code& ec);

    const std::filesystem::path& path() const { return temp_path_; }
    bool committed() const { return committed_; }

private:
    IFileSystem& fs_;
    std::filesystem::path temp_path_;
    bool committed_ = false;
};

} // namespace trim::io
