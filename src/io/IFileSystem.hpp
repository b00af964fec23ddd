#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace trim::io
{

// Filesystem seam used by the driver and the atomic writer. Tests substitute
// implementations that fail at chosen points.
class IFileSystem
{
public:
    virtual ~IFileSystem() = default;

    // Whole-file read. Directories fail with errc::is_a_directory.
    virtual bool readFile(const std::filesystem::path& path, std::string& out, std::error_code& ec) = 0;

    // Reads standard input to EOF.
    virtual bool readStdin(std::string& out, std::error_code& ec) = 0;

    // Creates a new file (must not exist), writes `data` and syncs it to disk.
    // On failure a partially written file may be left behind.
    virtual bool writeNewFile(const std::filesystem::path& path, std::string_view data, std::error_code& ec) = 0;

    virtual bool rename(const std::filesystem::path& from, const std::filesystem::path& to,
                        std::error_code& ec) = 0;

    // Removing a path that does not exist succeeds.
    virtual bool remove(const std::filesystem::path& path, std::error_code& ec) = 0;

    virtual bool copyPermissions(const std::filesystem::path& from, const std::filesystem::path& to,
                                 std::error_code& ec) = 0;
};

} // namespace trim::io
