#pragma once

#include "IFileSystem.hpp"

namespace trim::io
{

// POSIX implementation of IFileSystem.
class LocalFileSystem : public IFileSystem
{
public:
    bool readFile(const std::filesystem::path& path, std::string& out, std::error_code& ec) override;
    bool readStdin(std::string& out, std::error_code& ec) override;
    bool writeNewFile(const std::filesystem::path& path, std::string_view data, std::error_code& ec) override;
    bool rename(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) override;
    bool remove(const std::filesystem::path& path, std::error_code& ec) override;
    bool copyPermissions(const std::filesystem::path& from, const std::filesystem::path& to,
                         std::error_code& ec) override;
};

} // namespace trim::io
