#pragma once

#include "io/LocalFileSystem.hpp"

#include <cstddef>
#include <optional>
#include <string>

namespace test_utils {

// Real filesystem access with failures injected at chosen points.
// Standard input is simulated and never touches the process's stdin.
class FaultyFileSystem : public trim::io::LocalFileSystem {
public:
    // Write this many bytes of the staged file, then fail as a full disk would
    std::optional<std::size_t> fail_write_after;
    bool fail_rename = false;
    bool fail_copy_permissions = false;

    std::string stdin_content;
    bool stdin_unreadable = false;

    int write_calls = 0;
    int rename_calls = 0;
    int stdin_reads = 0;

    bool readStdin(std::string& out, std::error_code& ec) override {
        ++stdin_reads;
        if (stdin_unreadable) {
            ec = std::make_error_code(std::errc::io_error);
            return false;
        }
        // Consumed on first read, like a pipe
        out = std::move(stdin_content);
        stdin_content.clear();
        ec.clear();
        return true;
    }

    bool writeNewFile(const std::filesystem::path& path, std::string_view data, std::error_code& ec) override {
        ++write_calls;
        if (fail_write_after && *fail_write_after < data.size()) {
            std::error_code partial_ec;
            LocalFileSystem::writeNewFile(path, data.substr(0, *fail_write_after), partial_ec);
            ec = std::make_error_code(std::errc::no_space_on_device);
            return false;
        }
        return LocalFileSystem::writeNewFile(path, data, ec);
    }

    bool rename(const std::filesystem::path& from, const std::filesystem::path& to, std::error_code& ec) override {
        ++rename_calls;
        if (fail_rename) {
            ec = std::make_error_code(std::errc::io_error);
            return false;
        }
        return LocalFileSystem::rename(from, to, ec);
    }

    bool copyPermissions(const std::filesystem::path& from, const std::filesystem::path& to,
                         std::error_code& ec) override {
        if (fail_copy_permissions) {
            ec = std::make_error_code(std::errc::operation_not_permitted);
            return false;
        }
        return LocalFileSystem::copyPermissions(from, to, ec);
    }
};

}  // namespace test_utils
