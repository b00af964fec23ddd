#include "LocalFileSystem.hpp"

#include <cerrno>

#include <plog/Log.h>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

namespace fs = std::filesystem;

namespace trim::io
{

namespace
{
constexpr std::size_t kReadChunk = 64 * 1024;

std::error_code lastError()
{
    return std::error_code(errno, std::generic_category());
}

// Closes the descriptor on scope exit unless release() was called.
struct FdCloser
{
    int fd;

    explicit FdCloser(int f)
        : fd(f)
    {
    }

    ~FdCloser()
    {
        if (fd >= 0)
            ::close(fd);
    }

    int release()
    {
        int f = fd;
        fd = -1;
        return f;
    }
};

bool readToEnd(int fd, std::string& out, std::error_code& ec)
{
    char buffer[kReadChunk];
    for (;;)
    {
        ssize_t n = ::read(fd, buffer, sizeof(buffer));
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            ec = lastError();
            return false;
        }
        if (n == 0)
            break;
        out.append(buffer, static_cast<std::size_t>(n));
    }

    ec.clear();
    return true;
}
} // namespace

bool LocalFileSystem::readFile(const fs::path& path, std::string& out, std::error_code& ec)
{
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0)
    {
        ec = lastError();
        return false;
    }
    FdCloser closer(fd);

    struct stat st{};
    if (::fstat(fd, &st) != 0)
    {
        ec = lastError();
        return false;
    }
    if (S_ISDIR(st.st_mode))
    {
        ec = std::make_error_code(std::errc::is_a_directory);
        return false;
    }

    out.clear();
    if (st.st_size > 0)
        out.reserve(static_cast<std::size_t>(st.st_size));

    return readToEnd(fd, out, ec);
}

bool LocalFileSystem::readStdin(std::string& out, std::error_code& ec)
{
    out.clear();
    return readToEnd(STDIN_FILENO, out, ec);
}

bool LocalFileSystem::writeNewFile(const fs::path& path, std::string_view data, std::error_code& ec)
{
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0600);
    if (fd < 0)
    {
        ec = lastError();
        return false;
    }
    FdCloser closer(fd);

    std::size_t written = 0;
    while (written < data.size())
    {
        ssize_t n = ::write(fd, data.data() + written, data.size() - written);
        if (n < 0)
        {
            if (errno == EINTR)
                continue;
            ec = lastError();
            return false;
        }
        written += static_cast<std::size_t>(n);
    }

    if (::fsync(fd) != 0)
    {
        ec = lastError();
        return false;
    }

    if (::close(closer.release()) != 0)
    {
        ec = lastError();
        return false;
    }

    ec.clear();
    return true;
}

bool LocalFileSystem::rename(const fs::path& from, const fs::path& to, std::error_code& ec)
{
    fs::rename(from, to, ec);
    return !ec;
}

bool LocalFileSystem::remove(const fs::path& path, std::error_code& ec)
{
    fs::remove(path, ec);
    return !ec;
}

bool LocalFileSystem::copyPermissions(const fs::path& from, const fs::path& to, std::error_code& ec)
{
    struct stat original{};
    if (::stat(from.c_str(), &original) != 0)
    {
        ec = lastError();
        return false;
    }

    // Ownership is best effort: only a privileged user may hand the file to
    // someone else. chown runs first since it can clear the setuid bits.
    struct stat staged{};
    if (::stat(to.c_str(), &staged) != 0)
    {
        ec = lastError();
        return false;
    }
    if ((staged.st_uid != original.st_uid || staged.st_gid != original.st_gid) &&
        ::chown(to.c_str(), original.st_uid, original.st_gid) != 0)
    {
        if (errno != EPERM)
        {
            ec = lastError();
            return false;
        }
        PLOG_DEBUG << "Keeping owner of " << to.string() << ", chown not permitted";
    }

    fs::permissions(to, static_cast<fs::perms>(original.st_mode & 07777), fs::perm_options::replace, ec);
    return !ec;
}

} // namespace trim::io
