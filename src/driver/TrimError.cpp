#include "TrimError.hpp"

namespace trim::driver
{

std::string TrimError::message() const
{
    return target + ": " + ToString(kind);
}

const char* ToString(TrimErrorKind kind)
{
    switch (kind)
    {
    case TrimErrorKind::TargetNotFound:
        return "target not found";
    case TrimErrorKind::PermissionDenied:
        return "permission denied";
    case TrimErrorKind::InvalidEncoding:
        return "not valid UTF-8 text";
    case TrimErrorKind::IoReadFailure:
        return "read failed";
    case TrimErrorKind::IoWriteFailure:
        return "write failed";
    case TrimErrorKind::StdinUnreadable:
        return "standard input is unreadable";
    default:
        return "unknown error";
    }
}

TrimErrorKind ClassifyReadError(const std::error_code& ec)
{
    if (ec == std::errc::no_such_file_or_directory || ec == std::errc::not_a_directory)
        return TrimErrorKind::TargetNotFound;
    if (ec == std::errc::permission_denied || ec == std::errc::operation_not_permitted)
        return TrimErrorKind::PermissionDenied;
    return TrimErrorKind::IoReadFailure;
}

} // namespace trim::driver
