#pragma once

#include <string>
#include <system_error>

namespace trim::driver
{

enum class TrimErrorKind
{
    TargetNotFound,
    PermissionDenied,
    InvalidEncoding,
    IoReadFailure,
    IoWriteFailure,
    StdinUnreadable // Fatal: stops the run
};

struct TrimError
{
    TrimErrorKind kind = TrimErrorKind::IoReadFailure;
    std::string target; // Display name
    std::string detail;

    // "notes.txt: target not found"
    std::string message() const;
    bool isFatal() const { return kind == TrimErrorKind::StdinUnreadable; }
};

const char* ToString(TrimErrorKind kind);

// Maps an OS error from reading a file onto an error kind.
TrimErrorKind ClassifyReadError(const std::error_code& ec);

} // namespace trim::driver
