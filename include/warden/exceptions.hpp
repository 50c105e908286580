#pragma once
#include <stdexcept>
#include <string>

namespace warden
{

struct Error : public std::runtime_error
{
    using std::runtime_error::runtime_error;
};

struct ConfigError : public Error
{
    using Error::Error;
};

/// Nothing is recorded as running. Informational, not a failure.
struct NotRunningError : public Error
{
    using Error::Error;
};

/// A PID record exists but the process it names is gone.
struct StaleRecordError : public NotRunningError
{
    StaleRecordError(const std::string& message, int pid) : NotRunningError(message), pid(pid) {}

    int pid;
};

struct AlreadyRunningError : public Error
{
    AlreadyRunningError(const std::string& message, int pid) : Error(message), pid(pid) {}

    int pid;
};

struct LaunchError : public Error
{
    using Error::Error;
};

struct StopTimeoutError : public Error
{
    using Error::Error;
};

struct StopCancelledError : public Error
{
    using Error::Error;
};

struct RecordError : public Error
{
    using Error::Error;
};

/// The record lock is held by another invocation.
struct RecordBusyError : public RecordError
{
    using RecordError::RecordError;
};

} // namespace warden
