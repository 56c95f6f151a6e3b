#pragma once

#include <stdexcept>
#include <string>

namespace mds {

struct Error : std::runtime_error {
    using std::runtime_error::runtime_error;
};

// Invalid or missing directories, config already present without --force.
struct SetupError : Error {
    using Error::Error;
};

struct NotInitializedError : SetupError {
    using SetupError::SetupError;
};

struct SyncInProgressError : Error {
    using Error::Error;
};

struct ConfigError : Error {
    using Error::Error;
};

// Remote store unreachable. Fatal for the whole run.
struct RemoteError : Error {
    using Error::Error;
};

struct RemoteAuthError : RemoteError {
    using RemoteError::RemoteError;
};

// Per-document failures, recovered by the executor.
struct TransferError : Error {
    using Error::Error;
};

struct ConversionError : Error {
    using Error::Error;
};

struct ProcessError : Error {
    using Error::Error;
};

struct ProcessTimeout : ProcessError {
    using ProcessError::ProcessError;
};

struct PersistenceError : Error {
    using Error::Error;
};

struct TimestampError : Error {
    using Error::Error;
};

}
