#pragma once

#include <stdexcept>
#include <string>

namespace hs {

/// Base of every error this library raises on purpose.
class SessionError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

/// The backing store cannot be reached at all (open failure, quota,
/// permission, I/O).  Always recovered locally by EntityStore.
class StorageUnavailable : public SessionError {
public:
    using SessionError::SessionError;
};

/// A stored record does not have the expected shape.
/// Always recovered locally: the record is treated as absent.
class DecodeFailure : public SessionError {
public:
    using SessionError::SessionError;
};

/// A Media record exists but its Transcript or HighlightSet does not.
/// Surfaced to the caller of SessionRestoreService.
class IncompleteSessionDataError : public SessionError {
public:
    using SessionError::SessionError;
};

/// A cleanup transaction did not commit.  Nothing was deleted.
class CleanupError : public SessionError {
public:
    using SessionError::SessionError;
};

} // namespace hs
