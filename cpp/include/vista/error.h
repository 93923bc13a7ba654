#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace vista {

// ---------------------------------------------------------------------------
// Base exception
// ---------------------------------------------------------------------------

/// Base class for all vista exceptions.
class VistaError : public std::runtime_error {
public:
    explicit VistaError(const std::string& msg) : std::runtime_error(msg) {}
};

// ---------------------------------------------------------------------------
// Filter / rewrite errors
// ---------------------------------------------------------------------------

/// A filter specification could not be parsed.
/// Never retried: the caller must correct the specification.
class MalformedSpecError : public VistaError {
public:
    MalformedSpecError(const std::string& msg, size_t offset)
        : VistaError("malformed filter spec at offset " +
                     std::to_string(offset) + ": " + msg),
          offset_(offset) {}

    /// Byte offset into the specification text where parsing failed.
    size_t offset() const { return offset_; }
private:
    size_t offset_;
};

/// A filtered edit cannot be mapped back onto the unfiltered history.
class ConflictError : public VistaError {
public:
    ConflictError(const std::string& msg, const std::string& path = {})
        : VistaError("conflict: " + msg + (path.empty() ? "" : ": " + path)),
          path_(path) {}

    /// The view path that could not be mapped, or empty if not path-specific.
    const std::string& path() const { return path_; }
private:
    std::string path_;
};

/// A request exceeded its wall-clock limit. Safe to retry.
class TimeoutError : public VistaError {
public:
    explicit TimeoutError(const std::string& msg)
        : VistaError("timeout: " + msg) {}
};

/// An attempt to map an existing cache key to a different value.
/// Indicates a non-deterministic filter or a digest collision.
class CacheConsistencyViolation : public VistaError {
public:
    CacheConsistencyViolation(const std::string& key,
                              const std::string& existing,
                              const std::string& attempted)
        : VistaError("cache consistency violation for " + key + ": have " +
                     existing + ", refusing " + attempted),
          key_(key) {}

    const std::string& key() const { return key_; }
private:
    std::string key_;
};

// ---------------------------------------------------------------------------
// Store errors
// ---------------------------------------------------------------------------

/// An I/O failure reported by the object store.
/// Transient failures (e.g. a held lock) may be retried.
class StoreIoError : public VistaError {
public:
    explicit StoreIoError(const std::string& msg, bool transient = false)
        : VistaError(msg), transient_(transient) {}

    bool transient() const { return transient_; }
private:
    bool transient_;
};

/// A low-level libgit2 operation failed.
class GitError : public StoreIoError {
public:
    explicit GitError(const std::string& msg, bool transient = false)
        : StoreIoError("git error: " + msg, transient) {}
};

/// A filesystem I/O error occurred.
class IoError : public StoreIoError {
public:
    explicit IoError(const std::string& msg, bool transient = false)
        : StoreIoError("io error: " + msg, transient) {}
};

/// A reference, object or repository was not found.
class NotFoundError : public VistaError {
public:
    explicit NotFoundError(const std::string& what)
        : VistaError("not found: " + what), what_(what) {}
    const std::string& name() const { return what_; }
private:
    std::string what_;
};

/// A reference moved between the time it was read and a compare-and-swap.
class StaleRefError : public VistaError {
public:
    explicit StaleRefError(const std::string& ref)
        : VistaError("stale ref: " + ref + " has moved"), ref_(ref) {}
    const std::string& ref() const { return ref_; }
private:
    std::string ref_;
};

/// A path contains invalid segments (`..`, etc.).
class InvalidPathError : public VistaError {
public:
    explicit InvalidPathError(const std::string& msg)
        : VistaError("invalid path: " + msg) {}
};

/// An object id string is not a valid 40-char lowercase hex SHA.
class InvalidHashError : public VistaError {
public:
    explicit InvalidHashError(const std::string& hash)
        : VistaError("invalid hash: " + hash) {}
};

/// A ref name violates git's naming rules.
class InvalidRefNameError : public VistaError {
public:
    explicit InvalidRefNameError(const std::string& msg)
        : VistaError("invalid ref name: " + msg) {}
};

} // namespace vista
