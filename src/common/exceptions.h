#ifndef CLAIMSTONE_SRC_COMMON_EXCEPTIONS_H_
#define CLAIMSTONE_SRC_COMMON_EXCEPTIONS_H_

#include <stdexcept>
#include <string>

namespace Claimstone {

// Base for every error raised by the storage, lock and uniqueness layers.
class ClaimstoneException : public std::runtime_error {
public:
    explicit ClaimstoneException(const std::string& what) : std::runtime_error(what) {}
};

// The storage client could not complete a read or a batch write, e.g. not
// enough replicas were available for the requested consistency level.
class StorageException : public ClaimstoneException {
public:
    explicit StorageException(const std::string& what) : ClaimstoneException(what) {}
};

// Another valid, unexpired claim already exists on the row.
class BusyLockException : public ClaimstoneException {
public:
    explicit BusyLockException(const std::string& what) : ClaimstoneException(what) {}
};

// The claim was superseded (or found an expired leftover claim while running
// with fail_on_stale_lock) before it could be verified.
class StaleLockException : public ClaimstoneException {
public:
    explicit StaleLockException(const std::string& what) : ClaimstoneException(what) {}
};

/**
 * Raised to callers of the uniqueness constraint when any participating row
 * reported a busy or stale claim. Probes written by the failed attempt have
 * already been released when this is thrown.
 */
class NotUniqueException : public ClaimstoneException {
public:
    NotUniqueException(const std::string& row, const std::string& reason)
        : ClaimstoneException("Row '" + row + "' is not unique: " + reason),
          row_(row), reason_(reason) {}

    const std::string& row() const { return row_; }
    const std::string& reason() const { return reason_; }

private:
    std::string row_;
    std::string reason_;
};

} // namespace Claimstone

#endif // CLAIMSTONE_SRC_COMMON_EXCEPTIONS_H_
