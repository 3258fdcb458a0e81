/**
 * @file errors.hpp
 * @brief Error kinds and exception types used across orgmirrorbackup.
 *
 * Per-repository failures are raised as one of the BackupError subclasses and
 * classified into an ErrorKind by the orchestrator before being recorded.
 */

#ifndef ORGMIRRORBACKUP_ERRORS_HPP
#define ORGMIRRORBACKUP_ERRORS_HPP

#include <exception>
#include <stdexcept>
#include <string>

namespace omb {

/// Classification of failures recorded against a repository or a cycle.
enum class ErrorKind {
  ConfigurationError,      ///< Invalid configuration, fatal before any I/O.
  HostingError,            ///< Hosting API authentication/network failure.
  ArchiveError,            ///< Clone or packaging failure.
  UploadVerificationError, ///< Stored object does not match local bytes.
  StorageError,            ///< Object storage transport failure.
  Unexpected               ///< Any other exception.
};

/// Lowercase snake-case label for an error kind.
std::string to_string(ErrorKind kind);

/// Base class of all typed backup failures.
class BackupError : public std::runtime_error {
public:
  BackupError(ErrorKind kind, const std::string &message)
      : std::runtime_error(message), kind_(kind) {}

  /// Classification carried by the exception.
  ErrorKind kind() const noexcept { return kind_; }

private:
  ErrorKind kind_;
};

/// Invalid regex, missing required field or out-of-range value.
class ConfigurationError : public BackupError {
public:
  explicit ConfigurationError(const std::string &message)
      : BackupError(ErrorKind::ConfigurationError, message) {}
};

/// Failure talking to the source-control hosting API.
class HostingError : public BackupError {
public:
  explicit HostingError(const std::string &message, int status = 0)
      : BackupError(ErrorKind::HostingError, message), status_(status) {}

  /// HTTP status that caused the failure, 0 for transport errors.
  int status() const noexcept { return status_; }

private:
  int status_;
};

/// Mirror clone or archive packaging failed.
class ArchiveError : public BackupError {
public:
  explicit ArchiveError(const std::string &message)
      : BackupError(ErrorKind::ArchiveError, message) {}
};

/// Uploaded object size or checksum differs from the local payload.
class UploadVerificationError : public BackupError {
public:
  explicit UploadVerificationError(const std::string &message)
      : BackupError(ErrorKind::UploadVerificationError, message) {}
};

/// Object storage request failed before verification could happen.
class StorageError : public BackupError {
public:
  explicit StorageError(const std::string &message)
      : BackupError(ErrorKind::StorageError, message) {}
};

/// Network failure that may succeed when retried.
class TransientNetworkError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

/// Non-success HTTP status returned by a remote endpoint.
class HttpStatusError : public std::runtime_error {
public:
  HttpStatusError(int status_code, const std::string &message)
      : std::runtime_error(message), status(status_code) {}

  int status; ///< HTTP status code
};

/**
 * Classify an exception into an ErrorKind.
 *
 * @param e Exception caught at a per-repository boundary.
 * @return Kind carried by a BackupError, otherwise ErrorKind::Unexpected.
 */
ErrorKind classify_error(const std::exception &e);

} // namespace omb

#endif // ORGMIRRORBACKUP_ERRORS_HPP
