#include "errors.hpp"

namespace omb {

std::string to_string(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::ConfigurationError:
    return "configuration_error";
  case ErrorKind::HostingError:
    return "hosting_error";
  case ErrorKind::ArchiveError:
    return "archive_error";
  case ErrorKind::UploadVerificationError:
    return "upload_verification_error";
  case ErrorKind::StorageError:
    return "storage_error";
  case ErrorKind::Unexpected:
    break;
  }
  return "unexpected_error";
}

ErrorKind classify_error(const std::exception &e) {
  if (const auto *typed = dynamic_cast<const BackupError *>(&e)) {
    return typed->kind();
  }
  return ErrorKind::Unexpected;
}

} // namespace omb
