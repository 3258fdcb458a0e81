/**
 * @file storage_gateway.hpp
 * @brief Backup key layout and verified uploads on top of an ObjectStore.
 */

#ifndef ORGMIRRORBACKUP_STORAGE_GATEWAY_HPP
#define ORGMIRRORBACKUP_STORAGE_GATEWAY_HPP

#include "backup_date.hpp"
#include "object_store.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace omb {

/// Outcome of a verified upload.
struct UploadResult {
  std::string key;
  std::uint64_t size_bytes{0};
  std::string checksum; ///< SHA-256 hex of the local payload
};

/// Entry returned by StorageGateway::list_backups().
struct StoredBackup {
  std::string key;
  std::uint64_t size{0};
  std::string last_modified;
};

/**
 * Maps repositories and dates to object keys and guarantees that a
 * successful upload is byte-for-byte what was produced locally.
 *
 * Keys look like `{prefix}{name}/{name}-{YYYYMMDD}.tar.gz` and
 * `{prefix}{name}/{name}-issues-{YYYYMMDD}.json`.
 */
class StorageGateway {
public:
  /**
   * @param store Object store performing raw I/O.
   * @param prefix Key prefix; normalised to end with a single `/` unless
   *        empty.
   */
  StorageGateway(std::shared_ptr<ObjectStore> store, const std::string &prefix);

  /// Normalised key prefix.
  const std::string &prefix() const { return prefix_; }

  std::string archive_key(const std::string &name, const BackupDate &date) const;
  std::string issues_key(const std::string &name, const BackupDate &date) const;

  /**
   * Upload @p payload to @p key and verify what the store reports back.
   *
   * @throws UploadVerificationError When the stored object is missing or
   *         its size or SHA-256 differ from the local payload.
   * @throws StorageError On transport failures.
   */
  UploadResult upload(const std::string &key, const UploadPayload &payload,
                      const ObjectMetadata &metadata);

  /// Whether the archive of @p name for @p date is stored (HEAD request).
  bool backup_exists(const std::string &name, const BackupDate &date);

  /// Whether the issue export of @p name for @p date is stored.
  bool issues_export_exists(const std::string &name, const BackupDate &date);

  /// All objects stored for repository @p name.
  std::vector<StoredBackup> list_backups(const std::string &name);

  /// Location string of @p key for log output.
  std::string describe(const std::string &key) const {
    return store_->describe(key);
  }

private:
  std::shared_ptr<ObjectStore> store_;
  std::string prefix_;
};

/// Normalise a key prefix to `""` or `something/`.
std::string normalize_prefix(const std::string &prefix);

} // namespace omb

#endif // ORGMIRRORBACKUP_STORAGE_GATEWAY_HPP
