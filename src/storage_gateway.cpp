#include "storage_gateway.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <spdlog/spdlog.h>

namespace omb {

namespace {

std::shared_ptr<spdlog::logger> storage_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("storage");
  }();
  return logger;
}

} // namespace

std::string normalize_prefix(const std::string &prefix) {
  std::string out = prefix;
  while (!out.empty() && out.back() == '/')
    out.pop_back();
  while (!out.empty() && out.front() == '/')
    out.erase(0, 1);
  if (out.empty())
    return {};
  return out + "/";
}

StorageGateway::StorageGateway(std::shared_ptr<ObjectStore> store,
                               const std::string &prefix)
    : store_(std::move(store)), prefix_(normalize_prefix(prefix)) {}

std::string StorageGateway::archive_key(const std::string &name,
                                        const BackupDate &date) const {
  return prefix_ + name + "/" + name + "-" + date.compact() + ".tar.gz";
}

std::string StorageGateway::issues_key(const std::string &name,
                                       const BackupDate &date) const {
  return prefix_ + name + "/" + name + "-issues-" + date.compact() + ".json";
}

UploadResult StorageGateway::upload(const std::string &key,
                                    const UploadPayload &payload,
                                    const ObjectMetadata &metadata) {
  ContentDigest digest;
  try {
    digest = payload.file ? sha256_file(*payload.file)
                          : sha256_bytes(payload.bytes);
  } catch (const std::runtime_error &e) {
    throw StorageError("Cannot hash payload for " + describe(key) + ": " +
                       e.what());
  }

  store_->put_object(key, payload, digest.sha256_hex, metadata);

  auto stored = store_->head_object(key);
  if (!stored) {
    storage_log()->error("Upload verification failed: {} missing after put",
                         describe(key));
    throw UploadVerificationError("Object " + describe(key) +
                                  " not found after upload");
  }
  if (stored->size != digest.size_bytes) {
    storage_log()->error("Size mismatch for {}: stored={} bytes, local={} bytes",
                         describe(key), stored->size, digest.size_bytes);
    throw UploadVerificationError(
        "Size mismatch for " + describe(key) + ": stored " +
        std::to_string(stored->size) + " bytes, local " +
        std::to_string(digest.size_bytes) + " bytes");
  }
  if (stored->sha256_hex && *stored->sha256_hex != digest.sha256_hex) {
    storage_log()->error("Checksum mismatch for {}: stored={}, local={}",
                         describe(key), *stored->sha256_hex,
                         digest.sha256_hex);
    throw UploadVerificationError("Checksum mismatch for " + describe(key));
  }
  storage_log()->info("Successfully uploaded and verified: {} ({} bytes)",
                      describe(key), digest.size_bytes);
  return {key, digest.size_bytes, digest.sha256_hex};
}

bool StorageGateway::backup_exists(const std::string &name,
                                   const BackupDate &date) {
  return store_->head_object(archive_key(name, date)).has_value();
}

bool StorageGateway::issues_export_exists(const std::string &name,
                                          const BackupDate &date) {
  return store_->head_object(issues_key(name, date)).has_value();
}

std::vector<StoredBackup> StorageGateway::list_backups(const std::string &name) {
  std::vector<StoredBackup> backups;
  for (const auto &obj : store_->list_objects(prefix_ + name + "/")) {
    backups.push_back({obj.key, obj.size, obj.last_modified});
  }
  storage_log()->info("Found {} backups for repository: {}", backups.size(),
                      name);
  return backups;
}

} // namespace omb
