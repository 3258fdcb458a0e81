/**
 * @file object_store.hpp
 * @brief Raw object storage operations used by the storage gateway.
 */

#ifndef ORGMIRRORBACKUP_OBJECT_STORE_HPP
#define ORGMIRRORBACKUP_OBJECT_STORE_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace omb {

/// User metadata attached to a stored object.
using ObjectMetadata = std::map<std::string, std::string>;

/// What the backend reports about a stored object.
struct ObjectInfo {
  std::string key;
  std::uint64_t size{0};
  std::string last_modified;             ///< As reported by the backend
  std::optional<std::string> sha256_hex; ///< Only when the backend keeps one
  ObjectMetadata metadata;
};

/// Body of an upload, either a local file or an in-memory buffer.
struct UploadPayload {
  std::optional<std::filesystem::path> file;
  std::string bytes;
  std::string content_type{"application/octet-stream"};

  static UploadPayload from_file(std::filesystem::path path,
                                 std::string content_type =
                                     "application/gzip") {
    UploadPayload p;
    p.file = std::move(path);
    p.content_type = std::move(content_type);
    return p;
  }

  static UploadPayload from_bytes(std::string data,
                                  std::string content_type =
                                      "application/json") {
    UploadPayload p;
    p.bytes = std::move(data);
    p.content_type = std::move(content_type);
    return p;
  }
};

/**
 * Minimal object store interface.
 *
 * Implementations raise StorageError on transport or permission failures.
 */
class ObjectStore {
public:
  virtual ~ObjectStore() = default;

  /**
   * Store @p payload under @p key.
   *
   * @param sha256_hex Digest of the payload, forwarded to the backend so it
   *        can validate and retain it.
   */
  virtual void put_object(const std::string &key, const UploadPayload &payload,
                          const std::string &sha256_hex,
                          const ObjectMetadata &metadata) = 0;

  /// Object details, or std::nullopt when @p key does not exist.
  virtual std::optional<ObjectInfo> head_object(const std::string &key) = 0;

  /// Every object whose key starts with @p prefix.
  virtual std::vector<ObjectInfo> list_objects(const std::string &prefix) = 0;

  /// Human readable location of @p key, used in log messages.
  virtual std::string describe(const std::string &key) const { return key; }
};

} // namespace omb

#endif // ORGMIRRORBACKUP_OBJECT_STORE_HPP
