/**
 * @file s3_object_store.hpp
 * @brief ObjectStore backed by the S3 REST API.
 */

#ifndef ORGMIRRORBACKUP_S3_OBJECT_STORE_HPP
#define ORGMIRRORBACKUP_S3_OBJECT_STORE_HPP

#include "http_client.hpp"
#include "object_store.hpp"

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace omb {

/// Target bucket of an S3-compatible service.
struct S3Location {
  std::string bucket;
  std::string region{"us-east-1"};
  /// Path-style endpoint override such as `http://localhost:9000`. When
  /// empty the AWS virtual-hosted endpoint of @ref region is used.
  std::string endpoint;
};

/**
 * When and how payloads are split into a multipart upload. S3 rejects single
 * PUTs above 5 GiB and parts below 5 MiB (except the last one).
 */
struct MultipartSettings {
  std::uint64_t threshold{64ULL << 20}; ///< Larger payloads use multipart
  std::uint64_t part_size{64ULL << 20}; ///< Grown to stay within 10000 parts
};

/// One uploaded part of a multipart upload.
struct UploadedPart {
  int number{0};
  std::string etag;
  std::string checksum_sha256; ///< base64
};

/// One page of a ListObjectsV2 response.
struct ListObjectsPage {
  std::vector<ObjectInfo> objects;
  std::string next_continuation_token; ///< Empty on the last page
};

/**
 * Decode a ListObjectsV2 XML document.
 *
 * @throws StorageError When the document is not a ListBucketResult.
 */
ListObjectsPage parse_list_objects(const std::string &xml);

/**
 * Extract the upload id of an InitiateMultipartUploadResult document.
 *
 * @throws StorageError When the document carries no upload id.
 */
std::string parse_upload_id(const std::string &xml);

/// Body of a CompleteMultipartUpload request listing @p parts in order.
std::string render_complete_multipart(const std::vector<UploadedPart> &parts);

/// Percent-encode @p value per RFC 3986, keeping `/` when @p keep_slash.
std::string uri_encode(const std::string &value, bool keep_slash);

/**
 * S3 object store using libcurl with SigV4 signing.
 *
 * Uploads carry `x-amz-checksum-sha256` so that the service validates the
 * body and keeps the digest; HEAD requests ask for it back with
 * `x-amz-checksum-mode: ENABLED`.
 *
 * Payloads above MultipartSettings::threshold go up as a multipart upload
 * with a SHA-256 checksum per part. S3 then only keeps a composite
 * checksum, so the whole-object digest is also stored as `x-amz-meta-sha256`
 * and reported by head_object(). A failed multipart upload is aborted.
 */
class S3ObjectStore : public ObjectStore {
public:
  /**
   * @param location Bucket, region and optional endpoint.
   * @param http Transport; must sign requests for private buckets.
   * @param multipart Size limits for multipart uploads.
   */
  S3ObjectStore(S3Location location, std::unique_ptr<HttpClient> http,
                MultipartSettings multipart = {});

  void put_object(const std::string &key, const UploadPayload &payload,
                  const std::string &sha256_hex,
                  const ObjectMetadata &metadata) override;

  std::optional<ObjectInfo> head_object(const std::string &key) override;

  std::vector<ObjectInfo> list_objects(const std::string &prefix) override;

  std::string describe(const std::string &key) const override;

  /// URL addressing @p key.
  std::string object_url(const std::string &key) const;

  const S3Location &location() const { return location_; }

private:
  std::string bucket_url() const;
  void put_multipart(const std::string &key, const UploadPayload &payload,
                     std::uint64_t size, const std::string &sha256_hex,
                     std::vector<std::string> headers);
  void abort_multipart(const std::string &key, const std::string &upload_id);

  S3Location location_;
  std::unique_ptr<HttpClient> http_;
  MultipartSettings multipart_;
};

} // namespace omb

#endif // ORGMIRRORBACKUP_S3_OBJECT_STORE_HPP
