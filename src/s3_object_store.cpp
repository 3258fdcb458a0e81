#include "s3_object_store.hpp"
#include "checksum.hpp"
#include "errors.hpp"
#include "log.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <spdlog/spdlog.h>
#include <tinyxml2.h>

namespace omb {

namespace {

std::shared_ptr<spdlog::logger> s3_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("s3");
  }();
  return logger;
}

const char *kMetaPrefix = "x-amz-meta-";
const char *kDigestMetadata = "sha256";
const std::uint64_t kMaxParts = 10000;

std::string child_text(const tinyxml2::XMLElement *parent, const char *name) {
  const auto *el = parent->FirstChildElement(name);
  if (el == nullptr || el->GetText() == nullptr)
    return {};
  return el->GetText();
}

std::string lower(std::string value) {
  for (auto &c : value)
    c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  return value;
}

} // namespace

std::string uri_encode(const std::string &value, bool keep_slash) {
  static const char *hex = "0123456789ABCDEF";
  std::string out;
  out.reserve(value.size());
  for (unsigned char c : value) {
    if (std::isalnum(c) || c == '-' || c == '_' || c == '.' || c == '~' ||
        (keep_slash && c == '/')) {
      out.push_back(static_cast<char>(c));
    } else {
      out.push_back('%');
      out.push_back(hex[c >> 4]);
      out.push_back(hex[c & 0x0f]);
    }
  }
  return out;
}

ListObjectsPage parse_list_objects(const std::string &xml) {
  tinyxml2::XMLDocument doc;
  if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
    throw StorageError(std::string("Malformed ListObjectsV2 response: ") +
                       doc.ErrorStr());
  }
  const auto *root = doc.RootElement();
  if (root == nullptr || std::string(root->Name()) != "ListBucketResult") {
    throw StorageError("Unexpected ListObjectsV2 response");
  }
  ListObjectsPage page;
  for (const auto *c = root->FirstChildElement("Contents"); c != nullptr;
       c = c->NextSiblingElement("Contents")) {
    ObjectInfo info;
    info.key = child_text(c, "Key");
    info.last_modified = child_text(c, "LastModified");
    std::string size = child_text(c, "Size");
    if (!size.empty()) {
      try {
        info.size = std::stoull(size);
      } catch (const std::exception &) {
        throw StorageError("Invalid object size '" + size + "' for " +
                           info.key);
      }
    }
    page.objects.push_back(std::move(info));
  }
  if (child_text(root, "IsTruncated") == "true") {
    page.next_continuation_token = child_text(root, "NextContinuationToken");
  }
  return page;
}

std::string parse_upload_id(const std::string &xml) {
  tinyxml2::XMLDocument doc;
  if (doc.Parse(xml.c_str(), xml.size()) != tinyxml2::XML_SUCCESS) {
    throw StorageError(std::string("Malformed multipart upload response: ") +
                       doc.ErrorStr());
  }
  const auto *root = doc.RootElement();
  if (root == nullptr ||
      std::string(root->Name()) != "InitiateMultipartUploadResult") {
    throw StorageError("Unexpected multipart upload response");
  }
  std::string id = child_text(root, "UploadId");
  if (id.empty()) {
    throw StorageError("Multipart upload response has no UploadId");
  }
  return id;
}

std::string render_complete_multipart(const std::vector<UploadedPart> &parts) {
  tinyxml2::XMLPrinter printer(nullptr, true);
  printer.OpenElement("CompleteMultipartUpload");
  printer.PushAttribute("xmlns", "http://s3.amazonaws.com/doc/2006-03-01/");
  for (const auto &part : parts) {
    printer.OpenElement("Part");
    printer.OpenElement("PartNumber");
    printer.PushText(part.number);
    printer.CloseElement();
    printer.OpenElement("ETag");
    printer.PushText(part.etag.c_str());
    printer.CloseElement();
    printer.OpenElement("ChecksumSHA256");
    printer.PushText(part.checksum_sha256.c_str());
    printer.CloseElement();
    printer.CloseElement();
  }
  printer.CloseElement();
  return printer.CStr();
}

S3ObjectStore::S3ObjectStore(S3Location location,
                             std::unique_ptr<HttpClient> http,
                             MultipartSettings multipart)
    : location_(std::move(location)), http_(std::move(http)),
      multipart_(multipart) {
  while (!location_.endpoint.empty() && location_.endpoint.back() == '/') {
    location_.endpoint.pop_back();
  }
}

std::string S3ObjectStore::bucket_url() const {
  if (!location_.endpoint.empty()) {
    return location_.endpoint + "/" + location_.bucket;
  }
  return "https://" + location_.bucket + ".s3." + location_.region +
         ".amazonaws.com";
}

std::string S3ObjectStore::object_url(const std::string &key) const {
  return bucket_url() + "/" + uri_encode(key, true);
}

std::string S3ObjectStore::describe(const std::string &key) const {
  return "s3://" + location_.bucket + "/" + key;
}

void S3ObjectStore::put_object(const std::string &key,
                               const UploadPayload &payload,
                               const std::string &sha256_hex,
                               const ObjectMetadata &metadata) {
  std::uint64_t size = payload.bytes.size();
  if (payload.file) {
    std::error_code ec;
    size = std::filesystem::file_size(*payload.file, ec);
    if (ec) {
      throw StorageError("Failed to upload " + describe(key) + ": cannot stat " +
                         payload.file->string() + ": " + ec.message());
    }
  }
  std::vector<std::string> headers;
  headers.push_back("Content-Type: " + payload.content_type);
  for (const auto &[name, value] : metadata) {
    headers.push_back(kMetaPrefix + lower(name) + ": " + value);
  }
  if (size > multipart_.threshold) {
    put_multipart(key, payload, size, sha256_hex, std::move(headers));
    return;
  }
  headers.push_back("x-amz-content-sha256: " + sha256_hex);
  headers.push_back("x-amz-checksum-sha256: " + hex_to_base64(sha256_hex));
  s3_log()->info("Uploading to {}", describe(key));
  try {
    if (payload.file) {
      http_->put_file(object_url(key), *payload.file, headers);
    } else {
      http_->put(object_url(key), payload.bytes, headers);
    }
  } catch (const std::exception &e) {
    throw StorageError("Failed to upload " + describe(key) + ": " + e.what());
  }
}

void S3ObjectStore::put_multipart(const std::string &key,
                                  const UploadPayload &payload,
                                  std::uint64_t size,
                                  const std::string &sha256_hex,
                                  std::vector<std::string> headers) {
  std::uint64_t part_size = std::max<std::uint64_t>(
      {multipart_.part_size, (size + kMaxParts - 1) / kMaxParts, 1});
  std::uint64_t part_count = (size + part_size - 1) / part_size;
  s3_log()->info("Uploading to {} in {} parts of up to {} bytes",
                 describe(key), part_count, part_size);

  headers.push_back("x-amz-checksum-algorithm: SHA256");
  headers.push_back(std::string(kMetaPrefix) + kDigestMetadata + ": " +
                    sha256_hex);
  std::string upload_id;
  try {
    HttpResponse created = http_->post(object_url(key) + "?uploads", "", headers);
    upload_id = parse_upload_id(created.body);
  } catch (const std::exception &e) {
    throw StorageError("Failed to start multipart upload of " + describe(key) +
                       ": " + e.what());
  }
  const std::string upload_query = "uploadId=" + uri_encode(upload_id, false);

  try {
    std::ifstream in;
    if (payload.file) {
      in.open(*payload.file, std::ios::binary);
      if (!in) {
        throw std::runtime_error("Failed to open " + payload.file->string());
      }
    }
    std::vector<UploadedPart> parts;
    std::uint64_t offset = 0;
    for (int number = 1; offset < size; ++number) {
      std::uint64_t length = std::min(part_size, size - offset);
      std::string body;
      if (payload.file) {
        body.resize(length);
        in.read(body.data(), static_cast<std::streamsize>(length));
        if (static_cast<std::uint64_t>(in.gcount()) != length) {
          throw std::runtime_error("Short read from " + payload.file->string());
        }
      } else {
        body = payload.bytes.substr(offset, length);
      }
      ContentDigest digest = sha256_bytes(body);
      UploadedPart part{number, "", hex_to_base64(digest.sha256_hex)};
      HttpResponse res = http_->put(
          object_url(key) + "?partNumber=" + std::to_string(number) + "&" +
              upload_query,
          body,
          {"x-amz-content-sha256: " + digest.sha256_hex,
           "x-amz-checksum-sha256: " + part.checksum_sha256});
      auto etag = find_header(res.headers, "ETag");
      if (!etag || etag->empty()) {
        throw StorageError("No ETag returned for part " +
                           std::to_string(number));
      }
      part.etag = *etag;
      s3_log()->debug("Uploaded part {}/{} of {}", number, part_count,
                      describe(key));
      parts.push_back(std::move(part));
      offset += length;
    }

    HttpResponse done =
        http_->post(object_url(key) + "?" + upload_query,
                    render_complete_multipart(parts),
                    {"Content-Type: application/xml"});
    // Completion can fail after a 200 status; the body then holds an Error.
    tinyxml2::XMLDocument doc;
    if (doc.Parse(done.body.c_str(), done.body.size()) ==
            tinyxml2::XML_SUCCESS &&
        doc.RootElement() != nullptr &&
        std::string(doc.RootElement()->Name()) == "Error") {
      throw StorageError("CompleteMultipartUpload failed: " +
                         child_text(doc.RootElement(), "Code") + " " +
                         child_text(doc.RootElement(), "Message"));
    }
  } catch (const std::exception &e) {
    abort_multipart(key, upload_id);
    throw StorageError("Failed to upload " + describe(key) + ": " + e.what());
  }
}

void S3ObjectStore::abort_multipart(const std::string &key,
                                    const std::string &upload_id) {
  try {
    http_->del(object_url(key) + "?uploadId=" + uri_encode(upload_id, false),
               {});
    s3_log()->warn("Aborted multipart upload of {}", describe(key));
  } catch (const std::exception &e) {
    s3_log()->error("Failed to abort multipart upload {} of {}: {}", upload_id,
                    describe(key), e.what());
  }
}

std::optional<ObjectInfo> S3ObjectStore::head_object(const std::string &key) {
  HttpResponse res;
  try {
    res = http_->head(object_url(key), {"x-amz-checksum-mode: ENABLED"});
  } catch (const std::exception &e) {
    throw StorageError("Failed to check " + describe(key) + ": " + e.what());
  }
  if (res.status_code == 404) {
    return std::nullopt;
  }
  if (res.status_code < 200 || res.status_code >= 300) {
    throw StorageError("Failed to check " + describe(key) + ": HTTP " +
                       std::to_string(res.status_code));
  }
  ObjectInfo info;
  info.key = key;
  if (auto len = find_header(res.headers, "Content-Length")) {
    try {
      info.size = std::stoull(*len);
    } catch (const std::exception &) {
      throw StorageError("Invalid Content-Length for " + describe(key));
    }
  }
  info.last_modified = find_header(res.headers, "Last-Modified").value_or("");
  if (auto checksum = find_header(res.headers, "x-amz-checksum-sha256")) {
    try {
      info.sha256_hex = base64_to_hex(*checksum);
    } catch (const std::invalid_argument &) {
      // Multipart uploads report a composite checksum with a part suffix.
      s3_log()->debug("Ignoring non-object checksum '{}' for {}", *checksum,
                      describe(key));
    }
  }
  const std::string prefix = kMetaPrefix;
  for (const auto &h : res.headers) {
    auto colon = h.find(':');
    if (colon == std::string::npos)
      continue;
    std::string name = lower(h.substr(0, colon));
    if (name.rfind(prefix, 0) != 0)
      continue;
    info.metadata[name.substr(prefix.size())] =
        find_header({h}, name).value_or("");
  }
  if (!info.sha256_hex) {
    auto stored = info.metadata.find(kDigestMetadata);
    if (stored != info.metadata.end() && !stored->second.empty()) {
      info.sha256_hex = stored->second;
    }
  }
  return info;
}

std::vector<ObjectInfo> S3ObjectStore::list_objects(const std::string &prefix) {
  std::vector<ObjectInfo> objects;
  std::string token;
  do {
    std::string url = bucket_url() + "/?list-type=2&prefix=" +
                      uri_encode(prefix, false);
    if (!token.empty()) {
      url += "&continuation-token=" + uri_encode(token, false);
    }
    HttpResponse res;
    try {
      res = http_->get_with_headers(url, {});
    } catch (const std::exception &e) {
      throw StorageError("Failed to list " + describe(prefix) + ": " +
                         e.what());
    }
    if (res.status_code < 200 || res.status_code >= 300) {
      throw StorageError("Failed to list " + describe(prefix) + ": HTTP " +
                         std::to_string(res.status_code));
    }
    ListObjectsPage page = parse_list_objects(res.body);
    for (auto &obj : page.objects) {
      objects.push_back(std::move(obj));
    }
    token = page.next_continuation_token;
  } while (!token.empty());
  s3_log()->debug("Listed {} objects under {}", objects.size(),
                  describe(prefix));
  return objects;
}

} // namespace omb
