#include "checksum.hpp"
#include "errors.hpp"
#include "fakes.hpp"
#include "s3_object_store.hpp"
#include <algorithm>
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <memory>

using namespace omb;
using namespace omb::test;

namespace {

bool has_header(const std::vector<std::string> &headers,
                const std::string &header) {
  return std::find(headers.begin(), headers.end(), header) != headers.end();
}

const char *kPageOne = R"(<?xml version="1.0" encoding="UTF-8"?>
<ListBucketResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Name>bucket</Name>
  <Prefix>backups/demo/</Prefix>
  <KeyCount>2</KeyCount>
  <IsTruncated>true</IsTruncated>
  <NextContinuationToken>1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=</NextContinuationToken>
  <Contents>
    <Key>backups/demo/demo-20251201.tar.gz</Key>
    <LastModified>2025-12-01T08:00:00.000Z</LastModified>
    <Size>1024</Size>
  </Contents>
  <Contents>
    <Key>backups/demo/demo-issues-20251201.json</Key>
    <LastModified>2025-12-01T08:01:00.000Z</LastModified>
    <Size>512</Size>
  </Contents>
</ListBucketResult>)";

const char *kPageTwo = R"(<?xml version="1.0" encoding="UTF-8"?>
<ListBucketResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <IsTruncated>false</IsTruncated>
  <Contents>
    <Key>backups/demo/demo-20251202.tar.gz</Key>
    <LastModified>2025-12-02T08:00:00.000Z</LastModified>
    <Size>2048</Size>
  </Contents>
</ListBucketResult>)";

const char *kInitiated = R"(<?xml version="1.0" encoding="UTF-8"?>
<InitiateMultipartUploadResult xmlns="http://s3.amazonaws.com/doc/2006-03-01/">
  <Bucket>bucket</Bucket>
  <Key>demo/demo-20251202.tar.gz</Key>
  <UploadId>up/42=</UploadId>
</InitiateMultipartUploadResult>)";

HttpResponse part_response(const std::string &etag) {
  return {"", {"HTTP/1.1 200 OK", "ETag: " + etag}, 200};
}

} // namespace

TEST_CASE("uri_encode keeps unreserved characters") {
  REQUIRE(uri_encode("backups/demo/demo-20251202.tar.gz", true) ==
          "backups/demo/demo-20251202.tar.gz");
  REQUIRE(uri_encode("backups/demo/", false) == "backups%2Fdemo%2F");
  REQUIRE(uri_encode("a b+c~", true) == "a%20b%2Bc~");
}

TEST_CASE("parse_list_objects reads keys and continuation") {
  auto page = parse_list_objects(kPageOne);
  REQUIRE(page.objects.size() == 2);
  REQUIRE(page.objects[0].key == "backups/demo/demo-20251201.tar.gz");
  REQUIRE(page.objects[0].size == 1024);
  REQUIRE(page.objects[0].last_modified == "2025-12-01T08:00:00.000Z");
  REQUIRE(page.next_continuation_token ==
          "1ueGcxLPRx1Tr/XYExHnhbYLgveDs2J/wm36Hy4vbOwM=");

  auto last = parse_list_objects(kPageTwo);
  REQUIRE(last.objects.size() == 1);
  REQUIRE(last.next_continuation_token.empty());

  REQUIRE_THROWS_AS(parse_list_objects("<not-xml"), StorageError);
  REQUIRE_THROWS_AS(parse_list_objects("<Error><Code>AccessDenied</Code></Error>"),
                    StorageError);
}

TEST_CASE("s3 store builds virtual-hosted and path-style urls") {
  S3ObjectStore aws({"my-bucket", "eu-west-1", ""},
                    std::make_unique<ScriptedHttpClient>());
  REQUIRE(aws.object_url("backups/demo/demo-20251202.tar.gz") ==
          "https://my-bucket.s3.eu-west-1.amazonaws.com/backups/demo/"
          "demo-20251202.tar.gz");
  REQUIRE(aws.describe("k") == "s3://my-bucket/k");

  S3ObjectStore minio({"my-bucket", "us-east-1", "http://localhost:9000/"},
                      std::make_unique<ScriptedHttpClient>());
  REQUIRE(minio.object_url("demo/x.json") ==
          "http://localhost:9000/my-bucket/demo/x.json");
}

TEST_CASE("s3 put sends checksum and metadata headers") {
  auto http = std::make_unique<ScriptedHttpClient>();
  auto *raw = http.get();
  S3ObjectStore store({"bucket", "us-east-1", ""}, std::move(http));
  auto digest = sha256_bytes("{}");
  store.put_object("demo/demo-issues-20251202.json",
                   UploadPayload::from_bytes("{}"), digest.sha256_hex,
                   {{"repository", "QuantEcon/demo"}, {"total_issues", "0"}});

  REQUIRE(raw->requests.size() == 1);
  const auto &req = raw->requests.front();
  REQUIRE(req.method == "PUT");
  REQUIRE(req.body == "{}");
  REQUIRE(has_header(req.headers, "Content-Type: application/json"));
  REQUIRE(has_header(req.headers, "x-amz-content-sha256: " + digest.sha256_hex));
  REQUIRE(has_header(req.headers, "x-amz-checksum-sha256: " +
                                      hex_to_base64(digest.sha256_hex)));
  REQUIRE(has_header(req.headers, "x-amz-meta-repository: QuantEcon/demo"));
  REQUIRE(has_header(req.headers, "x-amz-meta-total_issues: 0"));
}

TEST_CASE("s3 head reports size checksum and absence") {
  auto http = std::make_unique<ScriptedHttpClient>();
  auto *raw = http.get();
  auto digest = sha256_bytes("archive");
  raw->head_responses = {
      {"",
       {"HTTP/1.1 200 OK", "Content-Length: 7",
        "Last-Modified: Tue, 02 Dec 2025 08:30:00 GMT",
        "x-amz-checksum-sha256: " + hex_to_base64(digest.sha256_hex),
        "x-amz-meta-repository: QuantEcon/demo"},
       200},
      {"", {}, 404},
      {"", {}, 403}};
  S3ObjectStore store({"bucket", "us-east-1", ""}, std::move(http));

  auto info = store.head_object("demo/demo-20251202.tar.gz");
  REQUIRE(info.has_value());
  REQUIRE(info->size == 7);
  REQUIRE(info->sha256_hex == digest.sha256_hex);
  REQUIRE(info->metadata.at("repository") == "QuantEcon/demo");
  REQUIRE(has_header(raw->requests[0].headers, "x-amz-checksum-mode: ENABLED"));

  REQUIRE_FALSE(store.head_object("missing").has_value());
  REQUIRE_THROWS_AS(store.head_object("forbidden"), StorageError);
}

TEST_CASE("s3 listing follows continuation tokens") {
  auto http = std::make_unique<ScriptedHttpClient>();
  auto *raw = http.get();
  raw->get_responses = {{kPageOne, {}, 200}, {kPageTwo, {}, 200}};
  S3ObjectStore store({"bucket", "us-east-1", ""}, std::move(http));

  auto objects = store.list_objects("backups/demo/");
  REQUIRE(objects.size() == 3);
  REQUIRE(raw->requests.size() == 2);
  REQUIRE(raw->requests[0].url ==
          "https://bucket.s3.us-east-1.amazonaws.com/"
          "?list-type=2&prefix=backups%2Fdemo%2F");
  REQUIRE(raw->requests[1].url.find(
              "&continuation-token=1ueGcxLPRx1Tr%2FXYExHnhbYLgveDs2J%2F"
              "wm36Hy4vbOwM%3D") != std::string::npos);
}

TEST_CASE("s3 listing errors are storage errors") {
  auto http = std::make_unique<ScriptedHttpClient>();
  http->get_responses = {{"<Error/>", {}, 403}};
  S3ObjectStore store({"bucket", "us-east-1", ""}, std::move(http));
  REQUIRE_THROWS_AS(store.list_objects("x/"), StorageError);
}

TEST_CASE("large payloads are uploaded in parts") {
  auto http = std::make_unique<ScriptedHttpClient>();
  auto *raw = http.get();
  raw->post_responses = {{kInitiated, {}, 200},
                         {"<CompleteMultipartUploadResult/>", {}, 200}};
  raw->put_responses = {part_response("\"etag-1\""),
                        part_response("\"etag-2\""),
                        part_response("\"etag-3\"")};
  S3ObjectStore store({"bucket", "us-east-1", ""}, std::move(http), {4, 4});
  auto digest = sha256_bytes("0123456789");
  store.put_object("demo/demo-20251202.tar.gz",
                   UploadPayload::from_bytes("0123456789", "application/gzip"),
                   digest.sha256_hex, {{"repository", "QuantEcon/demo"}});

  REQUIRE(raw->requests.size() == 5);
  const auto &start = raw->requests[0];
  REQUIRE(start.method == "POST");
  REQUIRE(start.url == store.object_url("demo/demo-20251202.tar.gz") +
                           "?uploads");
  REQUIRE(has_header(start.headers, "Content-Type: application/gzip"));
  REQUIRE(has_header(start.headers, "x-amz-meta-repository: QuantEcon/demo"));
  REQUIRE(has_header(start.headers, "x-amz-checksum-algorithm: SHA256"));
  REQUIRE(has_header(start.headers, "x-amz-meta-sha256: " + digest.sha256_hex));

  const std::vector<std::string> bodies{"0123", "4567", "89"};
  for (std::size_t i = 0; i < bodies.size(); ++i) {
    const auto &part = raw->requests[i + 1];
    REQUIRE(part.method == "PUT");
    REQUIRE(part.url == store.object_url("demo/demo-20251202.tar.gz") +
                            "?partNumber=" + std::to_string(i + 1) +
                            "&uploadId=up%2F42%3D");
    REQUIRE(part.body == bodies[i]);
    REQUIRE(has_header(part.headers,
                       "x-amz-checksum-sha256: " +
                           hex_to_base64(sha256_bytes(bodies[i]).sha256_hex)));
  }

  const auto &complete = raw->requests[4];
  REQUIRE(complete.method == "POST");
  REQUIRE(complete.url == store.object_url("demo/demo-20251202.tar.gz") +
                              "?uploadId=up%2F42%3D");
  REQUIRE(complete.body.find("<PartNumber>1</PartNumber>") !=
          std::string::npos);
  REQUIRE(complete.body.find("<PartNumber>3</PartNumber>") !=
          std::string::npos);
  REQUIRE(complete.body.find("etag-2") != std::string::npos);
  REQUIRE(complete.body.find(hex_to_base64(sha256_bytes("89").sha256_hex)) !=
          std::string::npos);
}

TEST_CASE("payloads at the threshold use a single put") {
  auto http = std::make_unique<ScriptedHttpClient>();
  auto *raw = http.get();
  S3ObjectStore store({"bucket", "us-east-1", ""}, std::move(http), {4, 4});
  store.put_object("k", UploadPayload::from_bytes("0123"),
                   sha256_bytes("0123").sha256_hex, {});
  REQUIRE(raw->requests.size() == 1);
  REQUIRE(raw->requests[0].method == "PUT");
  REQUIRE(raw->requests[0].url == store.object_url("k"));
}

TEST_CASE("failed multipart uploads are aborted") {
  const std::string path = "s3_multipart_upload.bin";
  std::ofstream(path, std::ios::binary) << "abcdefghij";
  auto digest = sha256_file(path);

  SECTION("part without etag") {
    auto http = std::make_unique<ScriptedHttpClient>();
    auto *raw = http.get();
    raw->post_responses = {{kInitiated, {}, 200}};
    raw->put_responses = {part_response("\"etag-1\""),
                          {"", {"HTTP/1.1 200 OK"}, 200}};
    S3ObjectStore store({"bucket", "us-east-1", ""}, std::move(http), {4, 4});
    REQUIRE_THROWS_AS(store.put_object("demo/big.tar.gz",
                                       UploadPayload::from_file(path),
                                       digest.sha256_hex, {}),
                      StorageError);
    REQUIRE(raw->requests[1].body == "abcd");
    REQUIRE(raw->requests[2].body == "efgh");
    REQUIRE(raw->requests.back().method == "DELETE");
    REQUIRE(raw->requests.back().url ==
            store.object_url("demo/big.tar.gz") + "?uploadId=up%2F42%3D");
  }

  SECTION("completion error inside a success response") {
    auto http = std::make_unique<ScriptedHttpClient>();
    auto *raw = http.get();
    raw->post_responses = {
        {kInitiated, {}, 200},
        {"<Error><Code>InternalError</Code><Message>retry</Message></Error>",
         {},
         200}};
    raw->put_responses = {part_response("a"), part_response("b"),
                          part_response("c")};
    S3ObjectStore store({"bucket", "us-east-1", ""}, std::move(http), {4, 4});
    try {
      store.put_object("demo/big.tar.gz", UploadPayload::from_file(path),
                       digest.sha256_hex, {});
      FAIL("expected StorageError");
    } catch (const StorageError &e) {
      REQUIRE(std::string(e.what()).find("InternalError") != std::string::npos);
    }
    REQUIRE(raw->requests.size() == 6);
    REQUIRE(raw->requests.back().method == "DELETE");
  }

  SECTION("no upload id") {
    auto http = std::make_unique<ScriptedHttpClient>();
    auto *raw = http.get();
    raw->post_responses = {{"<InitiateMultipartUploadResult/>", {}, 200}};
    S3ObjectStore store({"bucket", "us-east-1", ""}, std::move(http), {4, 4});
    REQUIRE_THROWS_AS(store.put_object("demo/big.tar.gz",
                                       UploadPayload::from_file(path),
                                       digest.sha256_hex, {}),
                      StorageError);
    REQUIRE(raw->requests.size() == 1);
  }
  std::remove(path.c_str());
}

TEST_CASE("s3 head falls back to the stored digest for multipart objects") {
  auto http = std::make_unique<ScriptedHttpClient>();
  auto *raw = http.get();
  auto digest = sha256_bytes("archive");
  raw->head_responses = {
      {"",
       {"HTTP/1.1 200 OK", "Content-Length: 7",
        "x-amz-checksum-sha256: " + hex_to_base64(digest.sha256_hex) + "-3",
        "x-amz-meta-sha256: " + digest.sha256_hex},
       200}};
  S3ObjectStore store({"bucket", "us-east-1", ""}, std::move(http));
  auto info = store.head_object("demo/demo-20251202.tar.gz");
  REQUIRE(info.has_value());
  REQUIRE(info->sha256_hex == digest.sha256_hex);
}

TEST_CASE("multipart documents are parsed and rendered") {
  REQUIRE(parse_upload_id(kInitiated) == "up/42=");
  REQUIRE_THROWS_AS(parse_upload_id("<Error/>"), StorageError);
  REQUIRE_THROWS_AS(parse_upload_id("not xml <"), StorageError);

  std::string xml = render_complete_multipart({{1, "e1", "c1"}, {2, "e2", "c2"}});
  REQUIRE(xml.rfind("<CompleteMultipartUpload", 0) == 0);
  REQUIRE(xml.find("<Part><PartNumber>1</PartNumber><ETag>e1</ETag>"
                   "<ChecksumSHA256>c1</ChecksumSHA256></Part>") !=
          std::string::npos);
  REQUIRE(xml.find("<PartNumber>2</PartNumber>") > xml.find("c1"));
}
