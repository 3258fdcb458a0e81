#include "errors.hpp"
#include <catch2/catch_test_macros.hpp>
#include <stdexcept>

using namespace omb;

TEST_CASE("error kinds have stable names") {
  REQUIRE(to_string(ErrorKind::ConfigurationError) == "configuration_error");
  REQUIRE(to_string(ErrorKind::HostingError) == "hosting_error");
  REQUIRE(to_string(ErrorKind::ArchiveError) == "archive_error");
  REQUIRE(to_string(ErrorKind::UploadVerificationError) ==
          "upload_verification_error");
  REQUIRE(to_string(ErrorKind::StorageError) == "storage_error");
  REQUIRE(to_string(ErrorKind::Unexpected) == "unexpected_error");
}

TEST_CASE("classify_error maps typed failures") {
  REQUIRE(classify_error(ArchiveError("clone")) == ErrorKind::ArchiveError);
  REQUIRE(classify_error(HostingError("denied", 403)) ==
          ErrorKind::HostingError);
  REQUIRE(classify_error(UploadVerificationError("size")) ==
          ErrorKind::UploadVerificationError);
  REQUIRE(classify_error(StorageError("put")) == ErrorKind::StorageError);
  REQUIRE(classify_error(std::runtime_error("boom")) == ErrorKind::Unexpected);
  REQUIRE(classify_error(TransientNetworkError("reset")) ==
          ErrorKind::Unexpected);

  HostingError limited("rate limit exceeded", 429);
  REQUIRE(limited.status() == 429);
  REQUIRE(limited.kind() == ErrorKind::HostingError);
}
