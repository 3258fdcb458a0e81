#include "checksum.hpp"
#include <catch2/catch_test_macros.hpp>
#include <cstdio>
#include <fstream>
#include <stdexcept>

using namespace omb;

TEST_CASE("sha256 of known inputs") {
  auto empty = sha256_bytes("");
  REQUIRE(empty.sha256_hex ==
          "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");
  REQUIRE(empty.size_bytes == 0);

  auto abc = sha256_bytes("abc");
  REQUIRE(abc.sha256_hex ==
          "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  REQUIRE(abc.size_bytes == 3);
}

TEST_CASE("sha256_file matches the in-memory digest") {
  const char *path = "checksum_test.bin";
  std::string content(200000, 'x');
  {
    std::ofstream out(path, std::ios::binary);
    out << content;
  }
  auto from_file = sha256_file(path);
  auto from_bytes = sha256_bytes(content);
  REQUIRE(from_file.sha256_hex == from_bytes.sha256_hex);
  REQUIRE(from_file.size_bytes == 200000);
  std::remove(path);
  REQUIRE_THROWS_AS(sha256_file(path), std::runtime_error);
}

TEST_CASE("hex and base64 digests convert both ways") {
  const std::string hex =
      "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad";
  const std::string b64 = "ungWv48Bz+pBQUDeXa4iI7ADYaOWF3qctBD/YfIAFa0=";
  REQUIRE(hex_to_base64(hex) == b64);
  REQUIRE(base64_to_hex(b64) == hex);
  REQUIRE(base64_encode({'M', 'a'}) == "TWE=");
  REQUIRE(base64_to_hex("TWE=") == "4d61");

  REQUIRE_THROWS_AS(hex_to_base64("abc"), std::invalid_argument);
  REQUIRE_THROWS_AS(hex_to_base64("zz"), std::invalid_argument);
  REQUIRE_THROWS_AS(base64_to_hex("abc"), std::invalid_argument);
  REQUIRE_THROWS_AS(base64_to_hex("abc=-1"), std::invalid_argument);
}
