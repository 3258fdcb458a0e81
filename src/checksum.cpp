#include "checksum.hpp"

#include <array>
#include <fstream>
#include <memory>
#include <stdexcept>

#include <openssl/evp.h>

namespace omb {

namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX *ctx) const { EVP_MD_CTX_free(ctx); }
};
using MdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

MdCtx new_sha256_ctx() {
  MdCtx ctx(EVP_MD_CTX_new());
  if (!ctx || EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
    throw std::runtime_error("Failed to initialise SHA-256 context");
  }
  return ctx;
}

std::string finish_hex(EVP_MD_CTX *ctx) {
  std::array<unsigned char, EVP_MAX_MD_SIZE> md{};
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx, md.data(), &len) != 1) {
    throw std::runtime_error("Failed to finalise SHA-256 digest");
  }
  static const char *digits = "0123456789abcdef";
  std::string hex;
  hex.reserve(len * 2);
  for (unsigned int i = 0; i < len; ++i) {
    hex.push_back(digits[md[i] >> 4]);
    hex.push_back(digits[md[i] & 0x0f]);
  }
  return hex;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'a' && c <= 'f')
    return c - 'a' + 10;
  if (c >= 'A' && c <= 'F')
    return c - 'A' + 10;
  return -1;
}

} // namespace

ContentDigest sha256_file(const std::filesystem::path &path) {
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    throw std::runtime_error("Failed to open " + path.string() +
                             " for hashing");
  }
  auto ctx = new_sha256_ctx();
  ContentDigest digest;
  char buffer[64 * 1024];
  while (in) {
    in.read(buffer, sizeof(buffer));
    std::streamsize read = in.gcount();
    if (read <= 0) {
      break;
    }
    if (EVP_DigestUpdate(ctx.get(), buffer, static_cast<std::size_t>(read)) !=
        1) {
      throw std::runtime_error("Failed to hash " + path.string());
    }
    digest.size_bytes += static_cast<std::uint64_t>(read);
  }
  if (in.bad()) {
    throw std::runtime_error("Read error while hashing " + path.string());
  }
  digest.sha256_hex = finish_hex(ctx.get());
  return digest;
}

ContentDigest sha256_bytes(const std::string &bytes) {
  auto ctx = new_sha256_ctx();
  if (EVP_DigestUpdate(ctx.get(), bytes.data(), bytes.size()) != 1) {
    throw std::runtime_error("Failed to hash buffer");
  }
  return {finish_hex(ctx.get()), bytes.size()};
}

std::string base64_encode(const std::vector<unsigned char> &raw) {
  if (raw.empty()) {
    return {};
  }
  std::string out(4 * ((raw.size() + 2) / 3), '\0');
  int written = EVP_EncodeBlock(reinterpret_cast<unsigned char *>(out.data()),
                                raw.data(), static_cast<int>(raw.size()));
  out.resize(static_cast<std::size_t>(written));
  return out;
}

std::string hex_to_base64(const std::string &hex) {
  if (hex.size() % 2 != 0) {
    throw std::invalid_argument("hex digest has odd length");
  }
  std::vector<unsigned char> raw;
  raw.reserve(hex.size() / 2);
  for (std::size_t i = 0; i < hex.size(); i += 2) {
    int hi = hex_value(hex[i]);
    int lo = hex_value(hex[i + 1]);
    if (hi < 0 || lo < 0) {
      throw std::invalid_argument("invalid hex digit in digest");
    }
    raw.push_back(static_cast<unsigned char>((hi << 4) | lo));
  }
  return base64_encode(raw);
}

std::string base64_to_hex(const std::string &b64) {
  if (b64.empty() || b64.size() % 4 != 0) {
    throw std::invalid_argument("invalid base64 digest length");
  }
  std::vector<unsigned char> raw(b64.size() / 4 * 3);
  int len = EVP_DecodeBlock(raw.data(),
                            reinterpret_cast<const unsigned char *>(b64.data()),
                            static_cast<int>(b64.size()));
  if (len < 0) {
    throw std::invalid_argument("invalid base64 digest");
  }
  // EVP_DecodeBlock keeps the zero bytes produced by '=' padding.
  std::size_t padding = 0;
  if (b64[b64.size() - 1] == '=')
    ++padding;
  if (b64[b64.size() - 2] == '=')
    ++padding;
  raw.resize(static_cast<std::size_t>(len) - padding);
  static const char *digits = "0123456789abcdef";
  std::string hex;
  hex.reserve(raw.size() * 2);
  for (unsigned char byte : raw) {
    hex.push_back(digits[byte >> 4]);
    hex.push_back(digits[byte & 0x0f]);
  }
  return hex;
}

} // namespace omb
