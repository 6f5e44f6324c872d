#include "hash.hpp"

#include <openssl/evp.h>

#include <memory>
#include <stdexcept>
#include <string>

namespace x402::crypto {
namespace {

struct MdCtxDeleter {
  void operator()(EVP_MD_CTX* ctx) const {
    EVP_MD_CTX_free(ctx);
  }
};

template <std::size_t N>
std::array<uint8_t, N> Digest(const EVP_MD* md, const uint8_t* data, std::size_t size) {
  if (md == nullptr) {
    throw std::runtime_error("digest algorithm unavailable");
  }

  std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
  if (!ctx) {
    throw std::runtime_error("EVP_MD_CTX_new failed");
  }

  std::array<uint8_t, N> out{};
  unsigned int           out_len = 0;
  if (EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1 || EVP_DigestUpdate(ctx.get(), data, size) != 1 ||
      EVP_DigestFinal_ex(ctx.get(), out.data(), &out_len) != 1 || out_len != N) {
    throw std::runtime_error(std::string("digest failed: ") + EVP_MD_get0_name(md));
  }
  return out;
}

} // namespace

Sha256Digest Sha256(const uint8_t* data, std::size_t size) {
  return Digest<32>(EVP_sha256(), data, size);
}

Sha256Digest Sha256(const std::vector<uint8_t>& data) {
  return Sha256(data.data(), data.size());
}

Sha256Digest Sha256(std::string_view data) {
  return Sha256(reinterpret_cast<const uint8_t*>(data.data()), data.size());
}

Sha256Digest DoubleSha256(const std::vector<uint8_t>& data) {
  const auto first = Sha256(data);
  return Sha256(first.data(), first.size());
}

Ripemd160Digest Ripemd160(const uint8_t* data, std::size_t size) {
  return Digest<20>(EVP_ripemd160(), data, size);
}

Ripemd160Digest Hash160(const std::vector<uint8_t>& data) {
  const auto sha = Sha256(data);
  return Ripemd160(sha.data(), sha.size());
}

} // namespace x402::crypto
