#include "digest.hpp"

#include <openssl/evp.h>

#include <stdexcept>

namespace sealbench::util {

void Digester::CtxDeleter::operator()(evp_md_ctx_st* ctx) const {
  EVP_MD_CTX_free(ctx);
}

Digester::Digester(std::string_view algorithm) : md_(EVP_get_digestbyname(std::string(algorithm).c_str())), ctx_(EVP_MD_CTX_new()) {
  if (md_ == nullptr) {
    throw std::invalid_argument("unknown digest algorithm: " + std::string(algorithm));
  }
  if (!ctx_ || EVP_DigestInit_ex(ctx_.get(), md_, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
}

Digester& Digester::Update(const void* data, std::size_t size) {
  if (EVP_DigestUpdate(ctx_.get(), data, size) != 1) {
    throw std::runtime_error("EVP_DigestUpdate failed");
  }
  return *this;
}

Digester& Digester::UpdateU64(uint64_t value) {
  uint8_t le[8];
  for (int i = 0; i < 8; ++i) {
    le[i] = static_cast<uint8_t>(value >> (8 * i));
  }
  return Update(le, sizeof(le));
}

std::string Digester::Finish() {
  std::string  out(static_cast<std::size_t>(EVP_MD_size(md_)), '\0');
  unsigned int len = 0;
  if (EVP_DigestFinal_ex(ctx_.get(), reinterpret_cast<unsigned char*>(out.data()), &len) != 1) {
    throw std::runtime_error("EVP_DigestFinal_ex failed");
  }
  out.resize(len);
  if (EVP_DigestInit_ex(ctx_.get(), md_, nullptr) != 1) {
    throw std::runtime_error("EVP_DigestInit_ex failed");
  }
  return out;
}

std::size_t Digester::Size() const {
  return static_cast<std::size_t>(EVP_MD_size(md_));
}

Digest32 Sha256(const void* data, std::size_t size) {
  Digest32     out{};
  unsigned int len = 0;
  if (EVP_Digest(data, size, out.data(), &len, EVP_sha256(), nullptr) != 1 || len != out.size()) {
    throw std::runtime_error("EVP_Digest(sha256) failed");
  }
  return out;
}

std::string ToHex(const void* data, std::size_t size) {
  static constexpr char kHex[] = "0123456789abcdef";
  const auto*           bytes  = static_cast<const uint8_t*>(data);
  std::string           result;
  result.reserve(size * 2);
  for (std::size_t i = 0; i < size; ++i) {
    result.push_back(kHex[(bytes[i] >> 4) & 0x0F]);
    result.push_back(kHex[bytes[i] & 0x0F]);
  }
  return result;
}

} // namespace sealbench::util
