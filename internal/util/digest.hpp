#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>

struct evp_md_ctx_st;
struct evp_md_st;

namespace sealbench::util {

/*
  OpenSSL EVP digests.

  Sha256 is used for artifact identity (cache, resume comparison) and by the
  reference engine. Digester works with any EVP digest by name.
*/

using Digest32 = std::array<uint8_t, 32>;

class Digester {
 public:
  explicit Digester(std::string_view algorithm = "SHA256");

  Digester& Update(const void* data, std::size_t size);
  Digester& Update(std::string_view bytes) {
    return Update(bytes.data(), bytes.size());
  }
  Digester& UpdateU64(uint64_t value);

  // Finalizes and resets, so one Digester can be reused.
  std::string Finish();

  std::size_t Size() const;

 private:
  struct CtxDeleter {
    void operator()(evp_md_ctx_st* ctx) const;
  };

  const evp_md_st*                        md_;
  std::unique_ptr<evp_md_ctx_st, CtxDeleter> ctx_;
};

Digest32 Sha256(const void* data, std::size_t size);

std::string ToHex(const void* data, std::size_t size);

inline std::string ToHex(const Digest32& digest) {
  return ToHex(digest.data(), digest.size());
}

} // namespace sealbench::util
