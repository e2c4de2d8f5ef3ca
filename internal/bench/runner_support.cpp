#include "runner_support.hpp"

#include "internal/util/arrow_utils.hpp"
#include "internal/util/digest.hpp"

namespace sealbench::bench {

engine::Artifact Randomness(std::string_view domain, uint64_t nonce) {
  util::Digester digester;
  return util::MakeBuffer(digester.Update("sealbench-randomness").Update(domain).UpdateU64(nonce).Finish());
}

} // namespace sealbench::bench
