#include "engine_factory.hpp"

#include "internal/engine/reference_engine.hpp"
#include "internal/util/errors.hpp"

namespace sealbench::engine {

std::shared_ptr<ProofEngine> EngineFactory::Build(const sealbench::runtime::config::EngineConfig& cfg) {
  if (cfg.kind().empty() || cfg.kind() == ReferenceEngine::kName) {
    return std::make_shared<ReferenceEngine>();
  }
  throw util::InvalidArgument("unknown proof engine: " + cfg.kind());
}

} // namespace sealbench::engine
