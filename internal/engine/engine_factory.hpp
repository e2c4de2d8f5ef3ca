#pragma once

#include <memory>

#include "config/config.pb.h"
#include "internal/engine/proof_engine.hpp"

namespace sealbench::engine {

/*
  Builds the proof engine named by configuration.

      auto engine = EngineFactory::Build(config.engine());
      engine->AddPiece(ctx);

  An empty kind selects the reference engine. Unknown kinds throw
  InvalidArgument.
*/
class EngineFactory {
 public:
  static std::shared_ptr<ProofEngine> Build(const sealbench::runtime::config::EngineConfig& cfg);
};

} // namespace sealbench::engine
