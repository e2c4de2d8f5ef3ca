#pragma once

#include <filesystem>
#include <memory>

#include "internal/engine/proof_engine.hpp"
#include "internal/model/phase.hpp"
#include "internal/model/sector.hpp"
#include "internal/util/cancellation.hpp"
#include "sealbench/v1.hpp"

namespace sealbench::bench {

struct WindowPostOptions {
  model::SealContext    context;
  std::filesystem::path cache_path;
  std::filesystem::path cache_root;
  bool                  preserve_cache = false;
  model::PhaseFlags     flags;
  bool                  test_resume = false;
};

/*
  Seals one sector (or resumes a partially sealed cache), verifies the seal
  proof, then generates and verifies a window PoSt over it.
*/
class WindowPostRunner {
 public:
  explicit WindowPostRunner(std::shared_ptr<engine::ProofEngine> engine, const util::CancellationToken* cancel = nullptr);

  sealbench::v1::WindowPostReport Run(const WindowPostOptions& options);

 private:
  std::shared_ptr<engine::ProofEngine> engine_;
  const util::CancellationToken*       cancel_;
};

} // namespace sealbench::bench
