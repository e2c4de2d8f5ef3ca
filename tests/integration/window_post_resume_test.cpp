#include <cassert>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>

#include "internal/bench/report.hpp"
#include "internal/bench/window_post.hpp"
#include "internal/cache/cache_directory.hpp"
#include "internal/engine/reference_engine.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;

using sealbench::bench::WindowPostOptions;
using sealbench::bench::WindowPostRunner;
using sealbench::testing::TempDir;

WindowPostOptions Options(const TempDir& root) {
  WindowPostOptions options;
  options.context    = sealbench::model::SealContext::Make(sealbench::model::kSectorSize2KiB, sealbench::model::kApiVersion1_0_0);
  options.cache_root = root.path();
  return options;
}

/*
  Baseline seal, interruption after precommit phase 2, resume over the same
  directory, then a third run that skips every phase of the preserved cache.
*/
void TestResumeThenReuseCache() {
  TempDir root("window_post_resume");
  auto    engine = std::make_shared<sealbench::engine::ReferenceEngine>();

  auto options           = Options(root);
  options.cache_path     = root / "sector-cache";
  options.preserve_cache = true;
  options.test_resume    = true;

  auto report = WindowPostRunner(engine).Run(options);
  assert(report.resume_tested());
  assert(report.cache_preserved());
  assert(report.has_add_piece());
  assert(report.phases_size() == 4);
  assert(report.phases(0).skipped());
  assert(report.phases(1).skipped());
  assert(!report.phases(2).skipped());
  assert(!report.phases(3).skipped());
  assert(report.has_generate_window_post());
  assert(report.has_verify_window_post());

  const fs::path cache = report.cache_path();
  assert(cache == options.cache_path);
  assert(fs::exists(cache / std::string(sealbench::cache::kMarkerFileName)));
  assert(sealbench::cache::CacheDirectory::Inspect(cache, options.context) ==
         sealbench::cache::CacheState::kPopulated);

  auto reuse                        = Options(root);
  reuse.cache_path                  = cache;
  reuse.preserve_cache              = true;
  reuse.flags.skip_precommit_phase1 = true;
  reuse.flags.skip_precommit_phase2 = true;
  reuse.flags.skip_commit_phase1    = true;
  reuse.flags.skip_commit_phase2    = true;

  auto replay = WindowPostRunner(engine).Run(reuse);
  assert(!replay.resume_tested());
  assert(replay.phases_size() == 4);
  for (const auto& phase : replay.phases()) {
    assert(phase.skipped());
  }
  // Skipped phases report the artifact already on disk.
  assert(replay.phases(3).digest() == report.phases(3).digest());

  // Opening the same cache for another sector size is refused.
  auto other       = Options(root);
  other.context    = sealbench::model::SealContext::Make(sealbench::model::kSectorSize8MiB, sealbench::model::kApiVersion1_0_0);
  other.cache_path = cache;
  try {
    (void)WindowPostRunner(engine).Run(other);
    assert(false && "expected IncompatibleCache");
  } catch (const sealbench::util::IncompatibleCache&) {
  }
}

void TestResumeWithoutPreserveCleansUp() {
  TempDir root("window_post_resume_cleanup");
  auto    engine = std::make_shared<sealbench::engine::ReferenceEngine>();

  auto options        = Options(root);
  options.test_resume = true;

  auto report = WindowPostRunner(engine).Run(options);
  assert(report.resume_tested());
  assert(!report.cache_preserved());
  assert(fs::path(report.cache_path()).parent_path() == root.path());
  assert(!fs::exists(report.cache_path()));
  assert(fs::is_empty(root.path()));
}

void TestReportEncodesAsJson() {
  TempDir root("window_post_resume_json");
  auto    engine = std::make_shared<sealbench::engine::ReferenceEngine>();

  auto options        = Options(root);
  options.test_resume = true;

  const auto json = sealbench::bench::ToJson(WindowPostRunner(engine).Run(options));
  sealbench::v1::WindowPostReport parsed;
  sealbench::bench::ParseJson(json, &parsed);
  assert(parsed.resume_tested());
  assert(parsed.sector_size_bytes() == sealbench::model::kSectorSize2KiB);
  assert(parsed.api_version() == "1.0.0");
  assert(parsed.metadata().engine() == "reference");
}

} // namespace

int main() {
  TestResumeThenReuseCache();
  TestResumeWithoutPreserveCleansUp();
  TestReportEncodesAsJson();

  std::cout << "sealbench_integration_window_post_resume: pass\n";
  return 0;
}
