#include "internal/cache/cache_directory.hpp"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/model/sector.hpp"
#include "internal/util/arrow_utils.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

namespace fs = std::filesystem;

using sealbench::cache::CacheDirectory;
using sealbench::cache::CacheState;
using sealbench::model::kApiVersion1_0_0;
using sealbench::model::kApiVersion1_1_0;
using sealbench::model::kSectorSize2KiB;
using sealbench::model::kSectorSize8MiB;
using sealbench::testing::TempDir;
using sealbench::util::MakeBuffer;

sealbench::model::SealContext Ctx(uint64_t sector_size, const sealbench::model::ApiVersion& api_version) {
  return sealbench::model::SealContext::Make(sector_size, api_version);
}

void TestGeneratedDirectoryIsRemovedOnRelease() {
  TempDir root("cache_generated");

  fs::path path;
  {
    auto cache = CacheDirectory::Acquire({}, Ctx(kSectorSize2KiB, kApiVersion1_0_0), root.path(), false);
    path       = cache->Path();
    assert(path.parent_path() == root.path());
    assert(path.filename().string().rfind("sealbench-", 0) == 0);
    assert(cache->InitialState() == CacheState::kAbsent);
    assert(fs::exists(path / sealbench::cache::kMarkerFileName));
  }
  assert(!fs::exists(path));
}

void TestPreservedDirectoryOutlivesRelease() {
  TempDir root("cache_preserved");
  auto    path = root / "kept";
  {
    auto cache = CacheDirectory::Acquire(path, Ctx(kSectorSize2KiB, kApiVersion1_0_0), {}, true);
    cache->Commit("precommit-phase1", MakeBuffer("labels"));
  }
  assert(fs::exists(path / "precommit-phase1.bin"));
  assert(CacheDirectory::Inspect(path, Ctx(kSectorSize2KiB, kApiVersion1_0_0)) == CacheState::kPopulated);
}

void TestCommitIsAtomicAndReadable() {
  TempDir root("cache_commit");
  auto    cache = CacheDirectory::Acquire(root / "c", Ctx(kSectorSize2KiB, kApiVersion1_0_0), {}, false);

  auto ref = cache->Commit("commit-phase1", MakeBuffer("vanilla proofs"));
  assert(ref.size_bytes == 14);
  assert(ref.digest.size() == 64);
  assert(ref.path == cache->ArtifactPath("commit-phase1"));

  for (const auto& entry : fs::directory_iterator(cache->Path())) {
    assert(entry.path().extension() != ".tmp");
  }

  assert(cache->HasArtifact("commit-phase1"));
  assert(sealbench::testing::Text(cache->Read("commit-phase1")) == "vanilla proofs");
  assert(cache->Describe("commit-phase1").digest == ref.digest);

  // Overwrite replaces the contents.
  cache->Commit("commit-phase1", MakeBuffer("other"));
  assert(sealbench::testing::Text(cache->Read("commit-phase1")) == "other");
}

void TestReadingMissingArtifactIsMissingPrerequisite() {
  TempDir root("cache_missing");
  auto    cache = CacheDirectory::Acquire(root / "c", Ctx(kSectorSize2KiB, kApiVersion1_0_0), {}, false);

  bool threw = false;
  try {
    (void)cache->Read("commit-phase1");
  } catch (const sealbench::util::MissingPrerequisite&) {
    threw = true;
  }
  assert(threw);
}

void TestMarkerMismatchIsIncompatible() {
  TempDir root("cache_mismatch");
  auto    path = root / "c";
  {
    auto cache = CacheDirectory::Acquire(path, Ctx(kSectorSize2KiB, kApiVersion1_0_0), {}, true);
  }

  assert(CacheDirectory::Inspect(path, Ctx(kSectorSize8MiB, kApiVersion1_0_0)) == CacheState::kStale);
  assert(CacheDirectory::Inspect(path, Ctx(kSectorSize2KiB, kApiVersion1_1_0)) == CacheState::kStale);
  assert(CacheDirectory::Inspect(path, Ctx(kSectorSize2KiB, kApiVersion1_0_0)) == CacheState::kFresh);

  bool threw = false;
  try {
    (void)CacheDirectory::Acquire(path, Ctx(kSectorSize8MiB, kApiVersion1_0_0), {}, false);
  } catch (const sealbench::util::IncompatibleCache&) {
    threw = true;
  }
  assert(threw);
  // A rejected directory is left alone.
  assert(fs::exists(path / sealbench::cache::kMarkerFileName));
}

void TestSealParameterMismatchIsIncompatible() {
  TempDir root("cache_parameters");
  auto    path = root / "c";
  auto    ctx  = Ctx(kSectorSize2KiB, kApiVersion1_0_0);
  {
    auto cache = CacheDirectory::Acquire(path, ctx, {}, true);
    cache->Commit("precommit-phase1", MakeBuffer("two-layer labels"));
  }

  auto layered              = ctx;
  layered.parameters.layers = 4;
  assert(CacheDirectory::Inspect(path, layered) == CacheState::kStale);

  auto challenged                        = ctx;
  challenged.parameters.porep_challenges = 3;
  assert(CacheDirectory::Inspect(path, challenged) == CacheState::kStale);

  auto partitioned                        = ctx;
  partitioned.parameters.porep_partitions = 2;
  assert(CacheDirectory::Inspect(path, partitioned) == CacheState::kStale);

  // PoSt parameters do not shape cached artifacts.
  auto post                               = ctx;
  post.parameters.post_challenges         = 99;
  post.parameters.post_challenged_sectors = 7;
  assert(CacheDirectory::Inspect(path, post) == CacheState::kPopulated);

  bool threw = false;
  try {
    (void)CacheDirectory::Acquire(path, layered, {}, false);
  } catch (const sealbench::util::IncompatibleCache& e) {
    threw = std::string(e.what()).find("layers=2") != std::string::npos;
  }
  assert(threw);
  assert(fs::exists(path / "precommit-phase1.bin"));
}

void TestUnknownContentsAreStale() {
  TempDir root("cache_unknown");
  auto    path = root / "c";
  fs::create_directories(path);
  std::ofstream(path / "notes.txt") << "hello";

  bool threw = false;
  try {
    (void)CacheDirectory::Acquire(path, Ctx(kSectorSize2KiB, kApiVersion1_0_0), {}, false);
  } catch (const sealbench::util::IncompatibleCache&) {
    threw = true;
  }
  assert(threw);
  assert(fs::exists(path / "notes.txt"));
}

void TestEmptyDirectoryIsAdopted() {
  TempDir root("cache_adopt");
  auto    path = root / "c";
  fs::create_directories(path);

  auto cache = CacheDirectory::Acquire(path, Ctx(kSectorSize2KiB, kApiVersion1_0_0), {}, true);
  assert(cache->InitialState() == CacheState::kFresh);
  assert(fs::exists(path / sealbench::cache::kMarkerFileName));
}

void TestInterruptedWritesAreCleanedOnOpen() {
  TempDir root("cache_tmp");
  auto    path = root / "c";
  {
    auto cache = CacheDirectory::Acquire(path, Ctx(kSectorSize2KiB, kApiVersion1_0_0), {}, true);
    cache->Commit("precommit-phase1", MakeBuffer("labels"));
  }
  std::ofstream(path / "precommit-phase2.bin.tmp") << "half";

  auto cache = CacheDirectory::Acquire(path, Ctx(kSectorSize2KiB, kApiVersion1_0_0), {}, false);
  assert(cache->InitialState() == CacheState::kPopulated);
  assert(!fs::exists(path / "precommit-phase2.bin.tmp"));
  assert(!cache->HasArtifact("precommit-phase2"));
  assert(cache->HasArtifact("precommit-phase1"));
}

void TestDiscardAndReleaseOverride() {
  TempDir root("cache_discard");
  auto    path  = root / "c";
  auto    cache = CacheDirectory::Acquire(path, Ctx(kSectorSize2KiB, kApiVersion1_0_0), {}, false);

  cache->Commit("commit-phase2", MakeBuffer("proof"));
  cache->Discard("commit-phase2");
  cache->Discard("commit-phase2");
  assert(!cache->HasArtifact("commit-phase2"));

  cache->Release(true);
  assert(fs::exists(path));

  bool threw = false;
  try {
    (void)cache->HasArtifact("commit-phase2");
  } catch (const sealbench::util::CacheIo&) {
    threw = true;
  }
  assert(threw);
}

void TestArtifactNamesCannotEscape() {
  TempDir root("cache_names");
  auto    cache = CacheDirectory::Acquire(root / "c", Ctx(kSectorSize2KiB, kApiVersion1_0_0), {}, false);

  bool threw = false;
  try {
    cache->Commit("../escape", MakeBuffer("x"));
  } catch (const sealbench::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

} // namespace

int main() {
  TestGeneratedDirectoryIsRemovedOnRelease();
  TestPreservedDirectoryOutlivesRelease();
  TestCommitIsAtomicAndReadable();
  TestReadingMissingArtifactIsMissingPrerequisite();
  TestMarkerMismatchIsIncompatible();
  TestSealParameterMismatchIsIncompatible();
  TestUnknownContentsAreStale();
  TestEmptyDirectoryIsAdopted();
  TestInterruptedWritesAreCleanedOnOpen();
  TestDiscardAndReleaseOverride();
  TestArtifactNamesCannotEscape();

  std::cout << "sealbench_unit_cache_directory: pass\n";
  return 0;
}
