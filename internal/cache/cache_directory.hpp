#pragma once

#include <arrow/buffer.h>

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <string_view>

#include "internal/model/api_version.hpp"
#include "internal/model/phase.hpp"
#include "internal/model/sector.hpp"

namespace sealbench::cache {

enum class CacheState {
  kAbsent,    // nothing at the path yet
  kFresh,     // valid marker (or empty directory), no artifacts
  kPopulated, // valid marker and at least one artifact
  kStale,     // marker mismatch or unknown contents
};

std::string_view CacheStateName(CacheState state);

inline constexpr std::string_view kMarkerFileName    = ".sealbench-cache.json";
inline constexpr std::string_view kArtifactExtension = ".bin";
inline constexpr std::string_view kTempExtension     = ".tmp";

/*
  Persistent working directory of one pipeline run.

  Properties:
    - a marker file pins the sector size, API version and sealing
      parameters the directory was created for; reopening with other values
      is rejected
    - artifact writes are atomic (write tmp, flush, rename)
    - the directory is removed on release unless preserved

  Not thread-safe. Prodbench gives every sector its own directory.
*/
class CacheDirectory {
 public:
  /*
    Opens or creates the cache directory.

    An empty path_hint creates <root>/sealbench-<uuid> (root defaults to the
    system temp directory). Throws IncompatibleCache for stale directories
    and CacheIo for filesystem failures.
  */
  static std::unique_ptr<CacheDirectory> Acquire(const std::filesystem::path& path_hint,
                                                 const model::SealContext&    ctx,
                                                 const std::filesystem::path& root,
                                                 bool                         preserve);

  // Classifies path for the given run parameters without touching it.
  static CacheState Inspect(const std::filesystem::path& path, const model::SealContext& ctx);

  ~CacheDirectory();

  CacheDirectory(const CacheDirectory&)            = delete;
  CacheDirectory& operator=(const CacheDirectory&) = delete;

  const std::filesystem::path& Path() const {
    return path_;
  }

  // State found when the directory was acquired.
  CacheState InitialState() const {
    return initial_state_;
  }

  uint64_t SectorSize() const {
    return sector_size_;
  }

  const model::ApiVersion& ApiVersion() const {
    return api_version_;
  }

  bool Preserve() const {
    return preserve_;
  }

  bool HasArtifact(std::string_view name) const;

  std::filesystem::path ArtifactPath(std::string_view name) const;

  model::ArtifactRef Describe(std::string_view name) const;

  std::shared_ptr<arrow::Buffer> Read(std::string_view name) const;

  model::ArtifactRef Commit(std::string_view name, const std::shared_ptr<arrow::Buffer>& data);

  // Removes one artifact; a missing artifact is not an error.
  void Discard(std::string_view name);

  void Release(bool preserve);

  void Release() {
    Release(preserve_);
  }

 private:
  CacheDirectory(std::filesystem::path path, uint64_t sector_size, model::ApiVersion api_version, bool preserve, CacheState initial_state);

  void EnsureOpen() const;

  std::filesystem::path path_;
  uint64_t              sector_size_;
  model::ApiVersion     api_version_;
  bool                  preserve_;
  CacheState            initial_state_;
  bool                  released_{false};
};

} // namespace sealbench::cache
