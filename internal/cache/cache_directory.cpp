#include "cache_directory.hpp"

#include <arrow/io/file.h>
#include <google/protobuf/util/json_util.h>

#include <system_error>
#include <utility>

#include "internal/observability/logging.hpp"
#include "internal/util/arrow_utils.hpp"
#include "internal/util/build_info.hpp"
#include "internal/util/digest.hpp"
#include "internal/util/errors.hpp"
#include "internal/util/time.hpp"
#include "internal/util/uuid.hpp"
#include "sealbench/v1/cache.pb.h"

namespace sealbench::cache {

namespace fs = std::filesystem;

using util::ReadAll;
using util::Unwrap;
using util::View;

namespace {

// Runs fn and reports any non-harness failure as CacheIo.
template <typename Fn>
auto GuardIo(std::string_view action, const fs::path& path, Fn&& fn) {
  try {
    return fn();
  } catch (const util::BenchError&) {
    throw;
  } catch (const std::exception& e) {
    throw util::CacheIo(std::string(action) + " " + path.string() + ": " + e.what());
  }
}

void ValidateArtifactName(std::string_view name) {
  if (name.empty()) {
    throw util::InvalidArgument("artifact name must not be empty");
  }
  for (char c : name) {
    if (c == '/' || c == '\\' || c == '\0') {
      throw util::InvalidArgument("artifact name contains invalid character: " + std::string(name));
    }
  }
  if (name == "." || name == "..") {
    throw util::InvalidArgument("artifact name must not be a relative path component");
  }
}

bool HasSuffix(const std::string& value, std::string_view suffix) {
  return value.size() >= suffix.size() && value.compare(value.size() - suffix.size(), suffix.size(), suffix) == 0;
}

/*
  Atomic write:
      write tmp → flush → rename
*/
void WriteAtomic(const fs::path& final_path, const uint8_t* data, int64_t size) {
  auto tmp_path = final_path.string() + std::string(kTempExtension);

  {
    auto out = Unwrap(arrow::io::FileOutputStream::Open(tmp_path));
    Unwrap(out->Write(data, size));
    Unwrap(out->Flush());
    Unwrap(out->Close());
  }

  fs::rename(tmp_path, final_path);
}

struct Classification {
  CacheState  state = CacheState::kAbsent;
  std::string reason;
  bool        has_marker = false;
};

// Sealing parameters that shape the cached artifacts. PoSt parameters do not.
std::string DescribeSealParameters(uint32_t layers, uint64_t challenges, uint32_t partitions) {
  return "layers=" + std::to_string(layers) + " porep_challenges=" + std::to_string(challenges) + " porep_partitions=" + std::to_string(partitions);
}

Classification Classify(const fs::path& path, const model::SealContext& ctx) {
  const auto& api_version = ctx.api_version;
  if (!fs::exists(path)) {
    return {CacheState::kAbsent, {}, false};
  }
  if (!fs::is_directory(path)) {
    return {CacheState::kStale, "not a directory", false};
  }

  auto marker_path = path / kMarkerFileName;
  bool artifacts   = false;
  bool unknown     = false;
  for (const auto& entry : fs::directory_iterator(path)) {
    const auto name = entry.path().filename().string();
    if (name == kMarkerFileName) {
      continue;
    }
    if (HasSuffix(name, kArtifactExtension)) {
      artifacts = true;
    } else if (!HasSuffix(name, kTempExtension)) {
      unknown = true;
    }
  }

  if (!fs::exists(marker_path)) {
    if (artifacts || unknown) {
      return {CacheState::kStale, "directory is not empty and has no cache marker", false};
    }
    return {CacheState::kFresh, {}, false};
  }

  auto file = Unwrap(arrow::io::ReadableFile::Open(marker_path.string()));
  auto json = ReadAll(file);

  sealbench::v1::CacheMarker marker;
  auto status = google::protobuf::util::JsonStringToMessage(std::string(View(*json)), &marker);
  if (!status.ok()) {
    return {CacheState::kStale, "unreadable cache marker: " + std::string(status.message()), true};
  }
  if (marker.sector_size_bytes() != ctx.sector_size) {
    return {CacheState::kStale,
            "cache was created for sector size " + std::to_string(marker.sector_size_bytes()) + ", run uses " + std::to_string(ctx.sector_size),
            true};
  }
  if (marker.api_version() != api_version.ToString()) {
    return {CacheState::kStale, "cache was created for api version " + marker.api_version() + ", run uses " + api_version.ToString(), true};
  }

  const auto& pinned = marker.parameters();
  const auto& params = ctx.parameters;
  if (pinned.stacked_layers() != params.layers || pinned.porep_challenges() != params.porep_challenges ||
      pinned.porep_partitions() != params.porep_partitions) {
    return {CacheState::kStale,
            "cache was sealed with " + DescribeSealParameters(pinned.stacked_layers(), pinned.porep_challenges(), pinned.porep_partitions()) +
                ", run uses " + DescribeSealParameters(params.layers, params.porep_challenges, params.porep_partitions),
            true};
  }

  return {artifacts ? CacheState::kPopulated : CacheState::kFresh, {}, true};
}

void WriteMarker(const fs::path& path, const model::SealContext& ctx) {
  sealbench::v1::CacheMarker marker;
  marker.set_sector_size_bytes(ctx.sector_size);
  marker.set_api_version(ctx.api_version.ToString());
  marker.mutable_parameters()->set_stacked_layers(ctx.parameters.layers);
  marker.mutable_parameters()->set_porep_challenges(ctx.parameters.porep_challenges);
  marker.mutable_parameters()->set_porep_partitions(ctx.parameters.porep_partitions);
  *marker.mutable_created_at() = util::ToProto(util::Now());
  marker.set_tool_version(std::string(util::kToolVersion));

  google::protobuf::util::JsonPrintOptions options;
  options.preserve_proto_field_names = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(marker, &json, options);
  if (!status.ok()) {
    throw util::CacheIo("failed to serialize cache marker: " + std::string(status.message()));
  }

  WriteAtomic(path / kMarkerFileName, reinterpret_cast<const uint8_t*>(json.data()), static_cast<int64_t>(json.size()));
}

// Leftovers of writes interrupted before their rename.
void RemoveTempFiles(const fs::path& path) {
  for (const auto& entry : fs::directory_iterator(path)) {
    const auto name = entry.path().filename().string();
    if (HasSuffix(name, kTempExtension)) {
      SEALBENCH_LOG_WARN("removing interrupted cache write", {observability::StringField("file", entry.path().string())});
      fs::remove(entry.path());
    }
  }
}

} // namespace

std::string_view CacheStateName(CacheState state) {
  switch (state) {
    case CacheState::kAbsent:
      return "absent";
    case CacheState::kFresh:
      return "fresh";
    case CacheState::kPopulated:
      return "populated";
    case CacheState::kStale:
      return "stale";
  }
  return "unknown";
}

CacheState CacheDirectory::Inspect(const fs::path& path, const model::SealContext& ctx) {
  return GuardIo("inspect", path, [&] { return Classify(path, ctx).state; });
}

std::unique_ptr<CacheDirectory> CacheDirectory::Acquire(const fs::path&           path_hint,
                                                        const model::SealContext& ctx,
                                                        const fs::path&           root,
                                                        bool                      preserve) {
  fs::path path = path_hint;
  if (path.empty()) {
    fs::path parent = root.empty() ? GuardIo("resolve temp directory for", root, [] { return fs::temp_directory_path(); }) : root;
    path            = parent / ("sealbench-" + util::ToString(util::GenerateUUID()));
  }

  auto classification = GuardIo("inspect", path, [&] { return Classify(path, ctx); });

  if (classification.state == CacheState::kStale) {
    throw util::IncompatibleCache("cache directory " + path.string() + " is incompatible: " + classification.reason);
  }

  GuardIo("prepare", path, [&] {
    if (classification.state == CacheState::kAbsent) {
      fs::create_directories(path);
    } else {
      RemoveTempFiles(path);
    }
    if (!classification.has_marker) {
      WriteMarker(path, ctx);
    }
  });

  SEALBENCH_LOG_INFO("cache acquired",
                     {observability::StringField("path", path.string()),
                      observability::StringField("state", CacheStateName(classification.state)),
                      observability::BoolField("preserve", preserve)});

  return std::unique_ptr<CacheDirectory>(new CacheDirectory(std::move(path), ctx.sector_size, ctx.api_version, preserve, classification.state));
}

CacheDirectory::CacheDirectory(fs::path path, uint64_t sector_size, model::ApiVersion api_version, bool preserve, CacheState initial_state)
    : path_(std::move(path)), sector_size_(sector_size), api_version_(api_version), preserve_(preserve), initial_state_(initial_state) {
}

CacheDirectory::~CacheDirectory() {
  try {
    Release(preserve_);
  } catch (const std::exception& e) {
    SEALBENCH_LOG_ERROR("cache release failed", {observability::StringField("path", path_.string()), observability::StringField("error", e.what())});
  }
}

void CacheDirectory::EnsureOpen() const {
  if (released_) {
    throw util::CacheIo("cache directory " + path_.string() + " was already released");
  }
}

fs::path CacheDirectory::ArtifactPath(std::string_view name) const {
  ValidateArtifactName(name);
  return path_ / (std::string(name) + std::string(kArtifactExtension));
}

bool CacheDirectory::HasArtifact(std::string_view name) const {
  EnsureOpen();
  auto path = ArtifactPath(name);
  return GuardIo("stat", path, [&] { return fs::is_regular_file(path); });
}

model::ArtifactRef CacheDirectory::Describe(std::string_view name) const {
  auto buffer = Read(name);
  auto digest = util::Sha256(buffer->data(), static_cast<std::size_t>(buffer->size()));

  model::ArtifactRef ref;
  ref.name       = std::string(name);
  ref.path       = ArtifactPath(name);
  ref.size_bytes = static_cast<uint64_t>(buffer->size());
  ref.digest     = util::ToHex(digest);
  return ref;
}

/*
  Read entire artifact from disk.
*/
std::shared_ptr<arrow::Buffer> CacheDirectory::Read(std::string_view name) const {
  EnsureOpen();
  auto path = ArtifactPath(name);
  if (!GuardIo("stat", path, [&] { return fs::is_regular_file(path); })) {
    throw util::MissingPrerequisite("artifact " + std::string(name) + " is not in cache " + path_.string());
  }
  return GuardIo("read", path, [&] {
    auto file = Unwrap(arrow::io::ReadableFile::Open(path.string()));
    return ReadAll(file);
  });
}

model::ArtifactRef CacheDirectory::Commit(std::string_view name, const std::shared_ptr<arrow::Buffer>& data) {
  EnsureOpen();
  if (!data) {
    throw util::InvalidArgument("cannot commit empty artifact " + std::string(name));
  }
  auto path = ArtifactPath(name);
  GuardIo("write", path, [&] { WriteAtomic(path, data->data(), data->size()); });

  model::ArtifactRef ref;
  ref.name       = std::string(name);
  ref.path       = path;
  ref.size_bytes = static_cast<uint64_t>(data->size());
  ref.digest     = util::ToHex(util::Sha256(data->data(), static_cast<std::size_t>(data->size())));

  SEALBENCH_LOG_DEBUG("artifact committed",
                      {observability::StringField("artifact", ref.name),
                       observability::IntField("bytes", static_cast<std::int64_t>(ref.size_bytes)),
                       observability::StringField("digest", ref.digest)});
  return ref;
}

void CacheDirectory::Discard(std::string_view name) {
  EnsureOpen();
  auto path = ArtifactPath(name);
  GuardIo("remove", path, [&] { fs::remove(path); });
}

void CacheDirectory::Release(bool preserve) {
  if (released_) {
    return;
  }
  released_ = true;

  if (preserve) {
    SEALBENCH_LOG_INFO("cache preserved", {observability::StringField("path", path_.string())});
    return;
  }

  GuardIo("remove", path_, [&] { fs::remove_all(path_); });
  SEALBENCH_LOG_DEBUG("cache removed", {observability::StringField("path", path_.string())});
}

} // namespace sealbench::cache
