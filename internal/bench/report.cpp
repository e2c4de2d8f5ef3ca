#include "report.hpp"

#include <google/protobuf/util/json_util.h>
#include <unistd.h>

#include <chrono>
#include <thread>

#include "internal/util/build_info.hpp"
#include "internal/util/errors.hpp"

namespace sealbench::bench {

namespace {

uint64_t Micros(std::chrono::nanoseconds value) {
  return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::microseconds>(value).count());
}

std::string Hostname() {
  char buffer[256] = {};
  if (gethostname(buffer, sizeof(buffer) - 1) != 0) {
    return "unknown";
  }
  return buffer;
}

} // namespace

sealbench::v1::Measurement ToProto(const util::Measurement& measurement) {
  sealbench::v1::Measurement out;
  out.set_wall_time_us(Micros(measurement.wall));
  out.set_cpu_time_us(Micros(measurement.cpu));
  return out;
}

sealbench::v1::Phase ToProto(model::Phase phase) {
  switch (phase) {
    case model::Phase::kPrecommitPhase1:
      return sealbench::v1::PHASE_PRECOMMIT_1;
    case model::Phase::kPrecommitPhase2:
      return sealbench::v1::PHASE_PRECOMMIT_2;
    case model::Phase::kCommitPhase1:
      return sealbench::v1::PHASE_COMMIT_1;
    case model::Phase::kCommitPhase2:
      return sealbench::v1::PHASE_COMMIT_2;
  }
  return sealbench::v1::PHASE_UNSPECIFIED;
}

sealbench::v1::PhaseTiming ToProto(const model::PhaseResult& result, uint32_t sector_index) {
  sealbench::v1::PhaseTiming out;
  out.set_phase(ToProto(result.phase));
  out.set_skipped(result.skipped);
  *out.mutable_time() = ToProto(result.elapsed);
  out.set_artifact(result.artifact.path.string());
  out.set_digest(result.artifact.digest);
  out.set_artifact_bytes(result.artifact.size_bytes);
  out.set_sector_index(sector_index);
  return out;
}

uint64_t AverageNs(const util::Measurement& total, uint64_t count) {
  if (count == 0) {
    return 0;
  }
  return static_cast<uint64_t>(total.wall.count()) / count;
}

sealbench::v1::RunMetadata BuildMetadata(const engine::ProofEngine& engine) {
  sealbench::v1::RunMetadata metadata;
  *metadata.mutable_started_at() = util::ToProto(util::Now());
  metadata.set_hostname(Hostname());
  metadata.set_cpu_count(std::thread::hardware_concurrency());
  metadata.set_engine(engine.Name());
  metadata.set_tool_version(std::string(util::kToolVersion));
  return metadata;
}

std::string ToJson(const google::protobuf::Message& message) {
  google::protobuf::util::JsonPrintOptions options;
  options.add_whitespace                = true;
  options.preserve_proto_field_names    = true;
  options.always_print_primitive_fields = true;

  std::string json;
  auto        status = google::protobuf::util::MessageToJsonString(message, &json, options);
  if (!status.ok()) {
    throw util::InvalidArgument("failed to encode " + message.GetTypeName() + " as JSON: " + std::string(status.message()));
  }
  return json;
}

void ParseJson(std::string_view json, google::protobuf::Message* message) {
  google::protobuf::util::JsonParseOptions options;
  options.ignore_unknown_fields = false;

  auto status = google::protobuf::util::JsonStringToMessage(std::string(json), message, options);
  if (!status.ok()) {
    throw util::MalformedInputDocument("invalid " + message->GetTypeName() + " document: " + std::string(status.message()));
  }
}

} // namespace sealbench::bench
