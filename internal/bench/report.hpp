#pragma once

#include <google/protobuf/message.h>

#include <cstdint>
#include <string>
#include <string_view>

#include "internal/engine/proof_engine.hpp"
#include "internal/model/phase.hpp"
#include "internal/util/time.hpp"
#include "sealbench/v1.hpp"

namespace sealbench::bench {

/*
  Conversions from in-memory results to report messages, and the JSON
  encoding every command prints.
*/

sealbench::v1::Measurement ToProto(const util::Measurement& measurement);
sealbench::v1::Phase       ToProto(model::Phase phase);
sealbench::v1::PhaseTiming ToProto(const model::PhaseResult& result, uint32_t sector_index = 0);

uint64_t AverageNs(const util::Measurement& total, uint64_t count);

sealbench::v1::RunMetadata BuildMetadata(const engine::ProofEngine& engine);

// snake_case field names, zero values printed.
std::string ToJson(const google::protobuf::Message& message);

// Strict: unknown fields are an error. Throws MalformedInputDocument.
void ParseJson(std::string_view json, google::protobuf::Message* message);

} // namespace sealbench::bench
