#pragma once

#include <filesystem>
#include <istream>
#include <memory>
#include <string>

#include "config/config.pb.h"
#include "internal/cli/command_line.hpp"
#include "internal/engine/proof_engine.hpp"
#include "internal/model/sector.hpp"
#include "internal/util/cancellation.hpp"

namespace sealbench::cli {

/*
  Report produced by one subcommand. success is false when the command ran
  to completion but its report records a failure (a FAILED prodbench stage).
*/
struct CommandResult {
  std::string json;
  bool        success = true;
};

// cache.root_path, or the system temp directory when unset.
std::filesystem::path CacheRoot(const sealbench::runtime::config::RuntimeConfig& config);

// Sector context for the sizes on the command line, with config overrides applied.
model::SealContext MakeContext(const CommandLine& line, const sealbench::runtime::config::RuntimeConfig& config);

/*
  Runs the selected subcommand and encodes its report as JSON. Benchmark
  failures propagate as BenchError; input is read only by prodbench when no
  --config is given.
*/
CommandResult Dispatch(const CommandLine&                               line,
                       const sealbench::runtime::config::RuntimeConfig& config,
                       std::shared_ptr<engine::ProofEngine>             engine,
                       const util::CancellationToken*                   cancel,
                       std::istream&                                    input);

} // namespace sealbench::cli
