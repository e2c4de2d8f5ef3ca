#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "internal/model/api_version.hpp"
#include "internal/model/phase.hpp"
#include "internal/prodbench/prodbench.hpp"

namespace sealbench::cli {

inline constexpr int kExitOk      = 0;
inline constexpr int kExitUsage   = 1;
inline constexpr int kExitFailure = 2;

enum class Command {
  kHelp,
  kWindowPost,
  kWinningPost,
  kHashConstraints,
  kMerkleProofs,
  kProdbench,
  kAggregateProof,
};

std::string_view CommandName(Command command);

/*
  Parsed invocation:

    sealbench [--runtime-config <path>] <subcommand> [flags]

  Only the fields of the selected subcommand are meaningful.
*/
struct CommandLine {
  std::string runtime_config;
  Command     command = Command::kHelp;

  // window-post, winning-post, merkleproofs, aggregate-proof
  uint64_t          size = 0;
  model::ApiVersion api_version;

  // window-post
  std::string       cache;
  bool              preserve_cache = false;
  model::PhaseFlags flags;
  bool              test_resume = false;

  // merkleproofs
  uint64_t proofs   = 1024;
  bool     validate = true;

  // aggregate-proof
  uint64_t num_agg = 128;

  // prodbench
  std::string            prodbench_config;
  prodbench::StageFlags stage_flags;
};

/*
  Parses argv without the program name. Flags take "--flag value" or
  "--flag=value". Throws InvalidArgument for usage errors, InvalidSize and
  InvalidApiVersion for bad values.
*/
CommandLine ParseCommandLine(const std::vector<std::string>& args);

std::string Usage();

} // namespace sealbench::cli
