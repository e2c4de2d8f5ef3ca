#include "command_line.hpp"

#include <sstream>

#include "internal/util/byte_size.hpp"
#include "internal/util/errors.hpp"

namespace sealbench::cli {

namespace {

struct Flag {
  std::string                name;
  std::optional<std::string> inline_value;
};

class Args {
 public:
  explicit Args(const std::vector<std::string>& args) : args_(args) {
  }

  bool Done() const {
    return pos_ >= args_.size();
  }

  const std::string& Peek() const {
    return args_[pos_];
  }

  std::string Next() {
    return args_[pos_++];
  }

  // Next argument when it is a value rather than another flag.
  std::optional<std::string> NextValue() {
    if (Done() || Peek().rfind("--", 0) == 0) {
      return std::nullopt;
    }
    return Next();
  }

 private:
  const std::vector<std::string>& args_;
  std::size_t                     pos_ = 0;
};

Flag SplitFlag(const std::string& arg) {
  if (arg.rfind("--", 0) != 0 || arg.size() == 2) {
    throw util::InvalidArgument("unexpected argument: " + arg);
  }
  auto eq = arg.find('=');
  if (eq == std::string::npos) {
    return {arg.substr(2), std::nullopt};
  }
  return {arg.substr(2, eq - 2), arg.substr(eq + 1)};
}

std::string RequireValue(const Flag& flag, Args& args) {
  if (flag.inline_value) {
    return *flag.inline_value;
  }
  auto value = args.NextValue();
  if (!value) {
    throw util::InvalidArgument("--" + flag.name + " requires a value");
  }
  return *value;
}

bool ParseBool(const std::string& value, const std::string& flag) {
  if (value == "true" || value == "1") {
    return true;
  }
  if (value == "false" || value == "0") {
    return false;
  }
  throw util::InvalidArgument("--" + flag + " expects true or false, got '" + value + "'");
}

// Switch flags: "--flag" alone means true, "--flag=false" is accepted.
bool SwitchValue(const Flag& flag) {
  return flag.inline_value ? ParseBool(*flag.inline_value, flag.name) : true;
}

uint64_t ParseCount(const std::string& value, const std::string& flag) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw util::InvalidArgument("--" + flag + " expects a non-negative integer, got '" + value + "'");
  }
  try {
    return std::stoull(value);
  } catch (const std::out_of_range&) {
    throw util::InvalidArgument("--" + flag + " is out of range: " + value);
  }
}

Command ParseCommand(const std::string& name) {
  if (name == "window-post") return Command::kWindowPost;
  if (name == "winning-post") return Command::kWinningPost;
  if (name == "hash-constraints") return Command::kHashConstraints;
  if (name == "merkleproofs") return Command::kMerkleProofs;
  if (name == "prodbench") return Command::kProdbench;
  if (name == "aggregate-proof") return Command::kAggregateProof;
  if (name == "help") return Command::kHelp;
  throw util::InvalidArgument("unknown subcommand: " + name);
}

[[noreturn]] void UnknownFlag(Command command, const Flag& flag) {
  throw util::InvalidArgument("unknown flag --" + flag.name + " for " + std::string(CommandName(command)));
}

// Flags shared by the commands that seal a sector; false when not one of them.
bool ParseSectorFlag(const Flag& flag, Args& args, CommandLine* line, bool* size_seen) {
  if (flag.name == "size") {
    line->size = util::ParseByteSize(RequireValue(flag, args));
    *size_seen = true;
    return true;
  }
  if (flag.name == "api-version") {
    line->api_version = model::ApiVersion::Parse(RequireValue(flag, args));
    return true;
  }
  return false;
}

} // namespace

std::string_view CommandName(Command command) {
  switch (command) {
    case Command::kHelp:
      return "help";
    case Command::kWindowPost:
      return "window-post";
    case Command::kWinningPost:
      return "winning-post";
    case Command::kHashConstraints:
      return "hash-constraints";
    case Command::kMerkleProofs:
      return "merkleproofs";
    case Command::kProdbench:
      return "prodbench";
    case Command::kAggregateProof:
      return "aggregate-proof";
  }
  return "unknown";
}

CommandLine ParseCommandLine(const std::vector<std::string>& argv) {
  CommandLine line;
  line.api_version = model::ApiVersion::Parse(model::kDefaultApiVersion);

  Args args(argv);

  // ------------------------------------------------------------
  // Global flags
  // ------------------------------------------------------------
  while (!args.Done() && args.Peek().rfind("--", 0) == 0) {
    auto flag = SplitFlag(args.Next());
    if (flag.name == "runtime-config") {
      line.runtime_config = RequireValue(flag, args);
    } else if (flag.name == "help") {
      line.command = Command::kHelp;
      return line;
    } else {
      throw util::InvalidArgument("unknown global flag --" + flag.name);
    }
  }

  if (args.Done()) {
    throw util::InvalidArgument("missing subcommand");
  }
  line.command = ParseCommand(args.Next());

  // ------------------------------------------------------------
  // Subcommand flags
  // ------------------------------------------------------------
  bool size_seen = false;
  while (!args.Done()) {
    auto flag = SplitFlag(args.Next());
    if (flag.name == "help") {
      line.command = Command::kHelp;
      return line;
    }

    switch (line.command) {
      case Command::kWindowPost:
        if (ParseSectorFlag(flag, args, &line, &size_seen)) {
        } else if (flag.name == "cache") {
          line.cache = RequireValue(flag, args);
        } else if (flag.name == "preserve-cache") {
          line.preserve_cache = SwitchValue(flag);
        } else if (flag.name == "skip-precommit-phase1") {
          line.flags.skip_precommit_phase1 = SwitchValue(flag);
        } else if (flag.name == "skip-precommit-phase2") {
          line.flags.skip_precommit_phase2 = SwitchValue(flag);
        } else if (flag.name == "skip-commit-phase1") {
          line.flags.skip_commit_phase1 = SwitchValue(flag);
        } else if (flag.name == "skip-commit-phase2") {
          line.flags.skip_commit_phase2 = SwitchValue(flag);
        } else if (flag.name == "test-resume") {
          line.test_resume = SwitchValue(flag);
        } else {
          UnknownFlag(line.command, flag);
        }
        break;

      case Command::kWinningPost:
        if (!ParseSectorFlag(flag, args, &line, &size_seen)) {
          UnknownFlag(line.command, flag);
        }
        break;

      case Command::kMerkleProofs:
        if (flag.name == "size") {
          line.size = util::ParseByteSize(RequireValue(flag, args));
          size_seen = true;
        } else if (flag.name == "proofs") {
          line.proofs = ParseCount(RequireValue(flag, args), flag.name);
        } else if (flag.name == "validate") {
          // Value is optional: "--validate", "--validate false", "--validate=false".
          if (flag.inline_value) {
            line.validate = ParseBool(*flag.inline_value, flag.name);
          } else if (!args.Done() && (args.Peek() == "true" || args.Peek() == "false")) {
            line.validate = ParseBool(args.Next(), flag.name);
          } else {
            line.validate = true;
          }
        } else {
          UnknownFlag(line.command, flag);
        }
        break;

      case Command::kAggregateProof:
        if (ParseSectorFlag(flag, args, &line, &size_seen)) {
        } else if (flag.name == "num_agg" || flag.name == "num-agg") {
          line.num_agg = ParseCount(RequireValue(flag, args), flag.name);
        } else {
          UnknownFlag(line.command, flag);
        }
        break;

      case Command::kProdbench:
        if (flag.name == "config") {
          line.prodbench_config = RequireValue(flag, args);
        } else if (flag.name == "skip-seal-proof") {
          line.stage_flags.skip_seal_proof = SwitchValue(flag);
        } else if (flag.name == "skip-post-proof") {
          line.stage_flags.skip_post_proof = SwitchValue(flag);
        } else if (flag.name == "only-replicate") {
          line.stage_flags.only_replicate = SwitchValue(flag);
        } else if (flag.name == "only-add-piece") {
          line.stage_flags.only_add_piece = SwitchValue(flag);
        } else {
          UnknownFlag(line.command, flag);
        }
        break;

      case Command::kHashConstraints:
      case Command::kHelp:
        UnknownFlag(line.command, flag);
    }
  }

  const bool needs_size = line.command == Command::kWindowPost || line.command == Command::kWinningPost ||
                          line.command == Command::kMerkleProofs || line.command == Command::kAggregateProof;
  if (needs_size && !size_seen) {
    throw util::InvalidArgument(std::string(CommandName(line.command)) + " requires --size");
  }

  return line;
}

std::string Usage() {
  std::ostringstream out;
  out << "Usage:\n"
      << "  sealbench [--runtime-config <path>] <subcommand> [flags]\n"
      << "\n"
      << "Subcommands:\n"
      << "  window-post --size <bytes> [--api-version 1.0.0] [--cache <dir>] [--preserve-cache]\n"
      << "              [--skip-precommit-phase1] [--skip-precommit-phase2]\n"
      << "              [--skip-commit-phase1] [--skip-commit-phase2] [--test-resume]\n"
      << "  winning-post --size <bytes> [--api-version 1.0.0]\n"
      << "  hash-constraints\n"
      << "  merkleproofs --size <bytes> [--proofs 1024] [--validate [true|false]]\n"
      << "  prodbench [--config <path>] [--skip-seal-proof] [--skip-post-proof]\n"
      << "            [--only-replicate] [--only-add-piece]\n"
      << "  aggregate-proof --size <bytes> [--num_agg 128] [--api-version 1.0.0]\n"
      << "\n"
      << "Sizes accept 2048, 2KiB, 2KB, 1.5MiB. Reports are written to stdout as JSON.\n"
      << "Exit status: 0 success, 1 usage error, 2 benchmark failure.\n";
  return out.str();
}

} // namespace sealbench::cli
