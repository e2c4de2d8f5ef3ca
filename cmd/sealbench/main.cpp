#include <csignal>
#include <iostream>
#include <string>
#include <vector>

#include "internal/cli/command_line.hpp"
#include "internal/cli/commands.hpp"
#include "internal/config/config_loader.hpp"
#include "internal/engine/engine_factory.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/cancellation.hpp"
#include "internal/util/errors.hpp"

using sealbench::cli::kExitFailure;
using sealbench::cli::kExitOk;
using sealbench::cli::kExitUsage;
using sealbench::observability::StringField;

static sealbench::util::CancellationToken g_cancel;

// First signal requests a cooperative stop; a second one terminates.
static void HandleSignal(int signum) {
  g_cancel.Cancel();
  std::signal(signum, SIG_DFL);
}

static void Shutdown() {
  sealbench::observability::ShutdownLogging();
  sealbench::observability::ShutdownMetrics();
  sealbench::observability::ShutdownTracing();
}

int main(int argc, char** argv) {
  // stdout carries the report; route logs to stderr before anything can log.
  sealbench::observability::InitializeLogging(sealbench::config::ConfigLoader::Defaults());

  std::vector<std::string> args(argv + 1, argv + argc);

  sealbench::cli::CommandLine line;
  try {
    line = sealbench::cli::ParseCommandLine(args);
  } catch (const sealbench::util::BenchError& e) {
    std::cerr << "sealbench: " << e.what() << "\n\n" << sealbench::cli::Usage();
    return kExitUsage;
  }

  if (line.command == sealbench::cli::Command::kHelp) {
    std::cout << sealbench::cli::Usage();
    return kExitOk;
  }

  try {
    // ------------------------------------------------------------
    // Load configuration
    // ------------------------------------------------------------
    auto config = sealbench::config::ConfigLoader::Load(line.runtime_config);

    sealbench::observability::InitializeTracing(config);
    sealbench::observability::InitializeMetrics(config);
    sealbench::observability::InitializeLogging(config);

    // ------------------------------------------------------------
    // Build engine
    // ------------------------------------------------------------
    auto engine = sealbench::engine::EngineFactory::Build(config.engine());

    // Cancellation is honored between phases only.
    std::signal(SIGINT, HandleSignal);
    std::signal(SIGTERM, HandleSignal);

    SEALBENCH_LOG_INFO("sealbench started",
                       {StringField("command", sealbench::cli::CommandName(line.command)), StringField("engine", engine->Name())});

    // ------------------------------------------------------------
    // Run benchmark
    // ------------------------------------------------------------
    auto result = sealbench::cli::Dispatch(line, config, engine, &g_cancel, std::cin);
    std::cout << result.json << std::endl;

    if (!result.success) {
      SEALBENCH_LOG_ERROR("benchmark reported a failed stage", {StringField("command", sealbench::cli::CommandName(line.command))});
      Shutdown();
      return kExitFailure;
    }
  } catch (const std::exception& e) {
    SEALBENCH_LOG_ERROR("benchmark failed",
                        {StringField("kind", sealbench::util::ErrorKindName(sealbench::util::KindOf(e))), StringField("error", e.what())});
    Shutdown();
    return kExitFailure;
  }

  Shutdown();
  return kExitOk;
}
