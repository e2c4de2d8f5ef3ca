#include "internal/config/config_loader.hpp"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>

#include "internal/model/sector.hpp"
#include "internal/util/errors.hpp"
#include "test_support.hpp"

namespace {

std::filesystem::path WriteYaml(const sealbench::testing::TempDir& dir, const std::string& test_name, const std::string& yaml_content) {
  const auto    file_path = dir / (test_name + ".yaml");
  std::ofstream out(file_path);
  out << yaml_content;
  out.close();

  return file_path;
}

void TestFullConfigParses() {
  sealbench::testing::TempDir dir("config_full");
  const auto                  yaml_path = WriteYaml(dir, "full",
                                   R"(logging:
  level: debug
  pattern: "[%l] %v"
observability:
  tracing_enabled: false
  metrics_enabled: false
  otlp_endpoint: "localhost:4317"
  transport: OTLP_TRANSPORT_HTTP
cache:
  root_path: "/var/tmp/sealbench"
engine:
  kind: reference
  parameters:
    stacked_layers: 4
    porep_challenges: 8
)");

  auto config = sealbench::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "debug");
  assert(config.logging().pattern() == "[%l] %v");
  assert(config.observability().otlp_endpoint() == "localhost:4317");
  assert(config.observability().transport() == sealbench::runtime::config::OTLP_TRANSPORT_HTTP);
  assert(config.observability().service_name() == "sealbench");
  assert(config.cache().root_path() == "/var/tmp/sealbench");
  assert(config.engine().parameters().stacked_layers() == 4);

  auto params = sealbench::model::ProofParameters::ForSectorSize(sealbench::model::kSectorSize2KiB).WithOverrides(config.engine().parameters());
  assert(params.layers == 4);
  assert(params.porep_challenges == 8);
  assert(params.porep_partitions == 1);
}

void TestEmptyFileYieldsDefaults() {
  sealbench::testing::TempDir dir("config_empty");
  const auto                  yaml_path = WriteYaml(dir, "empty", "");

  auto config = sealbench::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  assert(config.logging().level() == "info");
  assert(config.engine().kind() == "reference");
  assert(config.cache().root_path().empty());
}

void TestUnknownFieldsAreRejected() {
  sealbench::testing::TempDir dir("config_unknown");
  const auto                  yaml_path = WriteYaml(dir, "unknown_field",
                                   R"(logging:
  level: info
unknown_field: 123
)");

  bool threw = false;
  try {
    (void)sealbench::config::ConfigLoader::LoadFromYaml(yaml_path.string());
  } catch (const sealbench::util::InvalidArgument&) {
    threw = true;
  }

  assert(threw && "ConfigLoader must reject unknown fields.");
}

void TestMissingFileIsRejected() {
  bool threw = false;
  try {
    (void)sealbench::config::ConfigLoader::LoadFromYaml("/nonexistent/sealbench/config.yaml");
  } catch (const sealbench::util::InvalidArgument&) {
    threw = true;
  }
  assert(threw);
}

void TestLoadFallsBackToEnvironmentThenDefaults() {
  sealbench::testing::TempDir dir("config_env");
  const auto                  yaml_path = WriteYaml(dir, "env", "logging:\n  level: warn\n");

  ::setenv("SEALBENCH_CONFIG", yaml_path.c_str(), 1);
  assert(sealbench::config::ConfigLoader::Load("").logging().level() == "warn");

  ::unsetenv("SEALBENCH_CONFIG");
  assert(sealbench::config::ConfigLoader::Load("").logging().level() == "info");
}

} // namespace

int main() {
  TestFullConfigParses();
  TestEmptyFileYieldsDefaults();
  TestUnknownFieldsAreRejected();
  TestMissingFileIsRejected();
  TestLoadFallsBackToEnvironmentThenDefaults();

  std::cout << "sealbench_unit_config_loader: pass\n";
  return 0;
}
