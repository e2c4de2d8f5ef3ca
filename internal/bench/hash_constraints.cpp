#include "hash_constraints.hpp"

#include <string>
#include <utility>

#include "internal/bench/report.hpp"
#include "internal/bench/runner_support.hpp"
#include "internal/observability/logging.hpp"
#include "internal/observability/spans.hpp"
#include "internal/util/arrow_utils.hpp"

namespace sealbench::bench {

HashConstraintsRunner::HashConstraintsRunner(std::shared_ptr<engine::ProofEngine> engine) : engine_(std::move(engine)) {
}

sealbench::v1::HashConstraintsReport HashConstraintsRunner::Run(const HashBenchOptions& options) {
  if (options.iterations == 0) {
    throw util::InvalidArgument("hash benchmark needs at least one iteration");
  }

  observability::SpanScope span("sealbench.hash_constraints");

  sealbench::v1::HashConstraintsReport report;
  *report.mutable_metadata() = BuildMetadata(*engine_);

  std::string input(options.input_bytes, '\0');
  for (std::size_t i = 0; i < input.size(); ++i) {
    input[i] = static_cast<char>(i);
  }
  const auto data = util::MakeBuffer(std::move(input));

  for (const auto& hasher : engine_->Hashers()) {
    auto* result = report.add_hashers();
    result->set_name(hasher);
    result->set_iterations(options.iterations);
    result->set_input_bytes(options.input_bytes);

    if (auto constraints = engine_->CircuitConstraints(hasher)) {
      result->set_has_constraints(true);
      result->set_constraints(*constraints);
    }

    util::Measurement total;
    for (uint64_t i = 0; i < options.iterations; ++i) {
      total += TimedEngineCall("hash " + hasher, [&] { return engine_->Hash(hasher, data); }).second;
    }
    *result->mutable_time() = ToProto(total);
    result->set_average_ns(AverageNs(total, options.iterations));

    SEALBENCH_LOG_INFO("hasher measured",
                       {observability::StringField("hasher", hasher),
                        observability::BoolField("has_constraints", result->has_constraints()),
                        observability::IntField("average_ns", static_cast<std::int64_t>(result->average_ns()))});
  }
  return report;
}

} // namespace sealbench::bench
