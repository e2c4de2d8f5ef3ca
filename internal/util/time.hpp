#pragma once

#include <chrono>
#include <cstdint>
#include <utility>

#include "google/protobuf/timestamp.pb.h"

namespace sealbench::util {

/*
  Time utilities, the single place that controls clock sources.

  Benchmarks record both wall-clock time (steady clock) and process CPU time.
*/

using Clock     = std::chrono::system_clock;
using TimePoint = Clock::time_point;

TimePoint Now();

google::protobuf::Timestamp ToProto(TimePoint tp);
TimePoint                   FromProto(const google::protobuf::Timestamp& ts);

uint64_t ToUnixMillis(TimePoint tp);

struct Measurement {
  std::chrono::nanoseconds wall{0};
  std::chrono::nanoseconds cpu{0};

  Measurement& operator+=(const Measurement& other) {
    wall += other.wall;
    cpu += other.cpu;
    return *this;
  }
};

std::chrono::nanoseconds ProcessCpuTime();

class Stopwatch {
 public:
  Stopwatch();

  Measurement Elapsed() const;

 private:
  std::chrono::steady_clock::time_point wall_start_;
  std::chrono::nanoseconds              cpu_start_;
};

/*
  Runs fn and returns its result together with the time it took.
*/
template <typename Fn>
auto Measure(Fn&& fn) {
  Stopwatch watch;
  auto      value = std::forward<Fn>(fn)();
  return std::make_pair(std::move(value), watch.Elapsed());
}

} // namespace sealbench::util
