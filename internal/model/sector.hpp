#pragma once

#include <array>
#include <cstdint>

#include "internal/model/api_version.hpp"

namespace sealbench::runtime::config {
class ProofParameterOverrides;
}

namespace sealbench::model {

inline constexpr uint64_t kNodeSize = 32;

inline constexpr uint64_t kSectorSize2KiB   = 2ULL << 10;
inline constexpr uint64_t kSectorSize8MiB   = 8ULL << 20;
inline constexpr uint64_t kSectorSize512MiB = 512ULL << 20;
inline constexpr uint64_t kSectorSize32GiB  = 32ULL << 30;
inline constexpr uint64_t kSectorSize64GiB  = 64ULL << 30;

inline constexpr std::array<uint64_t, 5> kSupportedSectorSizes = {
    kSectorSize2KiB, kSectorSize8MiB, kSectorSize512MiB, kSectorSize32GiB, kSectorSize64GiB};

bool IsSupportedSectorSize(uint64_t bytes);

// Returns bytes unchanged, or throws InvalidSize.
uint64_t ValidateSectorSize(uint64_t bytes);

/*
  Knobs the proving backend derives its circuits from. Defaults follow the
  sector size class; overrides of 0 keep the default.
*/
struct ProofParameters {
  uint32_t layers                  = 2;
  uint64_t porep_challenges        = 2;
  uint32_t porep_partitions        = 1;
  uint64_t post_challenges         = 10;
  uint64_t post_challenged_sectors = 2;
  uint64_t winning_post_challenges = 66;

  static ProofParameters ForSectorSize(uint64_t sector_size);

  ProofParameters WithOverrides(const runtime::config::ProofParameterOverrides& overrides) const;
};

/*
  Everything a proof engine call is parameterized by. One SealContext is
  threaded through every phase of a pipeline so size and version cannot
  drift between phases.
*/
struct SealContext {
  uint64_t        sector_size = kSectorSize2KiB;
  ApiVersion      api_version;
  ProofParameters parameters;
  uint64_t        sector_id = 0;

  uint64_t Nodes() const {
    return sector_size / kNodeSize;
  }

  // Validates size and derives default parameters.
  static SealContext Make(uint64_t sector_size, ApiVersion api_version, uint64_t sector_id = 0);
};

} // namespace sealbench::model
