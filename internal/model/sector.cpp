#include "sector.hpp"

#include "config/config.pb.h"
#include "internal/util/byte_size.hpp"
#include "internal/util/errors.hpp"

namespace sealbench::model {

bool IsSupportedSectorSize(uint64_t bytes) {
  for (auto size : kSupportedSectorSizes) {
    if (size == bytes) {
      return true;
    }
  }
  return false;
}

uint64_t ValidateSectorSize(uint64_t bytes) {
  if (!IsSupportedSectorSize(bytes)) {
    throw util::InvalidSize("unsupported sector size " + std::to_string(bytes) + " (" + util::FormatByteSize(bytes) +
                            "); supported: 2KiB, 8MiB, 512MiB, 32GiB, 64GiB");
  }
  return bytes;
}

ProofParameters ProofParameters::ForSectorSize(uint64_t sector_size) {
  ProofParameters params;
  if (sector_size >= kSectorSize32GiB) {
    params.layers                  = 11;
    params.porep_challenges        = 176;
    params.porep_partitions        = 10;
    params.post_challenged_sectors = sector_size == kSectorSize64GiB ? 2300 : 2349;
  }
  return params;
}

ProofParameters ProofParameters::WithOverrides(const runtime::config::ProofParameterOverrides& overrides) const {
  ProofParameters params = *this;
  if (overrides.stacked_layers() != 0) params.layers = overrides.stacked_layers();
  if (overrides.porep_challenges() != 0) params.porep_challenges = overrides.porep_challenges();
  if (overrides.porep_partitions() != 0) params.porep_partitions = overrides.porep_partitions();
  if (overrides.post_challenges() != 0) params.post_challenges = overrides.post_challenges();
  if (overrides.post_challenged_nodes() != 0) params.post_challenged_sectors = overrides.post_challenged_nodes();
  if (overrides.winning_post_challenges() != 0) params.winning_post_challenges = overrides.winning_post_challenges();
  return params;
}

SealContext SealContext::Make(uint64_t sector_size, ApiVersion api_version, uint64_t sector_id) {
  SealContext ctx;
  ctx.sector_size = ValidateSectorSize(sector_size);
  ctx.api_version = api_version;
  ctx.parameters  = ProofParameters::ForSectorSize(sector_size);
  ctx.sector_id   = sector_id;
  return ctx;
}

} // namespace sealbench::model
