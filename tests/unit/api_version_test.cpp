#include "internal/model/api_version.hpp"

#include <cassert>
#include <iostream>
#include <string>

#include "internal/model/sector.hpp"
#include "internal/util/errors.hpp"

namespace {

using sealbench::model::ApiVersion;

bool RejectsVersion(const std::string& text) {
  try {
    (void)ApiVersion::Parse(text);
  } catch (const sealbench::util::InvalidApiVersion&) {
    return true;
  }
  return false;
}

void TestRecognizedVersionsParse() {
  assert(ApiVersion::Parse("1.0.0") == sealbench::model::kApiVersion1_0_0);
  assert(ApiVersion::Parse("1.1.0") == sealbench::model::kApiVersion1_1_0);
  assert(ApiVersion::Parse("1.2.0").ToString() == "1.2.0");
  assert(ApiVersion::Parse(sealbench::model::kDefaultApiVersion) == ApiVersion{});
}

void TestVersionsAreOrdered() {
  assert(sealbench::model::kApiVersion1_0_0 < sealbench::model::kApiVersion1_1_0);
  assert(sealbench::model::kApiVersion1_1_0 < sealbench::model::kApiVersion1_2_0);
  assert(ApiVersion(1, 2, 0) > ApiVersion(1, 1, 9));
}

void TestMalformedAndUnknownVersionsRejected() {
  assert(RejectsVersion(""));
  assert(RejectsVersion("1.0"));
  assert(RejectsVersion("1..0"));
  assert(RejectsVersion("1.0.0.0"));
  assert(RejectsVersion("v1.0.0"));
  assert(RejectsVersion("1.0.0-rc1"));
  assert(RejectsVersion("2.0.0"));
  assert(RejectsVersion("1.3.0"));
  assert(RejectsVersion("99999999999.0.0"));
}

void TestSectorContextCarriesVersion() {
  auto ctx = sealbench::model::SealContext::Make(sealbench::model::kSectorSize2KiB, sealbench::model::kApiVersion1_1_0, 7);
  assert(ctx.api_version == sealbench::model::kApiVersion1_1_0);
  assert(ctx.sector_id == 7);
  assert(ctx.Nodes() == 64);
}

void TestUnsupportedSectorSizeRejected() {
  bool threw = false;
  try {
    (void)sealbench::model::SealContext::Make(4096, ApiVersion{});
  } catch (const sealbench::util::InvalidSize&) {
    threw = true;
  }
  assert(threw);
}

void TestLargeSectorDefaults() {
  auto small = sealbench::model::ProofParameters::ForSectorSize(sealbench::model::kSectorSize8MiB);
  assert(small.layers == 2);
  assert(small.porep_partitions == 1);

  auto large = sealbench::model::ProofParameters::ForSectorSize(sealbench::model::kSectorSize32GiB);
  assert(large.layers == 11);
  assert(large.porep_challenges == 176);
  assert(large.post_challenged_sectors == 2349);
  assert(sealbench::model::ProofParameters::ForSectorSize(sealbench::model::kSectorSize64GiB).post_challenged_sectors == 2300);
}

} // namespace

int main() {
  TestRecognizedVersionsParse();
  TestVersionsAreOrdered();
  TestMalformedAndUnknownVersionsRejected();
  TestSectorContextCarriesVersion();
  TestUnsupportedSectorSizeRejected();
  TestLargeSectorDefaults();

  std::cout << "sealbench_unit_api_version: pass\n";
  return 0;
}
