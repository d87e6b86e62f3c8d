#include "fake_backend.hpp"

#include "nrt_predict/alignment/alignment_cache.hpp"
#include "nrt_predict/core/errors.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <stdexcept>
#include <utility>

using namespace nrt_predict::alignment;
using nrt_predict::NrtError;
using nrt_predict::Raster;
using nrt_predict::config::ModelConfig;
using nrt_predict::config::ModelInputConfig;
using nrt_predict::testing::FakeRaster;
using nrt_predict::testing::FakeRasterBackend;
using nrt_predict::testing::make_grid;
using nrt_predict::testing::make_raster;

namespace {

ModelConfig model(const std::string& name, const std::vector<std::string>& inputs,
                  const std::string& output) {
  ModelConfig m;
  m.name = name;
  m.output = output;
  for (const auto& fn : inputs) {
    ModelInputConfig ip;
    ip.filename = fn;
    m.inputs.push_back(ip);
  }
  return m;
}

AlignmentOptions options(bool nocleanup = false) {
  AlignmentOptions o;
  o.cutline = "/vsimem/clip.geojson";
  o.tmpdir = "/scratch/";
  o.nocleanup = nocleanup;
  return o;
}

// 10x10 single band source with `n_nodata` pixels set to the declared no-data value
void add_source(FakeRasterBackend& backend, const std::string& id, int n_nodata) {
  Raster r = make_raster(10, 10, 1, 5.0f);
  for (int i = 0; i < n_nodata; ++i) {
    r.bands[0](i / 10, i % 10) = -999.0f;
  }
  backend.rasters[id] = FakeRaster{r, make_grid(10, 10), -999.0};
}

} // namespace

TEST_CASE("unique_sources_in_first_appearance_order") {
  std::vector<ModelConfig> models{model("M1", {"A", "B"}, "m1.tif"),
                                  model("M2", {"B", "C"}, "m2.tif")};
  REQUIRE(unique_sources(models) == std::vector<std::string>{"A", "B", "C"});
}

TEST_CASE("unique_sources_skips_outputs_of_earlier_models") {
  std::vector<ModelConfig> models{model("Prev", {}, "prev.tif"),
                                  model("Change", {"prev.tif", "veg.tif"}, "change.tif")};
  REQUIRE(unique_sources(models) == std::vector<std::string>{"veg.tif"});
}

TEST_CASE("shared_source_is_aligned_once") {
  FakeRasterBackend backend;
  add_source(backend, "A", 0);
  add_source(backend, "B", 0);
  add_source(backend, "C", 0);

  std::vector<ModelConfig> models{model("M1", {"A", "B"}, "m1.tif"),
                                  model("M2", {"B", "C"}, "m2.tif")};

  AlignmentCache cache(backend, make_grid(10, 10), options());
  cache.build(unique_sources(models));

  REQUIRE(cache.alignment_count() == 3);
  REQUIRE(backend.total_warps() == 3);
  REQUIRE(backend.warp_calls["B"] == 1);

  cache.align("B");
  REQUIRE(cache.alignment_count() == 3);
  REQUIRE(backend.warp_calls["B"] == 1);
}

TEST_CASE("nodata_becomes_nan_and_is_measured") {
  FakeRasterBackend backend;
  add_source(backend, "A", 25);

  AlignmentCache cache(backend, make_grid(10, 10), options());
  const auto& a = cache.align("A");

  REQUIRE(std::isnan(a.data.bands[0](0, 0)));
  REQUIRE(a.data.bands[0](9, 9) == Catch::Approx(5.0f));
  REQUIRE(a.nodata_fraction == Catch::Approx(0.25));
  REQUIRE_FALSE(a.exceeds_nodata_limit);
}

TEST_CASE("nodata_advisory_is_strictly_above_ninety_percent") {
  FakeRasterBackend backend;
  add_source(backend, "at_limit", 90);
  add_source(backend, "above_limit", 91);

  AlignmentCache cache(backend, make_grid(10, 10), options());
  cache.build({"at_limit", "above_limit"});

  REQUIRE_FALSE(cache.get("at_limit").exceeds_nodata_limit);
  REQUIRE(cache.get("above_limit").exceeds_nodata_limit);
  REQUIRE(cache.advisories() == std::vector<std::string>{"above_limit"});

  REQUIRE_FALSE(exceeds_nodata_limit(0.9));
  REQUIRE(exceeds_nodata_limit(0.9000001));
}

TEST_CASE("warped_raster_is_resampled_to_grid") {
  FakeRasterBackend backend;
  backend.rasters["coarse"] = FakeRaster{make_raster(5, 5, 3, 2.0f), make_grid(5, 5), std::nullopt};

  AlignmentCache cache(backend, make_grid(10, 10), options());
  const auto& a = cache.align("coarse");

  REQUIRE(a.data.band_count() == 3);
  REQUIRE(a.data.width() == 10);
  REQUIRE(a.data.height() == 10);
  REQUIRE(a.data.bands[2](9, 9) == Catch::Approx(2.0f));
}

TEST_CASE("warped_raster_is_read_at_grid_size_with_centre_sampling") {
  FakeRasterBackend backend;
  Raster r = make_raster(3, 3, 1, 0.0f);
  for (int c = 0; c < 3; ++c) {
    r.bands[0].col(c).setConstant(static_cast<float>(c));
  }
  backend.rasters["coarse"] = FakeRaster{r, make_grid(3, 3), std::nullopt};

  AlignmentCache cache(backend, make_grid(10, 10), options());
  const auto& a = cache.align("coarse");

  REQUIRE(backend.read_buffers.size() == 1);
  REQUIRE(backend.read_buffers.begin()->second == std::make_pair(10, 10));
  // ratio 0.3: column 3 samples floor(3.5 * 0.3) = 1
  REQUIRE(a.data.bands[0](0, 2) == Catch::Approx(0.0f));
  REQUIRE(a.data.bands[0](0, 3) == Catch::Approx(1.0f));
  REQUIRE(a.data.bands[0](7, 3) == Catch::Approx(1.0f));
  REQUIRE(a.data.bands[0](0, 9) == Catch::Approx(2.0f));
}

TEST_CASE("scratch_removed_when_read_throws_non_library_error") {
  FakeRasterBackend backend;
  add_source(backend, "A", 0);
  backend.fail_warped_reads = true;

  AlignmentCache cache(backend, make_grid(10, 10), options());
  REQUIRE_THROWS_AS(cache.align("A"), std::runtime_error);
  REQUIRE(backend.removed.size() == 1);
  REQUIRE(backend.removed[0].rfind("/scratch/", 0) == 0);
  REQUIRE_FALSE(cache.contains("A"));
}

TEST_CASE("scratch_files_removed_unless_nocleanup") {
  FakeRasterBackend backend;
  add_source(backend, "A", 0);

  AlignmentCache cache(backend, make_grid(10, 10), options());
  cache.align("A");
  REQUIRE(backend.removed.size() == 1);
  REQUIRE(backend.removed[0].rfind("/scratch/", 0) == 0);

  FakeRasterBackend keep;
  add_source(keep, "A", 0);
  AlignmentCache kept(keep, make_grid(10, 10), options(true));
  kept.align("A");
  REQUIRE(keep.removed.empty());
}

TEST_CASE("copies_are_private") {
  FakeRasterBackend backend;
  add_source(backend, "A", 0);

  AlignmentCache cache(backend, make_grid(10, 10), options());
  cache.align("A");

  Raster mine = cache.copy("A");
  mine.bands[0].setConstant(-1.0f);
  REQUIRE(cache.get("A").data.bands[0](0, 0) == Catch::Approx(5.0f));
}

TEST_CASE("unknown_source_lookup_throws") {
  FakeRasterBackend backend;
  AlignmentCache cache(backend, make_grid(10, 10), options());
  REQUIRE_FALSE(cache.contains("A"));
  REQUIRE_THROWS_AS(cache.get("A"), NrtError);
  REQUIRE_THROWS_AS(cache.align("missing"), NrtError);
}
