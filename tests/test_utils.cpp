#include "nrt_predict/core/events.hpp"
#include "nrt_predict/core/types.hpp"
#include "nrt_predict/core/utils.hpp"
#include "nrt_predict/image/processing.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <cmath>
#include <sstream>
#include <string>

namespace core = nrt_predict::core;
namespace image = nrt_predict::image;
using nrt_predict::MaskClass;
using nrt_predict::MaskMatrix;
using nrt_predict::Matrix2Df;
using nrt_predict::Raster;
using nrt_predict::Stage;

TEST_CASE("run_id_has_timestamp_and_hex_suffix") {
  const std::string id = core::get_run_id();
  auto parts = core::split(id, '_');
  REQUIRE(parts.size() == 3);
  REQUIRE(parts[0].size() == 8);
  REQUIRE(parts[1].size() == 6);
  REQUIRE(parts[2].size() == 8);
  REQUIRE(parts[2].find_first_not_of("0123456789abcdef") == std::string::npos);
}

TEST_CASE("string_helpers") {
  REQUIRE(core::trim("  obs \n") == "obs");
  REQUIRE(core::to_lower("GTiff") == "gtiff");
  REQUIRE(core::starts_with("s3://bucket", "s3://"));
  REQUIRE_FALSE(core::ends_with("a.tif", ".vrt"));
  REQUIRE(core::join({"a", "b", "c"}, ", ") == "a, b, c");
  REQUIRE(core::format_bytes(512) == "512 B");
  REQUIRE(core::format_bytes(3 * 1024 * 1024) == "3.0 MiB");
}

TEST_CASE("nan_fraction_counts_all_bands") {
  Raster r;
  r.bands.push_back(Matrix2Df::Zero(2, 2));
  r.bands.push_back(Matrix2Df::Zero(2, 2));
  r.bands[1](0, 0) = std::nanf("");
  REQUIRE(core::count_nan(r) == 1);
  REQUIRE(core::nan_fraction(r) == Catch::Approx(0.125));
}

TEST_CASE("resample_nearest_upscales_blocks") {
  Matrix2Df band(2, 2);
  band << 1.0f, 2.0f,
          3.0f, 4.0f;
  auto out = image::resample_nearest(band, 4, 4);
  REQUIRE(out.rows() == 4);
  REQUIRE(out.cols() == 4);
  REQUIRE(out(0, 1) == 1.0f);
  REQUIRE(out(3, 3) == 4.0f);
}

TEST_CASE("resample_nearest_samples_pixel_centres") {
  Matrix2Df band(1, 3);
  band << 0.0f, 1.0f, 2.0f;
  auto out = image::resample_nearest(band, 10, 1);
  // floor((x + 0.5) * 0.3); corner sampling would give 0 at x = 3
  REQUIRE(out(0, 2) == 0.0f);
  REQUIRE(out(0, 3) == 1.0f);
  REQUIRE(out(0, 6) == 1.0f);
  REQUIRE(out(0, 9) == 2.0f);
}

TEST_CASE("scale_and_mask_blanks_nodata_pixels") {
  Raster r;
  r.bands.push_back(Matrix2Df::Constant(2, 2, 5000.0f));
  MaskMatrix mask = MaskMatrix::Constant(2, 2, static_cast<uint8_t>(MaskClass::CLEAR));
  mask(1, 1) = static_cast<uint8_t>(MaskClass::NODATA);

  image::scale_and_mask(r, 1e-4, mask);

  REQUIRE(r.bands[0](0, 0) == Catch::Approx(0.5f));
  REQUIRE(std::isnan(r.bands[0](1, 1)));
  REQUIRE(image::class_fraction(mask, MaskClass::CLEAR) == Catch::Approx(0.75));
}

TEST_CASE("replace_nodata_with_nan_counts_hits") {
  Matrix2Df band = Matrix2Df::Constant(3, 3, 7.0f);
  band(0, 0) = -9999.0f;
  band(2, 1) = -9999.0f;
  REQUIRE(image::replace_nodata_with_nan(band, -9999.0f) == 2);
  REQUIRE(std::isnan(band(2, 1)));
}

TEST_CASE("event_emitter_writes_json_lines") {
  std::ostringstream out;
  core::EventEmitter events("run42", out);
  events.stage_start(Stage::BUILD_FOOTPRINT);
  events.stop_requested(Stage::INVOKE);

  std::istringstream lines(out.str());
  std::string line;
  REQUIRE(std::getline(lines, line));
  auto first = core::json::parse(line);
  REQUIRE(first["type"] == "stage_start");
  REQUIRE(first["run_id"] == "run42");
  REQUIRE(first["stage_name"] == nrt_predict::stage_to_string(Stage::BUILD_FOOTPRINT));

  REQUIRE(std::getline(lines, line));
  auto second = core::json::parse(line);
  REQUIRE(second["type"] == "stop_requested");
  REQUIRE(second["stage"] == 5);
}
