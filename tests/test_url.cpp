#include "fake_backend.hpp"

#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/observation/observation.hpp"

#include <catch2/catch_test_macros.hpp>

using namespace nrt_predict::observation;
using nrt_predict::ObservationError;
using nrt_predict::testing::FakeRasterBackend;

TEST_CASE("check_url_local_file_candidates") {
  REQUIRE(check_url("") == UrlCheck::MaybeLocalFile);
  REQUIRE(check_url("/data/S2A_pkg") == UrlCheck::MaybeLocalFile);
  REQUIRE(check_url("relative/pkg") == UrlCheck::MaybeLocalFile);
  REQUIRE(check_url("file:///data/pkg") == UrlCheck::MaybeLocalFile);
  REQUIRE(check_url("FILE:///data/pkg") == UrlCheck::MaybeLocalFile);
}

TEST_CASE("check_url_scheme_without_path_is_invalid") {
  REQUIRE(check_url("https://data.example.org") == UrlCheck::Invalid);
  REQUIRE(check_url("s3://bucket") == UrlCheck::Invalid);
  REQUIRE(check_url("mailto:") == UrlCheck::Invalid);
  REQUIRE(check_url("http://[::1/pkg") == UrlCheck::Invalid);
}

TEST_CASE("check_url_accepts_well_formed_urls") {
  REQUIRE(check_url("https://host/path") == UrlCheck::Valid);
  REQUIRE(check_url("s3://dea-public-data/pkg") == UrlCheck::Valid);
  REQUIRE(check_url("http://[::1]/pkg?x=1") == UrlCheck::Valid);
}

TEST_CASE("local_path_strips_file_scheme") {
  REQUIRE(local_path("file:///data/pkg") == "/data/pkg");
  REQUIRE(local_path("/data/pkg") == "/data/pkg");
}

TEST_CASE("package_name_is_last_non_empty_segment") {
  REQUIRE(package_name("https://host/a/b/PKG/") == "PKG");
  REQUIRE(package_name("PKG") == "PKG");
  REQUIRE_THROWS_AS(package_name("///"), ObservationError);
}

TEST_CASE("acquisition_time_from_seventh_token") {
  const std::string url = std::string("https://host/2021-02-05/") + nrt_predict::testing::kPackage;
  REQUIRE(format_time(parse_acquisition_time(url)) == "2021-02-05 05:50:02");

  REQUIRE_THROWS_AS(parse_acquisition_time("https://host/S2A_OPER_MSI"), ObservationError);
  REQUIRE_THROWS_AS(parse_acquisition_time("https://host/A_B_C_D_E_F_notadate_G"),
                    ObservationError);
}

TEST_CASE("raster_paths_use_virtual_file_systems") {
  REQUIRE(to_raster_path("https://host/pkg/") == "/vsicurl/https://host/pkg");
  REQUIRE(to_raster_path("s3://bucket/pkg") == "/vsis3/bucket/pkg");
  REQUIRE(to_raster_path("file:///data/pkg") == "/data/pkg");
  REQUIRE(to_raster_path("/data/pkg") == "/data/pkg");

  REQUIRE(strip_vsi_prefix("/vsicurl/https://host/pkg") == "https://host/pkg");
  REQUIRE(strip_vsi_prefix("/vsis3/bucket/pkg") == "s3://bucket/pkg");
}

TEST_CASE("thumbnail_and_map_urls") {
  REQUIRE(thumbnail_url("/vsicurl/https://host/pkg", "NBAR") ==
          "https://host/pkg/NBAR/NBAR_THUMBNAIL.JPG");
  REQUIRE(map_url("/vsicurl/https://host/pkg/") == "https://host/pkg/map.html");
}

TEST_CASE("footprint_read_directly_when_available") {
  FakeRasterBackend backend;
  backend.vectors["/vsicurl/https://host/pkg/bounds.geojson"] = "POLYGON ((0 0,1 0,1 1,0 0))";

  auto fp = read_footprint("/vsicurl/https://host/pkg", backend);
  REQUIRE(fp.wkt.has_value());
  REQUIRE_FALSE(fp.used_http_fallback);
  REQUIRE(backend.http_requests.empty());
}

TEST_CASE("footprint_falls_back_to_single_http_fetch") {
  FakeRasterBackend backend;
  const std::string body = "POLYGON ((0 0,1 0,1 1,0 0))";
  backend.http["https://host/pkg/bounds.geojson"] = std::vector<uint8_t>(body.begin(), body.end());

  auto fp = read_footprint("/vsicurl/https://host/pkg", backend);
  REQUIRE(fp.used_http_fallback);
  REQUIRE(fp.wkt.has_value());
  REQUIRE(*fp.wkt == body);
  REQUIRE(backend.http_requests.size() == 1);
}

TEST_CASE("footprint_missing_after_fallback_reports_error") {
  FakeRasterBackend backend;

  auto fp = read_footprint("/vsicurl/https://host/pkg", backend);
  REQUIRE_FALSE(fp.wkt.has_value());
  REQUIRE(fp.used_http_fallback);
  REQUIRE_FALSE(fp.error.empty());
  REQUIRE(backend.http_requests.size() == 1);
}
