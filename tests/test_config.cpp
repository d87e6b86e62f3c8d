#include "nrt_predict/config/configuration.hpp"
#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/core/utils.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>

using namespace nrt_predict::config;
using nrt_predict::ConfigError;
using nrt_predict::ValidationError;

namespace fs = std::filesystem;

namespace {

const char* kYaml = R"(
url: https://data.example.org/S2MSIARD/pkg
quiet: true
product: NBART
urlprefix: https://mirror.example.org
obsscale: 0.001
nocleanup: true
gdalconfig:
  GDAL_DISABLE_READDIR_ON_OPEN: YES
  CPL_CURL_VERBOSE: NO
  CPL_VSIL_CURL_ALLOWED_EXTENSIONS: '.tif,.geojson'
models:
  - name: FirstBand
    output: /vsimem/b02.tif
  - name: NormalizedDifference
    driver: MEM
    output: nd.tif
    nodata: 0
    bands: "(6, 2)"
    ranges:
      clip: "(0.01, 0.3)"
      label: plain
    inputs:
      - filename: prev.tif
        scale: 0.0001
      - filename: dem.tif
)";

fs::path write_temp(const std::string& text) {
  fs::path p = fs::temp_directory_path() /
               ("nrt_predict_cfg_" + nrt_predict::core::random_hex(8) + ".yaml");
  std::ofstream out(p);
  out << text;
  return p;
}

} // namespace

TEST_CASE("config_defaults") {
  Config cfg;
  REQUIRE_FALSE(cfg.quiet);
  REQUIRE(cfg.product == "NBAR");
  REQUIRE(cfg.obstmp == "/vsimem/obs.tif");
  REQUIRE(cfg.urlprefix.empty());
  REQUIRE_FALSE(cfg.tmpdir.empty());
  REQUIRE(cfg.obsscale == Catch::Approx(0.0001));
  REQUIRE(cfg.models.empty());

  ModelConfig m;
  REQUIRE(m.driver == "GTiff");
  REQUIRE(m.inputs.empty());
}

TEST_CASE("config_from_yaml_reads_all_sections") {
  Config cfg = Config::from_yaml(YAML::Load(kYaml));

  REQUIRE(cfg.quiet);
  REQUIRE(cfg.product == "NBART");
  REQUIRE(cfg.urlprefix == "https://mirror.example.org");
  REQUIRE(cfg.obsscale == Catch::Approx(0.001));
  REQUIRE(cfg.nocleanup);

  REQUIRE(cfg.gdalconfig.options.at("GDAL_DISABLE_READDIR_ON_OPEN") == "YES");
  REQUIRE(cfg.gdalconfig.options.at("CPL_CURL_VERBOSE") == "NO");
  REQUIRE(cfg.gdalconfig.options.at("CPL_VSIL_CURL_ALLOWED_EXTENSIONS") == ".tif,.geojson");

  REQUIRE(cfg.models.size() == 2);
  REQUIRE(cfg.models[0].driver == "GTiff");
  REQUIRE(cfg.models[0].inputs.empty());

  const auto& nd = cfg.models[1];
  REQUIRE(nd.driver == "MEM");
  REQUIRE(nd.output == "nd.tif");
  REQUIRE(nd.inputs.size() == 2);
  REQUIRE(nd.inputs[0].filename == "prev.tif");
  REQUIRE(nd.inputs[0].params["scale"].get<double>() == Catch::Approx(0.0001));
  REQUIRE(nd.params["nodata"] == 0);
  REQUIRE_FALSE(nd.params.contains("name"));
  REQUIRE_FALSE(nd.params.contains("inputs"));
}

TEST_CASE("config_tuple_strings_parsed_only_in_nested_maps") {
  Config cfg = Config::from_yaml(YAML::Load(kYaml));
  const auto& params = cfg.models[1].params;

  REQUIRE(params["bands"].is_string());
  REQUIRE(params["ranges"]["clip"].is_array());
  REQUIRE(params["ranges"]["clip"][0].get<double>() == Catch::Approx(0.01));
  REQUIRE(params["ranges"]["clip"][1].get<double>() == Catch::Approx(0.3));
  REQUIRE(params["ranges"]["label"] == "plain");
}

TEST_CASE("parse_tuple_values") {
  auto v = parse_tuple("(1, 2.5,3)");
  REQUIRE(v.size() == 3);
  REQUIRE(v[1] == Catch::Approx(2.5));
  REQUIRE(parse_tuple("()").empty());
  REQUIRE_THROWS_AS(parse_tuple("(a, b)"), ConfigError);
  REQUIRE_THROWS_AS(parse_tuple("1, 2"), ConfigError);
}

TEST_CASE("gdal_option_values_map_booleans") {
  REQUIRE(gdal_option_value(YAML::Load("true")) == "YES");
  REQUIRE(gdal_option_value(YAML::Load("False")) == "NO");
  REQUIRE(gdal_option_value(YAML::Load("'YES'")) == "YES");
  REQUIRE(gdal_option_value(YAML::Load("us-west-2")) == "us-west-2");
}

TEST_CASE("config_validate_accepts_example") {
  Config cfg = Config::from_yaml(YAML::Load(kYaml));
  REQUIRE_NOTHROW(cfg.validate());
}

TEST_CASE("config_validate_requires_models") {
  Config cfg;
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
}

TEST_CASE("config_validate_reports_malformed_locators") {
  Config cfg = Config::from_yaml(YAML::Load(kYaml));
  cfg.models[0].name = "file://model.json";
  cfg.models[1].name = "s3://bucket/key";

  try {
    cfg.validate();
    FAIL("expected ValidationError");
  } catch (const ValidationError& e) {
    const std::string msg = e.what();
    REQUIRE(msg.find("file://filename:sha256checksum") != std::string::npos);
    REQUIRE(msg.find("s3://bucket/key:sha256checksum") != std::string::npos);
  }
}

TEST_CASE("config_validate_requires_output") {
  Config cfg = Config::from_yaml(YAML::Load(kYaml));
  cfg.models[0].output.clear();
  REQUIRE_THROWS_AS(cfg.validate(), ValidationError);
}

TEST_CASE("config_file_layer_missing_file_keeps_config") {
  Config cfg;
  cfg.product = "NBART";
  auto status = load_file_layer("/nonexistent/nrt_predict.yaml", cfg);
  REQUIRE_FALSE(status.loaded);
  REQUIRE(status.message.find("not found") != std::string::npos);
  REQUIRE(cfg.product == "NBART");
}

TEST_CASE("config_file_layer_bad_yaml_keeps_config") {
  const fs::path p = write_temp("models: [\n  - name: X\n");
  Config cfg;
  auto status = load_file_layer(p, cfg);
  fs::remove(p);
  REQUIRE_FALSE(status.loaded);
  REQUIRE(status.message.find("incorrect YAML syntax") != std::string::npos);
  REQUIRE(cfg.models.empty());
}

TEST_CASE("config_file_layer_then_cli_overrides") {
  const fs::path p = write_temp(kYaml);
  Config cfg;
  auto status = load_file_layer(p, cfg);
  fs::remove(p);
  REQUIRE(status.loaded);
  REQUIRE(cfg.product == "NBART");

  CliOverrides cli;
  cli.url = "s3://bucket/other";
  cli.product = "NBAR";
  apply_overrides(cli, cfg);
  REQUIRE(cfg.url == "s3://bucket/other");
  REQUIRE(cfg.product == "NBAR");
  REQUIRE(cfg.quiet);
}

TEST_CASE("config_yaml_round_trip_keeps_models") {
  Config cfg = Config::from_yaml(YAML::Load(kYaml));
  Config back = Config::from_yaml(cfg.to_yaml());

  REQUIRE(back.models.size() == 2);
  REQUIRE(back.models[1].inputs.size() == 2);
  REQUIRE(back.models[1].params["nodata"] == 0);
  REQUIRE(back.gdalconfig.options == cfg.gdalconfig.options);
}

TEST_CASE("schema_is_json") {
  REQUIRE(nlohmann::json::parse(get_schema_json())["required"][0] == "models");
}
