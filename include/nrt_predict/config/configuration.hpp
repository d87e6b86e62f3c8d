#pragma once

#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include <yaml-cpp/yaml.h>

namespace nrt_predict::config {

namespace fs = std::filesystem;
using json = nlohmann::json;

inline constexpr const char* kDefaultConfigFile = "nrt_predict.yaml";

struct ModelInputConfig {
  std::string filename;
  json params = json::object(); // per-input extras (scale, bands, ...)
};

struct ModelConfig {
  std::string name;               // model locator
  std::string driver = "GTiff";   // output raster driver
  std::vector<ModelInputConfig> inputs;
  std::string output;
  json params = json::object();   // every other key of the model entry
};

// Options handed to the raster driver layer once at startup
struct RasterSettings {
  std::map<std::string, std::string> options;
};

struct Config {
  std::string url;
  RasterSettings gdalconfig;
  bool quiet = false;
  std::string product = "NBAR";
  std::string obstmp = "/vsimem/obs.tif";
  std::string clipshpfn = "/vsimem/clip.geojson";
  std::string urlprefix;
  std::string tmpdir = fs::temp_directory_path().string();
  double obsscale = 0.0001;
  bool nocleanup = false;
  std::vector<ModelConfig> models;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  // Overlay the keys present in `node` onto this configuration.
  void merge_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;
};

// Result of reading the configuration file layer. A missing or malformed
// file leaves the configuration untouched.
struct ConfigFileStatus {
  bool loaded = false;
  std::string message;
};

ConfigFileStatus load_file_layer(const fs::path &path, Config &cfg);

// Values given directly on the command line; they win over the file.
struct CliOverrides {
  std::optional<std::string> url;
  std::optional<std::string> product;
  std::optional<std::string> tmpdir;
  std::optional<bool> quiet;
};

void apply_overrides(const CliOverrides &overrides, Config &cfg);

// Parse "(a,b,...)" strings into numeric arrays inside nested maps.
void parse_tuple_strings(json &params);
std::vector<double> parse_tuple(const std::string &text);

// Normalise a driver option value: booleans become YES / NO.
std::string gdal_option_value(const YAML::Node &value);

json yaml_to_json(const YAML::Node &node);
YAML::Node json_to_yaml(const json &value);

std::string get_schema_json();

} // namespace nrt_predict::config
