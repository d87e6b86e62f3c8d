#include "nrt_predict/config/configuration.hpp"
#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/core/utils.hpp"
#include "nrt_predict/model/model_locator.hpp"

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace nrt_predict::config {

namespace {

const std::set<std::string> kReservedModelKeys = {"name", "driver", "inputs", "output"};

json scalar_to_json(const YAML::Node& n) {
    // Quoted scalars stay strings
    if (n.Tag() == "!") {
        return n.Scalar();
    }
    long long i = 0;
    if (YAML::convert<long long>::decode(n, i)) {
        return i;
    }
    double d = 0.0;
    if (YAML::convert<double>::decode(n, d)) {
        return d;
    }
    bool b = false;
    if (YAML::convert<bool>::decode(n, b)) {
        return b;
    }
    const std::string& s = n.Scalar();
    if (s == "~" || s == "null" || s == "Null" || s == "NULL") {
        return nullptr;
    }
    return s;
}

ModelConfig model_from_yaml(const YAML::Node& m, size_t index) {
    if (!m.IsMap()) {
        throw ConfigError("models[" + std::to_string(index) + "] must be a mapping");
    }

    ModelConfig model;
    if (m["name"]) model.name = m["name"].as<std::string>();
    if (m["driver"]) model.driver = m["driver"].as<std::string>();
    if (m["output"]) model.output = m["output"].as<std::string>();

    if (m["inputs"]) {
        const auto ips = m["inputs"];
        if (!ips.IsSequence()) {
            throw ConfigError("models[" + std::to_string(index) + "].inputs must be a list");
        }
        for (const auto& ip : ips) {
            ModelInputConfig input;
            if (ip.IsMap()) {
                for (const auto& kv : ip) {
                    const auto key = kv.first.as<std::string>();
                    if (key == "filename") {
                        input.filename = kv.second.as<std::string>();
                    } else {
                        input.params[key] = yaml_to_json(kv.second);
                    }
                }
            } else if (ip.IsScalar()) {
                input.filename = ip.as<std::string>();
            }
            model.inputs.push_back(std::move(input));
        }
    }

    for (const auto& kv : m) {
        const auto key = kv.first.as<std::string>();
        if (kReservedModelKeys.count(key) == 0) {
            model.params[key] = yaml_to_json(kv.second);
        }
    }
    parse_tuple_strings(model.params);

    return model;
}

} // namespace

json yaml_to_json(const YAML::Node& node) {
    switch (node.Type()) {
        case YAML::NodeType::Scalar:
            return scalar_to_json(node);
        case YAML::NodeType::Sequence: {
            json arr = json::array();
            for (const auto& item : node) {
                arr.push_back(yaml_to_json(item));
            }
            return arr;
        }
        case YAML::NodeType::Map: {
            json obj = json::object();
            for (const auto& kv : node) {
                obj[kv.first.as<std::string>()] = yaml_to_json(kv.second);
            }
            return obj;
        }
        default:
            return nullptr;
    }
}

YAML::Node json_to_yaml(const json& value) {
    YAML::Node node;
    if (value.is_object()) {
        for (auto& [key, v] : value.items()) {
            node[key] = json_to_yaml(v);
        }
    } else if (value.is_array()) {
        for (const auto& v : value) {
            node.push_back(json_to_yaml(v));
        }
    } else if (value.is_boolean()) {
        node = value.get<bool>();
    } else if (value.is_number_integer()) {
        node = value.get<long long>();
    } else if (value.is_number()) {
        node = value.get<double>();
    } else if (value.is_string()) {
        node = value.get<std::string>();
    }
    return node;
}

std::vector<double> parse_tuple(const std::string& text) {
    const std::string t = core::trim(text);
    if (t.size() < 2 || t.front() != '(' || t.back() != ')') {
        throw ConfigError("not a tuple: '" + text + "'");
    }
    std::vector<double> values;
    const std::string body = t.substr(1, t.size() - 2);
    if (core::trim(body).empty()) {
        return values;
    }
    for (const auto& part : core::split(body, ',')) {
        const std::string p = core::trim(part);
        if (p.empty()) continue;
        try {
            size_t used = 0;
            double v = std::stod(p, &used);
            if (used != p.size()) {
                throw ConfigError("invalid tuple element '" + p + "' in '" + text + "'");
            }
            values.push_back(v);
        } catch (const std::invalid_argument&) {
            throw ConfigError("invalid tuple element '" + p + "' in '" + text + "'");
        } catch (const std::out_of_range&) {
            throw ConfigError("tuple element out of range '" + p + "' in '" + text + "'");
        }
    }
    return values;
}

void parse_tuple_strings(json& params) {
    if (!params.is_object()) return;
    for (auto& [key, value] : params.items()) {
        if (!value.is_object()) continue;
        for (auto& [inner_key, inner] : value.items()) {
            if (!inner.is_string()) continue;
            const std::string s = inner.get<std::string>();
            if (core::starts_with(s, "(") && core::ends_with(s, ")")) {
                inner = parse_tuple(s);
            }
        }
    }
}

std::string gdal_option_value(const YAML::Node& value) {
    if (!value.IsScalar()) {
        throw ConfigError("gdalconfig values must be scalars");
    }
    if (value.Tag() != "!") {
        bool b = false;
        if (YAML::convert<bool>::decode(value, b)) {
            return b ? "YES" : "NO";
        }
    }
    return value.Scalar();
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Configuration file '" + path.string() +
                          "' has incorrect YAML syntax: " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;
    cfg.merge_yaml(node);
    return cfg;
}

void Config::merge_yaml(const YAML::Node& node) {
    if (!node || node.IsNull()) {
        return;
    }
    if (!node.IsMap()) {
        throw ConfigError("configuration document must be a mapping");
    }

    try {
        if (node["url"]) url = node["url"].as<std::string>();
        if (node["quiet"]) quiet = node["quiet"].as<bool>();
        if (node["product"]) product = node["product"].as<std::string>();
        if (node["obstmp"]) obstmp = node["obstmp"].as<std::string>();
        if (node["clipshpfn"]) clipshpfn = node["clipshpfn"].as<std::string>();
        if (node["urlprefix"] && !node["urlprefix"].IsNull()) {
            urlprefix = node["urlprefix"].as<std::string>();
        }
        if (node["tmpdir"]) tmpdir = node["tmpdir"].as<std::string>();
        if (node["obsscale"]) obsscale = node["obsscale"].as<double>();
        if (node["nocleanup"]) nocleanup = node["nocleanup"].as<bool>();

        if (node["gdalconfig"] && !node["gdalconfig"].IsNull()) {
            const auto g = node["gdalconfig"];
            if (!g.IsMap()) {
                throw ConfigError("'gdalconfig' must be a mapping of option names to values");
            }
            for (const auto& kv : g) {
                gdalconfig.options[kv.first.as<std::string>()] = gdal_option_value(kv.second);
            }
        }

        if (node["models"]) {
            const auto ms = node["models"];
            if (!ms.IsSequence()) {
                throw ConfigError("'models' must be a list of models");
            }
            models.clear();
            for (size_t i = 0; i < ms.size(); ++i) {
                models.push_back(model_from_yaml(ms[i], i));
            }
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("invalid value: ") + e.what());
    }
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    if (!url.empty()) node["url"] = url;
    node["quiet"] = quiet;
    node["product"] = product;
    node["obstmp"] = obstmp;
    node["clipshpfn"] = clipshpfn;
    node["urlprefix"] = urlprefix;
    node["tmpdir"] = tmpdir;
    node["obsscale"] = obsscale;
    node["nocleanup"] = nocleanup;

    node["gdalconfig"] = YAML::Node(YAML::NodeType::Map);
    for (const auto& [key, value] : gdalconfig.options) {
        node["gdalconfig"][key] = value;
    }

    node["models"] = YAML::Node(YAML::NodeType::Sequence);
    for (const auto& m : models) {
        YAML::Node mn = json_to_yaml(m.params);
        mn["name"] = m.name;
        mn["driver"] = m.driver;
        mn["output"] = m.output;
        mn["inputs"] = YAML::Node(YAML::NodeType::Sequence);
        for (const auto& ip : m.inputs) {
            YAML::Node in = json_to_yaml(ip.params);
            in["filename"] = ip.filename;
            mn["inputs"].push_back(in);
        }
        node["models"].push_back(mn);
    }

    return node;
}

void Config::validate() const {
    std::vector<std::string> errors;

    if (product.empty()) {
        errors.emplace_back("'product' must not be empty");
    }
    if (!(obsscale > 0.0) || !std::isfinite(obsscale)) {
        errors.emplace_back("'obsscale' must be a positive number");
    }
    if (tmpdir.empty()) {
        errors.emplace_back("'tmpdir' must not be empty");
    }
    if (models.empty()) {
        errors.emplace_back("'models' should be set in the configuration");
    }

    for (size_t i = 0; i < models.size(); ++i) {
        const auto& m = models[i];
        const std::string where = "models[" + std::to_string(i) + "]";
        if (m.name.empty()) {
            errors.push_back(where + ".name must be set");
            continue;
        }
        try {
            (void)model::parse_model_locator(m.name);
        } catch (const ConfigError& e) {
            errors.push_back(e.what());
        }
        if (m.output.empty()) {
            errors.push_back(where + " ('" + m.name + "').output must be set");
        }
        if (m.driver.empty()) {
            errors.push_back(where + " ('" + m.name + "').driver must not be empty");
        }
        for (size_t k = 0; k < m.inputs.size(); ++k) {
            if (m.inputs[k].filename.empty()) {
                errors.push_back(where + ".inputs[" + std::to_string(k) + "].filename must be set");
            }
        }
    }

    if (!errors.empty()) {
        throw ValidationError(core::join(errors, "; "));
    }
}

ConfigFileStatus load_file_layer(const fs::path& path, Config& cfg) {
    ConfigFileStatus status;
    if (!fs::exists(path)) {
        status.message = "Configuration file '" + path.string() + "' not found.";
        return status;
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        status.message = "Configuration file '" + path.string() +
                         "' has incorrect YAML syntax: " + e.what();
        return status;
    }

    Config merged = cfg;
    try {
        merged.merge_yaml(node);
    } catch (const ConfigError& e) {
        status.message = "Configuration file '" + path.string() + "' is malformed: " + e.what();
        return status;
    }

    cfg = std::move(merged);
    status.loaded = true;
    status.message = "Loading configuration from '" + path.string() + "'";
    return status;
}

void apply_overrides(const CliOverrides& overrides, Config& cfg) {
    if (overrides.url && !overrides.url->empty()) cfg.url = *overrides.url;
    if (overrides.product) cfg.product = *overrides.product;
    if (overrides.tmpdir) cfg.tmpdir = *overrides.tmpdir;
    if (overrides.quiet) cfg.quiet = *overrides.quiet;
}

std::string get_schema_json() {
    return R"({
  "$schema": "http://json-schema.org/draft-07/schema#",
  "type": "object",
  "required": ["models"],
  "properties": {
    "url": {"type": "string"},
    "quiet": {"type": "boolean", "default": false},
    "product": {"type": "string", "default": "NBAR"},
    "obstmp": {"type": "string", "default": "/vsimem/obs.tif"},
    "clipshpfn": {"type": "string", "default": "/vsimem/clip.geojson"},
    "urlprefix": {"type": "string", "default": ""},
    "tmpdir": {"type": "string"},
    "obsscale": {"type": "number", "exclusiveMinimum": 0, "default": 0.0001},
    "nocleanup": {"type": "boolean", "default": false},
    "gdalconfig": {
      "type": "object",
      "additionalProperties": {"type": ["string", "boolean", "number"]}
    },
    "models": {
      "type": "array",
      "minItems": 1,
      "items": {
        "type": "object",
        "required": ["name", "output"],
        "properties": {
          "name": {"type": "string"},
          "driver": {"type": "string", "default": "GTiff"},
          "output": {"type": "string"},
          "inputs": {
            "type": "array",
            "items": {
              "type": "object",
              "required": ["filename"],
              "properties": {"filename": {"type": "string"}}
            }
          }
        },
        "additionalProperties": true
      }
    }
  }
})";
}

} // namespace nrt_predict::config
