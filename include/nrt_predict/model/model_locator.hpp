#pragma once

#include <filesystem>
#include <string>
#include <variant>
#include <vector>

namespace nrt_predict::model {

namespace fs = std::filesystem;

// Namespace registered model names are resolved in
inline constexpr const char* kModelDir = "models";

// file://<path>:<sha256>
struct LocalFileLocator {
    fs::path path;
    std::string checksum;
};

// s3://<bucket>/<key>:<sha256>
struct RemoteStoreLocator {
    std::string bucket;
    std::string key;
    std::string checksum;
};

// <name>, looked up as models.<name>
struct RegisteredLocator {
    std::string name;

    std::string qualified_name() const { return std::string(kModelDir) + "." + name; }
};

using ModelLocator = std::variant<LocalFileLocator, RemoteStoreLocator, RegisteredLocator>;

// Select the resolution strategy from the locator text. Malformed file:// and
// s3:// locators throw ConfigError; no I/O is performed.
ModelLocator parse_model_locator(const std::string& locator);

std::string describe_locator(const ModelLocator& locator);

// Distinct buckets of the s3:// locators in `locators`, in first-appearance order
std::vector<std::string> remote_buckets(const std::vector<std::string>& locators);

} // namespace nrt_predict::model
