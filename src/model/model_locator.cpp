#include "nrt_predict/model/model_locator.hpp"
#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/core/utils.hpp"

#include <algorithm>

namespace nrt_predict::model {

namespace {

constexpr const char* kFileScheme = "file://";
constexpr const char* kS3Scheme = "s3://";

// Split "<body>:<checksum>"; exactly one delimiter is accepted.
bool split_checksum(const std::string& rest, std::string& body, std::string& checksum) {
    const auto pos = rest.find(':');
    if (pos == std::string::npos || rest.find(':', pos + 1) != std::string::npos) {
        return false;
    }
    body = rest.substr(0, pos);
    checksum = rest.substr(pos + 1);
    return !body.empty() && !checksum.empty();
}

} // namespace

ModelLocator parse_model_locator(const std::string& locator) {
    if (core::starts_with(locator, kFileScheme)) {
        std::string path;
        std::string checksum;
        if (!split_checksum(locator.substr(7), path, checksum)) {
            throw ConfigError("Incorrect model name format '" + locator +
                              "', it should be file://filename:sha256checksum");
        }
        return LocalFileLocator{fs::path(path), checksum};
    }

    if (core::starts_with(locator, kS3Scheme)) {
        std::string path;
        std::string checksum;
        if (!split_checksum(locator.substr(5), path, checksum)) {
            throw ConfigError("Incorrect model name format '" + locator +
                              "', it should be s3://bucket/key:sha256checksum");
        }
        const auto slash = path.find('/');
        if (slash == std::string::npos || slash == 0 || slash + 1 >= path.size()) {
            throw ConfigError("Incorrect model name format '" + locator +
                              "', it should be s3://bucket/key:sha256checksum");
        }
        return RemoteStoreLocator{path.substr(0, slash), path.substr(slash + 1), checksum};
    }

    if (core::trim(locator).empty()) {
        throw ConfigError("model 'name' must not be empty");
    }
    return RegisteredLocator{locator};
}

std::string describe_locator(const ModelLocator& locator) {
    if (const auto* f = std::get_if<LocalFileLocator>(&locator)) {
        return "file '" + f->path.string() + "'";
    }
    if (const auto* s = std::get_if<RemoteStoreLocator>(&locator)) {
        return "s3 bucket '" + s->bucket + "' key '" + s->key + "'";
    }
    return "registered model '" + std::get<RegisteredLocator>(locator).qualified_name() + "'";
}

std::vector<std::string> remote_buckets(const std::vector<std::string>& locators) {
    std::vector<std::string> buckets;
    for (const auto& text : locators) {
        const ModelLocator locator = parse_model_locator(text);
        if (const auto* remote = std::get_if<RemoteStoreLocator>(&locator)) {
            if (std::find(buckets.begin(), buckets.end(), remote->bucket) == buckets.end()) {
                buckets.push_back(remote->bucket);
            }
        }
    }
    return buckets;
}

} // namespace nrt_predict::model
