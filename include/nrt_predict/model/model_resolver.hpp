#pragma once

#include "nrt_predict/core/utils.hpp"
#include "nrt_predict/io/object_store.hpp"
#include "nrt_predict/model/model.hpp"
#include "nrt_predict/model/model_locator.hpp"
#include "nrt_predict/model/model_registry.hpp"

#include <istream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace nrt_predict::model {

/**
 * SHA256 of the stream, read in `block_size` chunks, compared exactly with
 * `expected` (lowercase hex). Returns the digest; throws IntegrityError on
 * mismatch.
 */
std::string verify_checksum(std::istream& in, const std::string& expected,
                            size_t block_size = core::kDigestBlockSize);
std::string verify_checksum(const std::vector<uint8_t>& bytes, const std::string& expected);

// Package layout: {"model": "<registered name>", "params": {...}}
std::unique_ptr<Model> deserialize_model(const std::vector<uint8_t>& bytes,
                                         const ModelRegistry& registry);
std::vector<uint8_t> serialize_model(const std::string& name, const json& params);

struct ResolvedModel {
    std::unique_ptr<Model> model;
    std::string source;                   // describe_locator()
    std::optional<std::string> checksum;  // verified digest, packaged models only
};

class ModelResolver {
public:
    ModelResolver(const ModelRegistry& registry, io::ObjectStore& store);

    // Integrity is checked before anything is deserialized or instantiated
    ResolvedModel resolve(const ModelLocator& locator, const json& params) const;

private:
    ResolvedModel from_bytes(const std::vector<uint8_t>& bytes, const std::string& checksum,
                             const json& params) const;

    const ModelRegistry& registry_;
    io::ObjectStore& store_;
};

} // namespace nrt_predict::model
