#include "nrt_predict/model/model_resolver.hpp"
#include "nrt_predict/core/errors.hpp"

#include <sstream>
#include <type_traits>

namespace nrt_predict::model {

std::string verify_checksum(std::istream& in, const std::string& expected, size_t block_size) {
    const std::string actual = core::sha256_stream(in, block_size);
    if (actual != expected) {
        throw IntegrityError(expected, actual);
    }
    return actual;
}

std::string verify_checksum(const std::vector<uint8_t>& bytes, const std::string& expected) {
    std::istringstream in(std::string(bytes.begin(), bytes.end()));
    return verify_checksum(in, expected);
}

std::unique_ptr<Model> deserialize_model(const std::vector<uint8_t>& bytes,
                                         const ModelRegistry& registry) {
    json doc;
    try {
        doc = json::parse(bytes.begin(), bytes.end());
    } catch (const json::parse_error& e) {
        throw ModelError(std::string("cannot deserialize model package: ") + e.what());
    }

    if (!doc.is_object() || !doc.contains("model") || !doc["model"].is_string()) {
        throw ModelError("model package has no 'model' name");
    }
    json params = doc.value("params", json::object());
    if (!params.is_object()) {
        throw ModelError("model package 'params' must be a mapping");
    }
    return registry.create(doc["model"].get<std::string>(), params);
}

std::vector<uint8_t> serialize_model(const std::string& name, const json& params) {
    const std::string text = json{{"model", name}, {"params", params}}.dump(2);
    return std::vector<uint8_t>(text.begin(), text.end());
}

ModelResolver::ModelResolver(const ModelRegistry& registry, io::ObjectStore& store)
    : registry_(registry), store_(store) {}

ResolvedModel ModelResolver::from_bytes(const std::vector<uint8_t>& bytes,
                                        const std::string& checksum,
                                        const json& params) const {
    ResolvedModel resolved;
    resolved.checksum = verify_checksum(bytes, checksum);
    resolved.model = deserialize_model(bytes, registry_);
    resolved.model->update(params);
    return resolved;
}

ResolvedModel ModelResolver::resolve(const ModelLocator& locator, const json& params) const {
    ResolvedModel resolved = std::visit(
        [&](const auto& loc) -> ResolvedModel {
            using T = std::decay_t<decltype(loc)>;
            if constexpr (std::is_same_v<T, LocalFileLocator>) {
                return from_bytes(core::read_bytes(loc.path), loc.checksum, params);
            } else if constexpr (std::is_same_v<T, RemoteStoreLocator>) {
                return from_bytes(store_.fetch(loc.bucket, loc.key), loc.checksum, params);
            } else {
                ResolvedModel r;
                r.model = registry_.create(loc.name, params);
                return r;
            }
        },
        locator);
    resolved.source = describe_locator(locator);
    return resolved;
}

} // namespace nrt_predict::model
