#include "nrt_predict/model/model_registry.hpp"
#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/core/utils.hpp"
#include "nrt_predict/model/model_locator.hpp"

#include <utility>

namespace nrt_predict::model {

void ModelRegistry::add(const std::string& name, ModelFactory factory) {
    factories_[name] = std::move(factory);
}

std::vector<std::string> ModelRegistry::names() const {
    std::vector<std::string> out;
    out.reserve(factories_.size());
    for (const auto& kv : factories_) {
        out.push_back(kv.first);
    }
    return out;
}

std::unique_ptr<Model> ModelRegistry::create(const std::string& name, const json& params) const {
    auto it = factories_.find(name);
    if (it == factories_.end()) {
        throw ModelLookupError(RegisteredLocator{name}.qualified_name() + " (registered: " +
                               core::join(names(), ", ") + ")");
    }
    std::unique_ptr<Model> model = it->second(params);
    if (!model) {
        throw ModelLookupError(RegisteredLocator{name}.qualified_name() + " (factory returned nothing)");
    }
    return model;
}

ModelRegistry default_registry() {
    ModelRegistry registry;
    register_builtin_models(registry);
    return registry;
}

} // namespace nrt_predict::model
