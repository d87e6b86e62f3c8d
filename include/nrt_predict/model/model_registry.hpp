#pragma once

#include "nrt_predict/model/model.hpp"

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace nrt_predict::model {

using ModelFactory = std::function<std::unique_ptr<Model>(const json& params)>;

// In-process models addressable by bare name (qualified as models.<name>)
class ModelRegistry {
public:
    // Replaces an existing entry of the same name
    void add(const std::string& name, ModelFactory factory);

    std::vector<std::string> names() const;

    // Throws ModelLookupError for unknown names, listing the registered ones
    std::unique_ptr<Model> create(const std::string& name, const json& params) const;

private:
    std::map<std::string, ModelFactory> factories_;
};

// NoOp, FirstBand and NormalizedDifference
void register_builtin_models(ModelRegistry& registry);

ModelRegistry default_registry();

} // namespace nrt_predict::model
