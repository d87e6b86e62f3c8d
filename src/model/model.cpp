#include "nrt_predict/model/model.hpp"
#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/observation/observation.hpp"

namespace nrt_predict::model {

json ModelContext::to_json() const {
    return {
        {"obswkt", footprint_wkt},
        {"obsdate", observation::format_time(acquired)},
        {"geo", grid.transform},
        {"prj", grid.projection},
        {"xsize", grid.width},
        {"ysize", grid.height}
    };
}

void Model::update(const json& params) {
    if (params.is_null()) return;
    if (!params.is_object()) {
        throw ModelError(name() + ": parameters must be a mapping");
    }
    for (auto& [key, value] : params.items()) {
        params_[key] = value;
    }
}

void Model::set_context(ModelContext context) {
    context_ = std::move(context);
    update(context_.to_json());
}

void Model::predict_and_save(const std::vector<Raster>& inputs, const std::string& output) {
    Raster result = predict(inputs);
    if (!context_.writer) {
        throw ModelError(name() + ": no raster writer to save '" + output + "'");
    }
    context_.writer->write_raster(output, context_.driver, result, context_.grid, output_nodata());
}

std::optional<double> Model::output_nodata() const {
    auto it = params_.find("nodata");
    if (it == params_.end() || it->is_null()) return std::nullopt;
    if (!it->is_number()) {
        throw ModelError(name() + ": 'nodata' must be a number");
    }
    return it->get<double>();
}

const Raster& Model::observation_of(const std::vector<Raster>& inputs) {
    if (inputs.empty()) {
        throw ModelError("no inputs given");
    }
    return inputs.back();
}

} // namespace nrt_predict::model
