#pragma once

#include "nrt_predict/core/types.hpp"
#include "nrt_predict/io/raster_backend.hpp"

#include <ctime>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace nrt_predict::model {

using json = nlohmann::json;

// What a model knows about the observation it runs on
struct ModelContext {
    std::string footprint_wkt;
    std::time_t acquired = 0;
    GridSpec grid;
    std::string driver = "GTiff";
    io::RasterBackend* writer = nullptr; // not owned

    // obswkt, obsdate, geo, prj, xsize, ysize
    json to_json() const;
};

/**
 * A prediction model. Inputs are the model's ancillary rasters in declared
 * order followed by the observation reflectance; every raster is on the
 * observation grid and owned by the caller.
 *
 * Simple models implement predict(); predict_and_save() can be overridden
 * when a model needs control over how its output is written.
 */
class Model {
public:
    virtual ~Model() = default;

    virtual std::string name() const = 0;

    // Merge `params` over the current parameters
    virtual void update(const json& params);
    const json& params() const { return params_; }

    // Also merges the context's to_json() into the parameters
    void set_context(ModelContext context);

    virtual Raster predict(const std::vector<Raster>& inputs) = 0;
    virtual void predict_and_save(const std::vector<Raster>& inputs, const std::string& output);

protected:
    // "nodata" parameter, if set
    std::optional<double> output_nodata() const;

    // The observation reflectance; throws ModelError if there are no inputs
    static const Raster& observation_of(const std::vector<Raster>& inputs);

    json params_ = json::object();
    ModelContext context_;
};

} // namespace nrt_predict::model
