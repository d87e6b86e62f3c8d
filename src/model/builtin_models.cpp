#include "nrt_predict/model/builtin_models.hpp"
#include "nrt_predict/config/configuration.hpp"
#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/model/model_registry.hpp"

#include <cmath>
#include <limits>
#include <memory>

namespace nrt_predict::model {

Raster NoOpModel::predict(const std::vector<Raster>& inputs) {
    return observation_of(inputs);
}

void NoOpModel::predict_and_save(const std::vector<Raster>&, const std::string&) {}

Raster FirstBandModel::predict(const std::vector<Raster>& inputs) {
    const Raster& obs = observation_of(inputs);
    if (obs.empty()) {
        throw ModelError(name() + ": observation has no bands");
    }
    Raster out;
    out.bands.push_back(obs.bands.front());
    return out;
}

std::pair<int, int> NormalizedDifferenceModel::band_pair() const {
    auto it = params_.find("bands");
    if (it == params_.end()) {
        throw ModelError(name() + ": parameter 'bands' is required");
    }

    std::vector<double> values;
    if (it->is_string()) {
        try {
            values = config::parse_tuple(it->get<std::string>());
        } catch (const ConfigError& e) {
            throw ModelError(name() + ": " + e.what());
        }
    } else if (it->is_array()) {
        for (const auto& v : *it) {
            if (!v.is_number()) {
                throw ModelError(name() + ": 'bands' must hold numbers");
            }
            values.push_back(v.get<double>());
        }
    }

    if (values.size() != 2) {
        throw ModelError(name() + ": 'bands' must name exactly two bands");
    }
    for (double v : values) {
        if (!std::isfinite(v) || v != std::floor(v) || v < 0.0 ||
            v > static_cast<double>(std::numeric_limits<int>::max())) {
            throw ModelError(name() + ": 'bands' must hold non-negative whole band indices");
        }
    }
    return {static_cast<int>(values[0]), static_cast<int>(values[1])};
}

const Raster& NormalizedDifferenceModel::selected_input(const std::vector<Raster>& inputs) const {
    if (inputs.empty()) {
        throw ModelError(name() + ": no inputs given");
    }
    const int n = static_cast<int>(inputs.size());
    int idx = params_.value("input", -1);
    if (idx < 0) idx += n;
    if (idx < 0 || idx >= n) {
        throw ModelError(name() + ": 'input' index out of range");
    }
    return inputs[static_cast<size_t>(idx)];
}

Raster NormalizedDifferenceModel::predict(const std::vector<Raster>& inputs) {
    const Raster& src = selected_input(inputs);
    const auto [a, b] = band_pair();
    if (a < 0 || b < 0 || a >= src.band_count() || b >= src.band_count()) {
        throw ModelError(name() + ": band index out of range for a " +
                         std::to_string(src.band_count()) + " band input");
    }

    const Matrix2Df& x = src.bands[static_cast<size_t>(a)];
    const Matrix2Df& y = src.bands[static_cast<size_t>(b)];
    const float nan = std::numeric_limits<float>::quiet_NaN();

    Matrix2Df nd(x.rows(), x.cols());
    for (Eigen::Index r = 0; r < x.rows(); ++r) {
        for (Eigen::Index c = 0; c < x.cols(); ++c) {
            const float sum = x(r, c) + y(r, c);
            nd(r, c) = (sum == 0.0f) ? nan : (x(r, c) - y(r, c)) / sum;
        }
    }

    Raster out;
    out.bands.push_back(std::move(nd));
    return out;
}

void register_builtin_models(ModelRegistry& registry) {
    registry.add("NoOp", [](const json& params) {
        auto m = std::make_unique<NoOpModel>();
        m->update(params);
        return std::unique_ptr<Model>(std::move(m));
    });
    registry.add("FirstBand", [](const json& params) {
        auto m = std::make_unique<FirstBandModel>();
        m->update(params);
        return std::unique_ptr<Model>(std::move(m));
    });
    registry.add("NormalizedDifference", [](const json& params) {
        auto m = std::make_unique<NormalizedDifferenceModel>();
        m->update(params);
        return std::unique_ptr<Model>(std::move(m));
    });
}

} // namespace nrt_predict::model
