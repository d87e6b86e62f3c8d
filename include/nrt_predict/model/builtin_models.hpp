#pragma once

#include "nrt_predict/model/model.hpp"

#include <utility>

namespace nrt_predict::model {

// Writes nothing
class NoOpModel : public Model {
public:
    std::string name() const override { return "NoOp"; }
    Raster predict(const std::vector<Raster>& inputs) override;
    void predict_and_save(const std::vector<Raster>& inputs, const std::string& output) override;
};

// First observation band (B02)
class FirstBandModel : public Model {
public:
    std::string name() const override { return "FirstBand"; }
    Raster predict(const std::vector<Raster>& inputs) override;
};

/**
 * (a - b) / (a + b) of two bands of one input.
 *
 * Parameters:
 *   bands: [a, b] or "(a,b)", zero-based band indices (required)
 *   input: index into the input list, negative counts from the end
 *          (default -1, the observation)
 */
class NormalizedDifferenceModel : public Model {
public:
    std::string name() const override { return "NormalizedDifference"; }
    Raster predict(const std::vector<Raster>& inputs) override;

private:
    std::pair<int, int> band_pair() const;
    const Raster& selected_input(const std::vector<Raster>& inputs) const;
};

} // namespace nrt_predict::model
