#pragma once

#include <Eigen/Dense>
#include <array>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace nrt_predict {

namespace fs = std::filesystem;

// Pixel containers, row-major so rows map to raster lines
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MaskMatrix = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// GDAL ordering: origin x, pixel width, row rotation, origin y, column rotation, pixel height
using GeoTransform = std::array<double, 6>;

// Multi-band raster held as one matrix per band (height x width each)
struct Raster {
    std::vector<Matrix2Df> bands;

    int width() const { return bands.empty() ? 0 : static_cast<int>(bands.front().cols()); }
    int height() const { return bands.empty() ? 0 : static_cast<int>(bands.front().rows()); }
    int band_count() const { return static_cast<int>(bands.size()); }
    bool empty() const { return bands.empty(); }
};

// Observation grid every ancillary input is aligned onto
struct GridSpec {
    GeoTransform transform{0.0, 1.0, 0.0, 0.0, 0.0, -1.0};
    std::string projection;
    int width = 0;
    int height = 0;
};

// FMASK classes of the observation package
enum class MaskClass : uint8_t {
    NODATA = 0,
    CLEAR = 1,
    CLOUD = 2,
    SHADOW = 3,
    SNOW = 4,
    WATER = 5
};

// Reflectance bands of a Sentinel-2 ARD package, in load order
inline const std::vector<std::string>& observation_bands() {
    static const std::vector<std::string> bands = {
        "B02", "B03", "B04", "B05", "B06", "B07", "B08", "B8A", "B11", "B12"};
    return bands;
}

// Pipeline stage enumeration
enum class Stage {
    RESOLVE_OBSERVATION = 0,
    BUILD_FOOTPRINT = 1,
    BUILD_ALIGNMENT_CACHE = 2,
    RESOLVE_MODEL = 3,
    ASSEMBLE_INPUTS = 4,
    INVOKE = 5,
    PERSIST = 6,
    DONE = 7
};

inline std::string stage_to_string(Stage stage) {
    switch (stage) {
        case Stage::RESOLVE_OBSERVATION: return "RESOLVE_OBSERVATION";
        case Stage::BUILD_FOOTPRINT: return "BUILD_FOOTPRINT";
        case Stage::BUILD_ALIGNMENT_CACHE: return "BUILD_ALIGNMENT_CACHE";
        case Stage::RESOLVE_MODEL: return "RESOLVE_MODEL";
        case Stage::ASSEMBLE_INPUTS: return "ASSEMBLE_INPUTS";
        case Stage::INVOKE: return "INVOKE";
        case Stage::PERSIST: return "PERSIST";
        case Stage::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int stage_to_int(Stage stage) {
    return static_cast<int>(stage);
}

} // namespace nrt_predict
