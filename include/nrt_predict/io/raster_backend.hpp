#pragma once

#include "nrt_predict/core/types.hpp"
#include "nrt_predict/geometry/footprint.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace nrt_predict::io {

struct RasterInfo {
    GridSpec grid;
    int band_count = 0;
    std::optional<double> nodata; // of band 1
};

/**
 * Raster and vector I/O used by the pipeline. Paths are anything the
 * implementation can open (local files, /vsimem/, /vsicurl/, /vsis3/).
 * Failures throw RasterError unless stated otherwise.
 */
class RasterBackend {
public:
    virtual ~RasterBackend() = default;

    virtual RasterInfo open_info(const std::string& path) = 0;

    // All bands as float. A positive buffer size resamples on read.
    virtual Raster read_raster(const std::string& path, int buf_width = 0, int buf_height = 0) = 0;

    // Band 1 as uint8
    virtual MaskMatrix read_mask(const std::string& path) = 0;

    // WKT of the first feature's geometry, std::nullopt if the vector cannot be opened
    virtual std::optional<std::string> read_vector_footprint_wkt(const std::string& path) = 0;

    virtual std::vector<uint8_t> http_get(const std::string& url) = 0;
    virtual void write_mem_file(const std::string& path, const std::vector<uint8_t>& bytes) = 0;

    // Reproject `src` into `dst_srs` cropped to the cutline, written to `dst`
    virtual RasterInfo warp_to_cutline(const std::string& src, const std::string& dst,
                                       const std::string& cutline,
                                       const std::string& dst_srs) = 0;

    // Single-feature GeoJSON polygon layer named "obs"
    virtual void write_cutline(const std::string& path, const geometry::Polygon& polygon,
                               const std::string& projection) = 0;

    virtual void write_raster(const std::string& path, const std::string& driver,
                              const Raster& raster, const GridSpec& grid,
                              std::optional<double> nodata) = 0;

    virtual bool has_driver(const std::string& name) = 0;
    virtual std::vector<std::string> driver_names() = 0;

    // Missing files are not an error
    virtual void remove(const std::string& path) = 0;

    // Does not throw; the reason is stored in `error` when given
    virtual bool can_open(const std::string& path, std::string* error = nullptr) = 0;
};

} // namespace nrt_predict::io
