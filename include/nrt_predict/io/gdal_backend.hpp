#pragma once

#include "nrt_predict/config/configuration.hpp"
#include "nrt_predict/io/raster_backend.hpp"

namespace nrt_predict::io {

// RasterBackend over GDAL/OGR. Construction registers the drivers and
// applies the configured driver options process-wide.
class GdalRasterBackend : public RasterBackend {
public:
    explicit GdalRasterBackend(const config::RasterSettings& settings);

    RasterInfo open_info(const std::string& path) override;
    Raster read_raster(const std::string& path, int buf_width = 0, int buf_height = 0) override;
    MaskMatrix read_mask(const std::string& path) override;
    std::optional<std::string> read_vector_footprint_wkt(const std::string& path) override;
    std::vector<uint8_t> http_get(const std::string& url) override;
    void write_mem_file(const std::string& path, const std::vector<uint8_t>& bytes) override;
    RasterInfo warp_to_cutline(const std::string& src, const std::string& dst,
                               const std::string& cutline, const std::string& dst_srs) override;
    void write_cutline(const std::string& path, const geometry::Polygon& polygon,
                       const std::string& projection) override;
    void write_raster(const std::string& path, const std::string& driver, const Raster& raster,
                      const GridSpec& grid, std::optional<double> nodata) override;
    bool has_driver(const std::string& name) override;
    std::vector<std::string> driver_names() override;
    void remove(const std::string& path) override;
    bool can_open(const std::string& path, std::string* error = nullptr) override;
};

} // namespace nrt_predict::io
