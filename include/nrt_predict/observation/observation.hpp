#pragma once

#include "nrt_predict/core/types.hpp"
#include "nrt_predict/io/raster_backend.hpp"

#include <ctime>
#include <optional>
#include <string>

namespace nrt_predict::observation {

enum class UrlCheck {
    Valid,          // scheme and path present
    MaybeLocalFile, // no scheme, or file:
    Invalid
};

UrlCheck check_url(const std::string& locator);

// Local path behind a MaybeLocalFile locator (file:// stripped)
std::string local_path(const std::string& locator);

// Final non-empty path segment; throws ObservationError if there is none
std::string package_name(const std::string& locator);

// Token 7 of the package name, %Y%m%dT%H%M%S in UTC
std::time_t parse_acquisition_time(const std::string& locator);
std::string format_time(std::time_t t);

// http(s):// -> /vsicurl/http(s)://, s3:// -> /vsis3/, others unchanged
std::string to_raster_path(const std::string& locator);
std::string strip_vsi_prefix(const std::string& path);

std::string thumbnail_url(const std::string& locator, const std::string& product);
std::string map_url(const std::string& locator);

struct FootprintLookup {
    std::optional<std::string> wkt;
    bool used_http_fallback = false;
    std::string error;
};

inline constexpr const char* kFallbackBoundsPath = "/vsimem/bounds.geojson";

// Published footprint at <root>/bounds.geojson. On failure the document is
// fetched once over plain HTTP into memory and parsed again.
FootprintLookup read_footprint(const std::string& root, io::RasterBackend& backend);

struct ObservationOptions {
    std::string product = "NBAR";
    double scale = 0.0001;
};

struct ObservationPackage {
    std::string locator;
    std::string root;
    std::string package;
    std::time_t acquired = 0;

    std::string footprint_wkt;
    bool footprint_published = false;
    bool footprint_via_http = false;
    std::string footprint_error; // why no published footprint could be read

    GridSpec grid;
    Raster reflectance; // one band per observation_bands(), NaN where mask is NODATA
    MaskMatrix mask;

    double clear_fraction = 0.0;
    double nodata_fraction = 0.0;
};

ObservationPackage resolve_observation(const std::string& locator,
                                       const ObservationOptions& options,
                                       io::RasterBackend& backend);

} // namespace nrt_predict::observation
