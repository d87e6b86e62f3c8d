#include "nrt_predict/observation/observation.hpp"
#include "nrt_predict/core/errors.hpp"
#include "nrt_predict/core/utils.hpp"
#include "nrt_predict/geometry/footprint.hpp"
#include "nrt_predict/image/processing.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

namespace nrt_predict::observation {

namespace {

constexpr const char* kVsiCurl = "/vsicurl/";
constexpr const char* kVsiS3 = "/vsis3/";
constexpr size_t kDateToken = 6;

bool is_scheme_char(char c) {
    return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '-' || c == '.';
}

// Scheme (lowercased) and remainder after ':'; empty scheme when there is none.
std::pair<std::string, std::string> split_scheme(const std::string& url) {
    const auto colon = url.find(':');
    if (colon == std::string::npos || colon == 0 ||
        !std::isalpha(static_cast<unsigned char>(url[0]))) {
        return {"", url};
    }
    for (size_t i = 0; i < colon; ++i) {
        if (!is_scheme_char(url[i])) return {"", url};
    }
    return {core::to_lower(url.substr(0, colon)), url.substr(colon + 1)};
}

std::string strip_trailing_slashes(std::string s) {
    while (s.size() > 1 && s.back() == '/') s.pop_back();
    return s;
}

} // namespace

UrlCheck check_url(const std::string& locator) {
    auto [scheme, rest] = split_scheme(locator);

    if (core::starts_with(rest, "//")) {
        const auto end = rest.find_first_of("/?#", 2);
        const std::string netloc = rest.substr(2, end == std::string::npos ? std::string::npos : end - 2);
        const bool open = netloc.find('[') != std::string::npos;
        const bool close = netloc.find(']') != std::string::npos;
        if (open != close) {
            return UrlCheck::Invalid;
        }
        rest = end == std::string::npos ? std::string() : rest.substr(end);
    }

    const std::string path = rest.substr(0, rest.find_first_of("?#"));

    if (scheme.empty() || scheme == "file") {
        return UrlCheck::MaybeLocalFile;
    }
    if (path.empty()) {
        return UrlCheck::Invalid;
    }
    return UrlCheck::Valid;
}

std::string local_path(const std::string& locator) {
    if (core::starts_with(core::to_lower(locator), "file://")) {
        return locator.substr(7);
    }
    if (core::starts_with(core::to_lower(locator), "file:")) {
        return locator.substr(5);
    }
    return locator;
}

std::string package_name(const std::string& locator) {
    std::string last;
    for (const auto& part : core::split(locator, '/')) {
        if (!part.empty()) last = part;
    }
    if (last.empty()) {
        throw ObservationError("no package name in '" + locator + "'");
    }
    return last;
}

std::time_t parse_acquisition_time(const std::string& locator) {
    const std::string pkg = package_name(locator);
    const auto tokens = core::split(pkg, '_');
    if (tokens.size() <= kDateToken) {
        throw ObservationError("package name '" + pkg + "' has no acquisition time token");
    }

    const std::string& token = tokens[kDateToken];
    std::tm tm{};
    std::istringstream in(token);
    in >> std::get_time(&tm, "%Y%m%dT%H%M%S");
    if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
        throw ObservationError("cannot parse acquisition time '" + token + "' of package '" +
                               pkg + "'");
    }
    return timegm(&tm);
}

std::string format_time(std::time_t t) {
    std::tm tm_buf{};
    gmtime_r(&t, &tm_buf);
    std::ostringstream oss;
    oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return oss.str();
}

std::string to_raster_path(const std::string& locator) {
    const std::string lower = core::to_lower(locator);
    std::string path;
    if (core::starts_with(lower, "http://") || core::starts_with(lower, "https://")) {
        path = kVsiCurl + locator;
    } else if (core::starts_with(lower, "s3://")) {
        path = kVsiS3 + locator.substr(5);
    } else if (core::starts_with(lower, "file:")) {
        path = local_path(locator);
    } else {
        path = locator;
    }
    return strip_trailing_slashes(path);
}

std::string strip_vsi_prefix(const std::string& path) {
    if (core::starts_with(path, kVsiCurl)) {
        return path.substr(std::char_traits<char>::length(kVsiCurl));
    }
    if (core::starts_with(path, kVsiS3)) {
        return "s3://" + path.substr(std::char_traits<char>::length(kVsiS3));
    }
    return path;
}

std::string thumbnail_url(const std::string& locator, const std::string& product) {
    const std::string base = strip_trailing_slashes(strip_vsi_prefix(locator));
    return base + "/" + product + "/" + product + "_THUMBNAIL.JPG";
}

std::string map_url(const std::string& locator) {
    return strip_trailing_slashes(strip_vsi_prefix(locator)) + "/map.html";
}

FootprintLookup read_footprint(const std::string& root, io::RasterBackend& backend) {
    FootprintLookup lookup;
    const std::string fn = root + "/bounds.geojson";

    lookup.wkt = backend.read_vector_footprint_wkt(fn);
    if (lookup.wkt) {
        return lookup;
    }

    lookup.used_http_fallback = true;
    try {
        const auto bytes = backend.http_get(strip_vsi_prefix(fn));
        backend.write_mem_file(kFallbackBoundsPath, bytes);
        lookup.wkt = backend.read_vector_footprint_wkt(kFallbackBoundsPath);
        backend.remove(kFallbackBoundsPath);
        if (!lookup.wkt) {
            lookup.error = "fetched bounds of '" + root + "' could not be parsed";
        }
    } catch (const IOError& e) {
        lookup.error = e.what();
    }
    return lookup;
}

ObservationPackage resolve_observation(const std::string& locator,
                                       const ObservationOptions& options,
                                       io::RasterBackend& backend) {
    ObservationPackage obs;
    obs.locator = locator;
    obs.root = to_raster_path(locator);
    obs.package = package_name(locator);
    obs.acquired = parse_acquisition_time(locator);

    const FootprintLookup fp = read_footprint(obs.root, backend);
    obs.footprint_via_http = fp.used_http_fallback;
    if (fp.wkt) {
        obs.footprint_wkt = *fp.wkt;
        obs.footprint_published = true;
    } else {
        obs.footprint_error = fp.error;
    }

    const std::string mask_fn = obs.root + "/QA/" + obs.package + "_FMASK.TIF";
    const io::RasterInfo info = backend.open_info(mask_fn);
    obs.grid = info.grid;
    obs.mask = backend.read_mask(mask_fn);
    if (obs.mask.cols() != obs.grid.width || obs.mask.rows() != obs.grid.height) {
        throw ObservationError("mask '" + mask_fn + "' does not match its declared size");
    }

    obs.nodata_fraction = image::class_fraction(obs.mask, MaskClass::NODATA);
    obs.clear_fraction = image::class_fraction(obs.mask, MaskClass::CLEAR);

    const auto& bands = observation_bands();
    obs.reflectance.bands.reserve(bands.size());
    for (const auto& band : bands) {
        const std::string fn =
            obs.root + "/" + options.product + "/" + options.product + "_" + band + ".TIF";
        Raster r = backend.read_raster(fn, obs.grid.width, obs.grid.height);
        if (r.empty()) {
            throw ObservationError("band file '" + fn + "' has no bands");
        }
        obs.reflectance.bands.push_back(std::move(r.bands.front()));
    }
    // Backends may ignore the buffer size
    image::resample_raster(obs.reflectance, obs.grid.width, obs.grid.height);
    image::scale_and_mask(obs.reflectance, options.scale, obs.mask);

    if (!obs.footprint_published) {
        obs.footprint_wkt = geometry::footprint_from_grid(obs.grid).to_wkt();
    }
    return obs;
}

} // namespace nrt_predict::observation
