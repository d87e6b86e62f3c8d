#include "nrt_predict/geometry/footprint.hpp"
#include "nrt_predict/core/errors.hpp"

#include <cmath>
#include <iomanip>
#include <regex>
#include <sstream>

namespace nrt_predict::geometry {

namespace {

Point apply(const GeoTransform& gt, double col, double row) {
    return Point{gt[0] + col * gt[1] + row * gt[2],
                 gt[3] + col * gt[4] + row * gt[5]};
}

} // namespace

bool Polygon::is_closed() const {
    if (ring.size() < 4) return false;
    return ring.front().x == ring.back().x && ring.front().y == ring.back().y;
}

std::string Polygon::to_wkt() const {
    std::ostringstream ss;
    ss << std::setprecision(15);
    ss << "POLYGON ((";
    for (size_t i = 0; i < ring.size(); ++i) {
        if (i > 0) ss << ",";
        ss << ring[i].x << " " << ring[i].y;
    }
    ss << "))";
    return ss.str();
}

Polygon footprint_from_geotransform(const GeoTransform& gt, int width, int height) {
    for (double c : gt) {
        if (!std::isfinite(c)) {
            throw GeometryError("geotransform has non-finite coefficients");
        }
    }
    if (width <= 0 || height <= 0) {
        throw GeometryError("grid size must be positive, got " + std::to_string(width) +
                            " x " + std::to_string(height));
    }

    const double w = static_cast<double>(width);
    const double h = static_cast<double>(height);

    Polygon poly;
    poly.ring.reserve(5);
    poly.ring.push_back(apply(gt, 0.0, 0.0));
    poly.ring.push_back(apply(gt, w, 0.0));
    poly.ring.push_back(apply(gt, w, h));
    poly.ring.push_back(apply(gt, 0.0, h));
    poly.ring.push_back(poly.ring.front());
    return poly;
}

Polygon footprint_from_grid(const GridSpec& grid) {
    return footprint_from_geotransform(grid.transform, grid.width, grid.height);
}

std::string truncate_wkt(const std::string& wkt, int decimals) {
    if (decimals < 0) decimals = 0;
    const std::regex re("([+-]*\\d*\\.\\d{" + std::to_string(decimals) + "})\\d*");
    return std::regex_replace(wkt, re, "$1");
}

std::string format_list(const std::vector<double>& values) {
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(4) << "(";
    for (size_t i = 0; i < values.size(); ++i) {
        if (i > 0) ss << ", ";
        ss << values[i];
    }
    ss << ")";
    return ss.str();
}

} // namespace nrt_predict::geometry
