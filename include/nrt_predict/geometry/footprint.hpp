#pragma once

#include "nrt_predict/core/types.hpp"

#include <string>
#include <vector>

namespace nrt_predict::geometry {

struct Point {
    double x = 0.0;
    double y = 0.0;
};

// Single closed ring; the last vertex repeats the first.
struct Polygon {
    std::vector<Point> ring;

    bool is_closed() const;
    std::string to_wkt() const;
};

/**
 * Footprint of a raster grid in its own coordinate system.
 * Corners (0,0), (w,0), (w,h), (0,h) are mapped through the affine transform
 * and the first corner is repeated, giving a 5-vertex closed ring.
 * Throws GeometryError on non-finite coefficients or non-positive size.
 */
Polygon footprint_from_geotransform(const GeoTransform& gt, int width, int height);

Polygon footprint_from_grid(const GridSpec& grid);

// Cut every decimal number in `wkt` after `decimals` digits (no rounding).
std::string truncate_wkt(const std::string& wkt, int decimals = 4);

// "(a, b, ...)" with 4 decimals
std::string format_list(const std::vector<double>& values);

} // namespace nrt_predict::geometry
