#pragma once

#include "radbatch/core/types.hpp"

#include <vector>

namespace radbatch::aggregation {

// Even-odd ray casting. Points on an edge or vertex count as inside.
bool point_in_polygon(const std::vector<Point2d>& polygon, double x, double y);

// Polygon coverage of a width x height pixel grid, stored for the polygon's
// clipped bounding box only. Pixel (col, row) is sampled at (x=col, y=row).
struct RegionMask {
    int x0 = 0;
    int y0 = 0;
    MaskMatrix mask;
    long total = 0;
};

RegionMask rasterize_polygon(const std::vector<Point2d>& polygon, int width, int height);

// Pixels inside the mask whose value is strictly above `threshold`.
long count_passing(const Matrix2Df& raster, const RegionMask& mask, double threshold);

} // namespace radbatch::aggregation
