#include "radbatch/aggregation/polygon.hpp"

#include <algorithm>
#include <cmath>

namespace radbatch::aggregation {

namespace {
constexpr double kEdgeEpsilon = 1e-10;
}

bool point_in_polygon(const std::vector<Point2d>& polygon, double x, double y) {
    const size_t n = polygon.size();
    if (n < 3) {
        return false;
    }

    bool inside = false;
    for (size_t i = 0, j = n - 1; i < n; j = i++) {
        const Point2d& a = polygon[j];
        const Point2d& b = polygon[i];

        const double cross = (b.x - a.x) * (y - a.y) - (b.y - a.y) * (x - a.x);
        if (std::abs(cross) <= kEdgeEpsilon &&
            x >= std::min(a.x, b.x) - kEdgeEpsilon && x <= std::max(a.x, b.x) + kEdgeEpsilon &&
            y >= std::min(a.y, b.y) - kEdgeEpsilon && y <= std::max(a.y, b.y) + kEdgeEpsilon) {
            return true;
        }

        if ((b.y > y) != (a.y > y)) {
            const double x_cross = (a.x - b.x) * (y - b.y) / (a.y - b.y) + b.x;
            if (x < x_cross) {
                inside = !inside;
            }
        }
    }
    return inside;
}

RegionMask rasterize_polygon(const std::vector<Point2d>& polygon, int width, int height) {
    RegionMask out;
    if (polygon.size() < 3 || width < 1 || height < 1) {
        return out;
    }

    double min_x = polygon.front().x, max_x = min_x;
    double min_y = polygon.front().y, max_y = min_y;
    for (const auto& p : polygon) {
        min_x = std::min(min_x, p.x);
        max_x = std::max(max_x, p.x);
        min_y = std::min(min_y, p.y);
        max_y = std::max(max_y, p.y);
    }

    const int x0 = std::max(0, static_cast<int>(std::ceil(min_x - kEdgeEpsilon)));
    const int y0 = std::max(0, static_cast<int>(std::ceil(min_y - kEdgeEpsilon)));
    const int x1 = std::min(width - 1, static_cast<int>(std::floor(max_x + kEdgeEpsilon)));
    const int y1 = std::min(height - 1, static_cast<int>(std::floor(max_y + kEdgeEpsilon)));
    if (x1 < x0 || y1 < y0) {
        return out;
    }

    out.x0 = x0;
    out.y0 = y0;
    out.mask = MaskMatrix::Zero(y1 - y0 + 1, x1 - x0 + 1);
    for (int row = y0; row <= y1; ++row) {
        for (int col = x0; col <= x1; ++col) {
            if (point_in_polygon(polygon, col, row)) {
                out.mask(row - y0, col - x0) = 1;
                ++out.total;
            }
        }
    }
    return out;
}

long count_passing(const Matrix2Df& raster, const RegionMask& mask, double threshold) {
    long passing = 0;
    for (Eigen::Index r = 0; r < mask.mask.rows(); ++r) {
        const Eigen::Index row = r + mask.y0;
        if (row >= raster.rows()) {
            break;
        }
        for (Eigen::Index c = 0; c < mask.mask.cols(); ++c) {
            const Eigen::Index col = c + mask.x0;
            if (col >= raster.cols()) {
                break;
            }
            if (mask.mask(r, c) && static_cast<double>(raster(row, col)) > threshold) {
                ++passing;
            }
        }
    }
    return passing;
}

} // namespace radbatch::aggregation
