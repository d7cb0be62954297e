#pragma once

#include "radbatch/core/types.hpp"

#include <filesystem>
#include <istream>
#include <string>
#include <vector>

namespace radbatch::io {

namespace fs = std::filesystem;

// Polygonal area of interest in pixel coordinates.
struct Region {
    std::string id;       // file stem
    std::string label;    // owner / room label
    std::string view_id;  // association key
    double elevation = 0.0;
    std::vector<Point2d> vertices;
    fs::path source;
};

// Fixed layout: label, associated view, elevation, optional centroid line,
// point count, then one vertex per line. Rows with four or more columns
// carry world x y followed by pixel x y; the pixel pair is used.
Region parse_region(std::istream& in, const std::string& id);
Region read_region_file(const fs::path& path);

} // namespace radbatch::io
