#pragma once

#include <filesystem>
#include <string>
#include <utility>
#include <vector>

namespace radbatch::io {

namespace fs = std::filesystem;

struct ResultRecord {
    std::string region_id;
    std::string raster_id;
    long total_pixels = 0;
    long passing_pixels = 0;
};

// Contents of one per-region result file.
struct RegionResultFile {
    std::string region_id;
    long total_pixels = 0;
    std::vector<std::pair<std::string, long>> rows;  // raster id, passing pixels
};

// Writes "total_pixels_in_polygon: N", a column header, then rows sorted by
// raster id.
void write_region_result(const fs::path& path, const RegionResultFile& result);
RegionResultFile read_region_result(const fs::path& path);

fs::path region_result_path(const fs::path& results_dir, const std::string& region_id);

} // namespace radbatch::io
