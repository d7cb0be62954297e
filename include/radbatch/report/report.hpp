#pragma once

#include "radbatch/io/raster_io.hpp"
#include "radbatch/io/result_io.hpp"

#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace radbatch::report {

namespace fs = std::filesystem;

// Pixel grid to world mapping of a plan view.
struct PixelScale {
    int image_width = 0;
    int image_height = 0;
    double world_width = 0.0;
    double world_height = 0.0;

    double pixel_width() const;
    double pixel_height() const;
    // Rounded to 6 decimals (square meters).
    double area_per_pixel() const;
};

// Reads the three-line header of a pixel-to-world map file.
PixelScale read_pixel_scale(const fs::path& path);
// Derives the scale from a raster's VIEW= framing and resolution.
PixelScale pixel_scale_from_header(const io::RasterHeader& header);
void write_pixel_scale(const fs::path& path, const PixelScale& scale, const std::string& view_line);

struct ReportOptions {
    double timestep_hours = 1.0;
    double compliance_area_m2 = 1.0;
};

struct ReportRow {
    std::string region_id;
    std::string raster_id;
    long total_pixels = 0;
    long passing_pixels = 0;
    double area_m2 = 0.0;
};

struct RegionSummary {
    std::string region_id;
    std::string owner;      // text before the first '_'
    std::string sub_space;  // remainder
    double region_area_m2 = 0.0;
    double passing_area_total_m2 = 0.0;
    int consecutive_timesteps = 0;
    double hours = 0.0;
};

struct Report {
    double area_per_pixel = 0.0;
    std::vector<ReportRow> rows;  // sorted by (region, raster)
    std::vector<std::string> regions;
    std::vector<std::string> rasters;
    std::map<std::string, std::map<std::string, double>> pivot;  // region -> raster -> area
    std::vector<RegionSummary> summaries;
    std::vector<std::string> warnings;
};

int longest_run_at_least(const std::vector<double>& values, double minimum);
double hours_for_run(int run, double timestep_hours);

Report build_report(const std::vector<io::ResultRecord>& records, double area_per_pixel,
                    const ReportOptions& options);

// Reads per-region result files; unreadable files become warnings.
Report merge_results(const std::vector<fs::path>& result_files, double area_per_pixel,
                     const ReportOptions& options);

void write_flat_csv(const fs::path& path, const Report& report);
void write_pivot_csv(const fs::path& path, const Report& report);
void write_report_json(const fs::path& path, const Report& report);

} // namespace radbatch::report
