#include "radbatch/report/report.hpp"
#include "radbatch/core/errors.hpp"
#include "radbatch/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <fstream>
#include <iomanip>
#include <nlohmann/json.hpp>
#include <set>
#include <sstream>
#include <tuple>

namespace radbatch::report {

namespace {

constexpr double kPi = 3.14159265358979323846;

// Value after "<key>=" up to the next ',' or end of line.
std::string field_after(const std::string& line, const std::string& key, const fs::path& path) {
    const size_t pos = line.find(key + "=");
    if (pos == std::string::npos) {
        throw ParseError(path.string() + ": missing " + key + " in: " + line);
    }
    const size_t start = pos + key.size() + 1;
    const size_t end = line.find(',', start);
    return core::trim(line.substr(start, end == std::string::npos ? std::string::npos : end - start));
}

double to_double(const std::string& s, const fs::path& path) {
    try {
        return std::stod(s);
    } catch (const std::exception&) {
        throw ParseError(path.string() + ": bad number: " + s);
    }
}

std::string csv_escape(const std::string& s) {
    if (s.find_first_of(",\"\n") == std::string::npos) {
        return s;
    }
    std::string out = "\"";
    for (char c : s) {
        if (c == '"') out += '"';
        out += c;
    }
    return out + "\"";
}

} // namespace

double PixelScale::pixel_width() const {
    return image_width > 0 ? world_width / image_width : 0.0;
}

double PixelScale::pixel_height() const {
    return image_height > 0 ? world_height / image_height : 0.0;
}

double PixelScale::area_per_pixel() const {
    return std::round(pixel_width() * pixel_height() * 1e6) / 1e6;
}

PixelScale read_pixel_scale(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ParseError("cannot open pixel scale file: " + path.string());
    }
    std::string lines[3];
    for (auto& line : lines) {
        if (!std::getline(in, line)) {
            throw ParseError(path.string() + ": truncated pixel scale header");
        }
    }

    PixelScale scale;
    scale.image_width = static_cast<int>(to_double(field_after(lines[1], "width", path), path));
    scale.image_height = static_cast<int>(to_double(field_after(lines[1], "height", path), path));
    scale.world_width = to_double(field_after(lines[2], "width", path), path);
    scale.world_height = to_double(field_after(lines[2], "height", path), path);
    if (scale.image_width < 1 || scale.image_height < 1 ||
        !(scale.world_width > 0.0) || !(scale.world_height > 0.0)) {
        throw ParseError(path.string() + ": non-positive dimensions");
    }
    return scale;
}

PixelScale pixel_scale_from_header(const io::RasterHeader& header) {
    if (header.view_line.empty()) {
        throw ParseError("raster header has no VIEW line");
    }
    const io::ViewFraming view = io::parse_view(header.view_line);

    PixelScale scale;
    scale.image_width = header.width;
    scale.image_height = header.height;
    if (view.type == 'l') {
        // Parallel projection: -vh/-vv are extents in world units.
        scale.world_width = view.vh;
        scale.world_height = view.vv;
    } else {
        scale.world_width = 2.0 * view.vp[2] * std::tan(view.vh * kPi / 360.0);
        scale.world_height = 2.0 * view.vp[2] * std::tan(view.vv * kPi / 360.0);
    }
    if (!(scale.world_width > 0.0) || !(scale.world_height > 0.0)) {
        throw ParseError("view framing yields non-positive world size: " + header.view_line);
    }
    return scale;
}

void write_pixel_scale(const fs::path& path, const PixelScale& scale, const std::string& view_line) {
    std::ostringstream oss;
    oss << std::fixed << std::setprecision(6);
    oss << "# VIEW: VIEW= " << view_line << "\n";
    oss << "# Image dimensions in pixels: width=" << scale.image_width
        << ", height=" << scale.image_height << "\n";
    oss << "# World dimensions in meters: width=" << scale.world_width
        << ", height=" << scale.world_height << "\n";
    core::write_text(path, oss.str());
}

int longest_run_at_least(const std::vector<double>& values, double minimum) {
    int best = 0;
    int current = 0;
    for (double v : values) {
        if (v >= minimum) {
            best = std::max(best, ++current);
        } else {
            current = 0;
        }
    }
    return best;
}

double hours_for_run(int run, double timestep_hours) {
    return std::floor(run * timestep_hours * 10.0 + 1e-9) / 10.0;
}

Report build_report(const std::vector<io::ResultRecord>& records, double area_per_pixel,
                    const ReportOptions& options) {
    Report report;
    report.area_per_pixel = area_per_pixel;

    std::set<std::string> regions;
    std::set<std::string> rasters;
    std::map<std::string, long> region_pixels;
    for (const auto& rec : records) {
        ReportRow row;
        row.region_id = rec.region_id;
        row.raster_id = rec.raster_id;
        row.total_pixels = rec.total_pixels;
        row.passing_pixels = rec.passing_pixels;
        row.area_m2 = static_cast<double>(rec.passing_pixels) * area_per_pixel;
        report.rows.push_back(row);

        report.pivot[rec.region_id][rec.raster_id] += row.area_m2;
        regions.insert(rec.region_id);
        rasters.insert(rec.raster_id);
        region_pixels.emplace(rec.region_id, rec.total_pixels);
    }
    std::sort(report.rows.begin(), report.rows.end(), [](const ReportRow& a, const ReportRow& b) {
        return std::tie(a.region_id, a.raster_id) < std::tie(b.region_id, b.raster_id);
    });
    report.regions.assign(regions.begin(), regions.end());
    report.rasters.assign(rasters.begin(), rasters.end());

    for (const auto& region : report.regions) {
        const auto& by_raster = report.pivot[region];
        std::vector<double> series;
        series.reserve(report.rasters.size());
        RegionSummary s;
        s.region_id = region;
        const size_t us = region.find('_');
        s.owner = region.substr(0, us);
        s.sub_space = us == std::string::npos ? std::string() : region.substr(us + 1);
        s.region_area_m2 = static_cast<double>(region_pixels[region]) * area_per_pixel;
        for (const auto& raster : report.rasters) {
            auto it = by_raster.find(raster);
            const double area = it == by_raster.end() ? 0.0 : it->second;
            series.push_back(area);
            s.passing_area_total_m2 += area;
        }
        s.consecutive_timesteps = longest_run_at_least(series, options.compliance_area_m2);
        s.hours = hours_for_run(s.consecutive_timesteps, options.timestep_hours);
        report.summaries.push_back(std::move(s));
    }
    return report;
}

Report merge_results(const std::vector<fs::path>& result_files, double area_per_pixel,
                     const ReportOptions& options) {
    std::vector<io::ResultRecord> records;
    std::vector<std::string> warnings;
    for (const auto& path : result_files) {
        try {
            const auto file = io::read_region_result(path);
            for (const auto& [raster, passing] : file.rows) {
                records.push_back({file.region_id, raster, file.total_pixels, passing});
            }
        } catch (const ParseError& e) {
            warnings.push_back(e.what());
        }
    }
    Report report = build_report(records, area_per_pixel, options);
    report.warnings = std::move(warnings);
    return report;
}

void write_flat_csv(const fs::path& path, const Report& report) {
    std::ostringstream oss;
    oss << "region_id,raster_id,total_pixels,passing_pixels,passing_area_m2\n";
    oss << std::setprecision(10);
    for (const auto& row : report.rows) {
        oss << csv_escape(row.region_id) << ',' << csv_escape(row.raster_id) << ','
            << row.total_pixels << ',' << row.passing_pixels << ',' << row.area_m2 << "\n";
    }
    core::write_text(path, oss.str());
}

void write_pivot_csv(const fs::path& path, const Report& report) {
    std::ostringstream oss;
    oss << std::setprecision(10);
    oss << "region_id";
    for (const auto& raster : report.rasters) {
        oss << ',' << csv_escape(raster);
    }
    oss << ",total,consecutive_timesteps,hours\n";

    for (const auto& s : report.summaries) {
        const auto& by_raster = report.pivot.at(s.region_id);
        oss << csv_escape(s.region_id);
        for (const auto& raster : report.rasters) {
            auto it = by_raster.find(raster);
            oss << ',' << (it == by_raster.end() ? 0.0 : it->second);
        }
        oss << ',' << s.passing_area_total_m2 << ',' << s.consecutive_timesteps << ',' << s.hours << "\n";
    }
    core::write_text(path, oss.str());
}

void write_report_json(const fs::path& path, const Report& report) {
    nlohmann::json rows = nlohmann::json::array();
    for (const auto& row : report.rows) {
        rows.push_back({
            {"region_id", row.region_id},
            {"raster_id", row.raster_id},
            {"total_pixels", row.total_pixels},
            {"passing_pixels", row.passing_pixels},
            {"passing_area_m2", row.area_m2}
        });
    }
    nlohmann::json summaries = nlohmann::json::array();
    for (const auto& s : report.summaries) {
        summaries.push_back({
            {"region_id", s.region_id},
            {"owner", s.owner},
            {"sub_space", s.sub_space},
            {"region_area_m2", s.region_area_m2},
            {"passing_area_total_m2", s.passing_area_total_m2},
            {"consecutive_timesteps", s.consecutive_timesteps},
            {"hours", s.hours}
        });
    }
    nlohmann::json doc = {
        {"area_per_pixel_m2", report.area_per_pixel},
        {"rasters", report.rasters},
        {"rows", rows},
        {"pivot", report.pivot},
        {"summaries", summaries},
        {"warnings", report.warnings}
    };
    core::write_text(path, doc.dump(2) + "\n");
}

} // namespace radbatch::report
