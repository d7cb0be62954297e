#include "radbatch/io/result_io.hpp"
#include "radbatch/core/errors.hpp"
#include "radbatch/core/utils.hpp"

#include <algorithm>
#include <fstream>
#include <sstream>

namespace radbatch::io {

namespace {

const char* kTotalKey = "total_pixels_in_polygon:";

long to_long(const std::string& s, const fs::path& path) {
    try {
        size_t pos = 0;
        const long v = std::stol(s, &pos);
        if (pos != s.size() || v < 0) {
            throw ParseError(path.string() + ": bad count: " + s);
        }
        return v;
    } catch (const std::invalid_argument&) {
        throw ParseError(path.string() + ": bad count: " + s);
    } catch (const std::out_of_range&) {
        throw ParseError(path.string() + ": bad count: " + s);
    }
}

} // namespace

fs::path region_result_path(const fs::path& results_dir, const std::string& region_id) {
    return results_dir / (region_id + ".wpd");
}

void write_region_result(const fs::path& path, const RegionResultFile& result) {
    auto rows = result.rows;
    std::sort(rows.begin(), rows.end());

    std::ostringstream oss;
    oss << kTotalKey << " " << result.total_pixels << "\n";
    oss << "raster_id passing_pixels\n";
    for (const auto& [raster, passing] : rows) {
        oss << raster << " " << passing << "\n";
    }
    core::write_text(path, oss.str());
}

RegionResultFile read_region_result(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ParseError("cannot open result file: " + path.string());
    }

    RegionResultFile result;
    result.region_id = path.stem().string();

    std::string line;
    if (!std::getline(in, line) || !core::starts_with(core::trim(line), kTotalKey)) {
        throw ParseError(path.string() + ": missing total_pixels_in_polygon");
    }
    result.total_pixels = to_long(core::trim(core::trim(line).substr(std::string(kTotalKey).size())), path);

    if (!std::getline(in, line)) {
        throw ParseError(path.string() + ": missing column header");
    }

    while (std::getline(in, line)) {
        const auto cols = core::split_whitespace(line);
        if (cols.empty()) {
            continue;
        }
        if (cols.size() != 2) {
            throw ParseError(path.string() + ": bad row: " + line);
        }
        result.rows.emplace_back(cols[0], to_long(cols[1], path));
    }
    return result;
}

} // namespace radbatch::io
