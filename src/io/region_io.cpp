#include "radbatch/io/region_io.hpp"
#include "radbatch/core/errors.hpp"
#include "radbatch/core/utils.hpp"

#include <fstream>
#include <regex>

namespace radbatch::io {

namespace {

// Text after the last ':' when the line carries a "Label: value" prefix.
std::string strip_label(const std::string& line) {
    const size_t colon = line.rfind(':');
    if (colon == std::string::npos) {
        return core::trim(line);
    }
    return core::trim(line.substr(colon + 1));
}

double to_number(const std::string& s, const std::string& id, const std::string& what) {
    try {
        size_t pos = 0;
        const double v = std::stod(s, &pos);
        if (pos != s.size()) {
            throw ParseError(id + ": bad " + what + ": " + s);
        }
        return v;
    } catch (const std::invalid_argument&) {
        throw ParseError(id + ": bad " + what + ": " + s);
    } catch (const std::out_of_range&) {
        throw ParseError(id + ": bad " + what + ": " + s);
    }
}

} // namespace

Region parse_region(std::istream& in, const std::string& id) {
    Region region;
    region.id = id;

    std::string lines[4];
    for (int i = 0; i < 4; ++i) {
        if (!std::getline(in, lines[i])) {
            throw ParseError(id + ": truncated header (line " + std::to_string(i + 1) + ")");
        }
    }

    std::string label = core::trim(lines[0]);
    const std::string label_prefix = "AOI Points File:";
    if (core::starts_with(label, label_prefix)) {
        label = core::trim(label.substr(label_prefix.size()));
    }
    region.label = label;

    std::string view = strip_label(lines[1]);
    if (core::ends_with(core::to_lower(view), ".vp")) {
        view = view.substr(0, view.size() - 3);
    }
    if (view.empty()) {
        throw ParseError(id + ": empty associated view");
    }
    region.view_id = view;

    region.elevation = to_number(strip_label(lines[2]), id, "elevation");

    // Editors may insert a centroid line ahead of the point count.
    std::string count_line = lines[3];
    if (core::starts_with(core::to_lower(core::trim(count_line)), "central")) {
        if (!std::getline(in, count_line)) {
            throw ParseError(id + ": missing point count");
        }
    }

    static const std::regex count_re(R"((\d+))");
    std::smatch m;
    if (!std::regex_search(count_line, m, count_re)) {
        throw ParseError(id + ": missing point count");
    }
    const long declared = std::stol(m[1].str());

    std::string line;
    while (std::getline(in, line)) {
        const auto cols = core::split_whitespace(line);
        if (cols.empty()) {
            continue;
        }
        if (cols.size() < 2) {
            throw ParseError(id + ": bad vertex row: " + line);
        }
        const size_t xi = cols.size() >= 4 ? 2 : 0;
        region.vertices.push_back({to_number(cols[xi], id, "vertex"),
                                   to_number(cols[xi + 1], id, "vertex")});
    }

    if (static_cast<long>(region.vertices.size()) != declared) {
        throw ParseError(id + ": declared " + std::to_string(declared) + " points, found " +
                         std::to_string(region.vertices.size()));
    }
    if (region.vertices.size() < 3) {
        throw ParseError(id + ": polygon needs at least 3 points");
    }
    return region;
}

Region read_region_file(const fs::path& path) {
    std::ifstream in(path);
    if (!in) {
        throw ParseError("cannot open region file: " + path.string());
    }
    Region region = parse_region(in, path.stem().string());
    region.source = path;
    return region;
}

} // namespace radbatch::io
