#pragma once

#include "radbatch/core/types.hpp"

#include <filesystem>
#include <istream>
#include <map>
#include <optional>
#include <string>

namespace radbatch::io {

namespace fs = std::filesystem;

// Radiance picture header: text lines up to the first blank line, then the
// resolution string "-Y <h> +X <w>".
struct RasterHeader {
    std::string format;
    int width = 0;
    int height = 0;
    std::string view_line;  // last VIEW= value
    std::optional<double> exposure;
    std::map<std::string, std::string> values;
};

RasterHeader parse_raster_header(std::istream& in, const std::string& source);
RasterHeader read_raster_header(const fs::path& path);

struct ViewFraming {
    char type = 'v';  // v, l, a, h, s, c
    double vp[3] = {0.0, 0.0, 0.0};
    double vh = 45.0;
    double vv = 45.0;
};

// Parses rpict view options (-vt? -vp -vh -vv ...). Unknown options are ignored.
ViewFraming parse_view(const std::string& view_line);

// Decodes a raster into brightness samples. Throws ParseError on failure.
Matrix2Df decode_raster(const fs::path& path);

} // namespace radbatch::io
