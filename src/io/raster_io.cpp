#include "radbatch/io/raster_io.hpp"
#include "radbatch/core/errors.hpp"
#include "radbatch/core/utils.hpp"

#include <fstream>
#include <sstream>

#include <opencv2/opencv.hpp>

namespace radbatch::io {

namespace {

constexpr size_t kMaxHeaderLines = 4096;

// Radiance luminous-efficacy weights for RGB -> brightness.
constexpr float kRedWeight = 0.265074126f;
constexpr float kGreenWeight = 0.670114631f;
constexpr float kBlueWeight = 0.064811243f;

double parse_double(const std::string& s, const std::string& what) {
    try {
        size_t pos = 0;
        double v = std::stod(s, &pos);
        if (pos != s.size()) {
            throw ParseError("trailing characters in " + what + ": " + s);
        }
        return v;
    } catch (const std::invalid_argument&) {
        throw ParseError("expected number for " + what + ": " + s);
    } catch (const std::out_of_range&) {
        throw ParseError("number out of range for " + what + ": " + s);
    }
}

bool has_radiance_signature(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    char magic[2] = {0, 0};
    in.read(magic, 2);
    return in.gcount() == 2 && magic[0] == '#' && magic[1] == '?';
}

} // namespace

RasterHeader parse_raster_header(std::istream& in, const std::string& source) {
    RasterHeader header;
    std::string line;

    if (!std::getline(in, line) || !core::starts_with(line, "#?")) {
        throw ParseError(source + ": missing #? signature");
    }

    bool ended = false;
    for (size_t n = 0; n < kMaxHeaderLines && std::getline(in, line); ++n) {
        const std::string t = core::trim(line);
        if (t.empty()) {
            ended = true;
            break;
        }
        const size_t eq = t.find('=');
        if (eq == std::string::npos) {
            continue;  // command history lines
        }
        const std::string key = core::trim(t.substr(0, eq));
        const std::string value = core::trim(t.substr(eq + 1));
        header.values[key] = value;
        if (key == "FORMAT") {
            header.format = value;
        } else if (key == "VIEW") {
            header.view_line = value;
        } else if (key == "EXPOSURE") {
            const double e = parse_double(value, "EXPOSURE");
            header.exposure = header.exposure ? *header.exposure * e : e;
        }
    }
    if (!ended) {
        throw ParseError(source + ": header not terminated");
    }

    if (!std::getline(in, line)) {
        throw ParseError(source + ": missing resolution line");
    }
    const auto tokens = core::split_whitespace(line);
    if (tokens.size() != 4) {
        throw ParseError(source + ": bad resolution line: " + line);
    }
    int rows = 0;
    int cols = 0;
    for (size_t i = 0; i < 4; i += 2) {
        const std::string& axis = tokens[i];
        if (axis.size() != 2 || (axis[0] != '-' && axis[0] != '+')) {
            throw ParseError(source + ": bad resolution axis: " + axis);
        }
        const int v = static_cast<int>(parse_double(tokens[i + 1], "resolution"));
        if (v < 1) {
            throw ParseError(source + ": non-positive resolution: " + line);
        }
        // The first axis is the scanline direction (rows).
        if (i == 0) {
            rows = v;
        } else {
            cols = v;
        }
    }
    header.height = rows;
    header.width = cols;
    return header;
}

RasterHeader read_raster_header(const fs::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ParseError("cannot open raster: " + path.string());
    }
    return parse_raster_header(in, path.string());
}

ViewFraming parse_view(const std::string& view_line) {
    ViewFraming view;
    const auto tokens = core::split_whitespace(view_line);
    auto value_at = [&](size_t i, const std::string& opt) {
        if (i >= tokens.size()) {
            throw ParseError("view option " + opt + " missing value");
        }
        return parse_double(tokens[i], opt);
    };

    for (size_t i = 0; i < tokens.size(); ++i) {
        const std::string& t = tokens[i];
        if (t.size() == 4 && core::starts_with(t, "-vt")) {
            view.type = t[3];
        } else if (t == "-vp") {
            view.vp[0] = value_at(i + 1, t);
            view.vp[1] = value_at(i + 2, t);
            view.vp[2] = value_at(i + 3, t);
            i += 3;
        } else if (t == "-vd" || t == "-vu") {
            i += 3;
        } else if (t == "-vh") {
            view.vh = value_at(++i, t);
        } else if (t == "-vv") {
            view.vv = value_at(++i, t);
        } else if (t == "-vo" || t == "-va" || t == "-vs" || t == "-vl") {
            ++i;
        }
    }
    return view;
}

Matrix2Df decode_raster(const fs::path& path) {
    cv::Mat img = cv::imread(path.string(), cv::IMREAD_ANYDEPTH | cv::IMREAD_ANYCOLOR);
    if (img.empty()) {
        throw ParseError("cannot decode raster: " + path.string());
    }

    cv::Mat img32;
    img.convertTo(img32, CV_MAKETYPE(CV_32F, img.channels()));

    Matrix2Df out(img32.rows, img32.cols);
    cv::Mat out_cv(img32.rows, img32.cols, CV_32F, out.data());
    if (img32.channels() == 1) {
        img32.copyTo(out_cv);
    } else if (img32.channels() >= 3) {
        // OpenCV stores channels as BGR(A).
        cv::Matx<float, 1, 4> weights(kBlueWeight, kGreenWeight, kRedWeight, 0.0f);
        if (img32.channels() == 3) {
            cv::transform(img32, out_cv, cv::Matx13f(kBlueWeight, kGreenWeight, kRedWeight));
        } else {
            cv::transform(img32, out_cv, weights);
        }
    } else {
        throw ParseError("unsupported channel count in " + path.string());
    }

    // Radiance pictures carry EXPOSURE as a multiplier already applied to the
    // stored pixels. OpenCV leaves it in place, so undo it here.
    if (has_radiance_signature(path)) {
        const RasterHeader header = read_raster_header(path);
        if (header.exposure && *header.exposure > 0.0) {
            out /= static_cast<float>(*header.exposure);
        }
    }
    return out;
}

} // namespace radbatch::io
