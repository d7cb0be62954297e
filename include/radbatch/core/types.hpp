#pragma once

#include <Eigen/Dense>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace radbatch {

namespace fs = std::filesystem;

// Decoded raster grid: rows are image rows, columns are image columns.
using Matrix2Df = Eigen::Matrix<float, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using MaskMatrix = Eigen::Matrix<uint8_t, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

// Pipeline stages. Job phases come first and run in this order; AGGREGATE
// and REPORT are in-process stages used only for events and timings.
enum class Phase {
    SCENE_COMPILE = 0,
    AMBIENT_WARM = 1,
    CONDITION_COMPILE = 2,
    RENDER = 3,
    COMPOSITE = 4,
    CONVERT = 5,
    AGGREGATE = 6,
    REPORT = 7,
    DONE = 8
};

inline std::string phase_to_string(Phase phase) {
    switch (phase) {
        case Phase::SCENE_COMPILE: return "SCENE_COMPILE";
        case Phase::AMBIENT_WARM: return "AMBIENT_WARM";
        case Phase::CONDITION_COMPILE: return "CONDITION_COMPILE";
        case Phase::RENDER: return "RENDER";
        case Phase::COMPOSITE: return "COMPOSITE";
        case Phase::CONVERT: return "CONVERT";
        case Phase::AGGREGATE: return "AGGREGATE";
        case Phase::REPORT: return "REPORT";
        case Phase::DONE: return "DONE";
        default: return "UNKNOWN";
    }
}

inline int phase_to_int(Phase phase) {
    return static_cast<int>(phase);
}

inline Phase int_to_phase(int i) {
    if (i >= 0 && i <= 8) {
        return static_cast<Phase>(i);
    }
    return Phase::SCENE_COMPILE;
}

// Phases that produce external-process jobs, in execution order.
inline const std::vector<Phase>& job_phases() {
    static const std::vector<Phase> phases = {
        Phase::SCENE_COMPILE, Phase::AMBIENT_WARM, Phase::CONDITION_COMPILE,
        Phase::RENDER, Phase::COMPOSITE, Phase::CONVERT};
    return phases;
}

struct Point2d {
    double x = 0.0;
    double y = 0.0;
};

} // namespace radbatch
