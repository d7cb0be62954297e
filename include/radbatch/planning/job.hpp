#pragma once

#include "radbatch/config/configuration.hpp"
#include "radbatch/core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <tuple>
#include <variant>
#include <vector>

namespace radbatch::planning {

namespace fs = std::filesystem;

// A lighting condition (sky description). The id is the file stem.
struct Condition {
    std::string id;
    fs::path path;
};

// A camera viewpoint (.vp). The id is the file stem.
struct Viewpoint {
    std::string id;
    fs::path path;
};

struct SceneCompileSpec {
    fs::path base_scene;
    fs::path sky;
};

struct AmbientWarmSpec {
    fs::path octree;
    fs::path view;
    fs::path ambient_file;
    int x_res = 0;
    int y_res = 0;
    config::RenderParams params;
};

struct ConditionCompileSpec {
    fs::path base_scene;
    fs::path condition;
    // Per-condition copy of the base scene, populated before the phase runs.
    std::optional<fs::path> staged_input;

    const fs::path& scene_input() const { return staged_input ? *staged_input : base_scene; }
};

struct RenderSpec {
    fs::path octree;
    fs::path view;
    std::optional<fs::path> ambient_file;
    int x_res = 0;
    int y_res = 0;
    config::RenderParams params;
};

struct CompositeSpec {
    std::vector<fs::path> layers;
};

struct ConvertSpec {
    fs::path source;
    int exposure_stops = 0;
};

inline bool operator==(const SceneCompileSpec& a, const SceneCompileSpec& b) {
    return a.base_scene == b.base_scene && a.sky == b.sky;
}
inline bool operator==(const AmbientWarmSpec& a, const AmbientWarmSpec& b) {
    return std::tie(a.octree, a.view, a.ambient_file, a.x_res, a.y_res, a.params) ==
           std::tie(b.octree, b.view, b.ambient_file, b.x_res, b.y_res, b.params);
}
inline bool operator==(const ConditionCompileSpec& a, const ConditionCompileSpec& b) {
    return std::tie(a.base_scene, a.condition, a.staged_input) ==
           std::tie(b.base_scene, b.condition, b.staged_input);
}
inline bool operator==(const RenderSpec& a, const RenderSpec& b) {
    return std::tie(a.octree, a.view, a.ambient_file, a.x_res, a.y_res, a.params) ==
           std::tie(b.octree, b.view, b.ambient_file, b.x_res, b.y_res, b.params);
}
inline bool operator==(const CompositeSpec& a, const CompositeSpec& b) { return a.layers == b.layers; }
inline bool operator==(const ConvertSpec& a, const ConvertSpec& b) {
    return a.source == b.source && a.exposure_stops == b.exposure_stops;
}

using JobSpec = std::variant<SceneCompileSpec, AmbientWarmSpec, ConditionCompileSpec,
                             RenderSpec, CompositeSpec, ConvertSpec>;

struct Job {
    Phase phase = Phase::SCENE_COMPILE;
    std::string label;
    std::vector<fs::path> inputs;
    fs::path output;
    JobSpec spec;
};

} // namespace radbatch::planning
