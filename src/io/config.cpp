#include "radbatch/config/configuration.hpp"
#include "radbatch/core/errors.hpp"
#include "radbatch/core/utils.hpp"

#include <cmath>
#include <fstream>

namespace radbatch::config {

template <typename T>
static void read_optional(const YAML::Node& n, const char* key, std::optional<T>& out) {
    if (!n[key]) {
        return;
    }
    if (n[key].IsNull()) {
        out.reset();
    } else {
        out = n[key].as<T>();
    }
}

template <typename T>
static void write_optional(YAML::Node& n, const char* key, const std::optional<T>& v) {
    if (v) {
        n[key] = *v;
    }
}

static RenderParams read_render_params(const YAML::Node& n, RenderParams p) {
    read_optional(n, "aa", p.aa);
    read_optional(n, "ab", p.ab);
    read_optional(n, "ad", p.ad);
    read_optional(n, "ar", p.ar);
    read_optional(n, "as", p.as);
    read_optional(n, "ps", p.ps);
    read_optional(n, "pt", p.pt);
    read_optional(n, "pj", p.pj);
    read_optional(n, "dj", p.dj);
    read_optional(n, "lr", p.lr);
    read_optional(n, "lw", p.lw);
    return p;
}

static YAML::Node render_params_to_yaml(const RenderParams& p) {
    YAML::Node n(YAML::NodeType::Map);
    write_optional(n, "aa", p.aa);
    write_optional(n, "ab", p.ab);
    write_optional(n, "ad", p.ad);
    write_optional(n, "ar", p.ar);
    write_optional(n, "as", p.as);
    write_optional(n, "ps", p.ps);
    write_optional(n, "pt", p.pt);
    write_optional(n, "pj", p.pj);
    write_optional(n, "dj", p.dj);
    write_optional(n, "lr", p.lr);
    write_optional(n, "lw", p.lw);
    return n;
}

RenderParams default_ambient_params() {
    RenderParams p;
    p.aa = 0.1;
    p.ab = 1;
    p.ad = 4096;
    p.ar = 1024;
    p.as = 1024;
    p.dj = 0.7;
    p.lr = 12;
    p.lw = 0.002;
    p.pj = 1.0;
    p.ps = 4;
    p.pt = 0.05;
    return p;
}

RenderParams default_direct_params() {
    RenderParams p;
    p.ab = 0;
    p.ad = 128;
    p.ar = 64;
    p.as = 64;
    p.ps = 2;
    p.lw = 0.005;
    return p;
}

std::string ToolchainConfig::resolve(const std::string& tool) const {
    if (bin_dir.empty() || tool.find('/') != std::string::npos) {
        return tool;
    }
    return (fs::path(bin_dir) / tool).string();
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    try {
        if (node["pipeline"]) {
            auto p = node["pipeline"];
            if (p["abort_on_fail"]) cfg.pipeline.abort_on_fail = p["abort_on_fail"].as<bool>();
        }

        if (node["paths"]) {
            auto p = node["paths"];
            if (p["base_scene"]) cfg.paths.base_scene = p["base_scene"].as<std::string>();
            if (p["ambient_sky"]) cfg.paths.ambient_sky = p["ambient_sky"].as<std::string>();
            if (p["conditions_dir"]) cfg.paths.conditions_dir = p["conditions_dir"].as<std::string>();
            if (p["condition_pattern"]) cfg.paths.condition_pattern = p["condition_pattern"].as<std::string>();
            if (p["viewpoints_dir"]) cfg.paths.viewpoints_dir = p["viewpoints_dir"].as<std::string>();
            if (p["viewpoint_pattern"]) cfg.paths.viewpoint_pattern = p["viewpoint_pattern"].as<std::string>();
            if (p["octree_dir"]) cfg.paths.octree_dir = p["octree_dir"].as<std::string>();
            if (p["image_dir"]) cfg.paths.image_dir = p["image_dir"].as<std::string>();
            if (p["regions_dir"]) cfg.paths.regions_dir = p["regions_dir"].as<std::string>();
            if (p["region_pattern"]) cfg.paths.region_pattern = p["region_pattern"].as<std::string>();
            if (p["results_dir"]) cfg.paths.results_dir = p["results_dir"].as<std::string>();
            if (p["pixel_scale_file"]) cfg.paths.pixel_scale_file = p["pixel_scale_file"].as<std::string>();
            if (p["logs_dir"]) cfg.paths.logs_dir = p["logs_dir"].as<std::string>();
        }

        if (node["render"]) {
            auto r = node["render"];
            if (r["x_res"]) cfg.render.x_res = r["x_res"].as<int>();
            if (r["y_res"]) cfg.render.y_res = r["y_res"].as<int>();
            if (r["warm_x_res"]) cfg.render.warm_x_res = r["warm_x_res"].as<int>();
            if (r["warm_y_res"]) cfg.render.warm_y_res = r["warm_y_res"].as<int>();
            if (r["convert_exposure"]) cfg.render.convert_exposure = r["convert_exposure"].as<int>();
            if (r["isolate_condition_inputs"]) {
                cfg.render.isolate_condition_inputs = r["isolate_condition_inputs"].as<bool>();
            }
            if (r["ambient"]) cfg.render.ambient = read_render_params(r["ambient"], cfg.render.ambient);
            if (r["direct"]) cfg.render.direct = read_render_params(r["direct"], cfg.render.direct);
        }

        if (node["toolchain"]) {
            auto t = node["toolchain"];
            if (t["bin_dir"]) cfg.toolchain.bin_dir = t["bin_dir"].as<std::string>();
            if (t["oconv"]) cfg.toolchain.oconv = t["oconv"].as<std::string>();
            if (t["rpict"]) cfg.toolchain.rpict = t["rpict"].as<std::string>();
            if (t["pcomb"]) cfg.toolchain.pcomb = t["pcomb"].as<std::string>();
            if (t["ra_tiff"]) cfg.toolchain.ra_tiff = t["ra_tiff"].as<std::string>();
            if (t["raypath"]) cfg.toolchain.raypath = t["raypath"].as<std::string>();
            if (t["report_interval_s"]) cfg.toolchain.report_interval_s = t["report_interval_s"].as<int>();
        }

        if (node["workers"]) {
            auto w = node["workers"];
            if (w["scene_compile"]) cfg.workers.scene_compile = w["scene_compile"].as<int>();
            if (w["ambient_warm"]) cfg.workers.ambient_warm = w["ambient_warm"].as<int>();
            if (w["condition_compile"]) cfg.workers.condition_compile = w["condition_compile"].as<int>();
            if (w["render"]) cfg.workers.render = w["render"].as<int>();
            if (w["composite"]) cfg.workers.composite = w["composite"].as<int>();
            if (w["convert"]) cfg.workers.convert = w["convert"].as<int>();
        }

        if (node["aggregation"]) {
            auto a = node["aggregation"];
            if (a["threshold"]) cfg.aggregation.threshold = a["threshold"].as<double>();
            if (a["workers"]) cfg.aggregation.workers = a["workers"].as<int>();
            if (a["raster_pattern"]) cfg.aggregation.raster_pattern = a["raster_pattern"].as<std::string>();
            if (a["skip_existing_results"]) {
                cfg.aggregation.skip_existing_results = a["skip_existing_results"].as<bool>();
            }
        }

        if (node["report"]) {
            auto r = node["report"];
            if (r["timestep_hours"]) cfg.report.timestep_hours = r["timestep_hours"].as<double>();
            if (r["compliance_area_m2"]) cfg.report.compliance_area_m2 = r["compliance_area_m2"].as<double>();
            if (r["output_basename"]) cfg.report.output_basename = r["output_basename"].as<std::string>();
        }
    } catch (const YAML::Exception& e) {
        throw ConfigError(std::string("Invalid value: ") + e.what());
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["abort_on_fail"] = pipeline.abort_on_fail;

    node["paths"]["base_scene"] = paths.base_scene;
    node["paths"]["ambient_sky"] = paths.ambient_sky;
    node["paths"]["conditions_dir"] = paths.conditions_dir;
    node["paths"]["condition_pattern"] = paths.condition_pattern;
    node["paths"]["viewpoints_dir"] = paths.viewpoints_dir;
    node["paths"]["viewpoint_pattern"] = paths.viewpoint_pattern;
    node["paths"]["octree_dir"] = paths.octree_dir;
    node["paths"]["image_dir"] = paths.image_dir;
    node["paths"]["regions_dir"] = paths.regions_dir;
    node["paths"]["region_pattern"] = paths.region_pattern;
    node["paths"]["results_dir"] = paths.results_dir;
    node["paths"]["pixel_scale_file"] = paths.pixel_scale_file;
    node["paths"]["logs_dir"] = paths.logs_dir;

    node["render"]["x_res"] = render.x_res;
    node["render"]["y_res"] = render.y_res;
    node["render"]["warm_x_res"] = render.warm_x_res;
    node["render"]["warm_y_res"] = render.warm_y_res;
    node["render"]["convert_exposure"] = render.convert_exposure;
    node["render"]["isolate_condition_inputs"] = render.isolate_condition_inputs;
    node["render"]["ambient"] = render_params_to_yaml(render.ambient);
    node["render"]["direct"] = render_params_to_yaml(render.direct);

    node["toolchain"]["bin_dir"] = toolchain.bin_dir;
    node["toolchain"]["oconv"] = toolchain.oconv;
    node["toolchain"]["rpict"] = toolchain.rpict;
    node["toolchain"]["pcomb"] = toolchain.pcomb;
    node["toolchain"]["ra_tiff"] = toolchain.ra_tiff;
    node["toolchain"]["raypath"] = toolchain.raypath;
    node["toolchain"]["report_interval_s"] = toolchain.report_interval_s;

    node["workers"]["scene_compile"] = workers.scene_compile;
    node["workers"]["ambient_warm"] = workers.ambient_warm;
    node["workers"]["condition_compile"] = workers.condition_compile;
    node["workers"]["render"] = workers.render;
    node["workers"]["composite"] = workers.composite;
    node["workers"]["convert"] = workers.convert;

    node["aggregation"]["threshold"] = aggregation.threshold;
    node["aggregation"]["workers"] = aggregation.workers;
    node["aggregation"]["raster_pattern"] = aggregation.raster_pattern;
    node["aggregation"]["skip_existing_results"] = aggregation.skip_existing_results;

    node["report"]["timestep_hours"] = report.timestep_hours;
    node["report"]["compliance_area_m2"] = report.compliance_area_m2;
    node["report"]["output_basename"] = report.output_basename;

    return node;
}

void Config::validate() const {
    if (render.x_res < 1 || render.y_res < 1) {
        throw ValidationError("render.x_res and render.y_res must be >= 1");
    }
    if (render.warm_x_res < 1 || render.warm_y_res < 1) {
        throw ValidationError("render.warm_x_res and render.warm_y_res must be >= 1");
    }
    if (render.convert_exposure < -10 || render.convert_exposure > 10) {
        throw ValidationError("render.convert_exposure must be in [-10,10]");
    }
    if (toolchain.report_interval_s < 0) {
        throw ValidationError("toolchain.report_interval_s must be >= 0");
    }
    if (toolchain.oconv.empty() || toolchain.rpict.empty() ||
        toolchain.pcomb.empty() || toolchain.ra_tiff.empty()) {
        throw ValidationError("toolchain program names must not be empty");
    }

    for (Phase phase : job_phases()) {
        if (workers_for(phase) < 1) {
            throw ValidationError("workers." + core::to_lower(phase_to_string(phase)) + " must be >= 1");
        }
    }
    if (aggregation.workers < 1) {
        throw ValidationError("aggregation.workers must be >= 1");
    }
    if (std::isnan(aggregation.threshold)) {
        throw ValidationError("aggregation.threshold must be a number");
    }

    if (!(report.timestep_hours > 0.0)) {
        throw ValidationError("report.timestep_hours must be > 0");
    }
    if (report.compliance_area_m2 < 0.0) {
        throw ValidationError("report.compliance_area_m2 must be >= 0");
    }
    if (report.output_basename.empty()) {
        throw ValidationError("report.output_basename must not be empty");
    }
}

int Config::workers_for(Phase phase) const {
    switch (phase) {
        case Phase::SCENE_COMPILE: return workers.scene_compile;
        case Phase::AMBIENT_WARM: return workers.ambient_warm;
        case Phase::CONDITION_COMPILE: return workers.condition_compile;
        case Phase::RENDER: return workers.render;
        case Phase::COMPOSITE: return workers.composite;
        case Phase::CONVERT: return workers.convert;
        case Phase::AGGREGATE: return aggregation.workers;
        default: return 1;
    }
}

} // namespace radbatch::config
