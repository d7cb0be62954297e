#pragma once

#include "radbatch/core/types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <tuple>
#include <yaml-cpp/yaml.h>

namespace radbatch::config {

namespace fs = std::filesystem;

struct PipelineConfig {
  bool abort_on_fail = false;
};

struct PathsConfig {
  std::string base_scene;
  std::string ambient_sky;
  std::string conditions_dir = "outputs/sky";
  std::string condition_pattern = "*.sky";
  std::string viewpoints_dir = "outputs/view";
  std::string viewpoint_pattern = "*.vp";
  std::string octree_dir = "outputs/octree";
  std::string image_dir = "outputs/image";
  std::string regions_dir = "outputs/aoi";
  std::string region_pattern = "*.aoi";
  std::string results_dir = "outputs/wpd";
  std::string pixel_scale_file = "outputs/aoi/pixel_to_world_coordinate_map.txt";
  std::string logs_dir = "logs";
};

// rpict ambient and sampling options. Unset values are left to rpict.
struct RenderParams {
  std::optional<double> aa;
  std::optional<int> ab;
  std::optional<int> ad;
  std::optional<int> ar;
  std::optional<int> as;
  std::optional<int> ps;
  std::optional<double> pt;
  std::optional<double> pj;
  std::optional<double> dj;
  std::optional<int> lr;
  std::optional<double> lw;
};

inline bool operator==(const RenderParams& a, const RenderParams& b) {
  return std::tie(a.aa, a.ab, a.ad, a.ar, a.as, a.ps, a.pt, a.pj, a.dj, a.lr, a.lw) ==
         std::tie(b.aa, b.ab, b.ad, b.ar, b.as, b.ps, b.pt, b.pj, b.dj, b.lr, b.lw);
}
inline bool operator!=(const RenderParams& a, const RenderParams& b) { return !(a == b); }

RenderParams default_ambient_params();
RenderParams default_direct_params();

struct RenderConfig {
  int x_res = 2048;
  int y_res = 2048;
  int warm_x_res = 512;
  int warm_y_res = 512;
  int convert_exposure = -4;
  bool isolate_condition_inputs = true;
  RenderParams ambient = default_ambient_params();
  RenderParams direct = default_direct_params();
};

struct ToolchainConfig {
  std::string bin_dir;
  std::string oconv = "oconv";
  std::string rpict = "rpict";
  std::string pcomb = "pcomb";
  std::string ra_tiff = "ra_tiff";
  std::string raypath;
  int report_interval_s = 3;

  std::string resolve(const std::string& tool) const;
};

struct WorkersConfig {
  int scene_compile = 1;
  int ambient_warm = 8;
  int condition_compile = 6;
  int render = 18;
  int composite = 14;
  int convert = 14;
};

struct AggregationConfig {
  double threshold = 0.0;
  int workers = 14;
  std::string raster_pattern = "*.hdr";
  bool skip_existing_results = true;
};

struct ReportConfig {
  double timestep_hours = 1.0;
  double compliance_area_m2 = 1.0;
  std::string output_basename = "compliance_report";
};

struct Config {
  PipelineConfig pipeline;
  PathsConfig paths;
  RenderConfig render;
  ToolchainConfig toolchain;
  WorkersConfig workers;
  AggregationConfig aggregation;
  ReportConfig report;

  static Config load(const fs::path &path);
  static Config from_yaml(const YAML::Node &node);

  void save(const fs::path &path) const;
  YAML::Node to_yaml() const;

  void validate() const;

  // Configured worker count for a job phase; AGGREGATE maps to
  // aggregation.workers.
  int workers_for(Phase phase) const;
};

} // namespace radbatch::config
