#include "radbatch/config/configuration.hpp"
#include "radbatch/core/errors.hpp"
#include "radbatch/core/events.hpp"
#include "radbatch/core/utils.hpp"
#include "radbatch/execution/engine.hpp"
#include "radbatch/execution/invocation.hpp"
#include "radbatch/io/raster_io.hpp"
#include "radbatch/pipeline/orchestrator.hpp"
#include "radbatch/planning/planner.hpp"
#include "radbatch/report/report.hpp"

#include "runner_shared.hpp"

#include <CLI/CLI.hpp>

#include <iostream>
#include <map>
#include <string>

using namespace radbatch;
using runner::RunLog;

namespace {

config::Config load_config(const std::string &config_path) {
  config::Config cfg = config::Config::load(config_path);
  cfg.validate();
  return cfg;
}

void print_timings(const std::vector<pipeline::PhaseTiming> &timings) {
  double total = 0.0;
  for (const auto &t : timings) {
    std::cout << "[DONE] " << phase_to_string(t.phase) << ": "
              << runner::format_duration(t.seconds) << " (" << t.succeeded
              << " ok, " << t.failed << " failed, " << t.skipped
              << " skipped)" << std::endl;
    total += t.seconds;
  }
  std::cout << "[DONE] total: " << runner::format_duration(total) << std::endl;
}

int plan_command(const std::string &config_path) {
  const config::Config cfg = load_config(config_path);
  const auto inputs = planning::discover_plan_inputs(cfg);
  planning::JobPlanner planner(planning::PlannerOptions::from_config(cfg));
  const auto jobs = planner.plan(inputs);
  const auto pending = planning::filter_existing(jobs);
  execution::InvocationBuilder builder(cfg.toolchain);

  std::map<std::string, std::pair<size_t, size_t>> counts;
  for (const auto &job : jobs) {
    ++counts[phase_to_string(job.phase)].first;
  }
  for (const auto &job : pending.jobs) {
    ++counts[phase_to_string(job.phase)].second;
  }

  core::json out;
  out["conditions"] = inputs.conditions.size();
  out["viewpoints"] = inputs.viewpoints.size();
  out["jobs"] = core::json::array();
  for (const auto &job : jobs) {
    out["jobs"].push_back({{"phase", phase_to_string(job.phase)},
                           {"label", job.label},
                           {"output", job.output.string()},
                           {"exists", fs::exists(job.output)},
                           {"command", builder.build(job).to_string()}});
  }
  for (const auto &[phase, c] : counts) {
    out["counts"][phase] = {{"planned", c.first}, {"pending", c.second}};
  }
  out["skipped"] = pending.skipped;
  std::cout << out.dump(2) << std::endl;
  return 0;
}

bool run_render(const config::Config &cfg, pipeline::Orchestrator &orch,
                const planning::PlanInputs &inputs) {
  std::cout << "[PLAN] " << inputs.conditions.size() << " conditions x "
            << inputs.viewpoints.size() << " viewpoints" << std::endl;
  const auto summary =
      orch.render(inputs, execution::make_process_runner(cfg.toolchain));
  if (summary.failed_total() > 0) {
    std::cerr << "Render finished with " << summary.failed_total()
              << " failed jobs" << std::endl;
  }
  return summary.success();
}

bool run_aggregate(pipeline::Orchestrator &orch,
                   const std::vector<fs::path> &rasters) {
  const auto summary = orch.aggregate(rasters);
  if (!summary.warnings.empty()) {
    std::cerr << "Aggregation finished with " << summary.warnings.size()
              << " warnings" << std::endl;
  }
  return true;
}

int pipeline_command(const std::string &config_path, bool do_render,
                     bool do_aggregate) {
  const config::Config cfg = load_config(config_path);
  const std::string run_id = core::get_run_id();
  RunLog run_log(cfg, run_id);
  std::ostream &log_file = run_log.events();

  core::EventEmitter emitter;
  emitter.run_start(run_id,
                    {{"config_path", config_path},
                     {"run_dir", run_log.dir().string()},
                     {"render", do_render},
                     {"aggregate", do_aggregate}},
                    log_file);
  std::cout << "Run ID: " << run_id << std::endl;

  pipeline::Orchestrator orch(cfg, emitter, log_file, run_id);
  bool ok = true;
  try {
    std::vector<fs::path> rasters;
    if (do_render) {
      const auto inputs = planning::discover_plan_inputs(cfg);
      ok = run_render(cfg, orch, inputs);
      for (const auto &p : planning::direct_render_artifacts(orch.plan(inputs))) {
        if (fs::exists(p)) {
          rasters.push_back(p);
        }
      }
    } else {
      rasters = orch.discover_rasters();
    }
    if (do_aggregate && (ok || !cfg.pipeline.abort_on_fail)) {
      ok = run_aggregate(orch, rasters) && ok;
    }
  } catch (const RadbatchError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), log_file);
    ok = false;
  } catch (const fs::filesystem_error &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    emitter.error(run_id, e.what(), log_file);
    ok = false;
  }

  orch.write_timings(run_log.dir() / "timings.json");
  print_timings(orch.timings());
  emitter.run_end(run_id, ok, ok ? "ok" : "error", log_file);
  return ok ? 0 : 1;
}

int pixel_scale_command(const std::string &raster_path,
                        const std::string &out_path) {
  const auto header = io::read_raster_header(raster_path);
  const auto scale = report::pixel_scale_from_header(header);
  report::write_pixel_scale(out_path, scale, header.view_line);
  core::emit_event("pixel_scale", "",
                   {{"raster", raster_path},
                    {"output", out_path},
                    {"image_width", scale.image_width},
                    {"image_height", scale.image_height},
                    {"world_width", scale.world_width},
                    {"world_height", scale.world_height},
                    {"area_per_pixel_m2", scale.area_per_pixel()}},
                   std::cout);
  return 0;
}

} // namespace

int main(int argc, char *argv[]) {
  CLI::App app{"radbatch: batch Radiance renders and region compliance"};
  app.require_subcommand(1);

  std::string config_path;
  std::string raster_path;
  std::string out_path;

  auto plan_cmd = app.add_subcommand("plan", "Print the planned jobs as JSON");
  plan_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();

  auto render_cmd = app.add_subcommand("render", "Run the render phases");
  render_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();

  auto aggregate_cmd = app.add_subcommand(
      "aggregate", "Evaluate regions against rendered rasters and report");
  aggregate_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();

  auto run_cmd =
      app.add_subcommand("run", "Render, then aggregate the direct renders");
  run_cmd->add_option("--config", config_path, "Path to config.yaml")
      ->required();

  auto scale_cmd = app.add_subcommand(
      "pixel-scale", "Derive the pixel-to-world scale from a raster header");
  scale_cmd->add_option("--raster", raster_path, "Radiance picture")
      ->required();
  scale_cmd->add_option("--out", out_path, "Output scale file")->required();

  CLI11_PARSE(app, argc, argv);

  try {
    if (plan_cmd->parsed()) {
      return plan_command(config_path);
    }
    if (render_cmd->parsed()) {
      return pipeline_command(config_path, true, false);
    }
    if (aggregate_cmd->parsed()) {
      return pipeline_command(config_path, false, true);
    }
    if (run_cmd->parsed()) {
      return pipeline_command(config_path, true, true);
    }
    if (scale_cmd->parsed()) {
      return pixel_scale_command(raster_path, out_path);
    }
  } catch (const RadbatchError &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  } catch (const YAML::Exception &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cerr << app.help() << std::endl;
  return 1;
}
