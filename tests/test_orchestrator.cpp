#include "radbatch/core/errors.hpp"
#include "radbatch/core/utils.hpp"
#include "radbatch/pipeline/orchestrator.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <mutex>
#include <random>
#include <set>
#include <sstream>

using namespace radbatch;
using radbatch::execution::ExitInfo;
using radbatch::execution::LineCallback;
using radbatch::planning::Job;

namespace {

struct Workspace {
  fs::path root;
  config::Config cfg;

  Workspace() {
    std::random_device rd;
    root = fs::temp_directory_path() / ("radbatch_orch_" + std::to_string(rd()));
    fs::create_directories(root / "sky");
    fs::create_directories(root / "view");
    fs::create_directories(root / "aoi");
    core::write_text(root / "tower_skyless.oct", "scene");
    core::write_text(root / "overcast.sky", "sky");
    core::write_text(root / "sky" / "c1.sky", "sky");
    core::write_text(root / "sky" / "c2.sky", "sky");
    core::write_text(root / "view" / "plan.vp", "view");

    cfg.paths.base_scene = (root / "tower_skyless.oct").string();
    cfg.paths.ambient_sky = (root / "overcast.sky").string();
    cfg.paths.conditions_dir = (root / "sky").string();
    cfg.paths.viewpoints_dir = (root / "view").string();
    cfg.paths.octree_dir = (root / "oct").string();
    cfg.paths.image_dir = (root / "img").string();
    cfg.paths.regions_dir = (root / "aoi").string();
    cfg.paths.results_dir = (root / "wpd").string();
    cfg.paths.pixel_scale_file = (root / "aoi" / "pixel_to_world_coordinate_map.txt").string();
    cfg.aggregation.threshold = 1.0;
  }

  ~Workspace() {
    std::error_code ec;
    fs::remove_all(root, ec);
  }
};

// Records jobs and writes their declared output.
struct FakeRunner {
  std::mutex mutex;
  std::vector<std::string> labels;
  std::set<std::string> staged_seen;
  Phase fail_phase = Phase::DONE;

  execution::JobRunner runner() {
    return [this](const Job &job, const LineCallback &) {
      std::lock_guard<std::mutex> lock(mutex);
      labels.push_back(job.label);
      if (const auto *s = std::get_if<planning::ConditionCompileSpec>(&job.spec)) {
        if (s->staged_input && fs::exists(*s->staged_input)) {
          staged_seen.insert(s->staged_input->string());
        }
      }
      ExitInfo info;
      if (job.phase == fail_phase) {
        info.exit_code = 1;
        return info;
      }
      core::write_text(job.output, "artifact");
      info.exit_code = 0;
      return info;
    };
  }
};

// Flat RGBE picture (width below the run-length threshold) with a centered
// 2x2 block of value ~5 in a 4x4 grid.
void write_test_picture(const fs::path &path) {
  std::ofstream out(path, std::ios::binary);
  out << "#?RADIANCE\n"
      << "FORMAT=32-bit_rle_rgbe\n"
      << "VIEW= -vtl -vp 2 2 10 -vd 0 0 -1 -vu 0 1 0 -vh 4 -vv 4\n"
      << "\n"
      << "-Y 4 +X 4\n";
  for (int row = 0; row < 4; ++row) {
    for (int col = 0; col < 4; ++col) {
      const bool lit = row >= 1 && row <= 2 && col >= 1 && col <= 2;
      const unsigned char px[4] = {static_cast<unsigned char>(lit ? 160 : 0),
                                   static_cast<unsigned char>(lit ? 160 : 0),
                                   static_cast<unsigned char>(lit ? 160 : 0),
                                   static_cast<unsigned char>(lit ? 131 : 0)};
      out.write(reinterpret_cast<const char *>(px), 4);
    }
  }
}

} // namespace

TEST_CASE("orchestrator_render_runs_every_phase_then_skips_existing") {
  Workspace ws;
  std::ostringstream log;
  core::EventEmitter emitter;
  pipeline::Orchestrator orch(ws.cfg, emitter, log, "test-run");
  const auto inputs = planning::discover_plan_inputs(ws.cfg);

  FakeRunner fake;
  const auto first = orch.render(inputs, fake.runner());
  REQUIRE(first.success());
  REQUIRE(first.timings.size() == 6);
  // 1 + 1 warm + 2 compiles + (1 + 2) renders + 2 composites + 2 converts
  REQUIRE(fake.labels.size() == 11);
  REQUIRE(fake.staged_seen.size() == 2);
  for (const auto &staged : fake.staged_seen) {
    REQUIRE_FALSE(fs::exists(staged));
  }

  FakeRunner again;
  const auto second = orch.render(inputs, again.runner());
  REQUIRE(second.success());
  REQUIRE(again.labels.empty());
  for (const auto &t : second.timings) {
    REQUIRE(t.skipped == t.planned);
  }
  REQUIRE(log.str().find("\"phase_end\"") != std::string::npos);
}

TEST_CASE("orchestrator_abort_on_fail_stops_after_failed_phase") {
  Workspace ws;
  ws.cfg.pipeline.abort_on_fail = true;
  std::ostringstream log;
  core::EventEmitter emitter;
  pipeline::Orchestrator orch(ws.cfg, emitter, log, "test-run");

  FakeRunner fake;
  fake.fail_phase = Phase::SCENE_COMPILE;
  const auto summary = orch.render(planning::discover_plan_inputs(ws.cfg), fake.runner());
  REQUIRE(summary.aborted);
  REQUIRE(summary.reports.size() == 1);
  REQUIRE(summary.failed_total() == 1);
  REQUIRE_FALSE(summary.success());
}

TEST_CASE("orchestrator_continues_after_failure_by_default") {
  Workspace ws;
  std::ostringstream log;
  core::EventEmitter emitter;
  pipeline::Orchestrator orch(ws.cfg, emitter, log, "test-run");

  FakeRunner fake;
  fake.fail_phase = Phase::COMPOSITE;
  const auto summary = orch.render(planning::discover_plan_inputs(ws.cfg), fake.runner());
  REQUIRE_FALSE(summary.aborted);
  REQUIRE(summary.reports.size() == 6);
  REQUIRE(summary.failed_total() == 2);
}

TEST_CASE("orchestrator_aggregate_writes_results_and_report") {
  Workspace ws;
  fs::create_directories(ws.root / "img");
  write_test_picture(ws.root / "img" / "tower_plan_c1.hdr");
  core::write_text(ws.root / "aoi" / "TenantA_Kitchen.aoi",
                   "AOI Points File: TenantA_Kitchen\n"
                   "ASSOCIATED VIEW FILE: plan.vp\n"
                   "FFL z height(m): 0\n"
                   "NO. PERIMETER POINTS 4: X/Y pixel positions\n"
                   "1 1\n2 1\n2 2\n1 2\n");

  std::ostringstream log;
  core::EventEmitter emitter;
  pipeline::Orchestrator orch(ws.cfg, emitter, log, "test-run");

  const auto rasters = orch.discover_rasters();
  REQUIRE(rasters.size() == 1);
  const auto summary = orch.aggregate(rasters);
  REQUIRE(summary.regions == 1);
  REQUIRE(summary.records == 1);
  REQUIRE(summary.results_written == 1);
  REQUIRE(summary.report.area_per_pixel == Catch::Approx(1.0));
  REQUIRE(summary.report.rows.size() == 1);
  REQUIRE(summary.report.rows[0].total_pixels == 4);
  REQUIRE(summary.report.rows[0].passing_pixels == 4);
  REQUIRE(summary.report.rows[0].area_m2 == Catch::Approx(4.0));
  REQUIRE(fs::exists(ws.cfg.paths.pixel_scale_file));
  for (const auto &f : summary.report_files) {
    REQUIRE(fs::exists(f));
  }

  // Regions with a result file are not evaluated again.
  const auto rerun = orch.aggregate(rasters);
  REQUIRE(rerun.regions_skipped == 1);
  REQUIRE(rerun.records == 0);
  REQUIRE(rerun.report.rows.size() == 1);
}

TEST_CASE("orchestrator_aggregate_requires_rasters") {
  Workspace ws;
  std::ostringstream log;
  core::EventEmitter emitter;
  pipeline::Orchestrator orch(ws.cfg, emitter, log, "test-run");
  REQUIRE_THROWS_AS(orch.aggregate({}), AggregationError);
}
