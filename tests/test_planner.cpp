#include "radbatch/core/errors.hpp"
#include "radbatch/planning/naming.hpp"
#include "radbatch/planning/planner.hpp"

#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <set>

using namespace radbatch;
using namespace radbatch::planning;

namespace {

PlannerOptions test_options() {
  PlannerOptions o;
  o.ambient_sky = Condition{"overcast", "sky/overcast.sky"};
  o.octree_dir = "oct";
  o.image_dir = "img";
  return o;
}

std::vector<Condition> two_conditions() {
  return {{"c1", "sky/c1.sky"}, {"c2", "sky/c2.sky"}};
}

std::vector<Viewpoint> two_views() {
  return {{"v1", "view/v1.vp"}, {"v2", "view/v2.vp"}};
}

size_t count_phase(const std::vector<Job> &jobs, Phase phase) {
  size_t n = 0;
  for (const auto &j : jobs) {
    if (j.phase == phase)
      ++n;
  }
  return n;
}

fs::path make_temp_dir(const std::string &tag) {
  std::random_device rd;
  fs::path dir = fs::temp_directory_path() /
                 ("radbatch_" + tag + "_" + std::to_string(rd()));
  fs::create_directories(dir);
  return dir;
}

} // namespace

TEST_CASE("scene_base_name_strips_skyless_marker") {
  REQUIRE(scene_base_name("scenes/tower_skyless.oct") == "tower");
  REQUIRE(scene_base_name("scenes/tower.rad") == "tower");
}

TEST_CASE("artifact_naming_uses_double_underscore_for_ambient") {
  ArtifactNaming naming("tower", "oct", "img");
  REQUIRE(naming.path_for({Phase::SCENE_COMPILE, "c1", "", false}) ==
          fs::path("oct") / "tower_c1.oct");
  REQUIRE(naming.path_for({Phase::AMBIENT_WARM, "overcast", "v1", true}) ==
          fs::path("img") / "tower_v1__overcast.amb");
  REQUIRE(naming.path_for({Phase::RENDER, "overcast", "v1", true}) ==
          fs::path("img") / "tower_v1__overcast.hdr");
  REQUIRE(naming.path_for({Phase::RENDER, "c1", "v1", false}) ==
          fs::path("img") / "tower_v1_c1.hdr");
  REQUIRE(naming.path_for({Phase::COMPOSITE, "c1", "v1", false}) ==
          fs::path("img") / "tower_v1_c1_combined.hdr");
  REQUIRE(naming.path_for({Phase::CONVERT, "c1", "v1", false}) ==
          fs::path("img") / "tower_v1_c1_combined.tiff");
  REQUIRE(naming.staged_scene_for("c1") == fs::path("oct") / "tower_c1_temp.oct");
}

TEST_CASE("artifact_naming_rejects_non_job_phase") {
  ArtifactNaming naming("tower", "oct", "img");
  REQUIRE_THROWS_AS(naming.path_for({Phase::REPORT, "c1", "v1", false}), PlanningError);
}

TEST_CASE("plan_job_counts_per_phase") {
  JobPlanner planner(test_options());
  const auto jobs = planner.plan("scene/tower_skyless.oct", two_conditions(), two_views());

  REQUIRE(count_phase(jobs, Phase::SCENE_COMPILE) == 1);
  REQUIRE(count_phase(jobs, Phase::AMBIENT_WARM) == 2);
  // One compile per condition even though each (condition, view) pair asks.
  REQUIRE(count_phase(jobs, Phase::CONDITION_COMPILE) == 2);
  REQUIRE(count_phase(jobs, Phase::RENDER) == 2 + 4);
  REQUIRE(count_phase(jobs, Phase::COMPOSITE) == 4);
  REQUIRE(count_phase(jobs, Phase::CONVERT) == 4);
  REQUIRE(jobs.size() == 17);
}

TEST_CASE("plan_is_grouped_by_phase_and_unique_by_output") {
  JobPlanner planner(test_options());
  const auto jobs = planner.plan("scene/tower.oct", two_conditions(), two_views());

  std::set<std::string> outputs;
  for (size_t i = 0; i < jobs.size(); ++i) {
    REQUIRE(outputs.insert(jobs[i].output.string()).second);
    if (i > 0) {
      REQUIRE(phase_to_int(jobs[i - 1].phase) <= phase_to_int(jobs[i].phase));
    }
  }
}

TEST_CASE("plan_is_deterministic") {
  JobPlanner planner(test_options());
  const auto a = planner.plan("scene/tower.oct", two_conditions(), two_views());
  const auto b = planner.plan("scene/tower.oct", two_conditions(), two_views());
  REQUIRE(a.size() == b.size());
  for (size_t i = 0; i < a.size(); ++i) {
    REQUIRE(a[i].phase == b[i].phase);
    REQUIRE(a[i].label == b[i].label);
    REQUIRE(a[i].output == b[i].output);
    REQUIRE(a[i].inputs == b[i].inputs);
  }
}

TEST_CASE("plan_composite_combines_ambient_and_direct") {
  JobPlanner planner(test_options());
  const auto jobs = planner.plan("scene/tower.oct", {{"c1", "sky/c1.sky"}}, {{"v1", "view/v1.vp"}});
  const Job *composite = nullptr;
  for (const auto &j : jobs) {
    if (j.phase == Phase::COMPOSITE)
      composite = &j;
  }
  REQUIRE(composite != nullptr);
  const auto &spec = std::get<CompositeSpec>(composite->spec);
  REQUIRE(spec.layers.size() == 2);
  REQUIRE(spec.layers[0] == fs::path("img") / "tower_v1__overcast.hdr");
  REQUIRE(spec.layers[1] == fs::path("img") / "tower_v1_c1.hdr");
}

TEST_CASE("plan_stages_condition_inputs_when_isolated") {
  PlannerOptions o = test_options();
  JobPlanner isolated(o);
  o.isolate_condition_inputs = false;
  JobPlanner shared(o);

  for (const auto &j : isolated.plan("scene/tower.oct", two_conditions(), two_views())) {
    if (j.phase == Phase::CONDITION_COMPILE) {
      const auto &spec = std::get<ConditionCompileSpec>(j.spec);
      REQUIRE(spec.staged_input.has_value());
      REQUIRE(spec.scene_input() != spec.base_scene);
    }
  }
  for (const auto &j : shared.plan("scene/tower.oct", two_conditions(), two_views())) {
    if (j.phase == Phase::CONDITION_COMPILE) {
      REQUIRE_FALSE(std::get<ConditionCompileSpec>(j.spec).staged_input.has_value());
    }
  }
}

TEST_CASE("plan_empty_inputs_yield_empty_plan") {
  JobPlanner planner(test_options());
  REQUIRE(planner.plan("scene/tower.oct", {}, two_views()).empty());
  REQUIRE(planner.plan("scene/tower.oct", two_conditions(), {}).empty());
}

TEST_CASE("plan_rejects_duplicate_ids_and_missing_sky") {
  JobPlanner planner(test_options());
  std::vector<Condition> dup = {{"c1", "a/c1.sky"}, {"c1", "b/c1.sky"}};
  REQUIRE_THROWS_AS(planner.plan("scene/tower.oct", dup, two_views()), PlanningError);
  REQUIRE_THROWS_AS(planner.plan("", two_conditions(), two_views()), PlanningError);

  PlannerOptions o = test_options();
  o.ambient_sky = Condition{};
  JobPlanner no_sky(o);
  REQUIRE_THROWS_AS(no_sky.plan("scene/tower.oct", two_conditions(), two_views()),
                    PlanningError);
}

TEST_CASE("plan_rejects_ids_that_produce_the_same_artifact_name") {
  JobPlanner planner(test_options());
  // tower_a_b_c.hdr is both (view a_b, condition c) and (view a, condition b_c).
  const std::vector<Condition> conditions = {{"c", "sky/c.sky"}, {"b_c", "sky/b_c.sky"}};
  const std::vector<Viewpoint> views = {{"a_b", "view/a_b.vp"}, {"a", "view/a.vp"}};
  REQUIRE_THROWS_AS(planner.plan("scene/tower.oct", conditions, views), PlanningError);
}

TEST_CASE("plan_rejects_condition_named_like_ambient_sky") {
  JobPlanner planner(test_options());
  const std::vector<Condition> conditions = {{"overcast", "sky/other/overcast.sky"}};
  REQUIRE_THROWS_AS(planner.plan("scene/tower.oct", conditions, two_views()), PlanningError);
}

TEST_CASE("plan_compiles_each_condition_once_in_input_order") {
  JobPlanner planner(test_options());
  const std::vector<Condition> conditions = {{"c2", "sky/c2.sky"}, {"c1", "sky/c1.sky"}};
  const auto jobs = planner.plan("scene/tower.oct", conditions, two_views());

  std::vector<std::string> labels;
  for (const auto &j : jobs) {
    if (j.phase == Phase::CONDITION_COMPILE)
      labels.push_back(j.label);
  }
  REQUIRE(labels.size() == 2);
  REQUIRE(labels[0] == "oconv c2");
  REQUIRE(labels[1] == "oconv c1");
}

TEST_CASE("direct_render_artifacts_excludes_ambient_pass") {
  JobPlanner planner(test_options());
  const auto jobs = planner.plan("scene/tower.oct", two_conditions(), two_views());
  const auto rasters = direct_render_artifacts(jobs);
  REQUIRE(rasters.size() == 4);
  for (const auto &p : rasters) {
    REQUIRE(p.filename().string().find("__") == std::string::npos);
  }
}

TEST_CASE("filter_existing_skips_present_outputs") {
  JobPlanner planner(test_options());
  const auto jobs = planner.plan("scene/tower.oct", two_conditions(), two_views());

  std::set<std::string> present = {jobs[0].output.string(), jobs[3].output.string()};
  auto exists = [&](const fs::path &p) { return present.count(p.string()) > 0; };

  const auto first = filter_existing(jobs, exists);
  REQUIRE(first.skipped == 2);
  REQUIRE(first.jobs.size() == jobs.size() - 2);

  for (const auto &j : first.jobs) {
    present.insert(j.output.string());
  }
  const auto second = filter_existing(jobs, exists);
  REQUIRE(second.jobs.empty());
  REQUIRE(second.skipped == jobs.size());
}

TEST_CASE("filter_existing_checks_filesystem") {
  const fs::path dir = make_temp_dir("filter");
  PlannerOptions o = test_options();
  o.octree_dir = dir / "oct";
  o.image_dir = dir / "img";
  JobPlanner planner(o);
  const auto jobs = planner.plan("scene/tower.oct", {{"c1", "sky/c1.sky"}}, {{"v1", "view/v1.vp"}});

  REQUIRE(filter_existing(jobs).skipped == 0);

  fs::create_directories(dir / "oct");
  std::ofstream(jobs.front().output) << "octree";
  const auto filtered = filter_existing(jobs);
  REQUIRE(filtered.skipped == 1);
  REQUIRE(filtered.jobs.size() == jobs.size() - 1);

  fs::remove_all(dir);
}

TEST_CASE("discover_plan_inputs_requires_base_scene") {
  config::Config cfg;
  cfg.paths.base_scene = "/nonexistent/radbatch/scene.oct";
  cfg.paths.ambient_sky = "/nonexistent/radbatch/overcast.sky";
  REQUIRE_THROWS_AS(discover_plan_inputs(cfg), PlanningError);
}

TEST_CASE("discover_plan_inputs_sorts_by_name") {
  const fs::path dir = make_temp_dir("discover");
  fs::create_directories(dir / "sky");
  fs::create_directories(dir / "view");
  std::ofstream(dir / "scene.oct") << "x";
  std::ofstream(dir / "overcast.sky") << "x";
  std::ofstream(dir / "sky" / "b.sky") << "x";
  std::ofstream(dir / "sky" / "a.sky") << "x";
  std::ofstream(dir / "sky" / "notes.txt") << "x";
  std::ofstream(dir / "view" / "north.vp") << "x";

  config::Config cfg;
  cfg.paths.base_scene = (dir / "scene.oct").string();
  cfg.paths.ambient_sky = (dir / "overcast.sky").string();
  cfg.paths.conditions_dir = (dir / "sky").string();
  cfg.paths.viewpoints_dir = (dir / "view").string();

  const auto inputs = discover_plan_inputs(cfg);
  REQUIRE(inputs.conditions.size() == 2);
  REQUIRE(inputs.conditions[0].id == "a");
  REQUIRE(inputs.conditions[1].id == "b");
  REQUIRE(inputs.viewpoints.size() == 1);
  REQUIRE(inputs.viewpoints[0].id == "north");

  fs::remove_all(dir);
}
