#include "radbatch/core/errors.hpp"
#include "radbatch/core/events.hpp"
#include "radbatch/core/types.hpp"
#include "radbatch/core/utils.hpp"

#include <catch2/catch_test_macros.hpp>

#include <sstream>
#include <thread>

using namespace radbatch;

TEST_CASE("glob_match_alternatives_and_case") {
  REQUIRE(core::glob_match("*.hdr", "plan_c1.HDR"));
  REQUIRE(core::glob_match("*.sky;*.rad", "c1.rad"));
  REQUIRE_FALSE(core::glob_match("*.hdr", "plan_c1.hdr.tmp"));
  REQUIRE(core::glob_match("plan_?1.hdr", "plan_c1.hdr"));
  REQUIRE_FALSE(core::glob_match("plan(1).hdr", "plan1.hdr"));
}

TEST_CASE("compute_worker_count_bounds") {
  REQUIRE(core::compute_worker_count(0, 10) == 1);
  REQUIRE(core::compute_worker_count(8, 2) <= 2);
  const int cores = static_cast<int>(std::thread::hardware_concurrency());
  if (cores > 0) {
    REQUIRE(core::compute_worker_count(cores + 8, 1000) == cores);
  }
}

TEST_CASE("string_helpers") {
  REQUIRE(core::trim("  a b \n") == "a b");
  REQUIRE(core::split("a,b,,c", ',').size() == 4);
  REQUIRE(core::split_whitespace(" 1  2\t3 ").size() == 3);
}

TEST_CASE("to_lower_keeps_non_ascii_bytes") {
  REQUIRE(core::to_lower("Plan_L01") == "plan_l01");
  REQUIRE(core::to_lower("Plan_\xC3\x84.VP") == "plan_\xC3\x84.vp");
}

TEST_CASE("phase_names_round_trip") {
  for (Phase p : job_phases()) {
    REQUIRE(int_to_phase(phase_to_int(p)) == p);
  }
  REQUIRE(job_phases().size() == 6);
  REQUIRE(phase_to_string(Phase::AMBIENT_WARM) == "AMBIENT_WARM");
}

TEST_CASE("error_messages_carry_category") {
  REQUIRE(std::string(ConfigError("bad").what()) == "Config error: bad");
  REQUIRE_THROWS_AS(throw PlanningError("x"), RadbatchError);
}

TEST_CASE("event_emitter_writes_json_lines") {
  std::ostringstream out;
  core::EventEmitter emitter;
  emitter.phase_start("run1", Phase::RENDER, {{"jobs", 3}}, out);
  emitter.phase_end("run1", Phase::RENDER, "ok", {{"failed", 0}}, out);

  std::istringstream lines(out.str());
  std::string line;
  std::getline(lines, line);
  const auto start = core::json::parse(line);
  REQUIRE(start.at("type") == "phase_start");
  REQUIRE(start.at("run_id") == "run1");
  REQUIRE(start.at("phase_name") == "RENDER");
  REQUIRE(start.at("jobs") == 3);
  std::getline(lines, line);
  REQUIRE(core::json::parse(line).at("status") == "ok");
}
