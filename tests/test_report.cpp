#include "radbatch/core/errors.hpp"
#include "radbatch/core/utils.hpp"
#include "radbatch/report/report.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <random>
#include <sstream>

using namespace radbatch;
using namespace radbatch::report;

namespace {

fs::path make_temp_dir(const std::string &tag) {
  std::random_device rd;
  fs::path dir = fs::temp_directory_path() /
                 ("radbatch_" + tag + "_" + std::to_string(rd()));
  fs::create_directories(dir);
  return dir;
}

} // namespace

TEST_CASE("merge_results_area_is_passing_times_pixel_area") {
  const fs::path dir = make_temp_dir("merge");
  io::write_region_result(dir / "TenantA_Kitchen.wpd", {"TenantA_Kitchen", 100, {{"t09", 40}, {"t10", 10}}});
  io::write_region_result(dir / "TenantB_Living.wpd", {"TenantB_Living", 50, {{"t09", 5}}});

  const Report r = merge_results({dir / "TenantA_Kitchen.wpd", dir / "TenantB_Living.wpd"}, 0.25, {});
  REQUIRE(r.rows.size() == 3);
  for (const auto &row : r.rows) {
    REQUIRE(row.area_m2 == Catch::Approx(row.passing_pixels * 0.25));
  }
  REQUIRE(r.rasters == std::vector<std::string>{"t09", "t10"});
  // Missing pivot cells count as zero.
  REQUIRE(r.summaries.size() == 2);
  REQUIRE(r.summaries[1].region_id == "TenantB_Living");
  REQUIRE(r.summaries[1].passing_area_total_m2 == Catch::Approx(1.25));
  REQUIRE(r.summaries[0].owner == "TenantA");
  REQUIRE(r.summaries[0].sub_space == "Kitchen");
  REQUIRE(r.summaries[0].region_area_m2 == Catch::Approx(25.0));
  REQUIRE(r.warnings.empty());

  fs::remove_all(dir);
}

TEST_CASE("merge_results_turns_bad_files_into_warnings") {
  const fs::path dir = make_temp_dir("merge_bad");
  io::write_region_result(dir / "good.wpd", {"good", 4, {{"t1", 4}}});
  core::write_text(dir / "bad.wpd", "not a result file\n");

  const Report r = merge_results({dir / "bad.wpd", dir / "good.wpd", dir / "absent.wpd"}, 1.0, {});
  REQUIRE(r.rows.size() == 1);
  REQUIRE(r.warnings.size() == 2);
  fs::remove_all(dir);
}

TEST_CASE("longest_run_and_hours") {
  REQUIRE(longest_run_at_least({1, 2, 0, 3, 3, 3, 0.5}, 1.0) == 3);
  REQUIRE(longest_run_at_least({}, 1.0) == 0);
  REQUIRE(hours_for_run(3, 1.0) == Catch::Approx(3.0));
  REQUIRE(hours_for_run(5, 0.25) == Catch::Approx(1.2));
}

TEST_CASE("build_report_consecutive_timesteps") {
  std::vector<io::ResultRecord> records = {
      {"A_room", "t1", 10, 10}, {"A_room", "t2", 10, 10}, {"A_room", "t3", 10, 0},
      {"A_room", "t4", 10, 10}};
  ReportOptions opts;
  opts.timestep_hours = 0.5;
  opts.compliance_area_m2 = 5.0;
  const Report r = build_report(records, 1.0, opts);
  REQUIRE(r.summaries.size() == 1);
  REQUIRE(r.summaries[0].consecutive_timesteps == 2);
  REQUIRE(r.summaries[0].hours == Catch::Approx(1.0));
  REQUIRE(r.summaries[0].passing_area_total_m2 == Catch::Approx(30.0));
}

TEST_CASE("report_writers_produce_files") {
  const fs::path dir = make_temp_dir("writers");
  const Report r = build_report({{"A_room", "t1", 4, 2}, {"B_room", "t2", 4, 4}}, 0.5, {});
  write_flat_csv(dir / "report.csv", r);
  write_pivot_csv(dir / "report_pivot.csv", r);
  write_report_json(dir / "report.json", r);

  const std::string flat = core::read_text(dir / "report.csv");
  REQUIRE(core::starts_with(flat, "region_id,raster_id,total_pixels,passing_pixels,passing_area_m2\n"));
  REQUIRE(flat.find("A_room,t1,4,2,1\n") != std::string::npos);

  const std::string pivot = core::read_text(dir / "report_pivot.csv");
  REQUIRE(core::starts_with(pivot, "region_id,t1,t2,total,consecutive_timesteps,hours\n"));
  REQUIRE(pivot.find("B_room,0,2,2,") != std::string::npos);

  REQUIRE(core::read_text(dir / "report.json").find("\"area_per_pixel_m2\"") != std::string::npos);
  fs::remove_all(dir);
}

TEST_CASE("pixel_scale_from_parallel_view") {
  io::RasterHeader h;
  h.width = 200;
  h.height = 100;
  h.view_line = "-vtl -vp 5 5 10 -vd 0 0 -1 -vh 20 -vv 10";
  const PixelScale s = pixel_scale_from_header(h);
  REQUIRE(s.pixel_width() == Catch::Approx(0.1));
  REQUIRE(s.pixel_height() == Catch::Approx(0.1));
  REQUIRE(s.area_per_pixel() == Catch::Approx(0.01));
}

TEST_CASE("pixel_scale_from_perspective_view") {
  io::RasterHeader h;
  h.width = 100;
  h.height = 100;
  h.view_line = "-vtv -vp 0 0 5 -vd 0 0 -1 -vh 90 -vv 90";
  const PixelScale s = pixel_scale_from_header(h);
  REQUIRE(s.world_width == Catch::Approx(10.0));
  REQUIRE(s.area_per_pixel() == Catch::Approx(0.01));
}

TEST_CASE("pixel_scale_file_write_then_read") {
  const fs::path dir = make_temp_dir("scale");
  PixelScale s;
  s.image_width = 2048;
  s.image_height = 1024;
  s.world_width = 40.96;
  s.world_height = 20.48;
  write_pixel_scale(dir / "map.txt", s, "-vtl -vh 40.96 -vv 20.48");
  const PixelScale back = read_pixel_scale(dir / "map.txt");
  REQUIRE(back.image_width == 2048);
  REQUIRE(back.image_height == 1024);
  REQUIRE(back.area_per_pixel() == Catch::Approx(0.0004));
  fs::remove_all(dir);
}

TEST_CASE("pixel_scale_rejects_missing_view") {
  io::RasterHeader h;
  h.width = 10;
  h.height = 10;
  REQUIRE_THROWS_AS(pixel_scale_from_header(h), ParseError);
  REQUIRE_THROWS_AS(read_pixel_scale("/nonexistent/radbatch_map.txt"), ParseError);
}
