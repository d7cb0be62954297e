#include "radbatch/core/errors.hpp"
#include "radbatch/core/utils.hpp"
#include "radbatch/io/raster_io.hpp"
#include "radbatch/io/region_io.hpp"
#include "radbatch/io/result_io.hpp"

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <filesystem>
#include <fstream>
#include <random>
#include <sstream>

using namespace radbatch;
using namespace radbatch::io;

namespace {

const char *kRegionText = "AOI Points File: TenantA_Kitchen\n"
                          "ASSOCIATED VIEW FILE: plan_L01.vp\n"
                          "FFL z height(m): 3.15\n"
                          "NO. PERIMETER POINTS 4: X/Y/Z positions\n"
                          "10.0 20.0 0 0\n"
                          "12.0 20.0 4 0\n"
                          "12.0 22.0 4 4\n"
                          "10.0 22.0 0 4\n";

} // namespace

TEST_CASE("parse_region_reads_fixed_layout") {
  std::istringstream in(kRegionText);
  const Region r = parse_region(in, "TenantA_Kitchen");
  REQUIRE(r.id == "TenantA_Kitchen");
  REQUIRE(r.label == "TenantA_Kitchen");
  REQUIRE(r.view_id == "plan_L01");
  REQUIRE(r.elevation == Catch::Approx(3.15));
  REQUIRE(r.vertices.size() == 4);
  REQUIRE(r.vertices[2].x == Catch::Approx(4.0));
  REQUIRE(r.vertices[2].y == Catch::Approx(4.0));
}

TEST_CASE("parse_region_skips_centroid_line") {
  std::istringstream in("Room\n"
                        "plan_L02\n"
                        "0\n"
                        "CENTRAL 1.0 1.0\n"
                        "3 points\n"
                        "0 0\n"
                        "5 0\n"
                        "0 5\n");
  const Region r = parse_region(in, "room");
  REQUIRE(r.view_id == "plan_L02");
  REQUIRE(r.vertices.size() == 3);
  REQUIRE(r.vertices[1].x == Catch::Approx(5.0));
}

TEST_CASE("parse_region_rejects_count_mismatch") {
  std::istringstream in("Room\nplan.vp\n0\n4 points\n0 0\n1 0\n1 1\n");
  REQUIRE_THROWS_AS(parse_region(in, "room"), ParseError);
}

TEST_CASE("parse_region_rejects_truncated_and_degenerate") {
  std::istringstream truncated("Room\nplan.vp\n");
  REQUIRE_THROWS_AS(parse_region(truncated, "room"), ParseError);

  std::istringstream two_points("Room\nplan.vp\n0\n2 points\n0 0\n1 1\n");
  REQUIRE_THROWS_AS(parse_region(two_points, "room"), ParseError);

  std::istringstream bad_vertex("Room\nplan.vp\n0\n3 points\n0 0\n1 x\n1 1\n");
  REQUIRE_THROWS_AS(parse_region(bad_vertex, "room"), ParseError);
}

TEST_CASE("parse_raster_header_reads_resolution_and_view") {
  std::istringstream in("#?RADIANCE\n"
                        "rpict -vf plan.vp\n"
                        "VIEW= -vtl -vp 5 5 10 -vd 0 0 -1 -vh 20 -vv 10\n"
                        "EXPOSURE=2\n"
                        "EXPOSURE=0.5\n"
                        "FORMAT=32-bit_rle_rgbe\n"
                        "\n"
                        "-Y 100 +X 200\n");
  const RasterHeader h = parse_raster_header(in, "test.hdr");
  REQUIRE(h.width == 200);
  REQUIRE(h.height == 100);
  REQUIRE(h.format == "32-bit_rle_rgbe");
  REQUIRE(h.exposure.value() == Catch::Approx(1.0));

  const ViewFraming v = parse_view(h.view_line);
  REQUIRE(v.type == 'l');
  REQUIRE(v.vp[2] == Catch::Approx(10.0));
  REQUIRE(v.vh == Catch::Approx(20.0));
  REQUIRE(v.vv == Catch::Approx(10.0));
}

TEST_CASE("parse_raster_header_rejects_malformed") {
  std::istringstream no_sig("RADIANCE\n\n-Y 1 +X 1\n");
  REQUIRE_THROWS_AS(parse_raster_header(no_sig, "a"), ParseError);

  std::istringstream no_end("#?RADIANCE\nFORMAT=32-bit_rle_rgbe\n");
  REQUIRE_THROWS_AS(parse_raster_header(no_end, "b"), ParseError);

  std::istringstream bad_res("#?RADIANCE\n\n-Y 10\n");
  REQUIRE_THROWS_AS(parse_raster_header(bad_res, "c"), ParseError);
}

TEST_CASE("read_raster_header_missing_file") {
  REQUIRE_THROWS_AS(read_raster_header("/nonexistent/radbatch.hdr"), ParseError);
}

TEST_CASE("decode_raster_removes_picture_exposure") {
  std::random_device rd;
  const fs::path dir = fs::temp_directory_path() / ("radbatch_exp_" + std::to_string(rd()));
  fs::create_directories(dir);
  const fs::path path = dir / "exposed.hdr";
  {
    std::ofstream out(path, std::ios::binary);
    out << "#?RADIANCE\n"
        << "FORMAT=32-bit_rle_rgbe\n"
        << "EXPOSURE=2\n"
        << "\n"
        << "-Y 2 +X 2\n";
    // Each pixel stores grey 5.0 in RGBE.
    const unsigned char px[4] = {160, 160, 160, 131};
    for (int i = 0; i < 4; ++i)
      out.write(reinterpret_cast<const char *>(px), 4);
  }

  const Matrix2Df samples = decode_raster(path);
  REQUIRE(samples.rows() == 2);
  REQUIRE(samples.cols() == 2);
  REQUIRE(samples(0, 0) == Catch::Approx(2.5).epsilon(0.01));
  REQUIRE(samples(1, 1) == Catch::Approx(2.5).epsilon(0.01));

  fs::remove_all(dir);
}

TEST_CASE("region_result_file_write_then_read") {
  std::random_device rd;
  const fs::path dir = fs::temp_directory_path() / ("radbatch_wpd_" + std::to_string(rd()));
  const fs::path path = region_result_path(dir, "TenantA_Kitchen");
  REQUIRE(path.filename() == "TenantA_Kitchen.wpd");

  RegionResultFile out;
  out.region_id = "TenantA_Kitchen";
  out.total_pixels = 16;
  out.rows = {{"plan_L01_c2", 3}, {"plan_L01_c1", 16}};
  write_region_result(path, out);

  const RegionResultFile in = read_region_result(path);
  REQUIRE(in.region_id == "TenantA_Kitchen");
  REQUIRE(in.total_pixels == 16);
  REQUIRE(in.rows.size() == 2);
  REQUIRE(in.rows[0].first == "plan_L01_c1");
  REQUIRE(in.rows[1].second == 3);

  fs::remove_all(dir);
}

TEST_CASE("read_region_result_rejects_garbage") {
  std::random_device rd;
  const fs::path dir = fs::temp_directory_path() / ("radbatch_bad_" + std::to_string(rd()));
  fs::create_directories(dir);
  const fs::path path = dir / "broken.wpd";
  core::write_text(path, "hello\n");
  REQUIRE_THROWS_AS(read_region_result(path), ParseError);
  core::write_text(path, "total_pixels_in_polygon: 4\nraster_id passing_pixels\nr1 two\n");
  REQUIRE_THROWS_AS(read_region_result(path), ParseError);
  fs::remove_all(dir);
}
