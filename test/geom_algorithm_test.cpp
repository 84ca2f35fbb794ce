#include "catch2/catch.hpp"

#include "algorithm/geom_algorithm.hpp"
#include "core/error.hpp"
#include "util/debug.hpp"

#include <cmath>

using namespace POOLMATCH;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::ALGORITHM;

namespace
{
  constexpr double kPi = 3.14159265358979323846;
}

TEST_CASE("haversine distance is tested", "[geom]")
{
  SECTION("one_degree_of_latitude")
  {
    double d = haversine_distance(make_point(12.0, 77.0), make_point(13.0, 77.0));
    REQUIRE(d == Approx(EARTH_RADIUS * kPi / 180.0).epsilon(1e-9));
  }
  SECTION("same_point")
  {
    REQUIRE(haversine_distance(make_point(12.9, 77.58), make_point(12.9, 77.58)) == Approx(0.0));
  }
  SECTION("geodesic_length_of_polyline")
  {
    LineString line = LineString::from_lat_lon({{12.90, 77.58}, {12.92, 77.58}, {12.95, 77.58}});
    double expected = 0.05 * kPi / 180.0 * EARTH_RADIUS;
    REQUIRE(get_geodesic_length(line) == Approx(expected).epsilon(1e-9));
    REQUIRE(calculate_linestring_geodesic_distances(line).size() == 2);
  }
}

TEST_CASE("polyline sampling is tested", "[geom][sampler]")
{
  spdlog::set_level((spdlog::level::level_enum)0);
  spdlog::set_pattern("[%l][%s:%-3#] %v");
  SECTION("straight_meridian")
  {
    LineString line = LineString::from_lat_lon({{12.90, 77.58}, {12.95, 77.58}});
    double length = get_geodesic_length(line);
    LineString sampled = sample_polyline(line, 150);
    int expected_count = static_cast<int>(std::ceil(length / 150)) + 1;
    REQUIRE(expected_count == 39);
    REQUIRE(sampled.get_num_points() == expected_count);
    REQUIRE(sampled.get_lat(0) == Approx(12.90));
    REQUIRE(sampled.get_lat(38) == Approx(12.95));
    for (int j = 1; j < 38; ++j)
    {
      double expected_lat = 12.90 + j * 150.0 / EARTH_RADIUS * 180.0 / kPi;
      REQUIRE(sampled.get_lat(j) == Approx(expected_lat).epsilon(1e-9));
      REQUIRE(sampled.get_lon(j) == Approx(77.58));
    }
  }
  SECTION("samples_continue_across_vertices")
  {
    LineString line = LineString::from_lat_lon(
        {{12.90, 77.58}, {12.9013, 77.58}, {12.9201, 77.58}, {12.93, 77.58}});
    LineString sampled = sample_polyline(line, 100);
    int N = sampled.get_num_points();
    REQUIRE(N > 3);
    for (int i = 1; i < N - 1; ++i)
    {
      double d = haversine_distance(sampled.get_point(i - 1), sampled.get_point(i));
      REQUIRE(d == Approx(100.0).epsilon(1e-6));
    }
    double last = haversine_distance(sampled.get_point(N - 2), sampled.get_point(N - 1));
    REQUIRE(last > 0);
    REQUIRE(last <= 100.0 + 1e-6);
  }
  SECTION("interval_longer_than_route")
  {
    LineString line = LineString::from_lat_lon({{12.90, 77.58}, {12.9001, 77.58}});
    LineString sampled = sample_polyline(line, 150);
    REQUIRE(sampled.get_num_points() == 2);
    REQUIRE(sampled == line);
  }
  SECTION("single_point")
  {
    LineString line = LineString::from_lat_lon({{12.90, 77.58}});
    REQUIRE(sample_polyline(line, 150).get_num_points() == 1);
  }
  SECTION("empty")
  {
    LineString line;
    REQUIRE(sample_polyline(line, 150).is_empty());
  }
  SECTION("invalid_interval")
  {
    LineString line = LineString::from_lat_lon({{12.90, 77.58}, {12.95, 77.58}});
    REQUIRE_THROWS_AS(sample_polyline(line, 0), std::invalid_argument);
    REQUIRE_THROWS_AS(sample_polyline(line, -5), std::invalid_argument);
  }
  SECTION("invalid_coordinate")
  {
    LineString line = LineString::from_lat_lon({{12.90, 77.58}, {95.0, 77.58}});
    REQUIRE_THROWS_AS(sample_polyline(line, 150), InvalidGeometryError);
    LineString nan_line = LineString::from_lat_lon({{12.90, 77.58}, {12.95, std::nan("")}});
    REQUIRE_THROWS_AS(sample_polyline(nan_line, 150), InvalidGeometryError);
  }
}

TEST_CASE("wkt conversion is tested", "[geom]")
{
  LineString line = wkt2linestring("LINESTRING(77.58 12.9,77.6 12.95)");
  REQUIRE(line.get_num_points() == 2);
  REQUIRE(line.get_lat(1) == Approx(12.95));
  REQUIRE(line.get_lon(1) == Approx(77.6));
  REQUIRE(wkt2linestring(line.export_wkt()) == line);
}
