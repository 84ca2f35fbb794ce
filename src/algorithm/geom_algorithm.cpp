#include "algorithm/geom_algorithm.hpp"
#include "core/error.hpp"
#include "util/debug.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

#include <boost/format.hpp>

namespace
{
  bool is_valid_coordinate(double lat, double lon)
  {
    return std::isfinite(lat) && std::isfinite(lon) &&
           lat >= -90.0 && lat <= 90.0 && lon >= -180.0 && lon <= 180.0;
  }
}

double POOLMATCH::ALGORITHM::haversine_distance(const POOLMATCH::CORE::Point &a,
                                                const POOLMATCH::CORE::Point &b)
{
  return boost::geometry::distance(
      a, b, boost::geometry::strategy::distance::haversine<double>(EARTH_RADIUS));
}

void POOLMATCH::ALGORITHM::validate_coordinate(double lat, double lon)
{
  if (!is_valid_coordinate(lat, lon))
  {
    throw POOLMATCH::CORE::InvalidGeometryError(
        (boost::format("Invalid coordinate lat %1% lon %2%") % lat % lon).str());
  }
}

void POOLMATCH::ALGORITHM::validate_linestring(const POOLMATCH::CORE::LineString &line)
{
  int N = line.get_num_points();
  for (int i = 0; i < N; ++i)
  {
    double lat = line.get_lat(i);
    double lon = line.get_lon(i);
    if (!is_valid_coordinate(lat, lon))
    {
      throw POOLMATCH::CORE::InvalidGeometryError(
          (boost::format("Invalid coordinate at point %1%: lat %2% lon %3%") % i % lat % lon).str());
    }
  }
}

std::vector<double> POOLMATCH::ALGORITHM::calculate_linestring_geodesic_distances(
    const POOLMATCH::CORE::LineString &line)
{
  int N = line.get_num_points();
  std::vector<double> lengths;
  if (N < 2)
    return lengths;
  lengths.resize(N - 1);
  for (int i = 1; i < N; ++i)
  {
    lengths[i - 1] = haversine_distance(line.get_point(i - 1), line.get_point(i));
  }
  return lengths;
}

double POOLMATCH::ALGORITHM::get_geodesic_length(const POOLMATCH::CORE::LineString &line)
{
  double length = 0;
  for (double d : calculate_linestring_geodesic_distances(line))
  {
    length += d;
  }
  return length;
}

POOLMATCH::CORE::Point POOLMATCH::ALGORITHM::interpolate_point(
    const POOLMATCH::CORE::Point &a, const POOLMATCH::CORE::Point &b, double ratio)
{
  double x1 = boost::geometry::get<0>(a);
  double y1 = boost::geometry::get<1>(a);
  double x2 = boost::geometry::get<0>(b);
  double y2 = boost::geometry::get<1>(b);
  return POOLMATCH::CORE::Point(ratio * (x2 - x1) + x1, ratio * (y2 - y1) + y1);
}

POOLMATCH::CORE::LineString POOLMATCH::ALGORITHM::sample_polyline(
    const POOLMATCH::CORE::LineString &polyline, double interval)
{
  if (!(interval > 0))
  {
    throw std::invalid_argument(
        (boost::format("Sample interval must be positive, got %1%") % interval).str());
  }
  validate_linestring(polyline);
  int Npoints = polyline.get_num_points();
  if (Npoints < 2)
  {
    return polyline;
  }
  std::vector<double> distances = calculate_linestring_geodesic_distances(polyline);
  double total = 0;
  for (double d : distances)
  {
    total += d;
  }
  // Multiples closer than this to the end are covered by the last point
  const double end_tolerance = 1e-6;
  POOLMATCH::CORE::LineString sampled;
  sampled.add_point(polyline.get_point(0));
  long long emitted = 0;
  double next = interval;
  double length_visited = 0;
  for (int i = 1; i < Npoints; ++i)
  {
    double temp = distances[i - 1];
    while (temp > 0 && next <= length_visited + temp && next < total - end_tolerance)
    {
      double ratio = (next - length_visited) / temp;
      sampled.add_point(interpolate_point(polyline.get_point(i - 1),
                                          polyline.get_point(i), ratio));
      ++emitted;
      next = interval * (emitted + 1);
    }
    length_visited += temp;
  }
  sampled.add_point(polyline.get_point(Npoints - 1));
  SPDLOG_TRACE("Sampled polyline of {} points and length {} into {} points",
               Npoints, total, sampled.get_num_points());
  return sampled;
}
