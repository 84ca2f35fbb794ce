#include "index/memory_index.hpp"
#include "algorithm/geom_algorithm.hpp"
#include "util/debug.hpp"

#include <algorithm>
#include <cmath>
#include <iterator>
#include <map>
#include <mutex>

#include <boost/geometry/index/rtree.hpp>

using namespace POOLMATCH;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::INDEX;

namespace
{
  constexpr double kPi = 3.14159265358979323846;
  // Arc length of one degree of latitude
  constexpr double METERS_PER_DEGREE = ALGORITHM::EARTH_RADIUS * kPi / 180.0;
  // The search box is enlarged, the great circle filter decides
  constexpr double BOX_MARGIN = 1.1;
}

bool MemorySpatialIndex::insert_trip(const Trip &trip)
{
  std::unique_lock<std::shared_mutex> lock(mutex);
  auto iter = entries.find(trip.id);
  if (iter != entries.end())
  {
    remove_entry(iter->second);
    entries.erase(iter);
  }
  if (!trip.is_matchable())
  {
    SPDLOG_DEBUG("Trip {} is not matchable, not indexed", trip.id);
    return false;
  }
  Entry entry{next_key++, {}};
  int N = trip.sampled_points.get_num_points();
  entry.points.reserve(N);
  for (int i = 0; i < N; ++i)
  {
    IndexPoint p(trip.sampled_points.get_lon(i), trip.sampled_points.get_lat(i));
    entry.points.push_back(p);
    rtree.insert(std::make_pair(p, entry.key));
  }
  trip_ids.insert({entry.key, trip.id});
  entries.insert({trip.id, std::move(entry)});
  SPDLOG_TRACE("Indexed trip {} with {} samples", trip.id, N);
  return true;
}

bool MemorySpatialIndex::remove_trip(const TripId &trip_id)
{
  std::unique_lock<std::shared_mutex> lock(mutex);
  auto iter = entries.find(trip_id);
  if (iter == entries.end())
    return false;
  remove_entry(iter->second);
  entries.erase(iter);
  return true;
}

void MemorySpatialIndex::remove_entry(const Entry &entry)
{
  for (const IndexPoint &p : entry.points)
  {
    rtree.remove(std::make_pair(p, entry.key));
  }
  trip_ids.erase(entry.key);
}

bool MemorySpatialIndex::contains(const TripId &trip_id) const
{
  std::shared_lock<std::shared_mutex> lock(mutex);
  return entries.find(trip_id) != entries.end();
}

std::size_t MemorySpatialIndex::size() const
{
  std::shared_lock<std::shared_mutex> lock(mutex);
  return rtree.size();
}

std::size_t MemorySpatialIndex::trip_count() const
{
  std::shared_lock<std::shared_mutex> lock(mutex);
  return entries.size();
}

NearbyTrips MemorySpatialIndex::query_near(const Point &point, double radius,
                                           std::chrono::milliseconds) const
{
  double lat = get_lat(point);
  double lon = get_lon(point);
  double dlat = BOX_MARGIN * radius / METERS_PER_DEGREE;
  double max_abs_lat = std::min(90.0, std::abs(lat) + dlat);
  double cos_lat = std::cos(max_abs_lat * kPi / 180.0);
  double dlon = cos_lat > 1e-9 ? BOX_MARGIN * radius / (METERS_PER_DEGREE * cos_lat) : 360.0;
  IndexBox b(IndexPoint(std::max(-180.0, lon - dlon), std::max(-90.0, lat - dlat)),
             IndexPoint(std::min(180.0, lon + dlon), std::min(90.0, lat + dlat)));
  std::vector<Item> temp;
  std::map<TripId, double> nearest;
  {
    std::shared_lock<std::shared_mutex> lock(mutex);
    rtree.query(boost::geometry::index::intersects(b), std::back_inserter(temp));
    for (const Item &item : temp)
    {
      Point sample(boost::geometry::get<0>(item.first), boost::geometry::get<1>(item.first));
      double dist = ALGORITHM::haversine_distance(point, sample);
      if (dist > radius)
        continue;
      const TripId &id = trip_ids.at(item.second);
      auto found = nearest.find(id);
      if (found == nearest.end())
        nearest.insert({id, dist});
      else
        found->second = std::min(found->second, dist);
    }
  }
  NearbyTrips result;
  result.reserve(nearest.size());
  for (const auto &kv : nearest)
  {
    result.push_back({kv.first, kv.second});
  }
  SPDLOG_TRACE("Query near ({}, {}) radius {}: {} samples in box, {} trips",
               lat, lon, radius, temp.size(), result.size());
  return result;
}
