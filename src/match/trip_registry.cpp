#include "match/trip_registry.hpp"
#include "core/error.hpp"
#include "util/debug.hpp"

using namespace POOLMATCH;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::MATCH;

TripRegistry::TripRegistry(double sample_interval_arg) : sample_interval(sample_interval_arg)
{
}

void TripRegistry::add_trip(const Trip &trip)
{
  store.add_trip(trip);
  index.insert_trip(trip);
}

void TripRegistry::update_polyline(const TripId &trip_id, const LineString &polyline)
{
  std::optional<Trip> trip = store.get_trip(trip_id);
  if (!trip)
  {
    throw TripNotFoundError(trip_id);
  }
  trip->reset_polyline(polyline, sample_interval);
  if (!polyline.is_empty())
  {
    trip->origin = polyline.front();
    trip->destination = polyline.back();
  }
  store.put_trip(*trip);
  index.insert_trip(*trip);
  SPDLOG_DEBUG("Trip {} route updated, {} samples", trip_id,
               trip->sampled_points.get_num_points());
}

void TripRegistry::update_status(const TripId &trip_id, TripStatus status)
{
  Trip trip = store.update_status(trip_id, status);
  if (!trip.is_matchable())
  {
    index.remove_trip(trip_id);
  }
}
