#include "store/memory_trip_store.hpp"
#include "core/error.hpp"
#include "util/debug.hpp"

#include <mutex>
#include <stdexcept>

#include <boost/format.hpp>

using namespace POOLMATCH;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::STORE;

void MemoryTripStore::add_trip(const Trip &trip)
{
  std::unique_lock<std::shared_mutex> lock(mutex);
  if (!trips.insert({trip.id, trip}).second)
  {
    throw std::invalid_argument(
        (boost::format("Trip %1% already exists") % trip.id).str());
  }
}

void MemoryTripStore::put_trip(const Trip &trip)
{
  std::unique_lock<std::shared_mutex> lock(mutex);
  trips[trip.id] = trip;
}

Trip MemoryTripStore::update_status(const TripId &trip_id, TripStatus status)
{
  std::unique_lock<std::shared_mutex> lock(mutex);
  auto iter = trips.find(trip_id);
  if (iter == trips.end())
  {
    throw TripNotFoundError(trip_id);
  }
  TripStatus current = iter->second.status;
  if (!is_valid_transition(current, status))
  {
    throw std::invalid_argument(
        (boost::format("Trip %1% cannot change from %2% to %3%") % trip_id %
         status_to_string(current) % status_to_string(status))
            .str());
  }
  iter->second.status = status;
  SPDLOG_DEBUG("Trip {} status {} -> {}", trip_id, status_to_string(current),
               status_to_string(status));
  return iter->second;
}

bool MemoryTripStore::remove_trip(const TripId &trip_id)
{
  std::unique_lock<std::shared_mutex> lock(mutex);
  return trips.erase(trip_id) > 0;
}

std::optional<Trip> MemoryTripStore::get_trip(const TripId &trip_id) const
{
  std::shared_lock<std::shared_mutex> lock(mutex);
  auto iter = trips.find(trip_id);
  if (iter == trips.end())
    return std::nullopt;
  return iter->second;
}

std::vector<TripId> MemoryTripStore::get_trip_ids() const
{
  std::shared_lock<std::shared_mutex> lock(mutex);
  std::vector<TripId> ids;
  ids.reserve(trips.size());
  for (const auto &kv : trips)
  {
    ids.push_back(kv.first);
  }
  return ids;
}

std::vector<TripId> MemoryTripStore::get_active_trip_ids() const
{
  std::shared_lock<std::shared_mutex> lock(mutex);
  std::vector<TripId> ids;
  for (const auto &kv : trips)
  {
    if (kv.second.is_active())
      ids.push_back(kv.first);
  }
  return ids;
}

std::size_t MemoryTripStore::size() const
{
  std::shared_lock<std::shared_mutex> lock(mutex);
  return trips.size();
}
