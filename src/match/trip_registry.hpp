/**
 * Carpool route matching.
 *
 * Registry keeping an in-memory trip store and spatial index consistent
 */

#ifndef POOLMATCH_MATCH_TRIP_REGISTRY_HPP
#define POOLMATCH_MATCH_TRIP_REGISTRY_HPP

#include "index/memory_index.hpp"
#include "store/memory_trip_store.hpp"

namespace POOLMATCH
{
  namespace MATCH
  {

    /**
     * Trip registry.
     *
     * Stores every trip and indexes the sampled points of the trips that
     * can take part in matching. Status and route updates keep the index
     * in line with the store.
     */
    class TripRegistry
    {
    public:
      /**
       * @param sample_interval sampling interval used for route updates
       */
      explicit TripRegistry(double sample_interval = 150.0);

      /**
       * Store a new trip and index it if matchable
       * @throw std::invalid_argument if the id is already registered
       */
      void add_trip(const CORE::Trip &trip);
      /**
       * Replace the route of a trip, resample and reindex it
       * @throw CORE::TripNotFoundError if the trip does not exist
       * @throw CORE::InvalidGeometryError for an invalid route
       */
      void update_polyline(const CORE::TripId &trip_id, const CORE::LineString &polyline);
      /**
       * Change the status of a trip, trips leaving the active state are
       * removed from the index
       * @throw CORE::TripNotFoundError if the trip does not exist
       * @throw std::invalid_argument if the transition is not allowed
       */
      void update_status(const CORE::TripId &trip_id, CORE::TripStatus status);

      const STORE::MemoryTripStore &get_store() const
      {
        return store;
      };
      const INDEX::MemorySpatialIndex &get_index() const
      {
        return index;
      };
      double get_sample_interval() const
      {
        return sample_interval;
      };

    private:
      STORE::MemoryTripStore store;
      INDEX::MemorySpatialIndex index;
      const double sample_interval;
    };

  } // MATCH
} // POOLMATCH

#endif // POOLMATCH_MATCH_TRIP_REGISTRY_HPP
