/**
 * Carpool route matching.
 *
 * In-memory trip store
 */

#ifndef POOLMATCH_STORE_MEMORY_TRIP_STORE_HPP
#define POOLMATCH_STORE_MEMORY_TRIP_STORE_HPP

#include "store/trip_store.hpp"

#include <map>
#include <shared_mutex>
#include <vector>

namespace POOLMATCH
{
  namespace STORE
  {

    /**
     * Trip store keeping trips in an ordered map. Readers get copies, so a
     * snapshot stays valid while the store is updated.
     */
    class MemoryTripStore : public TripStore
    {
    public:
      MemoryTripStore() = default;
      MemoryTripStore(const MemoryTripStore &) = delete;
      MemoryTripStore &operator=(const MemoryTripStore &) = delete;

      /**
       * Add a new trip
       * @throw std::invalid_argument if a trip with the same id exists
       */
      void add_trip(const CORE::Trip &trip);
      /**
       * Insert or replace a trip
       */
      void put_trip(const CORE::Trip &trip);
      /**
       * Change the status of a trip following the lifecycle
       * @return the updated trip
       * @throw CORE::TripNotFoundError if the trip does not exist
       * @throw std::invalid_argument if the transition is not allowed
       */
      CORE::Trip update_status(const CORE::TripId &trip_id, CORE::TripStatus status);
      bool remove_trip(const CORE::TripId &trip_id);

      std::optional<CORE::Trip> get_trip(const CORE::TripId &trip_id) const override;
      /**
       * Ids of all trips in ascending order
       */
      std::vector<CORE::TripId> get_trip_ids() const;
      /**
       * Ids of all active trips in ascending order
       */
      std::vector<CORE::TripId> get_active_trip_ids() const;
      std::size_t size() const;

    private:
      std::map<CORE::TripId, CORE::Trip> trips;
      mutable std::shared_mutex mutex;
    };

  } // STORE
} // POOLMATCH

#endif // POOLMATCH_STORE_MEMORY_TRIP_STORE_HPP
