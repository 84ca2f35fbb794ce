/**
 * Carpool route matching.
 *
 * Read access to the trips owned by the persistence layer
 */

#ifndef POOLMATCH_STORE_TRIP_STORE_HPP
#define POOLMATCH_STORE_TRIP_STORE_HPP

#include "core/trip.hpp"

#include <optional>

namespace POOLMATCH
{
  /**
   * Trip storage
   */
  namespace STORE
  {

    /**
     * Trip store capability consumed by the matching engine
     */
    class TripStore
    {
    public:
      virtual ~TripStore() = default;
      /**
       * Load a snapshot of a trip
       * @param trip_id trip id
       * @return the trip, or an empty optional if it does not exist
       */
      virtual std::optional<CORE::Trip> get_trip(const CORE::TripId &trip_id) const = 0;
    };

  } // STORE
} // POOLMATCH

#endif // POOLMATCH_STORE_TRIP_STORE_HPP
