/**
 * Carpool route matching.
 *
 * Proximity query capability over the sampled points of active trips
 */

#ifndef POOLMATCH_INDEX_SPATIAL_INDEX_HPP
#define POOLMATCH_INDEX_SPATIAL_INDEX_HPP

#include "core/geometry.hpp"
#include "core/trip.hpp"

#include <chrono>
#include <vector>

namespace POOLMATCH
{
  /**
   * Spatial index of trips
   */
  namespace INDEX
  {

    /**
     * A trip with a sampled point close to the queried point
     */
    struct NearbyTrip
    {
      CORE::TripId trip_id; /**< Trip owning the matched sample */
      double distance;      /**< Distance in metres from the queried point to the matched sample */
    };

    typedef std::vector<NearbyTrip> NearbyTrips;

    /**
     * Spatial index adapter.
     *
     * Implementations wrap a store with proximity query support. The index
     * may lag behind trip creation: a new trip can be invisible for a short
     * while.
     */
    class SpatialIndex
    {
    public:
      virtual ~SpatialIndex() = default;
      /**
       * Find trips with at least one sampled point within radius of point
       * @param point queried point
       * @param radius search radius in metres
       * @param timeout deadline of the query
       * @return nearby trips, each trip at most once
       * @throw CORE::IndexUnavailableError if the backend cannot be reached
       * @throw CORE::IndexTimeoutError if the deadline is exceeded
       */
      virtual NearbyTrips query_near(const CORE::Point &point, double radius,
                                     std::chrono::milliseconds timeout) const = 0;
    };

  } // INDEX
} // POOLMATCH

#endif // POOLMATCH_INDEX_SPATIAL_INDEX_HPP
