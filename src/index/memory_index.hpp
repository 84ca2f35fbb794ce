/**
 * Carpool route matching.
 *
 * In-memory spatial index of trip sample points
 */

#ifndef POOLMATCH_INDEX_MEMORY_INDEX_HPP
#define POOLMATCH_INDEX_MEMORY_INDEX_HPP

#include "index/spatial_index.hpp"

#include <shared_mutex>
#include <unordered_map>

#include <boost/geometry/geometries/box.hpp>
#include <boost/geometry/index/rtree.hpp>

namespace POOLMATCH
{
  namespace INDEX
  {

    /**
     * Spatial index backed by a boost rtree.
     *
     * Sample points are stored in a planar (longitude, latitude) rtree. A
     * query searches the box obtained by converting the radius into degrees
     * at the queried latitude, then keeps the samples within the radius by
     * great circle distance. Boxes are not wrapped across the antimeridian.
     */
    class MemorySpatialIndex : public SpatialIndex
    {
    public:
      /**
       * Planar point of the rtree, x is longitude and y is latitude
       */
      typedef boost::geometry::model::point<
          double, 2, boost::geometry::cs::cartesian>
          IndexPoint;
      typedef boost::geometry::model::box<IndexPoint> IndexBox;
      /**
       * Item stored in a node of the rtree, the second member is the key of
       * the trip owning the sample
       */
      typedef std::pair<IndexPoint, unsigned int> Item;
      typedef boost::geometry::index::rtree<
          Item, boost::geometry::index::quadratic<16>>
          Rtree;

      MemorySpatialIndex() = default;
      MemorySpatialIndex(const MemorySpatialIndex &) = delete;
      MemorySpatialIndex &operator=(const MemorySpatialIndex &) = delete;

      /**
       * Index the sampled points of a trip. A trip already in the index is
       * replaced. Trips that cannot take part in matching (not active, or
       * with a zero length route) are not indexed.
       * @param trip trip to be inserted
       * @return true if the trip was indexed
       */
      bool insert_trip(const CORE::Trip &trip);
      /**
       * Remove all sampled points of a trip
       * @return true if the trip was in the index
       */
      bool remove_trip(const CORE::TripId &trip_id);
      bool contains(const CORE::TripId &trip_id) const;
      /**
       * Number of indexed sample points
       */
      std::size_t size() const;
      /**
       * Number of indexed trips
       */
      std::size_t trip_count() const;

      NearbyTrips query_near(const CORE::Point &point, double radius,
                             std::chrono::milliseconds timeout) const override;

    private:
      struct Entry
      {
        unsigned int key;
        std::vector<IndexPoint> points;
      };
      void remove_entry(const Entry &entry);

      Rtree rtree;
      std::unordered_map<CORE::TripId, Entry> entries;
      std::unordered_map<unsigned int, CORE::TripId> trip_ids;
      unsigned int next_key = 0;
      mutable std::shared_mutex mutex;
    };

  } // INDEX
} // POOLMATCH

#endif // POOLMATCH_INDEX_MEMORY_INDEX_HPP
