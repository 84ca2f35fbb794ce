/**
 * Carpool route matching.
 *
 * Retrieval of candidate trips overlapping a query trip in space and time
 */

#ifndef POOLMATCH_MATCH_CANDIDATE_RETRIEVER_HPP
#define POOLMATCH_MATCH_CANDIDATE_RETRIEVER_HPP

#include "index/spatial_index.hpp"
#include "store/trip_store.hpp"

#include <chrono>
#include <set>
#include <vector>

namespace POOLMATCH
{
  namespace MATCH
  {

    /**
     * Candidate retriever.
     *
     * The retriever is a cheap pre-filter: it may return trips that score
     * poorly, the scorer decides the final order.
     */
    class CandidateRetriever
    {
    public:
      /**
       * @param index spatial index of active trips
       * @param store trip store
       * @param query_timeout deadline of a single index query. A query still
       * running at the deadline is abandoned, so the index must outlive it
       * @param max_concurrency number of concurrent index queries, 0 for
       * the number of processing units
       */
      CandidateRetriever(const INDEX::SpatialIndex &index,
                         const STORE::TripStore &store,
                         std::chrono::milliseconds query_timeout = std::chrono::milliseconds(5000),
                         int max_concurrency = 0)
          : index_(index), store_(store), query_timeout_(query_timeout),
            max_concurrency_(max_concurrency) {};

      /**
       * Retrieve the trips close to the query trip with a departure within
       * the time window
       * @param trip query trip
       * @param radius search radius around each sampled point, in metres
       * @param time_window maximum departure difference
       * @return candidate snapshots in ascending id order, without the query
       * trip and without trips that are not active
       * @throw CORE::IndexUnavailableError if every index query failed
       */
      std::vector<CORE::Trip> retrieve(const CORE::Trip &trip, double radius,
                                       std::chrono::seconds time_window) const;

      /**
       * Union of the trip ids returned by the index around each sampled
       * point of the trip, the query trip included
       * @throw CORE::IndexUnavailableError if every index query failed
       */
      std::set<CORE::TripId> query_trip_ids(const CORE::Trip &trip, double radius) const;

      /**
       * Check the departure difference of two trips against a window
       */
      static bool within_time_window(const CORE::Trip &a, const CORE::Trip &b,
                                     std::chrono::seconds time_window);

    private:
      const INDEX::SpatialIndex &index_;
      const STORE::TripStore &store_;
      const std::chrono::milliseconds query_timeout_;
      const int max_concurrency_;
    };

  } // MATCH
} // POOLMATCH

#endif // POOLMATCH_MATCH_CANDIDATE_RETRIEVER_HPP
