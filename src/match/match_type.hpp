/**
 * Carpool route matching.
 *
 * Definition of match result types
 */

#ifndef POOLMATCH_MATCH_MATCH_TYPE_HPP
#define POOLMATCH_MATCH_MATCH_TYPE_HPP

#include "core/trip.hpp"

#include <vector>

namespace POOLMATCH
{

  /**
   * Classes related with trip matching
   */
  namespace MATCH
  {

    /**
     * A candidate trip scored against a query trip
     */
    struct MatchCandidate
    {
      CORE::TripId trip_id;     /**< Candidate trip */
      double score;             /**< Composite score in [0,1], higher is better */
      double overlap_fraction;  /**< Fraction of the query samples close to a candidate sample */
      double start_proximity;   /**< 1 at identical origins, 0 at or beyond the start distance ceiling */
      double end_proximity;     /**< 1 at identical destinations, 0 at or beyond the end distance ceiling */
      double time_delta;        /**< 1 at identical departures, 0 at or beyond the time window */
      double depart_difference; /**< Absolute departure difference in seconds */

      bool operator==(const MatchCandidate &rhs) const
      {
        return trip_id == rhs.trip_id && score == rhs.score &&
               overlap_fraction == rhs.overlap_fraction &&
               start_proximity == rhs.start_proximity &&
               end_proximity == rhs.end_proximity &&
               time_delta == rhs.time_delta &&
               depart_difference == rhs.depart_difference;
      }
    };

    typedef std::vector<MatchCandidate> MatchCandidates;

    /**
     * Output of one matching run
     */
    struct MatchResult
    {
      CORE::TripId for_trip_id;   /**< The query trip */
      MatchCandidates candidates; /**< Ranked candidates, best first */
      CORE::Timestamp computed_at;
    };

  } // MATCH

} // POOLMATCH

#endif // POOLMATCH_MATCH_MATCH_TYPE_HPP
