/**
 * Carpool route matching.
 *
 * Matching orchestrator: the unit run for each enqueued match job
 */

#ifndef POOLMATCH_MATCH_MATCHING_ORCHESTRATOR_HPP
#define POOLMATCH_MATCH_MATCHING_ORCHESTRATOR_HPP

#include "config/match_config.hpp"
#include "index/spatial_index.hpp"
#include "match/candidate_retriever.hpp"
#include "match/match_type.hpp"
#include "match/overlap_scorer.hpp"
#include "store/trip_store.hpp"

namespace POOLMATCH
{
  namespace MATCH
  {

    /**
     * Matching orchestrator.
     *
     * Each call is independent: the orchestrator only keeps references to
     * its collaborators and an immutable configuration, so it can serve
     * concurrent calls and calling it twice on the same snapshot gives the
     * same candidates in the same order.
     */
    class MatchingOrchestrator
    {
    public:
      /**
       * @param store trip store
       * @param index spatial index of active trips
       * @param config engine configuration
       * @throw CORE::InvalidWeightsError if the weights are invalid
       * @throw std::invalid_argument if another value is invalid
       */
      MatchingOrchestrator(const STORE::TripStore &store,
                           const INDEX::SpatialIndex &index,
                           const CONFIG::MatchConfig &config);

      /**
       * Find the best matches of a trip
       * @param trip_id the query trip
       * @return ranked candidates, empty if the trip is no longer active
       * @throw CORE::TripNotFoundError if the trip does not exist
       * @throw CORE::IndexUnavailableError if the index could not be queried
       */
      MatchResult find_matches(const CORE::TripId &trip_id) const;

      /**
       * Find the best matches of a trip snapshot
       */
      MatchResult match_trip(const CORE::Trip &trip) const;

      /**
       * Score candidates against the query trip, in parallel up to the
       * configured concurrency. The output keeps the order of the input.
       */
      MatchCandidates score_candidates(const CORE::Trip &trip,
                                       const std::vector<CORE::Trip> &candidates) const;

      const CONFIG::MatchConfig &get_config() const
      {
        return config_;
      };

    private:
      const STORE::TripStore &store_;
      const CONFIG::MatchConfig config_;
      const CandidateRetriever retriever_;
      const OverlapScorer scorer_;
    };

  } // MATCH
} // POOLMATCH

#endif // POOLMATCH_MATCH_MATCHING_ORCHESTRATOR_HPP
