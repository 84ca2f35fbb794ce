/**
 * Carpool route matching.
 *
 * Composite similarity score of two trips
 */

#ifndef POOLMATCH_MATCH_OVERLAP_SCORER_HPP
#define POOLMATCH_MATCH_OVERLAP_SCORER_HPP

#include "config/match_config.hpp"
#include "match/match_type.hpp"

namespace POOLMATCH
{
  namespace MATCH
  {

    /**
     * Overlap scorer.
     *
     * The score is computed from the perspective of the query trip: the
     * overlap fraction counts the samples of the query trip, so in general
     * score(a, b) differs from score(b, a).
     */
    class OverlapScorer
    {
    public:
      /**
       * @param config engine configuration
       * @throw CORE::InvalidWeightsError if the weights are invalid
       */
      explicit OverlapScorer(const CONFIG::MatchConfig &config);

      /**
       * Score a candidate trip against a query trip
       * @param a query trip
       * @param b candidate trip
       * @return the candidate with its component metrics
       */
      MatchCandidate score(const CORE::Trip &a, const CORE::Trip &b) const;

      /**
       * Fraction of the points of a having a point of b within radius
       * @return a value in [0,1], 0 if a is empty
       */
      static double calc_overlap_fraction(const CORE::LineString &a,
                                          const CORE::LineString &b,
                                          double radius);
      /**
       * 1 - min(1, distance / max_distance)
       */
      static double calc_proximity(double distance, double max_distance);
      /**
       * 1 - min(1, |difference| / time_window)
       */
      static double calc_time_component(double depart_difference, double time_window);

      /**
       * Weighted sum of the components, clamped to [0,1]
       */
      double calc_composite(double overlap_fraction, double start_proximity,
                            double end_proximity, double time_delta) const;

    private:
      const CONFIG::MatchConfig config_;
    };

  } // MATCH
} // POOLMATCH

#endif // POOLMATCH_MATCH_OVERLAP_SCORER_HPP
