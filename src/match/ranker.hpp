/**
 * Carpool route matching.
 *
 * Ranking of scored candidates
 */

#ifndef POOLMATCH_MATCH_RANKER_HPP
#define POOLMATCH_MATCH_RANKER_HPP

#include "match/match_type.hpp"

#include <cstddef>

namespace POOLMATCH
{
  namespace MATCH
  {

    /**
     * Ranker of scored candidates
     */
    class Ranker
    {
    public:
      /**
       * Sort candidates by descending score and keep the first limit ones
       * @param candidates scored candidates
       * @param limit maximum number of candidates returned
       * @return ranked candidates, empty for an empty input
       * @throw std::invalid_argument if limit is 0
       */
      static MatchCandidates rank(const MatchCandidates &candidates,
                                  std::size_t limit = 5);
      /**
       * Total order of candidates: higher score first, then smaller
       * departure difference, then smaller trip id
       * @return true if a ranks before b
       */
      static bool candidate_compare(const MatchCandidate &a, const MatchCandidate &b);
    };

  } // MATCH
} // POOLMATCH

#endif // POOLMATCH_MATCH_RANKER_HPP
