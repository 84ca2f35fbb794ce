#include "match/ranker.hpp"

#include <algorithm>
#include <stdexcept>

using namespace POOLMATCH;
using namespace POOLMATCH::MATCH;

bool Ranker::candidate_compare(const MatchCandidate &a, const MatchCandidate &b)
{
  if (a.score != b.score)
  {
    return a.score > b.score;
  }
  else if (a.depart_difference != b.depart_difference)
  {
    return a.depart_difference < b.depart_difference;
  }
  else
  {
    return a.trip_id < b.trip_id;
  }
}

MatchCandidates Ranker::rank(const MatchCandidates &candidates, std::size_t limit)
{
  if (limit == 0)
  {
    throw std::invalid_argument("Ranking limit must be positive");
  }
  if (candidates.size() <= limit)
  {
    MatchCandidates ranked = candidates;
    std::sort(ranked.begin(), ranked.end(), candidate_compare);
    return ranked;
  }
  MatchCandidates ranked(limit);
  std::partial_sort_copy(candidates.begin(), candidates.end(),
                         ranked.begin(), ranked.end(), candidate_compare);
  return ranked;
}
