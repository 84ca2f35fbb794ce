#include "match/matching_orchestrator.hpp"
#include "core/error.hpp"
#include "match/ranker.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

#include <algorithm>

using namespace POOLMATCH;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::MATCH;

namespace
{
  const CONFIG::MatchConfig &validated(const CONFIG::MatchConfig &config)
  {
    config.validate();
    return config;
  }
}

MatchingOrchestrator::MatchingOrchestrator(const STORE::TripStore &store,
                                           const INDEX::SpatialIndex &index,
                                           const CONFIG::MatchConfig &config)
    : store_(store), config_(validated(config)),
      retriever_(index, store, config.query_timeout, config.max_concurrency),
      scorer_(config)
{
}

MatchResult MatchingOrchestrator::find_matches(const TripId &trip_id) const
{
  std::optional<Trip> trip = store_.get_trip(trip_id);
  if (!trip)
  {
    throw TripNotFoundError(trip_id);
  }
  return match_trip(*trip);
}

MatchResult MatchingOrchestrator::match_trip(const Trip &trip) const
{
  MatchResult result;
  result.for_trip_id = trip.id;
  result.computed_at = std::chrono::system_clock::now();
  if (!trip.is_matchable())
  {
    SPDLOG_DEBUG("Trip {} ({}) is not matchable", trip.id, status_to_string(trip.status));
    return result;
  }
  SPDLOG_DEBUG("Retrieve candidates of trip {} with {} samples",
               trip.id, trip.sampled_points.get_num_points());
  std::vector<Trip> candidates = retriever_.retrieve(trip, config_.match_radius,
                                                     config_.time_window);
  SPDLOG_DEBUG("Score {} candidates", candidates.size());
  MatchCandidates scored = score_candidates(trip, candidates);
  result.candidates = Ranker::rank(scored, config_.limit);
  SPDLOG_DEBUG("Trip {} ranked {} of {} candidates", trip.id,
               result.candidates.size(), scored.size());
  return result;
}

MatchCandidates MatchingOrchestrator::score_candidates(
    const Trip &trip, const std::vector<Trip> &candidates) const
{
  int N = static_cast<int>(candidates.size());
  MatchCandidates scored(N);
  if (N == 0)
    return scored;
  int workers = std::min(UTIL::resolve_concurrency(config_.max_concurrency), N);
#pragma omp parallel num_threads(workers)
  {
#pragma omp for
    for (int i = 0; i < N; ++i)
    {
      scored[i] = scorer_.score(trip, candidates[i]);
    }
  }
  return scored;
}
