#include "match/overlap_scorer.hpp"
#include "algorithm/geom_algorithm.hpp"
#include "util/debug.hpp"

#include <algorithm>
#include <cmath>

using namespace POOLMATCH;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::MATCH;

OverlapScorer::OverlapScorer(const CONFIG::MatchConfig &config) : config_(config)
{
  config_.weights.validate();
}

MatchCandidate OverlapScorer::score(const Trip &a, const Trip &b) const
{
  double overlap = calc_overlap_fraction(a.sampled_points, b.sampled_points,
                                         config_.match_radius);
  double start = calc_proximity(
      ALGORITHM::haversine_distance(a.origin, b.origin), config_.max_start_distance);
  double end = calc_proximity(
      ALGORITHM::haversine_distance(a.destination, b.destination), config_.max_end_distance);
  double depart_difference = std::abs(
      std::chrono::duration<double>(a.depart_time - b.depart_time).count());
  double time = calc_time_component(
      depart_difference, static_cast<double>(config_.time_window.count()));
  MatchCandidate candidate{b.id, calc_composite(overlap, start, end, time),
                           overlap, start, end, time, depart_difference};
  SPDLOG_TRACE("Score {} -> {}: {} (overlap {} start {} end {} time {})",
               a.id, b.id, candidate.score, overlap, start, end, time);
  return candidate;
}

double OverlapScorer::calc_overlap_fraction(const LineString &a, const LineString &b,
                                            double radius)
{
  int N = a.get_num_points();
  int M = b.get_num_points();
  if (N == 0 || M == 0)
    return 0;
  int matched = 0;
  for (int i = 0; i < N; ++i)
  {
    const Point &p = a.get_point(i);
    for (int j = 0; j < M; ++j)
    {
      if (ALGORITHM::haversine_distance(p, b.get_point(j)) <= radius)
      {
        ++matched;
        break;
      }
    }
  }
  return static_cast<double>(matched) / N;
}

double OverlapScorer::calc_proximity(double distance, double max_distance)
{
  return 1.0 - std::min(1.0, distance / max_distance);
}

double OverlapScorer::calc_time_component(double depart_difference, double time_window)
{
  if (time_window <= 0)
    return depart_difference <= 0 ? 1.0 : 0.0;
  return 1.0 - std::min(1.0, std::abs(depart_difference) / time_window);
}

double OverlapScorer::calc_composite(double overlap_fraction, double start_proximity,
                                     double end_proximity, double time_delta) const
{
  const CONFIG::ScoreWeights &w = config_.weights;
  double score = w.overlap * overlap_fraction + w.start * start_proximity +
                 w.end * end_proximity + w.time * time_delta;
  return std::max(0.0, std::min(1.0, score));
}
