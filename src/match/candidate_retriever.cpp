#include "match/candidate_retriever.hpp"
#include "core/error.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

#include <algorithm>
#include <exception>
#include <future>
#include <memory>
#include <thread>

#include <boost/format.hpp>

using namespace POOLMATCH;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::INDEX;
using namespace POOLMATCH::MATCH;

namespace
{
  enum class QueryOutcome
  {
    SUCCESS,
    TIMED_OUT,
    FAILED
  };
}

bool CandidateRetriever::within_time_window(const Trip &a, const Trip &b,
                                            std::chrono::seconds time_window)
{
  auto delta = a.depart_time > b.depart_time ? a.depart_time - b.depart_time
                                             : b.depart_time - a.depart_time;
  return delta <= time_window;
}

std::set<TripId> CandidateRetriever::query_trip_ids(const Trip &trip, double radius) const
{
  std::set<TripId> ids;
  int N = trip.sampled_points.get_num_points();
  if (N == 0)
  {
    return ids;
  }
  std::vector<NearbyTrips> replies(N);
  std::vector<QueryOutcome> outcomes(N, QueryOutcome::SUCCESS);
  std::vector<std::exception_ptr> errors(N);
  int workers = std::min(UTIL::resolve_concurrency(max_concurrency_), N);
#pragma omp parallel num_threads(workers)
  {
#pragma omp for schedule(dynamic)
    for (int i = 0; i < N; ++i)
    {
      // The query runs on its own thread so that a hung adapter cannot hold
      // the worker past the deadline. An abandoned reply is dropped with
      // the shared state.
      auto task = std::make_shared<std::packaged_task<NearbyTrips()>>(
          [&index = index_, point = trip.sampled_points.get_point(i), radius,
           timeout = query_timeout_]
          { return index.query_near(point, radius, timeout); });
      try
      {
        std::future<NearbyTrips> reply = task->get_future();
        std::thread([task]
                    { (*task)(); })
            .detach();
        if (reply.wait_for(query_timeout_) != std::future_status::ready)
          outcomes[i] = QueryOutcome::TIMED_OUT;
        else
          replies[i] = reply.get();
      }
      catch (const IndexTimeoutError &)
      {
        outcomes[i] = QueryOutcome::TIMED_OUT;
      }
      catch (const IndexUnavailableError &)
      {
        outcomes[i] = QueryOutcome::FAILED;
      }
      catch (...)
      {
        // Rethrown after the parallel region
        errors[i] = std::current_exception();
        outcomes[i] = QueryOutcome::FAILED;
      }
    }
  }
  for (const std::exception_ptr &error : errors)
  {
    if (error)
      std::rethrow_exception(error);
  }
  int timed_out = std::count(outcomes.begin(), outcomes.end(), QueryOutcome::TIMED_OUT);
  int failed = std::count(outcomes.begin(), outcomes.end(), QueryOutcome::FAILED);
  if (timed_out + failed == N)
  {
    throw IndexUnavailableError(
        (boost::format("All %1% index queries of trip %2% failed (%3% timed out)") %
         N % trip.id % timed_out)
            .str());
  }
  if (timed_out + failed > 0)
  {
    SPDLOG_DEBUG("Trip {}: {} of {} index queries timed out, {} failed",
                 trip.id, timed_out, N, failed);
  }
  for (const NearbyTrips &reply : replies)
  {
    for (const NearbyTrip &nearby : reply)
    {
      ids.insert(nearby.trip_id);
    }
  }
  return ids;
}

std::vector<Trip> CandidateRetriever::retrieve(const Trip &trip, double radius,
                                               std::chrono::seconds time_window) const
{
  std::set<TripId> ids = query_trip_ids(trip, radius);
  std::vector<Trip> candidates;
  int skipped_status = 0;
  int skipped_time = 0;
  for (const TripId &id : ids)
  {
    if (id == trip.id)
      continue;
    std::optional<Trip> candidate = store_.get_trip(id);
    if (!candidate)
    {
      SPDLOG_DEBUG("Trip {} returned by the index is not in the store", id);
      continue;
    }
    if (!candidate->is_matchable())
    {
      ++skipped_status;
      continue;
    }
    if (!within_time_window(trip, *candidate, time_window))
    {
      ++skipped_time;
      continue;
    }
    candidates.push_back(std::move(*candidate));
  }
  SPDLOG_DEBUG("Trip {}: {} trips nearby, {} not matchable, {} outside time window, {} candidates",
               trip.id, ids.size(), skipped_status, skipped_time, candidates.size());
  return candidates;
}
