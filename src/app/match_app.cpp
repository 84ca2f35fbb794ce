#include "app/match_app.hpp"
#include "core/error.hpp"
#include "io/result_writer.hpp"
#include "io/trip_reader.hpp"
#include "match/matching_orchestrator.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

using namespace POOLMATCH;
using namespace POOLMATCH::APP;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::MATCH;

MatchApp::MatchApp(const MatchAppConfig &config)
    : config_(config), registry_(config.match_config.sample_interval)
{
  IO::CSVTripReader reader(config_.trip_config, config_.match_config.sample_interval);
  for (const Trip &trip : reader.read_all_trips())
  {
    registry_.add_trip(trip);
  }
  SPDLOG_INFO("Registered {} trips, {} indexed", registry_.get_store().size(),
              registry_.get_index().trip_count());
}

int MatchApp::run()
{
  auto begin_time = UTIL::get_current_time();
  MatchingOrchestrator orchestrator(registry_.get_store(), registry_.get_index(),
                                    config_.match_config);
  std::vector<TripId> trip_ids = config_.trip_ids;
  if (trip_ids.empty())
  {
    trip_ids = registry_.get_store().get_active_trip_ids();
  }
  IO::CSVMatchResultWriter writer(config_.output_file);
  int failed = 0;
  int matched = 0;
  for (const TripId &trip_id : trip_ids)
  {
    try
    {
      MatchResult result = orchestrator.find_matches(trip_id);
      writer.write_result(result);
      if (!result.candidates.empty())
        ++matched;
      SPDLOG_DEBUG("Trip {} has {} candidates", trip_id, result.candidates.size());
    }
    catch (const std::exception &e)
    {
      ++failed;
      SPDLOG_ERROR("Matching trip {} failed ({}): {}", trip_id,
                   is_retryable(e) ? "retryable" : "permanent", e.what());
    }
  }
  auto end_time = UTIL::get_current_time();
  double duration = UTIL::get_duration(begin_time, end_time);
  SPDLOG_INFO("Time takes {}", duration);
  SPDLOG_INFO("Trips processed {} with candidates {} failed {}",
              trip_ids.size(), matched, failed);
  SPDLOG_INFO("Result lines written {}", writer.get_num_lines());
  return failed;
}
