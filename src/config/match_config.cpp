#include "config/match_config.hpp"
#include "core/error.hpp"
#include "util/debug.hpp"

#include <cmath>
#include <stdexcept>

#include <boost/format.hpp>

using namespace POOLMATCH;
using namespace POOLMATCH::CONFIG;

void ScoreWeights::validate() const
{
  if (overlap < 0 || start < 0 || end < 0 || time < 0)
  {
    throw CORE::InvalidWeightsError(
        (boost::format("Weights must be non-negative: overlap %1% start %2% end %3% time %4%") %
         overlap % start % end % time)
            .str());
  }
  double sum = overlap + start + end + time;
  if (std::abs(sum - 1.0) > 1e-9)
  {
    throw CORE::InvalidWeightsError(
        (boost::format("Weights must sum to 1, got %1%") % sum).str());
  }
}

void MatchConfig::validate() const
{
  weights.validate();
  if (!(sample_interval > 0))
    throw std::invalid_argument("sample_interval must be positive");
  if (!(match_radius > 0))
    throw std::invalid_argument("match_radius must be positive");
  if (time_window.count() < 0)
    throw std::invalid_argument("time_window must not be negative");
  if (!(max_start_distance > 0) || !(max_end_distance > 0))
    throw std::invalid_argument("max_start_distance and max_end_distance must be positive");
  if (limit == 0)
    throw std::invalid_argument("limit must be positive");
  if (query_timeout.count() <= 0)
    throw std::invalid_argument("query_timeout must be positive");
}

void MatchConfig::print() const
{
  SPDLOG_INFO("MatchConfig");
  SPDLOG_INFO("Sample interval {} m", sample_interval);
  SPDLOG_INFO("Match radius {} m", match_radius);
  SPDLOG_INFO("Time window {} s", time_window.count());
  SPDLOG_INFO("Max start distance {} m, max end distance {} m",
              max_start_distance, max_end_distance);
  SPDLOG_INFO("Weights overlap {} start {} end {} time {}",
              weights.overlap, weights.start, weights.end, weights.time);
  SPDLOG_INFO("Limit {}", limit);
  SPDLOG_INFO("Query timeout {} ms", query_timeout.count());
  SPDLOG_INFO("Max concurrency {}", max_concurrency);
}

MatchConfig MatchConfig::load_from_xml(const boost::property_tree::ptree &xml_data)
{
  MatchConfig config;
  config.sample_interval = xml_data.get("config.parameters.sample_interval", config.sample_interval);
  config.match_radius = xml_data.get("config.parameters.match_radius", config.match_radius);
  config.time_window = std::chrono::seconds(
      xml_data.get("config.parameters.time_window", static_cast<long long>(config.time_window.count())));
  config.max_start_distance = xml_data.get("config.parameters.max_start_distance", config.max_start_distance);
  config.max_end_distance = xml_data.get("config.parameters.max_end_distance", config.max_end_distance);
  config.weights.overlap = xml_data.get("config.parameters.weights.overlap", config.weights.overlap);
  config.weights.start = xml_data.get("config.parameters.weights.start", config.weights.start);
  config.weights.end = xml_data.get("config.parameters.weights.end", config.weights.end);
  config.weights.time = xml_data.get("config.parameters.weights.time", config.weights.time);
  config.limit = xml_data.get("config.parameters.limit", config.limit);
  config.query_timeout = std::chrono::milliseconds(
      xml_data.get("config.parameters.query_timeout", static_cast<long long>(config.query_timeout.count())));
  config.max_concurrency = xml_data.get("config.parameters.max_concurrency", config.max_concurrency);
  config.validate();
  return config;
}

void MatchConfig::register_help(std::ostringstream &oss)
{
  oss << "--sample_interval (optional) <double>: sampling interval in metres (150)\n";
  oss << "--match_radius (optional) <double>: proximity radius in metres (200)\n";
  oss << "--time_window (optional) <int>: departure window in seconds (900)\n";
  oss << "--max_start_distance (optional) <double>: origin distance ceiling in metres (1000)\n";
  oss << "--max_end_distance (optional) <double>: destination distance ceiling in metres (1000)\n";
  oss << "--w_overlap, --w_start, --w_end, --w_time (optional) <double>: "
         "score weights summing to 1 (0.5, 0.2, 0.2, 0.1)\n";
  oss << "--limit (optional) <int>: number of ranked candidates (5)\n";
  oss << "--query_timeout (optional) <int>: index query timeout in ms (5000)\n";
  oss << "--max_concurrency (optional) <int>: worker bound, 0 uses all processing units (0)\n";
}
