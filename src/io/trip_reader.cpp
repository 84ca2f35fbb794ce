#include "io/trip_reader.hpp"
#include "core/error.hpp"
#include "io/polyline_codec.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

#include <algorithm>
#include <sstream>
#include <stdexcept>

#include <boost/format.hpp>
#include <boost/geometry/io/wkt/read.hpp>

using namespace POOLMATCH;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::IO;

namespace
{
  CONFIG::TripConfig config_from_file(const std::string &filename)
  {
    CONFIG::TripConfig config;
    config.file = filename;
    return config;
  }
}

CSVTripReader::CSVTripReader(const std::string &filename, double sample_interval)
    : CSVTripReader(config_from_file(filename), sample_interval)
{
}

CSVTripReader::CSVTripReader(const CONFIG::TripConfig &config, double sample_interval)
    : config_(config), sample_interval_(sample_interval)
{
  ifs.open(config_.file);
  if (!ifs.is_open())
  {
    throw std::runtime_error(
        (boost::format("Cannot open trip file %1%") % config_.file).str());
  }
  read_header();
}

void CSVTripReader::read_header()
{
  std::string line;
  UTIL::safe_get_line(ifs, line);
  line_number = 1;
  std::vector<std::string> fields = UTIL::split_string(line, config_.delim);
  for (int i = 0; i < static_cast<int>(fields.size()); ++i)
  {
    std::string name = UTIL::trim(fields[i]);
    if (name == config_.id)
      id_idx = i;
    else if (name == config_.user_id)
      user_id_idx = i;
    else if (name == config_.depart_time)
      depart_time_idx = i;
    else if (name == config_.status)
      status_idx = i;
    else if (name == config_.geom)
      geom_idx = i;
    else if (name == config_.polyline)
      polyline_idx = i;
  }
  if (id_idx < 0 || depart_time_idx < 0 || (geom_idx < 0 && polyline_idx < 0))
  {
    throw std::runtime_error(
        (boost::format("Trip file %1% must have columns %2%, %3% and %4% or %5%") %
         config_.file % config_.id % config_.depart_time % config_.geom % config_.polyline)
            .str());
  }
  SPDLOG_DEBUG("Trip file columns: id {} user {} depart {} status {} geom {} polyline {}",
               id_idx, user_id_idx, depart_time_idx, status_idx, geom_idx, polyline_idx);
}

bool CSVTripReader::has_next_trip()
{
  // Skip blank lines
  while (ifs.good())
  {
    int c = ifs.peek();
    if (c == '\n' || c == '\r')
    {
      ifs.get();
      ++line_number;
    }
    else
    {
      break;
    }
  }
  return ifs.peek() != EOF;
}

Trip CSVTripReader::read_next_trip()
{
  std::string line;
  UTIL::safe_get_line(ifs, line);
  ++line_number;
  std::vector<std::string> fields = UTIL::split_string(line, config_.delim);
  int max_idx = std::max({id_idx, user_id_idx, depart_time_idx, status_idx,
                          geom_idx, polyline_idx});
  if (static_cast<int>(fields.size()) <= max_idx)
  {
    throw std::runtime_error(
        (boost::format("Line %1% of %2% has %3% fields, expected %4%") %
         line_number % config_.file % fields.size() % (max_idx + 1))
            .str());
  }
  TripId id = UTIL::trim(fields[id_idx]);
  UserId user_id = user_id_idx >= 0 ? UTIL::trim(fields[user_id_idx]) : UserId();
  long long depart_seconds;
  try
  {
    depart_seconds = std::stoll(fields[depart_time_idx]);
  }
  catch (const std::logic_error &)
  {
    throw std::runtime_error(
        (boost::format("Line %1%: invalid departure time '%2%'") %
         line_number % fields[depart_time_idx])
            .str());
  }
  TripStatus status = TripStatus::ACTIVE;
  if (status_idx >= 0)
  {
    std::string status_str = UTIL::trim(fields[status_idx]);
    if (!status_str.empty())
      status = string_to_status(status_str);
  }
  LineString polyline;
  if (geom_idx >= 0)
  {
    try
    {
      polyline = wkt2linestring(fields[geom_idx]);
    }
    catch (const boost::geometry::read_wkt_exception &e)
    {
      throw InvalidGeometryError(
          (boost::format("Line %1%: invalid WKT: %2%") % line_number % e.what()).str());
    }
  }
  else
  {
    polyline = decode_polyline(UTIL::trim(fields[polyline_idx]));
  }
  return Trip::create(id, user_id, polyline, from_epoch_seconds(depart_seconds),
                      sample_interval_, status);
}

std::vector<Trip> CSVTripReader::read_all_trips()
{
  std::vector<Trip> trips;
  while (has_next_trip())
  {
    trips.push_back(read_next_trip());
  }
  SPDLOG_INFO("Read {} trips from {}", trips.size(), config_.file);
  return trips;
}

void CSVTripReader::reset()
{
  ifs.clear();
  ifs.seekg(0, std::ios::beg);
  std::string header;
  UTIL::safe_get_line(ifs, header);
  line_number = 1;
}

void CSVTripReader::close()
{
  ifs.close();
}
