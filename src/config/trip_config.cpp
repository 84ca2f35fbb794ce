#include "config/trip_config.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

using namespace POOLMATCH;
using namespace POOLMATCH::CONFIG;

bool TripConfig::validate() const
{
  if (!UTIL::file_exists(file))
  {
    SPDLOG_CRITICAL("Trip file {} not found", file);
    return false;
  }
  return true;
}

void TripConfig::print() const
{
  SPDLOG_INFO("TripConfig");
  SPDLOG_INFO("File name: {} ", file);
  SPDLOG_INFO("ID name: {} ", id);
  SPDLOG_INFO("User id name: {} ", user_id);
  SPDLOG_INFO("Depart time name: {} ", depart_time);
  SPDLOG_INFO("Status name: {} ", status);
  SPDLOG_INFO("Geom name: {} ", geom);
  SPDLOG_INFO("Polyline name: {} ", polyline);
}

TripConfig TripConfig::load_from_xml(const boost::property_tree::ptree &xml_data)
{
  TripConfig config;
  config.file = xml_data.get<std::string>("config.input.trips.file");
  config.id = xml_data.get("config.input.trips.id", config.id);
  config.user_id = xml_data.get("config.input.trips.user_id", config.user_id);
  config.depart_time = xml_data.get("config.input.trips.depart_time", config.depart_time);
  config.status = xml_data.get("config.input.trips.status", config.status);
  config.geom = xml_data.get("config.input.trips.geom", config.geom);
  config.polyline = xml_data.get("config.input.trips.polyline", config.polyline);
  std::string delim = xml_data.get("config.input.trips.delim", std::string(1, config.delim));
  if (!delim.empty())
    config.delim = delim[0];
  return config;
}

void TripConfig::register_help(std::ostringstream &oss)
{
  oss << "--trips (required) <string>: trip file name\n";
  oss << "--trip_id (optional) <string>: trip id column name (id)\n";
  oss << "--user_id (optional) <string>: user id column name (user_id)\n";
  oss << "--depart_time (optional) <string>: departure column name (depart_time)\n";
  oss << "--status (optional) <string>: status column name (status)\n";
  oss << "--geom (optional) <string>: WKT route column name (geom)\n";
  oss << "--polyline (optional) <string>: encoded polyline column name (polyline)\n";
  oss << "--delim (optional) <char>: field delimiter (;)\n";
}
