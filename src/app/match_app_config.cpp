#include "app/match_app_config.hpp"
#include "util/debug.hpp"
#include "util/util.hpp"

#include <iostream>
#include <sstream>

#include <boost/property_tree/ptree.hpp>
#include <boost/property_tree/xml_parser.hpp>

#include "cxxopts.hpp"

using namespace POOLMATCH;
using namespace POOLMATCH::APP;
using namespace POOLMATCH::CONFIG;

MatchAppConfig::MatchAppConfig(int argc, char **argv)
{
  spdlog::set_pattern("[%^%l%$][%s:%-3#] %v");
  if (argc == 2)
  {
    std::string first_arg(argv[1]);
    if (UTIL::check_file_extension(first_arg, "xml"))
    {
      SPDLOG_INFO("Start with reading poolmatch configuration {}", first_arg);
      load_xml(first_arg);
    }
    else
    {
      SPDLOG_INFO("Start reading poolmatch configuration from arguments");
      load_arg(argc, argv);
    }
  }
  else
  {
    SPDLOG_INFO("Start reading poolmatch configuration from arguments");
    load_arg(argc, argv);
  }
  spdlog::set_level((spdlog::level::level_enum)log_level);
}

void MatchAppConfig::load_xml(const std::string &file)
{
  boost::property_tree::ptree tree;
  boost::property_tree::read_xml(file, tree);
  trip_config = TripConfig::load_from_xml(tree);
  match_config = MatchConfig::load_from_xml(tree);
  output_file = tree.get<std::string>("config.output.file");
  std::string ids = tree.get("config.input.trip_ids", std::string());
  for (const std::string &id : UTIL::split_string(ids, ','))
  {
    std::string trimmed = UTIL::trim(id);
    if (!trimmed.empty())
      trip_ids.push_back(trimmed);
  }
  log_level = tree.get("config.other.log_level", log_level);
}

void MatchAppConfig::load_arg(int argc, char **argv)
{
  cxxopts::Options options("poolmatch", "Carpool route matching");
  options.add_options()
      ("trips", "Trip file name", cxxopts::value<std::string>()->default_value(""))
      ("trip_id", "Trip id column", cxxopts::value<std::string>()->default_value("id"))
      ("user_id", "User id column", cxxopts::value<std::string>()->default_value("user_id"))
      ("depart_time", "Departure time column", cxxopts::value<std::string>()->default_value("depart_time"))
      ("status", "Status column", cxxopts::value<std::string>()->default_value("status"))
      ("geom", "WKT route column", cxxopts::value<std::string>()->default_value("geom"))
      ("polyline", "Encoded polyline column", cxxopts::value<std::string>()->default_value("polyline"))
      ("delim", "Field delimiter", cxxopts::value<std::string>()->default_value(";"))
      ("o,output", "Output file name", cxxopts::value<std::string>()->default_value(""))
      ("match", "Comma separated trip ids to match", cxxopts::value<std::string>()->default_value(""))
      ("sample_interval", "Sampling interval", cxxopts::value<double>()->default_value("150"))
      ("match_radius", "Proximity radius", cxxopts::value<double>()->default_value("200"))
      ("time_window", "Departure window in seconds", cxxopts::value<long long>()->default_value("900"))
      ("max_start_distance", "Origin distance ceiling", cxxopts::value<double>()->default_value("1000"))
      ("max_end_distance", "Destination distance ceiling", cxxopts::value<double>()->default_value("1000"))
      ("w_overlap", "Overlap weight", cxxopts::value<double>()->default_value("0.5"))
      ("w_start", "Start proximity weight", cxxopts::value<double>()->default_value("0.2"))
      ("w_end", "End proximity weight", cxxopts::value<double>()->default_value("0.2"))
      ("w_time", "Time weight", cxxopts::value<double>()->default_value("0.1"))
      ("limit", "Number of ranked candidates", cxxopts::value<int>()->default_value("5"))
      ("query_timeout", "Index query timeout in ms", cxxopts::value<long long>()->default_value("5000"))
      ("max_concurrency", "Worker bound", cxxopts::value<int>()->default_value("0"))
      ("l,log_level", "Log level", cxxopts::value<int>()->default_value("2"))
      ("h,help", "Help information");
  auto result = options.parse(argc, argv);
  if (result.count("help") > 0)
  {
    help_specified = true;
    return;
  }
  trip_config.file = result["trips"].as<std::string>();
  trip_config.id = result["trip_id"].as<std::string>();
  trip_config.user_id = result["user_id"].as<std::string>();
  trip_config.depart_time = result["depart_time"].as<std::string>();
  trip_config.status = result["status"].as<std::string>();
  trip_config.geom = result["geom"].as<std::string>();
  trip_config.polyline = result["polyline"].as<std::string>();
  std::string delim = result["delim"].as<std::string>();
  if (!delim.empty())
    trip_config.delim = delim[0];
  output_file = result["output"].as<std::string>();
  for (const std::string &id : UTIL::split_string(result["match"].as<std::string>(), ','))
  {
    std::string trimmed = UTIL::trim(id);
    if (!trimmed.empty())
      trip_ids.push_back(trimmed);
  }
  match_config.sample_interval = result["sample_interval"].as<double>();
  match_config.match_radius = result["match_radius"].as<double>();
  match_config.time_window = std::chrono::seconds(result["time_window"].as<long long>());
  match_config.max_start_distance = result["max_start_distance"].as<double>();
  match_config.max_end_distance = result["max_end_distance"].as<double>();
  match_config.weights.overlap = result["w_overlap"].as<double>();
  match_config.weights.start = result["w_start"].as<double>();
  match_config.weights.end = result["w_end"].as<double>();
  match_config.weights.time = result["w_time"].as<double>();
  int limit = result["limit"].as<int>();
  if (limit < 1)
    throw std::invalid_argument("limit must be positive");
  match_config.limit = static_cast<std::size_t>(limit);
  match_config.query_timeout = std::chrono::milliseconds(result["query_timeout"].as<long long>());
  match_config.max_concurrency = result["max_concurrency"].as<int>();
  log_level = result["log_level"].as<int>();
  match_config.validate();
}

void MatchAppConfig::print() const
{
  SPDLOG_INFO("----   Print configuration   ----");
  trip_config.print();
  match_config.print();
  SPDLOG_INFO("Output file {}", output_file);
  SPDLOG_INFO("Trips to match {}", trip_ids.empty() ? std::string("all active") :
                                                      std::to_string(trip_ids.size()));
  SPDLOG_INFO("Log level {}", log_level);
  SPDLOG_INFO("---- Print configuration done ----");
}

bool MatchAppConfig::validate() const
{
  SPDLOG_DEBUG("Validating configuration");
  if (log_level < 0 || log_level > static_cast<int>(spdlog::level::off))
  {
    SPDLOG_CRITICAL("Invalid log_level {}, which should be 0 - 6", log_level);
    return false;
  }
  if (!trip_config.validate())
  {
    return false;
  }
  if (output_file.empty())
  {
    SPDLOG_CRITICAL("Output file is not specified");
    return false;
  }
  if (UTIL::file_exists(output_file))
  {
    SPDLOG_WARN("Overwrite existing result file {}", output_file);
  }
  std::string output_folder = UTIL::get_file_directory(output_file);
  if (!UTIL::folder_exist(output_folder))
  {
    SPDLOG_CRITICAL("Output folder {} not exists", output_folder);
    return false;
  }
  SPDLOG_DEBUG("Validating done");
  return true;
}

void MatchAppConfig::print_help()
{
  std::ostringstream oss;
  oss << "poolmatch argument lists:\n";
  TripConfig::register_help(oss);
  oss << "--output (required) <string>: match result file name\n";
  oss << "--match (optional) <string>: comma separated trip ids, all active trips if empty\n";
  MatchConfig::register_help(oss);
  oss << "--log_level (optional) <int>: log level (2)\n";
  oss << "-h/--help: print help information\n";
  oss << "For xml configuration, check example folder\n";
  std::cout << oss.str();
}
