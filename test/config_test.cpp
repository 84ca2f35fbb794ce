#include "catch2/catch.hpp"

#include "config/match_config.hpp"
#include "config/trip_config.hpp"
#include "core/error.hpp"

#include <sstream>

#include <boost/property_tree/xml_parser.hpp>

using namespace POOLMATCH;
using namespace POOLMATCH::CONFIG;

namespace
{
  boost::property_tree::ptree parse_xml(const std::string &xml)
  {
    std::istringstream iss(xml);
    boost::property_tree::ptree tree;
    boost::property_tree::read_xml(iss, tree);
    return tree;
  }
}

TEST_CASE("match config is tested", "[config]")
{
  SECTION("defaults")
  {
    MatchConfig config;
    REQUIRE(config.sample_interval == 150.0);
    REQUIRE(config.match_radius == 200.0);
    REQUIRE(config.time_window == std::chrono::seconds(900));
    REQUIRE(config.max_start_distance == 1000.0);
    REQUIRE(config.max_end_distance == 1000.0);
    REQUIRE(config.limit == 5);
    REQUIRE(config.query_timeout == std::chrono::milliseconds(5000));
    REQUIRE(config.weights.overlap == 0.5);
    REQUIRE_NOTHROW(config.validate());
  }
  SECTION("load_from_xml_file")
  {
    boost::property_tree::ptree tree;
    boost::property_tree::read_xml(std::string(POOLMATCH_TEST_DATA_DIR) + "/poolmatch_config.xml", tree);
    MatchConfig config = MatchConfig::load_from_xml(tree);
    REQUIRE(config.sample_interval == 100.0);
    REQUIRE(config.match_radius == 250.0);
    REQUIRE(config.time_window == std::chrono::seconds(1200));
    REQUIRE(config.max_start_distance == 800.0);
    REQUIRE(config.max_end_distance == 1000.0);
    REQUIRE(config.limit == 3);
    REQUIRE(config.query_timeout == std::chrono::milliseconds(2000));
    REQUIRE(config.max_concurrency == 2);
    REQUIRE(config.weights.overlap == Approx(0.4));
    REQUIRE(config.weights.start == Approx(0.25));
    TripConfig trip_config = TripConfig::load_from_xml(tree);
    REQUIRE(trip_config.file == "trips.csv");
    REQUIRE(trip_config.user_id == "user_id");
    REQUIRE(trip_config.delim == ';');
  }
  SECTION("empty_parameters_keep_defaults")
  {
    MatchConfig config = MatchConfig::load_from_xml(parse_xml("<config></config>"));
    REQUIRE(config.sample_interval == 150.0);
    REQUIRE(config.limit == 5);
  }
  SECTION("invalid_weights")
  {
    REQUIRE_THROWS_AS(MatchConfig::load_from_xml(parse_xml(
                          "<config><parameters><weights><overlap>0.9</overlap>"
                          "</weights></parameters></config>")),
                      CORE::InvalidWeightsError);
  }
  SECTION("invalid_values")
  {
    REQUIRE_THROWS_AS(MatchConfig::load_from_xml(parse_xml(
                          "<config><parameters><limit>0</limit></parameters></config>")),
                      std::invalid_argument);
    MatchConfig config;
    config.time_window = std::chrono::seconds(-1);
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
    config = MatchConfig();
    config.query_timeout = std::chrono::milliseconds(0);
    REQUIRE_THROWS_AS(config.validate(), std::invalid_argument);
  }
  SECTION("trip_file_required")
  {
    REQUIRE_THROWS(TripConfig::load_from_xml(parse_xml("<config></config>")));
  }
  SECTION("help")
  {
    std::ostringstream oss;
    MatchConfig::register_help(oss);
    TripConfig::register_help(oss);
    REQUIRE(oss.str().find("--match_radius") != std::string::npos);
    REQUIRE(oss.str().find("--trips") != std::string::npos);
  }
}
