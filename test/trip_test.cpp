#include "catch2/catch.hpp"

#include "core/error.hpp"
#include "core/trip.hpp"
#include "match/trip_registry.hpp"
#include "store/memory_trip_store.hpp"
#include "test_helpers.hpp"

using namespace POOLMATCH;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::MATCH;
using namespace POOLMATCH::STORE;
using namespace POOLMATCH::TEST;

TEST_CASE("trip is tested", "[trip]")
{
  SECTION("create_from_polyline")
  {
    Trip trip = make_trip("a", 12.90, 77.58, 12.95, 77.60, NINE_AM);
    REQUIRE(trip.id == "a");
    REQUIRE(trip.user_id == "user_a");
    REQUIRE(get_lat(trip.origin) == Approx(12.90));
    REQUIRE(get_lon(trip.destination) == Approx(77.60));
    REQUIRE(trip.length > 5900);
    REQUIRE(trip.sampled_points.get_num_points() > 2);
    REQUIRE(to_epoch_seconds(trip.depart_time) == NINE_AM);
    REQUIRE(trip.is_matchable());
  }
  SECTION("empty_polyline")
  {
    LineString empty;
    REQUIRE_THROWS_AS(Trip::create("a", "u", empty, from_epoch_seconds(NINE_AM), 150),
                      InvalidGeometryError);
  }
  SECTION("invalid_endpoint")
  {
    LineString line = LineString::from_lat_lon({{12.90, 77.58}, {12.95, 77.60}});
    REQUIRE_THROWS_AS(Trip::create("a", "u", make_point(12.90, 181.0), make_point(12.95, 77.60),
                                   line, from_epoch_seconds(NINE_AM), 150),
                      InvalidGeometryError);
  }
  SECTION("endpoint_far_from_polyline")
  {
    // About 2 km north of the route start
    LineString line = LineString::from_lat_lon({{12.90, 77.58}, {12.95, 77.60}});
    REQUIRE_THROWS_AS(Trip::create("a", "u", make_point(12.918, 77.58), make_point(12.95, 77.60),
                                   line, from_epoch_seconds(NINE_AM), 150),
                      InvalidGeometryError);
    REQUIRE_THROWS_AS(Trip::create("a", "u", make_point(12.90, 77.58), make_point(12.95, 77.62),
                                   line, from_epoch_seconds(NINE_AM), 150),
                      InvalidGeometryError);
  }
  SECTION("endpoint_close_to_polyline")
  {
    // About 50 m off the route start
    LineString line = LineString::from_lat_lon({{12.90, 77.58}, {12.95, 77.60}});
    Trip trip = Trip::create("a", "u", make_point(12.90045, 77.58), make_point(12.95, 77.60),
                             line, from_epoch_seconds(NINE_AM), 150);
    REQUIRE(get_lat(trip.origin) == Approx(12.90045));
    REQUIRE(get_lat(trip.sampled_points.front()) == Approx(12.90));
  }
  SECTION("zero_length_is_not_matchable")
  {
    Trip trip = make_trip("a", 12.90, 77.58, 12.90, 77.58, NINE_AM);
    REQUIRE(trip.length == Approx(0.0));
    REQUIRE_FALSE(trip.is_matchable());
  }
  SECTION("inactive_is_not_matchable")
  {
    Trip trip = make_trip("a", 12.90, 77.58, 12.95, 77.60, NINE_AM, TripStatus::EXPIRED);
    REQUIRE_FALSE(trip.is_matchable());
  }
}

TEST_CASE("trip status is tested", "[trip]")
{
  REQUIRE(string_to_status("matched") == TripStatus::MATCHED);
  REQUIRE(status_to_string(TripStatus::CANCELLED) == "cancelled");
  REQUIRE_THROWS_AS(string_to_status("paused"), std::invalid_argument);
  REQUIRE(is_valid_transition(TripStatus::ACTIVE, TripStatus::MATCHED));
  REQUIRE(is_valid_transition(TripStatus::ACTIVE, TripStatus::EXPIRED));
  REQUIRE(is_valid_transition(TripStatus::MATCHED, TripStatus::CANCELLED));
  REQUIRE_FALSE(is_valid_transition(TripStatus::EXPIRED, TripStatus::ACTIVE));
  REQUIRE_FALSE(is_valid_transition(TripStatus::MATCHED, TripStatus::EXPIRED));
  REQUIRE_FALSE(is_valid_transition(TripStatus::CANCELLED, TripStatus::MATCHED));
}

TEST_CASE("trip store is tested", "[store]")
{
  MemoryTripStore store;
  store.add_trip(make_trip("b", 12.90, 77.58, 12.95, 77.60, NINE_AM));
  store.add_trip(make_trip("a", 12.90, 77.58, 12.95, 77.60, NINE_AM, TripStatus::MATCHED));
  SECTION("lookup")
  {
    REQUIRE(store.size() == 2);
    REQUIRE(store.get_trip("a").has_value());
    REQUIRE_FALSE(store.get_trip("z").has_value());
    REQUIRE(store.get_trip_ids() == std::vector<TripId>{"a", "b"});
    REQUIRE(store.get_active_trip_ids() == std::vector<TripId>{"b"});
  }
  SECTION("duplicate")
  {
    REQUIRE_THROWS_AS(store.add_trip(make_trip("a", 12.90, 77.58, 12.95, 77.60, NINE_AM)),
                      std::invalid_argument);
  }
  SECTION("status_update")
  {
    Trip updated = store.update_status("b", TripStatus::EXPIRED);
    REQUIRE(updated.status == TripStatus::EXPIRED);
    REQUIRE(store.get_trip("b")->status == TripStatus::EXPIRED);
    REQUIRE_THROWS_AS(store.update_status("b", TripStatus::MATCHED), std::invalid_argument);
    REQUIRE_THROWS_AS(store.update_status("z", TripStatus::MATCHED), TripNotFoundError);
  }
  SECTION("remove")
  {
    REQUIRE(store.remove_trip("a"));
    REQUIRE_FALSE(store.remove_trip("a"));
    REQUIRE(store.size() == 1);
  }
}

TEST_CASE("trip registry is tested", "[registry]")
{
  TripRegistry registry(150);
  registry.add_trip(make_trip("a", 12.90, 77.58, 12.95, 77.60, NINE_AM));
  registry.add_trip(make_trip("b", 12.90, 77.58, 12.95, 77.60, NINE_AM, TripStatus::CANCELLED));
  REQUIRE(registry.get_sample_interval() == 150.0);
  REQUIRE(registry.get_store().size() == 2);
  REQUIRE(registry.get_index().contains("a"));
  REQUIRE_FALSE(registry.get_index().contains("b"));
  SECTION("status_change_removes_from_index")
  {
    registry.update_status("a", TripStatus::MATCHED);
    REQUIRE_FALSE(registry.get_index().contains("a"));
    REQUIRE(registry.get_index().size() == 0);
    REQUIRE(registry.get_store().get_trip("a")->status == TripStatus::MATCHED);
  }
  SECTION("polyline_update_resamples")
  {
    std::size_t before = registry.get_index().size();
    registry.update_polyline("a", LineString::from_lat_lon({{13.00, 77.58}, {13.01, 77.58}}));
    Trip trip = *registry.get_store().get_trip("a");
    REQUIRE(get_lat(trip.origin) == Approx(13.00));
    REQUIRE(get_lat(trip.destination) == Approx(13.01));
    REQUIRE(trip.sampled_points.get_num_points() == 9);
    REQUIRE(registry.get_index().size() == 9);
    REQUIRE(registry.get_index().size() < before);
  }
  SECTION("unknown_trip")
  {
    REQUIRE_THROWS_AS(registry.update_status("z", TripStatus::MATCHED), TripNotFoundError);
    REQUIRE_THROWS_AS(registry.update_polyline("z", LineString()), TripNotFoundError);
  }
}
