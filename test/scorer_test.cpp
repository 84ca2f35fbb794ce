#include "catch2/catch.hpp"

#include "core/error.hpp"
#include "match/overlap_scorer.hpp"
#include "test_helpers.hpp"

using namespace POOLMATCH;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::CONFIG;
using namespace POOLMATCH::MATCH;
using namespace POOLMATCH::TEST;

TEST_CASE("overlap scorer is tested", "[scorer]")
{
  MatchConfig config;
  OverlapScorer scorer(config);
  Trip a = make_trip("a", 12.90, 77.58, 12.95, 77.60, NINE_AM);
  SECTION("identical_trips")
  {
    Trip b = make_trip("b", 12.90, 77.58, 12.95, 77.60, NINE_AM);
    MatchCandidate c = scorer.score(a, b);
    REQUIRE(c.trip_id == "b");
    REQUIRE(c.overlap_fraction == Approx(1.0));
    REQUIRE(c.start_proximity == Approx(1.0));
    REQUIRE(c.end_proximity == Approx(1.0));
    REQUIRE(c.time_delta == Approx(1.0));
    REQUIRE(c.depart_difference == Approx(0.0));
    REQUIRE(c.score == Approx(1.0));
  }
  SECTION("parallel_route_ten_minutes_later")
  {
    Trip b = make_trip("b", 12.901, 77.581, 12.949, 77.599, NINE_AM + 600);
    MatchCandidate c = scorer.score(a, b);
    REQUIRE(c.overlap_fraction == Approx(1.0));
    REQUIRE(c.start_proximity == Approx(0.845).margin(0.01));
    REQUIRE(c.end_proximity == Approx(0.845).margin(0.01));
    REQUIRE(c.time_delta == Approx(1.0 / 3.0));
    REQUIRE(c.depart_difference == Approx(600.0));
    REQUIRE(c.score > 0.8);
  }
  SECTION("distant_trips")
  {
    Trip b = make_trip("b", 13.50, 78.00, 13.55, 78.02, NINE_AM + 3600);
    MatchCandidate c = scorer.score(a, b);
    REQUIRE(c.overlap_fraction == 0.0);
    REQUIRE(c.start_proximity == 0.0);
    REQUIRE(c.end_proximity == 0.0);
    REQUIRE(c.time_delta == 0.0);
    REQUIRE(c.score == 0.0);
  }
  SECTION("asymmetric_overlap")
  {
    // The first fifth of the route of a
    Trip shorter = make_trip("s", 12.90, 77.58, 12.91, 77.584, NINE_AM);
    double short_in_long = scorer.score(shorter, a).overlap_fraction;
    double long_in_short = scorer.score(a, shorter).overlap_fraction;
    REQUIRE(short_in_long == Approx(1.0));
    REQUIRE(long_in_short < 0.5);
  }
  SECTION("start_proximity_decreases_with_distance")
  {
    double previous = 2.0;
    for (double offset : {0.0, 0.002, 0.004, 0.006, 0.008, 0.010})
    {
      Trip b = make_trip("b", 12.90 - offset, 77.58, 12.95, 77.60, NINE_AM);
      MatchCandidate c = scorer.score(a, b);
      REQUIRE(c.start_proximity <= previous);
      REQUIRE(c.start_proximity >= 0.0);
      previous = c.start_proximity;
    }
    REQUIRE(previous == 0.0);
  }
  SECTION("score_bounds")
  {
    for (long long delay : {0LL, 300LL, 900LL, 7200LL})
    {
      Trip b = make_trip("b", 12.905, 77.582, 12.96, 77.61, NINE_AM + delay);
      MatchCandidate c = scorer.score(a, b);
      REQUIRE(c.score >= 0.0);
      REQUIRE(c.score <= 1.0);
    }
  }
}

TEST_CASE("score components are tested", "[scorer]")
{
  SECTION("proximity")
  {
    REQUIRE(OverlapScorer::calc_proximity(0, 1000) == 1.0);
    REQUIRE(OverlapScorer::calc_proximity(250, 1000) == Approx(0.75));
    REQUIRE(OverlapScorer::calc_proximity(1000, 1000) == 0.0);
    REQUIRE(OverlapScorer::calc_proximity(5000, 1000) == 0.0);
  }
  SECTION("time")
  {
    REQUIRE(OverlapScorer::calc_time_component(0, 900) == 1.0);
    REQUIRE(OverlapScorer::calc_time_component(450, 900) == Approx(0.5));
    REQUIRE(OverlapScorer::calc_time_component(900, 900) == 0.0);
    REQUIRE(OverlapScorer::calc_time_component(0, 0) == 1.0);
    REQUIRE(OverlapScorer::calc_time_component(10, 0) == 0.0);
  }
  SECTION("overlap_of_empty_route")
  {
    LineString empty;
    LineString line = LineString::from_lat_lon({{12.90, 77.58}});
    REQUIRE(OverlapScorer::calc_overlap_fraction(empty, line, 200) == 0.0);
    REQUIRE(OverlapScorer::calc_overlap_fraction(line, empty, 200) == 0.0);
  }
  SECTION("composite_increases_with_overlap")
  {
    MatchConfig config;
    OverlapScorer scorer(config);
    double previous = -1.0;
    for (int i = 0; i <= 10; ++i)
    {
      double score = scorer.calc_composite(i / 10.0, 0.3, 0.6, 0.2);
      REQUIRE(score >= previous);
      previous = score;
    }
  }
  SECTION("custom_weights")
  {
    MatchConfig config;
    config.weights = ScoreWeights{0.25, 0.25, 0.25, 0.25};
    OverlapScorer scorer(config);
    REQUIRE(scorer.calc_composite(1.0, 0.0, 1.0, 0.0) == Approx(0.5));
  }
}

TEST_CASE("score weights are tested", "[scorer][config]")
{
  MatchConfig config;
  SECTION("sum_not_one")
  {
    config.weights.overlap = 0.6;
    REQUIRE_THROWS_AS(OverlapScorer(config), InvalidWeightsError);
  }
  SECTION("negative")
  {
    config.weights = ScoreWeights{1.1, -0.1, 0.0, 0.0};
    REQUIRE_THROWS_AS(config.weights.validate(), InvalidWeightsError);
  }
  SECTION("default")
  {
    REQUIRE_NOTHROW(config.weights.validate());
  }
}
