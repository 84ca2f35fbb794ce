#include "catch2/catch.hpp"

#include "match/ranker.hpp"

#include <algorithm>
#include <string>

using namespace POOLMATCH;
using namespace POOLMATCH::MATCH;

namespace
{
  // Departure difference in seconds, against a 900 s window
  MatchCandidate candidate(const std::string &id, double score, double depart_difference = 450)
  {
    double time_delta = 1.0 - std::min(1.0, depart_difference / 900.0);
    return MatchCandidate{id, score, 0, 0, 0, time_delta, depart_difference};
  }

  std::vector<std::string> ids_of(const MatchCandidates &candidates)
  {
    std::vector<std::string> ids;
    for (const MatchCandidate &c : candidates)
      ids.push_back(c.trip_id);
    return ids;
  }
}

TEST_CASE("ranker is tested", "[ranker]")
{
  SECTION("score_descending")
  {
    MatchCandidates ranked = Ranker::rank(
        {candidate("a", 0.3), candidate("b", 0.9), candidate("c", 0.6)}, 5);
    REQUIRE(ids_of(ranked) == std::vector<std::string>{"b", "c", "a"});
  }
  SECTION("ties_broken_by_departure_then_id")
  {
    MatchCandidates ranked = Ranker::rank(
        {candidate("z", 0.8, 90), candidate("y", 0.8, 540), candidate("x", 0.8, 540),
         candidate("w", 0.7, 0)},
        5);
    REQUIRE(ids_of(ranked) == std::vector<std::string>{"z", "x", "y", "w"});
  }
  SECTION("departures_beyond_the_window_still_ordered")
  {
    // Both time components are 0
    MatchCandidates ranked = Ranker::rank(
        {candidate("a", 0.5, 1200), candidate("b", 0.5, 900)}, 5);
    REQUIRE(ids_of(ranked) == std::vector<std::string>{"b", "a"});
    REQUIRE(Ranker::candidate_compare(candidate("b", 0.5, 900), candidate("a", 0.5, 1200)));
    REQUIRE_FALSE(Ranker::candidate_compare(candidate("a", 0.5, 1200), candidate("b", 0.5, 900)));
  }
  SECTION("truncates_to_limit")
  {
    MatchCandidates six;
    for (const std::string &id : {"c6", "c3", "c1", "c5", "c2", "c4"})
      six.push_back(candidate(id, 0.75));
    MatchCandidates ranked = Ranker::rank(six, 5);
    REQUIRE(ids_of(ranked) == std::vector<std::string>{"c1", "c2", "c3", "c4", "c5"});
  }
  SECTION("truncates_keeping_best")
  {
    MatchCandidates many;
    for (int i = 0; i < 20; ++i)
      many.push_back(candidate("t" + std::to_string(i), i / 20.0));
    MatchCandidates ranked = Ranker::rank(many, 3);
    REQUIRE(ids_of(ranked) == std::vector<std::string>{"t19", "t18", "t17"});
  }
  SECTION("empty")
  {
    REQUIRE(Ranker::rank({}, 5).empty());
  }
  SECTION("zero_limit")
  {
    REQUIRE_THROWS_AS(Ranker::rank({candidate("a", 0.5)}, 0), std::invalid_argument);
  }
}
