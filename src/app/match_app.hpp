/**
 * Carpool route matching.
 *
 * Command line application matching the trips of a file
 */

#ifndef POOLMATCH_APP_MATCH_APP_HPP
#define POOLMATCH_APP_MATCH_APP_HPP

#include "app/match_app_config.hpp"
#include "match/trip_registry.hpp"

namespace POOLMATCH
{
  namespace APP
  {

    /**
     * Load the trips of a file into a registry and write the ranked
     * candidates of the requested trips
     */
    class MatchApp
    {
    public:
      explicit MatchApp(const MatchAppConfig &config);
      /**
       * Run the matching
       * @return number of trips that could not be matched
       */
      int run();

    private:
      const MatchAppConfig &config_;
      MATCH::TripRegistry registry_;
    };

  } // APP
} // POOLMATCH

#endif // POOLMATCH_APP_MATCH_APP_HPP
