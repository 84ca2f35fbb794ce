/**
 * Carpool route matching.
 *
 * Configuration of the poolmatch command line program
 */

#ifndef POOLMATCH_APP_MATCH_APP_CONFIG_HPP
#define POOLMATCH_APP_MATCH_APP_CONFIG_HPP

#include "config/match_config.hpp"
#include "config/trip_config.hpp"

#include <string>
#include <vector>

namespace POOLMATCH
{
  namespace APP
  {

    /**
     * Configuration of the poolmatch program, read either from a single
     * XML file argument or from command line options
     */
    class MatchAppConfig
    {
    public:
      /**
       * @param argc number of arguments
       * @param argv argument values
       * @throw std::invalid_argument if a parameter has an invalid value
       */
      MatchAppConfig(int argc, char **argv);

      void load_xml(const std::string &file);
      void load_arg(int argc, char **argv);
      void print() const;
      /**
       * Check the input and output files
       * @return true if the configuration is valid
       */
      bool validate() const;
      static void print_help();

      CONFIG::TripConfig trip_config;   /**< trip input file */
      CONFIG::MatchConfig match_config; /**< engine parameters */
      std::string output_file;          /**< match result file */
      std::vector<std::string> trip_ids; /**< trips to match, empty for all active trips */
      int log_level = 2;                /**< spdlog level, 0 trace to 6 off */
      bool help_specified = false;
    };

  } // APP
} // POOLMATCH

#endif // POOLMATCH_APP_MATCH_APP_CONFIG_HPP
