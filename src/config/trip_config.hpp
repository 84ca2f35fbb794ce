/**
 * Carpool route matching.
 *
 * Configuration of the trip input file
 */

#ifndef POOLMATCH_CONFIG_TRIP_CONFIG_HPP
#define POOLMATCH_CONFIG_TRIP_CONFIG_HPP

#include <sstream>
#include <string>

#include <boost/property_tree/ptree.hpp>

namespace POOLMATCH
{
  namespace CONFIG
  {

    /**
     * Trip file configuration, naming the file and its columns
     */
    struct TripConfig
    {
      std::string file;                       /**< trip file name */
      std::string id = "id";                  /**< trip id column */
      std::string user_id = "user_id";        /**< owner id column */
      std::string depart_time = "depart_time"; /**< departure column, epoch seconds */
      std::string status = "status";          /**< status column, optional */
      std::string geom = "geom";              /**< WKT route column */
      std::string polyline = "polyline";      /**< encoded polyline column, used when geom is absent */
      char delim = ';';                       /**< field delimiter */

      /**
       * Check that the file exists
       * @return true if the configuration is valid
       */
      bool validate() const;
      void print() const;
      static TripConfig load_from_xml(const boost::property_tree::ptree &xml_data);
      static void register_help(std::ostringstream &oss);
    };

  } // CONFIG
} // POOLMATCH

#endif // POOLMATCH_CONFIG_TRIP_CONFIG_HPP
