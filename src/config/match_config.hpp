/**
 * Carpool route matching.
 *
 * Configuration of the matching engine
 */

#ifndef POOLMATCH_CONFIG_MATCH_CONFIG_HPP
#define POOLMATCH_CONFIG_MATCH_CONFIG_HPP

#include <chrono>
#include <cstddef>
#include <sstream>

#include <boost/property_tree/ptree.hpp>

namespace POOLMATCH
{
  /**
   * Configuration classes
   */
  namespace CONFIG
  {

    /**
     * Weights of the composite score
     */
    struct ScoreWeights
    {
      double overlap = 0.5; /**< weight of the overlap fraction */
      double start = 0.2;   /**< weight of the start proximity */
      double end = 0.2;     /**< weight of the end proximity */
      double time = 0.1;    /**< weight of the departure time component */

      /**
       * Check that weights are non-negative and sum to 1
       * @throw CORE::InvalidWeightsError otherwise
       */
      void validate() const;
    };

    /**
     * Configuration of the matching engine
     */
    struct MatchConfig
    {
      double sample_interval = 150.0;               /**< arc length between sampled points, metres */
      double match_radius = 200.0;                  /**< proximity radius of index queries and overlap test, metres */
      std::chrono::seconds time_window{900};        /**< maximum departure difference */
      double max_start_distance = 1000.0;           /**< origin distance where start proximity reaches 0, metres */
      double max_end_distance = 1000.0;             /**< destination distance where end proximity reaches 0, metres */
      ScoreWeights weights;                         /**< composite score weights */
      std::size_t limit = 5;                        /**< maximum number of ranked candidates */
      std::chrono::milliseconds query_timeout{5000}; /**< deadline of a single index query */
      int max_concurrency = 0;                      /**< worker bound, 0 for the number of processing units */

      /**
       * Check the configuration
       * @throw CORE::InvalidWeightsError for invalid weights
       * @throw std::invalid_argument for any other invalid value
       */
      void validate() const;
      /**
       * Log the configuration
       */
      void print() const;
      /**
       * Load from the parameters section of an XML configuration, missing
       * values keep their defaults
       * @param xml_data property tree of the XML file
       * @return the configuration, validated
       */
      static MatchConfig load_from_xml(const boost::property_tree::ptree &xml_data);
      /**
       * Write a description of the XML parameters to a stream
       */
      static void register_help(std::ostringstream &oss);
    };

  } // CONFIG
} // POOLMATCH

#endif // POOLMATCH_CONFIG_MATCH_CONFIG_HPP
