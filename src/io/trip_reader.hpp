/**
 * Carpool route matching.
 *
 * Reader of delimited trip files
 */

#ifndef POOLMATCH_IO_TRIP_READER_HPP
#define POOLMATCH_IO_TRIP_READER_HPP

#include "config/trip_config.hpp"
#include "core/trip.hpp"

#include <fstream>
#include <string>
#include <vector>

namespace POOLMATCH
{
  namespace IO
  {

    /**
     * Trip reader for a delimited text file with a header line, e.g.
     *
     *     id;user_id;depart_time;status;geom
     *     t1;u1;1700000000;active;LINESTRING(77.58 12.9,77.6 12.95)
     *
     * The route is read from a WKT column, or from an encoded polyline
     * column when the file has no WKT column. The status column is optional
     * and defaults to active.
     */
    class CSVTripReader
    {
    public:
      /**
       * @param config file name and column names
       * @param sample_interval sampling interval of the trip routes
       * @throw std::runtime_error if the file cannot be opened or a
       * required column is missing
       */
      CSVTripReader(const CONFIG::TripConfig &config, double sample_interval);
      CSVTripReader(const std::string &filename, double sample_interval);

      /**
       * Read the next trip
       * @throw std::runtime_error for a row with missing fields
       * @throw CORE::InvalidGeometryError for an invalid route
       */
      CORE::Trip read_next_trip();
      bool has_next_trip();
      std::vector<CORE::Trip> read_all_trips();
      /**
       * Go back to the first row
       */
      void reset();
      void close();

    private:
      void read_header();

      std::ifstream ifs;
      CONFIG::TripConfig config_;
      double sample_interval_;
      int line_number = 0;
      int id_idx = -1;
      int user_id_idx = -1;
      int depart_time_idx = -1;
      int status_idx = -1;
      int geom_idx = -1;
      int polyline_idx = -1;
    };

  } // IO
} // POOLMATCH

#endif // POOLMATCH_IO_TRIP_READER_HPP
