/**
 * Carpool route matching.
 *
 * Writer of match results
 */

#ifndef POOLMATCH_IO_RESULT_WRITER_HPP
#define POOLMATCH_IO_RESULT_WRITER_HPP

#include "match/match_type.hpp"

#include <fstream>
#include <string>

namespace POOLMATCH
{
  namespace IO
  {

    /**
     * Write match results to a delimited text file, one line per ranked
     * candidate:
     *
     *     for_trip_id;rank;trip_id;score;overlap;start;end;time
     *
     * A result without candidates produces no line.
     */
    class CSVMatchResultWriter
    {
    public:
      /**
       * @throw std::runtime_error if the file cannot be opened
       */
      explicit CSVMatchResultWriter(const std::string &filename);
      void write_result(const MATCH::MatchResult &result);
      /**
       * Number of candidate lines written so far
       */
      int get_num_lines() const
      {
        return num_lines;
      };

    private:
      void write_header();
      std::ofstream m_fstream;
      int num_lines = 0;
    };

  } // IO
} // POOLMATCH

#endif // POOLMATCH_IO_RESULT_WRITER_HPP
