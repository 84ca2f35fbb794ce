/**
 * Carpool route matching.
 *
 * Encoded polyline format of directions providers: each coordinate is
 * stored as a latitude and longitude delta from the previous point,
 * scaled by 10^precision and written as base64-like 5 bit chunks.
 */

#ifndef POOLMATCH_IO_POLYLINE_CODEC_HPP
#define POOLMATCH_IO_POLYLINE_CODEC_HPP

#include "core/geometry.hpp"

#include <string>

namespace POOLMATCH
{
  /**
   * Input and output of trips and match results
   */
  namespace IO
  {

    /**
     * Decode an encoded polyline
     * @param encoded encoded string
     * @param precision number of decimals, 5 for most providers
     * @return the decoded linestring
     * @throw CORE::InvalidGeometryError if the string is truncated or a
     * decoded coordinate is out of range
     */
    CORE::LineString decode_polyline(const std::string &encoded, int precision = 5);

    /**
     * Encode a linestring into the polyline format
     */
    std::string encode_polyline(const CORE::LineString &line, int precision = 5);

  } // IO
} // POOLMATCH

#endif // POOLMATCH_IO_POLYLINE_CODEC_HPP
