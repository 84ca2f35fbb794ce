#include "io/polyline_codec.hpp"
#include "algorithm/geom_algorithm.hpp"
#include "core/error.hpp"

#include <cmath>
#include <cstdint>

#include <boost/format.hpp>

namespace
{
  // Read one zigzag encoded value starting at index
  bool decode_value(const std::string &encoded, std::size_t *index, int64_t *value)
  {
    int64_t result = 0;
    int shift = 0;
    int64_t b;
    do
    {
      if (*index >= encoded.size())
        return false;
      b = static_cast<int64_t>(encoded[(*index)++]) - 63;
      if (b < 0 || b > 63)
        return false;
      result |= (b & 0x1f) << shift;
      shift += 5;
    } while (b >= 0x20 && shift < 60);
    *value = (result & 1) ? ~(result >> 1) : (result >> 1);
    return true;
  }

  void encode_value(int64_t value, std::string *out)
  {
    uint64_t v = value < 0 ? ~(static_cast<uint64_t>(value) << 1)
                           : static_cast<uint64_t>(value) << 1;
    while (v >= 0x20)
    {
      out->push_back(static_cast<char>((0x20 | (v & 0x1f)) + 63));
      v >>= 5;
    }
    out->push_back(static_cast<char>(v + 63));
  }
}

POOLMATCH::CORE::LineString POOLMATCH::IO::decode_polyline(const std::string &encoded,
                                                           int precision)
{
  const double factor = std::pow(10.0, precision);
  POOLMATCH::CORE::LineString line;
  std::size_t index = 0;
  int64_t lat = 0;
  int64_t lon = 0;
  while (index < encoded.size())
  {
    int64_t dlat, dlon;
    if (!decode_value(encoded, &index, &dlat) || !decode_value(encoded, &index, &dlon))
    {
      throw POOLMATCH::CORE::InvalidGeometryError(
          (boost::format("Malformed encoded polyline at character %1%") % index).str());
    }
    lat += dlat;
    lon += dlon;
    double y = lat / factor;
    double x = lon / factor;
    POOLMATCH::ALGORITHM::validate_coordinate(y, x);
    line.add_point(x, y);
  }
  return line;
}

std::string POOLMATCH::IO::encode_polyline(const POOLMATCH::CORE::LineString &line,
                                           int precision)
{
  const double factor = std::pow(10.0, precision);
  std::string out;
  int64_t prev_lat = 0;
  int64_t prev_lon = 0;
  int N = line.get_num_points();
  for (int i = 0; i < N; ++i)
  {
    int64_t lat = std::llround(line.get_lat(i) * factor);
    int64_t lon = std::llround(line.get_lon(i) * factor);
    encode_value(lat - prev_lat, &out);
    encode_value(lon - prev_lon, &out);
    prev_lat = lat;
    prev_lon = lon;
  }
  return out;
}
