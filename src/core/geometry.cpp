#include "core/geometry.hpp"

#include <cmath>
#include <sstream>

#include <boost/geometry/io/wkt/wkt.hpp>

namespace POOLMATCH
{
  namespace CORE
  {

    std::string LineString::export_wkt(int precision) const
    {
      std::ostringstream ss;
      ss << std::setprecision(precision) << boost::geometry::wkt(line);
      return ss.str();
    }

    LineString LineString::from_lat_lon(const std::vector<std::pair<double, double>> &coords)
    {
      LineString result;
      for (const auto &c : coords)
      {
        result.add_point(c.second, c.first);
      }
      return result;
    }

    bool LineString::operator==(const LineString &rhs) const
    {
      int n = get_num_points();
      if (n != rhs.get_num_points())
        return false;
      for (int i = 0; i < n; ++i)
      {
        if (std::abs(get_x(i) - rhs.get_x(i)) > 1e-9 ||
            std::abs(get_y(i) - rhs.get_y(i)) > 1e-9)
          return false;
      }
      return true;
    }

    std::ostream &operator<<(std::ostream &os, const LineString &rhs)
    {
      os << std::setprecision(12) << boost::geometry::wkt(rhs.line);
      return os;
    }

    LineString wkt2linestring(const std::string &wkt)
    {
      LineString line;
      boost::geometry::read_wkt(wkt, line.get_geometry());
      return line;
    }

  } // CORE
} // POOLMATCH
