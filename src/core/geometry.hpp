/**
 * Carpool route matching.
 *
 * Definition of geometry types. Coordinates are geographic degrees, stored
 * as (longitude, latitude) the way WKT orders them.
 */

#ifndef POOLMATCH_CORE_GEOMETRY_HPP
#define POOLMATCH_CORE_GEOMETRY_HPP

#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

#include <boost/geometry.hpp>
#include <boost/geometry/geometries/linestring.hpp>
#include <boost/geometry/geometries/point.hpp>

namespace POOLMATCH
{
  /**
   * Core data types
   */
  namespace CORE
  {

    /**
     * Point on the sphere, x is longitude and y is latitude in degrees
     */
    typedef boost::geometry::model::point<
        double, 2,
        boost::geometry::cs::spherical_equatorial<boost::geometry::degree>>
        Point;

    /**
     * Create a point from latitude and longitude
     */
    inline Point make_point(double lat, double lon)
    {
      return Point(lon, lat);
    }

    inline double get_lat(const Point &p)
    {
      return boost::geometry::get<1>(p);
    }

    inline double get_lon(const Point &p)
    {
      return boost::geometry::get<0>(p);
    }

    /**
     * Linestring geometry class
     *
     * This class wraps a boost linestring geometry and is used for route
     * polylines and their sampled points.
     */
    class LineString
    {
    public:
      /**
       * This is the boost geometry linestring class, stored inside the
       * LineString class.
       */
      typedef boost::geometry::model::linestring<Point> linestring_t;

      /**
       * Get the x coordinate (longitude) of the ith point
       */
      inline double get_x(int i) const
      {
        return boost::geometry::get<0>(line.at(i));
      };
      /**
       * Get the y coordinate (latitude) of the ith point
       */
      inline double get_y(int i) const
      {
        return boost::geometry::get<1>(line.at(i));
      };
      inline double get_lat(int i) const
      {
        return get_y(i);
      };
      inline double get_lon(int i) const
      {
        return get_x(i);
      };
      /**
       * Get the ith point
       */
      inline const Point &get_point(int i) const
      {
        return line.at(i);
      };
      inline const Point &front() const
      {
        return line.front();
      };
      inline const Point &back() const
      {
        return line.back();
      };
      /**
       * Add a point given its longitude and latitude
       */
      inline void add_point(double x, double y)
      {
        boost::geometry::append(line, Point(x, y));
      };
      inline void add_point(const Point &point)
      {
        boost::geometry::append(line, point);
      };
      /**
       * Get the number of points in the linestring
       */
      inline int get_num_points() const
      {
        return static_cast<int>(boost::geometry::num_points(line));
      };
      inline bool is_empty() const
      {
        return line.empty();
      };
      inline linestring_t &get_geometry()
      {
        return line;
      };
      /**
       * Export the linestring as WKT, e.g. LINESTRING(77.58 12.9,77.6 12.95)
       */
      std::string export_wkt(int precision = 8) const;
      /**
       * Build a linestring from (latitude, longitude) pairs
       */
      static LineString from_lat_lon(const std::vector<std::pair<double, double>> &coords);

      /**
       * Compare two linestrings point by point
       * @param rhs another linestring
       * @return true if both have the same number of points and each pair
       * of points differs by less than 1e-9 degree
       */
      bool operator==(const LineString &rhs) const;

      friend std::ostream &operator<<(std::ostream &os, const LineString &rhs);

    private:
      linestring_t line;
    };

    std::ostream &operator<<(std::ostream &os, const LineString &rhs);

    /**
     * Convert a WKT string into a linestring
     * @param wkt a WKT LINESTRING with longitude first
     * @return a linestring
     */
    LineString wkt2linestring(const std::string &wkt);

  } // CORE
} // POOLMATCH

#endif // POOLMATCH_CORE_GEOMETRY_HPP
