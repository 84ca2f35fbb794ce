/**
 * Carpool route matching.
 *
 * Geometric algorithms on geographic linestrings. Distances are metres on
 * a sphere with the mean earth radius.
 */

#ifndef POOLMATCH_ALGORITHM_GEOM_ALGORITHM_HPP
#define POOLMATCH_ALGORITHM_GEOM_ALGORITHM_HPP

#include "core/geometry.hpp"

#include <vector>

namespace POOLMATCH
{
  /**
   * Geometric algorithms
   */
  namespace ALGORITHM
  {

    /**
     * Mean earth radius in metres
     */
    constexpr double EARTH_RADIUS = 6371008.8;

    /**
     * Default arc length between two sampled points of a route, in metres
     */
    constexpr double DEFAULT_SAMPLE_INTERVAL = 150.0;

    /**
     * Great circle distance between two points
     * @param a first point
     * @param b second point
     * @return distance in metres
     */
    double haversine_distance(const CORE::Point &a, const CORE::Point &b);

    /**
     * Check that a coordinate is a finite latitude in [-90,90] and a finite
     * longitude in [-180,180]
     * @throw InvalidGeometryError if the coordinate is invalid
     */
    void validate_coordinate(double lat, double lon);

    /**
     * Validate every point of a linestring
     * @throw InvalidGeometryError naming the first invalid point
     */
    void validate_linestring(const CORE::LineString &line);

    /**
     * Calculate the great circle length of each segment of a linestring
     * @param line input linestring
     * @return a vector of N-1 segment lengths for N points
     */
    std::vector<double> calculate_linestring_geodesic_distances(
        const CORE::LineString &line);

    /**
     * Total great circle length of a linestring in metres
     */
    double get_geodesic_length(const CORE::LineString &line);

    /**
     * Interpolate a point on the segment from a to b. The interpolation is
     * linear in degrees, which is accurate for the short segments of a
     * route polyline.
     * @param ratio 0 returns a, 1 returns b
     */
    CORE::Point interpolate_point(const CORE::Point &a, const CORE::Point &b,
                                  double ratio);

    /**
     * Sample a polyline at a fixed arc length interval.
     *
     * The first and last points of the polyline are always kept. Between
     * them, a point is emitted each time the accumulated arc length crosses
     * a multiple of the interval. A multiple coinciding with the total
     * length is covered by the last point and not emitted twice, so a
     * straight polyline of length L yields ceil(L/interval)+1 points.
     *
     * @param polyline route geometry
     * @param interval arc length between two samples in metres
     * @return sampled points, or the polyline itself when it has fewer
     * than two points
     * @throw InvalidGeometryError if any coordinate is out of range
     * @throw std::invalid_argument if interval is not positive
     */
    CORE::LineString sample_polyline(const CORE::LineString &polyline,
                                     double interval = DEFAULT_SAMPLE_INTERVAL);

  } // ALGORITHM
} // POOLMATCH

#endif // POOLMATCH_ALGORITHM_GEOM_ALGORITHM_HPP
