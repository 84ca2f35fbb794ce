/**
 * Carpool route matching.
 *
 * Definition of a planned trip
 */

#ifndef POOLMATCH_CORE_TRIP_HPP
#define POOLMATCH_CORE_TRIP_HPP

#include "core/geometry.hpp"

#include <chrono>
#include <string>

namespace POOLMATCH
{

  namespace CORE
  {

    typedef std::string TripId; /**< Opaque trip identifier */
    typedef std::string UserId; /**< Opaque identifier of the trip owner */
    typedef std::chrono::system_clock::time_point Timestamp;

    /**
     * Lifecycle state of a trip
     */
    enum class TripStatus
    {
      ACTIVE,   /**< Open for matching */
      MATCHED,  /**< A rider confirmed the match */
      EXPIRED,  /**< Departure time passed */
      CANCELLED /**< Cancelled by the user */
    };

    std::string status_to_string(TripStatus status);

    /**
     * Parse a status name (active, matched, expired, cancelled)
     * @throw std::invalid_argument for an unknown name
     */
    TripStatus string_to_status(const std::string &str);

    /**
     * Check a lifecycle transition: active to matched, active to expired,
     * active or matched to cancelled.
     */
    bool is_valid_transition(TripStatus from, TripStatus to);

    /**
     * %Trip class
     *
     * A planned trip represented with its route polyline, the points sampled
     * from it and its departure time.
     */
    struct Trip
    {
      TripId id;                  /**< Id of the trip */
      UserId user_id;             /**< Owner of the trip */
      Point origin;               /**< Start of the route */
      Point destination;          /**< End of the route */
      LineString polyline;        /**< Route geometry from the directions provider */
      LineString sampled_points;  /**< Points sampled from polyline at a fixed interval */
      double length = 0;          /**< Great circle length of polyline in metres */
      Timestamp depart_time;      /**< Planned departure */
      TripStatus status = TripStatus::ACTIVE;
      Timestamp created_at;

      bool is_active() const
      {
        return status == TripStatus::ACTIVE;
      }

      /**
       * A trip takes part in matching, as query or as candidate, only when
       * it is active and its route has a positive length.
       */
      bool is_matchable() const
      {
        return is_active() && !sampled_points.is_empty() && length > 0;
      }

      /**
       * Replace the route and recompute the derived fields
       * @param polyline_arg new route geometry
       * @param interval sampling interval in metres
       * @throw InvalidGeometryError if any coordinate is out of range
       */
      void reset_polyline(const LineString &polyline_arg, double interval);

      /**
       * Create a trip from its route. Origin and destination are the first
       * and last points of the polyline.
       *
       * @param id trip id
       * @param user_id owner id
       * @param polyline route geometry
       * @param depart_time planned departure
       * @param interval sampling interval in metres
       * @param status initial status
       * @throw InvalidGeometryError if any coordinate is out of range
       */
      static Trip create(const TripId &id, const UserId &user_id,
                         const LineString &polyline, Timestamp depart_time,
                         double interval, TripStatus status = TripStatus::ACTIVE);

      /**
       * Create a trip from its route with explicit endpoints. Each endpoint
       * must lie within one sampling interval of the matching end of the
       * polyline.
       * @throw InvalidGeometryError if a coordinate is out of range or an
       * endpoint is too far from the polyline
       */
      static Trip create(const TripId &id, const UserId &user_id,
                         const Point &origin, const Point &destination,
                         const LineString &polyline, Timestamp depart_time,
                         double interval, TripStatus status = TripStatus::ACTIVE);
    };

    /**
     * Convert between timestamps and epoch seconds
     */
    Timestamp from_epoch_seconds(long long seconds);
    long long to_epoch_seconds(Timestamp t);

  } // CORE

} // POOLMATCH
#endif // POOLMATCH_CORE_TRIP_HPP
