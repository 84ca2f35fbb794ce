#include "core/trip.hpp"
#include "algorithm/geom_algorithm.hpp"
#include "core/error.hpp"

#include <stdexcept>

#include <boost/format.hpp>

namespace POOLMATCH
{
  namespace CORE
  {

    std::string status_to_string(TripStatus status)
    {
      switch (status)
      {
      case TripStatus::ACTIVE:
        return "active";
      case TripStatus::MATCHED:
        return "matched";
      case TripStatus::EXPIRED:
        return "expired";
      case TripStatus::CANCELLED:
        return "cancelled";
      }
      return "unknown";
    }

    TripStatus string_to_status(const std::string &str)
    {
      if (str == "active")
        return TripStatus::ACTIVE;
      if (str == "matched")
        return TripStatus::MATCHED;
      if (str == "expired")
        return TripStatus::EXPIRED;
      if (str == "cancelled")
        return TripStatus::CANCELLED;
      throw std::invalid_argument(
          (boost::format("Unknown trip status '%1%'") % str).str());
    }

    bool is_valid_transition(TripStatus from, TripStatus to)
    {
      switch (to)
      {
      case TripStatus::MATCHED:
      case TripStatus::EXPIRED:
        return from == TripStatus::ACTIVE;
      case TripStatus::CANCELLED:
        return from == TripStatus::ACTIVE || from == TripStatus::MATCHED;
      case TripStatus::ACTIVE:
        return false;
      }
      return false;
    }

    void Trip::reset_polyline(const LineString &polyline_arg, double interval)
    {
      LineString sampled = ALGORITHM::sample_polyline(polyline_arg, interval);
      polyline = polyline_arg;
      sampled_points = sampled;
      length = ALGORITHM::get_geodesic_length(polyline);
    }

    Trip Trip::create(const TripId &id, const UserId &user_id,
                      const LineString &polyline, Timestamp depart_time,
                      double interval, TripStatus status)
    {
      if (polyline.is_empty())
      {
        throw InvalidGeometryError(
            (boost::format("Trip %1% has an empty polyline") % id).str());
      }
      return create(id, user_id, polyline.front(), polyline.back(), polyline,
                    depart_time, interval, status);
    }

    Trip Trip::create(const TripId &id, const UserId &user_id,
                      const Point &origin, const Point &destination,
                      const LineString &polyline, Timestamp depart_time,
                      double interval, TripStatus status)
    {
      ALGORITHM::validate_coordinate(get_lat(origin), get_lon(origin));
      ALGORITHM::validate_coordinate(get_lat(destination), get_lon(destination));
      Trip trip;
      trip.id = id;
      trip.user_id = user_id;
      trip.origin = origin;
      trip.destination = destination;
      trip.reset_polyline(polyline, interval);
      if (!polyline.is_empty())
      {
        double start_gap = ALGORITHM::haversine_distance(origin, polyline.front());
        double end_gap = ALGORITHM::haversine_distance(destination, polyline.back());
        if (start_gap > interval || end_gap > interval)
        {
          throw InvalidGeometryError(
              (boost::format("Trip %1% endpoints are %2% m and %3% m away from its "
                             "polyline, at most %4% m allowed") %
               id % start_gap % end_gap % interval)
                  .str());
        }
      }
      trip.depart_time = depart_time;
      trip.status = status;
      trip.created_at = std::chrono::system_clock::now();
      return trip;
    }

    Timestamp from_epoch_seconds(long long seconds)
    {
      return Timestamp(std::chrono::seconds(seconds));
    }

    long long to_epoch_seconds(Timestamp t)
    {
      return std::chrono::duration_cast<std::chrono::seconds>(
                 t.time_since_epoch())
          .count();
    }

  } // CORE
} // POOLMATCH
