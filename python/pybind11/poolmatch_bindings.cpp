// poolmatch_bindings.cpp: pybind11 bindings for POOLMATCH
#include <pybind11/pybind11.h>
#include <pybind11/chrono.h>
#include <pybind11/stl.h>
#include "core/error.hpp"
#include "core/geometry.hpp"
#include "core/trip.hpp"
#include "config/match_config.hpp"
#include "io/polyline_codec.hpp"
#include "match/match_type.hpp"
#include "match/matching_orchestrator.hpp"
#include "match/trip_registry.hpp"
#include "util/debug.hpp"

namespace py = pybind11;
using namespace POOLMATCH;
using namespace POOLMATCH::CORE;
using namespace POOLMATCH::CONFIG;
using namespace POOLMATCH::MATCH;

namespace
{
  LineString to_linestring(const py::list &coords)
  {
    std::vector<std::pair<double, double>> lat_lon;
    for (auto item : coords)
    {
      if (py::isinstance<py::tuple>(item) && py::len(item) == 2)
      {
        py::tuple tup = item.cast<py::tuple>();
        lat_lon.emplace_back(py::float_(tup[0]), py::float_(tup[1]));
      }
      else
      {
        throw std::runtime_error("Each coordinate must be a tuple (lat, lon)");
      }
    }
    return LineString::from_lat_lon(lat_lon);
  }

  py::list to_lat_lon_list(const LineString &line)
  {
    py::list coords;
    for (int i = 0; i < line.get_num_points(); ++i)
    {
      coords.append(py::make_tuple(line.get_lat(i), line.get_lon(i)));
    }
    return coords;
  }
}

PYBIND11_MODULE(poolmatch, m)
{
    m.doc() = "Carpool route matching (POOLMATCH) Python bindings via pybind11";

    // Errors
    auto base_error = py::register_exception<PoolmatchError>(m, "PoolmatchError", PyExc_RuntimeError);
    py::register_exception<InvalidGeometryError>(m, "InvalidGeometryError", base_error.ptr());
    py::register_exception<TripNotFoundError>(m, "TripNotFoundError", base_error.ptr());
    py::register_exception<IndexUnavailableError>(m, "IndexUnavailableError", base_error.ptr());
    py::register_exception<IndexTimeoutError>(m, "IndexTimeoutError", base_error.ptr());
    py::register_exception<InvalidWeightsError>(m, "InvalidWeightsError", base_error.ptr());

    m.def("set_log_level", [](int level)
          { spdlog::set_level((spdlog::level::level_enum)level); },
          py::arg("level"), "Set the log level, 0 trace to 6 off");

    m.def("decode_polyline", [](const std::string &encoded, int precision)
          { return to_lat_lon_list(IO::decode_polyline(encoded, precision)); },
          py::arg("encoded"), py::arg("precision") = 5,
          "Decode an encoded polyline into a list of (lat, lon) tuples");

    m.def("encode_polyline", [](const py::list &coords, int precision)
          { return IO::encode_polyline(to_linestring(coords), precision); },
          py::arg("coords"), py::arg("precision") = 5,
          "Encode a list of (lat, lon) tuples as an encoded polyline");

    // TripStatus enum
    py::enum_<TripStatus>(m, "TripStatus")
        .value("ACTIVE", TripStatus::ACTIVE, "Waiting for a match")
        .value("MATCHED", TripStatus::MATCHED, "Matched with another trip")
        .value("EXPIRED", TripStatus::EXPIRED, "Departure passed without a match")
        .value("CANCELLED", TripStatus::CANCELLED, "Cancelled by its owner")
        .export_values();

    // Trip
    py::class_<Trip>(m, "Trip", R"pbdoc(
        A trip offered or requested by a user, with its sampled route.

        Example:
            >>> trip = poolmatch.Trip.create("t1", "u1", [(12.90, 77.58), (12.95, 77.60)], 1700000000)
    )pbdoc")
        .def_static("create", [](const std::string &id, const std::string &user_id, const py::list &coords,
                                 long long depart_time, double sample_interval, TripStatus status)
                    { return Trip::create(id, user_id, to_linestring(coords), from_epoch_seconds(depart_time),
                                          sample_interval, status); },
                    py::arg("id"), py::arg("user_id"), py::arg("coords"), py::arg("depart_time"),
                    py::arg("sample_interval") = 150.0, py::arg("status") = TripStatus::ACTIVE,
                    "Create a trip from (lat, lon) tuples and a departure in epoch seconds")
        .def_readonly("id", &Trip::id)
        .def_readonly("user_id", &Trip::user_id)
        .def_readonly("status", &Trip::status)
        .def_readonly("length", &Trip::length, "Geodesic length of the route in metres")
        .def_property_readonly("depart_time", [](const Trip &t)
                               { return to_epoch_seconds(t.depart_time); }, "Departure in epoch seconds")
        .def_property_readonly("polyline", [](const Trip &t)
                               { return to_lat_lon_list(t.polyline); })
        .def_property_readonly("sampled_points", [](const Trip &t)
                               { return to_lat_lon_list(t.sampled_points); })
        .def("is_matchable", &Trip::is_matchable)
        .def("__repr__", [](const Trip &t)
             { return "<Trip id=" + t.id + " status=" + status_to_string(t.status) +
                      " length=" + fmt::format("{:.1f}", t.length) + ">"; });

    // ScoreWeights
    py::class_<ScoreWeights>(m, "ScoreWeights")
        .def(py::init<>())
        .def_readwrite("overlap", &ScoreWeights::overlap)
        .def_readwrite("start", &ScoreWeights::start)
        .def_readwrite("end", &ScoreWeights::end)
        .def_readwrite("time", &ScoreWeights::time)
        .def("validate", &ScoreWeights::validate);

    // MatchConfig
    py::class_<MatchConfig>(m, "MatchConfig", R"pbdoc(
        Parameters of the matching engine. Distances are in metres.
    )pbdoc")
        .def(py::init<>())
        .def_readwrite("sample_interval", &MatchConfig::sample_interval)
        .def_readwrite("match_radius", &MatchConfig::match_radius)
        .def_readwrite("time_window", &MatchConfig::time_window)
        .def_readwrite("max_start_distance", &MatchConfig::max_start_distance)
        .def_readwrite("max_end_distance", &MatchConfig::max_end_distance)
        .def_readwrite("weights", &MatchConfig::weights)
        .def_readwrite("limit", &MatchConfig::limit)
        .def_readwrite("query_timeout", &MatchConfig::query_timeout)
        .def_readwrite("max_concurrency", &MatchConfig::max_concurrency)
        .def("validate", &MatchConfig::validate);

    // MatchCandidate
    py::class_<MatchCandidate>(m, "MatchCandidate")
        .def_readonly("trip_id", &MatchCandidate::trip_id)
        .def_readonly("score", &MatchCandidate::score)
        .def_readonly("overlap_fraction", &MatchCandidate::overlap_fraction)
        .def_readonly("start_proximity", &MatchCandidate::start_proximity)
        .def_readonly("end_proximity", &MatchCandidate::end_proximity)
        .def_readonly("time_delta", &MatchCandidate::time_delta)
        .def_readonly("depart_difference", &MatchCandidate::depart_difference,
                      "Absolute departure difference in seconds")
        .def("__repr__", [](const MatchCandidate &c)
             { return "<MatchCandidate trip_id=" + c.trip_id +
                      " score=" + fmt::format("{:.3f}", c.score) + ">"; });

    // MatchResult
    py::class_<MatchResult>(m, "MatchResult")
        .def_readonly("for_trip_id", &MatchResult::for_trip_id)
        .def_readonly("candidates", &MatchResult::candidates, "Ranked candidates, best first")
        .def_readonly("computed_at", &MatchResult::computed_at)
        .def("__repr__", [](const MatchResult &r)
             { return "<MatchResult for_trip_id=" + r.for_trip_id + " with " +
                      std::to_string(r.candidates.size()) + " candidates>"; });

    // TripRegistry
    py::class_<TripRegistry>(m, "TripRegistry", R"pbdoc(
        In-memory trip store and spatial index kept consistent with each other.
    )pbdoc")
        .def(py::init<double>(), py::arg("sample_interval") = 150.0)
        .def("add_trip", &TripRegistry::add_trip, py::arg("trip"))
        .def("update_polyline", [](TripRegistry &self, const std::string &trip_id, const py::list &coords)
             { self.update_polyline(trip_id, to_linestring(coords)); },
             py::arg("trip_id"), py::arg("coords"))
        .def("update_status", &TripRegistry::update_status, py::arg("trip_id"), py::arg("status"))
        .def("get_trip", [](const TripRegistry &self, const std::string &trip_id)
             { return self.get_store().get_trip(trip_id); },
             py::arg("trip_id"))
        .def("__len__", [](const TripRegistry &self)
             { return self.get_store().size(); });

    // MatchingOrchestrator
    py::class_<MatchingOrchestrator>(m, "MatchingOrchestrator", R"pbdoc(
        Find the best carpool matches of a trip among the trips of a registry.

        Example:
            >>> registry = poolmatch.TripRegistry()
            >>> registry.add_trip(trip)
            >>> orchestrator = poolmatch.MatchingOrchestrator(registry, poolmatch.MatchConfig())
            >>> result = orchestrator.find_matches("t1")
    )pbdoc")
        .def(py::init([](const TripRegistry &registry, const MatchConfig &config)
                      { return new MatchingOrchestrator(registry.get_store(), registry.get_index(), config); }),
             py::arg("registry"), py::arg("config"), py::keep_alive<1, 2>())
        .def("find_matches", &MatchingOrchestrator::find_matches, py::arg("trip_id"),
             py::call_guard<py::gil_scoped_release>())
        .def("match_trip", &MatchingOrchestrator::match_trip, py::arg("trip"),
             py::call_guard<py::gil_scoped_release>());
}
