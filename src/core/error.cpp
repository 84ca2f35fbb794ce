#include "core/error.hpp"

#include <boost/format.hpp>

namespace POOLMATCH
{
  namespace CORE
  {

    TripNotFoundError::TripNotFoundError(const std::string &trip_id)
        : PoolmatchError((boost::format("Trip %1% not found") % trip_id).str()),
          trip_id_(trip_id)
    {
    }

    bool is_retryable(const std::exception &e)
    {
      return dynamic_cast<const IndexUnavailableError *>(&e) != nullptr;
    }

  } // CORE
} // POOLMATCH
