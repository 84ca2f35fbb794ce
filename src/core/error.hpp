/**
 * Carpool route matching.
 *
 * Exceptions raised by the matching engine
 */

#ifndef POOLMATCH_CORE_ERROR_HPP
#define POOLMATCH_CORE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace POOLMATCH
{
  namespace CORE
  {

    /**
     * Base class of all errors raised by the engine
     */
    class PoolmatchError : public std::runtime_error
    {
    public:
      explicit PoolmatchError(const std::string &what_arg)
          : std::runtime_error(what_arg) {};
    };

    /**
     * A coordinate is outside the valid latitude/longitude range.
     * Not retryable.
     */
    class InvalidGeometryError : public PoolmatchError
    {
    public:
      explicit InvalidGeometryError(const std::string &what_arg)
          : PoolmatchError(what_arg) {};
    };

    /**
     * The requested trip does not exist. Not retryable.
     */
    class TripNotFoundError : public PoolmatchError
    {
    public:
      explicit TripNotFoundError(const std::string &trip_id);
      const std::string &get_trip_id() const
      {
        return trip_id_;
      };

    private:
      std::string trip_id_;
    };

    /**
     * The spatial index is unreachable, or every sample point query of an
     * invocation timed out. Retryable by the job queue.
     */
    class IndexUnavailableError : public PoolmatchError
    {
    public:
      explicit IndexUnavailableError(const std::string &what_arg)
          : PoolmatchError(what_arg) {};
    };

    /**
     * A single spatial index query exceeded its deadline
     */
    class IndexTimeoutError : public PoolmatchError
    {
    public:
      explicit IndexTimeoutError(const std::string &what_arg)
          : PoolmatchError(what_arg) {};
    };

    /**
     * Scorer weights are negative or do not sum to 1. Raised when the
     * configuration is loaded.
     */
    class InvalidWeightsError : public PoolmatchError
    {
    public:
      explicit InvalidWeightsError(const std::string &what_arg)
          : PoolmatchError(what_arg) {};
    };

    /**
     * Check whether a failed match job can be retried by the queue
     * @param e the error raised by find_matches
     * @return true for IndexUnavailableError
     */
    bool is_retryable(const std::exception &e);

  } // CORE
} // POOLMATCH

#endif // POOLMATCH_CORE_ERROR_HPP
