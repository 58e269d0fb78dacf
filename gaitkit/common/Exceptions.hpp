#ifndef GAITKIT_COMMON_EXCEPTIONS_HPP_
#define GAITKIT_COMMON_EXCEPTIONS_HPP_

#include <stdexcept>
#include <string>

namespace gaitkit {

/// Base class for errors caused by missing or inconsistent recorded data
class GaitDataException : public std::runtime_error
{
public:
  explicit GaitDataException(const std::string& message)
    : std::runtime_error(message)
  {
  }
};

/// A marker that a computation requires is not present in the data
class MarkerNotFoundException : public GaitDataException
{
public:
  explicit MarkerNotFoundException(const std::string& markerName)
    : GaitDataException("Marker not found: " + markerName),
      mMarkerName(markerName)
  {
  }

  const std::string& getMarkerName() const
  {
    return mMarkerName;
  }

protected:
  std::string mMarkerName;
};

/// No EMG channel name contains the requested short name
class NoMatchingChannelException : public GaitDataException
{
public:
  explicit NoMatchingChannelException(const std::string& query)
    : GaitDataException("No matching channel for " + query), mQuery(query)
  {
  }

  const std::string& getQuery() const
  {
    return mQuery;
  }

protected:
  std::string mQuery;
};

/// Both feet pass the on-plate check for the same contact on one plate
class AmbiguousContactException : public GaitDataException
{
public:
  explicit AmbiguousContactException(int plateIndex)
    : GaitDataException(
        "Got valid contact for both feet on force plate "
        + std::to_string(plateIndex)),
      mPlateIndex(plateIndex)
  {
  }

  int getPlateIndex() const
  {
    return mPlateIndex;
  }

protected:
  int mPlateIndex;
};

/// Malformed filter passband
class InvalidPassbandException : public std::invalid_argument
{
public:
  explicit InvalidPassbandException(const std::string& message)
    : std::invalid_argument(message)
  {
  }
};

/// The operation is not meaningful for this kind of object
class UnsupportedOperationException : public std::logic_error
{
public:
  explicit UnsupportedOperationException(const std::string& message)
    : std::logic_error(message)
  {
  }
};

#define GAITKIT_THROW(ExceptionType, message) throw ExceptionType(message)

#define GAITKIT_THROW_IF(condition, ExceptionType, message)                    \
  do                                                                           \
  {                                                                            \
    if (condition)                                                             \
    {                                                                          \
      throw ExceptionType(message);                                            \
    }                                                                          \
  } while (false)

} // namespace gaitkit

#endif // GAITKIT_COMMON_EXCEPTIONS_HPP_
