#ifndef GAITKIT_BIOMECH_MOCAPSOURCE_HPP_
#define GAITKIT_BIOMECH_MOCAPSOURCE_HPP_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "gaitkit/biomechanics/ForcePlate.hpp"
#include "gaitkit/math/MathTypes.hpp"

namespace gaitkit {

namespace biomechanics {

struct TrialMetadata
{
  std::string trialName;
  std::string subjectName;
  // Marker frames per second
  s_t frameRate = 0;
  // Analog samples per second, an integer multiple of frameRate
  s_t analogRate = 0;
  int frameCount = 0;
  // analogRate / frameRate
  int samplesPerFrame = 0;
  // kg, unknown if empty
  std::optional<s_t> bodyMass;
  int forcePlateCount = 0;
  std::vector<std::string> markerNames;

  /// Fills in samplesPerFrame from the two rates. Throws GaitDataException if
  /// the rates are not positive, or the analog rate is not an integer
  /// multiple of the frame rate.
  void computeSamplesPerFrame();
};

/// Samples of one analog device (e.g. an EMG amplifier)
struct AnalogData
{
  s_t sampleRate = 0;
  // Seconds, one entry per sample
  Eigen::VectorXs timeAxis;
  std::map<std::string, Eigen::VectorXs> channels;
};

/// Read-only access to one recorded trial. Implementations wrap an acquisition
/// system or a file reader; the analysis code only depends on this interface.
class MocapSource
{
public:
  virtual ~MocapSource() = default;

  virtual TrialMetadata getMetadata() const = 0;

  /// Position series (frames x 3) of the named markers. Throws
  /// MarkerNotFoundException on the first missing name, unless allowMissing
  /// is set, in which case missing markers are left out of the result.
  virtual std::map<std::string, Eigen::MatrixXs> getMarkerData(
      const std::vector<std::string>& names, bool allowMissing = false) const
      = 0;

  /// All force plates of the trial, possibly none
  virtual std::vector<ForcePlate> getForcePlateData() const = 0;

  virtual AnalogData getAnalogData(const std::string& deviceName) const = 0;
};

/// A MocapSource over data that is already in memory
class InMemoryMocapSource : public MocapSource
{
public:
  /// Throws GaitDataException if the metadata rates are invalid
  explicit InMemoryMocapSource(const TrialMetadata& metadata);

  /// Throws GaitDataException unless positions is frameCount x 3
  void addMarker(const std::string& name, const Eigen::MatrixXs& positions);

  void addForcePlate(const ForcePlate& plate);

  void addAnalogDevice(const std::string& deviceName, const AnalogData& data);

  TrialMetadata getMetadata() const override;

  std::map<std::string, Eigen::MatrixXs> getMarkerData(
      const std::vector<std::string>& names,
      bool allowMissing = false) const override;

  std::vector<ForcePlate> getForcePlateData() const override;

  /// Device names are matched exactly, ignoring case. Throws
  /// GaitDataException if no device, or more than one device, matches.
  AnalogData getAnalogData(const std::string& deviceName) const override;

protected:
  TrialMetadata mMetadata;
  std::map<std::string, Eigen::MatrixXs> mMarkers;
  std::vector<ForcePlate> mForcePlates;
  std::map<std::string, AnalogData> mAnalogDevices;
};

} // namespace biomechanics
} // namespace gaitkit

#endif
