#include "gaitkit/biomechanics/MocapSource.hpp"

#include <algorithm>
#include <cctype>

#include "gaitkit/common/Console.hpp"
#include "gaitkit/common/Exceptions.hpp"

namespace gaitkit {

namespace biomechanics {

namespace {

//==============================================================================
std::string toLower(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return std::tolower(c);
  });
  return s;
}

} // namespace

//==============================================================================
void TrialMetadata::computeSamplesPerFrame()
{
  GAITKIT_THROW_IF(
      !(frameRate > 0) || !(analogRate > 0),
      GaitDataException,
      "Frame rate and analog rate must be positive");
  s_t ratio = analogRate / frameRate;
  int rounded = static_cast<int>(std::round(ratio));
  GAITKIT_THROW_IF(
      rounded < 1 || abs(ratio - rounded) > 1e-9 * ratio,
      GaitDataException,
      "Analog rate " + std::to_string(analogRate)
          + " is not an integer multiple of frame rate "
          + std::to_string(frameRate));
  samplesPerFrame = rounded;
}

//==============================================================================
InMemoryMocapSource::InMemoryMocapSource(const TrialMetadata& metadata)
  : mMetadata(metadata)
{
  mMetadata.computeSamplesPerFrame();
  GAITKIT_THROW_IF(
      mMetadata.frameCount < 0,
      GaitDataException,
      "Negative frame count");
  GAITKIT_THROW_IF(
      mMetadata.bodyMass && !(*mMetadata.bodyMass > 0),
      GaitDataException,
      "Body mass must be positive when given");
}

//==============================================================================
void InMemoryMocapSource::addMarker(
    const std::string& name, const Eigen::MatrixXs& positions)
{
  GAITKIT_THROW_IF(
      positions.rows() != mMetadata.frameCount || positions.cols() != 3,
      GaitDataException,
      "Marker " + name + " must have " + std::to_string(mMetadata.frameCount)
          + " x 3 samples");
  mMarkers[name] = positions;
}

//==============================================================================
void InMemoryMocapSource::addForcePlate(const ForcePlate& plate)
{
  plate.checkConsistency();
  mForcePlates.push_back(plate);
}

//==============================================================================
void InMemoryMocapSource::addAnalogDevice(
    const std::string& deviceName, const AnalogData& data)
{
  for (const auto& pair : data.channels)
  {
    GAITKIT_THROW_IF(
        data.timeAxis.size() != 0 && pair.second.size() != data.timeAxis.size(),
        GaitDataException,
        "Channel " + pair.first + " of device " + deviceName
            + " does not match the length of the time axis");
  }
  mAnalogDevices[deviceName] = data;
}

//==============================================================================
TrialMetadata InMemoryMocapSource::getMetadata() const
{
  TrialMetadata metadata = mMetadata;
  metadata.forcePlateCount = mForcePlates.size();
  metadata.markerNames.clear();
  for (const auto& pair : mMarkers)
  {
    metadata.markerNames.push_back(pair.first);
  }
  return metadata;
}

//==============================================================================
std::map<std::string, Eigen::MatrixXs> InMemoryMocapSource::getMarkerData(
    const std::vector<std::string>& names, bool allowMissing) const
{
  std::map<std::string, Eigen::MatrixXs> result;
  for (const std::string& name : names)
  {
    auto it = mMarkers.find(name);
    if (it == mMarkers.end())
    {
      if (!allowMissing)
      {
        GAITKIT_THROW(MarkerNotFoundException, name);
      }
      gkwarn << "Cannot read requested marker " << name << std::endl;
      continue;
    }
    result[name] = it->second;
  }
  return result;
}

//==============================================================================
std::vector<ForcePlate> InMemoryMocapSource::getForcePlateData() const
{
  return mForcePlates;
}

//==============================================================================
AnalogData InMemoryMocapSource::getAnalogData(
    const std::string& deviceName) const
{
  const std::string wanted = toLower(deviceName);
  const AnalogData* match = nullptr;
  int numMatches = 0;
  for (const auto& pair : mAnalogDevices)
  {
    if (toLower(pair.first) == wanted)
    {
      match = &pair.second;
      numMatches++;
    }
  }
  GAITKIT_THROW_IF(
      numMatches == 0,
      GaitDataException,
      "No matching analog device found for " + deviceName);
  GAITKIT_THROW_IF(
      numMatches > 1,
      GaitDataException,
      "Multiple analog devices match " + deviceName);
  return *match;
}

} // namespace biomechanics
} // namespace gaitkit
