#include "gaitkit/biomechanics/Trial.hpp"

#include <algorithm>

#include "gaitkit/common/Console.hpp"
#include "gaitkit/common/Exceptions.hpp"

namespace gaitkit {

namespace biomechanics {

//==============================================================================
Trial::Trial(
    const TrialMetadata& metadata,
    const MarkerSet& markers,
    const std::vector<ForcePlate>& forcePlates)
  : mMetadata(metadata), mMarkers(markers), mForcePlates(forcePlates)
{
  mMetadata.computeSamplesPerFrame();
  mMetadata.forcePlateCount = mForcePlates.size();
  mMetadata.markerNames.clear();
  for (const auto& pair : mMarkers)
  {
    GAITKIT_THROW_IF(
        pair.second.getNumFrames() != mMetadata.frameCount,
        GaitDataException,
        "Marker " + pair.first + " has "
            + std::to_string(pair.second.getNumFrames()) + " frames, expected "
            + std::to_string(mMetadata.frameCount));
    mMetadata.markerNames.push_back(pair.first);
  }
  for (ForcePlate& plate : mForcePlates)
  {
    plate.checkConsistency();
    if (!plate.corners.empty())
    {
      plate.computeBounds();
      plate.clipCentersOfPressureToBounds();
    }
  }
}

//==============================================================================
Trial Trial::fromSource(
    const MocapSource& source,
    const std::vector<std::string>& markerNames,
    bool allowMissing)
{
  TrialMetadata metadata = source.getMetadata();
  metadata.computeSamplesPerFrame();

  MarkerSet markers;
  for (const auto& pair : source.getMarkerData(markerNames, allowMissing))
  {
    markers[pair.first]
        = MarkerTrajectory(pair.first, pair.second, metadata.frameRate);
  }

  gkdbg << "Read trial " << metadata.trialName << ": " << metadata.frameCount
        << " frames at " << metadata.frameRate << " Hz, " << markers.size()
        << " markers" << std::endl;

  return Trial(metadata, markers, source.getForcePlateData());
}

//==============================================================================
const TrialMetadata& Trial::getMetadata() const
{
  return mMetadata;
}

//==============================================================================
s_t Trial::getFrameRate() const
{
  return mMetadata.frameRate;
}

//==============================================================================
s_t Trial::getAnalogRate() const
{
  return mMetadata.analogRate;
}

//==============================================================================
int Trial::getNumFrames() const
{
  return mMetadata.frameCount;
}

//==============================================================================
int Trial::getSamplesPerFrame() const
{
  return mMetadata.samplesPerFrame;
}

//==============================================================================
const std::optional<s_t>& Trial::getBodyMass() const
{
  return mMetadata.bodyMass;
}

//==============================================================================
const MarkerSet& Trial::getMarkers() const
{
  return mMarkers;
}

//==============================================================================
bool Trial::hasMarker(const std::string& name) const
{
  return mMarkers.count(name) > 0;
}

//==============================================================================
const MarkerTrajectory& Trial::getMarker(const std::string& name) const
{
  auto it = mMarkers.find(name);
  if (it == mMarkers.end())
  {
    GAITKIT_THROW(MarkerNotFoundException, name);
  }
  return it->second;
}

//==============================================================================
const std::vector<ForcePlate>& Trial::getForcePlates() const
{
  return mForcePlates;
}

//==============================================================================
void Trial::setEvents(
    const std::vector<GaitEvent>& events, const std::set<Side>& validSides)
{
  for (const GaitEvent& event : events)
  {
    GAITKIT_THROW_IF(
        event.frame < 0 || event.frame >= mMetadata.frameCount,
        GaitDataException,
        "Event frame " + std::to_string(event.frame) + " is outside the trial");
  }
  mEvents = events;
  std::sort(mEvents.begin(), mEvents.end());
  mValidSides = validSides;
}

//==============================================================================
const std::vector<GaitEvent>& Trial::getEvents() const
{
  return mEvents;
}

//==============================================================================
std::vector<int> Trial::getStrikes(Side side) const
{
  return selectFrames(mEvents, side, EventKind::Strike);
}

//==============================================================================
std::vector<int> Trial::getToeOffs(Side side) const
{
  return selectFrames(mEvents, side, EventKind::ToeOff);
}

//==============================================================================
const std::set<Side>& Trial::getValidSides() const
{
  return mValidSides;
}

} // namespace biomechanics
} // namespace gaitkit
