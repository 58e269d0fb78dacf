#ifndef GAITKIT_BIOMECH_TRIAL_HPP_
#define GAITKIT_BIOMECH_TRIAL_HPP_

#include <optional>
#include <set>
#include <string>
#include <vector>

#include "gaitkit/biomechanics/ForcePlate.hpp"
#include "gaitkit/biomechanics/GaitEvent.hpp"
#include "gaitkit/biomechanics/MarkerGeometry.hpp"
#include "gaitkit/biomechanics/MocapSource.hpp"
#include "gaitkit/math/MathTypes.hpp"

namespace gaitkit {

namespace biomechanics {

/// One recorded walking trial: metadata, marker trajectories and force plates.
/// The recorded data does not change after construction. Only the detected
/// gait events are written, and they are always replaced as a whole.
class Trial
{
public:
  /// Throws GaitDataException if a marker does not have frameCount frames, or
  /// a force plate is internally inconsistent. Plate bounds are computed from
  /// the corners, and CoP samples outside the bounds are clipped.
  Trial(
      const TrialMetadata& metadata,
      const MarkerSet& markers,
      const std::vector<ForcePlate>& forcePlates);

  /// Reads the metadata, the named markers and all force plates from the
  /// source. Marker velocities are computed from the positions.
  static Trial fromSource(
      const MocapSource& source,
      const std::vector<std::string>& markerNames,
      bool allowMissing = false);

  const TrialMetadata& getMetadata() const;

  s_t getFrameRate() const;

  s_t getAnalogRate() const;

  int getNumFrames() const;

  int getSamplesPerFrame() const;

  const std::optional<s_t>& getBodyMass() const;

  const MarkerSet& getMarkers() const;

  bool hasMarker(const std::string& name) const;

  /// Throws MarkerNotFoundException if the trial has no such marker
  const MarkerTrajectory& getMarker(const std::string& name) const;

  const std::vector<ForcePlate>& getForcePlates() const;

  /// Replaces all previously detected events
  void setEvents(
      const std::vector<GaitEvent>& events, const std::set<Side>& validSides);

  const std::vector<GaitEvent>& getEvents() const;

  /// Ascending strike frames of one side
  std::vector<int> getStrikes(Side side) const;

  /// Ascending toe-off frames of one side
  std::vector<int> getToeOffs(Side side) const;

  /// Sides with at least one valid force plate contact
  const std::set<Side>& getValidSides() const;

protected:
  TrialMetadata mMetadata;
  MarkerSet mMarkers;
  std::vector<ForcePlate> mForcePlates;

  std::vector<GaitEvent> mEvents;
  std::set<Side> mValidSides;
};

} // namespace biomechanics
} // namespace gaitkit

#endif
