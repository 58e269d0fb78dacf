#ifndef GAITKIT_BIOMECH_FORCEPLATEEVENTDETECTOR_HPP_
#define GAITKIT_BIOMECH_FORCEPLATEEVENTDETECTOR_HPP_

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "gaitkit/biomechanics/GaitEvent.hpp"
#include "gaitkit/biomechanics/MarkerGeometry.hpp"
#include "gaitkit/biomechanics/Trial.hpp"
#include "gaitkit/math/MathTypes.hpp"

namespace gaitkit {

namespace biomechanics {

/// Thresholds and marker names used to detect contacts on the force plates.
/// Lengths are in the units of the marker data (mm).
struct ForcePlateDetectionConfig
{
  // Contact threshold, as a fraction of body weight
  s_t relContactFraction = 0.2;
  // A plate whose peak force is below this fraction of body weight is not a
  // full contact
  s_t minWeightFraction = 0.9;
  // Max peak-to-peak CoP shift along the walking direction during contact
  s_t copShiftMax = 300.0;
  // Time after the strike before the foot position is checked
  s_t settleMs = 50.0;
  // Distance from the toe marker to the end of the foot, relative to the
  // heel-ankle distance
  s_t footRelativeLength = 0.75;
  s_t markerDiameter = 14.0;
  s_t gravity = math::GRAVITY;
  int medianKernel = 3;
  FootMarkerNames rightFoot = {"RHEE", "RTOE", "RANK"};
  FootMarkerNames leftFoot = {"LHEE", "LTOE", "LANK"};
  // Axis of walking. Detected from the foot markers if not set.
  std::optional<int> walkingDirection;
  // Evaluate plates concurrently. Results are identical to serial evaluation.
  bool multithreaded = false;

  const FootMarkerNames& getFootMarkers(Side side) const;

  /// Throws std::invalid_argument on nonsensical values
  void validate() const;
};

/// How the side of the foot on a plate is decided. Either the detector works
/// it out (Auto), or it is known in advance (Known), or the plate must be
/// ignored (Invalid).
class SideAssignment
{
public:
  enum class Kind
  {
    Auto,
    Known,
    Invalid
  };

  static SideAssignment automatic();

  static SideAssignment known(Side side);

  static SideAssignment invalid();

  /// Parses the vendor style values "Left", "Right", "Invalid" and "Auto".
  /// Throws GaitDataException on anything else.
  static SideAssignment fromString(const std::string& value);

  Kind getKind() const;

  /// Throws std::logic_error unless the kind is Known
  Side getSide() const;

  bool operator==(const SideAssignment& other) const;

private:
  SideAssignment(Kind kind, Side side);

  Kind mKind;
  Side mSide;
};

/// Side assignments by 0-based plate index. Plates without an entry are
/// detected automatically.
typedef std::map<int, SideAssignment> PlateAssignments;

/// Converts {"FP1": "Left", "FP2": "Invalid", ...} (plate numbers start from
/// 1) to assignments by 0-based plate index. Throws GaitDataException on a
/// malformed key or value.
PlateAssignments parsePlateAssignments(
    const std::map<std::string, std::string>& plateInfo);

enum class PlateOutcome
{
  Unanalyzed,
  // Plate assigned Invalid
  Skipped,
  // No threshold crossing in the force signal
  ForceRejected,
  // Peak force too low for a full body weight contact
  WeightRejected,
  // CoP moves too much, probably a double contact
  CoPRejected,
  // Neither foot is on the plate
  GeometryRejected,
  Accepted
};

std::string plateOutcomeToString(PlateOutcome outcome);

/// What happened on one plate
struct PlateAnalysis
{
  int plateIndex = -1;
  PlateOutcome outcome = PlateOutcome::Unanalyzed;
  bool autodetected = true;
  // Set if accepted
  std::optional<Side> side;
  // Frames, -1 if the force signal did not cross the threshold
  int strikeFrame = -1;
  int toeOffFrame = -1;
  // Analog sample indices of the threshold crossings
  int riseIndex = -1;
  int fallIndex = -1;
  s_t fmax = 0;
  s_t threshold = 0;
  // Peak-to-peak CoP shift, NaN if not checked
  s_t copShift;

  PlateAnalysis();
};

struct ForcePlateEvents
{
  /// Accepted strikes and toe-offs, sorted
  std::vector<GaitEvent> events;
  /// Sides with at least one accepted contact
  std::set<Side> validSides;
  /// One entry per plate, in plate order
  std::vector<PlateAnalysis> plates;

  std::vector<int> getStrikes(Side side) const;

  std::vector<int> getToeOffs(Side side) const;

  int getNumAccepted() const;
};

/// Finds valid foot strikes and toe-offs on the force plates of a trial.
///
/// Every plate is analyzed on its own. The total force is denoised with a
/// median filter and its resting level removed. The contact starts at the
/// first rise above the threshold and ends at the last fall below it. For an
/// automatically detected plate the contact must also carry nearly the full
/// body weight, the CoP must not travel too far along the walking direction,
/// and exactly one foot must be fully inside the plate shortly after the
/// strike.
class ForcePlateEventDetector
{
public:
  explicit ForcePlateEventDetector(
      const ForcePlateDetectionConfig& config = ForcePlateDetectionConfig());

  const ForcePlateDetectionConfig& getConfig() const;

  /// Analyzes every plate of the trial. Rejected plates yield no events.
  /// Throws AmbiguousContactException if both feet are on one plate, and
  /// MarkerNotFoundException if a plate needs the foot markers and they are
  /// missing.
  ForcePlateEvents detect(
      const Trial& trial,
      const PlateAssignments& assignments = PlateAssignments()) const;

  /// Walking axis: the configured one, or the axis of largest variance of
  /// the foot markers
  int getWalkingDirection(const Trial& trial) const;

  /// Foot footprints of both sides for every frame
  std::map<Side, FootFootprint> estimateFootprints(const Trial& trial) const;

  /// Analyzes one plate. `walkingDirection` and `footprints` are only used
  /// when the side is detected automatically.
  PlateAnalysis analyzePlate(
      const Trial& trial,
      int plateIndex,
      const SideAssignment& assignment,
      int walkingDirection,
      const std::map<Side, FootFootprint>& footprints) const;

  /// True if the footprint at this frame lies strictly inside the plate on
  /// both horizontal axes
  static bool isFootOnPlate(
      const FootFootprint& footprint,
      int frame,
      const Eigen::Vector3s& lowerBounds,
      const Eigen::Vector3s& upperBounds);

protected:
  ForcePlateDetectionConfig mConfig;
};

/// Runs the detector and stores the events in the trial, replacing any
/// previous ones
ForcePlateEvents detectForcePlateEvents(
    Trial& trial,
    const ForcePlateDetectionConfig& config = ForcePlateDetectionConfig(),
    const PlateAssignments& assignments = PlateAssignments());

} // namespace biomechanics
} // namespace gaitkit

#endif
