#include "gaitkit/biomechanics/ForcePlateEventDetector.hpp"

#include <algorithm>
#include <future>
#include <limits>
#include <regex>

#include "gaitkit/common/Console.hpp"
#include "gaitkit/common/Exceptions.hpp"
#include "gaitkit/math/SignalProcessing.hpp"

namespace gaitkit {

namespace biomechanics {

namespace {

const char* axisName(int axis)
{
  static const char* names[] = {"x", "y", "z"};
  return names[axis];
}

} // namespace

//==============================================================================
const FootMarkerNames& ForcePlateDetectionConfig::getFootMarkers(
    Side side) const
{
  return side == Side::Left ? leftFoot : rightFoot;
}

//==============================================================================
void ForcePlateDetectionConfig::validate() const
{
  GAITKIT_THROW_IF(
      !(relContactFraction > 0),
      std::invalid_argument,
      "relContactFraction must be positive");
  GAITKIT_THROW_IF(
      !(minWeightFraction >= 0),
      std::invalid_argument,
      "minWeightFraction must not be negative");
  GAITKIT_THROW_IF(
      !(copShiftMax >= 0),
      std::invalid_argument,
      "copShiftMax must not be negative");
  GAITKIT_THROW_IF(
      !(settleMs >= 0), std::invalid_argument, "settleMs must not be negative");
  GAITKIT_THROW_IF(
      !(gravity > 0), std::invalid_argument, "gravity must be positive");
  GAITKIT_THROW_IF(
      medianKernel < 1 || medianKernel % 2 == 0,
      std::invalid_argument,
      "medianKernel must be a positive odd number");
  GAITKIT_THROW_IF(
      walkingDirection && (*walkingDirection < 0 || *walkingDirection > 2),
      std::invalid_argument,
      "walkingDirection must be 0, 1 or 2");
}

//==============================================================================
SideAssignment::SideAssignment(Kind kind, Side side) : mKind(kind), mSide(side)
{
}

//==============================================================================
SideAssignment SideAssignment::automatic()
{
  return SideAssignment(Kind::Auto, Side::Right);
}

//==============================================================================
SideAssignment SideAssignment::known(Side side)
{
  return SideAssignment(Kind::Known, side);
}

//==============================================================================
SideAssignment SideAssignment::invalid()
{
  return SideAssignment(Kind::Invalid, Side::Right);
}

//==============================================================================
SideAssignment SideAssignment::fromString(const std::string& value)
{
  if (value == "Left")
  {
    return known(Side::Left);
  }
  if (value == "Right")
  {
    return known(Side::Right);
  }
  if (value == "Invalid")
  {
    return invalid();
  }
  if (value == "Auto")
  {
    return automatic();
  }
  GAITKIT_THROW(
      GaitDataException, "Unexpected force plate side assignment: " + value);
}

//==============================================================================
SideAssignment::Kind SideAssignment::getKind() const
{
  return mKind;
}

//==============================================================================
Side SideAssignment::getSide() const
{
  GAITKIT_THROW_IF(
      mKind != Kind::Known,
      std::logic_error,
      "Only a known side assignment has a side");
  return mSide;
}

//==============================================================================
bool SideAssignment::operator==(const SideAssignment& other) const
{
  if (mKind != other.mKind)
  {
    return false;
  }
  return mKind != Kind::Known || mSide == other.mSide;
}

//==============================================================================
PlateAssignments parsePlateAssignments(
    const std::map<std::string, std::string>& plateInfo)
{
  static const std::regex plateKey("FP([0-9]+)");
  PlateAssignments assignments;
  for (const auto& pair : plateInfo)
  {
    std::smatch match;
    GAITKIT_THROW_IF(
        !std::regex_match(pair.first, match, plateKey),
        GaitDataException,
        "Unexpected force plate name: " + pair.first);
    int plateNumber = std::stoi(match[1].str());
    GAITKIT_THROW_IF(
        plateNumber < 1,
        GaitDataException,
        "Force plate numbers start from 1: " + pair.first);
    assignments.emplace(
        plateNumber - 1, SideAssignment::fromString(pair.second));
  }
  return assignments;
}

//==============================================================================
std::string plateOutcomeToString(PlateOutcome outcome)
{
  switch (outcome)
  {
    case PlateOutcome::Unanalyzed:
      return "Unanalyzed";
    case PlateOutcome::Skipped:
      return "Skipped";
    case PlateOutcome::ForceRejected:
      return "ForceRejected";
    case PlateOutcome::WeightRejected:
      return "WeightRejected";
    case PlateOutcome::CoPRejected:
      return "CoPRejected";
    case PlateOutcome::GeometryRejected:
      return "GeometryRejected";
    case PlateOutcome::Accepted:
      return "Accepted";
  }
  return "Unknown";
}

//==============================================================================
PlateAnalysis::PlateAnalysis()
  : copShift(std::numeric_limits<s_t>::quiet_NaN())
{
}

//==============================================================================
std::vector<int> ForcePlateEvents::getStrikes(Side side) const
{
  return selectFrames(events, side, EventKind::Strike);
}

//==============================================================================
std::vector<int> ForcePlateEvents::getToeOffs(Side side) const
{
  return selectFrames(events, side, EventKind::ToeOff);
}

//==============================================================================
int ForcePlateEvents::getNumAccepted() const
{
  return std::count_if(
      plates.begin(), plates.end(), [](const PlateAnalysis& plate) {
        return plate.outcome == PlateOutcome::Accepted;
      });
}

//==============================================================================
ForcePlateEventDetector::ForcePlateEventDetector(
    const ForcePlateDetectionConfig& config)
  : mConfig(config)
{
  mConfig.validate();
}

//==============================================================================
const ForcePlateDetectionConfig& ForcePlateEventDetector::getConfig() const
{
  return mConfig;
}

//==============================================================================
int ForcePlateEventDetector::getWalkingDirection(const Trial& trial) const
{
  if (mConfig.walkingDirection)
  {
    return *mConfig.walkingDirection;
  }
  std::vector<std::string> names = mConfig.rightFoot.all();
  std::vector<std::string> left = mConfig.leftFoot.all();
  names.insert(names.end(), left.begin(), left.end());

  int direction = principalDirection(averageMarkers(trial.getMarkers(), names));
  gkdbg << "gait forward direction seems to be " << axisName(direction)
        << std::endl;
  return direction;
}

//==============================================================================
std::map<Side, FootFootprint> ForcePlateEventDetector::estimateFootprints(
    const Trial& trial) const
{
  std::map<Side, FootFootprint> footprints;
  for (Side side : {Side::Right, Side::Left})
  {
    const FootMarkerNames& names = mConfig.getFootMarkers(side);
    footprints[side] = estimateFootFootprint(
        trial.getMarker(names.heel).positions,
        trial.getMarker(names.toe).positions,
        trial.getMarker(names.ankle).positions,
        mConfig.footRelativeLength,
        mConfig.markerDiameter);
  }
  return footprints;
}

//==============================================================================
bool ForcePlateEventDetector::isFootOnPlate(
    const FootFootprint& footprint,
    int frame,
    const Eigen::Vector3s& lowerBounds,
    const Eigen::Vector3s& upperBounds)
{
  if (frame < 0 || frame >= footprint.minCorner.rows())
  {
    return false;
  }
  for (int axis = 0; axis < 2; axis++)
  {
    for (const Eigen::MatrixXs* corner :
         {&footprint.minCorner, &footprint.maxCorner})
    {
      s_t value = (*corner)(frame, axis);
      // NaN fails both comparisons
      if (!(lowerBounds(axis) < value && value < upperBounds(axis)))
      {
        return false;
      }
    }
  }
  return true;
}

//==============================================================================
PlateAnalysis ForcePlateEventDetector::analyzePlate(
    const Trial& trial,
    int plateIndex,
    const SideAssignment& assignment,
    int walkingDirection,
    const std::map<Side, FootFootprint>& footprints) const
{
  const ForcePlate& plate = trial.getForcePlates().at(plateIndex);
  PlateAnalysis result;
  result.plateIndex = plateIndex;

  if (assignment.getKind() == SideAssignment::Kind::Invalid)
  {
    gkdbg << "plate " << plateIndex << " is marked invalid, skipping"
          << std::endl;
    result.outcome = PlateOutcome::Skipped;
    result.autodetected = false;
    return result;
  }
  const bool detect = assignment.getKind() == SideAssignment::Kind::Auto;
  result.autodetected = detect;

  Eigen::VectorXs force = math::baseline(
      math::medianFilter(plate.getTotalForces(), mConfig.medianKernel));
  if (force.size() == 0)
  {
    gkdbg << "plate " << plateIndex << " has no force data" << std::endl;
    result.outcome = PlateOutcome::ForceRejected;
    return result;
  }
  int fmaxIndex = 0;
  result.fmax = force.maxCoeff(&fmaxIndex);
  gkdbg << "plate " << plateIndex << ": max force " << result.fmax
        << " N at sample " << fmaxIndex << std::endl;

  const std::optional<s_t>& bodyMass = trial.getBodyMass();
  if (!bodyMass)
  {
    result.threshold = mConfig.relContactFraction * result.fmax;
    gkwarn << "body mass unknown, thresholding force at " << result.threshold
           << " N" << std::endl;
  }
  else
  {
    const s_t bodyWeight = *bodyMass * mConfig.gravity;
    result.threshold = mConfig.relContactFraction * bodyWeight;
    if (detect && result.fmax < mConfig.minWeightFraction * bodyWeight)
    {
      gkdbg << "plate " << plateIndex << ": insufficient max. force"
            << std::endl;
      result.outcome = PlateOutcome::WeightRejected;
      return result;
    }
  }

  Eigen::VectorXs aboveThreshold
      = force - Eigen::VectorXs::Constant(force.size(), result.threshold);
  std::vector<int> rises = math::risingZeroCross(aboveThreshold);
  std::vector<int> falls = math::fallingZeroCross(aboveThreshold);
  if (rises.empty() || falls.empty())
  {
    gkdbg << "plate " << plateIndex << ": cannot detect force rise/fall"
          << std::endl;
    result.outcome = PlateOutcome::ForceRejected;
    return result;
  }
  result.riseIndex = rises.front();
  result.fallIndex = falls.back();

  const int samplesPerFrame = trial.getSamplesPerFrame();
  const int lastFrame = trial.getNumFrames() - 1;
  auto toFrame = [&](int analogIndex) {
    int frame = static_cast<int>(
        std::round(static_cast<s_t>(analogIndex) / samplesPerFrame));
    return std::max(0, std::min(lastFrame, frame));
  };
  result.strikeFrame = toFrame(result.riseIndex);
  result.toeOffFrame = toFrame(result.fallIndex);
  gkdbg << "plate " << plateIndex << ": threshold " << result.threshold
        << " N, strike @ frame " << result.strikeFrame << ", toeoff @ "
        << result.toeOffFrame << std::endl;
  if (result.strikeFrame >= result.toeOffFrame)
  {
    gkdbg << "plate " << plateIndex << ": no usable contact" << std::endl;
    result.outcome = PlateOutcome::ForceRejected;
    return result;
  }

  if (!detect)
  {
    result.side = assignment.getSide();
    result.outcome = PlateOutcome::Accepted;
    return result;
  }

  // Check the shift of the CoP in the walking direction during contact. The
  // unclipped CoP is used, a double contact can move it off the plate.
  const std::vector<Eigen::Vector3s>& cop = plate.getRawCentersOfPressure();
  const int copEnd = std::min<int>(result.fallIndex, cop.size());
  if (copEnd <= result.riseIndex)
  {
    gkdbg << "plate " << plateIndex << ": no CoP for the contact" << std::endl;
    result.outcome = PlateOutcome::CoPRejected;
    return result;
  }
  s_t copMin = std::numeric_limits<s_t>::infinity();
  s_t copMax = -std::numeric_limits<s_t>::infinity();
  for (int i = result.riseIndex; i < copEnd; i++)
  {
    s_t value = cop[i](walkingDirection);
    copMin = std::min(copMin, value);
    copMax = std::max(copMax, value);
  }
  result.copShift = copMax - copMin;
  gkdbg << "plate " << plateIndex << ": CoP total shift " << result.copShift
        << " mm" << std::endl;
  if (!(result.copShift <= mConfig.copShiftMax))
  {
    gkdbg << "plate " << plateIndex
          << ": center of pressure shifts too much (double contact?)"
          << std::endl;
    result.outcome = PlateOutcome::CoPRejected;
    return result;
  }

  // Let the foot settle after the strike, then check which foot is on the
  // plate
  const int settleFrames
      = static_cast<int>(mConfig.settleMs / 1000.0 * trial.getFrameRate());
  const int settledFrame
      = std::min(lastFrame, result.strikeFrame + settleFrames);
  gkdbg << "plate " << plateIndex << " edges x: " << plate.lowerBounds(0)
        << " to " << plate.upperBounds(0) << " y: " << plate.lowerBounds(1)
        << " to " << plate.upperBounds(1) << std::endl;
  for (Side side : {Side::Right, Side::Left})
  {
    if (!isFootOnPlate(
            footprints.at(side),
            settledFrame,
            plate.lowerBounds,
            plate.upperBounds))
    {
      gkdbg << "plate " << plateIndex << ": " << sideToString(side)
            << " foot off plate" << std::endl;
      continue;
    }
    if (result.side)
    {
      GAITKIT_THROW(AmbiguousContactException, plateIndex);
    }
    gkdbg << "plate " << plateIndex << ": on-plate check ok for "
          << sideToString(side) << std::endl;
    result.side = side;
  }

  result.outcome
      = result.side ? PlateOutcome::Accepted : PlateOutcome::GeometryRejected;
  return result;
}

//==============================================================================
ForcePlateEvents ForcePlateEventDetector::detect(
    const Trial& trial, const PlateAssignments& assignments) const
{
  const int numPlates = trial.getForcePlates().size();
  std::vector<SideAssignment> plateAssignments(
      numPlates, SideAssignment::automatic());
  bool needsGeometry = false;
  for (int i = 0; i < numPlates; i++)
  {
    auto it = assignments.find(i);
    if (it != assignments.end())
    {
      plateAssignments[i] = it->second;
    }
    if (plateAssignments[i].getKind() == SideAssignment::Kind::Auto)
    {
      needsGeometry = true;
    }
  }

  int walkingDirection = 0;
  std::map<Side, FootFootprint> footprints;
  if (needsGeometry)
  {
    walkingDirection = getWalkingDirection(trial);
    footprints = estimateFootprints(trial);
  }

  ForcePlateEvents result;
  if (mConfig.multithreaded)
  {
    std::vector<std::future<PlateAnalysis>> futures;
    for (int i = 0; i < numPlates; i++)
    {
      futures.push_back(std::async(std::launch::async, [&, i]() {
        return analyzePlate(
            trial, i, plateAssignments[i], walkingDirection, footprints);
      }));
    }
    // get() rethrows exceptions from the workers, in plate order
    for (std::future<PlateAnalysis>& future : futures)
    {
      result.plates.push_back(future.get());
    }
  }
  else
  {
    for (int i = 0; i < numPlates; i++)
    {
      result.plates.push_back(analyzePlate(
          trial, i, plateAssignments[i], walkingDirection, footprints));
    }
  }

  for (const PlateAnalysis& plate : result.plates)
  {
    if (plate.outcome != PlateOutcome::Accepted)
    {
      continue;
    }
    result.events.push_back(
        GaitEvent{*plate.side, EventKind::Strike, plate.strikeFrame});
    result.events.push_back(
        GaitEvent{*plate.side, EventKind::ToeOff, plate.toeOffFrame});
    result.validSides.insert(*plate.side);
  }
  std::sort(result.events.begin(), result.events.end());
  return result;
}

//==============================================================================
ForcePlateEvents detectForcePlateEvents(
    Trial& trial,
    const ForcePlateDetectionConfig& config,
    const PlateAssignments& assignments)
{
  ForcePlateEventDetector detector(config);
  ForcePlateEvents result = detector.detect(trial, assignments);
  trial.setEvents(result.events, result.validSides);
  return result;
}

} // namespace biomechanics
} // namespace gaitkit
