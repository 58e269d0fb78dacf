#ifndef GAITKIT_BIOMECH_GAITMETRICS_HPP_
#define GAITKIT_BIOMECH_GAITMETRICS_HPP_

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "gaitkit/biomechanics/GaitEvent.hpp"
#include "gaitkit/biomechanics/MarkerGeometry.hpp"
#include "gaitkit/biomechanics/Trial.hpp"
#include "gaitkit/math/MathTypes.hpp"

namespace gaitkit {

namespace biomechanics {

struct StepWidthConfig
{
  std::string rightToe = "RTOE";
  std::string leftToe = "LTOE";

  const std::string& getToeMarker(Side side) const;
};

/// Mean step width of each side over a trial, in the units of the marker data
struct StepWidth
{
  // Empty if the side has no step width samples
  std::optional<s_t> left;
  std::optional<s_t> right;
  std::string unit = "mm";

  const std::optional<s_t>& get(Side side) const;
};

/// One step width sample per usable strike of each side.
///
/// For a strike that is followed by another strike on the same side, the line
/// through the toe marker positions at the two strikes is the step line. The
/// sample is the distance from that line to the contralateral toe marker at
/// the next contralateral strike. Samples stop at the last strike of the side,
/// or when no contralateral strike follows. A step line of zero length has no
/// direction and gives no sample.
std::map<Side, std::vector<s_t>> computeStepWidthSamples(
    const Trial& trial, const StepWidthConfig& config = StepWidthConfig());

/// Mean of computeStepWidthSamples() per side
StepWidth computeStepWidth(
    const Trial& trial, const StepWidthConfig& config = StepWidthConfig());

/// Foot centre speed at the detected events of each side
struct FootContactVelocities
{
  Eigen::VectorXs rightStrike;
  Eigen::VectorXs rightToeOff;
  Eigen::VectorXs leftStrike;
  Eigen::VectorXs leftToeOff;

  const Eigen::VectorXs& get(Side side, EventKind kind) const;
};

/// Speed of the foot centre (mean of the foot markers) at every strike and
/// toe-off of the trial. With `medians`, each series is reduced to its median,
/// or stays empty if there are no events.
FootContactVelocities getFootContactVelocity(
    const Trial& trial,
    bool medians = true,
    const FootMarkerNames& rightFoot = {"RHEE", "RTOE", "RANK"},
    const FootMarkerNames& leftFoot = {"LHEE", "LTOE", "LANK"});

/// Typical swing phase speed of a foot: the median of the local maxima of
/// `speed` that are below `maxPeakVelocity`, ignoring peaks lower than
/// `minSwingFraction` of the largest of them. Throws GaitDataException if no
/// acceptable peak exists.
s_t computeFootSwingVelocity(
    const Eigen::VectorXs& speed, s_t maxPeakVelocity, s_t minSwingFraction);

} // namespace biomechanics
} // namespace gaitkit

#endif
