#include "gaitkit/biomechanics/GaitMetrics.hpp"

#include <algorithm>
#include <numeric>

#include "gaitkit/common/Console.hpp"
#include "gaitkit/common/Exceptions.hpp"
#include "gaitkit/math/SignalProcessing.hpp"

namespace gaitkit {

namespace biomechanics {

//==============================================================================
const std::string& StepWidthConfig::getToeMarker(Side side) const
{
  return side == Side::Left ? leftToe : rightToe;
}

//==============================================================================
const std::optional<s_t>& StepWidth::get(Side side) const
{
  return side == Side::Left ? left : right;
}

//==============================================================================
std::map<Side, std::vector<s_t>> computeStepWidthSamples(
    const Trial& trial, const StepWidthConfig& config)
{
  std::map<Side, std::vector<s_t>> samples;
  for (Side side : {Side::Left, Side::Right})
  {
    samples[side] = std::vector<s_t>();
    std::vector<int> strikes = trial.getStrikes(side);
    if (strikes.size() < 2)
    {
      continue;
    }
    std::vector<int> contralateralStrikes
        = trial.getStrikes(oppositeSide(side));
    const Eigen::MatrixXs& toe
        = trial.getMarker(config.getToeMarker(side)).positions;
    const Eigen::MatrixXs& contralateralToe
        = trial.getMarker(config.getToeMarker(oppositeSide(side))).positions;

    for (std::size_t j = 0; j + 1 < strikes.size(); j++)
    {
      auto next = std::upper_bound(
          contralateralStrikes.begin(), contralateralStrikes.end(), strikes[j]);
      if (next == contralateralStrikes.end())
      {
        break;
      }
      Eigen::Vector3s thisPos = toe.row(strikes[j]).transpose();
      Eigen::Vector3s nextPos = toe.row(strikes[j + 1]).transpose();
      Eigen::Vector3s contralateralPos
          = contralateralToe.row(*next).transpose();

      // Distance of the contralateral toe from the step line
      Eigen::MatrixXs step = (nextPos - thisPos).transpose();
      Eigen::Vector3s stepLine = normalizeRows(step).row(0).transpose();
      if (!stepLine.allFinite())
      {
        gkdbg << sideToString(side) << " toe did not move between frames "
              << strikes[j] << " and " << strikes[j + 1]
              << ", no step width sample" << std::endl;
        continue;
      }
      Eigen::Vector3s toContralateral = contralateralPos - thisPos;
      Eigen::Vector3s projection
          = stepLine * toContralateral.dot(stepLine);
      samples[side].push_back((projection - toContralateral).norm());
    }
  }
  return samples;
}

//==============================================================================
StepWidth computeStepWidth(const Trial& trial, const StepWidthConfig& config)
{
  std::map<Side, std::vector<s_t>> samples
      = computeStepWidthSamples(trial, config);
  StepWidth result;
  for (Side side : {Side::Left, Side::Right})
  {
    const std::vector<s_t>& values = samples[side];
    if (values.empty())
    {
      continue;
    }
    s_t mean = std::accumulate(values.begin(), values.end(), 0.0)
               / values.size();
    (side == Side::Left ? result.left : result.right) = mean;
    gkdbg << sideToString(side) << " step width " << mean << " "
          << result.unit << " from " << values.size() << " steps"
          << std::endl;
  }
  return result;
}

//==============================================================================
const Eigen::VectorXs& FootContactVelocities::get(
    Side side, EventKind kind) const
{
  if (side == Side::Left)
  {
    return kind == EventKind::Strike ? leftStrike : leftToeOff;
  }
  return kind == EventKind::Strike ? rightStrike : rightToeOff;
}

//==============================================================================
FootContactVelocities getFootContactVelocity(
    const Trial& trial,
    bool medians,
    const FootMarkerNames& rightFoot,
    const FootMarkerNames& leftFoot)
{
  FootContactVelocities result;
  for (Side side : {Side::Right, Side::Left})
  {
    const FootMarkerNames& names = side == Side::Left ? leftFoot : rightFoot;
    Eigen::MatrixXs velocities = averageMarkers(
        trial.getMarkers(), names.all(), MarkerQuantity::Velocity);
    Eigen::VectorXs speed = velocities.rowwise().norm();

    for (EventKind kind : {EventKind::Strike, EventKind::ToeOff})
    {
      std::vector<int> frames = kind == EventKind::Strike
                                    ? trial.getStrikes(side)
                                    : trial.getToeOffs(side);
      std::vector<s_t> values;
      for (int frame : frames)
      {
        values.push_back(speed(frame));
      }
      if (medians && !values.empty())
      {
        values = {math::nanMedian(values)};
      }
      Eigen::VectorXs series = Eigen::Map<Eigen::VectorXs>(
          values.data(), values.size());
      if (side == Side::Left)
      {
        (kind == EventKind::Strike ? result.leftStrike : result.leftToeOff)
            = series;
      }
      else
      {
        (kind == EventKind::Strike ? result.rightStrike : result.rightToeOff)
            = series;
      }
    }
  }
  return result;
}

//==============================================================================
s_t computeFootSwingVelocity(
    const Eigen::VectorXs& speed, s_t maxPeakVelocity, s_t minSwingFraction)
{
  // Maxima of the speed: the derivative falls through zero
  std::vector<int> peaks = math::fallingZeroCross(math::gradient(speed));
  std::vector<s_t> peakSpeeds;
  for (int peak : peaks)
  {
    if (speed(peak) < maxPeakVelocity)
    {
      peakSpeeds.push_back(speed(peak));
    }
  }
  GAITKIT_THROW_IF(
      peakSpeeds.empty(),
      GaitDataException,
      "Cannot find acceptable velocity peaks");

  // Drop spurious peaks where the swing speed is never reached
  const s_t highest = *std::max_element(peakSpeeds.begin(), peakSpeeds.end());
  std::vector<s_t> swingSpeeds;
  for (s_t value : peakSpeeds)
  {
    if (!(value < highest * minSwingFraction))
    {
      swingSpeeds.push_back(value);
    }
  }
  return math::nanMedian(swingSpeeds);
}

} // namespace biomechanics
} // namespace gaitkit
