#include "gaitkit/biomechanics/ForcePlate.hpp"

#include <algorithm>

#include "gaitkit/common/Console.hpp"
#include "gaitkit/common/Exceptions.hpp"

namespace gaitkit {

namespace biomechanics {

//==============================================================================
ForcePlate::ForcePlate()
  : worldOrigin(Eigen::Vector3s::Zero()),
    lowerBounds(Eigen::Vector3s::Zero()),
    upperBounds(Eigen::Vector3s::Zero())
{
}

//==============================================================================
int ForcePlate::getNumSamples() const
{
  if (!totalForces.empty())
  {
    return totalForces.size();
  }
  return forces.size();
}

//==============================================================================
void ForcePlate::computeBounds()
{
  GAITKIT_THROW_IF(
      corners.empty(),
      GaitDataException,
      "Force plate " + name + " has no corners, cannot compute bounds");

  lowerBounds = corners[0];
  upperBounds = corners[0];
  for (const Eigen::Vector3s& corner : corners)
  {
    lowerBounds = lowerBounds.cwiseMin(corner);
    upperBounds = upperBounds.cwiseMax(corner);
  }
}

//==============================================================================
int ForcePlate::clipCentersOfPressureToBounds()
{
  if (rawCentersOfPressure.empty())
  {
    rawCentersOfPressure = centersOfPressure;
  }
  int numClipped = 0;
  for (Eigen::Vector3s& cop : centersOfPressure)
  {
    bool clipped = false;
    for (int axis = 0; axis < 2; axis++)
    {
      s_t value = std::max(
          lowerBounds(axis), std::min(upperBounds(axis), cop(axis)));
      if (value != cop(axis))
      {
        cop(axis) = value;
        clipped = true;
      }
    }
    if (clipped)
    {
      numClipped++;
    }
  }
  if (numClipped > 0)
  {
    gkwarn << "Force plate " << name << ": " << numClipped
           << " center of pressure samples were outside the plate and have "
              "been clipped to its bounds"
           << std::endl;
  }
  return numClipped;
}

//==============================================================================
const std::vector<Eigen::Vector3s>& ForcePlate::getRawCentersOfPressure() const
{
  return rawCentersOfPressure.empty() ? centersOfPressure
                                      : rawCentersOfPressure;
}

//==============================================================================
Eigen::VectorXs ForcePlate::getTotalForces() const
{
  if (!totalForces.empty())
  {
    return Eigen::Map<const Eigen::VectorXs>(
        totalForces.data(), totalForces.size());
  }
  Eigen::VectorXs total(forces.size());
  for (std::size_t i = 0; i < forces.size(); i++)
  {
    total(i) = forces[i].norm();
  }
  return total;
}

//==============================================================================
void ForcePlate::checkConsistency() const
{
  const std::size_t numSamples = getNumSamples();
  GAITKIT_THROW_IF(
      !forces.empty() && forces.size() != numSamples,
      GaitDataException,
      "Force plate " + name + ": force and total force lengths differ");
  GAITKIT_THROW_IF(
      !moments.empty() && moments.size() != numSamples,
      GaitDataException,
      "Force plate " + name + ": moment and force lengths differ");
  GAITKIT_THROW_IF(
      centersOfPressure.size() != numSamples,
      GaitDataException,
      "Force plate " + name + ": center of pressure and force lengths differ");
  GAITKIT_THROW_IF(
      !rawCentersOfPressure.empty()
          && rawCentersOfPressure.size() != numSamples,
      GaitDataException,
      "Force plate " + name + ": raw center of pressure and force lengths "
          "differ");
}

} // namespace biomechanics
} // namespace gaitkit
