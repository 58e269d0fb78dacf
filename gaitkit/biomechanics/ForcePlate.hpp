#ifndef GAITKIT_BIOMECH_FORCE_PLATE_HPP_
#define GAITKIT_BIOMECH_FORCE_PLATE_HPP_

#include <string>
#include <vector>

#include <Eigen/Dense>

#include "gaitkit/math/MathTypes.hpp"

namespace gaitkit {

namespace biomechanics {

/// One physical force plate, sampled at the analog rate. All vectors are
/// expressed in the lab (world) frame.
struct ForcePlate
{
  EIGEN_MAKE_ALIGNED_OPERATOR_NEW

  std::string name;
  Eigen::Vector3s worldOrigin;
  std::vector<Eigen::Vector3s> corners;
  // Component-wise min and max of the corners, see computeBounds()
  Eigen::Vector3s lowerBounds;
  Eigen::Vector3s upperBounds;
  std::vector<Eigen::Vector3s> centersOfPressure;
  // CoP as recorded, before clipping. Empty until the CoP has been clipped.
  std::vector<Eigen::Vector3s> rawCentersOfPressure;
  std::vector<Eigen::Vector3s> moments;
  std::vector<Eigen::Vector3s> forces;
  // Optional. If empty, the norm of `forces` is used as the total force.
  std::vector<s_t> totalForces;

  ForcePlate();
  ForcePlate(const ForcePlate&) = default;
  ForcePlate(ForcePlate&&) = default;
  ForcePlate& operator=(const ForcePlate&) = default;
  ForcePlate& operator=(ForcePlate&&) = default;

  int getNumSamples() const;

  /// Sets lowerBounds and upperBounds from the corners. Throws
  /// GaitDataException if there are no corners.
  void computeBounds();

  /// Moves CoP samples that fall outside the plate back onto its edge, on the
  /// two horizontal axes. The unclipped series is kept in
  /// rawCentersOfPressure. Returns the number of samples that were clipped.
  int clipCentersOfPressureToBounds();

  /// The CoP as recorded: rawCentersOfPressure if the CoP was clipped,
  /// centersOfPressure otherwise
  const std::vector<Eigen::Vector3s>& getRawCentersOfPressure() const;

  /// Total force magnitude at every analog sample
  Eigen::VectorXs getTotalForces() const;

  /// Throws GaitDataException unless the per-sample series have matching
  /// lengths
  void checkConsistency() const;
};

} // namespace biomechanics
} // namespace gaitkit

#endif
