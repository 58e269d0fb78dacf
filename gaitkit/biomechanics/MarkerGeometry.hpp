#ifndef GAITKIT_BIOMECH_MARKERGEOMETRY_HPP_
#define GAITKIT_BIOMECH_MARKERGEOMETRY_HPP_

#include <map>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "gaitkit/math/MathTypes.hpp"

namespace gaitkit {

namespace biomechanics {

/// A named 3D marker trajectory, one row per frame. Frames where the marker
/// was not seen are stored as all zero rows and reported as invalid.
struct MarkerTrajectory
{
  std::string name;
  // frames x 3, same units as the source data (usually mm)
  Eigen::MatrixXs positions;
  // frames x 3, units per second
  Eigen::MatrixXs velocities;

  MarkerTrajectory() = default;

  /// Velocities are derived from the positions with central differences
  MarkerTrajectory(
      const std::string& name,
      const Eigen::MatrixXs& positions,
      s_t frameRate);

  int getNumFrames() const;

  /// False if the marker position is the zero sentinel (or not finite) at
  /// this frame
  bool isValidAt(int frame) const;
};

typedef std::map<std::string, MarkerTrajectory> MarkerSet;

enum class MarkerQuantity
{
  Position,
  Velocity
};

/// Heel, toe and ankle marker names for one foot
struct FootMarkerNames
{
  std::string heel;
  std::string toe;
  std::string ankle;

  std::vector<std::string> all() const;
};

/// Per frame bounding box of the estimated foot footprint. Both matrices are
/// frames x 3. Rows are NaN where the footprint is undefined.
struct FootFootprint
{
  Eigen::MatrixXs minCorner;
  Eigen::MatrixXs maxCorner;
};

/// Elementwise mean of the positions (or velocities) of the named markers.
/// Throws MarkerNotFoundException if any name is absent.
Eigen::MatrixXs averageMarkers(
    const MarkerSet& markers,
    const std::vector<std::string>& names,
    MarkerQuantity quantity = MarkerQuantity::Position);

/// Normalizes each row to unit length.
///
/// Rows with zero norm become all NaN. NaN means "undefined direction": any
/// caller comparing directions has to check for it first, since every
/// comparison against NaN is false.
Eigen::MatrixXs normalizeRows(const Eigen::MatrixXs& vectors);

/// Axis (0, 1 or 2) along which the positions vary the most. Used to find the
/// walking direction without a calibrated lab frame. Rows that are all zero or
/// contain NaN are ignored.
int principalDirection(const Eigen::MatrixXs& positions);

/// Central difference velocities of a frames x 3 position series
Eigen::MatrixXs computeVelocities(
    const Eigen::MatrixXs& positions, s_t frameRate);

/// Estimates the 2D footprint of the foot at every frame.
///
/// The foot is modelled as a triangle. Its front edge lies beyond the toe
/// marker by `relativeLength` times the (median) heel-ankle distance along the
/// heel->toe direction, and is as wide as twice the perpendicular offset of
/// the ankle from the heel-toe line. The back corner is the heel marker moved
/// forward by half the marker diameter, since the marker sits on the back of
/// the shoe. The result is the bounding box of the three corners.
FootFootprint estimateFootFootprint(
    const Eigen::MatrixXs& heel,
    const Eigen::MatrixXs& toe,
    const Eigen::MatrixXs& ankle,
    s_t relativeLength,
    s_t markerDiameter);

/// Frames where coordinate `dim` of the marker crosses `p0`. A crossing only
/// counts if the data is valid (non-zero) 10 frames before and after it and
/// the coordinate has changed side of `p0` between those frames.
std::vector<int> getCrossingFrames(
    const Eigen::MatrixXs& positions, int dim = 1, s_t p0 = 0);

/// Returns true if the names include the Plug-in Gait lower body markers, plus
/// either RPSI/LPSI or SACR
bool isPlugInGaitSet(const std::vector<std::string>& markerNames);

/// Sanity checks a Plug-in Gait marker set. Returns false (and warns) if the
/// heel and toe markers of either foot look swapped, judged by the angle
/// between the heel->toe line and the pelvis orientation. Throws
/// GaitDataException if the set is not a Plug-in Gait set.
bool checkPlugInGaitSet(const MarkerSet& markers);

} // namespace biomechanics
} // namespace gaitkit

#endif
