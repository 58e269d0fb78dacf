#include "gaitkit/biomechanics/MarkerGeometry.hpp"

#include <algorithm>
#include <limits>
#include <set>

#include "gaitkit/common/Console.hpp"
#include "gaitkit/common/Exceptions.hpp"
#include "gaitkit/math/SignalProcessing.hpp"

namespace gaitkit {

namespace biomechanics {

namespace {

const s_t NaN = std::numeric_limits<s_t>::quiet_NaN();

//==============================================================================
bool isValidRow(const Eigen::MatrixXs& m, int row)
{
  return m.row(row).allFinite() && !m.row(row).isZero(0);
}

} // namespace

//==============================================================================
MarkerTrajectory::MarkerTrajectory(
    const std::string& name, const Eigen::MatrixXs& positions, s_t frameRate)
  : name(name),
    positions(positions),
    velocities(computeVelocities(positions, frameRate))
{
}

//==============================================================================
int MarkerTrajectory::getNumFrames() const
{
  return positions.rows();
}

//==============================================================================
bool MarkerTrajectory::isValidAt(int frame) const
{
  if (frame < 0 || frame >= positions.rows())
  {
    return false;
  }
  return isValidRow(positions, frame);
}

//==============================================================================
std::vector<std::string> FootMarkerNames::all() const
{
  return {heel, toe, ankle};
}

//==============================================================================
Eigen::MatrixXs averageMarkers(
    const MarkerSet& markers,
    const std::vector<std::string>& names,
    MarkerQuantity quantity)
{
  GAITKIT_THROW_IF(
      names.empty(),
      std::invalid_argument,
      "averageMarkers() needs at least one marker name");

  Eigen::MatrixXs sum;
  for (const std::string& name : names)
  {
    auto it = markers.find(name);
    if (it == markers.end())
    {
      GAITKIT_THROW(MarkerNotFoundException, name);
    }
    const Eigen::MatrixXs& data = quantity == MarkerQuantity::Position
                                      ? it->second.positions
                                      : it->second.velocities;
    if (sum.size() == 0)
    {
      sum = Eigen::MatrixXs::Zero(data.rows(), data.cols());
    }
    GAITKIT_THROW_IF(
        data.rows() != sum.rows() || data.cols() != sum.cols(),
        GaitDataException,
        "Marker " + name + " has a different number of frames than "
            + names[0]);
    sum += data;
  }
  return sum / static_cast<s_t>(names.size());
}

//==============================================================================
Eigen::MatrixXs normalizeRows(const Eigen::MatrixXs& vectors)
{
  Eigen::MatrixXs normalized(vectors.rows(), vectors.cols());
  for (int i = 0; i < vectors.rows(); i++)
  {
    s_t norm = vectors.row(i).norm();
    if (norm == 0)
    {
      normalized.row(i).setConstant(NaN);
    }
    else
    {
      normalized.row(i) = vectors.row(i) / norm;
    }
  }
  return normalized;
}

//==============================================================================
int principalDirection(const Eigen::MatrixXs& positions)
{
  std::vector<int> rows;
  for (int i = 0; i < positions.rows(); i++)
  {
    if (isValidRow(positions, i))
    {
      rows.push_back(i);
    }
  }
  GAITKIT_THROW_IF(
      rows.empty(),
      GaitDataException,
      "Cannot determine the principal direction: no valid samples");

  Eigen::MatrixXs valid(rows.size(), positions.cols());
  for (std::size_t i = 0; i < rows.size(); i++)
  {
    valid.row(i) = positions.row(rows[i]);
  }
  Eigen::RowVectorXs mean = valid.colwise().mean();
  Eigen::MatrixXs centered = valid.rowwise() - mean;
  Eigen::VectorXs variance = centered.colwise().squaredNorm().transpose();

  int axis = 0;
  variance.maxCoeff(&axis);
  return axis;
}

//==============================================================================
Eigen::MatrixXs computeVelocities(
    const Eigen::MatrixXs& positions, s_t frameRate)
{
  Eigen::MatrixXs velocities(positions.rows(), positions.cols());
  for (int col = 0; col < positions.cols(); col++)
  {
    velocities.col(col) = math::gradient(positions.col(col)) * frameRate;
  }
  return velocities;
}

//==============================================================================
FootFootprint estimateFootFootprint(
    const Eigen::MatrixXs& heel,
    const Eigen::MatrixXs& toe,
    const Eigen::MatrixXs& ankle,
    s_t relativeLength,
    s_t markerDiameter)
{
  const int numFrames = heel.rows();
  GAITKIT_THROW_IF(
      toe.rows() != numFrames || ankle.rows() != numFrames || heel.cols() != 3
          || toe.cols() != 3 || ankle.cols() != 3,
      GaitDataException,
      "Foot markers must be frames x 3 series of equal length");

  Eigen::MatrixXs heelToe = normalizeRows(toe - heel);
  Eigen::MatrixXs heelAnkle = ankle - heel;

  // Marker height varies with the foot angle, so one length is used for the
  // whole trial
  std::vector<s_t> heelAnkleLengths;
  for (int i = 0; i < numFrames; i++)
  {
    if (isValidRow(heel, i) && isValidRow(ankle, i))
    {
      heelAnkleLengths.push_back(heelAnkle.row(i).norm());
    }
  }
  const s_t heelAnkleLength = math::nanMedian(heelAnkleLengths);

  FootFootprint footprint;
  footprint.minCorner = Eigen::MatrixXs::Constant(numFrames, 3, NaN);
  footprint.maxCorner = Eigen::MatrixXs::Constant(numFrames, 3, NaN);

  std::vector<s_t> footLengths;
  std::vector<s_t> footWidths;
  for (int i = 0; i < numFrames; i++)
  {
    if (!isValidRow(heel, i) || !isValidRow(toe, i) || !isValidRow(ankle, i)
        || !heelToe.row(i).allFinite() || !isfinite(heelAnkleLength))
    {
      continue;
    }
    Eigen::RowVector3s direction = heelToe.row(i);
    Eigen::RowVector3s footEnd
        = toe.row(i) + direction * relativeLength * heelAnkleLength;
    // Ankle offset from the heel-toe line
    Eigen::RowVector3s lateral
        = heelAnkle.row(i) - direction * heelAnkle.row(i).dot(direction);
    Eigen::RowVector3s lateralEdge = footEnd + lateral;
    Eigen::RowVector3s medialEdge = footEnd - lateral;
    Eigen::RowVector3s heelEdge
        = heel.row(i) + direction * markerDiameter / 2.0;

    footprint.minCorner.row(i)
        = heelEdge.cwiseMin(lateralEdge).cwiseMin(medialEdge);
    footprint.maxCorner.row(i)
        = heelEdge.cwiseMax(lateralEdge).cwiseMax(medialEdge);

    footLengths.push_back((footEnd - heelEdge).norm());
    footWidths.push_back((lateralEdge - medialEdge).norm());
  }

  gkdbg << "estimated foot length: " << math::nanMedian(footLengths)
        << " mm, width: " << math::nanMedian(footWidths) << " mm"
        << std::endl;

  return footprint;
}

//==============================================================================
std::vector<int> getCrossingFrames(
    const Eigen::MatrixXs& positions, int dim, s_t p0)
{
  GAITKIT_THROW_IF(
      dim < 0 || dim >= positions.cols(),
      std::invalid_argument,
      "Invalid dimension " + std::to_string(dim));

  Eigen::VectorXs y = positions.col(dim);
  for (int i = 0; i < y.size(); i++)
  {
    // zero means no data, leave it alone
    if (y(i) != 0)
    {
      y(i) -= p0;
    }
  }

  std::vector<int> candidates = math::risingZeroCross(y);
  std::vector<int> falling = math::fallingZeroCross(y);
  candidates.insert(candidates.end(), falling.begin(), falling.end());
  std::sort(candidates.begin(), candidates.end());

  const int margin = 10;
  std::vector<int> crossings;
  for (int p : candidates)
  {
    if (p - margin > 0 && p + margin < y.size())
    {
      s_t before = y(p - margin);
      s_t after = y(p + margin);
      if (before != 0 && after != 0 && (before > 0) != (after > 0))
      {
        crossings.push_back(p);
      }
    }
  }
  return crossings;
}

//==============================================================================
bool isPlugInGaitSet(const std::vector<std::string>& markerNames)
{
  static const std::vector<std::string> required = {"RASI",
                                                    "LASI",
                                                    "LTHI",
                                                    "LKNE",
                                                    "LTIB",
                                                    "LANK",
                                                    "LHEE",
                                                    "LTOE",
                                                    "RTHI",
                                                    "RKNE",
                                                    "RTIB",
                                                    "RANK",
                                                    "RHEE",
                                                    "RTOE"};
  std::set<std::string> names(markerNames.begin(), markerNames.end());
  for (const std::string& name : required)
  {
    if (names.count(name) == 0)
    {
      return false;
    }
  }
  bool hasPsis = names.count("RPSI") > 0 && names.count("LPSI") > 0;
  bool hasSacrum = names.count("SACR") > 0;
  return hasPsis || hasSacrum;
}

//==============================================================================
bool checkPlugInGaitSet(const MarkerSet& markers)
{
  std::vector<std::string> names;
  for (const auto& pair : markers)
  {
    names.push_back(pair.first);
  }
  GAITKIT_THROW_IF(
      !isPlugInGaitSet(names), GaitDataException, "Not a Plug-in Gait set");

  // max angle (degrees) to consider vectors similarly oriented
  const s_t maxAngle = 90.0;
  for (const std::string side : {"L", "R"})
  {
    Eigen::MatrixXs heelToe = normalizeRows(
        markers.at(side + "TOE").positions
        - markers.at(side + "HEE").positions);
    const Eigen::MatrixXs& asis = markers.at(side + "ASI").positions;
    Eigen::MatrixXs pelvis;
    if (markers.count(side + "PSI"))
    {
      pelvis = normalizeRows(asis - markers.at(side + "PSI").positions);
    }
    else
    {
      pelvis = normalizeRows(asis - markers.at("SACR").positions);
    }

    std::vector<s_t> angles;
    for (int i = 0; i < heelToe.rows(); i++)
    {
      s_t cosine = heelToe.row(i).dot(pelvis.row(i));
      if (!isfinite(cosine))
      {
        angles.push_back(NaN);
        continue;
      }
      cosine = std::max(-1.0, std::min(1.0, cosine));
      angles.push_back(std::acos(cosine) / M_PI * 180.0);
    }
    if (math::nanMedian(angles) > maxAngle)
    {
      gkwarn << side << "HEE and " << side << "TOE markers probably flipped"
             << std::endl;
      return false;
    }
  }
  return true;
}

} // namespace biomechanics
} // namespace gaitkit
