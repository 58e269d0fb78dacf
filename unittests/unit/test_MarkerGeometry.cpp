#include <cmath>
#include <string>
#include <utility>
#include <vector>

#include <Eigen/Dense>
#include <gtest/gtest.h>

#include "gaitkit/biomechanics/MarkerGeometry.hpp"
#include "gaitkit/common/Exceptions.hpp"
#include "gaitkit/math/MathTypes.hpp"

#include "GaitTestHelpers.hpp"

using namespace gaitkit;
using namespace biomechanics;

namespace {

/// Plug-in Gait lower body markers, walking along +y
MarkerSet makePlugInGaitMarkers(bool withSacrum)
{
  const std::vector<std::string> names = {"RASI",
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
  MarkerSet markers;
  for (const std::string& name : names)
  {
    markers[name] = MarkerTrajectory(
        name, constantTrajectory(Eigen::Vector3s(0, 0, 500)), FRAME_RATE);
  }
  auto set = [&](const std::string& name, const Eigen::Vector3s& position) {
    markers[name]
        = MarkerTrajectory(name, constantTrajectory(position), FRAME_RATE);
  };
  set("RASI", Eigen::Vector3s(100, 100, 900));
  set("LASI", Eigen::Vector3s(-100, 100, 900));
  if (withSacrum)
  {
    set("SACR", Eigen::Vector3s(0, -50, 900));
  }
  else
  {
    set("RPSI", Eigen::Vector3s(50, -50, 900));
    set("LPSI", Eigen::Vector3s(-50, -50, 900));
  }
  set("RHEE", Eigen::Vector3s(100, 0, 40));
  set("RTOE", Eigen::Vector3s(100, 150, 40));
  set("LHEE", Eigen::Vector3s(-100, 0, 40));
  set("LTOE", Eigen::Vector3s(-100, 150, 40));
  return markers;
}

std::vector<std::string> namesOf(const MarkerSet& markers)
{
  std::vector<std::string> names;
  for (const auto& pair : markers)
  {
    names.push_back(pair.first);
  }
  return names;
}

} // namespace

TEST(MARKER_GEOMETRY, TRAJECTORY_VALIDITY_AND_VELOCITY)
{
  Eigen::MatrixXs positions(5, 3);
  positions << 0, 0, 0, 10, 0, 0, 20, 0, 0, 30, 0, 0, 40, 0, 0;
  MarkerTrajectory marker("RTOE", positions, 100.0);

  EXPECT_EQ(marker.getNumFrames(), 5);
  EXPECT_FALSE(marker.isValidAt(0));
  EXPECT_TRUE(marker.isValidAt(1));
  EXPECT_FALSE(marker.isValidAt(5));
  EXPECT_FALSE(marker.isValidAt(-1));

  EXPECT_TRUE(equals(
      Eigen::VectorXs::Constant(5, 1000.0).eval(),
      marker.velocities.col(0).eval()));
  EXPECT_TRUE(marker.velocities.col(1).isZero());
}

TEST(MARKER_GEOMETRY, AVERAGE_MARKERS)
{
  MarkerSet markers;
  markers["A"] = MarkerTrajectory(
      "A", constantTrajectory(Eigen::Vector3s(0, 0, 0), 3), FRAME_RATE);
  markers["B"] = MarkerTrajectory(
      "B", constantTrajectory(Eigen::Vector3s(10, 20, 30), 3), FRAME_RATE);

  Eigen::MatrixXs mean = averageMarkers(markers, {"A", "B"});
  EXPECT_TRUE(equals(constantTrajectory(Eigen::Vector3s(5, 10, 15), 3), mean));

  Eigen::MatrixXs velocity
      = averageMarkers(markers, {"A", "B"}, MarkerQuantity::Velocity);
  EXPECT_TRUE(velocity.isZero());

  try
  {
    averageMarkers(markers, {"A", "C"});
    FAIL() << "expected MarkerNotFoundException";
  }
  catch (const MarkerNotFoundException& e)
  {
    EXPECT_EQ(e.getMarkerName(), "C");
  }
}

TEST(MARKER_GEOMETRY, NORMALIZE_ROWS)
{
  Eigen::MatrixXs vectors(2, 3);
  vectors << 3, 4, 0, 0, 0, 0;
  Eigen::MatrixXs normalized = normalizeRows(vectors);

  EXPECT_NEAR(normalized(0, 0), 0.6, 1e-12);
  EXPECT_NEAR(normalized(0, 1), 0.8, 1e-12);
  EXPECT_NEAR(normalized(0, 2), 0.0, 1e-12);
  for (int i = 0; i < 3; i++)
  {
    EXPECT_TRUE(std::isnan(normalized(1, i)));
  }
}

TEST(MARKER_GEOMETRY, PRINCIPAL_DIRECTION)
{
  Eigen::MatrixXs positions(20, 3);
  for (int i = 0; i < 20; i++)
  {
    positions.row(i) << 100 + (i % 2), 10.0 * i, 40;
  }
  EXPECT_EQ(principalDirection(positions), 1);

  // Missing samples do not count as motion
  positions.row(3).setZero();
  positions(4, 0) = std::nan("");
  EXPECT_EQ(principalDirection(positions), 1);

  EXPECT_THROW(
      principalDirection(Eigen::MatrixXs::Zero(10, 3)), GaitDataException);
}

TEST(MARKER_GEOMETRY, FOOT_FOOTPRINT)
{
  MarkerSet markers;
  Eigen::MatrixXs heel = constantTrajectory(Eigen::Vector3s(250, 200, 40), 4);
  heel.row(3).setZero();
  addFoot(markers, "R", heel);
  // addFoot() shifts the missing frame, put it back
  Eigen::MatrixXs toe = markers["RTOE"].positions;
  Eigen::MatrixXs ankle = markers["RANK"].positions;
  toe.row(3).setZero();

  FootFootprint footprint
      = estimateFootFootprint(heel, toe, ankle, 0.75, 14.0);
  ASSERT_EQ(footprint.minCorner.rows(), 4);

  const s_t footEnd = 200 + 150 + 0.75 * std::sqrt(30 * 30 + 40 * 40 + 60 * 60);
  Eigen::RowVectorXs expectedMin(3);
  expectedMin << 220, 207, -20;
  Eigen::RowVectorXs expectedMax(3);
  expectedMax << 280, footEnd, 100;
  for (int i = 0; i < 3; i++)
  {
    EXPECT_TRUE(equals(expectedMin, footprint.minCorner.row(i).eval()));
    EXPECT_TRUE(equals(expectedMax, footprint.maxCorner.row(i).eval()));
  }
  EXPECT_TRUE(footprint.minCorner.row(3).array().isNaN().all());
  EXPECT_TRUE(footprint.maxCorner.row(3).array().isNaN().all());
}

TEST(MARKER_GEOMETRY, CROSSING_FRAMES)
{
  Eigen::MatrixXs positions = Eigen::MatrixXs::Zero(100, 3);
  for (int i = 0; i < 100; i++)
  {
    positions(i, 1) = -99 + 2 * i;
  }
  std::vector<int> crossings = getCrossingFrames(positions, 1, 0);
  ASSERT_EQ(crossings.size(), 1u);
  EXPECT_EQ(crossings[0], 49);

  // Too close to the end of the data
  crossings = getCrossingFrames(positions, 1, 85);
  EXPECT_TRUE(crossings.empty());

  EXPECT_THROW(getCrossingFrames(positions, 3), std::invalid_argument);
}

TEST(MARKER_GEOMETRY, PLUG_IN_GAIT_SET)
{
  MarkerSet withSacrum = makePlugInGaitMarkers(true);
  MarkerSet withPsis = makePlugInGaitMarkers(false);
  EXPECT_TRUE(isPlugInGaitSet(namesOf(withSacrum)));
  EXPECT_TRUE(isPlugInGaitSet(namesOf(withPsis)));

  withPsis.erase("LPSI");
  EXPECT_FALSE(isPlugInGaitSet(namesOf(withPsis)));
  withSacrum.erase("RTOE");
  EXPECT_FALSE(isPlugInGaitSet(namesOf(withSacrum)));
}

TEST(MARKER_GEOMETRY, CHECK_PLUG_IN_GAIT_SET)
{
  EXPECT_TRUE(checkPlugInGaitSet(makePlugInGaitMarkers(true)));
  EXPECT_TRUE(checkPlugInGaitSet(makePlugInGaitMarkers(false)));

  MarkerSet flipped = makePlugInGaitMarkers(true);
  std::swap(flipped["LHEE"].positions, flipped["LTOE"].positions);
  EXPECT_FALSE(checkPlugInGaitSet(flipped));

  MarkerSet incomplete = makePlugInGaitMarkers(true);
  incomplete.erase("SACR");
  EXPECT_THROW(checkPlugInGaitSet(incomplete), GaitDataException);
}
