#include <vector>

#include <Eigen/Dense>
#include <gtest/gtest.h>

#include "gaitkit/biomechanics/ForcePlate.hpp"
#include "gaitkit/common/Exceptions.hpp"
#include "gaitkit/math/MathTypes.hpp"

#include "GaitTestHelpers.hpp"

using namespace gaitkit;
using namespace biomechanics;

TEST(FORCE_PLATES, BOUNDS_FROM_CORNERS)
{
  ForcePlate plate;
  plate.corners.push_back(Eigen::Vector3s(500, 0, 1));
  plate.corners.push_back(Eigen::Vector3s(0, 0, 0));
  plate.corners.push_back(Eigen::Vector3s(0, 600, -1));
  plate.corners.push_back(Eigen::Vector3s(500, 600, 0));
  plate.computeBounds();

  EXPECT_TRUE(plate.lowerBounds.isApprox(Eigen::Vector3s(0, 0, -1)));
  EXPECT_TRUE(plate.upperBounds.isApprox(Eigen::Vector3s(500, 600, 1)));

  ForcePlate noCorners;
  EXPECT_THROW(noCorners.computeBounds(), GaitDataException);
}

TEST(FORCE_PLATES, CLIP_CENTERS_OF_PRESSURE)
{
  ForcePlate plate = makeForcePlate(0, 0, 500, 600, 800, 0, 3, 3);
  plate.computeBounds();
  plate.centersOfPressure[0] = Eigen::Vector3s(-20, 300, 5);
  plate.centersOfPressure[1] = Eigen::Vector3s(250, 700, 0);
  plate.centersOfPressure[2] = Eigen::Vector3s(250, 300, 0);

  EXPECT_EQ(plate.clipCentersOfPressureToBounds(), 2);
  EXPECT_TRUE(plate.centersOfPressure[0].isApprox(Eigen::Vector3s(0, 300, 5)));
  EXPECT_TRUE(
      plate.centersOfPressure[1].isApprox(Eigen::Vector3s(250, 600, 0)));
  EXPECT_TRUE(
      plate.centersOfPressure[2].isApprox(Eigen::Vector3s(250, 300, 0)));

  // The recorded series is kept
  ASSERT_EQ(plate.getRawCentersOfPressure().size(), 3u);
  EXPECT_TRUE(plate.getRawCentersOfPressure()[1].isApprox(
      Eigen::Vector3s(250, 700, 0)));

  EXPECT_EQ(plate.clipCentersOfPressureToBounds(), 0);
  EXPECT_TRUE(plate.rawCentersOfPressure[0].isApprox(
      Eigen::Vector3s(-20, 300, 5)));
}

TEST(FORCE_PLATES, TOTAL_FORCES)
{
  ForcePlate plate;
  plate.forces.push_back(Eigen::Vector3s(3, 4, 0));
  plate.forces.push_back(Eigen::Vector3s(0, 0, -2));
  Eigen::VectorXs expected(2);
  expected << 5, 2;
  EXPECT_TRUE(equals(expected, plate.getTotalForces()));
  EXPECT_EQ(plate.getNumSamples(), 2);

  // An explicit total force series takes precedence
  plate.totalForces = {7, 8};
  expected << 7, 8;
  EXPECT_TRUE(equals(expected, plate.getTotalForces()));
}

TEST(FORCE_PLATES, CONSISTENCY)
{
  ForcePlate plate = makeForcePlate(0, 0, 500, 600, 800, 0, 3, 3);
  EXPECT_NO_THROW(plate.checkConsistency());

  plate.centersOfPressure.pop_back();
  EXPECT_THROW(plate.checkConsistency(), GaitDataException);
}
