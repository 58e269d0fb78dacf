/*
 * Copyright (c) 2011-2019, The DART development contributors
 * All rights reserved.
 *
 * The list of contributors can be found at:
 *   https://github.com/dartsim/dart/blob/master/LICENSE
 *
 * This file is provided under the following "BSD-style" License:
 *   Redistribution and use in source and binary forms, with or
 *   without modification, are permitted provided that the following
 *   conditions are met:
 *   * Redistributions of source code must retain the above copyright
 *     notice, this list of conditions and the following disclaimer.
 *   * Redistributions in binary form must reproduce the above
 *     copyright notice, this list of conditions and the following
 *     disclaimer in the documentation and/or other materials provided
 *     with the distribution.
 *   THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND
 *   CONTRIBUTORS "AS IS" AND ANY EXPRESS OR IMPLIED WARRANTIES,
 *   INCLUDING, BUT NOT LIMITED TO, THE IMPLIED WARRANTIES OF
 *   MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 *   DISCLAIMED. IN NO EVENT SHALL THE COPYRIGHT HOLDER OR
 *   CONTRIBUTORS BE LIABLE FOR ANY DIRECT, INDIRECT, INCIDENTAL,
 *   SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES (INCLUDING, BUT NOT
 *   LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES; LOSS OF
 *   USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED
 *   AND ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT
 *   LIABILITY, OR TORT (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN
 *   ANY WAY OUT OF THE USE OF THIS SOFTWARE, EVEN IF ADVISED OF THE
 *   POSSIBILITY OF SUCH DAMAGE.
 */

#ifndef GAITKIT_UNITTESTS_GAIT_TEST_HELPERS_HPP_
#define GAITKIT_UNITTESTS_GAIT_TEST_HELPERS_HPP_

#include <cmath>
#include <optional>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "gaitkit/biomechanics/ForcePlate.hpp"
#include "gaitkit/biomechanics/MarkerGeometry.hpp"
#include "gaitkit/biomechanics/MocapSource.hpp"
#include "gaitkit/biomechanics/Trial.hpp"
#include "gaitkit/math/MathTypes.hpp"

using namespace gaitkit;
using namespace gaitkit::biomechanics;

// Synthetic trials are 200 frames at 100 Hz, with 10 analog samples per frame
static const int NUM_FRAMES = 200;
static const s_t FRAME_RATE = 100.0;
static const s_t ANALOG_RATE = 1000.0;
static const int SAMPLES_PER_FRAME = 10;

//==============================================================================
/// Returns true if the two matrices are equal within the given bound. NaN is
/// equal to NaN.
template <class MATRIX>
bool equals(
    const Eigen::DenseBase<MATRIX>& _expected,
    const Eigen::DenseBase<MATRIX>& _actual,
    double tol = 1e-5)
{
  const size_t n1 = _expected.cols(), m1 = _expected.rows();
  const size_t n2 = _actual.cols(), m2 = _actual.rows();
  if (m1 != m2 || n1 != n2)
    return false;

  for (size_t i = 0; i < m1; i++)
  {
    for (size_t j = 0; j < n1; j++)
    {
      if (std::isnan(_expected(i, j)) ^ std::isnan(_actual(i, j)))
        return false;
      else if (std::fabs(_expected(i, j)) > 1)
      {
        // Test relative error for values that are larger than 1
        if (std::fabs((_expected(i, j) - _actual(i, j)) / _expected(i, j))
            > tol)
          return false;
      }
      else if (std::fabs(_expected(i, j) - _actual(i, j)) > tol)
        return false;
    }
  }
  return true;
}

//==============================================================================
inline TrialMetadata makeMetadata(std::optional<s_t> bodyMass = 70.0)
{
  TrialMetadata metadata;
  metadata.trialName = "synthetic";
  metadata.subjectName = "subject";
  metadata.frameRate = FRAME_RATE;
  metadata.analogRate = ANALOG_RATE;
  metadata.frameCount = NUM_FRAMES;
  metadata.bodyMass = bodyMass;
  metadata.computeSamplesPerFrame();
  return metadata;
}

//==============================================================================
/// A marker that stays at one position for the whole trial
inline Eigen::MatrixXs constantTrajectory(
    const Eigen::Vector3s& position, int numFrames = NUM_FRAMES)
{
  Eigen::MatrixXs positions(numFrames, 3);
  positions.rowwise() = position.transpose();
  return positions;
}

//==============================================================================
/// A marker at `before` until `switchFrame`, then at `after`
inline Eigen::MatrixXs steppingTrajectory(
    const Eigen::Vector3s& before,
    const Eigen::Vector3s& after,
    int switchFrame,
    int numFrames = NUM_FRAMES)
{
  Eigen::MatrixXs positions(numFrames, 3);
  for (int i = 0; i < numFrames; i++)
  {
    positions.row(i) = (i < switchFrame ? before : after).transpose();
  }
  return positions;
}

//==============================================================================
/// Adds heel, toe and ankle markers of a foot pointing along +y, given the
/// heel trajectory. With the default detection settings the footprint is the
/// box heel + ([-30, 30], [7, 208.6]) in x and y.
inline void addFoot(
    MarkerSet& markers,
    const std::string& context,
    const Eigen::MatrixXs& heel)
{
  const s_t lateral = context == "R" ? 30.0 : -30.0;
  Eigen::MatrixXs toe = heel;
  Eigen::MatrixXs ankle = heel;
  for (int i = 0; i < heel.rows(); i++)
  {
    toe.row(i) += Eigen::RowVector3s(0, 150, 0);
    ankle.row(i) += Eigen::RowVector3s(lateral, 40, 60);
  }
  markers[context + "HEE"]
      = MarkerTrajectory(context + "HEE", heel, FRAME_RATE);
  markers[context + "TOE"]
      = MarkerTrajectory(context + "TOE", toe, FRAME_RATE);
  markers[context + "ANK"]
      = MarkerTrajectory(context + "ANK", ankle, FRAME_RATE);
}

//==============================================================================
/// A horizontal rectangular plate spanning [x0, x1] x [y0, y1] at z = 0,
/// carrying `force` N vertically between the analog samples `riseSample`
/// (inclusive) and `fallSample` (exclusive). The CoP sits at the plate centre.
inline ForcePlate makeForcePlate(
    s_t x0,
    s_t y0,
    s_t x1,
    s_t y1,
    s_t force,
    int riseSample,
    int fallSample,
    int numSamples = NUM_FRAMES * SAMPLES_PER_FRAME)
{
  ForcePlate plate;
  plate.name = "plate";
  plate.corners.push_back(Eigen::Vector3s(x0, y0, 0));
  plate.corners.push_back(Eigen::Vector3s(x1, y0, 0));
  plate.corners.push_back(Eigen::Vector3s(x1, y1, 0));
  plate.corners.push_back(Eigen::Vector3s(x0, y1, 0));
  plate.worldOrigin = Eigen::Vector3s((x0 + x1) / 2, (y0 + y1) / 2, 0);
  for (int i = 0; i < numSamples; i++)
  {
    s_t f = (i >= riseSample && i < fallSample) ? force : 0.0;
    plate.forces.push_back(Eigen::Vector3s(0, 0, f));
    plate.moments.push_back(Eigen::Vector3s::Zero());
    plate.centersOfPressure.push_back(plate.worldOrigin);
  }
  return plate;
}

//==============================================================================
/// Plate 0 spans y in [0, 600] and is loaded with 800 N from frame 50 to 120.
/// The right foot stands on it for the whole trial. Plate 1 spans y in
/// [700, 1300] and is loaded with 750 N from frame 130 to 190; the left foot
/// steps onto it at frame 125.
inline MarkerSet makeTwoStepMarkers()
{
  MarkerSet markers;
  addFoot(markers, "R", constantTrajectory(Eigen::Vector3s(250, 200, 40)));
  addFoot(
      markers,
      "L",
      steppingTrajectory(
          Eigen::Vector3s(250, -300, 40), Eigen::Vector3s(250, 800, 40), 125));
  return markers;
}

//==============================================================================
inline ForcePlate makeFirstPlate(s_t force = 800.0)
{
  return makeForcePlate(0, 0, 500, 600, force, 500, 1200);
}

//==============================================================================
inline ForcePlate makeSecondPlate(s_t force = 750.0)
{
  return makeForcePlate(0, 700, 500, 1300, force, 1300, 1900);
}

//==============================================================================
inline Trial makeTwoStepTrial(std::optional<s_t> bodyMass = 70.0)
{
  return Trial(
      makeMetadata(bodyMass),
      makeTwoStepMarkers(),
      {makeFirstPlate(), makeSecondPlate()});
}

#endif
