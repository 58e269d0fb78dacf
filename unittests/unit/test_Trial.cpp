#include <map>
#include <set>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <gtest/gtest.h>

#include "gaitkit/biomechanics/GaitEvent.hpp"
#include "gaitkit/biomechanics/MocapSource.hpp"
#include "gaitkit/biomechanics/Trial.hpp"
#include "gaitkit/common/Exceptions.hpp"

#include "GaitTestHelpers.hpp"

using namespace gaitkit;
using namespace biomechanics;

namespace {

InMemoryMocapSource makeSource()
{
  InMemoryMocapSource source(makeMetadata());
  for (const auto& pair : makeTwoStepMarkers())
  {
    source.addMarker(pair.first, pair.second.positions);
  }
  source.addForcePlate(makeFirstPlate());
  source.addForcePlate(makeSecondPlate());
  return source;
}

} // namespace

TEST(MOCAP_SOURCE, METADATA)
{
  InMemoryMocapSource source = makeSource();
  TrialMetadata metadata = source.getMetadata();
  EXPECT_EQ(metadata.samplesPerFrame, SAMPLES_PER_FRAME);
  EXPECT_EQ(metadata.forcePlateCount, 2);
  EXPECT_EQ(metadata.markerNames.size(), 6u);
  ASSERT_TRUE(metadata.bodyMass.has_value());
  EXPECT_DOUBLE_EQ(*metadata.bodyMass, 70.0);

  TrialMetadata bad = makeMetadata();
  bad.analogRate = 1050;
  EXPECT_THROW(InMemoryMocapSource{bad}, GaitDataException);
  bad.analogRate = 1000;
  bad.frameRate = 0;
  EXPECT_THROW(InMemoryMocapSource{bad}, GaitDataException);
}

TEST(MOCAP_SOURCE, MARKER_DATA)
{
  InMemoryMocapSource source = makeSource();
  std::map<std::string, Eigen::MatrixXs> data
      = source.getMarkerData({"RHEE", "LTOE"});
  EXPECT_EQ(data.size(), 2u);
  EXPECT_EQ(data["RHEE"].rows(), NUM_FRAMES);

  EXPECT_THROW(
      source.getMarkerData({"RHEE", "RPSI"}), MarkerNotFoundException);

  data = source.getMarkerData({"RHEE", "RPSI"}, true);
  EXPECT_EQ(data.size(), 1u);
  EXPECT_EQ(data.count("RPSI"), 0u);

  EXPECT_THROW(
      source.addMarker("BAD", Eigen::MatrixXs::Zero(10, 3)), GaitDataException);
}

TEST(MOCAP_SOURCE, FORCE_PLATE_DATA)
{
  std::vector<ForcePlate> plates = makeSource().getForcePlateData();
  ASSERT_EQ(plates.size(), 2u);
  EXPECT_EQ(plates[0].getNumSamples(), NUM_FRAMES * SAMPLES_PER_FRAME);

  InMemoryMocapSource empty(makeMetadata());
  EXPECT_TRUE(empty.getForcePlateData().empty());
}

TEST(MOCAP_SOURCE, ANALOG_DEVICE_LOOKUP)
{
  InMemoryMocapSource source = makeSource();
  AnalogData emg;
  emg.sampleRate = 1000;
  emg.channels["Voltage.LGas"] = Eigen::VectorXs::Zero(10);
  source.addAnalogDevice("Myon EMG", emg);

  EXPECT_EQ(source.getAnalogData("MYON emg").channels.size(), 1u);
  EXPECT_THROW(source.getAnalogData("Myon"), GaitDataException);

  source.addAnalogDevice("myon emg", emg);
  EXPECT_THROW(source.getAnalogData("Myon EMG"), GaitDataException);
}

TEST(TRIAL, FROM_SOURCE)
{
  InMemoryMocapSource source = makeSource();
  Trial trial = Trial::fromSource(
      source, {"RHEE", "RTOE", "RANK", "LHEE", "LTOE", "LANK"});

  EXPECT_EQ(trial.getNumFrames(), NUM_FRAMES);
  EXPECT_EQ(trial.getSamplesPerFrame(), SAMPLES_PER_FRAME);
  EXPECT_DOUBLE_EQ(trial.getFrameRate(), FRAME_RATE);
  EXPECT_DOUBLE_EQ(trial.getAnalogRate(), ANALOG_RATE);
  EXPECT_EQ(trial.getForcePlates().size(), 2u);
  EXPECT_EQ(trial.getMarkers().size(), 6u);
  EXPECT_TRUE(trial.hasMarker("LANK"));
  EXPECT_FALSE(trial.hasMarker("SACR"));
  EXPECT_THROW(trial.getMarker("SACR"), MarkerNotFoundException);

  // Bounds come from the plate corners
  EXPECT_TRUE(trial.getForcePlates()[1].lowerBounds.isApprox(
      Eigen::Vector3s(0, 700, 0)));
  EXPECT_TRUE(trial.getForcePlates()[1].upperBounds.isApprox(
      Eigen::Vector3s(500, 1300, 0)));

  // The left foot jumps 1100 mm between frames 124 and 125
  const Eigen::MatrixXs& velocity = trial.getMarker("LHEE").velocities;
  EXPECT_NEAR(velocity(124, 1), 1100.0 / 2 * FRAME_RATE, 1e-9);
  EXPECT_NEAR(velocity(10, 1), 0.0, 1e-9);

  EXPECT_THROW(
      Trial::fromSource(source, {"RHEE", "SACR"}), MarkerNotFoundException);
  Trial partial = Trial::fromSource(source, {"RHEE", "SACR"}, true);
  EXPECT_EQ(partial.getMarkers().size(), 1u);
}

TEST(TRIAL, CLIPS_CENTERS_OF_PRESSURE)
{
  ForcePlate plate = makeFirstPlate();
  plate.centersOfPressure[0] = Eigen::Vector3s(900, 300, 0);
  Trial trial(makeMetadata(), makeTwoStepMarkers(), {plate});
  EXPECT_DOUBLE_EQ(trial.getForcePlates()[0].centersOfPressure[0](0), 500.0);
}

TEST(TRIAL, REJECTS_INCONSISTENT_DATA)
{
  MarkerSet markers = makeTwoStepMarkers();
  markers["SHORT"] = MarkerTrajectory(
      "SHORT", constantTrajectory(Eigen::Vector3s(1, 2, 3), 10), FRAME_RATE);
  EXPECT_THROW(Trial(makeMetadata(), markers, {}), GaitDataException);
}

TEST(TRIAL, EVENTS)
{
  Trial trial = makeTwoStepTrial();
  EXPECT_TRUE(trial.getEvents().empty());
  EXPECT_TRUE(trial.getValidSides().empty());

  trial.setEvents(
      {GaitEvent{Side::Right, EventKind::Strike, 150},
       GaitEvent{Side::Right, EventKind::ToeOff, 180},
       GaitEvent{Side::Right, EventKind::Strike, 50},
       GaitEvent{Side::Left, EventKind::ToeOff, 90}},
      {Side::Right});
  EXPECT_EQ(trial.getStrikes(Side::Right), (std::vector<int>{50, 150}));
  EXPECT_EQ(trial.getToeOffs(Side::Right), std::vector<int>{180});
  EXPECT_EQ(trial.getToeOffs(Side::Left), std::vector<int>{90});
  EXPECT_TRUE(trial.getStrikes(Side::Left).empty());
  EXPECT_EQ(trial.getEvents().front().frame, 50);

  // Replaced as a whole
  trial.setEvents({GaitEvent{Side::Left, EventKind::Strike, 10}}, {});
  EXPECT_TRUE(trial.getStrikes(Side::Right).empty());
  EXPECT_TRUE(trial.getValidSides().empty());

  std::vector<GaitEvent> outside
      = {GaitEvent{Side::Left, EventKind::Strike, NUM_FRAMES}};
  EXPECT_THROW(trial.setEvents(outside, {}), GaitDataException);
}

TEST(GAIT_EVENT, NAMES_AND_ORDER)
{
  EXPECT_EQ(sideToString(Side::Left), "Left");
  EXPECT_EQ(sideToContext(Side::Right), "R");
  EXPECT_EQ(oppositeSide(Side::Left), Side::Right);

  GaitEvent early{Side::Right, EventKind::ToeOff, 10};
  GaitEvent late{Side::Left, EventKind::Strike, 20};
  EXPECT_TRUE(early < late);
  EXPECT_FALSE(late < early);
  EXPECT_TRUE(early != late);
}
