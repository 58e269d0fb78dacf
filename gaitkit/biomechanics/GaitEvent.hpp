#ifndef GAITKIT_BIOMECH_GAITEVENT_HPP_
#define GAITKIT_BIOMECH_GAITEVENT_HPP_

#include <string>
#include <vector>

namespace gaitkit {

namespace biomechanics {

enum class Side
{
  Left,
  Right
};

enum class EventKind
{
  Strike,
  ToeOff
};

/// "Left" or "Right"
std::string sideToString(Side side);

/// Single letter context used in marker and channel names, "L" or "R"
std::string sideToContext(Side side);

Side oppositeSide(Side side);

/// A foot strike or toe-off, at a marker frame index
struct GaitEvent
{
  Side side;
  EventKind kind;
  int frame;

  bool operator==(const GaitEvent& other) const;
  bool operator!=(const GaitEvent& other) const;
  /// Orders by frame, then side, then kind
  bool operator<(const GaitEvent& other) const;
};

/// Ascending frames of all events of this side and kind
std::vector<int> selectFrames(
    const std::vector<GaitEvent>& events, Side side, EventKind kind);

} // namespace biomechanics
} // namespace gaitkit

#endif
