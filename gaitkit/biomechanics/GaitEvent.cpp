#include "gaitkit/biomechanics/GaitEvent.hpp"

#include <algorithm>
#include <tuple>

namespace gaitkit {

namespace biomechanics {

//==============================================================================
std::string sideToString(Side side)
{
  return side == Side::Left ? "Left" : "Right";
}

//==============================================================================
std::string sideToContext(Side side)
{
  return side == Side::Left ? "L" : "R";
}

//==============================================================================
Side oppositeSide(Side side)
{
  return side == Side::Left ? Side::Right : Side::Left;
}

//==============================================================================
bool GaitEvent::operator==(const GaitEvent& other) const
{
  return side == other.side && kind == other.kind && frame == other.frame;
}

//==============================================================================
bool GaitEvent::operator!=(const GaitEvent& other) const
{
  return !(*this == other);
}

//==============================================================================
bool GaitEvent::operator<(const GaitEvent& other) const
{
  return std::make_tuple(frame, static_cast<int>(side), static_cast<int>(kind))
         < std::make_tuple(
             other.frame,
             static_cast<int>(other.side),
             static_cast<int>(other.kind));
}

//==============================================================================
std::vector<int> selectFrames(
    const std::vector<GaitEvent>& events, Side side, EventKind kind)
{
  std::vector<int> frames;
  for (const GaitEvent& event : events)
  {
    if (event.side == side && event.kind == kind)
    {
      frames.push_back(event.frame);
    }
  }
  std::sort(frames.begin(), frames.end());
  return frames;
}

} // namespace biomechanics
} // namespace gaitkit
