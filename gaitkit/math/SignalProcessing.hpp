#ifndef GAITKIT_MATH_SIGNALPROCESSING_HPP_
#define GAITKIT_MATH_SIGNALPROCESSING_HPP_

#include <optional>
#include <vector>

#include <Eigen/Dense>

#include "gaitkit/math/MathTypes.hpp"

namespace gaitkit {
namespace math {

/// Indices i where signal[i] <= 0 and signal[i+1] > 0, ascending.
std::vector<int> risingZeroCross(const Eigen::VectorXs& signal);

/// Indices i where signal[i] >= 0 and signal[i+1] < 0, ascending.
std::vector<int> fallingZeroCross(const Eigen::VectorXs& signal);

/// Subtracts the resting level of the signal. The resting level is the mean
/// of the samples at or below the given percentile, so it does not depend on
/// how long the signal stays in its high (loaded) region.
Eigen::VectorXs baseline(const Eigen::VectorXs& signal, s_t percentile = 5.0);

/// Running median with an odd kernel size. The signal is zero padded at both
/// ends.
Eigen::VectorXs medianFilter(const Eigen::VectorXs& signal, int kernelSize = 3);

/// Numerical derivative with unit spacing: central differences inside, one
/// sided differences at the ends.
Eigen::VectorXs gradient(const Eigen::VectorXs& signal);

/// Median of the finite values, NaN if there are none
s_t nanMedian(std::vector<s_t> values);

/// Centered moving-window root-mean-square. The output has the same length as
/// the input; windows at the edges are truncated, not padded.
Eigen::VectorXs movingRMS(const Eigen::VectorXs& data, int windowSamples);

/// Corner frequencies in Hz. low == 0 means a pure low pass at high, high == 0
/// means a pure high pass at low, anything else is a band pass.
struct Passband
{
  s_t low;
  s_t high;

  Passband(s_t low, s_t high);

  /// Throws InvalidPassbandException unless the vector has exactly 2 entries
  static Passband fromVector(const std::vector<s_t>& corners);
};

struct FilterCoefficients
{
  /// Numerator
  Eigen::VectorXs b;
  /// Denominator, a(0) == 1
  Eigen::VectorXs a;
};

/// Design a digital Butterworth filter for the given passband. The analog
/// prototype is frequency transformed and discretized with the bilinear
/// transform. Throws InvalidPassbandException if the passband does not make
/// sense for the sample rate.
FilterCoefficients designButterworth(
    const Passband& passband, s_t sampleRate, int order = 5);

/// Direct form II transposed IIR filter. If `zi` is not null it holds the
/// initial state and receives the final state.
Eigen::VectorXs lfilter(
    const FilterCoefficients& filter,
    const Eigen::VectorXs& x,
    Eigen::VectorXs* zi = nullptr);

/// Steady state of lfilter() for a unit step input
Eigen::VectorXs lfilterInitialState(const FilterCoefficients& filter);

/// Zero phase filtering: filters forward, then backward. The signal is
/// extended at both ends by odd reflection to reduce edge transients.
Eigen::VectorXs filtfilt(
    const FilterCoefficients& filter, const Eigen::VectorXs& x);

/// Forward-backward Butterworth filtering. With no passband the data is
/// returned unchanged.
Eigen::VectorXs forwardBackwardFilter(
    const Eigen::VectorXs& data,
    const std::optional<Passband>& passband,
    s_t sampleRate,
    int order = 5);

/// Same as above, for a passband given as a list of corners. The list must
/// have exactly two entries.
Eigen::VectorXs forwardBackwardFilter(
    const Eigen::VectorXs& data,
    const std::vector<s_t>& passband,
    s_t sampleRate,
    int order = 5);

} // namespace math
} // namespace gaitkit

#endif // GAITKIT_MATH_SIGNALPROCESSING_HPP_
