#include "gaitkit/math/SignalProcessing.hpp"

#include <algorithm>
#include <cmath>
#include <complex>
#include <limits>
#include <string>

#include "gaitkit/common/Exceptions.hpp"

namespace gaitkit {
namespace math {

namespace {

typedef std::complex<s_t> c_t;

//==============================================================================
/// Expand the product of (x - r) over all roots into polynomial coefficients,
/// highest power first.
std::vector<c_t> polyFromRoots(const std::vector<c_t>& roots)
{
  std::vector<c_t> coeffs(1, c_t(1.0, 0.0));
  for (const c_t& root : roots)
  {
    std::vector<c_t> next(coeffs.size() + 1, c_t(0.0, 0.0));
    for (std::size_t i = 0; i < coeffs.size(); i++)
    {
      next[i] += coeffs[i];
      next[i + 1] -= coeffs[i] * root;
    }
    coeffs = next;
  }
  return coeffs;
}

//==============================================================================
c_t product(const std::vector<c_t>& values, c_t offset, bool negate)
{
  c_t result(1.0, 0.0);
  for (const c_t& v : values)
  {
    result *= negate ? (offset - v) : (offset + v);
  }
  return result;
}

} // namespace

//==============================================================================
std::vector<int> risingZeroCross(const Eigen::VectorXs& signal)
{
  std::vector<int> indices;
  for (int i = 0; i + 1 < signal.size(); i++)
  {
    if (signal(i) <= 0 && signal(i + 1) > 0)
    {
      indices.push_back(i);
    }
  }
  return indices;
}

//==============================================================================
std::vector<int> fallingZeroCross(const Eigen::VectorXs& signal)
{
  std::vector<int> indices;
  for (int i = 0; i + 1 < signal.size(); i++)
  {
    if (signal(i) >= 0 && signal(i + 1) < 0)
    {
      indices.push_back(i);
    }
  }
  return indices;
}

//==============================================================================
Eigen::VectorXs baseline(const Eigen::VectorXs& signal, s_t percentile)
{
  if (signal.size() == 0)
  {
    return signal;
  }
  GAITKIT_THROW_IF(
      !(percentile >= 0 && percentile <= 100),
      std::invalid_argument,
      "baseline() percentile must be within [0, 100], got "
          + std::to_string(percentile));

  std::vector<s_t> sorted(signal.data(), signal.data() + signal.size());
  std::sort(sorted.begin(), sorted.end());

  // Mean of the samples at or below the percentile. Only the lowest samples
  // contribute, however long the plate stays loaded.
  const int last = static_cast<int>(
      std::floor(percentile / 100.0 * (sorted.size() - 1)));
  s_t sum = 0.0;
  for (int i = 0; i <= last; i++)
  {
    sum += sorted[i];
  }
  const s_t restingLevel = sum / (last + 1);

  return (signal.array() - restingLevel).matrix();
}

//==============================================================================
Eigen::VectorXs medianFilter(const Eigen::VectorXs& signal, int kernelSize)
{
  GAITKIT_THROW_IF(
      kernelSize < 1 || kernelSize % 2 == 0,
      std::invalid_argument,
      "Median filter kernel size must be a positive odd number, got "
          + std::to_string(kernelSize));

  const int n = signal.size();
  const int half = kernelSize / 2;
  Eigen::VectorXs filtered(n);
  std::vector<s_t> window(kernelSize);
  for (int i = 0; i < n; i++)
  {
    for (int k = 0; k < kernelSize; k++)
    {
      int j = i - half + k;
      window[k] = (j >= 0 && j < n) ? signal(j) : 0.0;
    }
    std::nth_element(window.begin(), window.begin() + half, window.end());
    filtered(i) = window[half];
  }
  return filtered;
}

//==============================================================================
Eigen::VectorXs gradient(const Eigen::VectorXs& signal)
{
  const int n = signal.size();
  Eigen::VectorXs grad = Eigen::VectorXs::Zero(n);
  if (n < 2)
  {
    return grad;
  }
  grad(0) = signal(1) - signal(0);
  grad(n - 1) = signal(n - 1) - signal(n - 2);
  for (int i = 1; i < n - 1; i++)
  {
    grad(i) = (signal(i + 1) - signal(i - 1)) / 2.0;
  }
  return grad;
}

//==============================================================================
s_t nanMedian(std::vector<s_t> values)
{
  values.erase(
      std::remove_if(
          values.begin(), values.end(), [](s_t v) { return !isfinite(v); }),
      values.end());
  if (values.empty())
  {
    return std::numeric_limits<s_t>::quiet_NaN();
  }
  const std::size_t mid = values.size() / 2;
  std::nth_element(values.begin(), values.begin() + mid, values.end());
  s_t upper = values[mid];
  if (values.size() % 2 == 1)
  {
    return upper;
  }
  s_t lower = *std::max_element(values.begin(), values.begin() + mid);
  return (lower + upper) / 2.0;
}

//==============================================================================
Eigen::VectorXs movingRMS(const Eigen::VectorXs& data, int windowSamples)
{
  GAITKIT_THROW_IF(
      windowSamples < 1,
      std::invalid_argument,
      "RMS window must contain at least one sample");

  const int n = data.size();
  // cumulative sum of squares, cumSq(i) = sum of data(0..i-1)^2
  Eigen::VectorXs cumSq = Eigen::VectorXs::Zero(n + 1);
  for (int i = 0; i < n; i++)
  {
    cumSq(i + 1) = cumSq(i) + data(i) * data(i);
  }

  const int before = windowSamples / 2;
  const int after = windowSamples - 1 - before;
  Eigen::VectorXs rms(n);
  for (int i = 0; i < n; i++)
  {
    int start = std::max(0, i - before);
    int end = std::min(n - 1, i + after);
    s_t meanSq = (cumSq(end + 1) - cumSq(start)) / (end - start + 1);
    rms(i) = std::sqrt(std::max(meanSq, 0.0));
  }
  return rms;
}

//==============================================================================
Passband::Passband(s_t low, s_t high) : low(low), high(high)
{
}

//==============================================================================
Passband Passband::fromVector(const std::vector<s_t>& corners)
{
  GAITKIT_THROW_IF(
      corners.size() != 2,
      InvalidPassbandException,
      "Passband must be a vector of length 2, got length "
          + std::to_string(corners.size()));
  return Passband(corners[0], corners[1]);
}

//==============================================================================
FilterCoefficients designButterworth(
    const Passband& passband, s_t sampleRate, int order)
{
  GAITKIT_THROW_IF(
      order < 1, std::invalid_argument, "Filter order must be positive");
  GAITKIT_THROW_IF(
      !(sampleRate > 0),
      std::invalid_argument,
      "Sample rate must be positive");
  GAITKIT_THROW_IF(
      !isfinite(passband.low) || !isfinite(passband.high) || passband.low < 0
          || passband.high < 0,
      InvalidPassbandException,
      "Passband corners must be finite and non-negative");
  GAITKIT_THROW_IF(
      passband.low == 0 && passband.high == 0,
      InvalidPassbandException,
      "Passband corners cannot both be zero");

  // Corners normalized to the Nyquist frequency
  const s_t lowN = 2.0 * passband.low / sampleRate;
  const s_t highN = 2.0 * passband.high / sampleRate;
  GAITKIT_THROW_IF(
      lowN >= 1.0 || highN >= 1.0,
      InvalidPassbandException,
      "Passband corners must be below the Nyquist frequency ("
          + std::to_string(sampleRate / 2.0) + " Hz)");
  GAITKIT_THROW_IF(
      lowN > 0 && highN > 0 && lowN >= highN,
      InvalidPassbandException,
      "Band pass lower corner must be below the upper corner");

  // Analog prototype, poles on the left half of the unit circle
  std::vector<c_t> zeros;
  std::vector<c_t> poles;
  for (int m = -order + 1; m < order; m += 2)
  {
    poles.push_back(-std::exp(c_t(0.0, M_PI * m / (2.0 * order))));
  }
  s_t gain = 1.0;

  // Pre-warp corners for the bilinear transform (normalized fs = 2)
  const s_t fs = 2.0;
  auto warp = [&](s_t wn) { return 2.0 * fs * std::tan(M_PI * wn / fs); };

  if (lowN == 0)
  {
    // low pass
    const s_t wo = warp(highN);
    for (c_t& p : poles)
    {
      p *= wo;
    }
    gain *= std::pow(wo, order);
  }
  else if (highN == 0)
  {
    // high pass
    const s_t wo = warp(lowN);
    gain *= std::real(c_t(1.0, 0.0) / product(poles, c_t(0.0, 0.0), true));
    for (c_t& p : poles)
    {
      p = wo / p;
    }
    zeros.assign(order, c_t(0.0, 0.0));
  }
  else
  {
    // band pass
    const s_t w1 = warp(lowN);
    const s_t w2 = warp(highN);
    const s_t bw = w2 - w1;
    const s_t wo = std::sqrt(w1 * w2);
    std::vector<c_t> bandPoles;
    for (const c_t& p : poles)
    {
      c_t pLow = p * bw / 2.0;
      c_t root = std::sqrt(pLow * pLow - wo * wo);
      bandPoles.push_back(pLow + root);
    }
    for (const c_t& p : poles)
    {
      c_t pLow = p * bw / 2.0;
      c_t root = std::sqrt(pLow * pLow - wo * wo);
      bandPoles.push_back(pLow - root);
    }
    poles = bandPoles;
    zeros.assign(order, c_t(0.0, 0.0));
    gain *= std::pow(bw, order);
  }

  // Bilinear transform to the z-plane
  const s_t fs2 = 2.0 * fs;
  const int degree = poles.size() - zeros.size();
  gain *= std::real(
      product(zeros, c_t(fs2, 0.0), true)
      / product(poles, c_t(fs2, 0.0), true));
  std::vector<c_t> zZeros;
  std::vector<c_t> zPoles;
  for (const c_t& z : zeros)
  {
    zZeros.push_back((fs2 + z) / (fs2 - z));
  }
  for (const c_t& p : poles)
  {
    zPoles.push_back((fs2 + p) / (fs2 - p));
  }
  for (int i = 0; i < degree; i++)
  {
    zZeros.push_back(c_t(-1.0, 0.0));
  }

  std::vector<c_t> num = polyFromRoots(zZeros);
  std::vector<c_t> den = polyFromRoots(zPoles);

  FilterCoefficients filter;
  filter.b = Eigen::VectorXs(num.size());
  filter.a = Eigen::VectorXs(den.size());
  for (std::size_t i = 0; i < num.size(); i++)
  {
    filter.b(i) = gain * std::real(num[i]);
  }
  for (std::size_t i = 0; i < den.size(); i++)
  {
    filter.a(i) = std::real(den[i]);
  }
  return filter;
}

//==============================================================================
Eigen::VectorXs lfilter(
    const FilterCoefficients& filter,
    const Eigen::VectorXs& x,
    Eigen::VectorXs* zi)
{
  const int n = std::max(filter.a.size(), filter.b.size());
  GAITKIT_THROW_IF(
      filter.a.size() == 0 || filter.a(0) == 0,
      std::invalid_argument,
      "Filter denominator must have a non-zero leading coefficient");

  Eigen::VectorXs a = Eigen::VectorXs::Zero(n);
  Eigen::VectorXs b = Eigen::VectorXs::Zero(n);
  a.head(filter.a.size()) = filter.a / filter.a(0);
  b.head(filter.b.size()) = filter.b / filter.a(0);

  Eigen::VectorXs state = Eigen::VectorXs::Zero(n - 1);
  if (zi != nullptr && zi->size() == n - 1)
  {
    state = *zi;
  }

  Eigen::VectorXs y(x.size());
  for (int i = 0; i < x.size(); i++)
  {
    const s_t xi = x(i);
    const s_t yi = (n > 1 ? state(0) : 0.0) + b(0) * xi;
    for (int j = 0; j < n - 2; j++)
    {
      state(j) = state(j + 1) + b(j + 1) * xi - a(j + 1) * yi;
    }
    if (n > 1)
    {
      state(n - 2) = b(n - 1) * xi - a(n - 1) * yi;
    }
    y(i) = yi;
  }

  if (zi != nullptr)
  {
    *zi = state;
  }
  return y;
}

//==============================================================================
Eigen::VectorXs lfilterInitialState(const FilterCoefficients& filter)
{
  const int n = std::max(filter.a.size(), filter.b.size());
  if (n < 2)
  {
    return Eigen::VectorXs::Zero(0);
  }

  Eigen::VectorXs a = Eigen::VectorXs::Zero(n);
  Eigen::VectorXs b = Eigen::VectorXs::Zero(n);
  a.head(filter.a.size()) = filter.a / filter.a(0);
  b.head(filter.b.size()) = filter.b / filter.a(0);

  // (I - A^T) zi = B, where A is the companion matrix of a
  Eigen::MatrixXs companion = Eigen::MatrixXs::Zero(n - 1, n - 1);
  companion.row(0) = -a.tail(n - 1).transpose();
  for (int i = 1; i < n - 1; i++)
  {
    companion(i, i - 1) = 1.0;
  }
  Eigen::MatrixXs iMinusA
      = Eigen::MatrixXs::Identity(n - 1, n - 1) - companion.transpose();
  Eigen::VectorXs rhs = b.tail(n - 1) - a.tail(n - 1) * b(0);
  return iMinusA.colPivHouseholderQr().solve(rhs);
}

//==============================================================================
Eigen::VectorXs filtfilt(
    const FilterCoefficients& filter, const Eigen::VectorXs& x)
{
  const int n = x.size();
  if (n < 2)
  {
    return x;
  }
  const int order = std::max(filter.a.size(), filter.b.size());
  const int padLen = std::min(3 * order, n - 1);

  // Odd extension at both ends
  Eigen::VectorXs ext(n + 2 * padLen);
  for (int i = 0; i < padLen; i++)
  {
    ext(i) = 2.0 * x(0) - x(padLen - i);
    ext(n + padLen + i) = 2.0 * x(n - 1) - x(n - 2 - i);
  }
  ext.segment(padLen, n) = x;

  const Eigen::VectorXs zi = lfilterInitialState(filter);

  Eigen::VectorXs state = zi * ext(0);
  Eigen::VectorXs forward = lfilter(filter, ext, &state);

  Eigen::VectorXs reversed = forward.reverse();
  state = zi * reversed(0);
  Eigen::VectorXs backward = lfilter(filter, reversed, &state);

  return backward.reverse().segment(padLen, n);
}

//==============================================================================
Eigen::VectorXs forwardBackwardFilter(
    const Eigen::VectorXs& data,
    const std::optional<Passband>& passband,
    s_t sampleRate,
    int order)
{
  if (!passband)
  {
    return data;
  }
  FilterCoefficients filter = designButterworth(*passband, sampleRate, order);
  return filtfilt(filter, data);
}

//==============================================================================
Eigen::VectorXs forwardBackwardFilter(
    const Eigen::VectorXs& data,
    const std::vector<s_t>& passband,
    s_t sampleRate,
    int order)
{
  return forwardBackwardFilter(
      data,
      std::optional<Passband>(Passband::fromVector(passband)),
      sampleRate,
      order);
}

} // namespace math
} // namespace gaitkit
