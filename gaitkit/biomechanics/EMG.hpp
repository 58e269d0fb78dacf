#ifndef GAITKIT_BIOMECH_EMG_HPP_
#define GAITKIT_BIOMECH_EMG_HPP_

#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <Eigen/Dense>

#include "gaitkit/biomechanics/GaitEvent.hpp"
#include "gaitkit/biomechanics/MocapSource.hpp"
#include "gaitkit/math/MathTypes.hpp"
#include "gaitkit/math/SignalProcessing.hpp"

namespace gaitkit {

namespace biomechanics {

struct EmgConfig
{
  // Band pass applied to the channel data. No filtering if empty.
  std::optional<math::Passband> passband = math::Passband(10, 400);
  int filterOrder = 5;
  // Moving RMS window, in samples
  int rmsWindow = 31;
  // A channel is valid if the variance of its raw data is strictly between
  // these (V^2)
  s_t minVariance = 1e-10;
  s_t maxVariance = 1e-6;
  // Anatomical side ("L" or "R") of configured channel names
  std::map<std::string, std::string> channelContext;
  // Configured channel names that are known to be bad
  std::set<std::string> disabledChannels;
  bool autodetectBadChannels = true;
};

/// EMG channels of one trial.
///
/// Channels are looked up by a short configured name, which is matched
/// against the recorded channel names by substring. When several recorded
/// names contain the short name, the shortest one is used (e.g. "LGas" picks
/// "Voltage.LGas8" over "Voltage.LGas8_filtered").
class EMG
{
public:
  /// Throws GaitDataException unless the sample rate is positive
  EMG(const std::map<std::string, Eigen::VectorXs>& channels,
      s_t sampleRate,
      const EmgConfig& config = EmgConfig(),
      s_t correctionFactor = 1.0);

  virtual ~EMG() = default;

  /// Reads the channels of an analog device. The sample rate of the device is
  /// used if known, otherwise the analog rate of the trial.
  static EMG fromSource(
      const MocapSource& source,
      const std::string& deviceName,
      const EmgConfig& config = EmgConfig(),
      s_t correctionFactor = 1.0);

  /// Resolves a short name to a recorded channel name. Warns if there are
  /// several matches. Throws std::invalid_argument if the name is shorter
  /// than 2 characters, and NoMatchingChannelException if nothing matches.
  std::string matchChannelName(const std::string& name) const;

  bool hasChannel(const std::string& name) const;

  /// Band pass filtered channel data, or its moving RMS if `rms` is set. The
  /// result is multiplied by the correction factor.
  virtual Eigen::VectorXs getChannelData(
      const std::string& name, bool rms = false) const;

  /// Unfiltered channel data
  virtual Eigen::VectorXs getRawData(const std::string& name) const;

  /// True if the raw data variance is within the configured range
  virtual bool isValid(const std::string& name) const;

  /// True if the channel exists, is not disabled, and (when bad channel
  /// detection is on) is valid
  virtual bool statusOk(const std::string& name) const;

  /// Forward-backward Butterworth filtering at this EMG's sample rate
  virtual Eigen::VectorXs filter(
      const Eigen::VectorXs& data, const math::Passband& passband) const;

  /// False only if the configured channel has a side and it differs from
  /// `context` (compared ignoring case). No name matching is done here.
  bool contextMatches(
      const std::string& channelName, const std::string& context) const;

  bool contextMatches(const std::string& channelName, Side side) const;

  std::vector<std::string> getChannelNames() const;

  s_t getSampleRate() const;

  s_t getCorrectionFactor() const;

  const EmgConfig& getConfig() const;

protected:
  std::map<std::string, Eigen::VectorXs> mChannels;
  s_t mSampleRate;
  EmgConfig mConfig;
  s_t mCorrectionFactor;
};

/// Averaged RMS EMG, e.g. over the cycles of several trials. Only the RMS
/// data exists, so every operation that needs a raw waveform throws
/// UnsupportedOperationException.
class AveragedEMG : public EMG
{
public:
  AveragedEMG(
      const std::map<std::string, Eigen::VectorXs>& rmsData,
      const EmgConfig& config = EmgConfig());

  /// Returns the stored RMS data. Throws UnsupportedOperationException
  /// unless `rms` is set.
  Eigen::VectorXs getChannelData(
      const std::string& name, bool rms = false) const override;

  Eigen::VectorXs getRawData(const std::string& name) const override;

  bool isValid(const std::string& name) const override;

  /// Same as hasChannel()
  bool statusOk(const std::string& name) const override;

  Eigen::VectorXs filter(
      const Eigen::VectorXs& data,
      const math::Passband& passband) const override;
};

} // namespace biomechanics
} // namespace gaitkit

#endif
