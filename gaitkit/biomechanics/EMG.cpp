#include "gaitkit/biomechanics/EMG.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>

#include "gaitkit/common/Console.hpp"
#include "gaitkit/common/Exceptions.hpp"

namespace gaitkit {

namespace biomechanics {

namespace {

//==============================================================================
std::string toUpper(std::string s)
{
  std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) {
    return std::toupper(c);
  });
  return s;
}

} // namespace

//==============================================================================
EMG::EMG(
    const std::map<std::string, Eigen::VectorXs>& channels,
    s_t sampleRate,
    const EmgConfig& config,
    s_t correctionFactor)
  : mChannels(channels),
    mSampleRate(sampleRate),
    mConfig(config),
    mCorrectionFactor(correctionFactor)
{
  GAITKIT_THROW_IF(
      !(mSampleRate > 0),
      GaitDataException,
      "EMG sample rate must be positive");
  GAITKIT_THROW_IF(
      mConfig.rmsWindow < 1,
      std::invalid_argument,
      "EMG RMS window must be at least one sample");
}

//==============================================================================
EMG EMG::fromSource(
    const MocapSource& source,
    const std::string& deviceName,
    const EmgConfig& config,
    s_t correctionFactor)
{
  TrialMetadata metadata = source.getMetadata();
  gkdbg << "reading EMG from " << metadata.trialName << std::endl;
  AnalogData analog = source.getAnalogData(deviceName);
  s_t sampleRate
      = analog.sampleRate > 0 ? analog.sampleRate : metadata.analogRate;
  return EMG(analog.channels, sampleRate, config, correctionFactor);
}

//==============================================================================
std::string EMG::matchChannelName(const std::string& name) const
{
  GAITKIT_THROW_IF(
      name.size() < 2,
      std::invalid_argument,
      "invalid channel name: '" + name + "'");

  std::vector<std::string> matches;
  for (const auto& pair : mChannels)
  {
    if (pair.first.find(name) != std::string::npos)
    {
      matches.push_back(pair.first);
    }
  }
  if (matches.empty())
  {
    GAITKIT_THROW(NoMatchingChannelException, name);
  }

  const std::string& shortest = *std::min_element(
      matches.begin(),
      matches.end(),
      [](const std::string& a, const std::string& b) {
        return a.size() < b.size();
      });
  if (matches.size() > 1)
  {
    gkwarn << "multiple channel matches for " << name << ":";
    for (const std::string& match : matches)
    {
      std::cerr << " " << match;
    }
    std::cerr << " -> " << shortest << std::endl;
  }
  return shortest;
}

//==============================================================================
bool EMG::hasChannel(const std::string& name) const
{
  try
  {
    matchChannelName(name);
  }
  catch (const NoMatchingChannelException&)
  {
    return false;
  }
  return true;
}

//==============================================================================
Eigen::VectorXs EMG::getChannelData(const std::string& name, bool rms) const
{
  Eigen::VectorXs data = mChannels.at(matchChannelName(name));
  if (rms)
  {
    data = math::movingRMS(data, mConfig.rmsWindow);
  }
  else if (mConfig.passband)
  {
    data = filter(data, *mConfig.passband);
  }
  return data * mCorrectionFactor;
}

//==============================================================================
Eigen::VectorXs EMG::getRawData(const std::string& name) const
{
  return mChannels.at(matchChannelName(name));
}

//==============================================================================
bool EMG::isValid(const std::string& name) const
{
  const Eigen::VectorXs& data = mChannels.at(matchChannelName(name));
  if (data.size() == 0)
  {
    return false;
  }
  s_t variance = (data.array() - data.mean()).square().mean();
  return mConfig.minVariance < variance && variance < mConfig.maxVariance;
}

//==============================================================================
bool EMG::statusOk(const std::string& name) const
{
  if (!hasChannel(name))
  {
    return false;
  }
  if (mConfig.disabledChannels.count(name) > 0)
  {
    return false;
  }
  return mConfig.autodetectBadChannels ? isValid(name) : true;
}

//==============================================================================
Eigen::VectorXs EMG::filter(
    const Eigen::VectorXs& data, const math::Passband& passband) const
{
  return math::forwardBackwardFilter(
      data, passband, mSampleRate, mConfig.filterOrder);
}

//==============================================================================
bool EMG::contextMatches(
    const std::string& channelName, const std::string& context) const
{
  auto it = mConfig.channelContext.find(channelName);
  if (it == mConfig.channelContext.end())
  {
    return true;
  }
  return toUpper(context) == toUpper(it->second);
}

//==============================================================================
bool EMG::contextMatches(const std::string& channelName, Side side) const
{
  return contextMatches(channelName, sideToContext(side));
}

//==============================================================================
std::vector<std::string> EMG::getChannelNames() const
{
  std::vector<std::string> names;
  for (const auto& pair : mChannels)
  {
    names.push_back(pair.first);
  }
  return names;
}

//==============================================================================
s_t EMG::getSampleRate() const
{
  return mSampleRate;
}

//==============================================================================
s_t EMG::getCorrectionFactor() const
{
  return mCorrectionFactor;
}

//==============================================================================
const EmgConfig& EMG::getConfig() const
{
  return mConfig;
}

//==============================================================================
AveragedEMG::AveragedEMG(
    const std::map<std::string, Eigen::VectorXs>& rmsData,
    const EmgConfig& config)
  : EMG(rmsData, 1.0, config, 1.0)
{
}

//==============================================================================
Eigen::VectorXs AveragedEMG::getChannelData(
    const std::string& name, bool rms) const
{
  GAITKIT_THROW_IF(
      !rms,
      UnsupportedOperationException,
      "Averaged EMG can only return averaged RMS data");
  return mChannels.at(matchChannelName(name));
}

//==============================================================================
Eigen::VectorXs AveragedEMG::getRawData(const std::string& /*name*/) const
{
  GAITKIT_THROW(
      UnsupportedOperationException, "Averaged EMG has no raw data");
}

//==============================================================================
bool AveragedEMG::isValid(const std::string& /*name*/) const
{
  GAITKIT_THROW(
      UnsupportedOperationException,
      "Signal check not implemented for averaged EMG");
}

//==============================================================================
bool AveragedEMG::statusOk(const std::string& name) const
{
  return hasChannel(name);
}

//==============================================================================
Eigen::VectorXs AveragedEMG::filter(
    const Eigen::VectorXs& /*data*/, const math::Passband& /*passband*/) const
{
  GAITKIT_THROW(
      UnsupportedOperationException,
      "Filtering not implemented for averaged EMG");
}

} // namespace biomechanics
} // namespace gaitkit
