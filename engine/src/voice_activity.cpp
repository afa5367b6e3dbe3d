#include "voice_activity.h"

#include <algorithm>
#include <cmath>

namespace pwduck::duck
{

  VoiceActivityMonitor::VoiceActivityMonitor(const Parameters &params)
  {
    setParameters(params);
  }

  void VoiceActivityMonitor::setParameters(const Parameters &params)
  {
    params_ = params;
    params_.activateSampleCount = std::max<uint32_t>(1, params_.activateSampleCount);
    params_.deactivateSampleCount = std::max<uint32_t>(1, params_.deactivateSampleCount);
  }

  VoiceActivityMonitor::Parameters VoiceActivityMonitor::parametersFrom(const config::DuckConfig &cfg)
  {
    Parameters p;
    p.activationThresholdDb = cfg.activationThresholdDb;
    p.deactivationThresholdDb = cfg.deactivationThresholdDb;
    p.activateSampleCount = cfg.activateSampleCount;
    p.deactivateSampleCount = cfg.deactivateSampleCount;
    return p;
  }

  float VoiceActivityMonitor::levelToDb(float level)
  {
    return 20.0f * std::log10(std::fabs(level) + 1e-8f);
  }

  bool VoiceActivityMonitor::setActive(bool active, graph::Timestamp ts)
  {
    state_.consecutiveSampleCount = 0;
    if (state_.isActive == active)
      return false;
    state_.isActive = active;
    state_.lastTransitionTimestamp = ts;
    return true;
  }

  bool VoiceActivityMonitor::attach(graph::GraphNodeId id, graph::Timestamp ts)
  {
    if (source_ && *source_ == id)
      return false;
    source_ = id;
    samplesSinceAttach_ = 0;
    return setActive(false, ts);
  }

  bool VoiceActivityMonitor::detach(graph::Timestamp ts)
  {
    source_.reset();
    samplesSinceAttach_ = 0;
    return setActive(false, ts);
  }

  bool VoiceActivityMonitor::pushSample(graph::GraphNodeId id, float level, graph::Timestamp ts)
  {
    if (!source_ || *source_ != id)
      return false;

    samplesSinceAttach_++;
    const float db = levelToDb(level);
    lastLevelDb_ = db;

    const bool above = db > params_.activationThresholdDb;
    const bool below = db < params_.deactivationThresholdDb;

    if (!state_.isActive)
    {
      if (!above)
      {
        state_.consecutiveSampleCount = 0;
        return false;
      }
      if (++state_.consecutiveSampleCount >= params_.activateSampleCount)
        return setActive(true, ts);
      return false;
    }

    if (!below)
    {
      state_.consecutiveSampleCount = 0;
      return false;
    }
    if (++state_.consecutiveSampleCount >= params_.deactivateSampleCount)
      return setActive(false, ts);
    return false;
  }

} // namespace pwduck::duck
