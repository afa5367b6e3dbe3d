#include "gain_controller.h"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace pwduck::duck
{

  static inline float clamp01(float v) { return (v < 0.0f) ? 0.0f : (v > 1.0f) ? 1.0f
                                                                             : v; }

  GainController::Parameters GainController::parametersFrom(const config::DuckConfig &cfg)
  {
    Parameters p;
    p.rampDurationMs = cfg.rampDurationMs;
    p.volumeWriteEpsilon = cfg.volumeWriteEpsilon;
    return p;
  }

  void GainController::retarget(TrackedStream &s, float target, graph::Timestamp ts)
  {
    s.targetGain = clamp01(target);
    s.rampStartGain = s.currentGain;
    s.rampStartTime = ts;
  }

  bool GainController::advance(TrackedStream &s, graph::Timestamp ts) const
  {
    if (s.currentGain == s.targetGain)
      return false;

    double frac = 1.0;
    if (params_.rampDurationMs > 0)
    {
      const double elapsedMs = std::chrono::duration<double, std::milli>(ts - s.rampStartTime).count();
      frac = std::clamp(elapsedMs / (double)params_.rampDurationMs, 0.0, 1.0);
    }

    const float next = clamp01(s.rampStartGain + (s.targetGain - s.rampStartGain) * (float)frac);

    // Out-of-order timestamps must not pull the gain back along the ramp.
    if (std::fabs(s.targetGain - next) > std::fabs(s.targetGain - s.currentGain))
      return false;

    if (frac >= 1.0 || std::fabs(s.targetGain - next) <= kSnapEpsilon)
    {
      s.currentGain = s.targetGain;
      return true;
    }
    s.currentGain = next;
    return false;
  }

  bool GainController::needsWrite(const TrackedStream &s, bool settled) const
  {
    // The server starts every stream at unity.
    const float last = s.lastWrittenGain.value_or(1.0f);
    if (last == s.currentGain)
      return false;
    if (settled)
      return true;
    return std::fabs(s.currentGain - last) > params_.volumeWriteEpsilon;
  }

  bool GainController::write(TrackedStream &s, graph::GraphBridge &bridge, graph::Timestamp ts, graph::GraphError &err) const
  {
    if (!bridge.setStreamVolume(s.id, s.currentGain, err))
      return false;
    s.lastWrittenGain = s.currentGain;
    s.lastVolumeWriteTimestamp = ts;
    return true;
  }

  GainController::TickResult GainController::tick(StreamRegistry &registry, graph::GraphBridge &bridge, graph::Timestamp ts) const
  {
    TickResult res;
    registry.forEachTarget([&](TrackedStream &s)
                           {
      const bool arrived = advance(s, ts);
      if (arrived)
        res.reached.push_back(s.id);

      // A settled stream is written until the server holds its exact gain.
      if (!needsWrite(s, s.currentGain == s.targetGain))
        return;

      graph::GraphError err;
      if (write(s, bridge, ts, err))
        res.writes++;
      else
        res.failures.emplace_back(s.id, err); });
    return res;
  }

} // namespace pwduck::duck
