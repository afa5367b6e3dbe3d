#pragma once

#include <cstddef>

#include "stream_registry.h"

namespace pwduck::duck
{

  // Per-target ducking machine: Unducked -> Ducking -> Ducked -> Unducking -> Unducked.
  //
  // Activity changes retarget the gain immediately, including mid-ramp in either direction.
  // Ramp completion (reported by the gain controller) settles Ducking and Unducking.
  class DuckStateMachine
  {
  public:
    explicit DuckStateMachine(float attenuationFactor) : attenuation_(attenuationFactor) {}

    // Applies one activity value to one target. Returns true if it changed state.
    bool apply(TrackedStream &s, bool active, Timestamp ts);

    // Fans the activity value out to every DuckTarget. Returns how many changed state.
    size_t onActivityChanged(bool active, StreamRegistry &registry, Timestamp ts);

    // A new target joins under whatever activity is currently in effect.
    void onTargetAdded(TrackedStream &s, bool active, Timestamp ts) { apply(s, active, ts); }

    void onGainReachedTarget(TrackedStream &s);

    // Streams in Ducking or Ducked ramp to the new factor.
    size_t setAttenuation(float factor, StreamRegistry &registry, Timestamp ts);

    float attenuation() const { return attenuation_; }

  private:
    void enter(TrackedStream &s, DuckState next, float target, Timestamp ts);

    float attenuation_;
  };

} // namespace pwduck::duck
