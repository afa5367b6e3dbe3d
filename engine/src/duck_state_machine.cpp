#include "duck_state_machine.h"

#include "gain_controller.h"

namespace pwduck::duck
{

  void DuckStateMachine::enter(TrackedStream &s, DuckState next, float target, Timestamp ts)
  {
    s.duckState = next;
    GainController::retarget(s, target, ts);

    // Nothing to ramp (activity flapped before the first tick): settle right away.
    if (s.currentGain == s.targetGain)
      onGainReachedTarget(s);
  }

  bool DuckStateMachine::apply(TrackedStream &s, bool active, Timestamp ts)
  {
    if (s.role != StreamRole::DuckTarget)
      return false;

    switch (s.duckState)
    {
    case DuckState::Unducked:
    case DuckState::Unducking:
      if (!active)
        return false;
      enter(s, DuckState::Ducking, attenuation_, ts);
      return true;

    case DuckState::Ducking:
    case DuckState::Ducked:
      if (active)
        return false;
      enter(s, DuckState::Unducking, 1.0f, ts);
      return true;
    }
    return false;
  }

  size_t DuckStateMachine::onActivityChanged(bool active, StreamRegistry &registry, Timestamp ts)
  {
    size_t changed = 0;
    registry.forEachTarget([&](TrackedStream &s)
                           {
      if (apply(s, active, ts))
        changed++; });
    return changed;
  }

  void DuckStateMachine::onGainReachedTarget(TrackedStream &s)
  {
    if (s.duckState == DuckState::Ducking)
      s.duckState = DuckState::Ducked;
    else if (s.duckState == DuckState::Unducking)
      s.duckState = DuckState::Unducked;
  }

  size_t DuckStateMachine::setAttenuation(float factor, StreamRegistry &registry, Timestamp ts)
  {
    attenuation_ = factor;

    size_t changed = 0;
    registry.forEachTarget([&](TrackedStream &s)
                           {
      if (s.duckState != DuckState::Ducking && s.duckState != DuckState::Ducked)
        return;
      if (s.targetGain == factor)
        return;
      enter(s, DuckState::Ducking, factor, ts);
      changed++; });
    return changed;
  }

} // namespace pwduck::duck
