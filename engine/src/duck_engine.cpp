#include "duck_engine.h"

#include <cstdio>

namespace pwduck::duck
{

  const char *controlModeName(ControlMode mode)
  {
    switch (mode)
    {
    case ControlMode::Auto:
      return "auto";
    case ControlMode::ManualDucked:
      return "duck";
    case ControlMode::ManualRestored:
      return "restore";
    }
    return "unknown";
  }

  std::optional<ControlMode> parseControlMode(const std::string &s)
  {
    if (s == "auto")
      return ControlMode::Auto;
    if (s == "duck")
      return ControlMode::ManualDucked;
    if (s == "restore")
      return ControlMode::ManualRestored;
    return std::nullopt;
  }

  DuckEngine::DuckEngine(const config::DuckConfig &cfg, graph::GraphBridge &bridge)
      : cfg_(cfg),
        bridge_(bridge),
        classifier_(cfg),
        registry_(cfg.voiceSourcePolicy),
        monitor_(VoiceActivityMonitor::parametersFrom(cfg)),
        machine_(cfg.attenuationFactor),
        gain_(GainController::parametersFrom(cfg))
  {
  }

  DuckEngine::~DuckEngine()
  {
    stop();
  }

  bool DuckEngine::start(graph::GraphError &err)
  {
    if (started_)
      return true;
    if (!bridge_.connect(*this, err))
      return false;
    started_ = true;
    std::fprintf(stderr, "Duck: started (voice='%s', attenuation=%.2f, threshold=%.1f/%.1f dB, ramp=%u ms)\n",
                 cfg_.voiceApplicationMatcher.c_str(), cfg_.attenuationFactor,
                 cfg_.activationThresholdDb, cfg_.deactivationThresholdDb, cfg_.rampDurationMs);
    return true;
  }

  bool DuckEngine::run(graph::GraphError &err)
  {
    if (!started_)
    {
      err.kind = graph::GraphErrorKind::Connection;
      err.message = "engine not started";
      return false;
    }
    return bridge_.run(err);
  }

  void DuckEngine::restoreAll()
  {
    registry_.forEachTarget([&](TrackedStream &s)
                            {
      const bool touched = s.currentGain < 1.0f || s.lastWrittenGain.value_or(1.0f) < 1.0f;
      s.currentGain = 1.0f;
      s.targetGain = 1.0f;
      s.rampStartGain = 1.0f;
      s.duckState = DuckState::Unducked;
      if (!touched)
        return;

      graph::GraphError err;
      if (gain_.write(s, bridge_, graph::Clock::now(), err))
      {
        stats_.volumeWrites++;
      }
      else
      {
        stats_.writeFailures++;
        std::fprintf(stderr, "Duck: failed to restore volume of %u (%s): %s\n",
                     s.id, s.meta.label().c_str(), err.message.c_str());
      } });
  }

  void DuckEngine::stop()
  {
    if (!started_)
      return;
    started_ = false;

    restoreAll();
    bridge_.stopLevelMonitor();

    graph::GraphError err;
    if (!bridge_.flush(err))
      std::fprintf(stderr, "Duck: flush on shutdown failed: %s\n", err.message.c_str());

    bridge_.disconnect();
    std::fprintf(stderr, "Duck: stopped, volumes restored\n");
  }

  bool DuckEngine::effectiveActivity() const
  {
    switch (mode_)
    {
    case ControlMode::ManualDucked:
      return true;
    case ControlMode::ManualRestored:
      return false;
    case ControlMode::Auto:
      break;
    }
    return monitor_.isActive();
  }

  void DuckEngine::syncActivity(graph::Timestamp ts)
  {
    const bool active = effectiveActivity();
    if (active == appliedActivity_)
      return;

    appliedActivity_ = active;
    stats_.activityTransitions++;
    const size_t n = machine_.onActivityChanged(active, registry_, ts);
    std::fprintf(stderr, "Duck: %s (%zu stream%s)\n", active ? "ducking" : "restoring", n, n == 1 ? "" : "s");
  }

  void DuckEngine::attachMonitor(std::optional<graph::GraphNodeId> id, graph::Timestamp ts)
  {
    bridge_.stopLevelMonitor();

    if (!id)
    {
      monitor_.detach(ts);
      std::fprintf(stderr, "Duck: no voice source\n");
      syncActivity(ts);
      return;
    }

    monitor_.attach(*id, ts);
    lastFrameAt_ = ts;
    captureIdleWarned_ = false;

    const TrackedStream *s = registry_.find(*id);
    std::fprintf(stderr, "Duck: voice source is %u (%s)\n", *id, s ? s->meta.label().c_str() : "?");

    graph::GraphError err;
    if (!bridge_.startLevelMonitor(*id, err))
      std::fprintf(stderr, "Duck: level monitor for %u failed: %s\n", *id, err.message.c_str());

    syncActivity(ts);
  }

  void DuckEngine::dropStream(graph::GraphNodeId id, graph::Timestamp ts)
  {
    const RegistryUpdate up = registry_.unregisterStream(id);
    if (up.applied && up.voice == VoiceSourceChange::Changed)
      attachMonitor(registry_.activeVoice(), ts);
  }

  void DuckEngine::onNodeAdded(graph::GraphNodeId id, const graph::NodeMetadata &meta, graph::Timestamp ts)
  {
    stats_.nodesAdded++;

    if (registry_.contains(id))
    {
      // The removal was missed; whatever we knew about this id is stale.
      std::fprintf(stderr, "Duck: node %u announced again, replacing\n", id);
      dropStream(id, ts);
    }

    std::string note;
    const StreamRole role = classifier_.classify(meta, &note);
    if (role == StreamRole::Ignored)
    {
      stats_.nodesIgnored++;
      if (cfg_.verbose)
        std::fprintf(stderr, "Duck: ignoring %u (%s): %s\n", id, meta.label().c_str(), note.c_str());
      return;
    }

    const RegistryUpdate up = registry_.registerStream(id, role, meta);
    if (!up.applied)
      return;

    std::fprintf(stderr, "Duck: + %u %s (%s)\n", id, streamRoleName(role), meta.label().c_str());

    if (role == StreamRole::DuckTarget)
    {
      if (TrackedStream *s = registry_.find(id))
        machine_.onTargetAdded(*s, appliedActivity_, ts);
      return;
    }

    if (up.voice == VoiceSourceChange::Standby)
    {
      std::fprintf(stderr, "Duck: multiple voice sources, %u kept on standby (policy %s)\n",
                   id, config::voiceSourcePolicyName(cfg_.voiceSourcePolicy));
      return;
    }
    if (up.voice == VoiceSourceChange::Changed)
    {
      if (registry_.standbyVoices().size() > 0)
        std::fprintf(stderr, "Duck: multiple voice sources, %u takes over (policy %s)\n",
                     id, config::voiceSourcePolicyName(cfg_.voiceSourcePolicy));
      attachMonitor(registry_.activeVoice(), ts);
    }
  }

  void DuckEngine::onNodeRemoved(graph::GraphNodeId id, graph::Timestamp ts)
  {
    stats_.nodesRemoved++;

    const TrackedStream *s = registry_.find(id);
    if (!s)
      return;

    std::fprintf(stderr, "Duck: - %u %s (%s)\n", id, streamRoleName(s->role), s->meta.label().c_str());
    dropStream(id, ts);
  }

  void DuckEngine::onLevelSample(graph::GraphNodeId id, float level, graph::Timestamp ts)
  {
    const auto source = monitor_.source();
    if (!source || *source != id)
      return;

    stats_.levelSamples++;
    lastFrameAt_ = ts;
    if (captureIdleWarned_)
    {
      captureIdleWarned_ = false;
      std::fprintf(stderr, "Duck: capture of voice source %u resumed\n", id);
    }

    if (!monitor_.pushSample(id, level, ts))
      return;

    if (cfg_.verbose)
      std::fprintf(stderr, "Duck: voice %s (%.1f dB)\n", monitor_.isActive() ? "active" : "inactive", monitor_.lastLevelDb());

    if (mode_ == ControlMode::Auto)
      syncActivity(ts);
  }

  void DuckEngine::onTick(graph::Timestamp ts)
  {
    const GainController::TickResult res = gain_.tick(registry_, bridge_, ts);
    stats_.volumeWrites += res.writes;

    for (const auto &f : res.failures)
    {
      stats_.writeFailures++;
      std::fprintf(stderr, "Duck: %s on %u: %s\n", graph::graphErrorKindName(f.second.kind), f.first,
                   f.second.message.c_str());
    }

    for (GraphNodeId id : res.reached)
    {
      TrackedStream *s = registry_.find(id);
      if (!s)
        continue;
      machine_.onGainReachedTarget(*s);
      if (cfg_.verbose)
        std::fprintf(stderr, "Duck: %u %s at %.3f\n", id, duckStateName(s->duckState), s->currentGain);
    }

    checkCaptureIdle(ts);
    if (cfg_.logStats)
      logStats(ts);
  }

  void DuckEngine::checkCaptureIdle(graph::Timestamp ts)
  {
    const auto source = monitor_.source();
    if (!source || captureIdleWarned_)
      return;
    if (ts - lastFrameAt_ < kCaptureIdleWarning)
      return;

    captureIdleWarned_ = true;
    std::fprintf(stderr, "Duck: CAPTURE IDLE: no audio from voice source %u for %lld s; the capture stream is probably not linked\n",
                 *source, (long long)std::chrono::duration_cast<std::chrono::seconds>(ts - lastFrameAt_).count());
  }

  void DuckEngine::logStats(graph::Timestamp ts)
  {
    if (lastStatsAt_ == graph::Timestamp{})
    {
      lastStatsAt_ = ts;
      return;
    }
    if (ts - lastStatsAt_ < kStatsInterval)
      return;
    lastStatsAt_ = ts;

    const auto source = monitor_.source();
    std::fprintf(stderr,
                 "Duck: stats mode=%s voice=%d active=%d level=%.1fdB streams=%zu targets=%zu "
                 "added=%llu removed=%llu samples=%llu transitions=%llu writes=%llu failures=%llu\n",
                 controlModeName(mode_), source ? (int)*source : -1, effectiveActivity() ? 1 : 0,
                 monitor_.lastLevelDb(), registry_.size(), registry_.targetCount(),
                 (unsigned long long)stats_.nodesAdded, (unsigned long long)stats_.nodesRemoved,
                 (unsigned long long)stats_.levelSamples, (unsigned long long)stats_.activityTransitions,
                 (unsigned long long)stats_.volumeWrites, (unsigned long long)stats_.writeFailures);
  }

  void DuckEngine::setMode(ControlMode mode, graph::Timestamp ts)
  {
    if (mode == mode_)
      return;
    mode_ = mode;
    std::fprintf(stderr, "Duck: mode %s\n", controlModeName(mode));
    syncActivity(ts);
  }

  bool DuckEngine::setAttenuation(float factor, graph::Timestamp ts, std::string &err)
  {
    if (!(factor > 0.0f && factor < 1.0f))
    {
      err = "attenuation factor must be in (0, 1)";
      return false;
    }
    cfg_.attenuationFactor = factor;
    const size_t n = machine_.setAttenuation(factor, registry_, ts);
    std::fprintf(stderr, "Duck: attenuation %.2f (%zu stream%s retargeted)\n", factor, n, n == 1 ? "" : "s");
    return true;
  }

  bool DuckEngine::setThreshold(float db, std::string &err)
  {
    if (!(db >= -120.0f && db <= 0.0f))
    {
      err = "threshold must be in [-120, 0] dBFS";
      return false;
    }
    config::setActivationThreshold(cfg_, db);
    monitor_.setParameters(VoiceActivityMonitor::parametersFrom(cfg_));
    std::fprintf(stderr, "Duck: threshold %.1f/%.1f dB\n", cfg_.activationThresholdDb, cfg_.deactivationThresholdDb);
    return true;
  }

  bool DuckEngine::setHold(uint32_t samples, std::string &err)
  {
    if (samples < 1 || samples > kMaxHoldSamples)
    {
      err = "hold must be between 1 and " + std::to_string(kMaxHoldSamples) + " samples";
      return false;
    }
    cfg_.deactivateSampleCount = samples;
    monitor_.setParameters(VoiceActivityMonitor::parametersFrom(cfg_));
    std::fprintf(stderr, "Duck: hold %u samples\n", samples);
    return true;
  }

} // namespace pwduck::duck
