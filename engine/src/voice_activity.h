#pragma once

#include <cstdint>
#include <optional>

#include "duck_config.h"
#include "graph_types.h"

namespace pwduck::duck
{

  struct ActivityState
  {
    bool isActive = false;
    graph::Timestamp lastTransitionTimestamp{};
    // Length of the current run of samples pointing away from isActive.
    uint32_t consecutiveSampleCount = 0;
  };

  // Debounced voice activity detector for a single voice source.
  //
  // A sample louder than activationThresholdDb counts toward activation, one quieter than
  // deactivationThresholdDb toward deactivation. Samples inside the band, or agreeing with
  // the current state, break the run. The state flips only after a full run.
  class VoiceActivityMonitor
  {
  public:
    struct Parameters
    {
      float activationThresholdDb = -30.0f;
      float deactivationThresholdDb = -36.0f;
      uint32_t activateSampleCount = 3;
      uint32_t deactivateSampleCount = 15;
    };

    VoiceActivityMonitor() : VoiceActivityMonitor(Parameters{}) {}
    explicit VoiceActivityMonitor(const Parameters &params);

    static Parameters parametersFrom(const config::DuckConfig &cfg);

    // Takes effect from the next sample. The current run and state are kept, so a run
    // that already meets a shortened count flips on the next sample.
    void setParameters(const Parameters &params);
    const Parameters &parameters() const { return params_; }

    // Switches the monitored source. Any previous activity is dropped: the new source
    // starts inactive. Returns true when isActive changed.
    bool attach(graph::GraphNodeId id, graph::Timestamp ts);

    // No source: activity is forced false and held. Returns true when isActive changed.
    bool detach(graph::Timestamp ts);

    // Level is normalized linear amplitude (1.0 = full scale). Samples from any node other
    // than the attached source are ignored. Returns true exactly when isActive flipped.
    bool pushSample(graph::GraphNodeId id, float level, graph::Timestamp ts);

    std::optional<graph::GraphNodeId> source() const { return source_; }
    const ActivityState &state() const { return state_; }
    bool isActive() const { return state_.isActive; }
    uint64_t samplesSinceAttach() const { return samplesSinceAttach_; }
    float lastLevelDb() const { return lastLevelDb_; }

    static float levelToDb(float level);

  private:
    bool setActive(bool active, graph::Timestamp ts);

    Parameters params_;
    ActivityState state_;
    std::optional<graph::GraphNodeId> source_;
    uint64_t samplesSinceAttach_ = 0;
    float lastLevelDb_ = -160.0f;
  };

} // namespace pwduck::duck
