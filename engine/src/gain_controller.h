#pragma once

#include <cstdint>
#include <utility>
#include <vector>

#include "duck_config.h"
#include "graph_bridge.h"
#include "stream_registry.h"

namespace pwduck::duck
{

  // Drives currentGain toward targetGain on every bridge tick.
  //
  // Ramps are linear in amplitude and time based: a ramp started at gain g0 reaches its
  // target exactly rampDurationMs later, whatever the tick rate, and never overshoots.
  // Retargeting mid-ramp starts a fresh ramp from the current gain.
  class GainController
  {
  public:
    struct Parameters
    {
      uint32_t rampDurationMs = 200;
      float volumeWriteEpsilon = 0.005f;
    };

    static constexpr float kSnapEpsilon = 1e-4f;

    GainController() : GainController(Parameters{}) {}
    explicit GainController(const Parameters &params) : params_(params) {}

    static Parameters parametersFrom(const config::DuckConfig &cfg);

    struct TickResult
    {
      std::vector<GraphNodeId> reached; // streams that arrived at targetGain this tick
      std::vector<std::pair<GraphNodeId, graph::GraphError>> failures;
      uint32_t writes = 0;
    };

    static void retarget(TrackedStream &s, float target, graph::Timestamp ts);

    // Moves s along its ramp. Returns true when it arrived at targetGain on this call.
    bool advance(TrackedStream &s, graph::Timestamp ts) const;

    // Advances every duck target and writes volumes that moved far enough from the last
    // written value. A settled gain is always written until it sticks.
    TickResult tick(StreamRegistry &registry, graph::GraphBridge &bridge, graph::Timestamp ts) const;

    // Unconditional write of currentGain; updates write bookkeeping on success.
    bool write(TrackedStream &s, graph::GraphBridge &bridge, graph::Timestamp ts, graph::GraphError &err) const;

    const Parameters &parameters() const { return params_; }

  private:
    bool needsWrite(const TrackedStream &s, bool settled) const;

    Parameters params_;
  };

} // namespace pwduck::duck
