#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

#include "duck_config.h"
#include "duck_state_machine.h"
#include "gain_controller.h"
#include "graph_bridge.h"
#include "stream_registry.h"
#include "voice_activity.h"

namespace pwduck::duck
{

  enum class ControlMode
  {
    Auto,           // follow the voice activity monitor
    ManualDucked,   // activity forced true
    ManualRestored, // activity forced false
  };

  const char *controlModeName(ControlMode mode);

  // Accepts "auto", "duck" and "restore".
  std::optional<ControlMode> parseControlMode(const std::string &s);

  struct EngineStats
  {
    uint64_t nodesAdded = 0;
    uint64_t nodesRemoved = 0;
    uint64_t nodesIgnored = 0;
    uint64_t levelSamples = 0;
    uint64_t activityTransitions = 0;
    uint64_t volumeWrites = 0;
    uint64_t writeFailures = 0;
  };

  // Ties registry, activity monitor, state machine and gain controller to one bridge.
  // Every method runs on the event-loop thread.
  class DuckEngine : public graph::GraphListener
  {
  public:
    static constexpr auto kCaptureIdleWarning = std::chrono::seconds(3);
    static constexpr auto kStatsInterval = std::chrono::seconds(1);
    static constexpr uint32_t kMaxHoldSamples = 10000;

    DuckEngine(const config::DuckConfig &cfg, graph::GraphBridge &bridge);
    ~DuckEngine() override;

    DuckEngine(const DuckEngine &) = delete;
    DuckEngine &operator=(const DuckEngine &) = delete;

    bool start(graph::GraphError &err);
    bool run(graph::GraphError &err);

    // Puts every target back at unity, flushes and disconnects. Safe to call twice.
    void stop();

    void onNodeAdded(graph::GraphNodeId id, const graph::NodeMetadata &meta, graph::Timestamp ts) override;
    void onNodeRemoved(graph::GraphNodeId id, graph::Timestamp ts) override;
    void onLevelSample(graph::GraphNodeId id, float level, graph::Timestamp ts) override;
    void onTick(graph::Timestamp ts) override;

    void setMode(ControlMode mode, graph::Timestamp ts);
    bool setAttenuation(float factor, graph::Timestamp ts, std::string &err);

    // Moves the activation threshold (dBFS, [-120, 0]); the deactivation threshold
    // follows so the hysteresis band keeps its width.
    bool setThreshold(float db, std::string &err);

    // Number of consecutive quiet samples before voice counts as gone.
    bool setHold(uint32_t samples, std::string &err);

    ControlMode mode() const { return mode_; }
    bool effectiveActivity() const;
    bool started() const { return started_; }

    const config::DuckConfig &config() const { return cfg_; }
    const StreamRegistry &registry() const { return registry_; }
    const VoiceActivityMonitor &monitor() const { return monitor_; }
    const EngineStats &stats() const { return stats_; }

  private:
    void dropStream(graph::GraphNodeId id, graph::Timestamp ts);
    void attachMonitor(std::optional<graph::GraphNodeId> id, graph::Timestamp ts);
    void syncActivity(graph::Timestamp ts);
    void checkCaptureIdle(graph::Timestamp ts);
    void logStats(graph::Timestamp ts);
    void restoreAll();

    config::DuckConfig cfg_;
    graph::GraphBridge &bridge_;

    StreamClassifier classifier_;
    StreamRegistry registry_;
    VoiceActivityMonitor monitor_;
    DuckStateMachine machine_;
    GainController gain_;

    ControlMode mode_ = ControlMode::Auto;
    bool appliedActivity_ = false; // last value fanned out to the targets
    bool started_ = false;

    graph::Timestamp lastFrameAt_{};
    bool captureIdleWarned_ = false;
    graph::Timestamp lastStatsAt_{};

    EngineStats stats_;
  };

} // namespace pwduck::duck
