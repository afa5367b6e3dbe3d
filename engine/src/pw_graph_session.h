#pragma once

#include <cstdint>
#include <map>
#include <memory>
#include <optional>
#include <set>
#include <string>

#include <pipewire/pipewire.h>

#include "duck_config.h"
#include "graph_bridge.h"

namespace pwduck::graph
{

  // GraphBridge over one PipeWire connection driven by a pw_main_loop.
  //
  // Everything (registry, node info, level capture, ticks, signals and any IO source
  // added through loop()) is dispatched on the thread calling run().
  class PwGraphSession : public GraphBridge
  {
  public:
    struct Options
    {
      uint32_t tickIntervalMs = 20;
      config::LevelMetric levelMetric = config::LevelMetric::Rms;
      bool verbose = false;
      uint32_t flushTimeoutMs = 1000;
    };

    explicit PwGraphSession(const Options &opts);
    ~PwGraphSession() override;

    PwGraphSession(const PwGraphSession &) = delete;
    PwGraphSession &operator=(const PwGraphSession &) = delete;

    static Options optionsFrom(const config::DuckConfig &cfg);

    bool connect(GraphListener &listener, GraphError &err) override;
    bool run(GraphError &err) override;
    void quit() override;
    void disconnect() override;

    bool setStreamVolume(GraphNodeId id, float gain, GraphError &err) override;
    bool startLevelMonitor(GraphNodeId id, GraphError &err) override;
    void stopLevelMonitor() override;
    bool flush(GraphError &err) override;

    // Valid between connect() and disconnect().
    pw_loop *loop() const { return loop_; }

    // PipeWire callbacks; data is the session (node info: its NodeBinding).
    static void onRegistryGlobal(void *data, uint32_t id, uint32_t permissions,
                                 const char *type, uint32_t version, const spa_dict *props);
    static void onRegistryGlobalRemove(void *data, uint32_t id);
    static void onNodeInfo(void *data, const pw_node_info *info);
    static void onCoreDone(void *data, uint32_t id, int seq);
    static void onCoreError(void *data, uint32_t id, int seq, int res, const char *message);
    static void onCaptureStateChanged(void *data, pw_stream_state oldState, pw_stream_state state, const char *error);
    static void onCaptureParamChanged(void *data, uint32_t id, const spa_pod *param);
    static void onCaptureProcess(void *data);
    static void onTimer(void *data, uint64_t expirations);
    static void onSignal(void *data, int signalNumber);

  private:
    struct NodeBinding
    {
      PwGraphSession *session = nullptr;
      GraphNodeId id = 0;
      pw_proxy *proxy = nullptr;
      spa_hook listener{};
      bool announced = false;
      NodeMetadata meta;
    };

    void push(GraphEvent ev);
    void destroyBinding(NodeBinding &b);
    void failConnection(const std::string &message);

    Options opts_;
    GraphListener *listener_ = nullptr;
    GraphEventQueue queue_;
    bool delivering_ = false;

    pw_main_loop *mainLoop_ = nullptr;
    pw_loop *loop_ = nullptr;
    pw_context *context_ = nullptr;
    pw_core *core_ = nullptr;
    pw_registry *registry_ = nullptr;
    spa_hook coreListener_{};
    spa_hook registryListener_{};

    spa_source *timer_ = nullptr;
    spa_source *sigint_ = nullptr;
    spa_source *sigterm_ = nullptr;

    std::map<GraphNodeId, std::unique_ptr<NodeBinding>> bindings_;
    std::set<GraphNodeId> announcedPlain_; // non-playback nodes announced from global props

    pw_stream *capture_ = nullptr;
    spa_hook captureListener_{};
    std::optional<GraphNodeId> captureNode_;
    uint32_t captureFormat_ = 0;

    int pendingSync_ = -1;
    bool syncDone_ = false;

    std::optional<GraphError> connectionError_;
  };

} // namespace pwduck::graph
