#pragma once

#include <deque>
#include <variant>

#include "graph_types.h"

namespace pwduck::graph
{

  // Receives typed graph events. All calls happen on the event-loop thread, in delivery order.
  class GraphListener
  {
  public:
    virtual ~GraphListener() = default;

    virtual void onNodeAdded(GraphNodeId id, const NodeMetadata &meta, Timestamp ts) = 0;
    virtual void onNodeRemoved(GraphNodeId id, Timestamp ts) = 0;
    virtual void onLevelSample(GraphNodeId id, float level, Timestamp ts) = 0;
    virtual void onTick(Timestamp ts) = 0;
  };

  // The only way the rest of the engine talks to the audio server.
  class GraphBridge
  {
  public:
    virtual ~GraphBridge() = default;

    // Opens the session and starts delivering events to listener. Listener must outlive the session.
    virtual bool connect(GraphListener &listener, GraphError &err) = 0;

    // Dispatches events until quit() or connection loss. Returns false with a Connection error on loss.
    virtual bool run(GraphError &err) = 0;
    virtual void quit() = 0;

    // Releases the connection. No graph calls are issued afterwards.
    virtual void disconnect() = 0;

    // Fire-and-forget. Writes to unknown ids (node just removed) are dropped and return true.
    virtual bool setStreamVolume(GraphNodeId id, float gain, GraphError &err) = 0;

    virtual bool startLevelMonitor(GraphNodeId id, GraphError &err) = 0;
    virtual void stopLevelMonitor() = 0;

    // Round-trip to the server so every issued request has been processed.
    virtual bool flush(GraphError &err) = 0;
  };

  struct NodeAddedEvent
  {
    GraphNodeId id = 0;
    NodeMetadata meta;
    Timestamp ts;
  };

  struct NodeRemovedEvent
  {
    GraphNodeId id = 0;
    Timestamp ts;
  };

  struct LevelSampleEvent
  {
    GraphNodeId id = 0;
    float level = 0.0f;
    Timestamp ts;
  };

  struct TickEvent
  {
    Timestamp ts;
  };

  using GraphEvent = std::variant<NodeAddedEvent, NodeRemovedEvent, LevelSampleEvent, TickEvent>;

  // Turns server callbacks into typed events processed strictly in arrival order.
  // An event pushed while a dispatch is running (e.g. raised from inside a listener call)
  // is appended and handled after the current one instead of recursing.
  class GraphEventQueue
  {
  public:
    void push(GraphEvent ev);

    // Delivers every queued event to listener. Returns number of events delivered.
    size_t drain(GraphListener &listener);

    bool empty() const { return events_.empty(); }
    size_t size() const { return events_.size(); }
    void clear() { events_.clear(); }

  private:
    std::deque<GraphEvent> events_;
    bool draining_ = false;
  };

} // namespace pwduck::graph
