#include "graph_bridge.h"

#include <cstdio>
#include <exception>
#include <utility>

namespace pwduck::graph
{

  const char *graphErrorKindName(GraphErrorKind kind)
  {
    switch (kind)
    {
    case GraphErrorKind::None:
      return "none";
    case GraphErrorKind::Connection:
      return "GraphConnectionError";
    case GraphErrorKind::Write:
      return "GraphWriteError";
    }
    return "unknown";
  }

  namespace
  {
    struct Deliver
    {
      GraphListener &listener;

      void operator()(const NodeAddedEvent &e) const { listener.onNodeAdded(e.id, e.meta, e.ts); }
      void operator()(const NodeRemovedEvent &e) const { listener.onNodeRemoved(e.id, e.ts); }
      void operator()(const LevelSampleEvent &e) const { listener.onLevelSample(e.id, e.level, e.ts); }
      void operator()(const TickEvent &e) const { listener.onTick(e.ts); }
    };
  } // namespace

  void GraphEventQueue::push(GraphEvent ev)
  {
    events_.push_back(std::move(ev));
  }

  size_t GraphEventQueue::drain(GraphListener &listener)
  {
    if (draining_)
      return 0;

    draining_ = true;
    size_t delivered = 0;
    while (!events_.empty())
    {
      GraphEvent ev = std::move(events_.front());
      events_.pop_front();
      try
      {
        std::visit(Deliver{listener}, ev);
      }
      catch (const std::exception &e)
      {
        // One bad event must not stall the ones queued behind it.
        std::fprintf(stderr, "PW: event handler failed: %s\n", e.what());
      }
      delivered++;
    }
    draining_ = false;
    return delivered;
  }

} // namespace pwduck::graph
