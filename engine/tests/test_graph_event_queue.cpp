#include <catch2/catch_test_macros.hpp>

#include <stdexcept>
#include <string>
#include <vector>

#include "fake_graph_bridge.h"
#include "graph_bridge.h"

using namespace pwduck;
using namespace pwduck::graph;
using namespace pwduck::test;

namespace
{
  struct RecordingListener : GraphListener
  {
    std::vector<std::string> log;
    GraphEventQueue *queue = nullptr;
    bool pushOnAdd = false;
    bool throwOnRemove = false;
    size_t nestedDrained = 0;

    void onNodeAdded(GraphNodeId id, const NodeMetadata &, Timestamp ts) override
    {
      log.push_back("add " + std::to_string(id));
      if (pushOnAdd && queue)
      {
        // Raised from inside a callback: must be queued, not delivered re-entrantly.
        queue->push(LevelSampleEvent{id, 0.5f, ts});
        nestedDrained += queue->drain(*this);
        log.push_back("add done " + std::to_string(id));
      }
    }

    void onNodeRemoved(GraphNodeId id, Timestamp) override
    {
      if (throwOnRemove)
        throw std::runtime_error("boom");
      log.push_back("remove " + std::to_string(id));
    }

    void onLevelSample(GraphNodeId id, float, Timestamp) override
    {
      log.push_back("level " + std::to_string(id));
    }

    void onTick(Timestamp) override { log.push_back("tick"); }
  };
} // namespace

TEST_CASE("events are delivered in arrival order", "[queue]")
{
  GraphEventQueue q;
  RecordingListener l;

  q.push(NodeAddedEvent{4, playback("music"), at(0)});
  q.push(TickEvent{at(1)});
  q.push(LevelSampleEvent{4, 0.1f, at(2)});
  q.push(NodeRemovedEvent{4, at(3)});
  REQUIRE(q.size() == 4);

  REQUIRE(q.drain(l) == 4);
  REQUIRE(q.empty());
  REQUIRE(l.log == std::vector<std::string>{"add 4", "tick", "level 4", "remove 4"});
}

TEST_CASE("events raised during dispatch run after the current one", "[queue]")
{
  GraphEventQueue q;
  RecordingListener l;
  l.queue = &q;
  l.pushOnAdd = true;

  q.push(NodeAddedEvent{1, playback("a"), at(0)});
  q.push(TickEvent{at(1)});

  REQUIRE(q.drain(l) == 3);
  REQUIRE(l.nestedDrained == 0);
  REQUIRE(l.log == std::vector<std::string>{"add 1", "add done 1", "tick", "level 1"});
}

TEST_CASE("a failing handler does not stall later events", "[queue]")
{
  GraphEventQueue q;
  RecordingListener l;
  l.throwOnRemove = true;

  q.push(NodeRemovedEvent{2, at(0)});
  q.push(TickEvent{at(1)});

  REQUIRE(q.drain(l) == 2);
  REQUIRE(l.log == std::vector<std::string>{"tick"});

  // The queue is usable again afterwards.
  q.push(TickEvent{at(2)});
  REQUIRE(q.drain(l) == 1);
}

TEST_CASE("error kinds have stable names", "[queue]")
{
  REQUIRE(std::string(graphErrorKindName(GraphErrorKind::Connection)) == "GraphConnectionError");
  REQUIRE(std::string(graphErrorKindName(GraphErrorKind::Write)) == "GraphWriteError");
}
