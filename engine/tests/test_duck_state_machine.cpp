#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "duck_state_machine.h"
#include "fake_graph_bridge.h"
#include "gain_controller.h"

using namespace pwduck;
using namespace pwduck::test;
using duck::DuckState;
using Catch::Approx;

namespace
{
  struct Fixture
  {
    duck::StreamRegistry reg{config::VoiceSourcePolicy::FirstWins};
    duck::DuckStateMachine machine{0.25f};
    duck::GainController gain{duck::GainController::Parameters{100, 0.0f}};
    FakeGraphBridge bridge;

    Fixture()
    {
      reg.registerStream(1, duck::StreamRole::DuckTarget, playback("music"));
      reg.registerStream(2, duck::StreamRole::DuckTarget, playback("video"));
      reg.registerStream(3, duck::StreamRole::DuckTarget, playback("game"));
      reg.registerStream(9, duck::StreamRole::VoiceSource, voiceStream());
    }

    duck::TrackedStream &s(GraphNodeId id) { return *reg.find(id); }

    void tick(int ms)
    {
      auto res = gain.tick(reg, bridge, at(ms));
      for (auto id : res.reached)
        machine.onGainReachedTarget(*reg.find(id));
    }
  };
} // namespace

TEST_CASE("activity fans out to every target at once", "[machine]")
{
  Fixture f;

  REQUIRE(f.machine.onActivityChanged(true, f.reg, at(0)) == 3);
  for (GraphNodeId id : {1u, 2u, 3u})
  {
    REQUIRE(f.s(id).duckState == DuckState::Ducking);
    REQUIRE(f.s(id).targetGain == 0.25f);
  }

  // The voice source is never ducked.
  REQUIRE(f.s(9).duckState == DuckState::Unducked);
  REQUIRE(f.s(9).targetGain == 1.0f);

  // Repeating the same activity changes nothing.
  REQUIRE(f.machine.onActivityChanged(true, f.reg, at(10)) == 0);
}

TEST_CASE("full duck and unduck cycle", "[machine]")
{
  Fixture f;
  f.machine.onActivityChanged(true, f.reg, at(0));

  f.tick(50);
  REQUIRE(f.s(1).duckState == DuckState::Ducking);
  f.tick(100);
  REQUIRE(f.s(1).duckState == DuckState::Ducked);
  REQUIRE(f.s(1).currentGain == 0.25f);

  f.machine.onActivityChanged(false, f.reg, at(200));
  REQUIRE(f.s(1).duckState == DuckState::Unducking);
  REQUIRE(f.s(1).targetGain == 1.0f);

  f.tick(300);
  REQUIRE(f.s(1).duckState == DuckState::Unducked);
  REQUIRE(f.s(1).currentGain == 1.0f);
}

TEST_CASE("activation while unducking reverses immediately", "[machine]")
{
  Fixture f;
  f.machine.onActivityChanged(true, f.reg, at(0));
  f.tick(100);
  f.machine.onActivityChanged(false, f.reg, at(100));
  f.tick(150);

  const float mid = f.s(1).currentGain;
  REQUIRE(mid == Approx(0.625f));

  f.machine.onActivityChanged(true, f.reg, at(150));
  REQUIRE(f.s(1).duckState == DuckState::Ducking);
  REQUIRE(f.s(1).targetGain == 0.25f);
  REQUIRE(f.s(1).rampStartGain == mid);

  // The gain heads down from where it was, it does not jump back to unity first.
  f.tick(160);
  REQUIRE(f.s(1).currentGain < mid);
}

TEST_CASE("deactivation while ducking reverses immediately", "[machine]")
{
  Fixture f;
  f.machine.onActivityChanged(true, f.reg, at(0));
  f.tick(40);
  REQUIRE(f.s(1).duckState == DuckState::Ducking);

  f.machine.onActivityChanged(false, f.reg, at(40));
  REQUIRE(f.s(1).duckState == DuckState::Unducking);
  REQUIRE(f.s(1).targetGain == 1.0f);
}

TEST_CASE("activity that flaps before any tick settles without a ramp", "[machine]")
{
  Fixture f;
  f.machine.onActivityChanged(true, f.reg, at(0));
  f.machine.onActivityChanged(false, f.reg, at(1));
  REQUIRE(f.s(1).duckState == DuckState::Unducked);
  REQUIRE(f.s(1).currentGain == 1.0f);
}

TEST_CASE("late targets join the current activity", "[machine]")
{
  Fixture f;
  f.machine.onActivityChanged(true, f.reg, at(0));

  f.reg.registerStream(4, duck::StreamRole::DuckTarget, playback("late"));
  f.machine.onTargetAdded(f.s(4), true, at(30));
  REQUIRE(f.s(4).duckState == DuckState::Ducking);
  REQUIRE(f.s(4).targetGain == 0.25f);

  f.reg.registerStream(5, duck::StreamRole::DuckTarget, playback("quiet"));
  f.machine.onTargetAdded(f.s(5), false, at(30));
  REQUIRE(f.s(5).duckState == DuckState::Unducked);
}

TEST_CASE("changing attenuation retargets ducked streams", "[machine]")
{
  Fixture f;
  f.machine.onActivityChanged(true, f.reg, at(0));
  f.tick(100);
  REQUIRE(f.s(1).duckState == DuckState::Ducked);

  REQUIRE(f.machine.setAttenuation(0.5f, f.reg, at(200)) == 3);
  REQUIRE(f.machine.attenuation() == 0.5f);
  REQUIRE(f.s(1).duckState == DuckState::Ducking);
  REQUIRE(f.s(1).targetGain == 0.5f);

  f.tick(300);
  REQUIRE(f.s(1).duckState == DuckState::Ducked);
  REQUIRE(f.s(1).currentGain == 0.5f);

  SECTION("unducked streams only pick it up on the next activation")
  {
    f.machine.onActivityChanged(false, f.reg, at(400));
    f.tick(500);
    REQUIRE(f.machine.setAttenuation(0.1f, f.reg, at(500)) == 0);
    REQUIRE(f.s(1).targetGain == 1.0f);

    f.machine.onActivityChanged(true, f.reg, at(600));
    REQUIRE(f.s(1).targetGain == 0.1f);
  }
}
