#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "fake_graph_bridge.h"
#include "voice_activity.h"

using namespace pwduck;
using namespace pwduck::test;
using Catch::Approx;

namespace
{
  constexpr GraphNodeId kVoice = 42;

  const float kLoud = amplitude(-20.0f);
  const float kBand = amplitude(-33.0f);
  const float kQuiet = amplitude(-45.0f);

  duck::VoiceActivityMonitor makeMonitor(uint32_t activate = 3, uint32_t deactivate = 5)
  {
    duck::VoiceActivityMonitor::Parameters p;
    p.activationThresholdDb = -30.0f;
    p.deactivationThresholdDb = -36.0f;
    p.activateSampleCount = activate;
    p.deactivateSampleCount = deactivate;
    duck::VoiceActivityMonitor m(p);
    m.attach(kVoice, at(0));
    return m;
  }
} // namespace

TEST_CASE("levelToDb maps full scale to 0 dBFS", "[activity]")
{
  REQUIRE(duck::VoiceActivityMonitor::levelToDb(1.0f) == Approx(0.0f).margin(1e-4));
  REQUIRE(duck::VoiceActivityMonitor::levelToDb(0.1f) == Approx(-20.0f).margin(1e-3));
  REQUIRE(duck::VoiceActivityMonitor::levelToDb(0.0f) < -150.0f);
}

TEST_CASE("three loud samples activate exactly once", "[activity]")
{
  auto m = makeMonitor();

  int flips = 0;
  for (int i = 0; i < 3; i++)
    flips += m.pushSample(kVoice, kLoud, at(10 * i)) ? 1 : 0;

  REQUIRE(flips == 1);
  REQUIRE(m.isActive());
  REQUIRE(m.state().lastTransitionTimestamp == at(20));

  // More loud samples agree with the state: no further transitions.
  for (int i = 3; i < 10; i++)
    REQUIRE_FALSE(m.pushSample(kVoice, kLoud, at(10 * i)));
}

TEST_CASE("a single transient never flips the state", "[activity]")
{
  auto m = makeMonitor();

  REQUIRE_FALSE(m.pushSample(kVoice, kLoud, at(0)));
  REQUIRE_FALSE(m.pushSample(kVoice, kQuiet, at(10)));
  REQUIRE_FALSE(m.pushSample(kVoice, kLoud, at(20)));
  REQUIRE_FALSE(m.pushSample(kVoice, kLoud, at(30)));
  REQUIRE_FALSE(m.isActive());

  REQUIRE(m.pushSample(kVoice, kLoud, at(40)));
  REQUIRE(m.isActive());

  SECTION("one quiet sample while active is ignored")
  {
    REQUIRE_FALSE(m.pushSample(kVoice, kQuiet, at(50)));
    REQUIRE_FALSE(m.pushSample(kVoice, kLoud, at(60)));
    REQUIRE(m.isActive());
  }
}

TEST_CASE("samples inside the hysteresis band reset the run", "[activity]")
{
  auto m = makeMonitor(3, 3);

  m.pushSample(kVoice, kLoud, at(0));
  m.pushSample(kVoice, kLoud, at(10));
  REQUIRE(m.state().consecutiveSampleCount == 2);
  m.pushSample(kVoice, kBand, at(20));
  REQUIRE(m.state().consecutiveSampleCount == 0);
  REQUIRE_FALSE(m.isActive());

  for (int i = 0; i < 3; i++)
    m.pushSample(kVoice, kLoud, at(30 + 10 * i));
  REQUIRE(m.isActive());

  SECTION("band samples hold the active state")
  {
    for (int i = 0; i < 20; i++)
      REQUIRE_FALSE(m.pushSample(kVoice, kBand, at(100 + 10 * i)));
    REQUIRE(m.isActive());
  }

  SECTION("deactivation needs a full quiet run")
  {
    REQUIRE_FALSE(m.pushSample(kVoice, kQuiet, at(100)));
    REQUIRE_FALSE(m.pushSample(kVoice, kQuiet, at(110)));
    REQUIRE_FALSE(m.pushSample(kVoice, kBand, at(120)));
    REQUIRE_FALSE(m.pushSample(kVoice, kQuiet, at(130)));
    REQUIRE_FALSE(m.pushSample(kVoice, kQuiet, at(140)));
    REQUIRE(m.pushSample(kVoice, kQuiet, at(150)));
    REQUIRE_FALSE(m.isActive());
  }
}

TEST_CASE("samples from other nodes are ignored", "[activity]")
{
  auto m = makeMonitor(1, 1);

  REQUIRE_FALSE(m.pushSample(kVoice + 1, kLoud, at(0)));
  REQUIRE_FALSE(m.isActive());
  REQUIRE(m.samplesSinceAttach() == 0);

  REQUIRE(m.pushSample(kVoice, kLoud, at(10)));
  REQUIRE(m.samplesSinceAttach() == 1);
}

TEST_CASE("losing the voice source forces inactivity", "[activity]")
{
  auto m = makeMonitor(1, 10);
  REQUIRE(m.pushSample(kVoice, kLoud, at(0)));

  SECTION("detach")
  {
    REQUIRE(m.detach(at(10)));
    REQUIRE_FALSE(m.isActive());
    REQUIRE_FALSE(m.source().has_value());
    REQUIRE_FALSE(m.pushSample(kVoice, kLoud, at(20)));
    REQUIRE_FALSE(m.isActive());
  }

  SECTION("switching source starts inactive")
  {
    REQUIRE(m.attach(kVoice + 1, at(10)));
    REQUIRE_FALSE(m.isActive());
    REQUIRE(m.source() == kVoice + 1);
  }

  SECTION("re-attaching the same source keeps state")
  {
    REQUIRE_FALSE(m.attach(kVoice, at(10)));
    REQUIRE(m.isActive());
  }
}

TEST_CASE("parameters can change while a source is attached", "[activity]")
{
  auto m = makeMonitor(3, 5);

  SECTION("a lower threshold makes a quieter voice count")
  {
    const float soft = amplitude(-40.0f);
    for (int i = 0; i < 5; i++)
      REQUIRE_FALSE(m.pushSample(kVoice, soft, at(10 * i)));

    auto p = m.parameters();
    p.activationThresholdDb = -45.0f;
    p.deactivationThresholdDb = -51.0f;
    m.setParameters(p);

    m.pushSample(kVoice, soft, at(50));
    m.pushSample(kVoice, soft, at(60));
    REQUIRE(m.pushSample(kVoice, soft, at(70)));
    REQUIRE(m.isActive());
  }

  SECTION("a shorter hold releases on the next quiet sample")
  {
    for (int i = 0; i < 3; i++)
      m.pushSample(kVoice, kLoud, at(10 * i));
    REQUIRE(m.isActive());

    REQUIRE_FALSE(m.pushSample(kVoice, kQuiet, at(30)));
    REQUIRE_FALSE(m.pushSample(kVoice, kQuiet, at(40)));

    auto p = m.parameters();
    p.deactivateSampleCount = 2;
    m.setParameters(p);
    REQUIRE(m.source() == kVoice);
    REQUIRE(m.isActive());

    REQUIRE(m.pushSample(kVoice, kQuiet, at(50)));
    REQUIRE_FALSE(m.isActive());
  }

  SECTION("counts are kept at one or more")
  {
    auto p = m.parameters();
    p.activateSampleCount = 0;
    m.setParameters(p);
    REQUIRE(m.parameters().activateSampleCount == 1);
    REQUIRE(m.pushSample(kVoice, kLoud, at(0)));
  }
}
