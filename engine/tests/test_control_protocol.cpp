#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>

#include "control_protocol.h"
#include "fake_graph_bridge.h"

using namespace pwduck;
using namespace pwduck::test;
using control::Json;
using Catch::Approx;

namespace
{
  struct Harness
  {
    FakeGraphBridge bridge;
    duck::DuckEngine engine;

    Harness() : engine(config::DuckConfig{}, bridge)
    {
      graph::GraphError err;
      REQUIRE(engine.start(err));
      engine.onNodeAdded(10, voiceStream(), at(0));
      engine.onNodeAdded(11, voiceStream(), at(0));
      engine.onNodeAdded(20, playback("Spotify", "Music"), at(0));
    }

    Json request(const Json &req) { return control::handleRequest(engine, req); }
  };

  bool failedWith(const Json &resp, const std::string &msg)
  {
    return resp.value("ok", true) == false && resp.value("error", std::string()) == msg;
  }
} // namespace

TEST_CASE("status reports the engine view", "[control]")
{
  Harness h;
  Json st = h.request({{"cmd", "status"}});

  REQUIRE(st["ok"] == true);
  REQUIRE(st["mode"] == "auto");
  REQUIRE(st["voiceSource"] == 10);
  REQUIRE(st["standbyVoices"] == Json::array({11}));
  REQUIRE(st["voiceActive"] == false);
  REQUIRE(st["ducking"] == false);
  REQUIRE(st["attenuationFactor"].get<float>() == Approx(0.2f));
  REQUIRE(st["stats"]["nodesAdded"] == 3);

  REQUIRE(st["streams"].size() == 3);
  for (const auto &s : st["streams"])
  {
    if (s["id"] == 20)
    {
      REQUIRE(s["role"] == "target");
      REQUIRE(s["state"] == "unducked");
      REQUIRE(s["currentGain"].get<float>() == 1.0f);
    }
    else
    {
      REQUIRE(s["role"] == "voice");
      REQUIRE_FALSE(s.contains("state"));
    }
  }
}

TEST_CASE("status with no voice source", "[control]")
{
  FakeGraphBridge bridge;
  duck::DuckEngine engine(config::DuckConfig{}, bridge);
  Json st = control::statusToJson(engine);
  REQUIRE(st["voiceSource"].is_null());
  REQUIRE(st["streams"].empty());
}

TEST_CASE("set_mode forces ducking", "[control]")
{
  Harness h;

  Json r = h.request({{"cmd", "set_mode"}, {"mode", "duck"}});
  REQUIRE(r["ok"] == true);
  REQUIRE(r["mode"] == "duck");
  REQUIRE(h.engine.mode() == duck::ControlMode::ManualDucked);
  REQUIRE(h.engine.effectiveActivity());
  REQUIRE(h.engine.registry().find(20)->targetGain == Approx(0.2f));

  r = h.request({{"cmd", "set_mode"}, {"mode", "auto"}});
  REQUIRE(r["mode"] == "auto");
  REQUIRE_FALSE(h.engine.effectiveActivity());

  REQUIRE(failedWith(h.request({{"cmd", "set_mode"}, {"mode", "loud"}}), "mode must be auto, duck or restore"));
  REQUIRE(failedWith(h.request({{"cmd", "set_mode"}}), "missing string mode"));
  REQUIRE(h.engine.mode() == duck::ControlMode::Auto);
}

TEST_CASE("set_attenuation validates the factor", "[control]")
{
  Harness h;

  Json r = h.request({{"cmd", "set_attenuation"}, {"factor", 0.5}});
  REQUIRE(r["ok"] == true);
  REQUIRE(r["attenuationFactor"].get<float>() == Approx(0.5f));
  REQUIRE(h.engine.config().attenuationFactor == Approx(0.5f));

  r = h.request({{"cmd", "set_attenuation"}, {"factor", 1.5}});
  REQUIRE(r["ok"] == false);
  REQUIRE(h.engine.config().attenuationFactor == Approx(0.5f));

  REQUIRE(failedWith(h.request({{"cmd", "set_attenuation"}, {"factor", "half"}}), "missing number factor"));
}

TEST_CASE("get_config returns the running config", "[control]")
{
  Harness h;
  Json r = h.request({{"cmd", "get_config"}});
  REQUIRE(r["ok"] == true);
  REQUIRE(r["config"]["voiceApplicationMatcher"] == "WEBRTC VoiceEngine");
  REQUIRE(r["config"]["rampDurationMs"] == 200);
}

TEST_CASE("malformed requests", "[control]")
{
  Harness h;

  REQUIRE(failedWith(h.request(Json::array()), "request must be an object"));
  REQUIRE(failedWith(h.request({{"mode", "duck"}}), "missing string cmd"));
  REQUIRE(failedWith(h.request({{"cmd", "reboot"}}), "unknown cmd"));

  Json r = Json::parse(control::handleRequestLine(h.engine, "{not json"));
  REQUIRE(r["ok"] == false);
  REQUIRE(r["error"].get<std::string>().rfind("parse error", 0) == 0);

  r = Json::parse(control::handleRequestLine(h.engine, R"({"cmd":"status"})"));
  REQUIRE(r["ok"] == true);
}

TEST_CASE("set_threshold moves the detection band", "[control]")
{
  Harness h;

  Json r = h.request({{"cmd", "set_threshold"}, {"db", -40.0}});
  REQUIRE(r["ok"] == true);
  REQUIRE(r["activationThresholdDb"].get<float>() == Approx(-40.0f));
  REQUIRE(r["deactivationThresholdDb"].get<float>() == Approx(-46.0f));
  REQUIRE(h.engine.monitor().parameters().activationThresholdDb == Approx(-40.0f));

  // A level that was below the old threshold now activates the voice.
  for (int i = 0; i < 3; i++)
    h.engine.onLevelSample(10, amplitude(-35.0f), at(10 * i));
  REQUIRE(h.engine.effectiveActivity());

  REQUIRE(failedWith(h.request({{"cmd", "set_threshold"}, {"db", 6.0}}), "threshold must be in [-120, 0] dBFS"));
  REQUIRE(failedWith(h.request({{"cmd", "set_threshold"}}), "missing number db"));
  REQUIRE(h.engine.config().activationThresholdDb == Approx(-40.0f));
}

TEST_CASE("set_hold changes how long voice is held", "[control]")
{
  Harness h;

  Json r = h.request({{"cmd", "set_hold"}, {"samples", 2}});
  REQUIRE(r["ok"] == true);
  REQUIRE(r["deactivateSampleCount"] == 2);
  REQUIRE(h.engine.monitor().parameters().deactivateSampleCount == 2);
  REQUIRE(h.request({{"cmd", "status"}})["holdSamples"] == 2);

  for (int i = 0; i < 3; i++)
    h.engine.onLevelSample(10, amplitude(-20.0f), at(10 * i));
  REQUIRE(h.engine.effectiveActivity());
  h.engine.onLevelSample(10, amplitude(-60.0f), at(40));
  h.engine.onLevelSample(10, amplitude(-60.0f), at(50));
  REQUIRE_FALSE(h.engine.effectiveActivity());

  REQUIRE(h.request({{"cmd", "set_hold"}, {"samples", 0}})["ok"] == false);
  REQUIRE(h.request({{"cmd", "set_hold"}, {"samples", 99999999}})["ok"] == false);
  REQUIRE(failedWith(h.request({{"cmd", "set_hold"}, {"samples", -3}}), "missing non-negative integer samples"));
  REQUIRE(failedWith(h.request({{"cmd", "set_hold"}, {"samples", 1.5}}), "missing non-negative integer samples"));
  REQUIRE(h.engine.config().deactivateSampleCount == 2);
}
