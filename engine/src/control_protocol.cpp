#include "control_protocol.h"

#include <cstdint>

namespace pwduck::control
{

  static Json fail(const std::string &msg)
  {
    return Json{{"ok", false}, {"error", msg}};
  }

  Json statusToJson(const duck::DuckEngine &engine)
  {
    const auto &registry = engine.registry();
    const auto &monitor = engine.monitor();
    const auto &stats = engine.stats();

    Json streams = Json::array();
    for (const auto &kv : registry.streams())
    {
      const duck::TrackedStream &s = kv.second;
      Json js{
          {"id", s.id},
          {"role", duck::streamRoleName(s.role)},
          {"app", s.meta.label()},
          {"media", s.meta.mediaName},
      };
      if (s.role == duck::StreamRole::DuckTarget)
      {
        js["state"] = duck::duckStateName(s.duckState);
        js["currentGain"] = s.currentGain;
        js["targetGain"] = s.targetGain;
      }
      streams.push_back(std::move(js));
    }

    Json standby = Json::array();
    for (auto id : registry.standbyVoices())
      standby.push_back(id);

    Json voice = nullptr;
    if (auto id = registry.activeVoice())
      voice = *id;

    return Json{
        {"ok", true},
        {"mode", duck::controlModeName(engine.mode())},
        {"voiceSource", voice},
        {"standbyVoices", standby},
        {"voiceActive", monitor.isActive()},
        {"ducking", engine.effectiveActivity()},
        {"levelDb", monitor.lastLevelDb()},
        {"attenuationFactor", engine.config().attenuationFactor},
        {"activationThresholdDb", engine.config().activationThresholdDb},
        {"deactivationThresholdDb", engine.config().deactivationThresholdDb},
        {"holdSamples", engine.config().deactivateSampleCount},
        {"streams", streams},
        {"stats",
         {
             {"nodesAdded", stats.nodesAdded},
             {"nodesRemoved", stats.nodesRemoved},
             {"nodesIgnored", stats.nodesIgnored},
             {"levelSamples", stats.levelSamples},
             {"activityTransitions", stats.activityTransitions},
             {"volumeWrites", stats.volumeWrites},
             {"writeFailures", stats.writeFailures},
         }},
    };
  }

  Json handleRequest(duck::DuckEngine &engine, const Json &req)
  {
    if (!req.is_object())
      return fail("request must be an object");

    if (!req.contains("cmd") || !req["cmd"].is_string())
      return fail("missing string cmd");

    const std::string cmd = req["cmd"].get<std::string>();

    if (cmd == "status")
      return statusToJson(engine);

    if (cmd == "get_config")
      return Json{{"ok", true}, {"config", config::configToJson(engine.config())}};

    if (cmd == "set_mode")
    {
      if (!req.contains("mode") || !req["mode"].is_string())
        return fail("missing string mode");

      auto mode = duck::parseControlMode(req["mode"].get<std::string>());
      if (!mode)
        return fail("mode must be auto, duck or restore");

      engine.setMode(*mode, graph::Clock::now());
      return Json{{"ok", true}, {"mode", duck::controlModeName(engine.mode())}};
    }

    if (cmd == "set_attenuation")
    {
      if (!req.contains("factor") || !req["factor"].is_number())
        return fail("missing number factor");

      std::string err;
      if (!engine.setAttenuation(req["factor"].get<float>(), graph::Clock::now(), err))
        return fail(err);
      return Json{{"ok", true}, {"attenuationFactor", engine.config().attenuationFactor}};
    }

    if (cmd == "set_threshold")
    {
      if (!req.contains("db") || !req["db"].is_number())
        return fail("missing number db");

      std::string err;
      if (!engine.setThreshold(req["db"].get<float>(), err))
        return fail(err);
      return Json{{"ok", true},
                  {"activationThresholdDb", engine.config().activationThresholdDb},
                  {"deactivationThresholdDb", engine.config().deactivationThresholdDb}};
    }

    if (cmd == "set_hold")
    {
      const Json &n = req.contains("samples") ? req["samples"] : Json();
      if (!n.is_number_integer() || (!n.is_number_unsigned() && n.get<int64_t>() < 0))
        return fail("missing non-negative integer samples");

      std::string err;
      const uint64_t samples = n.get<uint64_t>();
      if (samples > UINT32_MAX || !engine.setHold((uint32_t)samples, err))
        return fail(err.empty() ? "hold out of range" : err);
      return Json{{"ok", true}, {"deactivateSampleCount", engine.config().deactivateSampleCount}};
    }

    return fail("unknown cmd");
  }

  std::string handleRequestLine(duck::DuckEngine &engine, const std::string &line)
  {
    Json resp;
    try
    {
      Json req = Json::parse(line);
      resp = handleRequest(engine, req);
    }
    catch (const std::exception &e)
    {
      resp = fail(std::string("parse error: ") + e.what());
    }
    // Node names come straight from clients and need not be valid UTF-8.
    return resp.dump(-1, ' ', false, Json::error_handler_t::replace);
  }

} // namespace pwduck::control
