#include "duck_config.h"

#include <algorithm>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>

namespace pwduck::config
{

  static inline float clampf(float v, float lo, float hi) { return (v < lo) ? lo : (v > hi) ? hi
                                                                                            : v; }

  static bool readString(const Json &j, const char *key, std::string &out, ValidationError &err)
  {
    if (!j.contains(key))
      return true;
    if (!j[key].is_string())
    {
      err.message = std::string("Field '") + key + "' must be a string";
      return false;
    }
    out = j[key].get<std::string>();
    return true;
  }

  static bool readStringList(const Json &j, const char *key, std::vector<std::string> &out, ValidationError &err)
  {
    if (!j.contains(key))
      return true;
    if (!j[key].is_array())
    {
      err.message = std::string("Field '") + key + "' must be an array of strings";
      return false;
    }
    std::vector<std::string> list;
    for (const auto &e : j[key])
    {
      if (!e.is_string())
      {
        err.message = std::string("Field '") + key + "' must be an array of strings";
        return false;
      }
      list.push_back(e.get<std::string>());
    }
    out = std::move(list);
    return true;
  }

  static bool readFloat(const Json &j, const char *key, float &out, ValidationError &err)
  {
    if (!j.contains(key))
      return true;
    if (!j[key].is_number())
    {
      err.message = std::string("Field '") + key + "' must be a number";
      return false;
    }
    out = j[key].get<float>();
    return true;
  }

  static bool readCount(const Json &j, const char *key, uint32_t &out, ValidationError &err)
  {
    if (!j.contains(key))
      return true;
    const Json &v = j[key];
    const bool inRange = v.is_number_unsigned()  ? v.get<uint64_t>() <= UINT32_MAX
                         : v.is_number_integer() ? v.get<int64_t>() >= 0 && v.get<int64_t>() <= (int64_t)UINT32_MAX
                                                 : false;
    if (!inRange)
    {
      err.message = std::string("Field '") + key + "' must be a non-negative integer below 2^32";
      return false;
    }
    out = (uint32_t)v.get<uint64_t>();
    return true;
  }

  static bool readBool(const Json &j, const char *key, bool &out, ValidationError &err)
  {
    if (!j.contains(key))
      return true;
    if (!j[key].is_boolean())
    {
      err.message = std::string("Field '") + key + "' must be a boolean";
      return false;
    }
    out = j[key].get<bool>();
    return true;
  }

  const char *voiceSourcePolicyName(VoiceSourcePolicy p)
  {
    return (p == VoiceSourcePolicy::NewestWins) ? "newest" : "first";
  }

  const char *levelMetricName(LevelMetric m)
  {
    return (m == LevelMetric::Peak) ? "peak" : "rms";
  }

  std::optional<DuckConfig> parseConfigJson(const Json &j, ValidationError &err)
  {
    if (!j.is_object())
    {
      err.message = "Config must be a JSON object";
      return std::nullopt;
    }

    DuckConfig cfg;
    if (j.contains("version"))
    {
      if (!j["version"].is_number_integer())
      {
        err.message = "'version' must be an integer";
        return std::nullopt;
      }
      cfg.version = j["version"].get<int>();
    }

    if (!readString(j, "voiceApplicationMatcher", cfg.voiceApplicationMatcher, err) ||
        !readStringList(j, "voiceMediaRoles", cfg.voiceMediaRoles, err) ||
        !readStringList(j, "duckTargetExcludePatterns", cfg.duckTargetExcludePatterns, err) ||
        !readFloat(j, "attenuationFactor", cfg.attenuationFactor, err) ||
        !readFloat(j, "activationThresholdDb", cfg.activationThresholdDb, err) ||
        !readFloat(j, "deactivationThresholdDb", cfg.deactivationThresholdDb, err) ||
        !readCount(j, "activateSampleCount", cfg.activateSampleCount, err) ||
        !readCount(j, "deactivateSampleCount", cfg.deactivateSampleCount, err) ||
        !readCount(j, "rampDurationMs", cfg.rampDurationMs, err) ||
        !readCount(j, "tickIntervalMs", cfg.tickIntervalMs, err) ||
        !readFloat(j, "volumeWriteEpsilon", cfg.volumeWriteEpsilon, err) ||
        !readBool(j, "verbose", cfg.verbose, err) ||
        !readBool(j, "logStats", cfg.logStats, err))
      return std::nullopt;

    if (j.contains("controlSocket") && !j["controlSocket"].is_null())
    {
      std::string sock;
      if (!readString(j, "controlSocket", sock, err))
        return std::nullopt;
      cfg.controlSocket = sock;
    }

    std::string policy = voiceSourcePolicyName(cfg.voiceSourcePolicy);
    if (!readString(j, "voiceSourcePolicy", policy, err))
      return std::nullopt;
    if (policy == "first")
      cfg.voiceSourcePolicy = VoiceSourcePolicy::FirstWins;
    else if (policy == "newest")
      cfg.voiceSourcePolicy = VoiceSourcePolicy::NewestWins;
    else
    {
      err.message = "'voiceSourcePolicy' must be \"first\" or \"newest\"";
      return std::nullopt;
    }

    std::string metric = levelMetricName(cfg.levelMetric);
    if (!readString(j, "levelMetric", metric, err))
      return std::nullopt;
    if (metric == "rms")
      cfg.levelMetric = LevelMetric::Rms;
    else if (metric == "peak")
      cfg.levelMetric = LevelMetric::Peak;
    else
    {
      err.message = "'levelMetric' must be \"rms\" or \"peak\"";
      return std::nullopt;
    }

    return cfg;
  }

  std::optional<DuckConfig> validateConfig(DuckConfig cfg, ValidationError &err)
  {
    if (cfg.version != 1)
    {
      err.message = "Unsupported config version";
      return std::nullopt;
    }
    if (cfg.voiceApplicationMatcher.empty() && cfg.voiceMediaRoles.empty())
    {
      err.message = "Need 'voiceApplicationMatcher' or 'voiceMediaRoles' to find the voice stream";
      return std::nullopt;
    }
    if (!(cfg.attenuationFactor > 0.0f && cfg.attenuationFactor < 1.0f))
    {
      err.message = "'attenuationFactor' must be in (0, 1)";
      return std::nullopt;
    }
    if (cfg.activationThresholdDb > 0.0f)
    {
      err.message = "'activationThresholdDb' must be <= 0 dBFS";
      return std::nullopt;
    }
    if (cfg.deactivationThresholdDb > cfg.activationThresholdDb)
    {
      err.message = "'deactivationThresholdDb' must not exceed 'activationThresholdDb'";
      return std::nullopt;
    }
    if (cfg.activateSampleCount < 1 || cfg.deactivateSampleCount < 1)
    {
      err.message = "Sample counts must be >= 1";
      return std::nullopt;
    }
    if (cfg.tickIntervalMs < 1 || cfg.tickIntervalMs > 1000)
    {
      err.message = "'tickIntervalMs' must be in [1, 1000]";
      return std::nullopt;
    }
    if (cfg.rampDurationMs > 60000)
    {
      err.message = "'rampDurationMs' must be <= 60000";
      return std::nullopt;
    }
    if (cfg.volumeWriteEpsilon < 0.0f || cfg.volumeWriteEpsilon > 0.1f)
    {
      err.message = "'volumeWriteEpsilon' must be in [0, 0.1]";
      return std::nullopt;
    }
    for (const auto &p : cfg.duckTargetExcludePatterns)
    {
      if (p.empty())
      {
        err.message = "Empty entry in 'duckTargetExcludePatterns'";
        return std::nullopt;
      }
    }
    return cfg;
  }

  Json configToJson(const DuckConfig &cfg)
  {
    Json j;
    j["version"] = cfg.version;
    j["voiceApplicationMatcher"] = cfg.voiceApplicationMatcher;
    j["voiceMediaRoles"] = cfg.voiceMediaRoles;
    j["duckTargetExcludePatterns"] = cfg.duckTargetExcludePatterns;
    j["voiceSourcePolicy"] = voiceSourcePolicyName(cfg.voiceSourcePolicy);
    j["attenuationFactor"] = cfg.attenuationFactor;
    j["activationThresholdDb"] = cfg.activationThresholdDb;
    j["deactivationThresholdDb"] = cfg.deactivationThresholdDb;
    j["activateSampleCount"] = cfg.activateSampleCount;
    j["deactivateSampleCount"] = cfg.deactivateSampleCount;
    j["rampDurationMs"] = cfg.rampDurationMs;
    j["tickIntervalMs"] = cfg.tickIntervalMs;
    j["volumeWriteEpsilon"] = cfg.volumeWriteEpsilon;
    j["levelMetric"] = levelMetricName(cfg.levelMetric);
    if (cfg.controlSocket)
      j["controlSocket"] = *cfg.controlSocket;
    else
      j["controlSocket"] = nullptr;
    j["verbose"] = cfg.verbose;
    j["logStats"] = cfg.logStats;
    return j;
  }

  std::optional<DuckConfig> loadConfigFile(const std::string &path, ValidationError &err)
  {
    std::ifstream f(path);
    if (!f.is_open())
      return DuckConfig{};

    Json j;
    try
    {
      f >> j;
    }
    catch (const std::exception &e)
    {
      err.message = std::string("parse error: ") + e.what();
      return std::nullopt;
    }

    auto parsed = parseConfigJson(j, err);
    if (!parsed)
      return std::nullopt;
    return validateConfig(*parsed, err);
  }

  std::string defaultConfigPath()
  {
    std::filesystem::path base;
    if (const char *xdg = std::getenv("XDG_CONFIG_HOME"); xdg && xdg[0])
      base = xdg;
    else if (const char *home = std::getenv("HOME"); home && home[0])
      base = std::filesystem::path(home) / ".config";
    else
      base = ".";
    return (base / "pwduck" / "config.json").string();
  }

  std::string defaultControlSocketPath()
  {
    const char *rt = std::getenv("XDG_RUNTIME_DIR");
    if (!rt || !rt[0])
      return std::string();
    return (std::filesystem::path(rt) / "pwduck.sock").string();
  }

  void setActivationThreshold(DuckConfig &cfg, float db)
  {
    // Keep the hysteresis band width when only the upper threshold moves.
    const float band = cfg.activationThresholdDb - cfg.deactivationThresholdDb;
    cfg.activationThresholdDb = clampf(db, -120.0f, 0.0f);
    cfg.deactivationThresholdDb = cfg.activationThresholdDb - band;
  }

  static inline bool envFlag(const char *k, bool def)
  {
    if (const char *e = std::getenv(k))
      return std::atoi(e) != 0;
    return def;
  }

  void applyEnvOverrides(DuckConfig &cfg)
  {
    if (const char *e = std::getenv("PWDUCK_ATTENUATION"))
      cfg.attenuationFactor = clampf(std::strtof(e, nullptr), 0.001f, 0.999f);

    if (const char *e = std::getenv("PWDUCK_THRESHOLD_DB"))
      setActivationThreshold(cfg, std::strtof(e, nullptr));

    if (const char *e = std::getenv("PWDUCK_VOICE_MATCH"); e && e[0])
      cfg.voiceApplicationMatcher = e;

    if (const char *e = std::getenv("PWDUCK_RAMP_MS"))
    {
      const long v = std::strtol(e, nullptr, 10);
      cfg.rampDurationMs = (uint32_t)std::clamp(v, 0L, 60000L);
    }

    if (const char *e = std::getenv("PWDUCK_CONTROL_SOCKET"))
      cfg.controlSocket = e;

    cfg.verbose = envFlag("PWDUCK_VERBOSE", cfg.verbose);
    cfg.logStats = envFlag("PWDUCK_LOG_STATS", cfg.logStats);
  }

} // namespace pwduck::config
