#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace pwduck::config
{

  using Json = nlohmann::json;

  enum class VoiceSourcePolicy
  {
    FirstWins,
    NewestWins,
  };

  enum class LevelMetric
  {
    Rms,
    Peak,
  };

  struct DuckConfig
  {
    int version = 1;

    // Classification
    std::string voiceApplicationMatcher = "WEBRTC VoiceEngine";
    std::vector<std::string> voiceMediaRoles = {"Communication"};
    std::vector<std::string> duckTargetExcludePatterns;
    VoiceSourcePolicy voiceSourcePolicy = VoiceSourcePolicy::FirstWins;

    // Ducking
    float attenuationFactor = 0.2f;
    float activationThresholdDb = -30.0f;
    float deactivationThresholdDb = -36.0f;
    uint32_t activateSampleCount = 3;
    uint32_t deactivateSampleCount = 15;
    uint32_t rampDurationMs = 200;
    uint32_t tickIntervalMs = 20;
    float volumeWriteEpsilon = 0.005f;
    LevelMetric levelMetric = LevelMetric::Rms;

    // Runtime
    // nullopt: defaultControlSocketPath(); empty string: control socket disabled.
    std::optional<std::string> controlSocket;
    bool verbose = false;
    bool logStats = false;
  };

  struct ValidationError
  {
    std::string message;
  };

  // Parses a config object on top of defaults. Keys that are absent keep their default.
  // Returns std::nullopt and fills err on wrong types or unknown enum values.
  std::optional<DuckConfig> parseConfigJson(const Json &j, ValidationError &err);

  // Range checks. Returns the config unchanged when valid.
  std::optional<DuckConfig> validateConfig(DuckConfig cfg, ValidationError &err);

  Json configToJson(const DuckConfig &cfg);

  // Reads and validates path. A missing file yields defaults; a malformed one is an error.
  std::optional<DuckConfig> loadConfigFile(const std::string &path, ValidationError &err);

  // $XDG_CONFIG_HOME/pwduck/config.json, falling back to ~/.config.
  std::string defaultConfigPath();

  // $XDG_RUNTIME_DIR/pwduck.sock, or empty when no runtime dir is set.
  std::string defaultControlSocketPath();

  // Moves activationThresholdDb (clamped to [-120, 0]) and drags the deactivation
  // threshold along so the hysteresis band keeps its width.
  void setActivationThreshold(DuckConfig &cfg, float db);

  // PWDUCK_* environment overrides, clamped to valid ranges.
  void applyEnvOverrides(DuckConfig &cfg);

  const char *voiceSourcePolicyName(VoiceSourcePolicy p);
  const char *levelMetricName(LevelMetric m);

} // namespace pwduck::config
