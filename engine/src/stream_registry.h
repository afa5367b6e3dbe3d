#pragma once

#include <cstddef>
#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "duck_config.h"
#include "graph_types.h"

namespace pwduck::duck
{

  using graph::GraphNodeId;
  using graph::NodeMetadata;
  using graph::Timestamp;

  enum class StreamRole
  {
    VoiceSource,
    DuckTarget,
    Ignored,
  };

  enum class DuckState
  {
    Unducked,
    Ducking,
    Ducked,
    Unducking,
  };

  const char *streamRoleName(StreamRole role);
  const char *duckStateName(DuckState state);

  struct TrackedStream
  {
    GraphNodeId id = 0;
    StreamRole role = StreamRole::Ignored;
    NodeMetadata meta;

    float currentGain = 1.0f;
    float targetGain = 1.0f;

    // Ramp bookkeeping, reset every time targetGain changes.
    float rampStartGain = 1.0f;
    Timestamp rampStartTime{};

    std::optional<float> lastWrittenGain; // nullopt: never written to the server
    Timestamp lastVolumeWriteTimestamp{};

    DuckState duckState = DuckState::Unducked;
  };

  // Case-insensitive substring match. An empty needle never matches.
  bool containsNoCase(const std::string &haystack, const std::string &needle);

  class StreamClassifier
  {
  public:
    explicit StreamClassifier(const config::DuckConfig &cfg);

    // Deterministic. Anything that is not an app playback stream, or that matches
    // conflicting patterns, is Ignored. note (optional) receives the reason.
    StreamRole classify(const NodeMetadata &meta, std::string *note = nullptr) const;

  private:
    bool matchesVoice(const NodeMetadata &meta) const;
    bool matchesExclude(const NodeMetadata &meta) const;

    std::string voiceMatcher_;
    std::vector<std::string> voiceRoles_;
    std::vector<std::string> excludePatterns_;
  };

  enum class VoiceSourceChange
  {
    None,
    Changed, // a different node (or none) is now the active voice source
    Standby, // registered, but another voice source keeps priority
  };

  struct RegistryUpdate
  {
    bool applied = false;
    VoiceSourceChange voice = VoiceSourceChange::None;
  };

  // Live set of tracked streams keyed by graph id. Entities are looked up per event and
  // never referenced across events, so an id reused by the server is a fresh entity.
  class StreamRegistry
  {
  public:
    explicit StreamRegistry(config::VoiceSourcePolicy policy) : policy_(policy) {}

    // Inserts a stream at unity gain. Ignored roles and ids already present are not applied.
    RegistryUpdate registerStream(GraphNodeId id, StreamRole role, const NodeMetadata &meta);

    // Removes the entity immediately. If it was the active voice source the oldest
    // standby candidate is promoted (voice == Changed, activeVoice() may be empty).
    RegistryUpdate unregisterStream(GraphNodeId id);

    TrackedStream *find(GraphNodeId id);
    const TrackedStream *find(GraphNodeId id) const;
    bool contains(GraphNodeId id) const { return streams_.count(id) != 0; }

    std::optional<GraphNodeId> activeVoice() const { return activeVoice_; }
    const std::deque<GraphNodeId> &standbyVoices() const { return standby_; }

    template <typename Fn>
    void forEachTarget(Fn &&fn)
    {
      for (auto &kv : streams_)
      {
        if (kv.second.role == StreamRole::DuckTarget)
          fn(kv.second);
      }
    }

    const std::map<GraphNodeId, TrackedStream> &streams() const { return streams_; }
    size_t size() const { return streams_.size(); }
    size_t targetCount() const;

  private:
    config::VoiceSourcePolicy policy_;
    std::map<GraphNodeId, TrackedStream> streams_;
    std::optional<GraphNodeId> activeVoice_;
    std::deque<GraphNodeId> standby_;
  };

} // namespace pwduck::duck
