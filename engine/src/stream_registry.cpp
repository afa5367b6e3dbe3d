#include "stream_registry.h"

#include <algorithm>
#include <cctype>

namespace pwduck::duck
{

  const char *streamRoleName(StreamRole role)
  {
    switch (role)
    {
    case StreamRole::VoiceSource:
      return "voice";
    case StreamRole::DuckTarget:
      return "target";
    case StreamRole::Ignored:
      return "ignored";
    }
    return "unknown";
  }

  const char *duckStateName(DuckState state)
  {
    switch (state)
    {
    case DuckState::Unducked:
      return "unducked";
    case DuckState::Ducking:
      return "ducking";
    case DuckState::Ducked:
      return "ducked";
    case DuckState::Unducking:
      return "unducking";
    }
    return "unknown";
  }

  bool containsNoCase(const std::string &haystack, const std::string &needle)
  {
    if (needle.empty() || needle.size() > haystack.size())
      return false;
    auto it = std::search(haystack.begin(), haystack.end(), needle.begin(), needle.end(),
                          [](char a, char b)
                          { return std::tolower((unsigned char)a) == std::tolower((unsigned char)b); });
    return it != haystack.end();
  }

  static bool equalsNoCase(const std::string &a, const std::string &b)
  {
    return a.size() == b.size() &&
           std::equal(a.begin(), a.end(), b.begin(),
                      [](char x, char y)
                      { return std::tolower((unsigned char)x) == std::tolower((unsigned char)y); });
  }

  StreamClassifier::StreamClassifier(const config::DuckConfig &cfg)
      : voiceMatcher_(cfg.voiceApplicationMatcher),
        voiceRoles_(cfg.voiceMediaRoles),
        excludePatterns_(cfg.duckTargetExcludePatterns)
  {
  }

  bool StreamClassifier::matchesVoice(const NodeMetadata &meta) const
  {
    if (containsNoCase(meta.applicationName, voiceMatcher_) ||
        containsNoCase(meta.processBinary, voiceMatcher_) ||
        containsNoCase(meta.nodeName, voiceMatcher_))
      return true;

    for (const auto &role : voiceRoles_)
    {
      if (!meta.mediaRole.empty() && equalsNoCase(meta.mediaRole, role))
        return true;
    }
    return false;
  }

  bool StreamClassifier::matchesExclude(const NodeMetadata &meta) const
  {
    for (const auto &p : excludePatterns_)
    {
      if (containsNoCase(meta.applicationName, p) ||
          containsNoCase(meta.processBinary, p) ||
          containsNoCase(meta.nodeName, p) ||
          containsNoCase(meta.mediaName, p))
        return true;
    }
    return false;
  }

  StreamRole StreamClassifier::classify(const NodeMetadata &meta, std::string *note) const
  {
    auto setNote = [note](const char *s)
    {
      if (note)
        *note = s;
    };

    if (meta.mediaClass != graph::kMediaClassPlayback)
    {
      setNote("not an application playback stream");
      return StreamRole::Ignored;
    }

    const bool voice = matchesVoice(meta);
    const bool excluded = matchesExclude(meta);

    if (voice && excluded)
    {
      setNote("ambiguous: matches both the voice matcher and an exclude pattern");
      return StreamRole::Ignored;
    }
    if (voice)
    {
      setNote("matches voice application");
      return StreamRole::VoiceSource;
    }
    if (excluded)
    {
      setNote("excluded by pattern");
      return StreamRole::Ignored;
    }
    setNote("playback stream");
    return StreamRole::DuckTarget;
  }

  RegistryUpdate StreamRegistry::registerStream(GraphNodeId id, StreamRole role, const NodeMetadata &meta)
  {
    RegistryUpdate up;
    if (role == StreamRole::Ignored || streams_.count(id) != 0)
      return up;

    TrackedStream s;
    s.id = id;
    s.role = role;
    s.meta = meta;
    streams_.emplace(id, std::move(s));
    up.applied = true;

    if (role != StreamRole::VoiceSource)
      return up;

    if (!activeVoice_)
    {
      activeVoice_ = id;
      up.voice = VoiceSourceChange::Changed;
    }
    else if (policy_ == config::VoiceSourcePolicy::NewestWins)
    {
      // Newest first: a removal hands back to the next most recent source.
      standby_.push_front(*activeVoice_);
      activeVoice_ = id;
      up.voice = VoiceSourceChange::Changed;
    }
    else
    {
      standby_.push_back(id);
      up.voice = VoiceSourceChange::Standby;
    }
    return up;
  }

  RegistryUpdate StreamRegistry::unregisterStream(GraphNodeId id)
  {
    RegistryUpdate up;
    auto it = streams_.find(id);
    if (it == streams_.end())
      return up;

    streams_.erase(it);
    up.applied = true;

    if (activeVoice_ && *activeVoice_ == id)
    {
      activeVoice_.reset();
      if (!standby_.empty())
      {
        activeVoice_ = standby_.front();
        standby_.pop_front();
      }
      up.voice = VoiceSourceChange::Changed;
    }
    else
    {
      standby_.erase(std::remove(standby_.begin(), standby_.end(), id), standby_.end());
    }
    return up;
  }

  TrackedStream *StreamRegistry::find(GraphNodeId id)
  {
    auto it = streams_.find(id);
    return (it == streams_.end()) ? nullptr : &it->second;
  }

  const TrackedStream *StreamRegistry::find(GraphNodeId id) const
  {
    auto it = streams_.find(id);
    return (it == streams_.end()) ? nullptr : &it->second;
  }

  size_t StreamRegistry::targetCount() const
  {
    return (size_t)std::count_if(streams_.begin(), streams_.end(),
                                 [](const auto &kv)
                                 { return kv.second.role == StreamRole::DuckTarget; });
  }

} // namespace pwduck::duck
