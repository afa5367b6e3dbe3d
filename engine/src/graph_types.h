#pragma once

#include <chrono>
#include <cstdint>
#include <string>

namespace pwduck::graph
{

  // Registry global id assigned by the audio server. May be reused after the node is removed.
  using GraphNodeId = uint32_t;

  using Clock = std::chrono::steady_clock;
  using Timestamp = Clock::time_point;

  inline constexpr const char *kMediaClassPlayback = "Stream/Output/Audio";

  struct NodeMetadata
  {
    std::string applicationName;
    std::string processBinary;
    std::string processId;
    std::string nodeName;
    std::string mediaName;
    std::string mediaRole;
    std::string mediaClass;
    std::string objectSerial;
    std::string clientId;

    // Best human-readable label for logs and status output.
    const std::string &label() const
    {
      if (!applicationName.empty())
        return applicationName;
      if (!nodeName.empty())
        return nodeName;
      return mediaName;
    }
  };

  enum class GraphErrorKind
  {
    None,
    Connection,
    Write,
  };

  struct GraphError
  {
    GraphErrorKind kind = GraphErrorKind::None;
    std::string message;
  };

  const char *graphErrorKindName(GraphErrorKind kind);

} // namespace pwduck::graph
