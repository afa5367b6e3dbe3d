#pragma once

#include <cstddef>
#include <cstdint>
#include <map>
#include <string>

#include <pipewire/pipewire.h>

#include "duck_engine.h"

namespace pwduck::control
{

  struct ControlLimits
  {
    size_t maxClients = 16;
    // A client that has not sent a complete request by then is answered with an error and closed.
    uint32_t clientTimeoutMs = 5000;
  };

  // Line-delimited JSON control socket served from the PipeWire loop.
  // One request per connection; see control_protocol.h for the commands.
  // Sockets are non-blocking, so a slow client never stalls the loop.
  class ControlServer
  {
  public:
    static constexpr size_t kMaxRequestBytes = 64 * 1024;

    ControlServer(pw_loop *loop, duck::DuckEngine &engine, const ControlLimits &limits = ControlLimits());
    ~ControlServer();

    ControlServer(const ControlServer &) = delete;
    ControlServer &operator=(const ControlServer &) = delete;

    bool open(const std::string &path, std::string &err);

    // Drops every client and removes the socket file. Must run before the loop goes away.
    void close();

    bool isOpen() const { return listenFd_ >= 0; }
    const std::string &path() const { return path_; }
    size_t clientCount() const { return clients_.size(); }

  private:
    struct Client
    {
      ControlServer *server = nullptr;
      int fd = -1;
      spa_source *source = nullptr;
      std::string buffer;
      graph::Timestamp acceptedAt;
    };

    static void onAccept(void *data, int fd, uint32_t mask);
    static void onClientIo(void *data, int fd, uint32_t mask);
    static void onReapTimer(void *data, uint64_t expirations);

    void finish(Client &c, const std::string *line);
    void reapIdle(graph::Timestamp now);
    void drop(int fd);

    pw_loop *loop_;
    duck::DuckEngine &engine_;
    ControlLimits limits_;
    std::string path_;
    int listenFd_ = -1;
    spa_source *listenSource_ = nullptr;
    spa_source *reapTimer_ = nullptr;
    std::map<int, Client> clients_;
  };

} // namespace pwduck::control
