#include "control_server.h"

#include <algorithm>
#include <cerrno>
#include <chrono>
#include <cstdio>
#include <cstring>
#include <ctime>
#include <vector>

#include <sys/socket.h>
#include <sys/stat.h>
#include <sys/un.h>
#include <unistd.h>

#include "control_protocol.h"

namespace pwduck::control
{

  static bool writeAll(int fd, const char *buf, size_t n)
  {
    size_t off = 0;
    while (off < n)
    {
      ssize_t w = ::write(fd, buf + off, n - off);
      if (w < 0)
      {
        if (errno == EINTR)
          continue;
        // Non-blocking client that stopped reading: give up rather than stall the loop.
        return false;
      }
      off += (size_t)w;
    }
    return true;
  }

  static std::string errorLine(const char *msg)
  {
    return Json{{"ok", false}, {"error", msg}}.dump() + "\n";
  }

  ControlServer::ControlServer(pw_loop *loop, duck::DuckEngine &engine, const ControlLimits &limits)
      : loop_(loop), engine_(engine), limits_(limits)
  {
    if (limits_.maxClients == 0)
      limits_.maxClients = 1;
    if (limits_.clientTimeoutMs == 0)
      limits_.clientTimeoutMs = 1;
  }

  ControlServer::~ControlServer()
  {
    close();
  }

  bool ControlServer::open(const std::string &path, std::string &err)
  {
    if (isOpen())
      return true;

    sockaddr_un addr{};
    if (path.empty() || path.size() >= sizeof(addr.sun_path))
    {
      err = "invalid socket path '" + path + "'";
      return false;
    }

    int srv = ::socket(AF_UNIX, SOCK_STREAM | SOCK_NONBLOCK | SOCK_CLOEXEC, 0);
    if (srv < 0)
    {
      err = std::string("socket() failed: ") + std::strerror(errno);
      return false;
    }

    ::unlink(path.c_str());

    addr.sun_family = AF_UNIX;
    std::snprintf(addr.sun_path, sizeof(addr.sun_path), "%s", path.c_str());

    if (::bind(srv, (sockaddr *)&addr, sizeof(addr)) < 0)
    {
      err = "bind(" + path + ") failed: " + std::strerror(errno);
      ::close(srv);
      return false;
    }

    ::chmod(path.c_str(), 0600);

    if (::listen(srv, 4) < 0)
    {
      err = std::string("listen() failed: ") + std::strerror(errno);
      ::close(srv);
      ::unlink(path.c_str());
      return false;
    }

    listenSource_ = pw_loop_add_io(loop_, srv, SPA_IO_IN, false, onAccept, this);
    if (!listenSource_)
    {
      err = "failed to add socket to the loop";
      ::close(srv);
      ::unlink(path.c_str());
      return false;
    }

    reapTimer_ = pw_loop_add_timer(loop_, onReapTimer, this);
    if (!reapTimer_)
    {
      err = "failed to add client timer";
      pw_loop_destroy_source(loop_, listenSource_);
      listenSource_ = nullptr;
      ::close(srv);
      ::unlink(path.c_str());
      return false;
    }

    // Sweep four times per timeout, at most once a second.
    const uint32_t periodMs = std::clamp<uint32_t>(limits_.clientTimeoutMs / 4, 1, 1000);
    timespec period{};
    period.tv_sec = periodMs / 1000;
    period.tv_nsec = (long)(periodMs % 1000) * 1000000L;
    pw_loop_update_timer(loop_, reapTimer_, &period, &period, false);

    listenFd_ = srv;
    path_ = path;
    std::fprintf(stderr, "Control: unix socket %s\n", path_.c_str());
    return true;
  }

  void ControlServer::close()
  {
    std::vector<int> fds;
    for (const auto &kv : clients_)
      fds.push_back(kv.first);
    for (int fd : fds)
      drop(fd);

    if (reapTimer_)
    {
      pw_loop_destroy_source(loop_, reapTimer_);
      reapTimer_ = nullptr;
    }
    if (listenSource_)
    {
      pw_loop_destroy_source(loop_, listenSource_);
      listenSource_ = nullptr;
    }
    if (listenFd_ >= 0)
    {
      ::close(listenFd_);
      listenFd_ = -1;
      ::unlink(path_.c_str());
    }
  }

  void ControlServer::onAccept(void *data, int fd, uint32_t mask)
  {
    (void)mask;
    auto *self = static_cast<ControlServer *>(data);

    for (;;)
    {
      int cfd = ::accept4(fd, nullptr, nullptr, SOCK_NONBLOCK | SOCK_CLOEXEC);
      if (cfd < 0)
      {
        if (errno == EINTR)
          continue;
        if (errno != EAGAIN && errno != EWOULDBLOCK)
          std::fprintf(stderr, "Control: accept() failed: %s\n", std::strerror(errno));
        return;
      }

      if (self->clients_.size() >= self->limits_.maxClients)
      {
        const std::string busy = errorLine("too many clients");
        if (!writeAll(cfd, busy.data(), busy.size()))
          std::fprintf(stderr, "Control: failed to reject client: %s\n", std::strerror(errno));
        ::close(cfd);
        continue;
      }

      Client &c = self->clients_[cfd];
      c.server = self;
      c.fd = cfd;
      c.acceptedAt = graph::Clock::now();
      c.source = pw_loop_add_io(self->loop_, cfd, SPA_IO_IN | SPA_IO_HUP | SPA_IO_ERR, false, onClientIo, &c);
      if (!c.source)
      {
        std::fprintf(stderr, "Control: failed to watch client socket\n");
        self->clients_.erase(cfd);
        ::close(cfd);
      }
    }
  }

  void ControlServer::onClientIo(void *data, int fd, uint32_t mask)
  {
    (void)mask;
    auto &c = *static_cast<Client *>(data);
    ControlServer *self = c.server;

    char buf[4096];
    for (;;)
    {
      ssize_t r = ::read(fd, buf, sizeof(buf));
      if (r < 0)
      {
        if (errno == EINTR)
          continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
          return;
        self->drop(fd);
        return;
      }

      if (r == 0)
      {
        // EOF without newline: treat what we have as the request.
        if (c.buffer.empty())
        {
          self->drop(fd);
          return;
        }
        const std::string line = c.buffer;
        self->finish(c, &line);
        return;
      }

      c.buffer.append(buf, (size_t)r);

      const auto nl = c.buffer.find('\n');
      if (nl != std::string::npos)
      {
        const std::string line = c.buffer.substr(0, nl);
        self->finish(c, &line);
        return;
      }

      if (c.buffer.size() > kMaxRequestBytes)
      {
        self->finish(c, nullptr);
        return;
      }
    }
  }

  void ControlServer::finish(Client &c, const std::string *line)
  {
    const std::string resp = line ? handleRequestLine(engine_, *line) + "\n"
                                  : errorLine("request too large");

    if (!writeAll(c.fd, resp.data(), resp.size()))
      std::fprintf(stderr, "Control: failed to send response: %s\n", std::strerror(errno));

    drop(c.fd);
  }

  void ControlServer::onReapTimer(void *data, uint64_t expirations)
  {
    (void)expirations;
    static_cast<ControlServer *>(data)->reapIdle(graph::Clock::now());
  }

  void ControlServer::reapIdle(graph::Timestamp now)
  {
    const auto timeout = std::chrono::milliseconds(limits_.clientTimeoutMs);

    std::vector<int> stale;
    for (const auto &kv : clients_)
    {
      if (now - kv.second.acceptedAt >= timeout)
        stale.push_back(kv.first);
    }

    for (int fd : stale)
    {
      const std::string resp = errorLine("request timed out");
      if (!writeAll(fd, resp.data(), resp.size()))
        std::fprintf(stderr, "Control: failed to send timeout: %s\n", std::strerror(errno));
      drop(fd);
    }
  }

  void ControlServer::drop(int fd)
  {
    auto it = clients_.find(fd);
    if (it == clients_.end())
      return;
    if (it->second.source)
      pw_loop_destroy_source(loop_, it->second.source);
    ::close(fd);
    clients_.erase(it);
  }

} // namespace pwduck::control
