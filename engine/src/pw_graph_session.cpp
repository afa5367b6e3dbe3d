#include "pw_graph_session.h"

#include <spa/param/audio/format-utils.h>
#include <spa/param/props.h>
#include <spa/pod/builder.h>
#include <spa/utils/result.h>

#include <cerrno>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <ctime>

#include "level_meter.h"

namespace pwduck::graph
{

  static std::string dictString(const spa_dict *props, const char *key)
  {
    const char *v = props ? spa_dict_lookup(props, key) : nullptr;
    return v ? std::string(v) : std::string();
  }

  static NodeMetadata metadataFromProps(const spa_dict *props)
  {
    NodeMetadata m;
    m.applicationName = dictString(props, PW_KEY_APP_NAME);
    m.processBinary = dictString(props, PW_KEY_APP_PROCESS_BINARY);
    m.processId = dictString(props, PW_KEY_APP_PROCESS_ID);
    m.nodeName = dictString(props, PW_KEY_NODE_NAME);
    m.mediaName = dictString(props, PW_KEY_MEDIA_NAME);
    m.mediaRole = dictString(props, PW_KEY_MEDIA_ROLE);
    m.mediaClass = dictString(props, PW_KEY_MEDIA_CLASS);
    m.objectSerial = dictString(props, PW_KEY_OBJECT_SERIAL);
    m.clientId = dictString(props, PW_KEY_CLIENT_ID);
    return m;
  }

  static const pw_registry_events registryEvents = {
      .version = PW_VERSION_REGISTRY_EVENTS,
      .global = PwGraphSession::onRegistryGlobal,
      .global_remove = PwGraphSession::onRegistryGlobalRemove,
  };

  static const pw_node_events nodeEvents = {
      .version = PW_VERSION_NODE_EVENTS,
      .info = PwGraphSession::onNodeInfo,
  };

  static const pw_core_events coreEvents = {
      .version = PW_VERSION_CORE_EVENTS,
      .done = PwGraphSession::onCoreDone,
      .error = PwGraphSession::onCoreError,
  };

  static const pw_stream_events captureEvents = {
      .version = PW_VERSION_STREAM_EVENTS,
      .state_changed = PwGraphSession::onCaptureStateChanged,
      .param_changed = PwGraphSession::onCaptureParamChanged,
      .process = PwGraphSession::onCaptureProcess,
  };

  PwGraphSession::PwGraphSession(const Options &opts)
      : opts_(opts)
  {
  }

  PwGraphSession::~PwGraphSession()
  {
    disconnect();
  }

  PwGraphSession::Options PwGraphSession::optionsFrom(const config::DuckConfig &cfg)
  {
    Options o;
    o.tickIntervalMs = cfg.tickIntervalMs;
    o.levelMetric = cfg.levelMetric;
    o.verbose = cfg.verbose;
    return o;
  }

  // -------------------- connection --------------------

  bool PwGraphSession::connect(GraphListener &listener, GraphError &err)
  {
    if (core_)
      return true;

    auto fail = [&](const std::string &msg)
    {
      err.kind = GraphErrorKind::Connection;
      err.message = msg;
      disconnect();
      return false;
    };

    listener_ = &listener;
    connectionError_.reset();

    mainLoop_ = pw_main_loop_new(nullptr);
    if (!mainLoop_)
      return fail("failed to create PipeWire main loop");
    loop_ = pw_main_loop_get_loop(mainLoop_);

    context_ = pw_context_new(loop_, nullptr, 0);
    if (!context_)
      return fail("failed to create PipeWire context");

    core_ = pw_context_connect(context_, nullptr, 0);
    if (!core_)
      return fail(std::string("failed to connect to PipeWire: ") + std::strerror(errno));

    pw_core_add_listener(core_, &coreListener_, &coreEvents, this);

    registry_ = pw_core_get_registry(core_, PW_VERSION_REGISTRY, 0);
    if (!registry_)
      return fail("failed to get PipeWire registry");
    pw_registry_add_listener(registry_, &registryListener_, &registryEvents, this);

    const uint32_t ms = opts_.tickIntervalMs ? opts_.tickIntervalMs : 20;
    timespec interval{};
    interval.tv_sec = ms / 1000;
    interval.tv_nsec = (long)(ms % 1000) * 1000000L;

    timer_ = pw_loop_add_timer(loop_, onTimer, this);
    if (!timer_)
      return fail("failed to add tick timer");
    pw_loop_update_timer(loop_, timer_, &interval, &interval, false);

    sigint_ = pw_loop_add_signal(loop_, SIGINT, onSignal, this);
    sigterm_ = pw_loop_add_signal(loop_, SIGTERM, onSignal, this);

    delivering_ = true;
    std::fprintf(stderr, "PW: connected (tick %u ms, level %s)\n", ms, config::levelMetricName(opts_.levelMetric));
    return true;
  }

  bool PwGraphSession::run(GraphError &err)
  {
    if (!mainLoop_)
    {
      err.kind = GraphErrorKind::Connection;
      err.message = "not connected";
      return false;
    }

    if (!connectionError_)
      pw_main_loop_run(mainLoop_);

    if (connectionError_)
    {
      err = *connectionError_;
      return false;
    }
    return true;
  }

  void PwGraphSession::quit()
  {
    if (mainLoop_)
      pw_main_loop_quit(mainLoop_);
  }

  void PwGraphSession::disconnect()
  {
    delivering_ = false;
    queue_.clear();

    stopLevelMonitor();

    for (auto &kv : bindings_)
      destroyBinding(*kv.second);
    bindings_.clear();
    announcedPlain_.clear();

    if (loop_)
    {
      if (timer_)
        pw_loop_destroy_source(loop_, timer_);
      if (sigint_)
        pw_loop_destroy_source(loop_, sigint_);
      if (sigterm_)
        pw_loop_destroy_source(loop_, sigterm_);
    }
    timer_ = nullptr;
    sigint_ = nullptr;
    sigterm_ = nullptr;

    if (registry_)
    {
      pw_proxy_destroy((pw_proxy *)registry_);
      registry_ = nullptr;
    }
    if (core_)
    {
      pw_core_disconnect(core_);
      core_ = nullptr;
    }
    if (context_)
    {
      pw_context_destroy(context_);
      context_ = nullptr;
    }
    if (mainLoop_)
    {
      pw_main_loop_destroy(mainLoop_);
      mainLoop_ = nullptr;
    }
    loop_ = nullptr;
    listener_ = nullptr;
  }

  void PwGraphSession::failConnection(const std::string &message)
  {
    if (!connectionError_)
      connectionError_ = GraphError{GraphErrorKind::Connection, message};
    quit();
  }

  void PwGraphSession::push(GraphEvent ev)
  {
    if (!delivering_ || !listener_)
      return;
    queue_.push(std::move(ev));
    queue_.drain(*listener_);
  }

  // -------------------- registry --------------------

  void PwGraphSession::onRegistryGlobal(void *data, uint32_t id, uint32_t permissions,
                                        const char *type, uint32_t version, const spa_dict *props)
  {
    (void)permissions;
    (void)version;
    auto *self = static_cast<PwGraphSession *>(data);
    if (!type || std::strcmp(type, PW_TYPE_INTERFACE_Node) != 0)
      return;

    NodeMetadata meta = metadataFromProps(props);

    if (meta.mediaClass != kMediaClassPlayback)
    {
      self->announcedPlain_.insert(id);
      self->push(NodeAddedEvent{id, std::move(meta), Clock::now()});
      return;
    }

    // Playback streams are announced from their first info event, which carries
    // the complete property set (role, binary, serial) the global may lack.
    auto *proxy = (pw_proxy *)pw_registry_bind(self->registry_, id, type, PW_VERSION_NODE, 0);
    if (!proxy)
    {
      std::fprintf(stderr, "PW: failed to bind node %u: %s\n", id, std::strerror(errno));
      return;
    }

    auto old = self->bindings_.find(id);
    if (old != self->bindings_.end())
    {
      self->destroyBinding(*old->second);
      self->bindings_.erase(old);
    }

    auto b = std::make_unique<NodeBinding>();
    b->session = self;
    b->id = id;
    b->proxy = proxy;
    b->meta = std::move(meta);
    pw_node_add_listener((pw_node *)proxy, &b->listener, &nodeEvents, b.get());
    self->bindings_.emplace(id, std::move(b));
  }

  void PwGraphSession::onRegistryGlobalRemove(void *data, uint32_t id)
  {
    auto *self = static_cast<PwGraphSession *>(data);

    if (self->announcedPlain_.erase(id) != 0)
    {
      self->push(NodeRemovedEvent{id, Clock::now()});
      return;
    }

    auto it = self->bindings_.find(id);
    if (it == self->bindings_.end())
      return;

    const bool announced = it->second->announced;
    self->destroyBinding(*it->second);
    self->bindings_.erase(it);

    if (announced)
      self->push(NodeRemovedEvent{id, Clock::now()});
  }

  void PwGraphSession::onNodeInfo(void *data, const pw_node_info *info)
  {
    auto *b = static_cast<NodeBinding *>(data);
    if (!info)
      return;

    if (info->props && (info->change_mask & PW_NODE_CHANGE_MASK_PROPS))
    {
      NodeMetadata m = metadataFromProps(info->props);
      if (m.mediaClass.empty())
        m.mediaClass = b->meta.mediaClass;
      b->meta = std::move(m);
    }

    if (b->announced)
      return;
    b->announced = true;
    b->session->push(NodeAddedEvent{b->id, b->meta, Clock::now()});
  }

  void PwGraphSession::destroyBinding(NodeBinding &b)
  {
    if (!b.proxy)
      return;
    spa_hook_remove(&b.listener);
    pw_proxy_destroy(b.proxy);
    b.proxy = nullptr;
  }

  // -------------------- core --------------------

  void PwGraphSession::onCoreDone(void *data, uint32_t id, int seq)
  {
    auto *self = static_cast<PwGraphSession *>(data);
    if (id == PW_ID_CORE && seq == self->pendingSync_)
      self->syncDone_ = true;
  }

  void PwGraphSession::onCoreError(void *data, uint32_t id, int seq, int res, const char *message)
  {
    auto *self = static_cast<PwGraphSession *>(data);
    std::fprintf(stderr, "PW: core error id=%u seq=%d res=%d (%s): %s\n",
                 id, seq, res, spa_strerror(res), message ? message : "(null)");

    if (id == PW_ID_CORE)
    {
      self->failConnection(message ? message : spa_strerror(res));
      return;
    }

    // Any other object is one of our node proxies: a rejected set_param.
    std::fprintf(stderr, "PW: %s on proxy %u, continuing\n", graphErrorKindName(GraphErrorKind::Write), id);
  }

  // -------------------- volume --------------------

  bool PwGraphSession::setStreamVolume(GraphNodeId id, float gain, GraphError &err)
  {
    if (!core_ || connectionError_)
    {
      err.kind = GraphErrorKind::Connection;
      err.message = "not connected";
      return false;
    }

    auto it = bindings_.find(id);
    if (it == bindings_.end() || !it->second->proxy)
      return true;

    uint8_t buffer[256];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));
    const spa_pod *props = (const spa_pod *)spa_pod_builder_add_object(
        &b, SPA_TYPE_OBJECT_Props, SPA_PARAM_Props,
        SPA_PROP_volume, SPA_POD_Float(gain));

    const int res = pw_node_set_param((pw_node *)it->second->proxy, SPA_PARAM_Props, 0, props);
    if (res < 0)
    {
      err.kind = GraphErrorKind::Write;
      err.message = spa_strerror(res);
      return false;
    }

    if (opts_.verbose)
      std::fprintf(stderr, "PW: node %u volume %.3f\n", id, gain);
    return true;
  }

  bool PwGraphSession::flush(GraphError &err)
  {
    if (!core_)
      return true;

    // Only used on the way out: events raised while flushing are dropped.
    delivering_ = false;
    queue_.clear();

    syncDone_ = false;
    pendingSync_ = pw_core_sync(core_, PW_ID_CORE, 0);

    const auto deadline = Clock::now() + std::chrono::milliseconds(opts_.flushTimeoutMs);
    pw_loop_enter(loop_);
    while (!syncDone_ && !connectionError_ && Clock::now() < deadline)
      pw_loop_iterate(loop_, 50);
    pw_loop_leave(loop_);

    if (connectionError_)
    {
      err = *connectionError_;
      return false;
    }
    if (!syncDone_)
    {
      err.kind = GraphErrorKind::Connection;
      err.message = "timed out waiting for the server";
      return false;
    }
    return true;
  }

  // -------------------- level capture --------------------

  bool PwGraphSession::startLevelMonitor(GraphNodeId id, GraphError &err)
  {
    stopLevelMonitor();

    if (!core_)
    {
      err.kind = GraphErrorKind::Connection;
      err.message = "not connected";
      return false;
    }

    std::string target = std::to_string(id);
    auto it = bindings_.find(id);
    if (it != bindings_.end())
    {
      if (!it->second->meta.objectSerial.empty())
        target = it->second->meta.objectSerial;
      else if (!it->second->meta.nodeName.empty())
        target = it->second->meta.nodeName;
    }

    pw_properties *props = pw_properties_new(
        PW_KEY_MEDIA_TYPE, "Audio",
        PW_KEY_MEDIA_CATEGORY, "Capture",
        PW_KEY_APP_NAME, "pwduck",
        PW_KEY_NODE_NAME, "pwduck.level",
        // Tap the voice stream's output instead of a source device.
        PW_KEY_STREAM_CAPTURE_SINK, "true",
        PW_KEY_TARGET_OBJECT, target.c_str(),
        PW_KEY_NODE_DONT_RECONNECT, "true",
        PW_KEY_NODE_PASSIVE, "true",
        nullptr);

    capture_ = pw_stream_new(core_, "pwduck-level", props);
    if (!capture_)
    {
      err.kind = GraphErrorKind::Connection;
      err.message = std::string("failed to create capture stream: ") + std::strerror(errno);
      return false;
    }

    std::memset(&captureListener_, 0, sizeof(captureListener_));
    pw_stream_add_listener(capture_, &captureListener_, &captureEvents, this);

    uint8_t buffer[1024];
    spa_pod_builder b = SPA_POD_BUILDER_INIT(buffer, sizeof(buffer));
    // F32 preferred; S16 for voice streams that only produce 16-bit samples.
    spa_audio_info_raw f32 = SPA_AUDIO_INFO_RAW_INIT(
            .format = SPA_AUDIO_FORMAT_F32);
    spa_audio_info_raw s16 = SPA_AUDIO_INFO_RAW_INIT(
            .format = SPA_AUDIO_FORMAT_S16);

    const spa_pod *params[2];
    params[0] = (const spa_pod *)spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &f32);
    params[1] = (const spa_pod *)spa_format_audio_raw_build(&b, SPA_PARAM_EnumFormat, &s16);

    // No RT_PROCESS: process() runs on the main loop alongside everything else.
    const int res = pw_stream_connect(capture_, PW_DIRECTION_INPUT, PW_ID_ANY,
                                      (pw_stream_flags)(PW_STREAM_FLAG_AUTOCONNECT |
                                                        PW_STREAM_FLAG_MAP_BUFFERS),
                                      params, 2);
    if (res < 0)
    {
      err.kind = GraphErrorKind::Connection;
      err.message = std::string("failed to connect capture stream: ") + spa_strerror(res);
      stopLevelMonitor();
      return false;
    }

    captureNode_ = id;
    captureFormat_ = SPA_AUDIO_FORMAT_F32;
    std::fprintf(stderr, "PW: level capture on node %u (target.object=%s)\n", id, target.c_str());
    return true;
  }

  void PwGraphSession::stopLevelMonitor()
  {
    if (capture_)
    {
      pw_stream_destroy(capture_);
      capture_ = nullptr;
    }
    captureNode_.reset();
  }

  void PwGraphSession::onCaptureStateChanged(void *data, pw_stream_state oldState, pw_stream_state state, const char *error)
  {
    auto *self = static_cast<PwGraphSession *>(data);
    if (!self->opts_.verbose && state != PW_STREAM_STATE_ERROR)
      return;
    std::fprintf(stderr, "PW: level capture %s -> %s%s%s\n",
                 pw_stream_state_as_string(oldState), pw_stream_state_as_string(state),
                 error ? ": " : "", error ? error : "");
  }

  void PwGraphSession::onCaptureParamChanged(void *data, uint32_t id, const spa_pod *param)
  {
    auto *self = static_cast<PwGraphSession *>(data);
    if (!param || id != SPA_PARAM_Format)
      return;

    spa_audio_info_raw info;
    std::memset(&info, 0, sizeof(info));
    if (spa_format_audio_raw_parse(param, &info) < 0)
      return;

    self->captureFormat_ = info.format;
    if (self->opts_.verbose)
      std::fprintf(stderr, "PW: level capture format rate=%u channels=%u format=%d\n",
                   info.rate, info.channels, (int)info.format);
  }

  void PwGraphSession::onCaptureProcess(void *data)
  {
    auto *self = static_cast<PwGraphSession *>(data);
    if (!self->capture_)
      return;

    pw_buffer *buf = pw_stream_dequeue_buffer(self->capture_);
    if (!buf)
      return;

    bool measured = false;
    float level = 0.0f;
    spa_buffer *sb = buf->buffer;
    if (sb && sb->n_datas > 0 && sb->datas[0].data && sb->datas[0].chunk)
    {
      const spa_data &d = sb->datas[0];
      const uint32_t offset = SPA_MIN(d.chunk->offset, d.maxsize);
      const uint32_t size = SPA_MIN(d.chunk->size, d.maxsize - offset);
      const uint8_t *p = (const uint8_t *)d.data + offset;

      if (self->captureFormat_ == SPA_AUDIO_FORMAT_S16)
        level = measureLevel((const int16_t *)p, size / sizeof(int16_t), self->opts_.levelMetric);
      else
        level = measureLevel((const float *)p, size / sizeof(float), self->opts_.levelMetric);
      measured = size > 0;
    }

    pw_stream_queue_buffer(self->capture_, buf);

    if (measured && self->captureNode_)
      self->push(LevelSampleEvent{*self->captureNode_, level, Clock::now()});
  }

  // -------------------- loop sources --------------------

  void PwGraphSession::onTimer(void *data, uint64_t expirations)
  {
    (void)expirations;
    auto *self = static_cast<PwGraphSession *>(data);
    self->push(TickEvent{Clock::now()});
  }

  void PwGraphSession::onSignal(void *data, int signalNumber)
  {
    auto *self = static_cast<PwGraphSession *>(data);
    std::fprintf(stderr, "PW: caught signal %d, shutting down\n", signalNumber);
    self->quit();
  }

} // namespace pwduck::graph
