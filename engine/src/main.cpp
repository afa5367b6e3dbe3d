#include <cstdio>
#include <cstdlib>
#include <optional>
#include <string>

#include <pipewire/pipewire.h>

#include "control_server.h"
#include "duck_config.h"
#include "duck_engine.h"
#include "pw_graph_session.h"

using namespace pwduck;

struct Args
{
  std::string configPath;
  std::optional<float> attenuation;
  std::optional<float> thresholdDb;
  std::optional<std::string> voice;
  bool verbose = false;
  bool printConfig = false;
  bool help = false;
};

static void usage(const char *argv0)
{
  std::fprintf(stderr,
               "Usage: %s [--config <path>] [--attenuation 0.2] [--threshold-db -30] [--voice <match>] "
               "[--verbose] [--print-config] [--help]\n",
               argv0);
}

static bool parseFloat(const char *s, float &out)
{
  char *end = nullptr;
  out = std::strtof(s, &end);
  return end && end != s && *end == '\0';
}

static bool parseArgs(int argc, char **argv, Args &a)
{
  for (int i = 1; i < argc; i++)
  {
    std::string k = argv[i];
    auto need = [&](const char *name) -> const char *
    {
      if (i + 1 >= argc)
      {
        std::fprintf(stderr, "Missing value for %s\n", name);
        return nullptr;
      }
      return argv[++i];
    };

    if (k == "--config")
    {
      const char *v = need("--config");
      if (!v)
        return false;
      a.configPath = v;
    }
    else if (k == "--attenuation")
    {
      const char *v = need("--attenuation");
      float f = 0.0f;
      if (!v || !parseFloat(v, f))
        return false;
      a.attenuation = f;
    }
    else if (k == "--threshold-db")
    {
      const char *v = need("--threshold-db");
      float f = 0.0f;
      if (!v || !parseFloat(v, f))
        return false;
      a.thresholdDb = f;
    }
    else if (k == "--voice")
    {
      const char *v = need("--voice");
      if (!v)
        return false;
      a.voice = v;
    }
    else if (k == "--verbose" || k == "-v")
    {
      a.verbose = true;
    }
    else if (k == "--print-config")
    {
      a.printConfig = true;
    }
    else if (k == "--help" || k == "-h")
    {
      a.help = true;
    }
    else
    {
      std::fprintf(stderr, "Unknown arg: %s\n", k.c_str());
      return false;
    }
  }
  return true;
}

int main(int argc, char **argv)
{
  setvbuf(stdout, nullptr, _IONBF, 0);
  setvbuf(stderr, nullptr, _IONBF, 0);

  Args a;
  if (!parseArgs(argc, argv, a))
  {
    usage(argv[0]);
    return 2;
  }
  if (a.help)
  {
    usage(argv[0]);
    return 0;
  }

  std::string cfgPath = a.configPath;
  if (cfgPath.empty())
  {
    const char *e = std::getenv("PWDUCK_CONFIG");
    cfgPath = (e && e[0]) ? e : config::defaultConfigPath();
  }

  // File, then environment, then command line.
  config::ValidationError verr;
  auto loaded = config::loadConfigFile(cfgPath, verr);
  if (!loaded)
  {
    std::fprintf(stderr, "Config: %s: %s\n", cfgPath.c_str(), verr.message.c_str());
    return 1;
  }

  config::DuckConfig cfg = *loaded;
  config::applyEnvOverrides(cfg);
  if (a.attenuation)
    cfg.attenuationFactor = *a.attenuation;
  if (a.thresholdDb)
    config::setActivationThreshold(cfg, *a.thresholdDb);
  if (a.voice)
    cfg.voiceApplicationMatcher = *a.voice;
  if (a.verbose)
    cfg.verbose = true;

  auto validated = config::validateConfig(cfg, verr);
  if (!validated)
  {
    std::fprintf(stderr, "Config: %s\n", verr.message.c_str());
    return 1;
  }
  cfg = *validated;

  if (a.printConfig)
  {
    std::printf("%s\n", config::configToJson(cfg).dump(2).c_str());
    return 0;
  }

  std::fprintf(stderr, "Config: %s\n", cfgPath.c_str());

  pw_init(&argc, &argv);

  int rc = 0;
  {
    graph::PwGraphSession session(graph::PwGraphSession::optionsFrom(cfg));
    duck::DuckEngine engine(cfg, session);

    graph::GraphError gerr;
    if (!engine.start(gerr))
    {
      std::fprintf(stderr, "PW: %s: %s\n", graph::graphErrorKindName(gerr.kind), gerr.message.c_str());
      rc = 1;
    }
    else
    {
      control::ControlServer control(session.loop(), engine);
      const std::string socketPath = cfg.controlSocket.value_or(config::defaultControlSocketPath());
      if (!socketPath.empty())
      {
        std::string err;
        if (!control.open(socketPath, err))
          std::fprintf(stderr, "Control: %s (continuing without control socket)\n", err.c_str());
      }

      if (!engine.run(gerr))
      {
        std::fprintf(stderr, "PW: %s: %s\n", graph::graphErrorKindName(gerr.kind), gerr.message.c_str());
        rc = 1;
      }

      // Control sources live on the session's loop.
      control.close();
      engine.stop();
    }
  }

  pw_deinit();
  return rc;
}
