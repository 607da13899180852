// Copyright (c) 2024 liudegui. MIT License.
//
// agent_demo.cpp -- Pairs this host with a gateway and serves a few commands.
//
// Usage: agent_demo <pairing-code> [config.(ini|json|yaml)]
//
// Commands: "hostname", "uptime", "upper <text>", "echo <text>" and the
// built-in "ping".

#include "ngw/agent.hpp"
#include "ngw/config.hpp"
#include "ngw/log.hpp"
#include "ngw/shutdown.hpp"

#include <unistd.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <string>
#include <thread>

// ============================================================================
// Command handler
// ============================================================================

static bool StartsWith(const std::string& s, const char* prefix) {
  return s.rfind(prefix, 0) == 0;
}

static ngw::CommandResult HandleCommand(const std::string& payload) {
  if (payload == "hostname") {
    char name[256] = {};
    if (::gethostname(name, sizeof(name) - 1) != 0) {
      return ngw::CommandResult::Fail("gethostname failed");
    }
    return ngw::CommandResult::Ok(name);
  }
  if (payload == "uptime") {
    std::ifstream in("/proc/uptime");
    std::string seconds;
    if (!(in >> seconds)) return ngw::CommandResult::Fail("uptime unavailable");
    return ngw::CommandResult::Ok(seconds);
  }
  if (StartsWith(payload, "upper ")) {
    std::string text = payload.substr(6);
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return ngw::CommandResult::Ok(text);
  }
  if (StartsWith(payload, "echo ")) return ngw::CommandResult::Ok(payload.substr(5));
  return ngw::CommandResult::Unhandled();
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  if (argc < 2) {
    std::fprintf(stderr, "usage: %s <pairing-code> [config]\n", argv[0]);
    return 2;
  }
  ngw::log::Init();

  ngw::AgentConfig cfg;
  if (argc > 2) {
#ifdef NGW_CONFIG_HAS_BACKEND
    ngw::MultiConfig file;
    auto loaded = file.LoadFile(argv[2]);
    auto parsed = loaded.has_value()
                      ? ngw::AgentConfig::Load(file)
                      : ngw::expected<ngw::AgentConfig, ngw::ConfigError>::error(
                            loaded.get_error());
    if (!parsed.has_value()) {
      NGW_LOG_ERROR("main", "cannot use %s: %s", argv[2], ngw::ToString(parsed.get_error()));
      return 1;
    }
    cfg = parsed.value();
#else
    NGW_LOG_ERROR("main", "built without config backends, cannot read %s", argv[2]);
    return 1;
#endif
  }
  if (cfg.hello.display_name.empty()) {
    char name[256] = {};
    if (::gethostname(name, sizeof(name) - 1) == 0) {
      cfg.hello.display_name = name;
      cfg.hello.hostname = name;
    }
  }
  if (cfg.hello.platform.empty()) cfg.hello.platform = "linux";

  ngw::NodeAgent agent(cfg, &HandleCommand);
  auto paired = agent.Pair(argv[1]);
  if (!paired.has_value()) {
    NGW_LOG_ERROR("main", "pairing failed: %s", ngw::ToString(paired.get_error()));
    return 1;
  }
  NGW_LOG_INFO("main", "paired as %s", paired.value().node_id.c_str());

  ngw::ShutdownSignal shutdown;
  if (!shutdown.Install().has_value()) {
    NGW_LOG_ERROR("main", "cannot install signal handlers");
    return 1;
  }
  std::thread waiter([&shutdown, &agent]() {
    static_cast<void>(shutdown.Wait());
    agent.Stop();
  });

  auto served = agent.Serve();
  shutdown.Trigger();
  waiter.join();

  int rc = 0;
  if (!served.has_value()) {
    NGW_LOG_ERROR("main", "agent stopped: %s (state %s)", ngw::ToString(served.get_error()),
                  ngw::ToString(agent.State()));
    rc = 1;
  } else {
    NGW_LOG_INFO("main", "agent finished (state %s)", ngw::ToString(agent.State()));
  }
  ngw::log::Shutdown();
  return rc;
}
