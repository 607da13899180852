// Copyright (c) 2024 liudegui. MIT License.
//
// gateway_demo.cpp -- Runs a node gateway until SIGINT/SIGTERM.
// Issues one pairing code at startup and pings every paired node periodically.
//
// Usage: gateway_demo [config.(ini|json|yaml)]

#include "ngw/config.hpp"
#include "ngw/gateway.hpp"
#include "ngw/log.hpp"
#include "ngw/shutdown.hpp"
#include "ngw/timer.hpp"

#include <cstdint>
#include <cstdio>

static constexpr uint32_t kStatusPeriodMs = 10000;
static constexpr uint32_t kPingTimeoutMs = 3000;

// ============================================================================
// Configuration
// ============================================================================

static bool LoadConfig(int argc, char* argv[], ngw::GatewayConfig& out) {
  if (argc < 2) {
    NGW_LOG_INFO("main", "no config file given, using defaults");
    return true;
  }
#ifdef NGW_CONFIG_HAS_BACKEND
  ngw::MultiConfig file;
  auto loaded = file.LoadFile(argv[1]);
  if (!loaded.has_value()) {
    NGW_LOG_ERROR("main", "cannot load %s: %s", argv[1], ngw::ToString(loaded.get_error()));
    return false;
  }
  auto cfg = ngw::GatewayConfig::Load(file);
  if (!cfg.has_value()) {
    NGW_LOG_ERROR("main", "invalid gateway config in %s", argv[1]);
    return false;
  }
  out = cfg.value();
  return true;
#else
  NGW_LOG_ERROR("main", "built without config backends, cannot read %s", argv[1]);
  return false;
#endif
}

// ============================================================================
// Periodic status
// ============================================================================

static void StatusTick(void* ctx) {
  auto* gw = static_cast<ngw::Gateway*>(ctx);
  const auto nodes = gw->ListNodes();
  NGW_LOG_INFO("status", "%zu nodes known", nodes.size());
  for (const auto& n : nodes) {
    NGW_LOG_INFO("status", "  %s (%s) %s", n.node_id.c_str(), n.display_name.c_str(),
                 ngw::ToString(n.connection_state));
  }
  for (const auto& kv : gw->Broadcast("ping", kPingTimeoutMs)) {
    NGW_LOG_INFO("status", "  ping %s -> %s", kv.first.c_str(),
                 ngw::ToString(kv.second.status));
  }
}

// ============================================================================
// Main
// ============================================================================

int main(int argc, char* argv[]) {
  ngw::log::Init();

  ngw::GatewayConfig cfg;
  if (!LoadConfig(argc, argv, cfg)) return 1;

  ngw::ShutdownSignal shutdown;
  if (!shutdown.Install().has_value()) {
    NGW_LOG_ERROR("main", "cannot install signal handlers");
    return 1;
  }

  auto gw = ngw::SharedGateway::Acquire(cfg);
  if (!gw.has_value()) {
    NGW_LOG_ERROR("main", "gateway failed to start: %s", ngw::ToString(gw.get_error()));
    return 1;
  }

  auto code = gw.value()->IssueCode("demo");
  if (code.has_value()) {
    std::printf("pairing code: %s (valid %u s)\n", code.value().code.c_str(),
                cfg.pairing.code_ttl_ms / 1000U);
    std::fflush(stdout);
  } else {
    NGW_LOG_WARN("main", "no pairing code issued: %s", ngw::ToString(code.get_error()));
  }

  ngw::TimerScheduler status(1);
  static_cast<void>(status.Add(kStatusPeriodMs, &StatusTick, gw.value().get()));
  static_cast<void>(status.Start());

  const int signo = shutdown.Wait();
  NGW_LOG_INFO("main", "signal %d received, shutting down", signo);

  status.Stop();
  ngw::SharedGateway::Teardown();
  ngw::log::Shutdown();
  return 0;
}
