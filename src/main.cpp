#include "bridge_router.hpp"
#include "config.hpp"
#include "dispatcher.hpp"
#include "event_stream.hpp"
#include "extension.hpp"
#include "providers/http_context_provider.hpp"
#include "providers/registry.hpp"
#include "shared_server.hpp"
#include "whitelist.hpp"

#include <signal.h>

#include <iostream>
#include <memory>
#include <string>
#include <vector>

int main() {
  std::cout.setf(std::ios::unitbuf);

  // Block termination signals before any thread starts so every thread
  // inherits the mask and only sigwait below sees them.
  sigset_t signals;
  sigemptyset(&signals);
  sigaddset(&signals, SIGINT);
  sigaddset(&signals, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &signals, nullptr);

  auto cfg = host_bridge::LoadConfigFromEnv();

  std::cout << "[bridge] listen host=" << cfg.listen.host << " port=" << cfg.listen.port
            << " writes=" << (cfg.enable_writes ? "true" : "false") << "\n";

  host_bridge::ProviderRegistry registry;
  host_bridge::CommandDispatcher dispatcher(&registry, host_bridge::DefaultWhitelist(), cfg.enable_writes);
  host_bridge::EventStream events(cfg.sse_keepalive_seconds);
  host_bridge::SharedHttpServerState servers;
  host_bridge::BridgeRouter router(cfg, &registry, &dispatcher, &events, &servers);
  const auto factory = router.MakeListenerFactory();

  std::vector<std::unique_ptr<host_bridge::BridgeExtension>> extensions;
  for (const auto& up : cfg.upstreams) {
    auto provider = std::make_shared<host_bridge::HttpContextProvider>(up);
    provider->SetTimeouts(cfg.connect_timeout_seconds, cfg.read_timeout_seconds);
    provider->SetMaxInFlight(cfg.max_in_flight);
    std::cout << "[provider] " << up.name << " endpoint=" << up.endpoint.scheme << "://" << up.endpoint.host << ":"
              << up.endpoint.port << up.endpoint.base_path << " program=" << (up.program_context ? 1 : 0)
              << " manager=" << (up.program_manager ? 1 : 0) << "\n";

    auto ext = std::make_unique<host_bridge::BridgeExtension>(provider, &registry, &servers, factory,
                                                              cfg.listen.port, &events);
    std::string err;
    if (!ext->Attach(&err)) {
      std::cout << "[provider] " << up.name << " attach failed error=" << err << "\n";
      continue;
    }
    extensions.push_back(std::move(ext));
  }

  auto listener = servers.Current();
  if (!listener) {
    std::cout << "[bridge] no listener: no attached provider can own it\n";
    return 1;
  }
  listener.reset();

  int sig = 0;
  sigwait(&signals, &sig);
  std::cout << "[bridge] signal=" << sig << " shutting down\n";

  for (auto it = extensions.rbegin(); it != extensions.rend(); ++it) (*it)->Detach();
  servers.StopIfIdle(true);
  return 0;
}
