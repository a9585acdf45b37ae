#pragma once

#include "config.hpp"
#include "dispatcher.hpp"
#include "event_stream.hpp"
#include "providers/registry.hpp"
#include "shared_server.hpp"

#include <httplib.h>

#include <string>

namespace host_bridge {

class BridgeRouter {
 public:
  BridgeRouter(const BridgeConfig& cfg,
               ProviderRegistry* registry,
               CommandDispatcher* dispatcher,
               EventStream* events,
               SharedHttpServerState* servers);

  void Register(httplib::Server* server);

  // Creates a listener with the bridge routes on cfg.listen.host. Stopping
  // the listener ends any open event stream first.
  ListenerFactory MakeListenerFactory();

 private:
  BridgeConfig cfg_;
  ProviderRegistry* registry_;
  CommandDispatcher* dispatcher_;
  EventStream* events_;
  SharedHttpServerState* servers_;
};

}  // namespace host_bridge
