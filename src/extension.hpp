#pragma once

#include "event_stream.hpp"
#include "providers/registry.hpp"
#include "shared_server.hpp"

#include <memory>
#include <mutex>
#include <string>

namespace host_bridge {

// What one extension instance does as its view comes and goes: register the
// provider, and, if it can own the listener, hold interest in it.
class BridgeExtension {
 public:
  BridgeExtension(std::shared_ptr<IContextProvider> provider,
                  ProviderRegistry* registry,
                  SharedHttpServerState* servers,
                  ListenerFactory factory,
                  int port,
                  EventStream* events = nullptr);
  ~BridgeExtension();
  BridgeExtension(const BridgeExtension&) = delete;
  BridgeExtension& operator=(const BridgeExtension&) = delete;

  bool Attach(std::string* err);
  void Focus();
  void Detach();

  bool Attached() const;
  bool HoldsListener() const;
  const std::shared_ptr<IContextProvider>& Provider() const { return provider_; }

 private:
  void Notify(const std::string& event);

  std::shared_ptr<IContextProvider> provider_;
  ProviderRegistry* registry_;
  SharedHttpServerState* servers_;
  ListenerFactory factory_;
  int port_;
  EventStream* events_;

  mutable std::mutex mu_;
  bool attached_ = false;
  bool holds_listener_ = false;
};

}  // namespace host_bridge
