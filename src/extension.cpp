#include "extension.hpp"

#include <iostream>
#include <utility>

namespace host_bridge {

BridgeExtension::BridgeExtension(std::shared_ptr<IContextProvider> provider,
                                 ProviderRegistry* registry,
                                 SharedHttpServerState* servers,
                                 ListenerFactory factory,
                                 int port,
                                 EventStream* events)
    : provider_(std::move(provider)),
      registry_(registry),
      servers_(servers),
      factory_(std::move(factory)),
      port_(port),
      events_(events) {}

BridgeExtension::~BridgeExtension() {
  Detach();
}

bool BridgeExtension::Attach(std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (attached_) return true;
  if (!provider_ || !registry_) {
    if (err) *err = "extension has no provider or registry";
    return false;
  }

  if (provider_->HasProgramManagerService() && servers_) {
    std::string create_err;
    auto handle = servers_->Acquire(port_, factory_, &create_err);
    if (!handle) {
      if (err) *err = create_err;
      std::cout << "[extension] attach failed provider=" << provider_->Name() << " error=" << create_err << "\n";
      return false;
    }
    holds_listener_ = true;
    std::cout << "[extension] listener provider=" << provider_->Name() << " port=" << handle->server->Port()
              << " created=" << (handle->newly_created ? 1 : 0) << "\n";
  }

  registry_->Register(provider_);
  attached_ = true;
  std::cout << "[extension] attach provider=" << provider_->Name()
            << " program=" << (provider_->HasProgramContext() ? 1 : 0)
            << " manager=" << (provider_->HasProgramManagerService() ? 1 : 0) << "\n";
  Notify("provider.attached");
  return true;
}

void BridgeExtension::Focus() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!attached_) return;
    if (!registry_->Promote(provider_.get())) return;
  }
  Notify("provider.focused");
}

void BridgeExtension::Detach() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!attached_) return;
    attached_ = false;
    registry_->Unregister(provider_.get());
    if (holds_listener_) {
      holds_listener_ = false;
      servers_->ReleaseAndStopIfIdle();
    }
  }
  std::cout << "[extension] detach provider=" << provider_->Name() << "\n";
  Notify("provider.detached");
}

bool BridgeExtension::Attached() const {
  std::lock_guard<std::mutex> lock(mu_);
  return attached_;
}

bool BridgeExtension::HoldsListener() const {
  std::lock_guard<std::mutex> lock(mu_);
  return holds_listener_;
}

void BridgeExtension::Notify(const std::string& event) {
  if (!events_ || !provider_) return;
  nlohmann::json data;
  data["provider"] = provider_->Name();
  data["program"] = provider_->HasProgramContext();
  if (registry_) {
    auto active = registry_->Active(false);
    auto active_program = registry_->Active(true);
    data["active"] = active ? nlohmann::json(active->Name()) : nlohmann::json(nullptr);
    data["active_program"] = active_program ? nlohmann::json(active_program->Name()) : nlohmann::json(nullptr);
  }
  events_->Publish(event, data);
}

}  // namespace host_bridge
