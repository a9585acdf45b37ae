#include "shared_server.hpp"

#include <iostream>
#include <utility>

namespace host_bridge {

EmbeddedListener::~EmbeddedListener() {
  Stop();
}

bool EmbeddedListener::Start(const std::string& host, int port, std::string* err) {
  std::lock_guard<std::mutex> lock(mu_);
  if (started_) {
    if (err) *err = "listener already started";
    return false;
  }
  if (port == 0) {
    const int bound = server_.bind_to_any_port(host);
    if (bound < 0) {
      if (err) *err = "failed to bind " + host + ":0";
      return false;
    }
    port_.store(bound);
  } else {
    if (!server_.bind_to_port(host, port)) {
      if (err) *err = "failed to bind " + host + ":" + std::to_string(port);
      return false;
    }
    port_.store(port);
  }
  started_ = true;
  thread_ = std::thread([this]() { server_.listen_after_bind(); });
  server_.wait_until_ready();
  std::cout << "[listener] started host=" << host << " port=" << port_.load() << "\n";
  return true;
}

void EmbeddedListener::AddShutdownHook(std::function<void()> hook) {
  std::lock_guard<std::mutex> lock(mu_);
  shutdown_hooks_.push_back(std::move(hook));
}

void EmbeddedListener::Stop() {
  std::vector<std::function<void()>> hooks;
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (!started_ || stopped_) return;
    stopped_ = true;
    hooks.swap(shutdown_hooks_);
  }
  for (auto& hook : hooks) {
    if (hook) hook();
  }
  server_.stop();
  if (thread_.joinable()) thread_.join();
  std::cout << "[listener] stopped port=" << port_.load() << "\n";
}

bool EmbeddedListener::IsRunning() const {
  return server_.is_running();
}

SharedHttpServerState::~SharedHttpServerState() {
  StopIfIdle(true);
}

std::optional<ServerHandle> SharedHttpServerState::EnsureServer(int port,
                                                               const ListenerFactory& factory,
                                                               std::string* err) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  std::lock_guard<std::mutex> lock(mu_);
  return EnsureLocked(port, factory, err);
}

std::optional<ServerHandle> SharedHttpServerState::Acquire(int port,
                                                          const ListenerFactory& factory,
                                                          std::string* err) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  std::lock_guard<std::mutex> lock(mu_);
  auto handle = EnsureLocked(port, factory, err);
  if (handle) interest_++;
  return handle;
}

std::optional<ServerHandle> SharedHttpServerState::EnsureLocked(int port,
                                                               const ListenerFactory& factory,
                                                               std::string* err) {
  if (server_) {
    if (port != 0 && port != server_->Port()) {
      std::cout << "[listener] reuse requested_port=" << port << " bound_port=" << server_->Port() << "\n";
    }
    return ServerHandle{server_, false};
  }
  if (!factory) {
    if (err) *err = "no listener factory";
    return std::nullopt;
  }
  std::string create_err;
  auto created = factory(port, &create_err);
  if (!created) {
    if (err) *err = create_err.empty() ? "listener factory failed" : create_err;
    std::cout << "[listener] create failed port=" << port << " error=" << (err ? *err : create_err) << "\n";
    return std::nullopt;
  }
  server_ = created;
  created_ = true;
  return ServerHandle{std::move(created), true};
}

void SharedHttpServerState::Retain() {
  std::lock_guard<std::mutex> lock(mu_);
  interest_++;
}

void SharedHttpServerState::Release() {
  std::lock_guard<std::mutex> lock(mu_);
  if (interest_ > 0) interest_--;
}

int SharedHttpServerState::Interest() const {
  std::lock_guard<std::mutex> lock(mu_);
  return interest_;
}

bool SharedHttpServerState::StopIfIdle(bool force) {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  std::unique_lock<std::mutex> lock(mu_);
  return StopLocked(&lock, force);
}

bool SharedHttpServerState::ReleaseAndStopIfIdle() {
  std::lock_guard<std::mutex> lifecycle(lifecycle_mu_);
  std::unique_lock<std::mutex> lock(mu_);
  if (interest_ > 0) interest_--;
  return StopLocked(&lock, false);
}

// Called with lifecycle_mu_ held and *lock owning mu_; returns with mu_
// released.
bool SharedHttpServerState::StopLocked(std::unique_lock<std::mutex>* lock, bool force) {
  if (!server_ || (!force && interest_ > 0)) {
    lock->unlock();
    return false;
  }
  auto victim = std::move(server_);
  server_.reset();
  created_ = false;
  lock->unlock();
  victim->Stop();
  return true;
}

std::shared_ptr<EmbeddedListener> SharedHttpServerState::Current() const {
  std::lock_guard<std::mutex> lock(mu_);
  return server_;
}

bool SharedHttpServerState::Created() const {
  std::lock_guard<std::mutex> lock(mu_);
  return created_;
}

}  // namespace host_bridge
