#pragma once

#include <httplib.h>

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace host_bridge {

// An httplib::Server bound to one address and served from a background
// thread. Routes must be registered before Start().
class EmbeddedListener {
 public:
  EmbeddedListener() = default;
  ~EmbeddedListener();
  EmbeddedListener(const EmbeddedListener&) = delete;
  EmbeddedListener& operator=(const EmbeddedListener&) = delete;

  httplib::Server* Server() { return &server_; }

  // Port 0 binds an ephemeral port.
  bool Start(const std::string& host, int port, std::string* err);
  void Stop();

  // Runs on Stop() before the server is shut down.
  void AddShutdownHook(std::function<void()> hook);

  int Port() const { return port_.load(); }
  bool IsRunning() const;

 private:
  httplib::Server server_;
  std::thread thread_;
  std::atomic<int> port_{0};

  std::mutex mu_;
  bool started_ = false;
  bool stopped_ = false;
  std::vector<std::function<void()>> shutdown_hooks_;
};

using ListenerFactory = std::function<std::shared_ptr<EmbeddedListener>(int port, std::string* err)>;

struct ServerHandle {
  std::shared_ptr<EmbeddedListener> server;
  bool newly_created = false;
};

// Process-wide owner of the single embedded listener. Extension instances
// retain interest while they need it; the listener is torn down only once
// nobody does (or when forced).
class SharedHttpServerState {
 public:
  SharedHttpServerState() = default;
  ~SharedHttpServerState();
  SharedHttpServerState(const SharedHttpServerState&) = delete;
  SharedHttpServerState& operator=(const SharedHttpServerState&) = delete;

  // The factory runs only when no listener exists. Its failure leaves the
  // state empty so a later call can retry.
  std::optional<ServerHandle> EnsureServer(int port, const ListenerFactory& factory, std::string* err);

  // EnsureServer plus Retain in one critical section: the returned listener
  // cannot be torn down before the caller's interest is counted.
  std::optional<ServerHandle> Acquire(int port, const ListenerFactory& factory, std::string* err);

  void Retain();
  void Release();
  int Interest() const;

  // Returns true when a listener was torn down by this call.
  bool StopIfIdle(bool force);

  // Release plus StopIfIdle(false) in one critical section.
  bool ReleaseAndStopIfIdle();

  std::shared_ptr<EmbeddedListener> Current() const;
  bool Created() const;

 private:
  std::optional<ServerHandle> EnsureLocked(int port, const ListenerFactory& factory, std::string* err);
  bool StopLocked(std::unique_lock<std::mutex>* lock, bool force);

  // Serializes create and teardown. Held across EmbeddedListener::Stop(),
  // which mu_ must not be: route handlers read state under mu_ while Stop()
  // waits for them.
  std::mutex lifecycle_mu_;
  mutable std::mutex mu_;
  std::shared_ptr<EmbeddedListener> server_;
  bool created_ = false;
  int interest_ = 0;
};

}  // namespace host_bridge
