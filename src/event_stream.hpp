#pragma once

#include <nlohmann/json.hpp>

#include <condition_variable>
#include <deque>
#include <mutex>
#include <string>

namespace host_bridge {

// Idle -> Streaming -> Idle on disconnect. Streaming -> Closing when the
// server cancels the session; the writer then ends the stream and the
// release brings the guard back to Idle.
enum class StreamState { kIdle, kStreaming, kClosing };

enum class StreamAdmission { kAccepted, kConflict, kMethodNotAllowed };

struct AdmitResult {
  StreamAdmission status = StreamAdmission::kConflict;
  std::string connection_id;
  int connects = 0;
};

class StreamSessionGuard {
 public:
  // Check and transition happen under one lock: of any number of
  // simultaneous GETs exactly one is accepted.
  AdmitResult Admit(const std::string& method);

  // Only the holder of connection_id can release; stale ids are ignored.
  bool Release(const std::string& connection_id);

  // Streaming -> Closing. Returns false if nothing was streaming.
  bool Cancel();

  bool IsActive(const std::string& connection_id) const;
  StreamState State() const;
  std::string ActiveConnectionId() const;
  int Connects() const;

 private:
  mutable std::mutex mu_;
  StreamState state_ = StreamState::kIdle;
  std::string active_id_;
  int connects_ = 0;
};

const char* StreamStateName(StreamState state);

// The single-subscriber event channel. Events published while nobody is
// subscribed are dropped.
class EventStream {
 public:
  static constexpr size_t kMaxPendingEvents = 256;

  explicit EventStream(int keepalive_seconds);

  StreamSessionGuard& Guard() { return guard_; }
  const StreamSessionGuard& Guard() const { return guard_; }

  AdmitResult Open(const std::string& method);
  void Publish(const std::string& event, const nlohmann::json& data);

  // Blocks until an event is pending or the keep-alive interval elapses.
  // Returns false once the session is no longer the active one.
  bool NextChunk(const std::string& connection_id, std::string* out);

  // Called when the connection is gone.
  void EndSession(const std::string& connection_id);

  // Server shutdown: ends the current session, if any.
  void Close();

 private:
  StreamSessionGuard guard_;
  int keepalive_seconds_;

  std::mutex mu_;
  std::condition_variable cv_;
  std::deque<std::string> pending_;
};

std::string SseEvent(const std::string& event, const nlohmann::json& data);

}  // namespace host_bridge
