#include "event_stream.hpp"

#include <chrono>
#include <cstdint>
#include <iostream>
#include <random>
#include <sstream>
#include <utility>

namespace host_bridge {
namespace {

static std::string Hex(uint64_t v) {
  std::ostringstream oss;
  oss << std::hex << v;
  return oss.str();
}

static uint64_t Rand64() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  return rng();
}

static std::string NewConnectionId() {
  auto now = static_cast<uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::system_clock::now().time_since_epoch())
          .count());
  return "sse-" + Hex(now) + "-" + Hex(Rand64());
}

}  // namespace

AdmitResult StreamSessionGuard::Admit(const std::string& method) {
  AdmitResult out;
  if (method != "GET") {
    out.status = StreamAdmission::kMethodNotAllowed;
    return out;
  }
  std::lock_guard<std::mutex> lock(mu_);
  out.connects = connects_;
  if (state_ != StreamState::kIdle) {
    out.status = StreamAdmission::kConflict;
    out.connection_id = active_id_;
    return out;
  }
  state_ = StreamState::kStreaming;
  active_id_ = NewConnectionId();
  connects_++;
  out.status = StreamAdmission::kAccepted;
  out.connection_id = active_id_;
  out.connects = connects_;
  return out;
}

bool StreamSessionGuard::Release(const std::string& connection_id) {
  std::lock_guard<std::mutex> lock(mu_);
  if (state_ == StreamState::kIdle || connection_id != active_id_) return false;
  state_ = StreamState::kIdle;
  active_id_.clear();
  return true;
}

bool StreamSessionGuard::Cancel() {
  std::lock_guard<std::mutex> lock(mu_);
  if (state_ != StreamState::kStreaming) return false;
  state_ = StreamState::kClosing;
  return true;
}

bool StreamSessionGuard::IsActive(const std::string& connection_id) const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_ == StreamState::kStreaming && connection_id == active_id_;
}

StreamState StreamSessionGuard::State() const {
  std::lock_guard<std::mutex> lock(mu_);
  return state_;
}

std::string StreamSessionGuard::ActiveConnectionId() const {
  std::lock_guard<std::mutex> lock(mu_);
  return active_id_;
}

int StreamSessionGuard::Connects() const {
  std::lock_guard<std::mutex> lock(mu_);
  return connects_;
}

const char* StreamStateName(StreamState state) {
  switch (state) {
    case StreamState::kIdle:
      return "idle";
    case StreamState::kStreaming:
      return "streaming";
    case StreamState::kClosing:
      return "closing";
  }
  return "unknown";
}

std::string SseEvent(const std::string& event, const nlohmann::json& data) {
  return std::string("event: ") + event + "\n" + "data: " + data.dump() + "\n\n";
}

EventStream::EventStream(int keepalive_seconds)
    : keepalive_seconds_(keepalive_seconds > 0 ? keepalive_seconds : 15) {}

AdmitResult EventStream::Open(const std::string& method) {
  auto admitted = guard_.Admit(method);
  if (admitted.status != StreamAdmission::kAccepted) return admitted;
  {
    std::lock_guard<std::mutex> lock(mu_);
    pending_.clear();
    pending_.push_back(
        SseEvent("ready", {{"connection_id", admitted.connection_id}, {"connects", admitted.connects}}));
  }
  cv_.notify_all();
  std::cout << "[sse] connect id=" << admitted.connection_id << " connects=" << admitted.connects << "\n";
  return admitted;
}

void EventStream::Publish(const std::string& event, const nlohmann::json& data) {
  {
    std::lock_guard<std::mutex> lock(mu_);
    if (guard_.State() != StreamState::kStreaming) return;
    pending_.push_back(SseEvent(event, data));
    while (pending_.size() > kMaxPendingEvents) pending_.pop_front();
  }
  cv_.notify_all();
}

bool EventStream::NextChunk(const std::string& connection_id, std::string* out) {
  std::unique_lock<std::mutex> lock(mu_);
  cv_.wait_for(lock, std::chrono::seconds(keepalive_seconds_),
               [&]() { return !pending_.empty() || !guard_.IsActive(connection_id); });
  if (!guard_.IsActive(connection_id)) return false;
  if (pending_.empty()) {
    *out = ": keepalive\n\n";
    return true;
  }
  *out = std::move(pending_.front());
  pending_.pop_front();
  return true;
}

void EventStream::EndSession(const std::string& connection_id) {
  {
    // Clear before releasing: once the guard is Idle the queue belongs to
    // the next session, whose Open() waits on mu_ to queue its ready event.
    std::lock_guard<std::mutex> lock(mu_);
    if (!guard_.Release(connection_id)) return;
    pending_.clear();
  }
  cv_.notify_all();
  std::cout << "[sse] disconnect id=" << connection_id << "\n";
}

void EventStream::Close() {
  const bool cancelled = guard_.Cancel();
  {
    // Taken so a writer between its predicate check and its wait cannot miss
    // the notification.
    std::lock_guard<std::mutex> lock(mu_);
  }
  cv_.notify_all();
  if (cancelled) std::cout << "[sse] cancel reason=shutdown\n";
}

}  // namespace host_bridge
