#pragma once

#include "config.hpp"
#include "providers/context_provider.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace host_bridge {

// Talks to one host view's embedded plugin surface: GET <base>/<operation>
// with the arguments as query parameters, or a form POST for writes.
class HttpContextProvider : public IContextProvider {
 public:
  explicit HttpContextProvider(UpstreamConfig upstream);

  std::string Name() const override;
  bool HasProgramContext() const override;
  bool HasProgramManagerService() const override;
  std::optional<std::vector<std::string>> Invoke(const ScriptCall& call, std::string* err) override;

  // The view may open or close its program while attached.
  void SetProgramContext(bool has_program);

  void SetTimeouts(int connect_seconds, int read_seconds);
  void SetMaxInFlight(int max_in_flight);

  const HttpEndpoint& Endpoint() const { return upstream_.endpoint; }

 private:
  UpstreamConfig upstream_;
  std::atomic<bool> program_context_;
  int connect_timeout_seconds_ = 5;
  int read_timeout_seconds_ = 30;
  int max_in_flight_ = 4;

  std::mutex mu_;
  int in_flight_ = 0;
};

}  // namespace host_bridge
