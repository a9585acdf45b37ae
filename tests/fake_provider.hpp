#pragma once

#include "providers/context_provider.hpp"

#include <atomic>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace host_bridge {

// In-memory provider: records every call and answers with canned lines.
class FakeProvider : public IContextProvider {
 public:
  FakeProvider(std::string name, bool program, bool manager)
      : name_(std::move(name)), program_(program), manager_(manager) {}

  std::string Name() const override { return name_; }
  bool HasProgramContext() const override { return program_.load(); }
  bool HasProgramManagerService() const override { return manager_; }

  std::optional<std::vector<std::string>> Invoke(const ScriptCall& call, std::string* err) override {
    std::lock_guard<std::mutex> lock(mu_);
    calls_.push_back(call);
    if (fail_) {
      if (err) *err = name_ + ": connection refused";
      return std::nullopt;
    }
    return lines_;
  }

  void SetProgramContext(bool v) { program_.store(v); }

  void SetLines(std::vector<std::string> lines) {
    std::lock_guard<std::mutex> lock(mu_);
    lines_ = std::move(lines);
  }

  void SetFail(bool v) {
    std::lock_guard<std::mutex> lock(mu_);
    fail_ = v;
  }

  std::vector<ScriptCall> Calls() const {
    std::lock_guard<std::mutex> lock(mu_);
    return calls_;
  }

 private:
  std::string name_;
  std::atomic<bool> program_;
  bool manager_;

  mutable std::mutex mu_;
  std::vector<std::string> lines_;
  bool fail_ = false;
  std::vector<ScriptCall> calls_;
};

}  // namespace host_bridge
