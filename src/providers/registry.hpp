#pragma once

#include "providers/context_provider.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <vector>

namespace host_bridge {

// Tracks attached providers in most-recently-touched order and the active
// provider for each capability class. T needs HasProgramContext().
template <typename T>
class ContextRegistry {
 public:
  void Register(std::shared_ptr<T> provider) {
    if (!provider) return;
    std::lock_guard<std::mutex> lock(mu_);
    Erase(provider.get());
    MakeMostRecent(std::move(provider));
  }

  void Unregister(const T* provider) {
    if (!provider) return;
    std::lock_guard<std::mutex> lock(mu_);
    if (!Erase(provider)) return;
    if (active_any_.get() == provider) active_any_ = history_.empty() ? nullptr : history_.back();
    if (active_program_.get() == provider) active_program_ = MostRecentEligible();
  }

  // An ineligible provider never displaces the active program provider.
  bool Promote(const T* provider) {
    if (!provider) return false;
    std::lock_guard<std::mutex> lock(mu_);
    auto it = Find(provider);
    if (it == history_.end()) return false;
    auto keep = *it;
    history_.erase(it);
    MakeMostRecent(std::move(keep));
    return true;
  }

  std::shared_ptr<T> Active(bool requires_program) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!requires_program) return active_any_;
    if (active_program_ && active_program_->HasProgramContext()) return active_program_;
    return MostRecentEligible();
  }

  size_t Size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return history_.size();
  }

  // Registration order, most recent last.
  std::vector<std::shared_ptr<T>> Snapshot() const {
    std::lock_guard<std::mutex> lock(mu_);
    return history_;
  }

 private:
  using History = std::vector<std::shared_ptr<T>>;

  typename History::iterator Find(const T* provider) {
    return std::find_if(history_.begin(), history_.end(),
                        [provider](const std::shared_ptr<T>& p) { return p.get() == provider; });
  }

  bool Erase(const T* provider) {
    auto it = Find(provider);
    if (it == history_.end()) return false;
    history_.erase(it);
    return true;
  }

  void MakeMostRecent(std::shared_ptr<T> provider) {
    history_.push_back(provider);
    if (provider->HasProgramContext()) active_program_ = provider;
    active_any_ = std::move(provider);
  }

  std::shared_ptr<T> MostRecentEligible() const {
    for (auto it = history_.rbegin(); it != history_.rend(); ++it) {
      if ((*it)->HasProgramContext()) return *it;
    }
    return nullptr;
  }

  mutable std::mutex mu_;
  History history_;
  std::shared_ptr<T> active_any_;
  std::shared_ptr<T> active_program_;
};

using ProviderRegistry = ContextRegistry<IContextProvider>;

}  // namespace host_bridge
