#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>
#include <vector>

#include "internal/events/subscription.hpp"

namespace install::events {

/*
  Typed event stream keyed by identity.

  Handlers run on the publishing thread, outside the bus lock, so a handler
  may subscribe, unsubscribe or publish again. A handler released while a
  publish is in flight is not invoked after the release.
*/
template <typename Event>
class EventBus {
 public:
  using Handler = std::function<void(const std::string& key, const Event& event)>;

  EventBus() : state_(std::make_shared<State>()) {
  }

  EventBus(const EventBus&)            = delete;
  EventBus& operator=(const EventBus&) = delete;

  Subscription Subscribe(const std::string& key, Handler handler) {
    auto entry     = std::make_shared<Entry>();
    entry->handler = std::move(handler);

    uint64_t id = 0;
    {
      std::lock_guard lock(state_->mutex);
      id = ++state_->next_id;
      state_->entries[key].emplace(id, entry);
    }

    std::weak_ptr<State> weak_state = state_;
    return Subscription([weak_state, key, id, entry] {
      entry->active = false;
      if (auto state = weak_state.lock()) {
        std::lock_guard lock(state->mutex);
        auto            it = state->entries.find(key);
        if (it == state->entries.end()) return;
        it->second.erase(id);
        if (it->second.empty()) state->entries.erase(it);
      }
    });
  }

  void Publish(const std::string& key, const Event& event) const {
    std::vector<std::shared_ptr<Entry>> targets;
    {
      std::lock_guard lock(state_->mutex);
      auto            it = state_->entries.find(key);
      if (it == state_->entries.end()) return;
      targets.reserve(it->second.size());
      for (const auto& [id, entry] : it->second) targets.push_back(entry);
    }

    for (const auto& entry : targets) {
      if (entry->active) entry->handler(key, event);
    }
  }

  std::size_t SubscriberCount(const std::string& key) const {
    std::lock_guard lock(state_->mutex);
    auto            it = state_->entries.find(key);
    return it == state_->entries.end() ? 0 : it->second.size();
  }

 private:
  struct Entry {
    Handler           handler;
    std::atomic<bool> active{true};
  };

  struct State {
    std::mutex                                                                      mutex;
    uint64_t                                                                        next_id = 0;
    std::unordered_map<std::string, std::unordered_map<uint64_t, std::shared_ptr<Entry>>> entries;
  };

  std::shared_ptr<State> state_;
};

} // namespace install::events
