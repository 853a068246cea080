#pragma once

#include <functional>
#include <utility>

namespace install::events {

/*
  Scoped registration on an EventBus.

  Releases itself on destruction, on Reset() and when moved over. Safe to
  destroy from inside the handler it guards.
*/
class Subscription {
 public:
  Subscription() = default;
  explicit Subscription(std::function<void()> release) : release_(std::move(release)) {
  }

  ~Subscription() {
    Reset();
  }

  Subscription(const Subscription&)            = delete;
  Subscription& operator=(const Subscription&) = delete;

  Subscription(Subscription&& other) noexcept : release_(std::exchange(other.release_, nullptr)) {
  }

  Subscription& operator=(Subscription&& other) noexcept {
    if (this != &other) {
      Reset();
      release_ = std::exchange(other.release_, nullptr);
    }
    return *this;
  }

  void Reset() {
    if (auto release = std::exchange(release_, nullptr)) {
      release();
    }
  }

  bool Active() const {
    return static_cast<bool>(release_);
  }

 private:
  std::function<void()> release_;
};

} // namespace install::events
