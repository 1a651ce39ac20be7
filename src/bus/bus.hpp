#pragma once

#include <any>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <typeindex>
#include <vector>

namespace codeloop {

// Process-wide typed pub/sub for loop observers
class Bus {
 public:
  using SubscriptionId = uint64_t;

  static Bus &instance();

  template <typename T>
  SubscriptionId subscribe(std::function<void(const T &)> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    handlers_[std::type_index(typeid(T))].push_back({id, [handler](const std::any &event) {
                                                       handler(std::any_cast<const T &>(event));
                                                     }});
    return id;
  }

  void unsubscribe(SubscriptionId id);

  // Handlers run on the publishing thread, outside the lock
  template <typename T>
  void publish(const T &event) {
    std::vector<std::function<void(const std::any &)>> to_call;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = handlers_.find(std::type_index(typeid(T)));
      if (it == handlers_.end()) return;
      for (const auto &entry : it->second) {
        to_call.push_back(entry.handler);
      }
    }

    std::any wrapped = event;
    for (const auto &handler : to_call) {
      handler(wrapped);
    }
  }

 private:
  Bus() = default;

  struct HandlerEntry {
    SubscriptionId id;
    std::function<void(const std::any &)> handler;
  };

  std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<std::type_index, std::vector<HandlerEntry>> handlers_;
};

// Unsubscribes on destruction
class ScopedSubscription {
 public:
  explicit ScopedSubscription(Bus::SubscriptionId id) : id_(id) {}
  ~ScopedSubscription() {
    Bus::instance().unsubscribe(id_);
  }
  ScopedSubscription(const ScopedSubscription &) = delete;
  ScopedSubscription &operator=(const ScopedSubscription &) = delete;

 private:
  Bus::SubscriptionId id_;
};

// Agent loop events
namespace events {

struct SessionStarted {
  std::string session_id;
  std::string provider;
  std::string model;
};

struct SessionEnded {
  std::string session_id;
  std::string reason;  // done, max_steps_exceeded, error, cancelled
  int steps = 0;
};

struct MessageAdded {
  std::string session_id;
  std::string message_id;
  std::string role;
};

struct ToolCallStarted {
  std::string session_id;
  std::string tool_call_id;
  std::string tool_name;
};

struct ToolCallCompleted {
  std::string session_id;
  std::string tool_call_id;
  std::string tool_name;
  bool is_error = false;
};

struct TokensUsed {
  std::string session_id;
  int64_t input_tokens = 0;
  int64_t output_tokens = 0;
};

struct PlanUpdated {
  std::string session_id;
  size_t plan_size = 0;
};

}  // namespace events

}  // namespace codeloop
