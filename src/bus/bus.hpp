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

namespace subagent {

// Type-safe event bus. Owned by whoever wires the components together;
// handlers run synchronously on the publishing thread.
class Bus {
 public:
  using SubscriptionId = uint64_t;

  Bus() = default;

  Bus(const Bus &) = delete;
  Bus &operator=(const Bus &) = delete;

  // Subscribe to events of type T
  template <typename T>
  SubscriptionId subscribe(std::function<void(const T &)> handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto id = next_id_++;
    auto type_idx = std::type_index(typeid(T));

    handlers_[type_idx].push_back({id, [handler](const std::any &event) {
                                     handler(std::any_cast<const T &>(event));
                                   }});

    return id;
  }

  // Unsubscribe
  void unsubscribe(SubscriptionId id);

  // Publish an event
  template <typename T>
  void publish(const T &event) {
    std::vector<std::function<void(const std::any &)>> to_call;

    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto type_idx = std::type_index(typeid(T));
      auto it = handlers_.find(type_idx);
      if (it != handlers_.end()) {
        for (const auto &entry : it->second) {
          to_call.push_back(entry.handler);
        }
      }
    }

    // Call handlers outside the lock
    std::any wrapped = event;
    for (const auto &handler : to_call) {
      handler(wrapped);
    }
  }

  // Number of live subscriptions
  size_t subscriber_count() const;

 private:
  struct HandlerEntry {
    SubscriptionId id;
    std::function<void(const std::any &)> handler;
  };

  mutable std::mutex mutex_;
  SubscriptionId next_id_ = 1;
  std::map<std::type_index, std::vector<HandlerEntry>> handlers_;
};

// Subagent lifecycle events
namespace events {

struct SubagentStarted {
  std::string subagent_id;
  std::string parent_context_id;
  std::string skill_name;
};

struct SubagentFinished {
  std::string subagent_id;
  std::string status;  // terminal status name, e.g. "complete"
  std::string error_message;
  int64_t tokens_used = 0;
  int tool_calls_made = 0;
};

struct SubagentEvicted {
  std::string subagent_id;
};

}  // namespace events

}  // namespace subagent
