// Ticket: 0004_contact_aggregation

#ifndef SCOL_SIM_PHYSICS_EVENT_CHANNEL_HPP
#define SCOL_SIM_PHYSICS_EVENT_CHANNEL_HPP

#include <algorithm>
#include <cstdint>
#include <functional>
#include <utility>
#include <vector>

namespace scol_sim
{

/**
 * @brief Multicast callback list
 *
 * Handlers run synchronously in subscription order. publish() iterates over
 * a snapshot, so a handler may subscribe or unsubscribe (itself included)
 * without disturbing the current dispatch; the change takes effect on the
 * next publish().
 *
 * @tparam Args Arguments passed to every handler
 */
template <typename... Args>
class EventChannel
{
public:
  using Handler = std::function<void(Args...)>;
  using SubscriptionId = uint64_t;

  EventChannel() = default;

  /**
   * @brief Register a handler
   * @return Id to pass to unsubscribe()
   */
  SubscriptionId subscribe(Handler handler)
  {
    SubscriptionId const id = nextId_++;
    handlers_.emplace_back(id, std::move(handler));
    return id;
  }

  /**
   * @brief Remove a handler
   * @return false if the id was not subscribed
   */
  bool unsubscribe(SubscriptionId id)
  {
    auto it = std::find_if(handlers_.begin(),
                           handlers_.end(),
                           [id](const auto& entry) { return entry.first == id; });
    if (it == handlers_.end())
    {
      return false;
    }
    handlers_.erase(it);
    return true;
  }

  void publish(Args... args) const
  {
    auto const snapshot = handlers_;
    for (const auto& [id, handler] : snapshot)
    {
      if (handler)
      {
        handler(args...);
      }
    }
  }

  [[nodiscard]] size_t getSubscriberCount() const
  {
    return handlers_.size();
  }

  void clear()
  {
    handlers_.clear();
  }

  EventChannel(const EventChannel&) = delete;
  EventChannel& operator=(const EventChannel&) = delete;
  EventChannel(EventChannel&&) noexcept = default;
  EventChannel& operator=(EventChannel&&) noexcept = default;
  ~EventChannel() = default;

private:
  std::vector<std::pair<SubscriptionId, Handler>> handlers_;
  SubscriptionId nextId_{1};
};

}  // namespace scol_sim

#endif  // SCOL_SIM_PHYSICS_EVENT_CHANNEL_HPP
