// Ticket: 0004_contact_aggregation

#ifndef SCOL_SIM_PHYSICS_CONTACT_AGGREGATOR_HPP
#define SCOL_SIM_PHYSICS_CONTACT_AGGREGATOR_HPP

#include <cstddef>
#include <optional>
#include <unordered_map>

#include "scol-sim/src/Physics/ContactNotification.hpp"
#include "scol-sim/src/Physics/EventChannel.hpp"

namespace scol_sim
{

/**
 * @brief Collapses per-segment contact notifications into per-object events
 *
 * Every baked segment reports its own begin/continue/end notifications. The
 * aggregator keeps one contact count per external object and channel, so an
 * object touched by K segments at once still sees a single contact episode:
 *
 * - begin: count += 1, enter fires when the count becomes 1
 * - end: count -= 1, exit fires when the count reaches 0 and the entry is
 *   removed; an end for an untracked object is ignored
 * - continue (collision only): refreshes the cached detail while count > 0
 *
 * Stay events are not driven by notifications. The owner calls
 * dispatchStay() once per physics step, after all of that step's
 * notifications, and every tracked object receives exactly one stay per
 * channel it is in contact on.
 *
 * Segments are anonymous: nothing here records which volume a notification
 * came from.
 *
 * Thread safety: Not thread-safe (single-threaded step loop)
 */
class ContactAggregator
{
public:
  using TriggerEvent = EventChannel<ObjectId>;
  using CollisionEvent = EventChannel<const CollisionDetail&>;

  ContactAggregator() = default;

  /**
   * @brief Route one host notification to the matching handler below
   */
  void processNotification(const ContactNotification& notification);

  void beginTrigger(ObjectId other);
  void endTrigger(ObjectId other);

  void beginCollision(const CollisionDetail& detail);
  void continueCollision(const CollisionDetail& detail);
  void endCollision(const CollisionDetail& detail);

  /**
   * @brief Fire trigger stay and collision stay for every tracked object
   *
   * Collision stay carries the most recently cached detail.
   */
  void dispatchStay();

  /**
   * @brief End every open contact episode
   *
   * Fires exit for every tracked object on both channels and empties the
   * maps. Used when the volumes that produced the contacts are destroyed,
   * since the host reports nothing further for them.
   */
  void releaseAll();

  [[nodiscard]] bool isColliding(ObjectId other) const;
  [[nodiscard]] bool isOverlapping(ObjectId other) const;
  [[nodiscard]] bool isInContact(ObjectId other) const;

  [[nodiscard]] int getTriggerCount(ObjectId other) const;
  [[nodiscard]] int getCollisionCount(ObjectId other) const;

  /**
   * @brief Most recent collision detail cached for an object
   * @return std::nullopt if the object is not colliding
   */
  [[nodiscard]] std::optional<CollisionDetail> getLastCollision(
    ObjectId other) const;

  [[nodiscard]] size_t getOverlappingObjectCount() const;
  [[nodiscard]] size_t getCollidingObjectCount() const;

  TriggerEvent& onTriggerEnter()
  {
    return triggerEnter_;
  }
  TriggerEvent& onTriggerStay()
  {
    return triggerStay_;
  }
  TriggerEvent& onTriggerExit()
  {
    return triggerExit_;
  }
  CollisionEvent& onCollisionEnter()
  {
    return collisionEnter_;
  }
  CollisionEvent& onCollisionStay()
  {
    return collisionStay_;
  }
  CollisionEvent& onCollisionExit()
  {
    return collisionExit_;
  }

  ContactAggregator(const ContactAggregator&) = delete;
  ContactAggregator& operator=(const ContactAggregator&) = delete;
  ContactAggregator(ContactAggregator&&) noexcept = default;
  ContactAggregator& operator=(ContactAggregator&&) noexcept = default;
  ~ContactAggregator() = default;

private:
  struct CollisionEntry
  {
    int count{0};
    CollisionDetail lastDetail;
  };

  std::unordered_map<ObjectId, int> triggerContacts_;
  std::unordered_map<ObjectId, CollisionEntry> collisionContacts_;

  TriggerEvent triggerEnter_;
  TriggerEvent triggerStay_;
  TriggerEvent triggerExit_;
  CollisionEvent collisionEnter_;
  CollisionEvent collisionStay_;
  CollisionEvent collisionExit_;
};

}  // namespace scol_sim

#endif  // SCOL_SIM_PHYSICS_CONTACT_AGGREGATOR_HPP
