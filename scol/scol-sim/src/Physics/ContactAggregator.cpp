// Ticket: 0004_contact_aggregation

#include "scol-sim/src/Physics/ContactAggregator.hpp"

#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace scol_sim
{

void ContactAggregator::processNotification(
  const ContactNotification& notification)
{
  if (notification.channel == ContactChannel::Trigger)
  {
    switch (notification.phase)
    {
      case ContactPhase::Begin:
        beginTrigger(notification.other);
        break;
      case ContactPhase::Continue:
        // Trigger stay needs no payload; dispatchStay() covers it
        break;
      case ContactPhase::End:
        endTrigger(notification.other);
        break;
    }
    return;
  }

  CollisionDetail detail = notification.detail.value_or(CollisionDetail{});
  detail.other = notification.other;

  switch (notification.phase)
  {
    case ContactPhase::Begin:
      beginCollision(detail);
      break;
    case ContactPhase::Continue:
      continueCollision(detail);
      break;
    case ContactPhase::End:
      endCollision(detail);
      break;
  }
}

void ContactAggregator::beginTrigger(ObjectId other)
{
  int& count = triggerContacts_[other];
  ++count;
  if (count == 1)
  {
    triggerEnter_.publish(other);
  }
}

void ContactAggregator::endTrigger(ObjectId other)
{
  auto it = triggerContacts_.find(other);
  if (it == triggerContacts_.end())
  {
    spdlog::debug("ContactAggregator: trigger end for untracked object {}",
                  other);
    return;
  }

  --it->second;
  if (it->second <= 0)
  {
    triggerContacts_.erase(it);
    triggerExit_.publish(other);
  }
}

void ContactAggregator::beginCollision(const CollisionDetail& detail)
{
  CollisionEntry& entry = collisionContacts_[detail.other];
  ++entry.count;
  entry.lastDetail = detail;
  if (entry.count == 1)
  {
    collisionEnter_.publish(detail);
  }
}

void ContactAggregator::continueCollision(const CollisionDetail& detail)
{
  auto it = collisionContacts_.find(detail.other);
  if (it != collisionContacts_.end() && it->second.count > 0)
  {
    it->second.lastDetail = detail;
  }
}

void ContactAggregator::endCollision(const CollisionDetail& detail)
{
  auto it = collisionContacts_.find(detail.other);
  if (it == collisionContacts_.end())
  {
    spdlog::debug("ContactAggregator: collision end for untracked object {}",
                  detail.other);
    return;
  }

  --it->second.count;
  if (it->second.count <= 0)
  {
    collisionContacts_.erase(it);
    collisionExit_.publish(detail);
  }
}

void ContactAggregator::dispatchStay()
{
  // Snapshot first: handlers may feed new notifications back in
  std::vector<ObjectId> overlapping;
  overlapping.reserve(triggerContacts_.size());
  for (const auto& [other, count] : triggerContacts_)
  {
    overlapping.push_back(other);
  }

  std::vector<CollisionDetail> colliding;
  colliding.reserve(collisionContacts_.size());
  for (const auto& [other, entry] : collisionContacts_)
  {
    colliding.push_back(entry.lastDetail);
  }

  for (ObjectId const other : overlapping)
  {
    triggerStay_.publish(other);
  }
  for (const auto& detail : colliding)
  {
    collisionStay_.publish(detail);
  }
}

void ContactAggregator::releaseAll()
{
  auto triggers = std::exchange(triggerContacts_, {});
  auto collisions = std::exchange(collisionContacts_, {});

  if (!triggers.empty() || !collisions.empty())
  {
    spdlog::debug(
      "ContactAggregator: releasing {} overlapping and {} colliding objects",
      triggers.size(),
      collisions.size());
  }

  for (const auto& [other, count] : triggers)
  {
    triggerExit_.publish(other);
  }
  for (const auto& [other, entry] : collisions)
  {
    collisionExit_.publish(entry.lastDetail);
  }
}

bool ContactAggregator::isColliding(ObjectId other) const
{
  return collisionContacts_.contains(other);
}

bool ContactAggregator::isOverlapping(ObjectId other) const
{
  return triggerContacts_.contains(other);
}

bool ContactAggregator::isInContact(ObjectId other) const
{
  return isColliding(other) || isOverlapping(other);
}

int ContactAggregator::getTriggerCount(ObjectId other) const
{
  auto it = triggerContacts_.find(other);
  return it == triggerContacts_.end() ? 0 : it->second;
}

int ContactAggregator::getCollisionCount(ObjectId other) const
{
  auto it = collisionContacts_.find(other);
  return it == collisionContacts_.end() ? 0 : it->second.count;
}

std::optional<CollisionDetail> ContactAggregator::getLastCollision(
  ObjectId other) const
{
  auto it = collisionContacts_.find(other);
  if (it == collisionContacts_.end())
  {
    return std::nullopt;
  }
  return it->second.lastDetail;
}

size_t ContactAggregator::getOverlappingObjectCount() const
{
  return triggerContacts_.size();
}

size_t ContactAggregator::getCollidingObjectCount() const
{
  return collisionContacts_.size();
}

}  // namespace scol_sim
