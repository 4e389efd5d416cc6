// Ticket: 0003_segment_emission
// Ticket: 0004_contact_aggregation

#include "scol-sim/src/SplineCollider/SplineCollider.hpp"

#include <utility>

namespace scol_sim
{

SplineCollider::SplineCollider(const Curve& curve,
                               VolumeHost& host,
                               BakeSettings settings)
  : curve_{curve}, settings_{std::move(settings)}, baker_{host}
{
}

size_t SplineCollider::bake()
{
  // Contacts from the old volumes cannot end through the host any more
  contacts_.releaseAll();
  baker_.bake(curve_, settings_);
  lastBakeRequest_ = settings_;
  return baker_.getSegmentCount();
}

void SplineCollider::clear()
{
  contacts_.releaseAll();
  baker_.clear();
  lastBakeRequest_.reset();
}

void SplineCollider::setSettings(const BakeSettings& settings)
{
  settings_ = settings;
}

const BakeSettings& SplineCollider::getSettings() const
{
  return settings_;
}

bool SplineCollider::needsRebake() const
{
  return !lastBakeRequest_ || *lastBakeRequest_ != settings_;
}

void SplineCollider::processStep(
  std::span<const ContactNotification> notifications)
{
  for (const auto& notification : notifications)
  {
    processNotification(notification);
  }
  endStep();
}

bool SplineCollider::processNotification(
  const ContactNotification& notification)
{
  if (!baker_.ownsVolume(notification.volume))
  {
    return false;
  }
  contacts_.processNotification(notification);
  return true;
}

void SplineCollider::endStep()
{
  contacts_.dispatchStay();
}

bool SplineCollider::hasBakedSegments() const
{
  return baker_.hasBakedSegments();
}

size_t SplineCollider::getSegmentCount() const
{
  return baker_.getSegmentCount();
}

const std::vector<BakedSegment>& SplineCollider::getSegments() const
{
  return baker_.getSegments();
}

const std::vector<SamplePoint>& SplineCollider::getSamplePoints() const
{
  return baker_.getSamplePoints();
}

const SegmentBaker& SplineCollider::getBaker() const
{
  return baker_;
}

bool SplineCollider::isColliding(ObjectId other) const
{
  return contacts_.isColliding(other);
}

bool SplineCollider::isOverlapping(ObjectId other) const
{
  return contacts_.isOverlapping(other);
}

bool SplineCollider::isInContact(ObjectId other) const
{
  return contacts_.isInContact(other);
}

const ContactAggregator& SplineCollider::getContacts() const
{
  return contacts_;
}

ContactAggregator::TriggerEvent& SplineCollider::onTriggerEnter()
{
  return contacts_.onTriggerEnter();
}

ContactAggregator::TriggerEvent& SplineCollider::onTriggerStay()
{
  return contacts_.onTriggerStay();
}

ContactAggregator::TriggerEvent& SplineCollider::onTriggerExit()
{
  return contacts_.onTriggerExit();
}

ContactAggregator::CollisionEvent& SplineCollider::onCollisionEnter()
{
  return contacts_.onCollisionEnter();
}

ContactAggregator::CollisionEvent& SplineCollider::onCollisionStay()
{
  return contacts_.onCollisionStay();
}

ContactAggregator::CollisionEvent& SplineCollider::onCollisionExit()
{
  return contacts_.onCollisionExit();
}

}  // namespace scol_sim
