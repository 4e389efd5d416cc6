// Ticket: 0003_segment_emission
// Ticket: 0004_contact_aggregation

#include <gtest/gtest.h>
#include <vector>

#include "scol-sim/src/Physics/ProbeWorld.hpp"
#include "scol-sim/src/Spline/PolylineCurve.hpp"
#include "scol-sim/src/SplineCollider/SplineCollider.hpp"
#include "scol-sim/test/Helpers/ContactEventLog.hpp"

using namespace scol_sim;
using scol_sim::test::ContactEventLog;

namespace
{

constexpr ObjectId kProbeId{1};

PolylineCurve createLineAlongX(double length)
{
  return PolylineCurve{{Coordinate{0, 0, 0}, Coordinate{length, 0, 0}}};
}

BakeSettings sixCapsules()
{
  BakeSettings settings;
  settings.samplingMode = SamplingMode::Count;
  settings.segmentCount = 6;
  settings.radius = 0.5;
  return settings;
}

ProbeWorld::Probe largeProbe(bool isTrigger = false)
{
  ProbeWorld::Probe probe;
  probe.center = Coordinate{3.0, 0.0, 0.0};
  probe.radius = 2.0;
  probe.isTrigger = isTrigger;
  return probe;
}

}  // namespace

class SplineColliderTest : public ::testing::Test
{
protected:
  void runStep()
  {
    auto const notifications = world_.step();
    collider_.processStep(notifications);
  }

  PolylineCurve curve_{createLineAlongX(6.0)};
  ProbeWorld world_;
  SplineCollider collider_{curve_, world_, sixCapsules()};
};

// ============================================================================
// Unified Events
// ============================================================================

TEST_F(SplineColliderTest, ProbeAcrossAllSegmentsIsOneCollisionEpisode)
{
  ContactEventLog log{collider_};
  ASSERT_EQ(collider_.bake(), 6u);
  world_.setProbe(kProbeId, largeProbe());

  runStep();
  EXPECT_EQ(
    log.count(ContactEventKind::Enter, ContactChannel::Collision, kProbeId),
    1u);
  EXPECT_EQ(collider_.getContacts().getCollisionCount(kProbeId), 6);
  EXPECT_EQ(
    log.count(ContactEventKind::Stay, ContactChannel::Collision, kProbeId), 1u);

  runStep();
  EXPECT_EQ(
    log.count(ContactEventKind::Stay, ContactChannel::Collision, kProbeId), 2u);
  EXPECT_TRUE(collider_.isColliding(kProbeId));

  ASSERT_TRUE(world_.moveProbe(kProbeId, Coordinate{3.0, 10.0, 0.0}));
  runStep();
  EXPECT_EQ(
    log.count(ContactEventKind::Exit, ContactChannel::Collision, kProbeId), 1u);
  EXPECT_EQ(
    log.count(ContactEventKind::Stay, ContactChannel::Collision, kProbeId), 2u);
  EXPECT_FALSE(collider_.isInContact(kProbeId));
}

TEST_F(SplineColliderTest, TriggerProbeUsesTriggerEvents)
{
  ContactEventLog log{collider_};
  collider_.bake();
  world_.setProbe(kProbeId, largeProbe(true));

  runStep();
  runStep();
  ASSERT_TRUE(world_.removeProbe(kProbeId));
  runStep();

  EXPECT_EQ(
    log.count(ContactEventKind::Enter, ContactChannel::Trigger, kProbeId), 1u);
  EXPECT_EQ(
    log.count(ContactEventKind::Stay, ContactChannel::Trigger, kProbeId), 2u);
  EXPECT_EQ(
    log.count(ContactEventKind::Exit, ContactChannel::Trigger, kProbeId), 1u);
  EXPECT_EQ(
    log.count(ContactEventKind::Enter, ContactChannel::Collision, kProbeId),
    0u);
}

TEST_F(SplineColliderTest, ProbeSlidingAlongCurveNeverReenters)
{
  ContactEventLog log{collider_};
  collider_.bake();

  ProbeWorld::Probe probe;
  probe.center = Coordinate{0.0, 0.0, 0.0};
  probe.radius = 0.3;
  world_.setProbe(kProbeId, probe);

  for (int i = 0; i <= 60; ++i)
  {
    ASSERT_TRUE(
      world_.moveProbe(kProbeId, Coordinate{0.1 * i, 0.6, 0.0}));
    runStep();
  }

  EXPECT_EQ(
    log.count(ContactEventKind::Enter, ContactChannel::Collision, kProbeId),
    1u);
  EXPECT_EQ(
    log.count(ContactEventKind::Exit, ContactChannel::Collision, kProbeId), 0u);
  EXPECT_EQ(
    log.count(ContactEventKind::Stay, ContactChannel::Collision, kProbeId),
    61u);
}

TEST_F(SplineColliderTest, ProbeTurningIntoTriggerMovesToTriggerChannel)
{
  ContactEventLog log{collider_};
  collider_.bake();
  world_.setProbe(kProbeId, largeProbe());
  runStep();
  ASSERT_TRUE(collider_.isColliding(kProbeId));

  world_.setProbe(kProbeId, largeProbe(true));
  runStep();
  EXPECT_FALSE(collider_.isColliding(kProbeId));
  EXPECT_TRUE(collider_.isOverlapping(kProbeId));
  EXPECT_EQ(
    log.count(ContactEventKind::Exit, ContactChannel::Collision, kProbeId), 1u);
  EXPECT_EQ(
    log.count(ContactEventKind::Enter, ContactChannel::Trigger, kProbeId), 1u);

  ASSERT_TRUE(world_.moveProbe(kProbeId, Coordinate{3.0, 100.0, 0.0}));
  runStep();
  EXPECT_FALSE(collider_.isInContact(kProbeId));
  EXPECT_EQ(
    log.count(ContactEventKind::Exit, ContactChannel::Trigger, kProbeId), 1u);
}

// ============================================================================
// Bake Lifecycle
// ============================================================================

TEST_F(SplineColliderTest, NeedsRebakeTracksSettingsChanges)
{
  EXPECT_TRUE(collider_.needsRebake());

  collider_.bake();
  EXPECT_FALSE(collider_.needsRebake());

  collider_.setSettings(sixCapsules());
  EXPECT_FALSE(collider_.needsRebake());

  BakeSettings changed = sixCapsules();
  changed.radius = 0.75;
  collider_.setSettings(changed);
  EXPECT_TRUE(collider_.needsRebake());

  collider_.bake();
  EXPECT_FALSE(collider_.needsRebake());

  collider_.clear();
  EXPECT_TRUE(collider_.needsRebake());
}

TEST_F(SplineColliderTest, ClearEndsContactsAndDestroysVolumes)
{
  ContactEventLog log{collider_};
  collider_.bake();
  world_.setProbe(kProbeId, largeProbe());
  runStep();

  collider_.clear();

  EXPECT_EQ(
    log.count(ContactEventKind::Exit, ContactChannel::Collision, kProbeId), 1u);
  EXPECT_FALSE(collider_.isInContact(kProbeId));
  EXPECT_FALSE(collider_.hasBakedSegments());
  EXPECT_EQ(world_.getVolumeCount(), 0u);

  // Nothing left to report for the destroyed volumes
  EXPECT_TRUE(world_.step().empty());
}

TEST_F(SplineColliderTest, RebakeDuringContactStartsNewEpisode)
{
  ContactEventLog log{collider_};
  collider_.bake();
  world_.setProbe(kProbeId, largeProbe());
  runStep();

  // Rebaking closes the episode even though the probe has not moved
  collider_.bake();
  EXPECT_EQ(
    log.count(ContactEventKind::Exit, ContactChannel::Collision, kProbeId), 1u);
  EXPECT_FALSE(collider_.isInContact(kProbeId));
  EXPECT_EQ(world_.getVolumeCount(), 6u);

  runStep();
  EXPECT_EQ(
    log.count(ContactEventKind::Enter, ContactChannel::Collision, kProbeId),
    2u);
  EXPECT_EQ(collider_.getContacts().getCollisionCount(kProbeId), 6);
}

TEST_F(SplineColliderTest, MergedStraightLineBakesOneVolume)
{
  PolylineCurve const curve = createLineAlongX(8.0);
  BakeSettings settings;
  settings.samplingMode = SamplingMode::Count;
  settings.segmentCount = 4;
  settings.postProcess = PostProcess::MergeShallowBends;
  settings.minBendAngleDegrees = 10.0;

  ProbeWorld world;
  SplineCollider collider{curve, world, settings};

  EXPECT_EQ(collider.bake(), 1u);
  EXPECT_EQ(world.getVolumeCount(), 1u);
  EXPECT_DOUBLE_EQ(collider.getSegments().front().descriptor.length, 8.0);
}

TEST(SplineColliderLifetimeTest, DestructorReleasesVolumes)
{
  PolylineCurve const curve = createLineAlongX(6.0);
  ProbeWorld world;
  {
    SplineCollider collider{curve, world, sixCapsules()};
    collider.bake();
    EXPECT_EQ(world.getVolumeCount(), 6u);
  }
  EXPECT_EQ(world.getVolumeCount(), 0u);
}

// ============================================================================
// Notification Routing
// ============================================================================

TEST_F(SplineColliderTest, NotificationForForeignVolumeIsIgnored)
{
  ContactEventLog log{collider_};
  collider_.bake();

  ContactNotification notification;
  notification.volume = 999;
  notification.other = kProbeId;
  notification.channel = ContactChannel::Trigger;
  notification.phase = ContactPhase::Begin;

  EXPECT_FALSE(collider_.processNotification(notification));
  collider_.endStep();

  EXPECT_TRUE(log.events().empty());
  EXPECT_FALSE(collider_.isOverlapping(kProbeId));
}

TEST(SplineColliderSharedHostTest, BroadcastNotificationsReachOnlyOwner)
{
  PolylineCurve const left{{Coordinate{0, 0, 0}, Coordinate{2, 0, 0}}};
  PolylineCurve const right{{Coordinate{10, 0, 0}, Coordinate{12, 0, 0}}};
  ProbeWorld world;

  SplineCollider leftCollider{left, world, sixCapsules()};
  SplineCollider rightCollider{right, world, sixCapsules()};
  leftCollider.bake();
  rightCollider.bake();

  ProbeWorld::Probe probe;
  probe.center = Coordinate{1.0, 0.0, 0.0};
  probe.radius = 0.4;
  world.setProbe(kProbeId, probe);

  std::vector<ContactNotification> const notifications = world.step();
  leftCollider.processStep(notifications);
  rightCollider.processStep(notifications);

  EXPECT_TRUE(leftCollider.isColliding(kProbeId));
  EXPECT_FALSE(rightCollider.isColliding(kProbeId));
}
