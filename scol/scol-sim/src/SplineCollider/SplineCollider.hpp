// Ticket: 0003_segment_emission
// Ticket: 0004_contact_aggregation

#ifndef SCOL_SIM_SPLINE_COLLIDER_HPP
#define SCOL_SIM_SPLINE_COLLIDER_HPP

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

#include "scol-sim/src/Baking/BakeSettings.hpp"
#include "scol-sim/src/Baking/SegmentBaker.hpp"
#include "scol-sim/src/Physics/ContactAggregator.hpp"
#include "scol-sim/src/Physics/ContactNotification.hpp"
#include "scol-sim/src/Physics/VolumeHost.hpp"
#include "scol-sim/src/Spline/Curve.hpp"

namespace scol_sim
{

/**
 * @brief Chain of collision volumes along a curve with unified contact events
 *
 * Combines a SegmentBaker (which owns the volumes created in the host) with a
 * ContactAggregator (which merges the per-volume notifications). The host
 * drives it in two ways:
 *
 * 1. bake() / clear() on explicit request, e.g. after editing the curve or
 *    the settings.
 * 2. processStep() once per physics step with every notification the host
 *    produced during that step.
 *
 * Notifications for volumes this collider does not currently own are
 * ignored, so a host can broadcast one notification list to several
 * colliders.
 *
 * clear() ends every open contact episode (exit events fire) because the
 * volumes that carried those contacts no longer exist.
 *
 * The curve and host are held by reference and must outlive the collider.
 *
 * Thread safety: Not thread-safe (single-threaded step loop)
 */
class SplineCollider
{
public:
  SplineCollider(const Curve& curve,
                 VolumeHost& host,
                 BakeSettings settings = BakeSettings{});

  ~SplineCollider() = default;

  /**
   * @brief Rebuild the baked set from the current settings
   *
   * The old volumes are destroyed first and never report End, so every open
   * contact episode is closed here: exit events fire for all objects in
   * contact, and objects still touching the new volumes enter again on the
   * next step.
   *
   * @return Number of volumes created
   */
  size_t bake();

  /**
   * @brief Destroy the baked set and end all open contacts
   */
  void clear();

  /**
   * @brief Replace the settings; takes effect on the next bake()
   */
  void setSettings(const BakeSettings& settings);

  [[nodiscard]] const BakeSettings& getSettings() const;

  /**
   * @brief True when the settings changed since the last bake
   *
   * Also true before the first bake.
   */
  [[nodiscard]] bool needsRebake() const;

  /**
   * @brief Consume one physics step worth of notifications
   *
   * Notifications are processed in the given order, then the stay sweep
   * runs once.
   */
  void processStep(std::span<const ContactNotification> notifications);

  /**
   * @brief Process one notification without ending the step
   * @return false if the notification was ignored (volume not owned)
   */
  bool processNotification(const ContactNotification& notification);

  /**
   * @brief Close the current step by running the stay sweep
   */
  void endStep();

  [[nodiscard]] bool hasBakedSegments() const;
  [[nodiscard]] size_t getSegmentCount() const;
  [[nodiscard]] const std::vector<BakedSegment>& getSegments() const;
  [[nodiscard]] const std::vector<SamplePoint>& getSamplePoints() const;
  [[nodiscard]] const SegmentBaker& getBaker() const;

  [[nodiscard]] bool isColliding(ObjectId other) const;
  [[nodiscard]] bool isOverlapping(ObjectId other) const;
  [[nodiscard]] bool isInContact(ObjectId other) const;

  [[nodiscard]] const ContactAggregator& getContacts() const;

  ContactAggregator::TriggerEvent& onTriggerEnter();
  ContactAggregator::TriggerEvent& onTriggerStay();
  ContactAggregator::TriggerEvent& onTriggerExit();
  ContactAggregator::CollisionEvent& onCollisionEnter();
  ContactAggregator::CollisionEvent& onCollisionStay();
  ContactAggregator::CollisionEvent& onCollisionExit();

  SplineCollider(const SplineCollider&) = delete;
  SplineCollider& operator=(const SplineCollider&) = delete;
  SplineCollider(SplineCollider&&) = delete;
  SplineCollider& operator=(SplineCollider&&) = delete;

private:
  const Curve& curve_;
  BakeSettings settings_;
  std::optional<BakeSettings> lastBakeRequest_;
  SegmentBaker baker_;
  ContactAggregator contacts_;
};

}  // namespace scol_sim

#endif  // SCOL_SIM_SPLINE_COLLIDER_HPP
