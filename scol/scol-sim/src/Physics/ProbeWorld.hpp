// Ticket: 0007_probe_world_host

#ifndef SCOL_SIM_PHYSICS_PROBE_WORLD_HPP
#define SCOL_SIM_PHYSICS_PROBE_WORLD_HPP

#include <cstdint>
#include <map>
#include <optional>
#include <utility>
#include <vector>

#include "scol-sim/src/Baking/SegmentDescriptor.hpp"
#include "scol-sim/src/DataTypes/Coordinate.hpp"
#include "scol-sim/src/Physics/ContactNotification.hpp"
#include "scol-sim/src/Physics/VolumeHost.hpp"

namespace scol_sim
{

/**
 * @brief Minimal step-driven physics host built around sphere probes
 *
 * Stores baked volumes exactly as described and tests them each step against
 * a set of spherical probes (the "external objects"). step() diffs the
 * overlapping (volume, probe) pairs against the previous step and reports
 * one notification per pair:
 *
 * - Begin when a pair starts overlapping
 * - Continue while it keeps overlapping
 * - End when it stops overlapping or its probe was removed
 *
 * A pair reports on the trigger channel when either the volume or the probe
 * is a trigger, otherwise on the collision channel with a CollisionDetail.
 * If the channel of an overlapping pair changes (setProbe() replaced the
 * probe with a different trigger flag), the pair reports End on the old
 * channel followed by Begin on the new one in the same step.
 *
 * Destroying a volume drops its pairs without an End; the owner of the
 * volume is expected to release its own contacts.
 *
 * Notifications are ordered by volume handle, then by probe id.
 *
 * Thread safety: Not thread-safe
 */
class ProbeWorld final : public VolumeHost
{
public:
  struct Probe
  {
    Coordinate center;
    double radius{0.5};  // [m]
    bool isTrigger{false};
  };

  ProbeWorld() = default;
  ~ProbeWorld() override = default;

  [[nodiscard]] VolumeHandle createVolume(
    const SegmentDescriptor& descriptor) override;
  void destroyVolume(VolumeHandle handle) override;

  /**
   * @brief Add a probe or replace an existing one with the same id
   * @throws std::invalid_argument if the radius is not positive and finite
   */
  void setProbe(ObjectId id, const Probe& probe);

  /**
   * @brief Move an existing probe
   * @return false if no probe with that id exists
   */
  bool moveProbe(ObjectId id, const Coordinate& center);

  /**
   * @brief Remove a probe; its open contacts end on the next step()
   * @return false if no probe with that id exists
   */
  bool removeProbe(ObjectId id);

  /**
   * @brief Advance one physics step and report the contact changes
   */
  [[nodiscard]] std::vector<ContactNotification> step();

  [[nodiscard]] size_t getVolumeCount() const;
  [[nodiscard]] bool hasVolume(VolumeHandle handle) const;
  [[nodiscard]] std::optional<SegmentDescriptor> getVolume(
    VolumeHandle handle) const;
  [[nodiscard]] std::optional<Probe> getProbe(ObjectId id) const;
  [[nodiscard]] uint64_t getStepCount() const;

  /**
   * @brief Contact between one volume and one probe
   *
   * Capsules use the closest point on the core segment (start to end);
   * boxes use the closest point on the oriented box. The normal points from
   * the volume toward the probe center.
   *
   * @return std::nullopt if the shapes do not overlap. Touching exactly at
   *         the surface does not count as overlap.
   */
  [[nodiscard]] static std::optional<CollisionDetail> computeContact(
    const SegmentDescriptor& volume,
    const Probe& probe);

  ProbeWorld(const ProbeWorld&) = delete;
  ProbeWorld& operator=(const ProbeWorld&) = delete;
  ProbeWorld(ProbeWorld&&) noexcept = default;
  ProbeWorld& operator=(ProbeWorld&&) noexcept = default;

private:
  using PairKey = std::pair<VolumeHandle, ObjectId>;

  struct ActiveContact
  {
    ContactChannel channel{ContactChannel::Trigger};
    std::optional<CollisionDetail> detail;
  };

  static std::optional<CollisionDetail> capsuleContact(
    const SegmentDescriptor& volume,
    const Probe& probe);
  static std::optional<CollisionDetail> boxContact(
    const SegmentDescriptor& volume,
    const Probe& probe);

  std::map<VolumeHandle, SegmentDescriptor> volumes_;
  std::map<ObjectId, Probe> probes_;
  std::map<PairKey, ActiveContact> activeContacts_;
  VolumeHandle nextHandle_{1};
  uint64_t stepCount_{0};
};

}  // namespace scol_sim

#endif  // SCOL_SIM_PHYSICS_PROBE_WORLD_HPP
