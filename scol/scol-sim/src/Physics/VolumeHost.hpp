// Ticket: 0003_segment_emission

#ifndef SCOL_SIM_PHYSICS_VOLUME_HOST_HPP
#define SCOL_SIM_PHYSICS_VOLUME_HOST_HPP

#include <cstdint>

#include "scol-sim/src/Baking/SegmentDescriptor.hpp"

namespace scol_sim
{

/**
 * @brief Host-assigned identifier of one collision volume
 *
 * Zero is never handed out by a conforming host.
 */
using VolumeHandle = uint32_t;

static constexpr VolumeHandle kInvalidVolumeHandle{0};

/**
 * @brief Physics world abstraction that owns the actual collision volumes
 *
 * The baker describes each volume with a SegmentDescriptor; the host turns
 * it into whatever its collision engine needs and hands back a handle. The
 * baker keeps the handles and returns every one of them through
 * destroyVolume() before the next bake or on clear().
 *
 * Contact notifications produced by the host reference volumes by handle, so
 * no volume ever points back at its owner.
 */
class VolumeHost
{
public:
  virtual ~VolumeHost() = default;

  /**
   * @brief Create a volume in the physics world
   * @return Non-zero handle unique among the host's live volumes
   */
  [[nodiscard]] virtual VolumeHandle createVolume(
    const SegmentDescriptor& descriptor) = 0;

  /**
   * @brief Remove a volume previously returned by createVolume()
   *
   * After this returns the host must not report contacts for the handle.
   */
  virtual void destroyVolume(VolumeHandle handle) = 0;

protected:
  VolumeHost() = default;
  VolumeHost(const VolumeHost&) = default;
  VolumeHost& operator=(const VolumeHost&) = default;
  VolumeHost(VolumeHost&&) noexcept = default;
  VolumeHost& operator=(VolumeHost&&) noexcept = default;
};

}  // namespace scol_sim

#endif  // SCOL_SIM_PHYSICS_VOLUME_HOST_HPP
