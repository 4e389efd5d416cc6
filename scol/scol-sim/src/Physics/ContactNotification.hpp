// Ticket: 0004_contact_aggregation

#ifndef SCOL_SIM_PHYSICS_CONTACT_NOTIFICATION_HPP
#define SCOL_SIM_PHYSICS_CONTACT_NOTIFICATION_HPP

#include <cstdint>
#include <optional>
#include <string_view>

#include "scol-sim/src/DataTypes/Coordinate.hpp"
#include "scol-sim/src/DataTypes/Vector3D.hpp"
#include "scol-sim/src/Physics/VolumeHost.hpp"

namespace scol_sim
{

/**
 * @brief Identity of an external object touching the segments
 *
 * Stable for the object's lifetime and comparable for equality.
 */
using ObjectId = uint32_t;

enum class ContactPhase : uint8_t
{
  Begin,
  Continue,
  End
};

enum class ContactChannel : uint8_t
{
  Trigger,    // Overlap without collision response
  Collision   // Solid contact
};

/**
 * @brief Unified event emitted by the aggregator for one object
 */
enum class ContactEventKind : uint8_t
{
  Enter,
  Stay,
  Exit
};

/**
 * @brief Per-contact data reported on the collision channel
 *
 * The normal points from the segment toward the other object.
 */
struct CollisionDetail
{
  ObjectId other{0};
  Coordinate point;       // Contact point on the segment surface [m]
  Vector3D normal;        // Unit contact normal
  double depth{0.0};      // Penetration depth [m]
};

/**
 * @brief One contact notification from the physics host for one volume
 *
 * Collision-channel notifications carry a detail; trigger notifications
 * leave it empty.
 */
struct ContactNotification
{
  VolumeHandle volume{kInvalidVolumeHandle};
  ObjectId other{0};
  ContactPhase phase{ContactPhase::Begin};
  ContactChannel channel{ContactChannel::Trigger};
  std::optional<CollisionDetail> detail;
};

[[nodiscard]] constexpr std::string_view toString(ContactPhase phase)
{
  switch (phase)
  {
    case ContactPhase::Begin:
      return "Begin";
    case ContactPhase::Continue:
      return "Continue";
    case ContactPhase::End:
      return "End";
  }
  return "Unknown";
}

[[nodiscard]] constexpr std::string_view toString(ContactChannel channel)
{
  switch (channel)
  {
    case ContactChannel::Trigger:
      return "Trigger";
    case ContactChannel::Collision:
      return "Collision";
  }
  return "Unknown";
}

}  // namespace scol_sim

#endif  // SCOL_SIM_PHYSICS_CONTACT_NOTIFICATION_HPP
