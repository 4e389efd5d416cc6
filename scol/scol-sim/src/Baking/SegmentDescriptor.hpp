// Ticket: 0003_segment_emission

#ifndef SCOL_SIM_BAKING_SEGMENT_DESCRIPTOR_HPP
#define SCOL_SIM_BAKING_SEGMENT_DESCRIPTOR_HPP

#include <optional>

#include "scol-sim/src/Baking/BakeSettings.hpp"
#include "scol-sim/src/DataTypes/Coordinate.hpp"
#include "scol-sim/src/DataTypes/Quaternion.hpp"
#include "scol-sim/src/DataTypes/Vector3D.hpp"

namespace scol_sim
{

/**
 * @brief Placement and size of one collision volume between two samples
 *
 * Every volume is authored along its local +Y axis and rotated so that +Y
 * points from the start sample to the end sample. The position is the
 * midpoint of the two samples.
 *
 * Capsule: radius r, total height length + 2r (hemispherical caps reach
 * exactly to the two samples' spheres).
 * Box: size (2r, length, 2r).
 */
struct SegmentDescriptor
{
  SegmentShape shape{SegmentShape::Capsule};
  Coordinate start;
  Coordinate end;
  Coordinate position;     // Midpoint of start and end [m]
  QuaternionD orientation;  // Rotates +Y onto (end - start)
  double radius{0.0};      // [m]
  double length{0.0};      // |end - start| [m]
  bool isTrigger{false};

  // Pairs closer than this produce no volume
  static constexpr double kMinSegmentLength{1e-9};

  /**
   * @brief Build the descriptor for the sample pair (start, end)
   * @return std::nullopt when the two samples coincide
   */
  [[nodiscard]] static std::optional<SegmentDescriptor> fromEndpoints(
    const Coordinate& start,
    const Coordinate& end,
    const BakeSettings& settings);

  /**
   * @brief Total capsule height including both hemispherical caps [m]
   */
  [[nodiscard]] double capsuleHeight() const
  {
    return length + 2.0 * radius;
  }

  /**
   * @brief Full box extents in the local frame (x, y, z) [m]
   */
  [[nodiscard]] Vector3D boxSize() const
  {
    return Vector3D{2.0 * radius, length, 2.0 * radius};
  }

  /**
   * @brief Unit direction from start to end in world space
   */
  [[nodiscard]] Vector3D axis() const
  {
    return orientation.rotate(Vector3D::unitY());
  }
};

}  // namespace scol_sim

#endif  // SCOL_SIM_BAKING_SEGMENT_DESCRIPTOR_HPP
