// Ticket: 0003_segment_emission

#include "scol-sim/src/Baking/SegmentDescriptor.hpp"

namespace scol_sim
{

std::optional<SegmentDescriptor> SegmentDescriptor::fromEndpoints(
  const Coordinate& start,
  const Coordinate& end,
  const BakeSettings& settings)
{
  Vector3D const direction = end - start;
  double const length = direction.norm();
  if (!(length > kMinSegmentLength))
  {
    return std::nullopt;
  }

  SegmentDescriptor descriptor;
  descriptor.shape = settings.shape;
  descriptor.start = start;
  descriptor.end = end;
  descriptor.position = Coordinate::midpoint(start, end);
  // Normalize here: fromTo() treats very short vectors as zero
  descriptor.orientation =
    QuaternionD::fromTo(Vector3D::unitY(), Vector3D{direction / length});
  descriptor.radius = settings.radius;
  descriptor.length = length;
  descriptor.isTrigger = settings.isTrigger;
  return descriptor;
}

}  // namespace scol_sim
