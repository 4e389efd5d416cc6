// Ticket: 0008_recording_pipeline

#include "scol-sim/src/DataRecorder/RecordConversions.hpp"

namespace scol_sim
{

scol_transfer::CoordinateRecord toRecord(const Coordinate& c)
{
  scol_transfer::CoordinateRecord record;
  record.x = c.x();
  record.y = c.y();
  record.z = c.z();
  return record;
}

scol_transfer::Vector3DRecord toRecord(const Vector3D& v)
{
  scol_transfer::Vector3DRecord record;
  record.x = v.x();
  record.y = v.y();
  record.z = v.z();
  return record;
}

scol_transfer::QuaternionDRecord toRecord(const QuaternionD& q)
{
  scol_transfer::QuaternionDRecord record;
  record.w = q.w();
  record.x = q.x();
  record.y = q.y();
  record.z = q.z();
  return record;
}

scol_transfer::BakeRecord toBakeRecord(const SegmentBaker& baker)
{
  const BakeSettings& settings = baker.getEffectiveSettings();

  scol_transfer::BakeRecord record;
  record.shape = static_cast<uint32_t>(settings.shape);
  record.sampling_mode = static_cast<uint32_t>(settings.samplingMode);
  record.post_process = static_cast<uint32_t>(settings.postProcess);
  record.is_trigger = settings.isTrigger ? 1 : 0;
  record.segment_count_setting = static_cast<uint32_t>(settings.segmentCount);
  record.segment_spacing = settings.segmentSpacing;
  record.radius = settings.radius;
  record.min_bend_angle_deg = settings.minBendAngleDegrees;
  record.max_subdivision_depth =
    static_cast<uint32_t>(settings.maxSubdivisionDepth);
  record.curve_length = baker.getCurveLength();
  record.sample_count = static_cast<uint32_t>(baker.getSamplePoints().size());
  record.segment_count = static_cast<uint32_t>(baker.getSegmentCount());
  return record;
}

scol_transfer::SegmentRecord toSegmentRecord(const BakedSegment& segment,
                                             uint32_t segmentIndex)
{
  const SegmentDescriptor& descriptor = segment.descriptor;

  scol_transfer::SegmentRecord record;
  record.segment_index = segmentIndex;
  record.volume_handle = segment.handle;
  record.shape = static_cast<uint32_t>(descriptor.shape);
  record.is_trigger = descriptor.isTrigger ? 1 : 0;
  record.position = toRecord(descriptor.position);
  record.orientation = toRecord(descriptor.orientation);
  record.radius = descriptor.radius;
  record.length = descriptor.length;
  return record;
}

scol_transfer::ContactEventRecord toContactEventRecord(
  ContactEventKind kind,
  ContactChannel channel,
  ObjectId other,
  const CollisionDetail* detail)
{
  scol_transfer::ContactEventRecord record;
  record.object_id = other;
  record.channel = static_cast<uint32_t>(channel);
  record.kind = static_cast<uint32_t>(kind);
  if (detail != nullptr)
  {
    record.point = toRecord(detail->point);
    record.normal = toRecord(detail->normal);
    record.depth = detail->depth;
  }
  return record;
}

}  // namespace scol_sim
