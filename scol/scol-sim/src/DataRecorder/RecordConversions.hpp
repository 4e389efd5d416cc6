// Ticket: 0008_recording_pipeline

#ifndef SCOL_SIM_DATA_RECORDER_RECORD_CONVERSIONS_HPP
#define SCOL_SIM_DATA_RECORDER_RECORD_CONVERSIONS_HPP

#include <cstdint>

#include "scol-sim/src/Baking/BakeSettings.hpp"
#include "scol-sim/src/Baking/SegmentBaker.hpp"
#include "scol-sim/src/DataTypes/Coordinate.hpp"
#include "scol-sim/src/DataTypes/Quaternion.hpp"
#include "scol-sim/src/DataTypes/Vector3D.hpp"
#include "scol-sim/src/Physics/ContactNotification.hpp"
#include "scol-transfer/src/BakeRecord.hpp"
#include "scol-transfer/src/ContactEventRecord.hpp"
#include "scol-transfer/src/CoordinateRecord.hpp"
#include "scol-transfer/src/QuaternionDRecord.hpp"
#include "scol-transfer/src/SegmentRecord.hpp"
#include "scol-transfer/src/Vector3DRecord.hpp"

namespace scol_sim
{

/**
 * @brief Conversions from simulation types to database transfer records
 *
 * Kept next to the recorder so the core library does not depend on
 * cpp_sqlite. Foreign keys are left for the caller to fill in.
 */

[[nodiscard]] scol_transfer::CoordinateRecord toRecord(const Coordinate& c);

[[nodiscard]] scol_transfer::Vector3DRecord toRecord(const Vector3D& v);

[[nodiscard]] scol_transfer::QuaternionDRecord toRecord(const QuaternionD& q);

/**
 * @brief Bake record for the most recent bake of a baker
 */
[[nodiscard]] scol_transfer::BakeRecord toBakeRecord(const SegmentBaker& baker);

[[nodiscard]] scol_transfer::SegmentRecord toSegmentRecord(
  const BakedSegment& segment,
  uint32_t segmentIndex);

/**
 * @brief Contact event record; trigger events pass no detail
 */
[[nodiscard]] scol_transfer::ContactEventRecord toContactEventRecord(
  ContactEventKind kind,
  ContactChannel channel,
  ObjectId other,
  const CollisionDetail* detail);

}  // namespace scol_sim

#endif  // SCOL_SIM_DATA_RECORDER_RECORD_CONVERSIONS_HPP
