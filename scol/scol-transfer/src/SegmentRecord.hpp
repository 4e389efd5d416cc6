// Ticket: 0008_recording_pipeline

#ifndef SCOL_TRANSFER_SEGMENT_RECORD_HPP
#define SCOL_TRANSFER_SEGMENT_RECORD_HPP

#include <cstdint>
#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "scol-transfer/src/BakeRecord.hpp"
#include "scol-transfer/src/CoordinateRecord.hpp"
#include "scol-transfer/src/QuaternionDRecord.hpp"

namespace scol_transfer
{

/**
 * @brief One baked volume, in curve order within its bake
 */
struct SegmentRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t segment_index{0};  // Position in the baked set
  uint32_t volume_handle{0};  // Host handle at bake time
  uint32_t shape{0};
  uint32_t is_trigger{0};

  CoordinateRecord position;        // Midpoint (world space)
  QuaternionDRecord orientation;    // Local +Y onto the segment direction
  double radius{std::numeric_limits<double>::quiet_NaN()};  // [m]
  double length{std::numeric_limits<double>::quiet_NaN()};  // Endpoint distance [m]

  cpp_sqlite::ForeignKey<BakeRecord> bake;
};

BOOST_DESCRIBE_STRUCT(SegmentRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (segment_index,
                       volume_handle,
                       shape,
                       is_trigger,
                       position,
                       orientation,
                       radius,
                       length,
                       bake));

}  // namespace scol_transfer

#endif  // SCOL_TRANSFER_SEGMENT_RECORD_HPP
