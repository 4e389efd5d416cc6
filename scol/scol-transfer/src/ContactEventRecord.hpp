// Ticket: 0008_recording_pipeline

#ifndef SCOL_TRANSFER_CONTACT_EVENT_RECORD_HPP
#define SCOL_TRANSFER_CONTACT_EVENT_RECORD_HPP

#include <cstdint>
#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>

#include "scol-transfer/src/CoordinateRecord.hpp"
#include "scol-transfer/src/StepRecord.hpp"
#include "scol-transfer/src/Vector3DRecord.hpp"

namespace scol_transfer
{

/**
 * @brief One unified contact event (enter / stay / exit) for one object
 *
 * channel stores scol_sim::ContactChannel, kind stores
 * scol_sim::ContactEventKind. Trigger events leave point, normal and depth
 * at NaN.
 */
struct ContactEventRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t object_id{0};
  uint32_t channel{0};
  uint32_t kind{0};

  CoordinateRecord point;
  Vector3DRecord normal;
  double depth{std::numeric_limits<double>::quiet_NaN()};  // [m]

  cpp_sqlite::ForeignKey<StepRecord> step;
};

BOOST_DESCRIBE_STRUCT(ContactEventRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (object_id, channel, kind, point, normal, depth, step));

}  // namespace scol_transfer

#endif  // SCOL_TRANSFER_CONTACT_EVENT_RECORD_HPP
