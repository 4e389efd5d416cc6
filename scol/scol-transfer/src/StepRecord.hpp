// Ticket: 0008_recording_pipeline

#ifndef SCOL_TRANSFER_STEP_RECORD_HPP
#define SCOL_TRANSFER_STEP_RECORD_HPP

#include <cstdint>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace scol_transfer
{

/**
 * @brief Database record for one physics step
 *
 * Per-step records (ContactEventRecord) reference this step via
 * ForeignKey<StepRecord>. The id field is inherited from BaseTransferObject
 * and is assigned by the recorder.
 */
struct StepRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t step_index{0};       // Host step counter
  double simulation_time{0.0};  // Simulation time [seconds]
  double wall_clock_time{0.0};  // Wall clock time [seconds since epoch]
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(StepRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (step_index, simulation_time, wall_clock_time));

}  // namespace scol_transfer

#endif  // SCOL_TRANSFER_STEP_RECORD_HPP
