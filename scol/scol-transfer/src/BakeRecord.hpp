// Ticket: 0008_recording_pipeline

#ifndef SCOL_TRANSFER_BAKE_RECORD_HPP
#define SCOL_TRANSFER_BAKE_RECORD_HPP

#include <cstdint>
#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace scol_transfer
{

/**
 * @brief Database record for one bake: the effective settings and its output
 *
 * Enum fields store the underlying integer of the scol_sim enum
 * (SegmentShape, SamplingMode, PostProcess bit set). Booleans are stored as
 * 0/1.
 */
struct BakeRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t shape{0};
  uint32_t sampling_mode{0};
  uint32_t post_process{0};
  uint32_t is_trigger{0};

  uint32_t segment_count_setting{0};
  double segment_spacing{std::numeric_limits<double>::quiet_NaN()};  // [m]
  double radius{std::numeric_limits<double>::quiet_NaN()};           // [m]
  double min_bend_angle_deg{std::numeric_limits<double>::quiet_NaN()};
  uint32_t max_subdivision_depth{0};

  double curve_length{std::numeric_limits<double>::quiet_NaN()};  // [m]
  uint32_t sample_count{0};
  uint32_t segment_count{0};
};

BOOST_DESCRIBE_STRUCT(BakeRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (shape,
                       sampling_mode,
                       post_process,
                       is_trigger,
                       segment_count_setting,
                       segment_spacing,
                       radius,
                       min_bend_angle_deg,
                       max_subdivision_depth,
                       curve_length,
                       sample_count,
                       segment_count));

}  // namespace scol_transfer

#endif  // SCOL_TRANSFER_BAKE_RECORD_HPP
