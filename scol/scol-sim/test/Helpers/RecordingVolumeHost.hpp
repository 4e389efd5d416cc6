// Ticket: 0003_segment_emission
// Test helper: VolumeHost that records every create/destroy call

#ifndef SCOL_SIM_TEST_RECORDING_VOLUME_HOST_HPP
#define SCOL_SIM_TEST_RECORDING_VOLUME_HOST_HPP

#include <cstddef>
#include <set>
#include <vector>

#include "scol-sim/src/Baking/SegmentDescriptor.hpp"
#include "scol-sim/src/Physics/VolumeHost.hpp"

namespace scol_sim::test
{

/**
 * @brief VolumeHost stand-in that only keeps books
 *
 * Tracks which handles are live, everything that was ever created and every
 * destroy call, so tests can check that a baker never leaks or double-frees
 * a volume.
 */
class RecordingVolumeHost final : public VolumeHost
{
public:
  VolumeHandle createVolume(const SegmentDescriptor& descriptor) override
  {
    VolumeHandle const handle = nextHandle_++;
    live_.insert(handle);
    created_.push_back(descriptor);
    return handle;
  }

  void destroyVolume(VolumeHandle handle) override
  {
    if (live_.erase(handle) == 0)
    {
      ++invalidDestroyCount_;
      return;
    }
    destroyed_.push_back(handle);
  }

  [[nodiscard]] size_t liveCount() const
  {
    return live_.size();
  }

  [[nodiscard]] bool isLive(VolumeHandle handle) const
  {
    return live_.contains(handle);
  }

  [[nodiscard]] const std::vector<SegmentDescriptor>& created() const
  {
    return created_;
  }

  [[nodiscard]] const std::vector<VolumeHandle>& destroyed() const
  {
    return destroyed_;
  }

  [[nodiscard]] size_t invalidDestroyCount() const
  {
    return invalidDestroyCount_;
  }

private:
  std::set<VolumeHandle> live_;
  std::vector<SegmentDescriptor> created_;
  std::vector<VolumeHandle> destroyed_;
  size_t invalidDestroyCount_{0};
  VolumeHandle nextHandle_{1};
};

}  // namespace scol_sim::test

#endif  // SCOL_SIM_TEST_RECORDING_VOLUME_HOST_HPP
