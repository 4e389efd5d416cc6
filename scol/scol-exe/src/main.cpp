// Ticket: 0008_recording_pipeline
// Generate a recording of probes crossing a baked spline collider

#include <exception>
#include <stdexcept>
#include <string>
#include <vector>

#include <spdlog/spdlog.h>

#include "scol-sim/src/Baking/BakeSettings.hpp"
#include "scol-sim/src/DataRecorder/DataRecorder.hpp"
#include "scol-sim/src/DataTypes/Coordinate.hpp"
#include "scol-sim/src/Physics/ProbeWorld.hpp"
#include "scol-sim/src/Spline/BezierSpline.hpp"
#include "scol-sim/src/SplineCollider/SplineCollider.hpp"

using namespace scol_sim;

namespace
{

constexpr ObjectId kSweepingProbe{1};
constexpr ObjectId kTriggerProbe{2};
constexpr int kStepCount{200};
constexpr int kTriggerProbeRemovalStep{150};
constexpr double kTimeStep{0.01};  // [s]

// S-shaped path in the XY plane, two cubic pieces
BezierSpline createSCurve()
{
  return BezierSpline{{Coordinate{0.0, 0.0, 0.0},
                       Coordinate{3.0, 0.0, 0.0},
                       Coordinate{3.0, 4.0, 0.0},
                       Coordinate{6.0, 4.0, 0.0},
                       Coordinate{9.0, 4.0, 0.0},
                       Coordinate{9.0, 8.0, 0.0},
                       Coordinate{12.0, 8.0, 0.0}}};
}

void logEvents(SplineCollider& collider)
{
  collider.onCollisionEnter().subscribe(
    [](const CollisionDetail& detail)
    {
      spdlog::info("collision enter: object {} depth {:.3f} m",
                   detail.other,
                   detail.depth);
    });
  collider.onCollisionExit().subscribe(
    [](const CollisionDetail& detail)
    { spdlog::info("collision exit: object {}", detail.other); });
  collider.onTriggerEnter().subscribe(
    [](ObjectId other) { spdlog::info("trigger enter: object {}", other); });
  collider.onTriggerExit().subscribe(
    [](ObjectId other) { spdlog::info("trigger exit: object {}", other); });
}

}  // namespace

int main(int argc, char** argv)
{
  if (argc != 2)
  {
    spdlog::error("Usage: {} <output.db>", argv[0]);
    return 1;
  }

  std::string const outputPath = argv[1];
  spdlog::info("Generating spline collider recording: {}", outputPath);

  try
  {
    BezierSpline const curve = createSCurve();
    ProbeWorld world;

    BakeSettings settings;
    settings.shape = SegmentShape::Capsule;
    settings.samplingMode = SamplingMode::Distance;
    settings.segmentSpacing = 1.0;
    settings.radius = 0.5;
    settings.postProcess =
      PostProcess::MergeShallowBends | PostProcess::SubdivideSharpBends;
    settings.minBendAngleDegrees = 5.0;
    settings.maxSubdivisionDepth = 2;

    SplineCollider collider{curve, world, settings};
    size_t const segmentCount = collider.bake();
    spdlog::info("Baked {} segments along {:.2f} m of curve",
                 segmentCount,
                 curve.length());

    logEvents(collider);

    DataRecorder::Config config;
    config.databasePath = outputPath;
    DataRecorder recorder{config};
    recorder.recordBake(collider);
    recorder.attach(collider);

    // Probe 1 sweeps across the curve along y = 2; probe 2 sits on the curve
    // as a trigger until it is removed
    Coordinate const sweepStart{-2.0, 2.0, 0.0};
    Coordinate const sweepEnd{14.0, 2.0, 0.0};
    world.setProbe(kSweepingProbe, ProbeWorld::Probe{sweepStart, 0.4, false});
    world.setProbe(kTriggerProbe,
                   ProbeWorld::Probe{curve.position(0.75), 0.3, true});

    for (int step = 0; step < kStepCount; ++step)
    {
      double const time = step * kTimeStep;
      double const progress =
        static_cast<double>(step) / static_cast<double>(kStepCount - 1);
      if (!world.moveProbe(
            kSweepingProbe,
            Coordinate{sweepStart + progress * (sweepEnd - sweepStart)}))
      {
        throw std::runtime_error("sweeping probe is missing from the world");
      }

      if (step == kTriggerProbeRemovalStep &&
          !world.removeProbe(kTriggerProbe))
      {
        spdlog::warn("trigger probe {} already removed", kTriggerProbe);
      }

      recorder.recordStep(static_cast<uint32_t>(step), time);
      std::vector<ContactNotification> const notifications = world.step();
      collider.processStep(notifications);
    }

    recorder.detach();
    recorder.flush();
  }
  catch (const std::exception& e)
  {
    spdlog::error("Recording failed: {}", e.what());
    return 1;
  }

  spdlog::info("Recording complete: {}", outputPath);
  return 0;
}
