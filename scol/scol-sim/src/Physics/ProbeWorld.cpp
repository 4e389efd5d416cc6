// Ticket: 0007_probe_world_host

#include "scol-sim/src/Physics/ProbeWorld.hpp"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace scol_sim
{

namespace
{

constexpr double kDegenerateDistance{1e-12};

}  // namespace

VolumeHandle ProbeWorld::createVolume(const SegmentDescriptor& descriptor)
{
  if (nextHandle_ == std::numeric_limits<VolumeHandle>::max())
  {
    throw std::runtime_error("ProbeWorld: volume handles exhausted");
  }
  VolumeHandle const handle = nextHandle_++;
  volumes_.emplace(handle, descriptor);
  return handle;
}

void ProbeWorld::destroyVolume(VolumeHandle handle)
{
  if (volumes_.erase(handle) == 0)
  {
    spdlog::warn("ProbeWorld: destroyVolume on unknown handle {}", handle);
    return;
  }

  std::erase_if(activeContacts_,
                [handle](const auto& entry)
                { return entry.first.first == handle; });
}

void ProbeWorld::setProbe(ObjectId id, const Probe& probe)
{
  if (!std::isfinite(probe.radius) || probe.radius <= 0.0)
  {
    throw std::invalid_argument("ProbeWorld: probe " + std::to_string(id) +
                                " radius must be positive, got " +
                                std::to_string(probe.radius));
  }
  probes_[id] = probe;
}

bool ProbeWorld::moveProbe(ObjectId id, const Coordinate& center)
{
  auto it = probes_.find(id);
  if (it == probes_.end())
  {
    return false;
  }
  it->second.center = center;
  return true;
}

bool ProbeWorld::removeProbe(ObjectId id)
{
  return probes_.erase(id) > 0;
}

std::vector<ContactNotification> ProbeWorld::step()
{
  std::vector<ContactNotification> notifications;
  std::map<PairKey, ActiveContact> nextContacts;

  for (const auto& [handle, volume] : volumes_)
  {
    for (const auto& [id, probe] : probes_)
    {
      PairKey const key{handle, id};
      auto previous = activeContacts_.find(key);
      bool const wasActive = previous != activeContacts_.end();

      std::optional<CollisionDetail> contact = computeContact(volume, probe);
      if (contact)
      {
        contact->other = id;

        ActiveContact active;
        active.channel = (volume.isTrigger || probe.isTrigger)
                           ? ContactChannel::Trigger
                           : ContactChannel::Collision;
        if (active.channel == ContactChannel::Collision)
        {
          active.detail = contact;
        }

        bool const channelChanged =
          wasActive && previous->second.channel != active.channel;
        if (channelChanged)
        {
          // Trigger flag flipped while overlapping: close the old episode
          notifications.push_back(ContactNotification{handle,
                                                      id,
                                                      ContactPhase::End,
                                                      previous->second.channel,
                                                      previous->second.detail});
        }

        notifications.push_back(ContactNotification{
          handle,
          id,
          (wasActive && !channelChanged) ? ContactPhase::Continue
                                         : ContactPhase::Begin,
          active.channel,
          active.detail});
        nextContacts.emplace(key, std::move(active));
      }
      else if (wasActive)
      {
        notifications.push_back(ContactNotification{handle,
                                                    id,
                                                    ContactPhase::End,
                                                    previous->second.channel,
                                                    previous->second.detail});
      }
    }
  }

  // Pairs whose probe disappeared since the last step
  for (const auto& [key, active] : activeContacts_)
  {
    if (!probes_.contains(key.second))
    {
      notifications.push_back(ContactNotification{
        key.first, key.second, ContactPhase::End, active.channel, active.detail});
    }
  }

  activeContacts_ = std::move(nextContacts);
  ++stepCount_;
  return notifications;
}

size_t ProbeWorld::getVolumeCount() const
{
  return volumes_.size();
}

bool ProbeWorld::hasVolume(VolumeHandle handle) const
{
  return volumes_.contains(handle);
}

std::optional<SegmentDescriptor> ProbeWorld::getVolume(
  VolumeHandle handle) const
{
  auto it = volumes_.find(handle);
  if (it == volumes_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

std::optional<ProbeWorld::Probe> ProbeWorld::getProbe(ObjectId id) const
{
  auto it = probes_.find(id);
  if (it == probes_.end())
  {
    return std::nullopt;
  }
  return it->second;
}

uint64_t ProbeWorld::getStepCount() const
{
  return stepCount_;
}

std::optional<CollisionDetail> ProbeWorld::computeContact(
  const SegmentDescriptor& volume,
  const Probe& probe)
{
  switch (volume.shape)
  {
    case SegmentShape::Capsule:
      return capsuleContact(volume, probe);
    case SegmentShape::Box:
      return boxContact(volume, probe);
  }
  return std::nullopt;
}

std::optional<CollisionDetail> ProbeWorld::capsuleContact(
  const SegmentDescriptor& volume,
  const Probe& probe)
{
  Vector3D const axis = volume.end - volume.start;
  double const lengthSquared = axis.squaredNorm();

  double t = 0.0;
  if (lengthSquared > kDegenerateDistance)
  {
    t = std::clamp(
      (probe.center - volume.start).dot(axis) / lengthSquared, 0.0, 1.0);
  }
  Coordinate const closest = volume.start + t * axis;

  Vector3D const offset = probe.center - closest;
  double const distance = offset.norm();
  double const reach = volume.radius + probe.radius;
  if (distance >= reach)
  {
    return std::nullopt;
  }

  // Probe center on the axis: any direction perpendicular to it will do
  Vector3D const normal = distance > kDegenerateDistance
                            ? Vector3D{offset / distance}
                            : Vector3D{volume.axis().unitOrthogonal()};

  CollisionDetail detail;
  detail.point = closest + volume.radius * normal;
  detail.normal = normal;
  detail.depth = reach - distance;
  return detail;
}

std::optional<CollisionDetail> ProbeWorld::boxContact(
  const SegmentDescriptor& volume,
  const Probe& probe)
{
  Vector3D const halfSize = 0.5 * volume.boxSize();
  QuaternionD const toLocal = volume.orientation.inverse();
  Vector3D const local = toLocal.rotate(probe.center - volume.position);

  bool const inside = (local.cwiseAbs().array() <= halfSize.array()).all();
  Vector3D normalLocal;
  Vector3D pointLocal;
  double depth = 0.0;

  if (inside)
  {
    // Center inside the box: push out through the nearest face
    Vector3D const faceGap = halfSize - local.cwiseAbs();
    Eigen::Index axisIndex = 0;
    faceGap.minCoeff(&axisIndex);

    double const side = local[axisIndex] >= 0.0 ? 1.0 : -1.0;
    normalLocal = Vector3D{0.0, 0.0, 0.0};
    normalLocal[axisIndex] = side;
    pointLocal = local;
    pointLocal[axisIndex] = side * halfSize[axisIndex];
    depth = probe.radius + faceGap[axisIndex];
  }
  else
  {
    Vector3D const clampedLocal =
      local.cwiseMax(-halfSize).cwiseMin(halfSize);
    Vector3D const offset = local - clampedLocal;
    double const distance = offset.norm();
    if (distance >= probe.radius)
    {
      return std::nullopt;
    }
    normalLocal = offset / distance;
    pointLocal = clampedLocal;
    depth = probe.radius - distance;
  }

  CollisionDetail detail;
  detail.point = volume.position + volume.orientation.rotate(pointLocal);
  detail.normal = volume.orientation.rotate(normalLocal);
  detail.depth = depth;
  return detail;
}

}  // namespace scol_sim
