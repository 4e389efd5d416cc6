// Ticket: 0008_recording_pipeline

#include "scol-sim/src/DataRecorder/DataRecorder.hpp"

#include <chrono>
#include <filesystem>
#include <stdexcept>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>
#include <spdlog/spdlog.h>

#include "scol-sim/src/DataRecorder/RecordConversions.hpp"
#include "scol-sim/src/SplineCollider/SplineCollider.hpp"
#include "scol-transfer/src/BakeRecord.hpp"
#include "scol-transfer/src/ContactEventRecord.hpp"
#include "scol-transfer/src/CoordinateRecord.hpp"
#include "scol-transfer/src/QuaternionDRecord.hpp"
#include "scol-transfer/src/SegmentRecord.hpp"
#include "scol-transfer/src/StepRecord.hpp"
#include "scol-transfer/src/Vector3DRecord.hpp"

namespace scol_sim
{

struct DataRecorder::Subscriptions
{
  ContactAggregator::TriggerEvent::SubscriptionId triggerEnter{0};
  ContactAggregator::TriggerEvent::SubscriptionId triggerStay{0};
  ContactAggregator::TriggerEvent::SubscriptionId triggerExit{0};
  ContactAggregator::CollisionEvent::SubscriptionId collisionEnter{0};
  ContactAggregator::CollisionEvent::SubscriptionId collisionStay{0};
  ContactAggregator::CollisionEvent::SubscriptionId collisionExit{0};
};

DataRecorder::DataRecorder(const Config& config)
  : flushEverySteps_{config.flushEverySteps}
{
  std::filesystem::path const path{config.databasePath};
  if (path.empty() || (path.has_parent_path() &&
                       !std::filesystem::is_directory(path.parent_path())))
  {
    throw std::runtime_error("DataRecorder: cannot create database at '" +
                             config.databasePath + "'");
  }

  database_ = std::make_unique<cpp_sqlite::Database>(config.databasePath, true);

  // Pre-create every DAO so the flush order is fixed: parents before the
  // records that reference them, nested sub-records before their owners
  database_->getDAO<scol_transfer::StepRecord>();
  database_->getDAO<scol_transfer::BakeRecord>();

  database_->getDAO<scol_transfer::CoordinateRecord>();
  database_->getDAO<scol_transfer::Vector3DRecord>();
  database_->getDAO<scol_transfer::QuaternionDRecord>();

  database_->getDAO<scol_transfer::SegmentRecord>();
  database_->getDAO<scol_transfer::ContactEventRecord>();

  spdlog::debug("DataRecorder: recording to {}", config.databasePath);
}

DataRecorder::~DataRecorder()
{
  detach();
  flush();
}

uint32_t DataRecorder::recordStep(uint32_t stepIndex, double simulationTime)
{
  if (flushEverySteps_ > 0 && stepsSinceFlush_ >= flushEverySteps_)
  {
    flush();
  }

  uint32_t const stepId = nextStepId_++;

  scol_transfer::StepRecord record{};
  record.id = stepId;
  record.step_index = stepIndex;
  record.simulation_time = simulationTime;

  auto now = std::chrono::system_clock::now();
  record.wall_clock_time =
    std::chrono::duration_cast<std::chrono::duration<double>>(
      now.time_since_epoch())
      .count();

  database_->getDAO<scol_transfer::StepRecord>().addToBuffer(record);

  currentStepId_ = stepId;
  ++stepsSinceFlush_;
  return stepId;
}

uint32_t DataRecorder::recordBake(const SplineCollider& collider)
{
  uint32_t const bakeId = nextBakeId_++;
  const SegmentBaker& baker = collider.getBaker();

  auto bakeRecord = toBakeRecord(baker);
  bakeRecord.id = bakeId;
  database_->getDAO<scol_transfer::BakeRecord>().addToBuffer(bakeRecord);

  auto& segmentDAO = database_->getDAO<scol_transfer::SegmentRecord>();
  uint32_t index = 0;
  for (const auto& segment : baker.getSegments())
  {
    auto record = toSegmentRecord(segment, index++);
    record.bake.id = bakeId;
    segmentDAO.addToBuffer(record);
  }

  return bakeId;
}

void DataRecorder::recordContactEvent(ContactEventKind kind,
                                      ContactChannel channel,
                                      ObjectId other,
                                      const CollisionDetail* detail)
{
  if (currentStepId_ == 0)
  {
    throw std::logic_error(
      "DataRecorder: recordStep() must be called before recording contact "
      "events");
  }

  auto record = toContactEventRecord(kind, channel, other, detail);
  record.step.id = currentStepId_;
  database_->getDAO<scol_transfer::ContactEventRecord>().addToBuffer(record);
}

void DataRecorder::attach(SplineCollider& collider)
{
  detach();

  auto subscriptions = std::make_unique<Subscriptions>();

  subscriptions->triggerEnter = collider.onTriggerEnter().subscribe(
    [this](ObjectId other)
    {
      recordContactEvent(
        ContactEventKind::Enter, ContactChannel::Trigger, other);
    });
  subscriptions->triggerStay = collider.onTriggerStay().subscribe(
    [this](ObjectId other)
    {
      recordContactEvent(
        ContactEventKind::Stay, ContactChannel::Trigger, other);
    });
  subscriptions->triggerExit = collider.onTriggerExit().subscribe(
    [this](ObjectId other)
    {
      recordContactEvent(
        ContactEventKind::Exit, ContactChannel::Trigger, other);
    });

  subscriptions->collisionEnter = collider.onCollisionEnter().subscribe(
    [this](const CollisionDetail& detail)
    {
      recordContactEvent(ContactEventKind::Enter,
                         ContactChannel::Collision,
                         detail.other,
                         &detail);
    });
  subscriptions->collisionStay = collider.onCollisionStay().subscribe(
    [this](const CollisionDetail& detail)
    {
      recordContactEvent(ContactEventKind::Stay,
                         ContactChannel::Collision,
                         detail.other,
                         &detail);
    });
  subscriptions->collisionExit = collider.onCollisionExit().subscribe(
    [this](const CollisionDetail& detail)
    {
      recordContactEvent(ContactEventKind::Exit,
                         ContactChannel::Collision,
                         detail.other,
                         &detail);
    });

  attached_ = &collider;
  subscriptions_ = std::move(subscriptions);
}

void DataRecorder::detach()
{
  if (attached_ == nullptr || !subscriptions_)
  {
    return;
  }

  attached_->onTriggerEnter().unsubscribe(subscriptions_->triggerEnter);
  attached_->onTriggerStay().unsubscribe(subscriptions_->triggerStay);
  attached_->onTriggerExit().unsubscribe(subscriptions_->triggerExit);
  attached_->onCollisionEnter().unsubscribe(subscriptions_->collisionEnter);
  attached_->onCollisionStay().unsubscribe(subscriptions_->collisionStay);
  attached_->onCollisionExit().unsubscribe(subscriptions_->collisionExit);

  attached_ = nullptr;
  subscriptions_.reset();
}

void DataRecorder::flush()
{
  database_->withTransaction([this]() { database_->flushAllDAOs(); });
  stepsSinceFlush_ = 0;
}

const cpp_sqlite::Database& DataRecorder::getDatabase() const
{
  return *database_;
}

uint32_t DataRecorder::getCurrentStepId() const
{
  return currentStepId_;
}

// Template definition
template <typename T>
cpp_sqlite::DataAccessObject<T>& DataRecorder::getDAO()
{
  return database_->getDAO<T>();
}

// Explicit template instantiations for the recorded types
template cpp_sqlite::DataAccessObject<scol_transfer::StepRecord>&
DataRecorder::getDAO<scol_transfer::StepRecord>();

template cpp_sqlite::DataAccessObject<scol_transfer::BakeRecord>&
DataRecorder::getDAO<scol_transfer::BakeRecord>();

template cpp_sqlite::DataAccessObject<scol_transfer::SegmentRecord>&
DataRecorder::getDAO<scol_transfer::SegmentRecord>();

template cpp_sqlite::DataAccessObject<scol_transfer::ContactEventRecord>&
DataRecorder::getDAO<scol_transfer::ContactEventRecord>();

}  // namespace scol_sim
