// Ticket: 0008_recording_pipeline

#ifndef SCOL_SIM_DATA_RECORDER_HPP
#define SCOL_SIM_DATA_RECORDER_HPP

#include <cstdint>
#include <memory>
#include <string>

#include <cpp_sqlite/src/cpp_sqlite/DBDataAccessObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "scol-sim/src/Physics/ContactNotification.hpp"

namespace scol_sim
{

class SplineCollider;

/**
 * @brief Records bakes, steps and unified contact events to SQLite
 *
 * Runs on the caller's thread. Records are buffered in cpp_sqlite DAOs and
 * written in one transaction per flush(): explicitly, every
 * Config::flushEverySteps steps, and on destruction.
 *
 * Contact events are attached to the most recent step, so recordStep() has
 * to be called before the first event of each step.
 */
class DataRecorder
{
public:
  /**
   * @brief Configuration for DataRecorder behavior
   */
  struct Config
  {
    std::string databasePath;      // Path to SQLite database file
    uint32_t flushEverySteps{100};  // 0 disables periodic flushing
  };

  /**
   * @brief Open the database and create all DAOs
   * @throws std::runtime_error if the database cannot be created at the path
   */
  explicit DataRecorder(const Config& config);

  /**
   * @brief Flushes all pending records
   */
  ~DataRecorder();

  DataRecorder(const DataRecorder&) = delete;
  DataRecorder& operator=(const DataRecorder&) = delete;
  DataRecorder(DataRecorder&&) = delete;
  DataRecorder& operator=(DataRecorder&&) = delete;

  /**
   * @brief Start a new step
   * @param stepIndex Host step counter
   * @param simulationTime Current simulation time [seconds]
   * @return Pre-assigned step ID for FK references
   */
  uint32_t recordStep(uint32_t stepIndex, double simulationTime);

  /**
   * @brief Record the collider's current baked set
   *
   * Writes one BakeRecord with the effective (clamped) settings and one
   * SegmentRecord per baked volume.
   *
   * @return Pre-assigned bake ID
   */
  uint32_t recordBake(const SplineCollider& collider);

  /**
   * @brief Record one unified contact event against the current step
   * @param detail Collision detail, or nullptr for trigger events
   * @throws std::logic_error if no step has been recorded yet
   */
  void recordContactEvent(ContactEventKind kind,
                          ContactChannel channel,
                          ObjectId other,
                          const CollisionDetail* detail = nullptr);

  /**
   * @brief Subscribe to all six unified events of a collider
   *
   * Every event is recorded through recordContactEvent(). The collider must
   * outlive the recorder, or detach() must be called first.
   */
  void attach(SplineCollider& collider);

  /**
   * @brief Remove the subscriptions made by attach()
   */
  void detach();

  template <typename T>
  cpp_sqlite::DataAccessObject<T>& getDAO();

  /**
   * @brief Write all buffered records in a single transaction
   */
  void flush();

  /**
   * @brief Access database for queries (const only)
   */
  const cpp_sqlite::Database& getDatabase() const;

  [[nodiscard]] uint32_t getCurrentStepId() const;

private:
  struct Subscriptions;

  std::unique_ptr<cpp_sqlite::Database> database_;
  uint32_t flushEverySteps_;
  uint32_t stepsSinceFlush_{0};
  uint32_t nextStepId_{1};
  uint32_t nextBakeId_{1};
  uint32_t currentStepId_{0};
  SplineCollider* attached_{nullptr};
  std::unique_ptr<Subscriptions> subscriptions_;
};

}  // namespace scol_sim

#endif  // SCOL_SIM_DATA_RECORDER_HPP
