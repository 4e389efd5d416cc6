#ifndef SCOL_TRANSFER_QUATERNIOND_RECORD_HPP
#define SCOL_TRANSFER_QUATERNIOND_RECORD_HPP

#include <limits>

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>

namespace scol_transfer
{

/**
 * @brief Database record for a segment orientation
 *
 * Component order follows scol_sim::QuaternionD (w first).
 */
struct QuaternionDRecord : public cpp_sqlite::BaseTransferObject
{
  double w{std::numeric_limits<double>::quiet_NaN()};
  double x{std::numeric_limits<double>::quiet_NaN()};
  double y{std::numeric_limits<double>::quiet_NaN()};
  double z{std::numeric_limits<double>::quiet_NaN()};
};

BOOST_DESCRIBE_STRUCT(QuaternionDRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (w, x, y, z));

}  // namespace scol_transfer

#endif  // SCOL_TRANSFER_QUATERNIOND_RECORD_HPP
