// Ticket: 0015_clash_data_store

#ifndef CLASH_TRANSFER_OVERLAP_RECORD_HPP
#define CLASH_TRANSFER_OVERLAP_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>
#include <cstdint>
#include <limits>
#include <string>

#include "clash-transfer/src/QueryRecord.hpp"

namespace clash_transfer
{

/**
 * @brief One clash or clearance interval of a stored run
 *
 * The contact points are flattened into scalar columns; has_contact is 0
 * when the record carries no contact location, in which case the point
 * columns hold NaN.
 *
 * @ticket 0015_clash_data_store
 */
struct OverlapRecord : public cpp_sqlite::BaseTransferObject
{
  std::string object_a;
  std::string object_b;
  std::string classification;  // "Clash" or "Clearance"
  double distance{0.0};        // Negative for penetration
  double start_time{0.0};
  double end_time{0.0};
  uint32_t start_sample{0};
  uint32_t end_sample{0};
  uint32_t overlapping_triangles{0};

  uint32_t has_contact{0};
  double point_a_x{std::numeric_limits<double>::quiet_NaN()};
  double point_a_y{std::numeric_limits<double>::quiet_NaN()};
  double point_a_z{std::numeric_limits<double>::quiet_NaN()};
  double point_b_x{std::numeric_limits<double>::quiet_NaN()};
  double point_b_y{std::numeric_limits<double>::quiet_NaN()};
  double point_b_z{std::numeric_limits<double>::quiet_NaN()};

  cpp_sqlite::ForeignKey<QueryRecord> query;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(OverlapRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (object_a,
                       object_b,
                       classification,
                       distance,
                       start_time,
                       end_time,
                       start_sample,
                       end_sample,
                       overlapping_triangles,
                       has_contact,
                       point_a_x,
                       point_a_y,
                       point_a_z,
                       point_b_x,
                       point_b_y,
                       point_b_z,
                       query));

}  // namespace clash_transfer

#endif  // CLASH_TRANSFER_OVERLAP_RECORD_HPP
