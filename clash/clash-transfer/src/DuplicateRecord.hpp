// Ticket: 0015_clash_data_store

#ifndef CLASH_TRANSFER_DUPLICATE_RECORD_HPP
#define CLASH_TRANSFER_DUPLICATE_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>
#include <string>

#include "clash-transfer/src/QueryRecord.hpp"

namespace clash_transfer
{

/**
 * @brief Duplicate-geometry advisory of a stored run
 *
 * content_hash is stored as a decimal string since SQLite integers are
 * signed 64-bit.
 */
struct DuplicateRecord : public cpp_sqlite::BaseTransferObject
{
  std::string object_a;
  std::string object_b;
  std::string content_hash;
  double first_time{0.0};
  double last_time{0.0};

  cpp_sqlite::ForeignKey<QueryRecord> query;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(DuplicateRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (object_a, object_b, content_hash, first_time, last_time, query));

}  // namespace clash_transfer

#endif  // CLASH_TRANSFER_DUPLICATE_RECORD_HPP
