// Ticket: 0015_clash_data_store

#ifndef CLASH_TRANSFER_WARNING_RECORD_HPP
#define CLASH_TRANSFER_WARNING_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>
#include <cstdint>
#include <string>

#include "clash-transfer/src/QueryRecord.hpp"

namespace clash_transfer
{

/**
 * @brief Resolution warning of a stored run
 *
 * sequence preserves the order in which the warnings were raised.
 */
struct WarningRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t sequence{0};
  std::string kind;  // WarningKind name
  std::string path;
  double time{0.0};
  std::string message;

  cpp_sqlite::ForeignKey<QueryRecord> query;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(WarningRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (sequence, kind, path, time, message, query));

}  // namespace clash_transfer

#endif  // CLASH_TRANSFER_WARNING_RECORD_HPP
