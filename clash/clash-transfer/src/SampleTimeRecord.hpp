// Ticket: 0015_clash_data_store

#ifndef CLASH_TRANSFER_SAMPLE_TIME_RECORD_HPP
#define CLASH_TRANSFER_SAMPLE_TIME_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBForeignKey.hpp>
#include <cstdint>

#include "clash-transfer/src/QueryRecord.hpp"

namespace clash_transfer
{

struct SampleTimeRecord : public cpp_sqlite::BaseTransferObject
{
  uint32_t sample_index{0};
  double sample_time{0.0};  // [s]

  cpp_sqlite::ForeignKey<QueryRecord> query;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(SampleTimeRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (sample_index, sample_time, query));

}  // namespace clash_transfer

#endif  // CLASH_TRANSFER_SAMPLE_TIME_RECORD_HPP
