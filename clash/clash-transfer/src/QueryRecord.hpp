// Ticket: 0015_clash_data_store

#ifndef CLASH_TRANSFER_QUERY_RECORD_HPP
#define CLASH_TRANSFER_QUERY_RECORD_HPP

#include <boost/describe.hpp>
#include <cpp_sqlite/src/cpp_sqlite/DBBaseTransferObject.hpp>
#include <cstdint>
#include <string>

namespace clash_transfer
{

/**
 * @brief Database record for one stored detection run
 *
 * Every overlap, duplicate, warning and sample-time record of the run refers
 * back to this record via ForeignKey<QueryRecord>. The complete
 * DetectionConfig (including both group lists) is kept as JSON in
 * config_json; the scalar columns duplicate the fields most often queried.
 *
 * @ticket 0015_clash_data_store
 */
struct QueryRecord : public cpp_sqlite::BaseTransferObject
{
  std::string name;     // DetectionConfig::queryName
  std::string comment;
  std::string mode;     // "Static" or "Dynamic"
  double clash_tolerance{0.0};
  double clearance_tolerance{0.0};
  double resolved_at_ms{0.0};  // Milliseconds since epoch
  uint32_t schema_version{0};
  uint32_t overlap_count{0};
  std::string config_json;
};

// Register with Boost.Describe for cpp_sqlite ORM
BOOST_DESCRIBE_STRUCT(QueryRecord,
                      (cpp_sqlite::BaseTransferObject),
                      (name,
                       comment,
                       mode,
                       clash_tolerance,
                       clearance_tolerance,
                       resolved_at_ms,
                       schema_version,
                       overlap_count,
                       config_json));

}  // namespace clash_transfer

#endif  // CLASH_TRANSFER_QUERY_RECORD_HPP
