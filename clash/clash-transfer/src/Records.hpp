#ifndef CLASH_TRANSFER_RECORDS_HPP
#define CLASH_TRANSFER_RECORDS_HPP

/**
 * @file Records.hpp
 * @brief Convenience header including all clash store transfer objects
 */

#include <cpp_sqlite/src/cpp_sqlite/DBDatabase.hpp>

#include "clash-transfer/src/DuplicateRecord.hpp"
#include "clash-transfer/src/OverlapRecord.hpp"
#include "clash-transfer/src/QueryRecord.hpp"
#include "clash-transfer/src/SampleTimeRecord.hpp"
#include "clash-transfer/src/WarningRecord.hpp"

namespace clash_transfer
{

using Database = cpp_sqlite::Database;

}  // namespace clash_transfer

#endif  // CLASH_TRANSFER_RECORDS_HPP
