#ifndef CLASH_CORE_DETECTION_ERRORS_HPP
#define CLASH_CORE_DETECTION_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace clash_core
{

/**
 * @brief Strict resolution produced zero proxies from a non-empty reference
 * set. Fatal: the run stops before indexing.
 */
class UnresolvedReferenceError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief Dynamic time range is empty or the step is not positive. Fatal: the
 * run stops before sampling.
 */
class InvalidRangeError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

/**
 * @brief A report could not be written or read (unwritable destination,
 * malformed or incompatible document)
 */
class ReportIOError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

}  // namespace clash_core

#endif  // CLASH_CORE_DETECTION_ERRORS_HPP
