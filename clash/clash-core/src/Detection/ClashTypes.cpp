#include "clash-core/src/Detection/ClashTypes.hpp"

#include <stdexcept>
#include <string>

namespace clash_core
{

std::string_view toString(Classification classification)
{
  switch (classification)
  {
    case Classification::Clash:
      return "Clash";
    case Classification::Clearance:
      return "Clearance";
    case Classification::None:
      return "None";
  }
  return "None";
}

Classification classificationFromString(std::string_view name)
{
  if (name == "Clash")
  {
    return Classification::Clash;
  }
  if (name == "Clearance")
  {
    return Classification::Clearance;
  }
  if (name == "None")
  {
    return Classification::None;
  }
  throw std::invalid_argument("Unknown classification: " + std::string{name});
}

std::string_view toString(WarningKind kind)
{
  switch (kind)
  {
    case WarningKind::MissingObject:
      return "MissingObject";
    case WarningKind::MissingMember:
      return "MissingMember";
    case WarningKind::DegenerateGeometry:
      return "DegenerateGeometry";
    case WarningKind::UnsupportedTransform:
      return "UnsupportedTransform";
  }
  return "MissingObject";
}

WarningKind warningKindFromString(std::string_view name)
{
  if (name == "MissingObject")
  {
    return WarningKind::MissingObject;
  }
  if (name == "MissingMember")
  {
    return WarningKind::MissingMember;
  }
  if (name == "DegenerateGeometry")
  {
    return WarningKind::DegenerateGeometry;
  }
  if (name == "UnsupportedTransform")
  {
    return WarningKind::UnsupportedTransform;
  }
  throw std::invalid_argument("Unknown warning kind: " + std::string{name});
}

}  // namespace clash_core
