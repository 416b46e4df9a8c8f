// Ticket: 0003_clash_record_model

#ifndef CLASH_CORE_DETECTION_CLASH_TYPES_HPP
#define CLASH_CORE_DETECTION_CLASH_TYPES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <tuple>
#include <utility>

#include "clash-core/src/DataTypes/Coordinate.hpp"

namespace clash_core
{

/**
 * @brief Unordered pair of proxy identity keys
 *
 * Stored normalised so that first <= second; (A, B) and (B, A) compare and
 * hash equal.
 */
class ClashPair
{
public:
  ClashPair() = default;

  ClashPair(std::string a, std::string b)
  {
    if (b < a)
    {
      std::swap(a, b);
    }
    first_ = std::move(a);
    second_ = std::move(b);
  }

  const std::string& first() const
  {
    return first_;
  }

  const std::string& second() const
  {
    return second_;
  }

  bool contains(std::string_view key) const
  {
    return first_ == key || second_ == key;
  }

  bool operator==(const ClashPair& other) const = default;

  bool operator<(const ClashPair& other) const
  {
    return std::tie(first_, second_) < std::tie(other.first_, other.second_);
  }

private:
  std::string first_;
  std::string second_;
};

enum class Classification : uint8_t
{
  None = 0,
  Clash = 1,
  Clearance = 2
};

std::string_view toString(Classification classification);

/**
 * @throws std::invalid_argument for an unknown name
 */
Classification classificationFromString(std::string_view name);

/**
 * @brief Closest points on the two surfaces (world space)
 *
 * For penetrating pairs the points are the deepest penetration witnesses.
 */
struct ContactLocation
{
  Coordinate pointA;  // On pair.first()'s geometry
  Coordinate pointB;  // On pair.second()'s geometry

  bool operator==(const ContactLocation& other) const
  {
    return pointA == other.pointA && pointB == other.pointB;
  }
};

/**
 * @brief One classified proximity finding for a pair
 *
 * A point record (one sample) has startSample == endSample. After merging,
 * [startTime, endTime] spans every consecutive sample of the interval and
 * distance is the minimum seen over it, with the contact taken from that
 * sample.
 *
 * Invariants:
 * - Clash implies distance <= clashTolerance (within epsilon)
 * - Clearance implies clashTolerance < distance <= clearanceTolerance
 *
 * @ticket 0003_clash_record_model
 */
struct ClashRecord
{
  ClashPair pair;
  Classification classification{Classification::None};
  double distance{0.0};  // Signed separation, negative for penetration
  double startTime{0.0};
  double endTime{0.0};
  uint32_t startSample{0};
  uint32_t endSample{0};
  uint32_t overlappingTriangles{0};  // Triangle pairs within clash tolerance
  std::optional<ContactLocation> contact;

  uint32_t sampleCount() const
  {
    return endSample - startSample + 1;
  }

  bool operator==(const ClashRecord& other) const = default;
};

/**
 * @brief Advisory record for two proxies that are the same physical instance
 *
 * Emitted instead of a ClashRecord when both proxies share a content hash
 * and an identical world transform.
 */
struct DuplicateGeometry
{
  ClashPair pair;
  uint64_t contentHash{0};
  double firstTime{0.0};
  double lastTime{0.0};

  bool operator==(const DuplicateGeometry& other) const = default;
};

enum class WarningKind : uint8_t
{
  MissingObject = 0,
  MissingMember = 1,
  DegenerateGeometry = 2,
  UnsupportedTransform = 3
};

std::string_view toString(WarningKind kind);

/**
 * @throws std::invalid_argument for an unknown name
 */
WarningKind warningKindFromString(std::string_view name);

/**
 * @brief Non-fatal problem found while resolving geometry
 */
struct ResolutionWarning
{
  WarningKind kind{WarningKind::MissingObject};
  std::string path;
  double time{0.0};
  std::string message;

  bool operator==(const ResolutionWarning& other) const = default;
};

}  // namespace clash_core

#endif  // CLASH_CORE_DETECTION_CLASH_TYPES_HPP
