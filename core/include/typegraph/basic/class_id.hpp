// typegraph/basic/class_id.hpp - Stable identity handle for declaring classes
//
// This header provides the ClassId handle used to key raw declarations and
// resolved metadata.
//
#pragma once

#include <cstdint>
#include <functional>

namespace typegraph
{

// ============================================================================
// ClassId - Opaque class identity
// ============================================================================

/**
 * An opaque, stable handle identifying a declaring class.
 *
 * Ids are assigned by the raw metadata store when a class is declared and
 * stay valid for the lifetime of that store. Equality is identity equality:
 * two classes with the same shape still have distinct ids.
 */
class ClassId
{
public:
  /// Invalid/unknown class sentinel
  static constexpr uint32_t k_invalid_value = UINT32_MAX;

  /// Create an invalid id
  constexpr ClassId() noexcept : value_(k_invalid_value) {}

  /// Create an id from its raw value
  constexpr explicit ClassId(uint32_t value) noexcept : value_(value) {}

  [[nodiscard]] static constexpr ClassId invalid() noexcept { return ClassId{}; }

  /// Check if this is a valid id
  [[nodiscard]] constexpr bool is_valid() const noexcept { return value_ != k_invalid_value; }

  /// Get the raw value (dense, starting at 0)
  [[nodiscard]] constexpr uint32_t value() const noexcept { return value_; }

  [[nodiscard]] constexpr bool operator==(ClassId other) const noexcept
  {
    return value_ == other.value_;
  }
  [[nodiscard]] constexpr bool operator!=(ClassId other) const noexcept
  {
    return value_ != other.value_;
  }
  [[nodiscard]] constexpr bool operator<(ClassId other) const noexcept
  {
    return value_ < other.value_;
  }

private:
  uint32_t value_;
};

}  // namespace typegraph

namespace std
{

template <>
struct hash<typegraph::ClassId>
{
  size_t operator()(typegraph::ClassId id) const noexcept { return hash<uint32_t>{}(id.value()); }
};

}  // namespace std
