// typegraph/basic/decl_location.hpp - Location of a declaration inside the schema
//
// Declarations are not tied to source text; they are located by the class
// that declares them, an optional member and an optional parameter slot.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "typegraph/basic/class_id.hpp"

namespace typegraph
{

/**
 * Pinpoints a declaration: a class, a member of that class, or a parameter
 * of a member.
 *
 * Examples of the printed form:
 *   User
 *   UserResolver.getUser
 *   UserResolver.getUser#1
 */
struct DeclLocation
{
  ClassId class_id;
  std::string class_name;

  /// Field or method name (empty for class-level declarations)
  std::string member;

  /// Parameter index (only for method parameters)
  std::optional<uint32_t> parameter_index;

  [[nodiscard]] static DeclLocation of_class(ClassId id, std::string name)
  {
    DeclLocation loc;
    loc.class_id = id;
    loc.class_name = std::move(name);
    return loc;
  }

  [[nodiscard]] static DeclLocation of_member(ClassId id, std::string name, std::string member)
  {
    DeclLocation loc = of_class(id, std::move(name));
    loc.member = std::move(member);
    return loc;
  }

  [[nodiscard]] static DeclLocation of_parameter(
    ClassId id, std::string name, std::string member, uint32_t index)
  {
    DeclLocation loc = of_member(id, std::move(name), std::move(member));
    loc.parameter_index = index;
    return loc;
  }

  [[nodiscard]] bool is_valid() const noexcept { return class_id.is_valid(); }

  [[nodiscard]] std::string to_string() const
  {
    std::string out = class_name;
    if (out.empty()) {
      out = class_id.is_valid() ? "<class #" + std::to_string(class_id.value()) + ">"
                                : std::string("<unknown>");
    }
    if (!member.empty()) {
      out += '.';
      out += member;
    }
    if (parameter_index) {
      out += '#';
      out += std::to_string(*parameter_index);
    }
    return out;
  }
};

}  // namespace typegraph
