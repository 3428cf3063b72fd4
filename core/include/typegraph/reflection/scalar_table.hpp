// typegraph/reflection/scalar_table.hpp - Scalar type names
//
// Manages the scalar namespace (built-in scalars, their aliases and custom
// scalars from the build configuration).
//
#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <unordered_set>

namespace typegraph
{

/**
 * Scalar namespace.
 *
 * Manages:
 * - Built-in scalars (Int, Float, String, Boolean, ID)
 * - Built-in aliases (int→Int, double→Float, bool→Boolean, ...)
 * - Custom scalars (e.g. DateTime) registered from configuration
 */
class ScalarTable
{
public:
  ScalarTable() = default;

  // ===========================================================================
  // Built-in Registration
  // ===========================================================================

  /**
   * Register all built-in scalars and aliases.
   *
   * This should be called before resolving any declaration.
   */
  void register_builtins()
  {
    register_builtin("Int");
    register_builtin("Float");
    register_builtin("String");
    register_builtin("Boolean");
    register_builtin("ID");

    // Host-language spellings resolve to the canonical scalars
    register_alias("int", "Int");
    register_alias("float", "Float");
    register_alias("double", "Float");
    register_alias("string", "String");
    register_alias("bool", "Boolean");
  }

  // ===========================================================================
  // Definition
  // ===========================================================================

  /**
   * Define a custom scalar.
   *
   * @return true if defined successfully, false if the name already exists
   */
  bool define(std::string_view name)
  {
    if (aliases_.count(std::string(name)) > 0) {
      return false;
    }
    return scalars_.emplace(name).second;
  }

  // ===========================================================================
  // Lookup
  // ===========================================================================

  /**
   * Look up a scalar by name, resolving aliases to the canonical name.
   *
   * @return The canonical scalar name, or nullopt if `name` is not a scalar
   */
  [[nodiscard]] std::optional<std::string_view> lookup(std::string_view name) const
  {
    std::string key(name);
    auto alias_it = aliases_.find(key);
    if (alias_it != aliases_.end()) {
      key = alias_it->second;
    }

    auto it = scalars_.find(key);
    if (it == scalars_.end()) {
      return std::nullopt;
    }
    return std::string_view(*it);
  }

  [[nodiscard]] bool contains(std::string_view name) const { return lookup(name).has_value(); }

  /// Check if `name` is one of the built-in scalars (aliases included)
  [[nodiscard]] bool is_builtin(std::string_view name) const
  {
    const auto canonical = lookup(name);
    return canonical && builtins_.count(std::string(*canonical)) > 0;
  }

  /// Number of scalars (excluding aliases)
  [[nodiscard]] size_t size() const noexcept { return scalars_.size(); }

private:
  void register_builtin(std::string_view name)
  {
    scalars_.emplace(name);
    builtins_.emplace(name);
  }

  void register_alias(std::string_view alias_name, std::string_view canonical_name)
  {
    aliases_.emplace(alias_name, canonical_name);
  }

  std::unordered_set<std::string> scalars_;
  std::unordered_set<std::string> builtins_;
  std::unordered_map<std::string, std::string> aliases_;
};

}  // namespace typegraph
