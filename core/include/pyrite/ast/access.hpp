// pyrite/ast/access.hpp - Qualified names
//
// An Access is an ordered sequence of identifiers ("a.b.c") and is the key
// for locals, globals, modules and classes. Locals of nested scopes are
// renamed by the front end to `$local_<qualifier>$<name>` where the
// qualifier's components are separated by '?'.
//
#pragma once

#include <cstddef>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace pyrite
{

/// Prefix marking an identifier as a synthetic scope-local name.
inline constexpr std::string_view k_local_marker = "$local_";

class Access
{
public:
  Access() = default;

  explicit Access(std::vector<std::string> identifiers) : identifiers_(std::move(identifiers)) {}

  /// Split a dotted name ("a.b.c") into an access. Empty input yields an empty access.
  [[nodiscard]] static Access create(std::string_view dotted);

  [[nodiscard]] const std::vector<std::string> & identifiers() const noexcept
  {
    return identifiers_;
  }
  [[nodiscard]] bool empty() const noexcept { return identifiers_.empty(); }
  [[nodiscard]] size_t size() const noexcept { return identifiers_.size(); }

  /// First `count` identifiers (the whole access if count exceeds size()).
  [[nodiscard]] Access prefix(size_t count) const;

  /// Everything after the first `count` identifiers.
  [[nodiscard]] Access drop_prefix(size_t count) const;

  [[nodiscard]] bool starts_with(const Access & other) const noexcept;

  [[nodiscard]] Access append(std::string_view identifier) const;

  /// Recover the name a global table uses for a renamed local.
  ///
  /// `$local_a?b$x.y` becomes `a.b.x.y`; `$local_$x` becomes `x`.
  /// Accesses without a local marker are returned unchanged.
  [[nodiscard]] Access delocalize() const;

  [[nodiscard]] bool is_local() const noexcept;

  /// Dotted rendering ("a.b.c").
  [[nodiscard]] std::string to_string() const;

  [[nodiscard]] bool operator==(const Access & other) const
  {
    return identifiers_ == other.identifiers_;
  }
  [[nodiscard]] bool operator!=(const Access & other) const { return !(*this == other); }
  [[nodiscard]] bool operator<(const Access & other) const
  {
    return identifiers_ < other.identifiers_;
  }

private:
  std::vector<std::string> identifiers_;
};

/// Split a single `$local_q1?q2$name` identifier into its delocalized parts.
[[nodiscard]] std::vector<std::string> delocalize_identifier(std::string_view identifier);

}  // namespace pyrite
