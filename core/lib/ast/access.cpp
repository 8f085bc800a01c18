// pyrite/ast/access.cpp - Qualified name implementation
//
#include "pyrite/ast/access.hpp"

#include <algorithm>
#include <cstddef>
#include <iterator>

namespace pyrite
{

Access Access::create(std::string_view dotted)
{
  std::vector<std::string> parts;
  size_t start = 0;
  while (start <= dotted.size() && !dotted.empty()) {
    const size_t dot = dotted.find('.', start);
    if (dot == std::string_view::npos) {
      parts.emplace_back(dotted.substr(start));
      break;
    }
    parts.emplace_back(dotted.substr(start, dot - start));
    start = dot + 1;
  }
  return Access(std::move(parts));
}

Access Access::prefix(size_t count) const
{
  count = std::min(count, identifiers_.size());
  return Access({identifiers_.begin(), identifiers_.begin() + static_cast<std::ptrdiff_t>(count)});
}

Access Access::drop_prefix(size_t count) const
{
  count = std::min(count, identifiers_.size());
  return Access({identifiers_.begin() + static_cast<std::ptrdiff_t>(count), identifiers_.end()});
}

bool Access::starts_with(const Access & other) const noexcept
{
  if (other.size() > size()) return false;
  return std::equal(other.identifiers_.begin(), other.identifiers_.end(), identifiers_.begin());
}

Access Access::append(std::string_view identifier) const
{
  auto parts = identifiers_;
  parts.emplace_back(identifier);
  return Access(std::move(parts));
}

bool Access::is_local() const noexcept
{
  return std::any_of(identifiers_.begin(), identifiers_.end(), [](const std::string & id) {
    return std::string_view(id).substr(0, k_local_marker.size()) == k_local_marker;
  });
}

Access Access::delocalize() const
{
  std::vector<std::string> parts;
  parts.reserve(identifiers_.size());
  for (const auto & id : identifiers_) {
    auto pieces = delocalize_identifier(id);
    parts.insert(
      parts.end(), std::make_move_iterator(pieces.begin()), std::make_move_iterator(pieces.end()));
  }
  return Access(std::move(parts));
}

std::string Access::to_string() const
{
  std::string result;
  for (size_t i = 0; i < identifiers_.size(); ++i) {
    if (i > 0) result += '.';
    result += identifiers_[i];
  }
  return result;
}

std::vector<std::string> delocalize_identifier(std::string_view identifier)
{
  if (identifier.substr(0, k_local_marker.size()) != k_local_marker) {
    return {std::string(identifier)};
  }

  const std::string_view rest = identifier.substr(k_local_marker.size());
  const size_t separator = rest.find('$');
  if (separator == std::string_view::npos || separator + 1 >= rest.size()) {
    // Malformed marker: keep the identifier as written.
    return {std::string(identifier)};
  }

  std::vector<std::string> parts;
  const std::string_view qualifier = rest.substr(0, separator);
  size_t start = 0;
  while (start < qualifier.size()) {
    const size_t mark = qualifier.find('?', start);
    const size_t end = mark == std::string_view::npos ? qualifier.size() : mark;
    if (end > start) parts.emplace_back(qualifier.substr(start, end - start));
    start = end + 1;
  }
  parts.emplace_back(rest.substr(separator + 1));
  return parts;
}

}  // namespace pyrite
