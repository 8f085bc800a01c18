// pyrite/sema/resolution/annotation.cpp - Type plus binding mutability
//
#include "pyrite/sema/resolution/annotation.hpp"

#include "pyrite/sema/types/type_utils.hpp"

namespace pyrite
{

std::string to_string(const Annotation & annotation)
{
  std::string out = to_string(annotation.type);
  if (annotation.is_final) {
    out += " (final)";
  } else if (annotation.is_immutable()) {
    out += " (immutable)";
  }
  return out;
}

}  // namespace pyrite
