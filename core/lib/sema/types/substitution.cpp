// pyrite/sema/types/substitution.cpp - Variable bindings produced by solving
//
#include "pyrite/sema/types/substitution.hpp"

#include "pyrite/sema/types/type_utils.hpp"

namespace pyrite
{

const Type * Substitution::find(const Type * variable) const
{
  auto it = bindings_.find(variable);
  return it != bindings_.end() ? it->second : nullptr;
}

Substitution Substitution::with_binding(const Type * variable, const Type * value) const
{
  Map copy = bindings_;
  copy[variable] = value;
  return Substitution(std::move(copy));
}

const Type * Substitution::apply(TypeContext & types, const Type * type) const
{
  if (bindings_.empty()) return type;
  return instantiate(types, type, [this](const Type * t) -> const Type * {
    return t->is_variable() ? find(t) : nullptr;
  });
}

std::string Substitution::to_string() const
{
  std::string out = "{";
  bool first = true;
  for (const auto & [variable, value] : bindings_) {
    if (!first) out += ", ";
    first = false;
    out += variable->name + " -> " + pyrite::to_string(value);
  }
  out += "}";
  return out;
}

}  // namespace pyrite
