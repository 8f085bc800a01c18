// pyrite/sema/analysis/invariance.cpp - Invariance mismatch detection
//
#include "pyrite/sema/analysis/invariance.hpp"

namespace pyrite
{

bool is_invariance_mismatch(const Resolution & resolution, const Type * left, const Type * right)
{
  if (!left->is_parametric() || !right->is_parametric() || left->name != right->name) {
    return false;
  }

  const auto variables = resolution.order().variables(left->name);
  if (!variables) return false;

  const auto & left_params = left->parameters;
  const auto & right_params = right->parameters;
  if (variables->size() != left_params.size() || variables->size() != right_params.size()) {
    return false;
  }

  for (size_t i = 0; i < variables->size(); ++i) {
    const Type * variable = (*variables)[i];
    if (
      variable->is_variable() && variable->variance == Variance::Invariant &&
      resolution.less_or_equal(left_params[i], right_params[i])) {
      return true;
    }
  }
  return false;
}

}  // namespace pyrite
