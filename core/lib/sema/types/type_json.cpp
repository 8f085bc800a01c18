// pyrite/sema/types/type_json.cpp - JSON dumps of types and substitutions
//
#include "pyrite/sema/types/type_json.hpp"

#include "pyrite/sema/types/type_utils.hpp"

namespace pyrite
{
namespace
{

using nlohmann::json;

const char * kind_name(TypeKind kind)
{
  switch (kind) {
    case TypeKind::Top:
      return "Top";
    case TypeKind::Bottom:
      return "Bottom";
    case TypeKind::Object:
      return "Object";
    case TypeKind::Deleted:
      return "Deleted";
    case TypeKind::Primitive:
      return "Primitive";
    case TypeKind::Parametric:
      return "Parametric";
    case TypeKind::Union:
      return "Union";
    case TypeKind::Optional:
      return "Optional";
    case TypeKind::Tuple:
      return "Tuple";
    case TypeKind::Callable:
      return "Callable";
    case TypeKind::Variable:
      return "Variable";
    case TypeKind::Meta:
      return "Meta";
  }
  return "Unknown";
}

json j_list(const std::vector<const Type *> & types)
{
  json out = json::array();
  for (const Type * t : types) out.push_back(to_json(t));
  return out;
}

json j_signature(const CallableSignature & signature)
{
  json out{{"annotation", signature.annotation ? to_json(signature.annotation) : json(nullptr)}};
  if (!signature.parameters) {
    out["parameters"] = nullptr;
    return out;
  }
  json params = json::array();
  for (const auto & param : *signature.parameters) {
    params.push_back(json{
      {"name", param.name},
      {"annotation", param.annotation ? to_json(param.annotation) : json(nullptr)},
      {"has_default", param.has_default}});
  }
  out["parameters"] = std::move(params);
  return out;
}

}  // namespace

json to_json(const Type * type)
{
  if (!type) return nullptr;

  json out{{"kind", kind_name(type->kind)}};
  switch (type->kind) {
    case TypeKind::Top:
    case TypeKind::Bottom:
    case TypeKind::Object:
    case TypeKind::Deleted:
      break;
    case TypeKind::Primitive:
      out["name"] = type->name;
      break;
    case TypeKind::Parametric:
      out["name"] = type->name;
      out["parameters"] = j_list(type->parameters);
      break;
    case TypeKind::Union:
      out["members"] = j_list(type->parameters);
      break;
    case TypeKind::Optional:
    case TypeKind::Meta:
      out["element"] = to_json(type->element);
      break;
    case TypeKind::Tuple:
      out["unbounded"] = type->unbounded;
      if (type->unbounded) {
        out["element"] = to_json(type->element);
      } else {
        out["elements"] = j_list(type->parameters);
      }
      break;
    case TypeKind::Callable: {
      if (!type->name.empty()) out["name"] = type->name;
      out["implementation"] = j_signature(type->implementation);
      json overloads = json::array();
      for (const auto & overload : type->overloads) overloads.push_back(j_signature(overload));
      out["overloads"] = std::move(overloads);
      break;
    }
    case TypeKind::Variable:
      out["name"] = type->name;
      out["variance"] = to_string(type->variance);
      if (type->constraint == VariableConstraint::Bound) {
        out["bound"] = to_json(type->element);
      } else if (type->constraint == VariableConstraint::Explicit) {
        out["constraints"] = j_list(type->parameters);
      }
      break;
  }
  return out;
}

json to_json(const Substitution & substitution)
{
  json out = json::object();
  for (const auto & [variable, value] : substitution) {
    out[variable->name] = to_json(value);
  }
  return out;
}

}  // namespace pyrite
