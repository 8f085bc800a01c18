// pyrite/project/project_config.cpp - Project configuration implementation
//
#include "pyrite/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <cctype>

namespace pyrite
{

namespace
{

// ============================================================================
// Type Strings
// ============================================================================

class TypeStringParser
{
public:
  TypeStringParser(
    std::string_view text, TypeContext & types, const std::vector<const Type *> & variables)
  : text_(text), types_(types), variables_(variables)
  {
  }

  const Type * parse(std::string & error)
  {
    const Type * type = parse_type();
    skip_space();
    if (type && pos_ != text_.size()) {
      fail("unexpected `" + std::string(text_.substr(pos_)) + "`");
    }
    if (!error_.empty()) {
      error = "invalid type `" + std::string(text_) + "`: " + error_;
      return nullptr;
    }
    return type;
  }

private:
  void skip_space()
  {
    while (pos_ < text_.size() && std::isspace(static_cast<unsigned char>(text_[pos_]))) ++pos_;
  }

  bool consume(char c)
  {
    skip_space();
    if (pos_ < text_.size() && text_[pos_] == c) {
      ++pos_;
      return true;
    }
    return false;
  }

  void fail(std::string message)
  {
    if (error_.empty()) error_ = std::move(message);
  }

  std::string_view parse_name()
  {
    skip_space();
    const size_t start = pos_;
    while (pos_ < text_.size()) {
      const char c = text_[pos_];
      if (std::isalnum(static_cast<unsigned char>(c)) || c == '_' || c == '.') {
        ++pos_;
      } else {
        break;
      }
    }
    return text_.substr(start, pos_ - start);
  }

  const Type * parse_type()
  {
    const std::string_view name = parse_name();
    if (name.empty()) {
      fail("expected a type name");
      return nullptr;
    }

    std::vector<const Type *> arguments;
    bool ellipsis = false;
    if (consume('[')) {
      do {
        skip_space();
        if (text_.substr(pos_, 3) == "...") {
          pos_ += 3;
          ellipsis = true;
          continue;
        }
        const Type * argument = parse_type();
        if (!argument) return nullptr;
        arguments.push_back(argument);
      } while (consume(','));
      if (!consume(']')) {
        fail("expected `]`");
        return nullptr;
      }
    }

    return build(name, std::move(arguments), ellipsis);
  }

  const Type * build(std::string_view name, std::vector<const Type *> arguments, bool ellipsis)
  {
    if (ellipsis && name != "typing.Tuple") {
      fail("`...` is only allowed in typing.Tuple");
      return nullptr;
    }

    if (arguments.empty()) {
      if (name == builtin::k_object) return types_.object_type();
      if (name == builtin::k_none) return types_.none_type();
      for (const Type * variable : variables_) {
        if (variable->name == name) return variable;
      }
      return types_.get_primitive_type(name);
    }

    if (name == "typing.Optional") {
      if (arguments.size() != 1) {
        fail("typing.Optional takes one argument");
        return nullptr;
      }
      return types_.get_optional_type(arguments.front());
    }
    if (name == "typing.Union") return types_.get_union_type(std::move(arguments));
    if (name == "typing.Type") {
      if (arguments.size() != 1) {
        fail("typing.Type takes one argument");
        return nullptr;
      }
      return types_.get_meta_type(arguments.front());
    }
    if (name == "typing.Tuple") {
      if (ellipsis) {
        if (arguments.size() != 1) {
          fail("typing.Tuple[T, ...] takes one element type");
          return nullptr;
        }
        return types_.get_unbounded_tuple_type(arguments.front());
      }
      return types_.get_bounded_tuple_type(std::move(arguments));
    }
    return types_.get_parametric_type(name, std::move(arguments));
  }

  std::string_view text_;
  size_t pos_ = 0;
  TypeContext & types_;
  const std::vector<const Type *> & variables_;
  std::string error_;
};

// ============================================================================
// YAML Sections
// ============================================================================

std::optional<Variance> parse_variance(const std::string & text)
{
  if (text == "covariant") return Variance::Covariant;
  if (text == "contravariant") return Variance::Contravariant;
  if (text == "invariant") return Variance::Invariant;
  return std::nullopt;
}

std::optional<VariableConfig> parse_variable(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap() || !node["name"]) {
    error = "type variable entry must be a map with a 'name'";
    return std::nullopt;
  }

  VariableConfig variable;
  variable.name = node["name"].as<std::string>();

  if (node["variance"]) {
    const auto variance = parse_variance(node["variance"].as<std::string>());
    if (!variance) {
      error = "invalid variance '" + node["variance"].as<std::string>() + "' of `" +
              variable.name + "` (must be 'covariant', 'contravariant' or 'invariant')";
      return std::nullopt;
    }
    variable.variance = *variance;
  }

  if (node["bound"]) {
    variable.bound = node["bound"].as<std::string>();
  }

  if (node["constraints"]) {
    if (!node["constraints"].IsSequence()) {
      error = "constraints of `" + variable.name + "` must be a list";
      return std::nullopt;
    }
    for (const auto & constraint : node["constraints"]) {
      variable.constraints.push_back(constraint.as<std::string>());
    }
  }

  if (variable.bound && !variable.constraints.empty()) {
    error = "type variable `" + variable.name + "` cannot have both a bound and constraints";
    return std::nullopt;
  }

  return variable;
}

std::optional<ClassConfig> parse_class(const YAML::Node & node, std::string & error)
{
  if (!node.IsMap() || !node["name"]) {
    error = "class entry must be a map with a 'name'";
    return std::nullopt;
  }

  ClassConfig cls;
  cls.name = node["name"].as<std::string>();

  if (node["bases"]) {
    if (!node["bases"].IsSequence()) {
      error = "bases of `" + cls.name + "` must be a list";
      return std::nullopt;
    }
    for (const auto & base : node["bases"]) {
      cls.bases.push_back(base.as<std::string>());
    }
  }

  if (node["variables"]) {
    if (!node["variables"].IsSequence()) {
      error = "variables of `" + cls.name + "` must be a list";
      return std::nullopt;
    }
    for (const auto & variable_node : node["variables"]) {
      auto variable = parse_variable(variable_node, error);
      if (!variable) return std::nullopt;
      cls.variables.push_back(std::move(*variable));
    }
  }

  return cls;
}

ConfigLoadResult parse_root(const YAML::Node & root)
{
  ProjectConfig config;

  // Parse 'analysis' section
  if (root["analysis"]) {
    const auto & analysis = root["analysis"];
    if (analysis["widening_threshold"]) {
      config.analysis.widening_threshold = analysis["widening_threshold"].as<int>();
      if (config.analysis.widening_threshold < 0) {
        return ConfigLoadResult::fail("analysis.widening_threshold must not be negative");
      }
    }
    if (analysis["allow_untracked_annotations"]) {
      config.analysis.allow_untracked_annotations =
        analysis["allow_untracked_annotations"].as<bool>();
    }
  }

  // Parse 'log' section
  if (root["log"]) {
    const auto & log_node = root["log"];
    if (log_node["level"]) {
      const auto text = log_node["level"].as<std::string>();
      const auto level = log::parse_level(text);
      if (!level) {
        return ConfigLoadResult::fail("invalid log.level: '" + text + "'");
      }
      config.log.level = *level;
    }
    if (log_node["color"]) {
      config.log.color = log_node["color"].as<bool>();
    }
  }

  // Parse 'hierarchy' section
  if (root["hierarchy"]) {
    const auto & hierarchy = root["hierarchy"];
    if (hierarchy["builtins"]) {
      config.hierarchy.builtins = hierarchy["builtins"].as<bool>();
    }
    if (hierarchy["classes"]) {
      if (!hierarchy["classes"].IsSequence()) {
        return ConfigLoadResult::fail("hierarchy.classes must be a list");
      }
      for (const auto & class_node : hierarchy["classes"]) {
        std::string class_error;
        auto cls = parse_class(class_node, class_error);
        if (!cls) {
          return ConfigLoadResult::fail("invalid class: " + class_error);
        }
        config.hierarchy.classes.push_back(std::move(*cls));
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

// ============================================================================
// Configuration Loading API
// ============================================================================

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  ConfigLoadResult result;
  try {
    result = parse_root(root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
  if (result.success) {
    result.config.project_root = fs::absolute(config_path).parent_path();
  }
  return result;
}

ConfigLoadResult parse_project_config(std::string_view yaml_text)
{
  try {
    return parse_root(YAML::Load(std::string(yaml_text)));
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

void apply_log_config(const LogConfig & config)
{
  auto & logger = log::Logger::instance();
  logger.set_level(config.level);
  logger.set_color(config.color);
}

// ============================================================================
// Class Hierarchy Construction
// ============================================================================

const Type * parse_type_string(
  std::string_view text, TypeContext & types, const std::vector<const Type *> & variables,
  std::string & error)
{
  return TypeStringParser(text, types, variables).parse(error);
}

HierarchyBuildResult build_class_hierarchy(const ProjectConfig & config, TypeContext & types)
{
  auto hierarchy = std::make_unique<ClassHierarchy>(types);
  if (config.hierarchy.builtins) {
    hierarchy->register_builtins();
  }

  for (const auto & cls : config.hierarchy.classes) {
    std::string error;

    std::vector<const Type *> variables;
    for (const auto & variable : cls.variables) {
      if (variable.bound) {
        const Type * bound = parse_type_string(*variable.bound, types, {}, error);
        if (!bound) return HierarchyBuildResult::fail(error);
        variables.push_back(
          types.get_bound_variable_type(variable.name, bound, variable.variance));
      } else if (!variable.constraints.empty()) {
        std::vector<const Type *> constraints;
        for (const auto & text : variable.constraints) {
          const Type * constraint = parse_type_string(text, types, {}, error);
          if (!constraint) return HierarchyBuildResult::fail(error);
          constraints.push_back(constraint);
        }
        variables.push_back(types.get_explicit_variable_type(
          variable.name, std::move(constraints), variable.variance));
      } else {
        variables.push_back(types.get_variable_type(variable.name, variable.variance));
      }
    }

    std::vector<const Type *> bases;
    for (const auto & text : cls.bases) {
      const Type * base = parse_type_string(text, types, variables, error);
      if (!base) return HierarchyBuildResult::fail(error);
      bases.push_back(base);
    }

    const DefineResult defined =
      hierarchy->define(cls.name, std::move(variables), std::move(bases));
    if (!defined.success) {
      return HierarchyBuildResult::fail(defined.error);
    }
  }

  log::info("config", "class hierarchy has {} classes", hierarchy->size());
  return HierarchyBuildResult::ok(std::move(hierarchy));
}

}  // namespace pyrite
