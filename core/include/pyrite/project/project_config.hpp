// pyrite/project/project_config.hpp - Project configuration (pyrite.yaml)
//
// Parses and validates pyrite.yaml: analysis limits, logging and the class
// hierarchy the lattice is built from.
//
// Example:
//
//   analysis:
//     widening_threshold: 10
//   log:
//     level: debug
//   hierarchy:
//     classes:
//       - name: typing.Mapping
//         variables:
//           - { name: _KT }
//           - { name: _VT_co, variance: covariant }
//       - name: Box
//         variables: [{ name: _T }]
//
#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "pyrite/basic/log.hpp"
#include "pyrite/sema/types/class_hierarchy.hpp"
#include "pyrite/sema/types/type.hpp"

namespace pyrite
{

// ============================================================================
// Configuration Structures
// ============================================================================

struct AnalysisConfig
{
  /// Fixpoint iterations before widening gives up and yields Top.
  int widening_threshold = 10;

  /// Keep annotations that mention names unknown to the lattice.
  bool allow_untracked_annotations = false;
};

struct LogConfig
{
  log::Level level = log::Level::Warn;
  bool color = true;
};

/**
 * A generic parameter of a configured class.
 */
struct VariableConfig
{
  std::string name;
  Variance variance = Variance::Invariant;

  /// Upper bound, as a type string.
  std::optional<std::string> bound;

  /// Explicit alternatives, as type strings. Exclusive with `bound`.
  std::vector<std::string> constraints;
};

struct ClassConfig
{
  std::string name;

  /// Base classes as type strings, e.g. "typing.Mapping[str, _T]".
  std::vector<std::string> bases;

  std::vector<VariableConfig> variables;
};

struct HierarchyConfig
{
  /// Install `object`, numbers, strings and the builtin containers first.
  bool builtins = true;

  /// Classes in definition order; bases must come first.
  std::vector<ClassConfig> classes;
};

/**
 * Complete project configuration (pyrite.yaml).
 */
struct ProjectConfig
{
  AnalysisConfig analysis;
  LogConfig log;
  HierarchyConfig hierarchy;

  /// Directory containing pyrite.yaml (empty for in-memory configs)
  std::filesystem::path project_root;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a pyrite.yaml file.
 *
 * @param config_path Path to pyrite.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/// Parse configuration text directly; `project_root` is left empty.
[[nodiscard]] ConfigLoadResult parse_project_config(std::string_view yaml_text);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to pyrite.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/// Route the process-wide logger according to `config`.
void apply_log_config(const LogConfig & config);

// ============================================================================
// Class Hierarchy Construction
// ============================================================================

struct HierarchyBuildResult
{
  std::unique_ptr<ClassHierarchy> hierarchy;
  bool success = false;
  std::string error;

  static HierarchyBuildResult ok(std::unique_ptr<ClassHierarchy> h)
  {
    HierarchyBuildResult r;
    r.hierarchy = std::move(h);
    r.success = true;
    return r;
  }

  static HierarchyBuildResult fail(std::string msg)
  {
    HierarchyBuildResult r;
    r.error = std::move(msg);
    return r;
  }
};

/**
 * Build the lattice described by `config.hierarchy`.
 *
 * The hierarchy refers to `types`, which must outlive it.
 */
[[nodiscard]] HierarchyBuildResult build_class_hierarchy(
  const ProjectConfig & config, TypeContext & types);

/**
 * Parse a type string such as "dict[str, typing.Optional[int]]".
 *
 * Names found in `variables` resolve to those type variables; `object` is
 * Object and `None` the None type. Returns nullptr and sets `error` on
 * malformed input.
 */
[[nodiscard]] const Type * parse_type_string(
  std::string_view text, TypeContext & types,
  const std::vector<const Type *> & variables, std::string & error);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "pyrite.yaml";

}  // namespace pyrite
