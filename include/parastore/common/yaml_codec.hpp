#pragma once

#include "parastore/common/result.hpp"

#include <yaml-cpp/yaml.h>

#include <optional>
#include <string>

namespace parastore::common {

// Parses one YAML document. Syntax errors yield ParseError with the
// YAML::ParserException as cause.
[[nodiscard]] Result<YAML::Node> parse_yaml(const std::string &text);

// Block-style serialisation, two-space indent, trailing newline.
[[nodiscard]] Result<std::string> emit_yaml(const YAML::Node &node);

// Scalar string field of a map node, if present.
[[nodiscard]] std::optional<std::string> scalar_field(const YAML::Node &node,
                                                      const std::string &key);

} // namespace parastore::common
