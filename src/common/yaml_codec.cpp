#include "parastore/common/yaml_codec.hpp"

namespace parastore::common {

Result<YAML::Node> parse_yaml(const std::string &text) {
  try {
    return Result<YAML::Node>::success(YAML::Load(text));
  } catch (const YAML::Exception &ex) {
    return Result<YAML::Node>::failure(make_error(
        ErrorCode::ParseError, "Failed to parse YAML: " + ex.msg, std::current_exception()));
  }
}

Result<std::string> emit_yaml(const YAML::Node &node) {
  try {
    YAML::Emitter out;
    out.SetIndent(2);
    out.SetSeqFormat(YAML::Block);
    out.SetMapFormat(YAML::Block);
    out << node;
    if (!out.good()) {
      return Result<std::string>::failure(
          make_error(ErrorCode::WriteError, "Failed to serialise YAML: " + out.GetLastError()));
    }
    std::string text = out.c_str();
    text.push_back('\n');
    return Result<std::string>::success(std::move(text));
  } catch (const YAML::Exception &ex) {
    return Result<std::string>::failure(make_error(
        ErrorCode::WriteError, "Failed to serialise YAML: " + ex.msg, std::current_exception()));
  }
}

std::optional<std::string> scalar_field(const YAML::Node &node, const std::string &key) {
  if (!node.IsMap()) {
    return std::nullopt;
  }
  const YAML::Node value = node[key];
  if (!value.IsDefined() || !value.IsScalar()) {
    return std::nullopt;
  }
  return value.Scalar();
}

} // namespace parastore::common
