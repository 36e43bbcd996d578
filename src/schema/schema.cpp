#include "parastore/schema/schema.hpp"

#include "parastore/common/time.hpp"

namespace parastore::schema {

namespace {

std::string describe_node(const YAML::Node &node) {
  switch (node.Type()) {
  case YAML::NodeType::Null:
    return "null";
  case YAML::NodeType::Scalar:
    return "scalar";
  case YAML::NodeType::Sequence:
    return "sequence";
  case YAML::NodeType::Map:
    return "map";
  case YAML::NodeType::Undefined:
    break;
  }
  return "undefined";
}

std::string child_path(const std::string &parent, const std::string &key) {
  return parent.empty() ? key : parent + "." + key;
}

void add(std::vector<Issue> &issues, const std::string &path, std::string message) {
  issues.push_back(Issue{.path = path.empty() ? "<root>" : path, .message = std::move(message)});
}

} // namespace

ValidationFailure::ValidationFailure(const std::string &schema_name, std::vector<Issue> issues)
    : std::runtime_error(schema_name + ": " + format_issues(issues)), issues_(std::move(issues)) {}

Field Field::any() { return Field(Kind::Any); }
Field Field::string() { return Field(Kind::String); }
Field Field::integer() { return Field(Kind::Integer); }
Field Field::boolean() { return Field(Kind::Boolean); }
Field Field::timestamp() { return Field(Kind::Timestamp); }

Field Field::one_of(std::vector<std::string> values) {
  Field field(Kind::Enum);
  field.allowed_ = std::move(values);
  return field;
}

Field Field::array_of(Field element) {
  Field field(Kind::Array);
  field.element_ = std::make_shared<const Field>(std::move(element));
  return field;
}

Field Field::object(Schema schema) {
  Field field(Kind::Object);
  field.object_ = std::make_shared<const Schema>(std::move(schema));
  return field;
}

Field &Field::min_length(const std::size_t length) {
  min_length_ = length;
  return *this;
}

Field &Field::starts_with(std::string prefix) {
  prefix_ = std::move(prefix);
  return *this;
}

Field &Field::min(const long long value) {
  min_ = value;
  return *this;
}

Field &Field::max(const long long value) {
  max_ = value;
  return *this;
}

void Field::check(const YAML::Node &node, const std::string &path,
                  std::vector<Issue> &issues) const {
  switch (kind_) {
  case Kind::Any:
    return;

  case Kind::String:
  case Kind::Timestamp:
  case Kind::Enum: {
    if (!node.IsScalar()) {
      add(issues, path, "expected string, received " + describe_node(node));
      return;
    }
    const std::string &text = node.Scalar();
    if (kind_ == Kind::Timestamp && !common::is_rfc3339(text)) {
      add(issues, path, "invalid datetime '" + text + "'");
    }
    if (kind_ == Kind::Enum) {
      bool matched = false;
      std::string expected;
      for (const auto &allowed : allowed_) {
        matched = matched || allowed == text;
        expected += expected.empty() ? allowed : " | " + allowed;
      }
      if (!matched) {
        add(issues, path, "expected one of " + expected + ", received '" + text + "'");
      }
    }
    if (min_length_.has_value() && text.size() < *min_length_) {
      add(issues, path, "must contain at least " + std::to_string(*min_length_) + " character(s)");
    }
    if (prefix_.has_value() && text.rfind(*prefix_, 0) != 0) {
      add(issues, path, "must start with '" + *prefix_ + "'");
    }
    return;
  }

  case Kind::Integer: {
    long long value = 0;
    if (!node.IsScalar() || !YAML::convert<long long>::decode(node, value)) {
      add(issues, path, "expected integer, received " + describe_node(node));
      return;
    }
    if (min_.has_value() && value < *min_) {
      add(issues, path, "must be >= " + std::to_string(*min_));
    }
    if (max_.has_value() && value > *max_) {
      add(issues, path, "must be <= " + std::to_string(*max_));
    }
    return;
  }

  case Kind::Boolean: {
    bool value = false;
    if (!node.IsScalar() || !YAML::convert<bool>::decode(node, value)) {
      add(issues, path, "expected boolean, received " + describe_node(node));
    }
    return;
  }

  case Kind::Array: {
    if (!node.IsSequence()) {
      add(issues, path, "expected array, received " + describe_node(node));
      return;
    }
    for (std::size_t i = 0; i < node.size(); ++i) {
      element_->check(node[i], path + "[" + std::to_string(i) + "]", issues);
    }
    return;
  }

  case Kind::Object:
    object_->check(node, path, issues);
    return;
  }
}

Schema::Schema(std::string name) : name_(std::move(name)) {}

Schema &Schema::required(std::string key, Field field) {
  entries_.push_back(Entry{.key = std::move(key), .field = std::move(field), .required = true});
  return *this;
}

Schema &Schema::optional(std::string key, Field field) {
  entries_.push_back(Entry{.key = std::move(key), .field = std::move(field), .required = false});
  return *this;
}

void Schema::check(const YAML::Node &node, const std::string &path,
                   std::vector<Issue> &issues) const {
  if (!node.IsMap()) {
    add(issues, path, "expected object, received " + describe_node(node));
    return;
  }
  for (const auto &entry : entries_) {
    const YAML::Node value = node[entry.key];
    const std::string key_path = child_path(path, entry.key);
    if (!value.IsDefined()) {
      if (entry.required) {
        add(issues, key_path, "required");
      }
      continue;
    }
    entry.field.check(value, key_path, issues);
  }
}

std::vector<Issue> Schema::issues(const YAML::Node &node) const {
  std::vector<Issue> out;
  check(node, "", out);
  return out;
}

common::Status Schema::validate(const YAML::Node &node) const {
  auto found = issues(node);
  if (found.empty()) {
    return common::Status::success();
  }
  const std::string message = "Validation failed: " + format_issues(found);
  return common::Status::failure(common::make_error(
      common::ErrorCode::ValidationError, message,
      std::make_exception_ptr(ValidationFailure(name_, std::move(found)))));
}

std::string format_issues(const std::vector<Issue> &issues) {
  std::string out;
  for (const auto &issue : issues) {
    if (!out.empty()) {
      out += "; ";
    }
    out += issue.path + ": " + issue.message;
  }
  return out;
}

} // namespace parastore::schema
