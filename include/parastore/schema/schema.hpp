#pragma once

#include "parastore/common/result.hpp"

#include <yaml-cpp/yaml.h>

#include <cstddef>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace parastore::schema {

struct Issue {
  std::string path;
  std::string message;
};

// Attached as the cause of a ValidationError.
class ValidationFailure : public std::runtime_error {
public:
  ValidationFailure(const std::string &schema_name, std::vector<Issue> issues);

  [[nodiscard]] const std::vector<Issue> &issues() const { return issues_; }

private:
  std::vector<Issue> issues_;
};

class Schema;

// Constraint on a single YAML value. Built fluently:
//   Field::string().starts_with("proj_")
//   Field::one_of({"active", "dormant"})
//   Field::array_of(Field::string())
class Field {
public:
  enum class Kind { Any, String, Integer, Boolean, Timestamp, Enum, Array, Object };

  static Field any();
  static Field string();
  static Field integer();
  static Field boolean();
  static Field timestamp();
  static Field one_of(std::vector<std::string> values);
  static Field array_of(Field element);
  static Field object(Schema schema);

  Field &min_length(std::size_t length);
  Field &starts_with(std::string prefix);
  Field &min(long long value);
  Field &max(long long value);

  [[nodiscard]] Kind kind() const { return kind_; }

  void check(const YAML::Node &node, const std::string &path, std::vector<Issue> &issues) const;

private:
  explicit Field(Kind kind) : kind_(kind) {}

  Kind kind_;
  std::optional<std::size_t> min_length_;
  std::optional<std::string> prefix_;
  std::optional<long long> min_;
  std::optional<long long> max_;
  std::vector<std::string> allowed_;
  std::shared_ptr<const Field> element_;
  std::shared_ptr<const Schema> object_;
};

// Object schema: a set of required and optional keys. Unknown keys are
// accepted and preserved.
class Schema {
public:
  explicit Schema(std::string name = "object");

  Schema &required(std::string key, Field field);
  Schema &optional(std::string key, Field field);

  [[nodiscard]] const std::string &name() const { return name_; }

  void check(const YAML::Node &node, const std::string &path, std::vector<Issue> &issues) const;
  [[nodiscard]] std::vector<Issue> issues(const YAML::Node &node) const;

  // ValidationError whose cause is a ValidationFailure listing every issue.
  [[nodiscard]] common::Status validate(const YAML::Node &node) const;

private:
  struct Entry {
    std::string key;
    Field field;
    bool required;
  };

  std::string name_;
  std::vector<Entry> entries_;
};

[[nodiscard]] std::string format_issues(const std::vector<Issue> &issues);

} // namespace parastore::schema
